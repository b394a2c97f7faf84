/*
 * HTTPScript transport interface
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Concrete request/response values exchanged with the HttpClient. The
 *   client is the only networking seam: tests plug a fake one in.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "httpscript/http/method.hpp"

namespace httpscript::http {

enum class Version { Http09, Http10, Http11, Http2, Http3 };

const char* to_string(Version version);

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Request {
    Method method = Method::Get;
    std::string target;
    Headers headers;
    std::optional<std::string> body;
};

struct Response {
    Version version = Version::Http11;
    int status_code = 0;
    std::string status_text;
    Headers headers;
    std::optional<std::string> body;

    // "HTTP/1.1 200 OK"
    std::string status_line() const;
};

struct ClientConfig {
    bool ssl_check = true;
    long timeout_seconds = 30;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    // Throws TransportError.
    virtual Response execute(const Request& request) = 0;
};

} // namespace httpscript::http
