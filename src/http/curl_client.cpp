/*
 * HTTPScript libcurl transport
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <curl/curl.h>
#include <cctype>
#include <memory>
#include <httpscript/error.hpp>
#include <httpscript/http/curl_client.hpp>
#include <httpscript/lex/lexer.hpp>
#include <httpscript/log.hpp>

namespace httpscript::http {

namespace {

size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct HeaderCapture {
    std::string status_text;
    Headers headers;
};

// Called once per header line, status line and final empty line included.
size_t curl_header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* cap = static_cast<HeaderCapture*>(userdata);
    std::string line(ptr, size * nmemb);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    if (line.compare(0, 5, "HTTP/") == 0) {
        // new response block (redirect or 100-continue): start over
        cap->headers.clear();
        cap->status_text.clear();
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
        if (sp2 != std::string::npos) cap->status_text = trim(line.substr(sp2 + 1));
        return size * nmemb;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) cap->headers.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
    return size * nmemb;
}

bool has_header(const Headers& headers, const std::string& name) {
    for (const auto& [n, v] : headers) {
        if (n.size() != name.size()) continue;
        bool same = true;
        for (std::size_t i = 0; i < n.size() && same; ++i)
            same = std::tolower(static_cast<unsigned char>(n[i])) == std::tolower(static_cast<unsigned char>(name[i]));
        if (same) return true;
    }
    return false;
}

Version version_of(long v) {
    switch (v) {
        case CURL_HTTP_VERSION_1_0: return Version::Http10;
        case CURL_HTTP_VERSION_2_0: return Version::Http2;
#ifdef CURL_HTTP_VERSION_3
        case CURL_HTTP_VERSION_3: return Version::Http3;
#endif
        default: return Version::Http11;
    }
}

} // namespace

std::string normalize_target(const std::string& target) {
    if (target.compare(0, 7, "http://") == 0 || target.compare(0, 8, "https://") == 0) return target;
    if (target.compare(0, 2, "//") == 0) return "http:" + target;
    return "http://" + target;
}

Response CurlHttpClient::execute(const Request& request) {
    const std::string url = normalize_target(request.target);
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw TransportError("Error executing request " + url + ": curl initialisation failed");

    std::string body;
    HeaderCapture capture;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, curl_header_cb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &capture);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_cfg.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    if (!m_cfg.ssl_check) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, to_string(request.method));

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    auto append = [&](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (!next) throw TransportError("Error executing request " + url + ": out of memory");
        headers.release();
        headers.reset(next);
    };
    for (const auto& [name, value] : request.headers) append(value.empty() ? name + ";" : name + ": " + value);

    std::string payload;
    if (request.body) {
        payload = trim(*request.body);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        // curl would otherwise add a form content type and Expect: 100-continue
        if (!has_header(request.headers, "Content-Type")) append("Content-Type:");
        append("Expect:");
    }
    if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    debug_log(std::string("curl ") + to_string(request.method) + " " + url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) throw TransportError("Error executing request " + url + ": " + curl_easy_strerror(res));

    long code = 0;
    long version = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    curl_easy_getinfo(curl.get(), CURLINFO_HTTP_VERSION, &version);

    Response response;
    response.version = version_of(version);
    response.status_code = static_cast<int>(code);
    response.status_text = capture.status_text;
    response.headers = std::move(capture.headers);
    if (!body.empty()) response.body = std::move(body);
    return response;
}

} // namespace httpscript::http
