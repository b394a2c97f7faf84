/*
 * HTTPScript Request Sources
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Parsed script files handed to the runtime. Files are read and parsed at
 *   construction so that a syntax error aborts before any request runs.
 *   "api.http#2" selects only the second request of api.http.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "httpscript/parse/ast.hpp"

namespace httpscript {

struct SourceItem {
    std::string name;  // source (file) name
    std::size_t index; // 0-based position in the file
    const RequestScript* script;

    // Declared name, or "#<index+1>".
    std::string label() const;
    std::string display_name() const { return name + " / " + label(); }
};

class SourceProvider {
public:
    virtual ~SourceProvider() = default;
    virtual std::vector<SourceItem> requests() const = 0;
};

class FileSourceProvider : public SourceProvider {
public:
    // `request` is 1-based. Throws Error when it is out of range.
    FileSourceProvider(std::string name, File file, std::optional<std::size_t> request = std::nullopt);

    // Reads and parses `path` ("path#N" selects one request). Throws ParseError / Error.
    static FileSourceProvider open(const std::string& argument);

    std::vector<SourceItem> requests() const override;

private:
    std::string m_name;
    File m_file;
    std::optional<std::size_t> m_request;
};

class FilesSourceProvider : public SourceProvider {
public:
    static FilesSourceProvider open(const std::vector<std::string>& arguments);
    void add(FileSourceProvider provider) { m_files.push_back(std::move(provider)); }

    std::vector<SourceItem> requests() const override;

private:
    std::vector<FileSourceProvider> m_files;
};

// "file#3" -> ("file", 3); a '#' not followed by digits is part of the path.
// Throws Error when the number does not fit a request index.
std::pair<std::string, std::optional<std::size_t>> split_source_argument(const std::string& argument);

} // namespace httpscript
