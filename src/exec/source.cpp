/*
 * HTTPScript Request Sources
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <httpscript/error.hpp>
#include <httpscript/exec/source.hpp>
#include <httpscript/parse/parser.hpp>

namespace httpscript {

std::string SourceItem::label() const {
    if (script && script->name) return *script->name;
    return "#" + std::to_string(index + 1);
}

std::pair<std::string, std::optional<std::size_t>> split_source_argument(const std::string& argument) {
    auto hash = argument.rfind('#');
    if (hash == std::string::npos || hash + 1 >= argument.size()) return {argument, std::nullopt};
    std::string digits = argument.substr(hash + 1);
    for (char c : digits) if (!std::isdigit(static_cast<unsigned char>(c))) return {argument, std::nullopt};
    try {
        return {argument.substr(0, hash), static_cast<std::size_t>(std::stoull(digits))};
    } catch (const std::out_of_range&) {
        throw Error("Couldn't find request #" + digits + " in " + argument.substr(0, hash));
    }
}

FileSourceProvider::FileSourceProvider(std::string name, File file, std::optional<std::size_t> request)
    : m_name(std::move(name)), m_file(std::move(file)), m_request(request) {
    if (m_request && (*m_request == 0 || *m_request > m_file.request_scripts.size()))
        throw Error("Couldn't find request #" + std::to_string(*m_request) + " in " + m_name);
}

FileSourceProvider FileSourceProvider::open(const std::string& argument) {
    auto [path, request] = split_source_argument(argument);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Error("cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return FileSourceProvider(path, parse(path, ss.str()), request);
}

std::vector<SourceItem> FileSourceProvider::requests() const {
    std::vector<SourceItem> items;
    for (std::size_t i = 0; i < m_file.request_scripts.size(); ++i) {
        if (m_request && *m_request != i + 1) continue;
        items.push_back({m_name, i, &m_file.request_scripts[i]});
    }
    return items;
}

FilesSourceProvider FilesSourceProvider::open(const std::vector<std::string>& arguments) {
    FilesSourceProvider provider;
    for (const auto& arg : arguments) provider.add(FileSourceProvider::open(arg));
    return provider;
}

std::vector<SourceItem> FilesSourceProvider::requests() const {
    std::vector<SourceItem> items;
    for (const auto& f : m_files) {
        auto more = f.requests();
        items.insert(items.end(), more.begin(), more.end());
    }
    return items;
}

} // namespace httpscript
