/*
 * HTTPScript Environment Providers
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <filesystem>
#include <fstream>
#include <httpscript/env/environment.hpp>
#include <httpscript/error.hpp>
#include <httpscript/log.hpp>

namespace httpscript {

namespace fs = std::filesystem;

std::optional<nlohmann::json> read_json_object(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot read " + path);
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError(path + " must contain a JSON object");
    return j;
}

StaticEnvironmentProvider::StaticEnvironmentProvider(nlohmann::json environment, nlohmann::json snapshot)
    : m_environment(std::move(environment)), m_snapshot(std::move(snapshot)) {}

EnvironmentFileProvider::EnvironmentFileProvider(nlohmann::json environment, nlohmann::json snapshot,
                                                 std::string snapshot_path)
    : m_environment(std::move(environment)), m_snapshot(std::move(snapshot)), m_snapshot_path(std::move(snapshot_path)) {}

EnvironmentFileProvider EnvironmentFileProvider::open(const std::string& environment_name,
                                                      const std::string& environment_path,
                                                      const std::string& snapshot_path) {
    nlohmann::json environment = nlohmann::json::object();
    if (auto file = read_json_object(environment_path)) {
        auto it = file->find(environment_name);
        if (it != file->end()) {
            if (!it->is_object())
                throw ConfigError("environment '" + environment_name + "' in " + environment_path + " must be an object");
            environment = *it;
        } else {
            debug_log("environment '" + environment_name + "' not found in " + environment_path);
        }
    }
    nlohmann::json snapshot = read_json_object(snapshot_path).value_or(nlohmann::json::object());
    return EnvironmentFileProvider(std::move(environment), std::move(snapshot), snapshot_path);
}

nlohmann::json EnvironmentFileProvider::snapshot() const {
    nlohmann::json merged = m_snapshot;
    merged.update(m_environment);
    return merged;
}

void EnvironmentFileProvider::save(const nlohmann::json& snapshot) {
    std::ofstream out(m_snapshot_path, std::ios::trunc);
    if (!out) throw ConfigError("cannot write snapshot " + m_snapshot_path);
    out << snapshot.dump(2) << '\n';
    if (!out) throw ConfigError("cannot write snapshot " + m_snapshot_path);
    debug_log("snapshot saved to " + m_snapshot_path);
}

} // namespace httpscript
