/*
 * HTTPScript Environment Providers
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Source of the read-only environment and of the persisted snapshot, and
 *   sink for the snapshot at the end of a run.
 *
 *   Environment file layout (http-client.env.json):
 *     { "dev": { "host": "localhost:8080" }, "prod": { ... } }
 */
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace httpscript {

class EnvironmentProvider {
public:
    virtual ~EnvironmentProvider() = default;
    virtual nlohmann::json environment() const = 0;
    // Initial persisted store (environment values merged over the saved snapshot).
    virtual nlohmann::json snapshot() const = 0;
    virtual void save(const nlohmann::json& snapshot) = 0;
};

// In-memory provider; remembers what was saved.
class StaticEnvironmentProvider : public EnvironmentProvider {
public:
    explicit StaticEnvironmentProvider(nlohmann::json environment = nlohmann::json::object(),
                                       nlohmann::json snapshot = nlohmann::json::object());

    nlohmann::json environment() const override { return m_environment; }
    nlohmann::json snapshot() const override { return m_snapshot; }
    void save(const nlohmann::json& snapshot) override { m_saved = snapshot; }

    const std::optional<nlohmann::json>& saved() const { return m_saved; }

private:
    nlohmann::json m_environment;
    nlohmann::json m_snapshot;
    std::optional<nlohmann::json> m_saved;
};

class EnvironmentFileProvider : public EnvironmentProvider {
public:
    // Throws ConfigError on unreadable or non-object JSON. Missing files count as {}.
    static EnvironmentFileProvider open(const std::string& environment_name, const std::string& environment_path,
                                        const std::string& snapshot_path);

    nlohmann::json environment() const override { return m_environment; }
    nlohmann::json snapshot() const override;
    // Pretty-printed JSON; throws ConfigError when the file cannot be written.
    void save(const nlohmann::json& snapshot) override;

private:
    EnvironmentFileProvider(nlohmann::json environment, nlohmann::json snapshot, std::string snapshot_path);

    nlohmann::json m_environment;
    nlohmann::json m_snapshot;
    std::string m_snapshot_path;
};

// Reads a JSON object from `path`; nullopt when the file does not exist.
std::optional<nlohmann::json> read_json_object(const std::string& path);

} // namespace httpscript
