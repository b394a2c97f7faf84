/*
 * HTTPScript Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Run configuration assembled from ~/.httpscriptrc (key=value lines,
 *   '#' comments) and then from the command line, which wins.
 *
 *   Recognised rc keys: environment, environment_file, snapshot_file,
 *   format, request_format, response_format, accept_invalid_certs,
 *   timeout_seconds, color, debug.
 */
#pragma once
#include <istream>
#include <string>
#include <vector>

namespace httpscript {

struct RunConfig {
    std::string environment = "dev";
    std::string environment_file = "http-client.env.json";
    std::string snapshot_file = ".snapshot.json";
    std::string format = "standard"; // standard|ci
    std::string request_format = "%N\n%R\n\n";
    std::string response_format = "%R\n%H\n%B\n\n%T\n";
    bool accept_invalid_certs = false;
    long timeout_seconds = 30;
    bool color = false;
    bool debug = false;
    bool dry_run = false;
    bool show_help = false;
    std::vector<std::string> files;
};

// $HOME/.httpscriptrc, empty when HOME is unset.
std::string default_rc_path();

// Applies rc lines to cfg. Unknown keys are ignored; bad values throw ConfigError.
void load_rc(RunConfig& cfg, std::istream& in);
// Returns false when the file does not exist.
bool load_rc_file(RunConfig& cfg, const std::string& path);

// Throws ConfigError on unknown options or missing values.
void parse_args(RunConfig& cfg, int argc, const char* const* argv);

// "\n", "\t" and "\\" escapes as typed on the command line.
std::string unescape(const std::string& s);

std::string usage();

} // namespace httpscript
