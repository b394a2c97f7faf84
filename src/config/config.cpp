/*
 * HTTPScript Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cstdlib>
#include <fstream>
#include <httpscript/config/config.hpp>
#include <httpscript/error.hpp>
#include <httpscript/lex/lexer.hpp>

namespace httpscript {

static bool parse_bool(const std::string& key, const std::string& v) {
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    throw ConfigError("invalid boolean for " + key + ": " + v);
}

static long parse_timeout(const std::string& v) {
    try {
        std::size_t used = 0;
        long n = std::stol(v, &used);
        if (used == v.size() && n > 0) return n;
    } catch (const std::exception&) {
    }
    throw ConfigError("invalid timeout: " + v);
}

static void check_format(const std::string& v) {
    if (v != "standard" && v != "ci") throw ConfigError("invalid format '" + v + "', expected standard or ci");
}

std::string default_rc_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.httpscriptrc";
}

std::string unescape(const std::string& s) {
    std::string out;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) { out.push_back(s[i]); continue; }
        char c = s[++i];
        if (c == 'n') out.push_back('\n');
        else if (c == 't') out.push_back('\t');
        else if (c == '\\') out.push_back('\\');
        else { out.push_back('\\'); out.push_back(c); }
    }
    return out;
}

void load_rc(RunConfig& cfg, std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq));
        auto val = trim(line.substr(eq + 1));
        if (key == "environment") cfg.environment = val;
        else if (key == "environment_file") cfg.environment_file = val;
        else if (key == "snapshot_file") cfg.snapshot_file = val;
        else if (key == "format") { check_format(val); cfg.format = val; }
        else if (key == "request_format") cfg.request_format = unescape(val);
        else if (key == "response_format") cfg.response_format = unescape(val);
        else if (key == "accept_invalid_certs") cfg.accept_invalid_certs = parse_bool(key, val);
        else if (key == "timeout_seconds") cfg.timeout_seconds = parse_timeout(val);
        else if (key == "color") cfg.color = parse_bool(key, val);
        else if (key == "debug") cfg.debug = parse_bool(key, val);
    }
}

bool load_rc_file(RunConfig& cfg, const std::string& path) {
    if (path.empty()) return false;
    std::ifstream in(path);
    if (!in) return false;
    load_rc(cfg, in);
    return true;
}

void parse_args(RunConfig& cfg, int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError("missing value for " + a);
            return argv[++i];
        };
        if (a == "-h" || a == "--help") cfg.show_help = true;
        else if (a == "-n" || a == "--environment-file") cfg.environment_file = value();
        else if (a == "-p" || a == "--snapshot") cfg.snapshot_file = value();
        else if (a == "-e" || a == "--environment") cfg.environment = value();
        else if (a == "--request-format") cfg.request_format = unescape(value());
        else if (a == "--response-format") cfg.response_format = unescape(value());
        else if (a == "--format") { cfg.format = value(); check_format(cfg.format); }
        else if (a == "--accept-invalid-certs") cfg.accept_invalid_certs = true;
        else if (a == "--timeout") cfg.timeout_seconds = parse_timeout(value());
        else if (a == "--dry-run") cfg.dry_run = true;
        else if (a == "--color") cfg.color = true;
        else if (a == "--no-color") cfg.color = false;
        else if (a == "-d" || a == "--debug") cfg.debug = true;
        else if (a.size() > 1 && a[0] == '-') throw ConfigError("unknown option " + a);
        else cfg.files.push_back(a);
    }
    if (cfg.files.empty() && !cfg.show_help) throw ConfigError("no input files");
}

std::string usage() {
    return "Usage: httpscript [options] <file[#N]>...\n"
           "  -n, --environment-file <path>  environment file (default http-client.env.json)\n"
           "  -p, --snapshot <path>          snapshot file (default .snapshot.json)\n"
           "  -e, --environment <name>       environment to use (default dev)\n"
           "      --request-format <fmt>     request output format (default \"%N\\n%R\\n\\n\")\n"
           "      --response-format <fmt>    response output format (default \"%R\\n%H\\n%B\\n\\n%T\\n\")\n"
           "      --format standard|ci       output style\n"
           "      --accept-invalid-certs     skip TLS certificate checks\n"
           "      --timeout <seconds>        request timeout (default 30)\n"
           "      --dry-run                  print resolved requests without sending them\n"
           "      --color / --no-color       colored test results\n"
           "  -d, --debug                    trace execution on stderr\n"
           "  -h, --help                     this help\n"
           "Format items: %R first line, %H headers, %B body, %T tests, %N name, %% literal %\n";
}

} // namespace httpscript
