// HTTPScript command line runner
#include <httpscript/config/config.hpp>
#include <httpscript/env/environment.hpp>
#include <httpscript/error.hpp>
#include <httpscript/exec/runtime.hpp>
#include <httpscript/exec/source.hpp>
#include <httpscript/http/curl_client.hpp>
#include <httpscript/log.hpp>
#include <httpscript/output/output.hpp>

#include <iostream>
#include <memory>
#include <unistd.h>

using namespace httpscript;

int main(int argc, char* argv[]) {
    RunConfig cfg;
    cfg.color = isatty(STDOUT_FILENO) != 0;
    try {
        load_rc_file(cfg, default_rc_path());
        parse_args(cfg, argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << '\n' << usage();
        return 1;
    }
    if (cfg.show_help) { std::cout << usage(); return 0; }
    set_debug(cfg.debug);

    try {
        std::unique_ptr<Output> output;
        if (cfg.format == "ci") output = std::make_unique<CiOutput>(std::cout);
        else output = std::make_unique<FormattedOutput>(std::cout, std::cerr, cfg.request_format, cfg.response_format, cfg.color);

        // parse everything before running anything
        auto sources = FilesSourceProvider::open(cfg.files);
        auto environment = EnvironmentFileProvider::open(cfg.environment, cfg.environment_file, cfg.snapshot_file);
        debug_log("environment '" + cfg.environment + "' from " + cfg.environment_file);

        if (cfg.dry_run) {
            dry_run(sources, environment, *output);
            return 0;
        }

        http::ClientConfig client_cfg;
        client_cfg.ssl_check = !cfg.accept_invalid_certs;
        client_cfg.timeout_seconds = cfg.timeout_seconds;
        Runtime runtime(environment, *output, std::make_unique<http::CurlHttpClient>(client_cfg));
        runtime.execute(sources);
    } catch (const TestFailuresError& e) {
        if (cfg.format == "ci") std::cerr << "error: " << e.what() << '\n';
        return 1;
    } catch (const ParseError& e) {
        std::cerr << "error: " << e.selection().to_string() << ": " << e.what() << '\n';
        return 1;
    } catch (const ScriptError& e) {
        std::cerr << "error: ";
        if (e.selection()) std::cerr << e.selection()->to_string() << ": ";
        std::cerr << e.what() << '\n';
        return 1;
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: internal: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
