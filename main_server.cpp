/*
* @license
* (C) zachbabanov
*
*/

#include <server.hpp>
#include <config.hpp>
#include <logger.hpp>

#include <csignal>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

#include <sys/stat.h>

using namespace canvasrelay;
using namespace canvasrelay::log;

static gateway::Server *g_server = nullptr;

static void on_signal(int) {
    if (g_server) g_server->requestStop();
}

static bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // first pass only to find --config / --help
    config::RelayConfig cfg;
    config::CliOptions opts;
    std::string error;
    {
        config::RelayConfig scratch;
        if (!config::apply_cli(args, scratch, opts, error)) {
            std::cerr << error << "\n" << config::usage(argv[0]);
            return 1;
        }
    }
    if (opts.help) {
        std::cout << config::usage(argv[0]);
        return 0;
    }

    std::string config_path = opts.config_path;
    if (config_path.empty()) {
        std::string def = config::default_config_path(argc > 0 ? argv[0] : nullptr);
        if (file_exists(def)) config_path = def;
    }
    if (!config_path.empty()) {
        if (!config::load_file(config_path, cfg, error)) {
            std::cerr << "Config error: " << error << "\n";
            return 1;
        }
    }

    if (!config::apply_cli(args, cfg, opts, error) || !config::validate(cfg, error)) {
        std::cerr << error << "\n" << config::usage(argv[0]);
        return 1;
    }

    Level level = Level::INFO;
    if (!parse_level(cfg.log_level, level)) level = Level::INFO;
    Logger::instance().set_level(level);

    // If user provided a log file, test opening it first for append/writability
    if (!cfg.log_file.empty()) {
        std::ofstream ofs(cfg.log_file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << cfg.log_file << "' for append, continuing without file logging\n";
        } else {
            ofs.close();
            if (!Logger::instance().open_logfile(cfg.log_file)) {
                std::cerr << "Warning: log file '" << cfg.log_file << "' could not be attached\n";
            }
        }
    }
    if (!config_path.empty()) LOG_GEN_INFO("Loaded relay config from '{}'", config_path);

    // a dead encoder must surface as EPIPE on its pipe, not kill the relay
    std::signal(SIGPIPE, SIG_IGN);

    gateway::Server srv(cfg);
    if (!srv.start()) {
        LOG_GEN_ERROR("Relay failed to start");
        return 1;
    }

    g_server = &srv;
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    srv.runLoop();
    g_server = nullptr;
    return 0;
}
