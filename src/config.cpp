/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <logger.hpp>

#include <fstream>
#include <sstream>
#include <limits.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace canvasrelay::config {

    namespace {

        bool parse_number(const std::string &s, uint64_t max, uint64_t &out) {
            if (s.empty() || s.size() > 12) return false;
            uint64_t v = 0;
            for (char c : s) {
                if (c < '0' || c > '9') return false;
                v = v * 10 + (uint64_t)(c - '0');
            }
            if (v > max) return false;
            out = v;
            return true;
        }

        bool read_plans(const json &j, quality::PlanTable &table, std::string &error) {
            if (!j.is_object()) {
                error = "'plans' must be an object";
                return false;
            }
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.key() == "fallback") {
                    table.set_fallback(it.value().get<std::string>());
                    continue;
                }
                const json &p = it.value();
                if (!p.is_object()) {
                    error = "plan '" + it.key() + "' must be an object";
                    return false;
                }
                quality::PlanQuality q = table.lookup(it.key());
                if (p.contains("bitrateKbps")) q.bitrate_kbps = p["bitrateKbps"].get<uint32_t>();
                if (p.contains("bitrate_kbps")) q.bitrate_kbps = p["bitrate_kbps"].get<uint32_t>();
                if (p.contains("resolution")) q.resolution = p["resolution"].get<std::string>();
                if (p.contains("frameRate")) q.frame_rate = p["frameRate"].get<uint32_t>();
                if (p.contains("frame_rate")) q.frame_rate = p["frame_rate"].get<uint32_t>();

                uint32_t w = 0, h = 0;
                if (!quality::parse_resolution(q.resolution, w, h)) {
                    error = "plan '" + it.key() + "' has unsupported resolution '" + q.resolution + "'";
                    return false;
                }
                if (q.frame_rate == 0 || q.frame_rate > quality::MAX_FRAME_RATE) {
                    error = "plan '" + it.key() + "' has unsupported frame rate";
                    return false;
                }
                table.set(it.key(), q);
            }
            return true;
        }

    } // namespace

    bool load_json_text(const std::string &text, RelayConfig &cfg, std::string &error) {
        RelayConfig c = cfg;
        try {
            json j = json::parse(text);
            if (!j.is_object()) {
                error = "configuration must be a JSON object";
                return false;
            }
            if (j.contains("port")) c.port = j["port"].get<int>();
            if (j.contains("bind_address")) c.bind_address = j["bind_address"].get<std::string>();
            if (j.contains("ws_path")) c.ws_path = j["ws_path"].get<std::string>();
            if (j.contains("encoder_binary")) c.encoder_binary = j["encoder_binary"].get<std::string>();
            if (j.contains("max_pending_frames")) c.max_pending_frames = j["max_pending_frames"].get<size_t>();
            if (j.contains("spawn_timeout_ms")) c.spawn_timeout_ms = j["spawn_timeout_ms"].get<uint32_t>();
            if (j.contains("stop_grace_ms")) c.stop_grace_ms = j["stop_grace_ms"].get<uint32_t>();
            if (j.contains("kill_wait_ms")) c.kill_wait_ms = j["kill_wait_ms"].get<uint32_t>();
            if (j.contains("status_interval_ms")) c.status_interval_ms = j["status_interval_ms"].get<uint32_t>();
            if (j.contains("max_message_bytes")) c.max_message_bytes = j["max_message_bytes"].get<size_t>();
            if (j.contains("max_connections")) c.max_connections = j["max_connections"].get<size_t>();
            if (j.contains("max_sessions_per_connection")) c.max_sessions_per_connection = j["max_sessions_per_connection"].get<size_t>();
            if (j.contains("idle_timeout_ms")) c.idle_timeout_ms = j["idle_timeout_ms"].get<uint32_t>();
            if (j.contains("decode_error_alert_threshold")) c.decode_error_alert_threshold = j["decode_error_alert_threshold"].get<uint32_t>();
            if (j.contains("log_file")) c.log_file = j["log_file"].get<std::string>();
            if (j.contains("log_level")) c.log_level = j["log_level"].get<std::string>();
            if (j.contains("plans") && !read_plans(j["plans"], c.plans, error)) return false;
        } catch (const json::exception &e) {
            error = e.what();
            return false;
        }
        cfg = c;
        return true;
    }

    bool load_file(const std::string &path, RelayConfig &cfg, std::string &error) {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "cannot open '" + path + "'";
            return false;
        }
        std::stringstream ss;
        ss << ifs.rdbuf();
        if (!load_json_text(ss.str(), cfg, error)) {
            error = "'" + path + "': " + error;
            return false;
        }
        return true;
    }

    std::string default_config_path(const char *argv0) {
        char buf[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len > 0) {
            buf[len] = '\0';
            std::string p(buf);
            size_t pos = p.find_last_of('/');
            if (pos != std::string::npos) return p.substr(0, pos) + "/config.json";
        }
        if (argv0) {
            std::string p(argv0);
            size_t pos = p.find_last_of('/');
            if (pos != std::string::npos) return p.substr(0, pos) + "/config.json";
        }
        return "./config.json";
    }

    bool apply_cli(const std::vector<std::string> &args, RelayConfig &cfg, CliOptions &opts, std::string &error) {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string &a = args[i];
            if (a == "-h" || a == "--help") {
                opts.help = true;
                continue;
            }

            const bool takes_value = a == "--config" || a == "--port" || a == "--encoder" || a == "--log" ||
                                     a == "--log-level" || a == "--max-pending" || a == "--grace-ms" || a == "--bind";
            if (!takes_value) {
                error = "unknown option '" + a + "'";
                return false;
            }
            if (i + 1 >= args.size()) {
                error = a + " requires a value";
                return false;
            }
            const std::string &v = args[++i];
            uint64_t n = 0;

            if (a == "--config") {
                opts.config_path = v;
            } else if (a == "--port") {
                if (!parse_number(v, 65535, n) || n == 0) { error = "invalid port '" + v + "'"; return false; }
                cfg.port = (int)n;
            } else if (a == "--bind") {
                cfg.bind_address = v;
            } else if (a == "--encoder") {
                cfg.encoder_binary = v;
            } else if (a == "--log") {
                cfg.log_file = v;
            } else if (a == "--log-level") {
                log::Level lvl;
                if (!log::parse_level(v, lvl)) { error = "unknown log level '" + v + "'"; return false; }
                cfg.log_level = v;
            } else if (a == "--max-pending") {
                if (!parse_number(v, 1024, n) || n == 0) { error = "invalid --max-pending '" + v + "'"; return false; }
                cfg.max_pending_frames = (size_t)n;
            } else if (a == "--grace-ms") {
                if (!parse_number(v, 600000, n)) { error = "invalid --grace-ms '" + v + "'"; return false; }
                cfg.stop_grace_ms = (uint32_t)n;
            }
        }
        return true;
    }

    bool validate(const RelayConfig &cfg, std::string &error) {
        log::Level lvl;
        if (cfg.port <= 0 || cfg.port > 65535) {
            error = "port out of range";
        } else if (cfg.ws_path.empty() || cfg.ws_path[0] != '/') {
            error = "ws_path must start with '/'";
        } else if (cfg.encoder_binary.empty()) {
            error = "encoder_binary is empty";
        } else if (cfg.max_pending_frames == 0) {
            error = "max_pending_frames must be at least 1";
        } else if (cfg.spawn_timeout_ms == 0) {
            error = "spawn_timeout_ms must be positive";
        } else if (cfg.max_message_bytes < 1024) {
            error = "max_message_bytes is too small";
        } else if (cfg.max_connections == 0) {
            error = "max_connections must be at least 1";
        } else if (!log::parse_level(cfg.log_level, lvl)) {
            error = "unknown log_level '" + cfg.log_level + "'";
        } else {
            return true;
        }
        return false;
    }

    session::SessionSettings session_settings(const RelayConfig &cfg) {
        session::SessionSettings s;
        s.encoder_binary = cfg.encoder_binary;
        s.spawn_timeout = std::chrono::milliseconds(cfg.spawn_timeout_ms);
        s.stop_grace = std::chrono::milliseconds(cfg.stop_grace_ms);
        s.kill_wait = std::chrono::milliseconds(cfg.kill_wait_ms);
        s.max_pending_frames = cfg.max_pending_frames;
        s.decode_error_alert_threshold = cfg.decode_error_alert_threshold;
        s.plans = cfg.plans;
        return s;
    }

    std::string usage(const char *prog) {
        std::string p = prog ? prog : "canvasrelay_server";
        return "Usage: " + p + " [--config <file>] [--port <port>] [--bind <address>] [--encoder <path>]\n"
               "       [--log <log_file>] [--log-level trace|debug|info|warn|error]\n"
               "       [--max-pending <frames>] [--grace-ms <ms>]\n"
               "Without --config, config.json next to the binary is used when present.\n"
               "Command line options override values from the config file.\n";
    }

} // namespace canvasrelay::config
