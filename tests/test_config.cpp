/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <config.hpp>

#include "test_support.hpp"

#include <fstream>

#include <unistd.h>

using namespace canvasrelay;
using namespace canvasrelay::config;

TEST_CASE("defaults are valid", "[config]") {
    RelayConfig cfg;
    std::string err;
    REQUIRE(validate(cfg, err));
    REQUIRE(cfg.port == 8080);
    REQUIRE(cfg.max_pending_frames == 3);
    REQUIRE(cfg.plans.contains("goat"));
}

TEST_CASE("JSON overlays only the keys it names", "[config]") {
    RelayConfig cfg;
    std::string err;
    REQUIRE(load_json_text(R"({"port": 9000, "encoder_binary": "/opt/ffmpeg/bin/ffmpeg",
                               "stop_grace_ms": 1500, "unknown": true})",
                           cfg, err));
    REQUIRE(cfg.port == 9000);
    REQUIRE(cfg.encoder_binary == "/opt/ffmpeg/bin/ffmpeg");
    REQUIRE(cfg.stop_grace_ms == 1500);
    REQUIRE(cfg.ws_path == "/rtmp-relay");
}

TEST_CASE("wrong types leave the config untouched", "[config]") {
    RelayConfig cfg;
    std::string err;
    REQUIRE_FALSE(load_json_text(R"({"port": 9100, "ws_path": 5})", cfg, err));
    REQUIRE_FALSE(err.empty());
    REQUIRE(cfg.port == 8080);

    REQUIRE_FALSE(load_json_text("[]", cfg, err));
    REQUIRE_FALSE(load_json_text("{broken", cfg, err));
}

TEST_CASE("plan table from JSON", "[config]") {
    RelayConfig cfg;
    std::string err;
    REQUIRE(load_json_text(R"({"plans": {"studio": {"bitrateKbps": 8000, "resolution": "1440p", "frame_rate": 60},
                                         "free": {"resolution": "480p"},
                                         "fallback": "studio"}})",
                           cfg, err));
    quality::QualityProfile p;
    Fault f;
    REQUIRE(quality::resolve_profile(cfg.plans, quality::QualityRequest{"studio", 0, "", 0}, p, f));
    REQUIRE(p.bitrate_kbps == 8000);
    REQUIRE(p.height == 1440);
    REQUIRE(p.frame_rate == 60);

    // existing plan keeps the fields it does not override
    REQUIRE(quality::resolve_profile(cfg.plans, quality::QualityRequest{"free", 0, "", 0}, p, f));
    REQUIRE(p.bitrate_kbps == 1500);
    REQUIRE(p.height == 480);

    REQUIRE(quality::resolve_profile(cfg.plans, quality::QualityRequest{"nobody", 0, "", 0}, p, f));
    REQUIRE(p.bitrate_kbps == 8000);

    RelayConfig bad;
    REQUIRE_FALSE(load_json_text(R"({"plans": {"x": {"resolution": "999p"}}})", bad, err));
    REQUIRE(err.find("unsupported resolution") != std::string::npos);
}

TEST_CASE("config file loading", "[config]") {
    const std::string path = testsupport::temp_path("config") + ".json";
    {
        std::ofstream out(path);
        out << R"({"port": 7000, "log_level": "debug"})";
    }
    RelayConfig cfg;
    std::string err;
    REQUIRE(load_file(path, cfg, err));
    REQUIRE(cfg.port == 7000);
    REQUIRE(cfg.log_level == "debug");
    ::unlink(path.c_str());

    REQUIRE_FALSE(load_file(path, cfg, err));
    REQUIRE(err.find("cannot open") != std::string::npos);
}

TEST_CASE("command line flags override the file", "[config]") {
    RelayConfig cfg;
    CliOptions opts;
    std::string err;
    REQUIRE(apply_cli({"--config", "relay.json", "--port", "9443", "--encoder", "/usr/bin/ffmpeg",
                       "--max-pending", "5", "--grace-ms", "250", "--log-level", "warn", "--bind", "127.0.0.1"},
                      cfg, opts, err));
    REQUIRE(opts.config_path == "relay.json");
    REQUIRE_FALSE(opts.help);
    REQUIRE(cfg.port == 9443);
    REQUIRE(cfg.encoder_binary == "/usr/bin/ffmpeg");
    REQUIRE(cfg.max_pending_frames == 5);
    REQUIRE(cfg.stop_grace_ms == 250);
    REQUIRE(cfg.log_level == "warn");
    REQUIRE(cfg.bind_address == "127.0.0.1");

    CliOptions help;
    REQUIRE(apply_cli({"-h"}, cfg, help, err));
    REQUIRE(help.help);
}

TEST_CASE("bad command lines are rejected", "[config]") {
    RelayConfig cfg;
    CliOptions opts;
    std::string err;
    REQUIRE_FALSE(apply_cli({"--port"}, cfg, opts, err));
    REQUIRE(err == "--port requires a value");
    REQUIRE_FALSE(apply_cli({"--port", "70000"}, cfg, opts, err));
    REQUIRE_FALSE(apply_cli({"--max-pending", "0"}, cfg, opts, err));
    REQUIRE_FALSE(apply_cli({"--log-level", "loud"}, cfg, opts, err));
    REQUIRE_FALSE(apply_cli({"--frobnicate"}, cfg, opts, err));
    REQUIRE(err == "unknown option '--frobnicate'");
}

TEST_CASE("validate catches inconsistent settings", "[config]") {
    std::string err;
    RelayConfig a;
    a.ws_path = "relay";
    REQUIRE_FALSE(validate(a, err));

    RelayConfig b;
    b.encoder_binary.clear();
    REQUIRE_FALSE(validate(b, err));

    RelayConfig c;
    c.log_level = "verbose";
    REQUIRE_FALSE(validate(c, err));
}

TEST_CASE("session settings mirror the config", "[config]") {
    RelayConfig cfg;
    cfg.stop_grace_ms = 1234;
    cfg.max_pending_frames = 7;
    session::SessionSettings s = session_settings(cfg);
    REQUIRE(s.stop_grace.count() == 1234);
    REQUIRE(s.max_pending_frames == 7);
    // encoder arguments always come from the session profile
    REQUIRE(s.encoder_args_override.empty());
    REQUIRE(s.plans.contains("free"));
}

TEST_CASE("a config file cannot replace the encoder arguments", "[config]") {
    RelayConfig cfg;
    std::string err;
    REQUIRE(load_json_text(R"({"encoder_args": ["-i", "-", "-f", "flv", "rtmp://elsewhere/live/key"]})", cfg, err));
    session::SessionSettings s = session_settings(cfg);
    REQUIRE(s.encoder_args_override.empty());
    REQUIRE(s.encoder_binary == "ffmpeg");
}
