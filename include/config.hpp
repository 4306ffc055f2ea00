/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_CONFIG_HPP
#define CANVASRELAY_CONFIG_HPP

#pragma once

#include <quality.hpp>
#include <session.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canvasrelay::config {

    struct RelayConfig {
        int port{8080};
        std::string bind_address{"0.0.0.0"};
        std::string ws_path{"/rtmp-relay"};

        std::string encoder_binary{"ffmpeg"};

        size_t max_pending_frames{3};
        uint32_t spawn_timeout_ms{3000};
        uint32_t stop_grace_ms{3000};
        uint32_t kill_wait_ms{2000};
        uint32_t status_interval_ms{5000};       // 0 disables periodic stream-status
        size_t max_message_bytes{32 * 1024 * 1024};
        size_t max_connections{64};
        size_t max_sessions_per_connection{4};
        uint32_t idle_timeout_ms{0};             // 0 disables
        uint32_t decode_error_alert_threshold{30};

        std::string log_file;
        std::string log_level{"info"};

        quality::PlanTable plans{quality::PlanTable::defaults()};
    };

/**
 * @brief Overlay the keys present in a JSON document onto `cfg`.
 *
 * Unknown keys are ignored. A value of the wrong type rejects the whole
 * document and leaves `cfg` untouched.
 */
    bool load_json_text(const std::string &text, RelayConfig &cfg, std::string &error);
    bool load_file(const std::string &path, RelayConfig &cfg, std::string &error);

/// "<directory of the running binary>/config.json"
    std::string default_config_path(const char *argv0);

    struct CliOptions {
        std::string config_path;
        bool help{false};
    };

/**
 * @brief Apply command line flags on top of `cfg`.
 *
 * --config is only recorded in `opts`; the caller loads it before calling
 * this again so flags always win over the file.
 */
    bool apply_cli(const std::vector<std::string> &args, RelayConfig &cfg, CliOptions &opts, std::string &error);

    bool validate(const RelayConfig &cfg, std::string &error);

    session::SessionSettings session_settings(const RelayConfig &cfg);

    std::string usage(const char *prog);

} // namespace canvasrelay::config

#endif // CANVASRELAY_CONFIG_HPP
