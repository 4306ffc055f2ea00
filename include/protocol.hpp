/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_PROTOCOL_HPP
#define CANVASRELAY_PROTOCOL_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace canvasrelay::protocol {

//
// Inbound message names (JSON "type" field). The *-webrtc-* names are accepted
// for older browser clients.
//
    constexpr const char *MSG_START = "start-stream";
    constexpr const char *MSG_START_LEGACY = "start-webrtc-stream";
    constexpr const char *MSG_FRAME = "canvas-frame";
    constexpr const char *MSG_STOP = "stop-stream";
    constexpr const char *MSG_STOP_LEGACY = "stop-webrtc-stream";
    constexpr const char *MSG_HEARTBEAT = "heartbeat";

//
// Outbound message names
//
    constexpr const char *MSG_READY = "stream-ready";
    constexpr const char *MSG_STATUS = "stream-status";
    constexpr const char *MSG_ERROR = "stream-error";
    constexpr const char *MSG_STOPPED = "stream-stopped";

    enum class MessageKind {
        START,
        FRAME,
        STOP,
        HEARTBEAT
    };

/**
 * @brief One decoded inbound event. Only the fields of its kind are filled.
 */
    struct InboundMessage {
        MessageKind kind{MessageKind::HEARTBEAT};
        std::string session_id;

        // START
        std::string ingest_url;
        std::string stream_key;
        std::string plan;
        uint32_t bitrate_kbps{0};
        std::string resolution;
        uint32_t frame_rate{0};

        // FRAME
        std::string frame_data;   // data URI (text) or PNG bytes (binary)
        bool binary{false};
        bool has_sequence{false};
        uint64_t sequence{0};
    };

/**
 * @brief Parse a JSON text message.
 *
 * On failure returns false, sets `error` to a short client-facing reason and
 * leaves whatever session id could be read in `out.session_id`.
 */
    bool parse_text_message(const std::string &text, InboundMessage &out, std::string &error);

/**
 * @brief Parse a binary frame message: [u16 BE id length][id bytes][PNG bytes].
 */
    bool parse_binary_frame(const std::string &data, InboundMessage &out, std::string &error);

/// Build the binary frame layout parse_binary_frame() accepts.
    std::string build_binary_frame(const std::string &session_id, const std::string &png_bytes);

    enum class OutboundType {
        READY,
        STATUS,
        ERROR,
        STOPPED
    };

    struct SessionCounters {
        uint64_t frames_written{0};
        uint64_t frames_dropped{0};
        uint64_t decode_errors{0};
        uint64_t pending_frames{0};
        uint64_t uptime_ms{0};
    };

    struct OutboundMessage {
        OutboundType type{OutboundType::STATUS};
        std::string session_id;
        std::string state;        // READY, STATUS
        std::string destination;  // READY (redacted)
        std::string message;      // ERROR
        std::string kind;         // ERROR: fault kind name
        std::string exit_reason;  // STOPPED
        std::string warning;      // STATUS, optional
        bool has_counters{false};
        SessionCounters counters; // STATUS
    };

    const char *outbound_type_name(OutboundType t);

    OutboundMessage make_ready(const std::string &session_id, const std::string &redacted_destination);
    OutboundMessage make_error(const std::string &session_id, const std::string &kind, const std::string &message);
    OutboundMessage make_stopped(const std::string &session_id, const std::string &exit_reason);
    OutboundMessage make_status(const std::string &session_id, const std::string &state, const SessionCounters &c);

    std::string serialize(const OutboundMessage &msg);

} // namespace canvasrelay::protocol

#endif // CANVASRELAY_PROTOCOL_HPP
