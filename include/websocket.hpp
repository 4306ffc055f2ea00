/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_WEBSOCKET_HPP
#define CANVASRELAY_WEBSOCKET_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace canvasrelay::ws {

//
// RFC 6455 framing used by the gateway. Everything here works on byte
// buffers so the epoll loop can feed partial reads and retry later.
//
    enum class Opcode : uint8_t {
        CONTINUATION = 0x0,
        TEXT = 0x1,
        BINARY = 0x2,
        CLOSE = 0x8,
        PING = 0x9,
        PONG = 0xA
    };

    constexpr uint16_t CLOSE_NORMAL = 1000;
    constexpr uint16_t CLOSE_GOING_AWAY = 1001;
    constexpr uint16_t CLOSE_PROTOCOL_ERROR = 1002;
    constexpr uint16_t CLOSE_TOO_BIG = 1009;
    constexpr uint16_t CLOSE_NO_STATUS = 1005;

    constexpr size_t MAX_CONTROL_PAYLOAD = 125;

    enum class ParseStatus {
        NEED_MORE,
        OK,
        ERROR
    };

    struct HandshakeRequest {
        std::string path;   // request target without the query string
        std::string key;    // Sec-WebSocket-Key
        std::string origin;
    };

/**
 * @brief Parse the HTTP/1.1 upgrade request at the start of `buf`.
 *
 * NEED_MORE until the blank line arrives (ERROR once `max_bytes` is exceeded
 * without one). On OK `consumed` is the length of the request head.
 */
    ParseStatus parse_handshake(const std::string &buf, size_t max_bytes, HandshakeRequest &out,
                                size_t &consumed, std::string &error);

/// base64(SHA-1(key + GUID))
    std::string accept_key(const std::string &client_key);

    std::string handshake_response(const std::string &client_key);
    std::string http_error_response(int status, const std::string &reason);

    struct Frame {
        bool fin{true};
        Opcode opcode{Opcode::TEXT};
        std::string payload;
    };

/**
 * @brief Parse one client frame starting at `offset`.
 *
 * Client frames must be masked. On ERROR `close_code` says why
 * (CLOSE_PROTOCOL_ERROR or CLOSE_TOO_BIG when the payload exceeds `max_payload`).
 */
    ParseStatus parse_frame(const std::string &buf, size_t offset, size_t max_payload, Frame &out,
                            size_t &consumed, uint16_t &close_code);

/// Unmasked server frame.
    std::string encode_frame(Opcode opcode, const std::string &payload, bool fin = true);

/// Masked frame as a client sends it.
    std::string encode_masked_frame(Opcode opcode, const std::string &payload, uint32_t mask, bool fin = true);

    std::string encode_close(uint16_t code, const std::string &reason = std::string());

/// Status code of a close payload, CLOSE_NO_STATUS when it carries none.
    uint16_t close_code_of(const std::string &payload);

    struct Message {
        Opcode opcode{Opcode::TEXT};
        std::string data;
    };

/**
 * @brief Joins fragmented data messages; control frames pass straight through.
 */
    class MessageAssembler {
    public:
        enum class Result {
            NONE,     // fragment stored, message incomplete
            MESSAGE,  // complete TEXT or BINARY message in `out`
            CONTROL,  // CLOSE / PING / PONG in `out`
            ERROR
        };

        explicit MessageAssembler(size_t max_message);

        Result push(Frame &frame, Message &out, uint16_t &close_code);

        void reset();
        bool in_progress() const { return in_progress_; }

    private:
        const size_t max_message_;
        bool in_progress_;
        Opcode opcode_;
        std::string buffer_;
    };

} // namespace canvasrelay::ws

#endif // CANVASRELAY_WEBSOCKET_HPP
