/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_COMMON_HPP
#define CANVASRELAY_COMMON_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#define INVALID_SOCK (-1)

namespace canvasrelay {
    namespace common {
        using sock_t = int;

// Constants used across gateway/session/encoder
        constexpr size_t BUFFER_SIZE = 64 * 1024;
        constexpr size_t MAX_OUTBOUND_BUFFER = 4 * 1024 * 1024;   // 4 MB soft
        constexpr size_t MAX_OUTBOUND_BUFFER_HARD = 16 * 1024 * 1024; // 16 MB hard: slow client is dropped
        constexpr size_t MAX_HANDSHAKE_BYTES = 16 * 1024;
        constexpr size_t MAX_SESSION_ID_LEN = 128;
        constexpr size_t ENCODER_PIPE_SIZE = 1024 * 1024;         // requested F_SETPIPE_SZ for encoder stdin

//
// Utility functions
//
        int setSocketNonBlocking(sock_t fd);
        int setFdCloseOnExec(int fd);
        void closeSocket(sock_t fd);
        int enableSocketKeepAliveAndNoDelay(sock_t fd);

        /// Replace every occurrence of `secret` in `text` with "***". Empty secret leaves text untouched.
        std::string redactSecret(const std::string &text, const std::string &secret);

        /// "rtmp://host/app" + key -> "rtmp://host/app/***"
        std::string redactDestination(const std::string &ingest_url, const std::string &stream_key);

        /// Base64 (RFC 4648, padded) via OpenSSL EVP block coders.
        std::string base64Encode(const unsigned char *data, size_t len);

        /// Decode [begin, end) of `in`; ASCII whitespace is skipped. Returns false on malformed input.
        bool base64Decode(const std::string &in, size_t begin, std::vector<uint8_t> &out);

        uint64_t steadyNowMs();

    } // namespace common
} // namespace canvasrelay

#endif // CANVASRELAY_COMMON_HPP
