/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_TEST_SUPPORT_HPP
#define CANVASRELAY_TEST_SUPPORT_HPP

#pragma once

#include <common.hpp>
#include <frame_codec.hpp>
#include <protocol.hpp>
#include <session.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <png.h>
#include <unistd.h>

namespace testsupport {

    /// Solid-colour RGBA PNG file bytes, written with libpng's simplified API.
    inline std::string make_png(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b) {
        std::vector<uint8_t> px((size_t)w * h * 4);
        for (size_t i = 0; i < px.size(); i += 4) {
            px[i] = r;
            px[i + 1] = g;
            px[i + 2] = b;
            px[i + 3] = 255;
        }
        png_image img;
        std::memset(&img, 0, sizeof(img));
        img.version = PNG_IMAGE_VERSION;
        img.width = w;
        img.height = h;
        img.format = PNG_FORMAT_RGBA;

        png_alloc_size_t size = 0;
        if (!png_image_write_to_memory(&img, nullptr, &size, 0, px.data(), 0, nullptr)) return std::string();
        std::string out(size, '\0');
        if (!png_image_write_to_memory(&img, &out[0], &size, 0, px.data(), 0, nullptr)) return std::string();
        out.resize(size);
        return out;
    }

    /// PNG from an explicit RGBA buffer.
    inline std::string make_png(uint32_t w, uint32_t h, const std::vector<uint8_t> &rgba) {
        png_image img;
        std::memset(&img, 0, sizeof(img));
        img.version = PNG_IMAGE_VERSION;
        img.width = w;
        img.height = h;
        img.format = PNG_FORMAT_RGBA;

        png_alloc_size_t size = 0;
        if (!png_image_write_to_memory(&img, nullptr, &size, 0, rgba.data(), 0, nullptr)) return std::string();
        std::string out(size, '\0');
        if (!png_image_write_to_memory(&img, &out[0], &size, 0, rgba.data(), 0, nullptr)) return std::string();
        out.resize(size);
        return out;
    }

    inline std::string data_uri(const std::string &png) {
        return std::string(canvasrelay::codec::PNG_DATA_URI_PREFIX) +
               canvasrelay::common::base64Encode((const unsigned char *)png.data(), png.size());
    }

    /// Stand-in encoder: /bin/sh running `script`.
    inline canvasrelay::session::SessionSettings shell_encoder(const std::string &script) {
        canvasrelay::session::SessionSettings s;
        s.encoder_binary = "/bin/sh";
        s.encoder_args_override = {"-c", script};
        s.spawn_timeout = std::chrono::milliseconds(2000);
        s.stop_grace = std::chrono::milliseconds(1000);
        s.kill_wait = std::chrono::milliseconds(500);
        s.max_pending_frames = 8;
        return s;
    }

    inline canvasrelay::quality::QualityProfile tiny_profile() {
        canvasrelay::quality::QualityProfile p;
        p.width = 16;
        p.height = 16;
        p.frame_rate = 30;
        p.bitrate_kbps = 500;
        return p;
    }

    inline std::string temp_path(const std::string &tag) {
        return "/tmp/canvasrelay_test_" + tag + "_" + std::to_string((long long)::getpid()) + "_" +
               std::to_string(canvasrelay::common::steadyNowMs());
    }

    inline bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    struct Record {
        uint64_t connection;
        canvasrelay::protocol::OutboundMessage msg;
    };

    /// EventSink that keeps everything it is given.
    class RecordingSink : public canvasrelay::session::EventSink {
    public:
        void publish(uint64_t connection_id, const canvasrelay::protocol::OutboundMessage &msg) override {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                records_.push_back(Record{connection_id, msg});
            }
            cv_.notify_all();
        }

        std::vector<Record> records() const {
            std::lock_guard<std::mutex> lk(mtx_);
            return records_;
        }

        size_t count(canvasrelay::protocol::OutboundType type, const std::string &session_id) const {
            std::lock_guard<std::mutex> lk(mtx_);
            size_t n = 0;
            for (const auto &r : records_) {
                if (r.msg.type == type && r.msg.session_id == session_id) ++n;
            }
            return n;
        }

        size_t count(canvasrelay::protocol::OutboundType type) const {
            std::lock_guard<std::mutex> lk(mtx_);
            size_t n = 0;
            for (const auto &r : records_) {
                if (r.msg.type == type) ++n;
            }
            return n;
        }

        /// Last message of `type` for `session_id`; type STATUS with empty id when none.
        canvasrelay::protocol::OutboundMessage last(canvasrelay::protocol::OutboundType type, const std::string &session_id) const {
            std::lock_guard<std::mutex> lk(mtx_);
            for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
                if (it->msg.type == type && it->msg.session_id == session_id) return it->msg;
            }
            return canvasrelay::protocol::OutboundMessage{};
        }

        bool wait_count(canvasrelay::protocol::OutboundType type, const std::string &session_id, size_t n,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
            std::unique_lock<std::mutex> lk(mtx_);
            return cv_.wait_for(lk, timeout, [&]() {
                size_t c = 0;
                for (const auto &r : records_) {
                    if (r.msg.type == type && r.msg.session_id == session_id) ++c;
                }
                return c >= n;
            });
        }

        void clear() {
            std::lock_guard<std::mutex> lk(mtx_);
            records_.clear();
        }

    private:
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::vector<Record> records_;
    };

} // namespace testsupport

#endif // CANVASRELAY_TEST_SUPPORT_HPP
