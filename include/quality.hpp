/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_QUALITY_HPP
#define CANVASRELAY_QUALITY_HPP

#pragma once

#include <fault.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace canvasrelay::quality {

    constexpr uint32_t MIN_BITRATE_KBPS = 250;
    constexpr uint32_t MAX_BITRATE_KBPS = 20000;
    constexpr uint32_t MIN_DIMENSION = 16;
    constexpr uint32_t MAX_DIMENSION = 4096;
    constexpr uint32_t DEFAULT_FRAME_RATE = 30;
    constexpr uint32_t MAX_FRAME_RATE = 60;

/**
 * @brief Encoding parameters of one session. Immutable once the session exists.
 */
    struct QualityProfile {
        uint32_t bitrate_kbps{0};
        uint32_t width{0};
        uint32_t height{0};
        uint32_t frame_rate{DEFAULT_FRAME_RATE};

        /// Bytes of one raw RGBA frame at this geometry.
        size_t frame_bytes() const { return (size_t)width * height * 4; }
    };

/// Plan entry as configured: resolution kept as text ("720p", "1280x720").
    struct PlanQuality {
        uint32_t bitrate_kbps{0};
        std::string resolution;
        uint32_t frame_rate{DEFAULT_FRAME_RATE};
    };

/**
 * @brief Read-only plan -> quality lookup consumed at start-stream time.
 *
 * Unknown plan names fall back to the fallback plan ("free" by default).
 */
    class PlanTable {
    public:
        PlanTable();

        static PlanTable defaults();

        void set(const std::string &plan, const PlanQuality &q);
        void set_fallback(const std::string &plan);

        PlanQuality lookup(const std::string &plan) const;
        bool contains(const std::string &plan) const;
        size_t size() const { return plans_.size(); }

    private:
        std::map<std::string, PlanQuality> plans_;
        std::string fallback_;
    };

/// Caller-supplied overrides from start-stream; zero / empty = not given.
    struct QualityRequest {
        std::string plan;
        uint32_t bitrate_kbps{0};
        std::string resolution;
        uint32_t frame_rate{0};
    };

/// "480p" | "720p" | "1080p" | "1440p" | "WxH". Width/height must be even and within limits.
    bool parse_resolution(const std::string &text, uint32_t &width, uint32_t &height);

/**
 * @brief Resolve the session profile from the plan table plus explicit overrides.
 *
 * Bitrate is clamped to [MIN_BITRATE_KBPS, MAX_BITRATE_KBPS]. A malformed
 * resolution or frame rate is a CONFIGURATION_ERROR.
 */
    bool resolve_profile(const PlanTable &plans, const QualityRequest &req, QualityProfile &out, Fault &fault);

} // namespace canvasrelay::quality

#endif // CANVASRELAY_QUALITY_HPP
