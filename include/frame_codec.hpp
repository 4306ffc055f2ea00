/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_FRAME_CODEC_HPP
#define CANVASRELAY_FRAME_CODEC_HPP

#pragma once

#include <fault.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canvasrelay::codec {

    constexpr size_t BYTES_PER_PIXEL = 4; // RGBA, 8 bit per channel, rows top-down
    constexpr uint32_t MAX_SOURCE_DIMENSION = 4096;
    // a source may hold at most this many times the target area, but never
    // less than a 1080p canvas
    constexpr size_t SOURCE_AREA_FACTOR = 4;
    constexpr size_t MIN_SOURCE_PIXEL_BUDGET = 1920 * 1080;
    constexpr const char *PNG_DATA_URI_PREFIX = "data:image/png;base64,";

/**
 * @brief A raw fixed-geometry frame ready to be piped into the encoder.
 */
    struct RawFrame {
        uint32_t width{0};
        uint32_t height{0};
        std::vector<uint8_t> pixels; // width * height * BYTES_PER_PIXEL

        size_t size() const { return pixels.size(); }
        bool empty() const { return pixels.empty(); }
    };

/**
 * @brief Decode one canvas frame and bring it to the exact encoder geometry.
 *
 * `payload` must be a PNG data URI ("data:image/png;base64,..."), which is the
 * only accepted encoding. Any other prefix, a broken base64 body or an
 * undecodable PNG is a DECODE_ERROR, and so is a source larger than
 * source_pixel_budget(). Images of a different size are scaled to cover the
 * target and centre-cropped.
 */
    bool decode(const std::string &payload, uint32_t expected_width, uint32_t expected_height,
                RawFrame &out, Fault &fault);

/// Binary fast path: `data` holds the PNG file bytes directly.
    bool decode_png_bytes(const uint8_t *data, size_t len, uint32_t expected_width, uint32_t expected_height,
                          RawFrame &out, Fault &fault);

/// Largest source image, in pixels, accepted for a width x height target.
    size_t source_pixel_budget(uint32_t width, uint32_t height);

/**
 * @brief Decode a PNG at its native size into RGBA.
 *
 * The header is checked against `max_pixels` before any pixel buffer is
 * allocated; a larger image is a DECODE_ERROR.
 */
    bool decode_png(const uint8_t *data, size_t len, size_t max_pixels, RawFrame &out, Fault &fault);

/// Scale `src` to cover width x height (bilinear), centre-crop the overflow.
    void resample_cover(const RawFrame &src, uint32_t width, uint32_t height, RawFrame &out);

} // namespace canvasrelay::codec

#endif // CANVASRELAY_FRAME_CODEC_HPP
