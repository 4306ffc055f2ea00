/*
* @license
* (C) zachbabanov
*
*/

#include <frame_codec.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

#include <png.h>

using namespace canvasrelay::log;

namespace canvasrelay::codec {

    static const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    size_t source_pixel_budget(uint32_t width, uint32_t height) {
        return std::max((size_t)width * height * SOURCE_AREA_FACTOR, MIN_SOURCE_PIXEL_BUDGET);
    }

    bool decode_png(const uint8_t *data, size_t len, size_t max_pixels, RawFrame &out, Fault &fault) {
        if (!data || len < sizeof(PNG_SIGNATURE) || std::memcmp(data, PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) != 0) {
            fault.set(FaultKind::DECODE_ERROR, "payload is not a PNG image");
            return false;
        }

        png_image image;
        std::memset(&image, 0, sizeof(image));
        image.version = PNG_IMAGE_VERSION;

        if (!png_image_begin_read_from_memory(&image, data, len)) {
            fault.set(FaultKind::DECODE_ERROR, std::string("png header: ") + image.message);
            png_image_free(&image);
            return false;
        }

        if (image.width == 0 || image.height == 0 ||
            image.width > MAX_SOURCE_DIMENSION || image.height > MAX_SOURCE_DIMENSION) {
            fault.set(FaultKind::DECODE_ERROR,
                      "png dimensions out of range: " + std::to_string(image.width) + "x" + std::to_string(image.height));
            png_image_free(&image);
            return false;
        }
        if ((size_t)image.width * image.height > max_pixels) {
            fault.set(FaultKind::DECODE_ERROR,
                      "png too large: " + std::to_string(image.width) + "x" + std::to_string(image.height));
            png_image_free(&image);
            return false;
        }

        image.format = PNG_FORMAT_RGBA;
        RawFrame frame;
        frame.width = image.width;
        frame.height = image.height;
        frame.pixels.resize(PNG_IMAGE_SIZE(image));

        if (!png_image_finish_read(&image, nullptr, frame.pixels.data(), 0, nullptr)) {
            fault.set(FaultKind::DECODE_ERROR, std::string("png body: ") + image.message);
            png_image_free(&image);
            return false;
        }

        out = std::move(frame);
        return true;
    }

    void resample_cover(const RawFrame &src, uint32_t width, uint32_t height, RawFrame &out) {
        out.width = width;
        out.height = height;
        out.pixels.assign((size_t)width * height * BYTES_PER_PIXEL, 0);
        if (src.width == 0 || src.height == 0 || width == 0 || height == 0) return;

        const double scale = std::max((double)width / src.width, (double)height / src.height);
        const double off_x = ((double)src.width * scale - width) / 2.0;
        const double off_y = ((double)src.height * scale - height) / 2.0;

        // per-column source taps with 8-bit weights
        std::vector<uint32_t> x0(width), x1(width), wx(width);
        for (uint32_t x = 0; x < width; ++x) {
            double sx = (x + 0.5 + off_x) / scale - 0.5;
            if (sx < 0) sx = 0;
            uint32_t ix = (uint32_t)sx;
            if (ix >= src.width - 1) {
                x0[x] = x1[x] = src.width - 1;
                wx[x] = 0;
            } else {
                x0[x] = ix;
                x1[x] = ix + 1;
                wx[x] = (uint32_t)std::lround((sx - ix) * 256.0);
            }
        }

        const size_t src_stride = (size_t)src.width * BYTES_PER_PIXEL;
        uint8_t *dst = out.pixels.data();
        for (uint32_t y = 0; y < height; ++y) {
            double sy = (y + 0.5 + off_y) / scale - 0.5;
            if (sy < 0) sy = 0;
            uint32_t y0 = (uint32_t)sy, y1;
            uint32_t wy;
            if (y0 >= src.height - 1) {
                y0 = y1 = src.height - 1;
                wy = 0;
            } else {
                y1 = y0 + 1;
                wy = (uint32_t)std::lround((sy - y0) * 256.0);
            }
            const uint8_t *r0 = src.pixels.data() + (size_t)y0 * src_stride;
            const uint8_t *r1 = src.pixels.data() + (size_t)y1 * src_stride;

            for (uint32_t x = 0; x < width; ++x) {
                const uint8_t *p00 = r0 + (size_t)x0[x] * BYTES_PER_PIXEL;
                const uint8_t *p01 = r0 + (size_t)x1[x] * BYTES_PER_PIXEL;
                const uint8_t *p10 = r1 + (size_t)x0[x] * BYTES_PER_PIXEL;
                const uint8_t *p11 = r1 + (size_t)x1[x] * BYTES_PER_PIXEL;
                const uint32_t fx = wx[x];
                for (size_t c = 0; c < BYTES_PER_PIXEL; ++c) {
                    uint32_t top = p00[c] * (256 - fx) + p01[c] * fx;
                    uint32_t bot = p10[c] * (256 - fx) + p11[c] * fx;
                    *dst++ = (uint8_t)((top * (256 - wy) + bot * wy + (1u << 15)) >> 16);
                }
            }
        }
    }

    bool decode_png_bytes(const uint8_t *data, size_t len, uint32_t expected_width, uint32_t expected_height,
                          RawFrame &out, Fault &fault) {
        if (expected_width == 0 || expected_height == 0) {
            fault.set(FaultKind::DECODE_ERROR, "no target geometry");
            return false;
        }

        RawFrame native;
        if (!decode_png(data, len, source_pixel_budget(expected_width, expected_height), native, fault)) return false;

        if (native.width == expected_width && native.height == expected_height) {
            out = std::move(native);
            return true;
        }

        LOG_CODEC_TRACE("resampling frame {}x{} -> {}x{}", native.width, native.height, expected_width, expected_height);
        resample_cover(native, expected_width, expected_height, out);
        return true;
    }

    bool decode(const std::string &payload, uint32_t expected_width, uint32_t expected_height,
                RawFrame &out, Fault &fault) {
        const size_t prefix_len = std::strlen(PNG_DATA_URI_PREFIX);
        if (payload.size() <= prefix_len || payload.compare(0, prefix_len, PNG_DATA_URI_PREFIX) != 0) {
            fault.set(FaultKind::DECODE_ERROR, "frame is not a PNG data URI");
            return false;
        }

        std::vector<uint8_t> png;
        if (!common::base64Decode(payload, prefix_len, png)) {
            fault.set(FaultKind::DECODE_ERROR, "malformed base64 frame body");
            return false;
        }

        return decode_png_bytes(png.data(), png.size(), expected_width, expected_height, out, fault);
    }

} // namespace canvasrelay::codec
