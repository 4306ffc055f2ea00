/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_BACKPRESSURE_HPP
#define CANVASRELAY_BACKPRESSURE_HPP

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace canvasrelay::backpressure {

/**
 * @brief Admission gate for frames headed to one encoder.
 *
 * Counts frames that were admitted but not yet written (pendingFrameCount).
 * A frame is dropped, never queued, when that count is already at the limit
 * or when the encoder input cannot take data right now. Every admitted frame
 * must be settled exactly once through complete(), fail() or release().
 */
    class BackpressureController {
    public:
        explicit BackpressureController(size_t max_pending);

        /// Try to admit one frame. `input_ready` is false when the encoder input would block.
        bool admit(bool input_ready);

        /// Admitted frame was written.
        void complete();

        /// Admitted frame write failed.
        void fail();

        /// Admitted frame was discarded before writing (decode error, cancellation).
        void release();

        size_t pending() const { return pending_.load(); }
        size_t limit() const { return max_pending_; }
        uint64_t admitted() const { return admitted_.load(); }
        uint64_t dropped() const { return dropped_.load(); }
        uint64_t written() const { return written_.load(); }
        uint64_t failed() const { return failed_.load(); }

    private:
        void settle();

        const size_t max_pending_;
        std::atomic<size_t> pending_;
        std::atomic<uint64_t> admitted_;
        std::atomic<uint64_t> dropped_;
        std::atomic<uint64_t> written_;
        std::atomic<uint64_t> failed_;
    };

} // namespace canvasrelay::backpressure

#endif // CANVASRELAY_BACKPRESSURE_HPP
