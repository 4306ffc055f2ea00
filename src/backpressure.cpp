/*
* @license
* (C) zachbabanov
*
*/

#include <backpressure.hpp>
#include <logger.hpp>

namespace canvasrelay::backpressure {

    BackpressureController::BackpressureController(size_t max_pending)
            : max_pending_(max_pending == 0 ? 1 : max_pending),
              pending_(0), admitted_(0), dropped_(0), written_(0), failed_(0) {}

    bool BackpressureController::admit(bool input_ready) {
        if (!input_ready) {
            dropped_.fetch_add(1);
            return false;
        }
        size_t cur = pending_.load();
        while (true) {
            if (cur >= max_pending_) {
                dropped_.fetch_add(1);
                return false;
            }
            if (pending_.compare_exchange_weak(cur, cur + 1)) break;
        }
        admitted_.fetch_add(1);
        return true;
    }

    void BackpressureController::settle() {
        size_t cur = pending_.load();
        while (cur > 0 && !pending_.compare_exchange_weak(cur, cur - 1)) {
        }
        if (cur == 0) {
            LOG_SESSION_WARN("backpressure: settle() with nothing pending");
        }
    }

    void BackpressureController::complete() {
        written_.fetch_add(1);
        settle();
    }

    void BackpressureController::fail() {
        failed_.fetch_add(1);
        settle();
    }

    void BackpressureController::release() {
        settle();
    }

} // namespace canvasrelay::backpressure
