/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_FAULT_HPP
#define CANVASRELAY_FAULT_HPP

#pragma once

#include <string>
#include <utility>

namespace canvasrelay {

/**
 * @brief Failure classes of the relay.
 *
 * Every fault is contained to the session it happened in. Only
 * CONFIGURATION_ERROR, PIPE_CLOSED, PROCESS_EXITED and PUBLISH_REJECTED are
 * ever reported to a client; DECODE_ERROR is logged and the frame dropped,
 * TRANSPORT_LOST has nobody left to report to and CANCELLED marks a write that
 * was interrupted by stop/disconnect.
 */
    enum class FaultKind {
        NONE = 0,
        CONFIGURATION_ERROR,
        DECODE_ERROR,
        PIPE_CLOSED,
        PROCESS_EXITED,
        PUBLISH_REJECTED,
        TRANSPORT_LOST,
        CANCELLED
    };

    struct Fault {
        FaultKind kind{FaultKind::NONE};
        std::string message;

        Fault() = default;
        Fault(FaultKind k, std::string m) : kind(k), message(std::move(m)) {}

        bool ok() const { return kind == FaultKind::NONE; }

        void set(FaultKind k, std::string m) {
            kind = k;
            message = std::move(m);
        }

        void clear() {
            kind = FaultKind::NONE;
            message.clear();
        }
    };

/// Wire/log name of a fault kind ("ConfigurationError", "PipeClosed", ...).
    const char *fault_kind_name(FaultKind kind);

} // namespace canvasrelay

#endif // CANVASRELAY_FAULT_HPP
