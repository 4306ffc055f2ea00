/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_DISPATCHER_HPP
#define CANVASRELAY_DISPATCHER_HPP

#pragma once

#include <protocol.hpp>
#include <registry.hpp>
#include <session.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace canvasrelay::gateway {

/**
 * @brief Routes decoded client messages to the session registry.
 *
 * Transport agnostic: the WebSocket server feeds it parsed messages and a
 * connection id, replies go out through the EventSink. Never blocks on an
 * encoder; the slowest thing it does is enqueue a frame.
 */
    class Dispatcher {
    public:
        Dispatcher(session::SessionRegistry &registry, session::EventSink *sink);

        /// Frame payloads are moved out of `msg`.
        void handle(uint64_t connection_id, protocol::InboundMessage msg);

        /// Reply stream-error for a message that could not be parsed.
        void handle_malformed(uint64_t connection_id, const std::string &session_id, const std::string &error);

        /// Tear down everything the connection owned. Returns the number of sessions stopped.
        size_t connection_lost(uint64_t connection_id);

        /// Periodic stream-status for every live session.
        size_t emit_status();

    private:
        void handle_start(uint64_t connection_id, const protocol::InboundMessage &msg);
        void handle_frame(uint64_t connection_id, protocol::InboundMessage &msg);
        void handle_stop(uint64_t connection_id, const protocol::InboundMessage &msg);
        void handle_heartbeat(uint64_t connection_id, const protocol::InboundMessage &msg);

        session::SessionRegistry &registry_;
        session::EventSink *sink_;
    };

} // namespace canvasrelay::gateway

#endif // CANVASRELAY_DISPATCHER_HPP
