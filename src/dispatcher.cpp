/*
* @license
* (C) zachbabanov
*
*/

#include <dispatcher.hpp>
#include <fault.hpp>
#include <logger.hpp>
#include <quality.hpp>

#include <utility>

namespace canvasrelay::gateway {

    using session::StreamSession;

    Dispatcher::Dispatcher(session::SessionRegistry &registry, session::EventSink *sink)
            : registry_(registry), sink_(sink) {}

    void Dispatcher::handle(uint64_t connection_id, protocol::InboundMessage msg) {
        switch (msg.kind) {
            case protocol::MessageKind::START:
                handle_start(connection_id, msg);
                break;
            case protocol::MessageKind::FRAME:
                handle_frame(connection_id, msg);
                break;
            case protocol::MessageKind::STOP:
                handle_stop(connection_id, msg);
                break;
            case protocol::MessageKind::HEARTBEAT:
                handle_heartbeat(connection_id, msg);
                break;
        }
    }

    void Dispatcher::handle_malformed(uint64_t connection_id, const std::string &session_id, const std::string &error) {
        LOG_NET_DEBUG("Connection {}: rejected message: {}", connection_id, error);
        sink_->publish(connection_id, protocol::make_error(session_id, "", error));
    }

    void Dispatcher::handle_start(uint64_t connection_id, const protocol::InboundMessage &msg) {
        quality::QualityRequest qreq;
        qreq.plan = msg.plan;
        qreq.bitrate_kbps = msg.bitrate_kbps;
        qreq.resolution = msg.resolution;
        qreq.frame_rate = msg.frame_rate;

        session::StartRequest req;
        Fault fault;
        if (!quality::resolve_profile(registry_.settings().plans, qreq, req.profile, fault)) {
            sink_->publish(connection_id, protocol::make_error(msg.session_id, fault_kind_name(fault.kind), fault.message));
            return;
        }
        req.session_id = msg.session_id;
        req.connection_id = connection_id;
        req.ingest_url = msg.ingest_url;
        req.stream_key = msg.stream_key;

        const char *cfg_error = fault_kind_name(FaultKind::CONFIGURATION_ERROR);
        switch (registry_.start_session(std::move(req))) {
            case session::StartResult::STARTED:
                break;
            case session::StartResult::DUPLICATE:
                sink_->publish(connection_id, protocol::make_error(msg.session_id, cfg_error,
                                                                   "session " + msg.session_id + " already exists"));
                break;
            case session::StartResult::LIMIT_REACHED:
                sink_->publish(connection_id, protocol::make_error(msg.session_id, cfg_error,
                                                                   "too many sessions on this connection"));
                break;
            case session::StartResult::SHUTTING_DOWN:
                sink_->publish(connection_id, protocol::make_error(msg.session_id, cfg_error, "relay is shutting down"));
                break;
        }
    }

    void Dispatcher::handle_frame(uint64_t connection_id, protocol::InboundMessage &msg) {
        std::shared_ptr<StreamSession> s = registry_.find(msg.session_id);
        if (!s) {
            // frames racing a stop or an error teardown
            LOG_SESSION_TRACE("Frame for unknown session {} ignored", msg.session_id);
            return;
        }
        if (s->connection_id() != connection_id) {
            sink_->publish(connection_id, protocol::make_error(msg.session_id, "", "session is owned by another connection"));
            return;
        }
        s->submit_frame(std::move(msg.frame_data), msg.binary);
    }

    void Dispatcher::handle_stop(uint64_t connection_id, const protocol::InboundMessage &msg) {
        std::shared_ptr<StreamSession> s = registry_.find(msg.session_id);
        if (!s) {
            sink_->publish(connection_id, protocol::make_stopped(msg.session_id, "not_found"));
            return;
        }
        if (s->connection_id() != connection_id) {
            sink_->publish(connection_id, protocol::make_error(msg.session_id, "", "session is owned by another connection"));
            return;
        }
        switch (s->request_stop(session::StopReason::CLIENT)) {
            case session::StopResult::ACCEPTED:
                LOG_SESSION_INFO("Stop requested for session {}", msg.session_id);
                break;
            case session::StopResult::ALREADY_STOPPING:
                // the pending teardown reports stream-stopped
                break;
            case session::StopResult::ALREADY_TERMINAL:
                sink_->publish(connection_id, protocol::make_stopped(msg.session_id,
                                                                     s->state() == session::State::ERROR ? "error" : "stopped"));
                break;
        }
    }

    void Dispatcher::handle_heartbeat(uint64_t connection_id, const protocol::InboundMessage &msg) {
        if (!msg.session_id.empty()) {
            std::shared_ptr<StreamSession> s = registry_.find(msg.session_id);
            if (!s || s->connection_id() != connection_id) {
                sink_->publish(connection_id, protocol::make_error(msg.session_id, "", "unknown session"));
                return;
            }
            sink_->publish(connection_id, s->status_message());
            return;
        }
        for (auto &s : registry_.owned_by(connection_id)) {
            sink_->publish(connection_id, s->status_message());
        }
    }

    size_t Dispatcher::connection_lost(uint64_t connection_id) {
        return registry_.teardown_connection(connection_id);
    }

    size_t Dispatcher::emit_status() {
        size_t n = 0;
        for (auto &s : registry_.snapshot()) {
            if (s->state() != session::State::LIVE) continue;
            sink_->publish(s->connection_id(), s->status_message());
            ++n;
        }
        return n;
    }

} // namespace canvasrelay::gateway
