/*
* @license
* (C) zachbabanov
*
*/

#include <session.hpp>
#include <common.hpp>
#include <frame_codec.hpp>
#include <logger.hpp>

#include <utility>

namespace canvasrelay::session {

    const char *state_name(State s) {
        switch (s) {
            case State::CONNECTING: return "connecting";
            case State::LIVE: return "live";
            case State::STOPPING: return "stopping";
            case State::STOPPED: return "stopped";
            case State::ERROR: return "error";
        }
        return "unknown";
    }

    StreamSession::StreamSession(StartRequest req, const SessionSettings &settings, EventSink *sink, FinishedHook on_finished)
            : id_(std::move(req.session_id)),
              connection_id_(req.connection_id),
              ingest_url_(std::move(req.ingest_url)),
              stream_key_(std::move(req.stream_key)),
              profile_(req.profile),
              settings_(settings),
              sink_(sink),
              on_finished_(std::move(on_finished)),
              backpressure_(settings.max_pending_frames),
              state_(State::CONNECTING),
              encoder_(nullptr),
              stop_pending_(false),
              stop_reason_(StopReason::CLIENT),
              client_stop_(false),
              queue_closed_(false),
              interrupt_(false),
              finished_(false),
              decode_errors_(0),
              decode_error_streak_(0) {}

    StreamSession::~StreamSession() {
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach();
            } else {
                request_stop(StopReason::TRANSPORT_LOST);
                worker_.join();
            }
        }
    }

    void StreamSession::start() {
        LOG_SESSION_INFO("Session {} starting: {}x{}@{} {} kbps -> {}", id_, profile_.width, profile_.height,
                         profile_.frame_rate, profile_.bitrate_kbps, common::redactDestination(ingest_url_, stream_key_));
        worker_ = std::thread(&StreamSession::run, this);
    }

    void StreamSession::join() {
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    State StreamSession::state() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return state_;
    }

    bool StreamSession::input_ready() const {
        // caller holds mtx_
        if (!encoder_ || !encoder_->input_open()) return false;
        return encoder_->input_writable();
    }

    FrameResult StreamSession::submit_frame(std::string payload, bool binary) {
        bool ready;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stop_pending_.load() || (state_ != State::LIVE && state_ != State::CONNECTING)) {
                return FrameResult::IGNORED;
            }
            ready = state_ == State::LIVE && input_ready();
        }
        if (!backpressure_.admit(ready)) {
            LOG_SESSION_TRACE("Session {} dropped frame (pending={}, ready={})", id_, backpressure_.pending(), ready);
            return FrameResult::DROPPED;
        }

        {
            std::lock_guard<std::mutex> lk(queue_mtx_);
            if (queue_closed_) {
                backpressure_.release();
                return FrameResult::IGNORED;
            }
            Event ev;
            ev.type = Event::Type::FRAME;
            ev.payload = std::move(payload);
            ev.binary = binary;
            queue_.push_back(std::move(ev));
        }
        queue_cv_.notify_one();
        return FrameResult::QUEUED;
    }

    StopResult StreamSession::request_stop(StopReason reason) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (is_terminal(state_)) return StopResult::ALREADY_TERMINAL;
            if (reason == StopReason::CLIENT) client_stop_ = true;
            if (stop_pending_.load()) return StopResult::ALREADY_STOPPING;
            stop_reason_ = reason;
            stop_pending_.store(true);
        }
        interrupt_.store(true);
        {
            std::lock_guard<std::mutex> lk(queue_mtx_);
        }
        queue_cv_.notify_all();
        return StopResult::ACCEPTED;
    }

    void StreamSession::post_front(Event ev) {
        {
            std::lock_guard<std::mutex> lk(queue_mtx_);
            if (queue_closed_) return;
            queue_.push_front(std::move(ev));
        }
        queue_cv_.notify_all();
    }

    void StreamSession::on_publish_rejected(const std::string &diagnostic) {
        interrupt_.store(true);
        Event ev;
        ev.type = Event::Type::ENCODER_REJECTED;
        ev.diagnostic = diagnostic;
        post_front(std::move(ev));
    }

    void StreamSession::on_encoder_exit(const encoder::ExitStatus &status) {
        interrupt_.store(true);
        Event ev;
        ev.type = Event::Type::ENCODER_EXITED;
        ev.status = status;
        post_front(std::move(ev));
    }

    void StreamSession::run() {
        if (start_encoder()) {
            while (!is_terminal(state())) {
                Event ev;
                bool stop = false;
                {
                    std::unique_lock<std::mutex> lk(queue_mtx_);
                    queue_cv_.wait(lk, [this]() { return stop_pending_.load() || !queue_.empty(); });
                    if (stop_pending_.load()) {
                        stop = true;
                    } else {
                        ev = std::move(queue_.front());
                        queue_.pop_front();
                    }
                }
                if (stop) {
                    handle_stop();
                    break;
                }

                switch (ev.type) {
                    case Event::Type::FRAME:
                        handle_frame(ev);
                        break;
                    case Event::Type::ENCODER_REJECTED:
                        fail(FaultKind::PUBLISH_REJECTED, "destination rejected the stream: " + ev.diagnostic);
                        break;
                    case Event::Type::ENCODER_EXITED: {
                        std::string msg = "encoder exited unexpectedly (" + ev.status.describe() + ")";
                        std::string last;
                        {
                            std::lock_guard<std::mutex> lk(mtx_);
                            if (encoder_) last = encoder_->last_error();
                        }
                        if (!last.empty()) msg += ": " + last;
                        fail(FaultKind::PROCESS_EXITED, msg);
                        break;
                    }
                }
            }
        }
        finish();
    }

    bool StreamSession::start_encoder() {
        encoder::EncoderConfig cfg;
        cfg.binary = settings_.encoder_binary;
        cfg.args_override = settings_.encoder_args_override;
        cfg.ingest_url = ingest_url_;
        cfg.stream_key = stream_key_;
        cfg.profile = profile_;
        cfg.spawn_timeout = settings_.spawn_timeout;

        Fault fault;
        std::unique_ptr<encoder::EncoderProcess> enc = encoder::EncoderProcess::spawn(cfg, this, fault);
        if (!enc) {
            fail(FaultKind::CONFIGURATION_ERROR, fault.message.empty() ? "encoder failed to start" : fault.message);
            return false;
        }

        int pid = enc->pid();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            encoder_ = std::move(enc);
            state_ = State::LIVE;
            live_since_ = std::chrono::steady_clock::now();
        }
        LOG_SESSION_INFO("Session {} live (encoder pid={})", id_, pid);
        sink_->publish(connection_id_, protocol::make_ready(id_, common::redactDestination(ingest_url_, stream_key_)));
        return true;
    }

    void StreamSession::handle_frame(Event &ev) {
        if (interrupt_.load() || state() != State::LIVE) {
            backpressure_.release();
            return;
        }

        codec::RawFrame raw;
        Fault fault;
        bool ok = ev.binary
                  ? codec::decode_png_bytes((const uint8_t *)ev.payload.data(), ev.payload.size(),
                                            profile_.width, profile_.height, raw, fault)
                  : codec::decode(ev.payload, profile_.width, profile_.height, raw, fault);
        ev.payload.clear();
        ev.payload.shrink_to_fit();

        if (!ok) {
            backpressure_.release();
            uint64_t total = decode_errors_.fetch_add(1) + 1;
            ++decode_error_streak_;
            LOG_CODEC_DEBUG("Session {} dropped undecodable frame: {}", id_, fault.message);
            const uint32_t threshold = settings_.decode_error_alert_threshold;
            if (threshold != 0 && decode_error_streak_ == threshold) {
                LOG_CODEC_WARN("Session {}: {} consecutive frames failed to decode ({} total)", id_, decode_error_streak_, total);
                protocol::OutboundMessage status = status_message();
                status.warning = "sustained decode errors: " + std::to_string(decode_error_streak_) + " consecutive frames dropped";
                sink_->publish(connection_id_, status);
            }
            return;
        }
        decode_error_streak_ = 0;

        encoder::EncoderProcess *enc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            enc = encoder_.get();
        }

        bool wrote = enc->write(raw.pixels.data(), raw.size(), interrupt_, fault);

        if (wrote) {
            backpressure_.complete();
            return;
        }
        if (fault.kind == FaultKind::CANCELLED) {
            backpressure_.release();
            return;
        }
        backpressure_.fail();
        fail(fault.kind == FaultKind::NONE ? FaultKind::PIPE_CLOSED : fault.kind, "encoder input closed: " + fault.message);
    }

    void StreamSession::handle_stop() {
        StopReason reason;
        encoder::EncoderProcess *enc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_ = State::STOPPING;
            reason = stop_reason_;
            enc = encoder_.get();
        }
        LOG_SESSION_INFO("Session {} stopping", id_);

        encoder::ExitStatus status;
        if (enc) status = enc->terminate(settings_.stop_grace, settings_.kill_wait);

        bool notify;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_ = State::STOPPED;
            notify = client_stop_ || reason == StopReason::SHUTDOWN;
        }
        const char *exit_reason = status.forced ? "killed_after_grace" : "stopped";
        LOG_SESSION_INFO("Session {} stopped ({}, {})", id_, exit_reason, status.describe());

        if (on_finished_) on_finished_(this);
        if (notify) sink_->publish(connection_id_, protocol::make_stopped(id_, exit_reason));
    }

    void StreamSession::fail(FaultKind kind, const std::string &message) {
        encoder::EncoderProcess *enc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (is_terminal(state_)) return;
            state_ = State::ERROR;
            enc = encoder_.get();
        }
        interrupt_.store(true);

        const std::string safe = common::redactSecret(message, stream_key_);
        LOG_SESSION_ERROR("Session {} failed [{}]: {}", id_, fault_kind_name(kind), safe);

        if (enc) enc->terminate(settings_.stop_grace, settings_.kill_wait);

        bool notify;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            notify = client_stop_;
        }
        if (on_finished_) on_finished_(this);
        sink_->publish(connection_id_, protocol::make_error(id_, fault_kind_name(kind), safe));
        if (notify) sink_->publish(connection_id_, protocol::make_stopped(id_, "error"));
    }

    void StreamSession::finish() {
        size_t leftover = 0;
        {
            std::lock_guard<std::mutex> lk(queue_mtx_);
            queue_closed_ = true;
            for (const Event &ev : queue_) {
                if (ev.type == Event::Type::FRAME) {
                    backpressure_.release();
                    ++leftover;
                }
            }
            queue_.clear();
        }
        if (leftover) LOG_SESSION_DEBUG("Session {} discarded {} queued frames", id_, leftover);
        finished_.store(true);
    }

    Snapshot StreamSession::snapshot() const {
        Snapshot s;
        std::chrono::steady_clock::time_point since;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            s.state = state_;
            since = live_since_;
            if (encoder_) s.encoder_pid = encoder_->pid();
        }
        s.counters.frames_written = backpressure_.written();
        s.counters.frames_dropped = backpressure_.dropped();
        s.counters.decode_errors = decode_errors_.load();
        s.counters.pending_frames = backpressure_.pending();
        if (since != std::chrono::steady_clock::time_point{}) {
            s.counters.uptime_ms = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - since).count();
        }
        return s;
    }

    protocol::OutboundMessage StreamSession::status_message() const {
        Snapshot s = snapshot();
        return protocol::make_status(id_, state_name(s.state), s.counters);
    }

} // namespace canvasrelay::session
