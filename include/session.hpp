/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_SESSION_HPP
#define CANVASRELAY_SESSION_HPP

#pragma once

#include <backpressure.hpp>
#include <encoder_process.hpp>
#include <fault.hpp>
#include <protocol.hpp>
#include <quality.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace canvasrelay::session {

// Session state machine
    enum class State : int {
        CONNECTING,
        LIVE,
        STOPPING,
        STOPPED,
        ERROR
    };

    const char *state_name(State s);
    inline bool is_terminal(State s) { return s == State::STOPPED || s == State::ERROR; }

/**
 * @brief Where sessions and the dispatcher deliver outbound messages.
 *
 * Implementations must be thread-safe: session workers publish concurrently.
 */
    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void publish(uint64_t connection_id, const protocol::OutboundMessage &msg) = 0;
    };

/// Per-session knobs taken from the relay configuration.
    struct SessionSettings {
        std::string encoder_binary{"ffmpeg"};
        // replaces the profile-derived arguments; only stand-in encoders in tests set it
        std::vector<std::string> encoder_args_override;
        std::chrono::milliseconds spawn_timeout{3000};
        std::chrono::milliseconds stop_grace{3000};
        std::chrono::milliseconds kill_wait{2000};
        size_t max_pending_frames{3};
        uint32_t decode_error_alert_threshold{30}; // 0 disables the warning
        quality::PlanTable plans{quality::PlanTable::defaults()};
    };

    struct StartRequest {
        std::string session_id;
        uint64_t connection_id{0};
        std::string ingest_url;
        std::string stream_key;
        quality::QualityProfile profile;
    };

    enum class StopReason {
        CLIENT,
        TRANSPORT_LOST,
        SHUTDOWN
    };

    enum class StopResult {
        ACCEPTED,
        ALREADY_STOPPING,
        ALREADY_TERMINAL
    };

    enum class FrameResult {
        QUEUED,   // admitted, will be written in order
        DROPPED,  // refused by backpressure
        IGNORED   // session is stopping or finished
    };

    struct Snapshot {
        State state{State::CONNECTING};
        protocol::SessionCounters counters;
        int encoder_pid{-1};
    };

/**
 * @brief One broadcast: owns its encoder and one worker thread.
 *
 * The gateway only enqueues: submit_frame() runs the admission check and
 * hands the payload to the worker, request_stop() raises a flag that the
 * worker honours before any queued frame and that interrupts a write in
 * progress. Spawning, decoding, writing and teardown all happen on the worker.
 *
 * When the session reaches STOPPED or ERROR the worker calls the `on_finished`
 * hook (the registry drops its entry there) and only then emits the final
 * message, so a client that reacts to it can immediately reuse the id.
 */
    class StreamSession : public encoder::EncoderObserver {
    public:
        using FinishedHook = std::function<void(StreamSession *)>;

        StreamSession(StartRequest req, const SessionSettings &settings, EventSink *sink, FinishedHook on_finished);
        ~StreamSession() override;

        StreamSession(const StreamSession &) = delete;
        StreamSession &operator=(const StreamSession &) = delete;

        /// Launch the worker; it spawns the encoder and reports stream-ready / stream-error.
        void start();

        FrameResult submit_frame(std::string payload, bool binary);
        StopResult request_stop(StopReason reason);

        /// Wait for the worker to finish. No-op when called from the worker itself.
        void join();

        const std::string &id() const { return id_; }
        uint64_t connection_id() const { return connection_id_; }
        const quality::QualityProfile &profile() const { return profile_; }

        State state() const;
        bool finished() const { return finished_.load(); }
        Snapshot snapshot() const;

        /// stream-status message for the current counters.
        protocol::OutboundMessage status_message() const;

        // encoder::EncoderObserver (monitor thread)
        void on_publish_rejected(const std::string &diagnostic) override;
        void on_encoder_exit(const encoder::ExitStatus &status) override;

    private:
        struct Event {
            enum class Type { FRAME, ENCODER_REJECTED, ENCODER_EXITED };
            Type type{Type::FRAME};
            std::string payload;
            bool binary{false};
            std::string diagnostic;
            encoder::ExitStatus status;
        };

        void run();
        bool start_encoder();
        void handle_frame(Event &ev);
        void handle_stop();
        void fail(FaultKind kind, const std::string &message);
        void finish();
        void post_front(Event ev);
        bool input_ready() const;

        const std::string id_;
        const uint64_t connection_id_;
        const std::string ingest_url_;
        const std::string stream_key_;
        const quality::QualityProfile profile_;
        const SessionSettings settings_;
        EventSink *sink_;
        FinishedHook on_finished_;

        backpressure::BackpressureController backpressure_;

        mutable std::mutex mtx_;            // state_, encoder_, stop flags, live_since_
        State state_;
        std::unique_ptr<encoder::EncoderProcess> encoder_;
        std::atomic<bool> stop_pending_;    // written under mtx_, read by the worker's wait
        StopReason stop_reason_;
        bool client_stop_;
        std::chrono::steady_clock::time_point live_since_;

        std::mutex queue_mtx_;
        std::condition_variable queue_cv_;
        std::deque<Event> queue_;
        bool queue_closed_;

        std::atomic<bool> interrupt_;       // cancels the write in progress
        std::atomic<bool> finished_;
        std::atomic<uint64_t> decode_errors_;
        uint32_t decode_error_streak_;      // worker only

        std::thread worker_;
    };

} // namespace canvasrelay::session

#endif // CANVASRELAY_SESSION_HPP
