/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_ENCODER_PROCESS_HPP
#define CANVASRELAY_ENCODER_PROCESS_HPP

#pragma once

#include <fault.hpp>
#include <quality.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace canvasrelay::encoder {

/**
 * @brief Everything needed to launch one session's encoder.
 *
 * When `args_override` is empty the arguments are derived from the profile
 * and destination by build_encoder_args(); otherwise they are passed verbatim
 * (used by deployments with a wrapper script and by the tests).
 */
    struct EncoderConfig {
        std::string binary{"ffmpeg"};
        std::vector<std::string> args_override;
        std::string ingest_url;
        std::string stream_key;
        quality::QualityProfile profile;
        std::chrono::milliseconds spawn_timeout{3000};
    };

/// ingest URL joined with the stream key ("rtmp://host/app" + "key" -> "rtmp://host/app/key").
    std::string publish_url(const std::string &ingest_url, const std::string &stream_key);

/// ffmpeg arguments: raw RGBA on stdin + silent audio -> H.264/AAC in FLV to the publish URL.
    std::vector<std::string> build_encoder_args(const EncoderConfig &cfg);

    enum class DiagnosticKind {
        PROGRESS,         // "frame= ... fps= ..." steady-state lines
        PUBLISH_REJECTED, // destination refused or unreachable
        OTHER
    };

    DiagnosticKind classify_diagnostic(const std::string &line);

    struct ExitStatus {
        bool exited{false};
        int code{-1};   // exit code when the process exited normally
        int signal{0};  // terminating signal, 0 if none
        bool forced{false}; // terminate() had to signal the process

        bool clean() const { return exited && signal == 0 && code == 0; }
        std::string describe() const;
    };

/**
 * @brief Receives asynchronous encoder events. Called on the monitor thread.
 */
    class EncoderObserver {
    public:
        virtual ~EncoderObserver() = default;
        virtual void on_publish_rejected(const std::string &diagnostic) = 0;
        virtual void on_encoder_exit(const ExitStatus &status) = 0;
    };

/**
 * @brief One external encode/mux subprocess.
 *
 * - spawn() forks and execs the encoder with stdin/stderr pipes; an exec
 *   failure is reported through a close-on-exec status pipe and turned into a
 *   CONFIGURATION_ERROR within the spawn timeout.
 * - The child runs in its own process group so signals reach helpers it starts.
 * - A monitor thread reads the diagnostic stream, classifies lines and is the
 *   only place that reaps the child.
 * - write(), close_input() and terminate() belong to the owning session task.
 *   input_writable() may be polled from any thread.
 */
    class EncoderProcess {
    public:
        static std::unique_ptr<EncoderProcess> spawn(const EncoderConfig &cfg, EncoderObserver *observer, Fault &fault);

        ~EncoderProcess();

        EncoderProcess(const EncoderProcess &) = delete;
        EncoderProcess &operator=(const EncoderProcess &) = delete;

        /**
         * @brief Write one whole buffer to the encoder input.
         *
         * Waits (in short poll slices) while the pipe is full, re-checking
         * `cancel` between slices. A closed pipe is PIPE_CLOSED, an interrupted
         * write is CANCELLED; neither raises a signal or an exception.
         */
        bool write(const uint8_t *data, size_t len, const std::atomic<bool> &cancel, Fault &fault);

        /// True while the input is open and the pipe has room right now.
        bool input_writable() const;
        bool input_open() const;

        /// Close the input so the encoder can flush and finalize. Idempotent.
        void close_input();

        /**
         * @brief Close input, wait up to `grace`, then SIGTERM, then SIGKILL.
         *
         * Returns once the process has been reaped. Idempotent: later calls
         * return the first result.
         */
        ExitStatus terminate(std::chrono::milliseconds grace, std::chrono::milliseconds kill_wait);

        bool running() const;
        int pid() const;
        ExitStatus exit_status() const;

        /// Most recent non-progress diagnostic line, stream key redacted.
        std::string last_error() const;

        std::chrono::steady_clock::time_point started_at() const;
        uint64_t bytes_written() const;

    private:
        EncoderProcess();

        void monitor_loop();
        void handle_diagnostic_line(const std::string &line);
        bool wait_exit(std::chrono::milliseconds timeout);
        void signal_group(int sig);

        struct Impl;
        Impl *impl_;
    };

} // namespace canvasrelay::encoder

#endif // CANVASRELAY_ENCODER_PROCESS_HPP
