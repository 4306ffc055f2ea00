/*
* @license
* (C) zachbabanov
*
*/

#include <encoder_process.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <condition_variable>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace canvasrelay::common;
using namespace canvasrelay::log;

namespace canvasrelay::encoder {

/*
 * Implementation notes:
 * - Three pipes: child stdin (raw frames), child stderr (diagnostics) and a
 *   close-on-exec status pipe that carries errno back if execvp fails.
 * - Parent keeps the write end of stdin non-blocking; write() polls for room.
 * - SIGPIPE is ignored in the relay so a vanished reader becomes EPIPE. The
 *   child restores the default disposition before exec.
 */

    struct EncoderProcess::Impl {
        std::atomic<int> stdin_fd{-1};
        int stderr_fd{-1};
        pid_t pid{-1};
        std::string secret;
        EncoderObserver *observer{nullptr};
        std::thread monitor;

        mutable std::mutex mtx;
        std::condition_variable exit_cv;
        bool exited{false};
        ExitStatus status;
        std::string last_error;

        std::mutex terminate_mtx;
        bool terminated{false};
        bool signalled{false};
        ExitStatus final_status;

        std::chrono::steady_clock::time_point started;
        std::atomic<uint64_t> bytes_written{0};
    };

    static void ignore_sigpipe_once() {
        static std::once_flag once;
        std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
    }

    static std::vector<char*> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(cmd.c_str()));
        for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        return argv;
    }

    static void close_fd(int &fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    std::string publish_url(const std::string &ingest_url, const std::string &stream_key) {
        std::string base = ingest_url;
        while (!base.empty() && base.back() == '/') base.pop_back();
        if (stream_key.empty()) return base;
        return base + "/" + stream_key;
    }

    std::vector<std::string> build_encoder_args(const EncoderConfig &cfg) {
        const quality::QualityProfile &p = cfg.profile;
        const std::string fps = std::to_string(p.frame_rate);
        const std::string gop = std::to_string(p.frame_rate * 2);
        const std::string rate = std::to_string(p.bitrate_kbps) + "k";
        const std::string bufsize = std::to_string(p.bitrate_kbps * 2) + "k";

        std::string profile = "baseline";
        std::string level = "3.1";
        if (p.height > 1080) {
            profile = "high";
            level = "5.0";
        } else if (p.height > 720) {
            profile = "high";
            level = "4.0";
        }

        return {
                "-hide_banner",
                "-loglevel", "info",
                // video: raw RGBA frames on stdin
                "-f", "rawvideo",
                "-pix_fmt", "rgba",
                "-s", std::to_string(p.width) + "x" + std::to_string(p.height),
                "-r", fps,
                "-i", "pipe:0",
                // silent audio: the browser sends no audio track
                "-f", "lavfi",
                "-i", "anullsrc=channel_layout=stereo:sample_rate=44100",
                "-map", "0:v",
                "-map", "1:a",
                "-c:v", "libx264",
                "-preset", "veryfast",
                "-tune", "zerolatency",
                "-profile:v", profile,
                "-level:v", level,
                "-pix_fmt", "yuv420p",
                "-b:v", rate,
                "-maxrate", rate,
                "-bufsize", bufsize,
                "-r", fps,
                "-g", gop,
                "-keyint_min", gop,
                "-sc_threshold", "0",
                "-c:a", "aac",
                "-b:a", "128k",
                "-ar", "44100",
                "-ac", "2",
                "-shortest",
                "-f", "flv",
                publish_url(cfg.ingest_url, cfg.stream_key)
        };
    }

    DiagnosticKind classify_diagnostic(const std::string &line) {
        static const char *rejections[] = {
                "Connection refused",
                "Network is unreachable",
                "No route to host",
                "Connection timed out",
                "Input/output error",
                "Server returned 4",
                "403 Forbidden",
                "401 Unauthorized",
                "Failed to connect",
                "RTMP_Connect",
                "Cannot open connection",
                "Error opening output",
        };
        for (const char *r : rejections) {
            if (line.find(r) != std::string::npos) return DiagnosticKind::PUBLISH_REJECTED;
        }
        if (line.find("frame=") != std::string::npos || line.find("fps=") != std::string::npos) {
            return DiagnosticKind::PROGRESS;
        }
        return DiagnosticKind::OTHER;
    }

    std::string ExitStatus::describe() const {
        if (!exited) return "running";
        if (signal != 0) return "killed by signal " + std::to_string(signal);
        return "exit code " + std::to_string(code);
    }

    EncoderProcess::EncoderProcess() : impl_(new Impl()) {}

    EncoderProcess::~EncoderProcess() {
        terminate(std::chrono::milliseconds(500), std::chrono::milliseconds(1000));
        delete impl_;
    }

    std::unique_ptr<EncoderProcess> EncoderProcess::spawn(const EncoderConfig &cfg, EncoderObserver *observer, Fault &fault) {
        if (cfg.binary.empty()) {
            fault.set(FaultKind::CONFIGURATION_ERROR, "no encoder binary configured");
            return nullptr;
        }
        if (cfg.args_override.empty()) {
            if (cfg.ingest_url.empty() || cfg.stream_key.empty()) {
                fault.set(FaultKind::CONFIGURATION_ERROR, "destination requires ingest URL and stream key");
                return nullptr;
            }
            if (cfg.profile.width == 0 || cfg.profile.height == 0 || cfg.profile.frame_rate == 0) {
                fault.set(FaultKind::CONFIGURATION_ERROR, "invalid quality profile");
                return nullptr;
            }
        }

        ignore_sigpipe_once();

        const std::vector<std::string> args = cfg.args_override.empty() ? build_encoder_args(cfg) : cfg.args_override;
        std::vector<char*> argv = build_argv(cfg.binary, args);

        int in_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int status_pipe[2] = {-1, -1};
        if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
            int e = errno;
            close_fd(in_pipe[0]); close_fd(in_pipe[1]);
            close_fd(err_pipe[0]); close_fd(err_pipe[1]);
            close_fd(status_pipe[0]); close_fd(status_pipe[1]);
            LOG_ENC_ERROR("Encoder: pipe creation failed: {}", strerror(e));
            fault.set(FaultKind::CONFIGURATION_ERROR, std::string("pipe creation failed: ") + strerror(e));
            return nullptr;
        }

        pid_t pid = fork();
        if (pid < 0) {
            int e = errno;
            close_fd(in_pipe[0]); close_fd(in_pipe[1]);
            close_fd(err_pipe[0]); close_fd(err_pipe[1]);
            close_fd(status_pipe[0]); close_fd(status_pipe[1]);
            LOG_ENC_ERROR("Encoder: fork failed: {}", strerror(e));
            fault.set(FaultKind::CONFIGURATION_ERROR, std::string("fork failed: ") + strerror(e));
            return nullptr;
        }

        if (pid == 0) {
            // child: only async-signal-safe calls from here on
            setpgid(0, 0);
            signal(SIGPIPE, SIG_DFL);
            dup2(in_pipe[0], STDIN_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) dup2(devnull, STDOUT_FILENO);

            execvp(argv[0], argv.data());
            int e = errno;
            ssize_t ignored = ::write(status_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        // parent
        setpgid(pid, pid); // may race with the child doing the same; either wins
        close_fd(in_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(status_pipe[1]);

        auto p = std::unique_ptr<EncoderProcess>(new EncoderProcess());
        p->impl_->pid = pid;
        p->impl_->stdin_fd.store(in_pipe[1]);
        p->impl_->stderr_fd = err_pipe[0];
        p->impl_->secret = cfg.stream_key;
        p->impl_->observer = observer;
        p->impl_->started = std::chrono::steady_clock::now();

        // Wait for exec: EOF on the status pipe means exec succeeded, an int means it failed.
        int exec_errno = 0;
        bool exec_failed = false;
        bool timed_out = false;
        auto deadline = std::chrono::steady_clock::now() + cfg.spawn_timeout;
        while (true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) { timed_out = true; break; }
            pollfd pfd{status_pipe[0], POLLIN, 0};
            int r = poll(&pfd, 1, (int)left);
            if (r < 0) {
                if (errno == EINTR) continue;
                timed_out = true;
                break;
            }
            if (r == 0) { timed_out = true; break; }
            ssize_t n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
            if (n < 0 && errno == EINTR) continue;
            exec_failed = (n == (ssize_t)sizeof(exec_errno));
            break;
        }
        close_fd(status_pipe[0]);

        if (exec_failed || timed_out) {
            if (timed_out) kill(-pid, SIGKILL);
            int st = 0;
            while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {
            }
            int fd = p->impl_->stdin_fd.exchange(-1);
            close_fd(fd);
            close_fd(p->impl_->stderr_fd);
            p->impl_->exited = true;
            p->impl_->terminated = true;

            std::string why = exec_failed
                    ? "cannot execute encoder '" + cfg.binary + "': " + strerror(exec_errno)
                    : "encoder did not start within " + std::to_string(cfg.spawn_timeout.count()) + " ms";
            LOG_ENC_ERROR("Encoder: spawn failed: {}", why);
            fault.set(FaultKind::CONFIGURATION_ERROR, why);
            return nullptr;
        }

        setSocketNonBlocking(in_pipe[1]);
#ifdef F_SETPIPE_SZ
        // best-effort: a larger pipe absorbs encoder jitter
        if (fcntl(in_pipe[1], F_SETPIPE_SZ, (int)ENCODER_PIPE_SIZE) < 0) {
            LOG_ENC_DEBUG("Encoder: F_SETPIPE_SZ failed: {}", strerror(errno));
        }
#endif

        p->impl_->monitor = std::thread([raw = p.get()]() { raw->monitor_loop(); });

        LOG_ENC_INFO("Encoder started: cmd='{}' pid={} stdin_fd={} args={}", cfg.binary, (int)pid, in_pipe[1], args.size());
        return p;
    }

    void EncoderProcess::handle_diagnostic_line(const std::string &raw) {
        size_t b = raw.find_first_not_of(" \t");
        if (b == std::string::npos) return;
        std::string line = redactSecret(raw.substr(b), impl_->secret);

        switch (classify_diagnostic(line)) {
            case DiagnosticKind::PROGRESS:
                LOG_ENC_TRACE("encoder pid={} progress: {}", (int)impl_->pid, line);
                break;
            case DiagnosticKind::PUBLISH_REJECTED: {
                {
                    std::lock_guard<std::mutex> lk(impl_->mtx);
                    impl_->last_error = line;
                }
                LOG_ENC_WARN("encoder pid={} publish rejected: {}", (int)impl_->pid, line);
                if (impl_->observer) impl_->observer->on_publish_rejected(line);
                break;
            }
            case DiagnosticKind::OTHER: {
                std::lock_guard<std::mutex> lk(impl_->mtx);
                impl_->last_error = line;
                LOG_ENC_DEBUG("encoder pid={}: {}", (int)impl_->pid, line);
                break;
            }
        }
    }

    void EncoderProcess::monitor_loop() {
        std::string pending;
        char buf[4096];
        while (true) {
            ssize_t n = ::read(impl_->stderr_fd, buf, sizeof(buf));
            if (n > 0) {
                pending.append(buf, (size_t)n);
                size_t start = 0;
                while (true) {
                    size_t eol = pending.find_first_of("\r\n", start);
                    if (eol == std::string::npos) break;
                    if (eol > start) handle_diagnostic_line(pending.substr(start, eol - start));
                    start = eol + 1;
                }
                pending.erase(0, start);
                // a progress line without terminator must not grow forever
                if (pending.size() > 64 * 1024) pending.clear();
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        if (!pending.empty()) handle_diagnostic_line(pending);

        int st = 0;
        pid_t r;
        do {
            r = waitpid(impl_->pid, &st, 0);
        } while (r < 0 && errno == EINTR);

        ExitStatus es;
        es.exited = true;
        if (r == impl_->pid) {
            if (WIFEXITED(st)) es.code = WEXITSTATUS(st);
            if (WIFSIGNALED(st)) es.signal = WTERMSIG(st);
        }
        {
            std::lock_guard<std::mutex> lk(impl_->mtx);
            es.forced = impl_->signalled;
            impl_->status = es;
            impl_->exited = true;
        }
        impl_->exit_cv.notify_all();

        LOG_ENC_INFO("Encoder process pid={} finished: {}", (int)impl_->pid, es.describe());
        if (impl_->observer) impl_->observer->on_encoder_exit(es);
    }

    bool EncoderProcess::write(const uint8_t *data, size_t len, const std::atomic<bool> &cancel, Fault &fault) {
        int fd = impl_->stdin_fd.load();
        if (fd < 0) {
            fault.set(FaultKind::PIPE_CLOSED, "encoder input is closed");
            return false;
        }

        size_t off = 0;
        while (off < len) {
            if (cancel.load()) {
                fault.set(FaultKind::CANCELLED, "write cancelled");
                return false;
            }
            ssize_t n = ::write(fd, data + off, len - off);
            if (n > 0) {
                off += (size_t)n;
                impl_->bytes_written.fetch_add((uint64_t)n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd{fd, POLLOUT, 0};
                int r = poll(&pfd, 1, 50);
                if (r > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                    fault.set(FaultKind::PIPE_CLOSED, "encoder closed its input");
                    return false;
                }
                continue;
            }
            if (n < 0 && errno == EPIPE) {
                fault.set(FaultKind::PIPE_CLOSED, "encoder closed its input");
            } else {
                fault.set(FaultKind::PIPE_CLOSED, std::string("encoder input write failed: ") + strerror(errno));
            }
            return false;
        }
        return true;
    }

    bool EncoderProcess::input_open() const {
        return impl_->stdin_fd.load() >= 0;
    }

    bool EncoderProcess::input_writable() const {
        int fd = impl_->stdin_fd.load();
        if (fd < 0) return false;
        pollfd pfd{fd, POLLOUT, 0};
        int r = poll(&pfd, 1, 0);
        return r > 0 && (pfd.revents & POLLOUT) && !(pfd.revents & (POLLERR | POLLHUP | POLLNVAL));
    }

    void EncoderProcess::close_input() {
        int fd = impl_->stdin_fd.exchange(-1);
        if (fd >= 0) {
            close(fd);
            LOG_ENC_DEBUG("Encoder stdin closed pid={}", (int)impl_->pid);
        }
    }

    bool EncoderProcess::wait_exit(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(impl_->mtx);
        return impl_->exit_cv.wait_for(lk, timeout, [this]() { return impl_->exited; });
    }

    void EncoderProcess::signal_group(int sig) {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        if (impl_->exited || impl_->pid <= 0) return;
        impl_->signalled = true;
        if (kill(-impl_->pid, sig) != 0) {
            kill(impl_->pid, sig);
        }
    }

    ExitStatus EncoderProcess::terminate(std::chrono::milliseconds grace, std::chrono::milliseconds kill_wait) {
        std::lock_guard<std::mutex> tl(impl_->terminate_mtx);
        if (impl_->terminated) return impl_->final_status;

        close_input();

        if (!wait_exit(grace)) {
            LOG_ENC_WARN("Encoder pid={} still running after {} ms grace, sending SIGTERM", (int)impl_->pid, grace.count());
            signal_group(SIGTERM);
            if (!wait_exit(kill_wait)) {
                LOG_ENC_WARN("Encoder pid={} ignored SIGTERM, sending SIGKILL", (int)impl_->pid);
                signal_group(SIGKILL);
                if (!wait_exit(kill_wait)) {
                    LOG_ENC_ERROR("Encoder pid={} not reaped {} ms after SIGKILL; waiting", (int)impl_->pid, kill_wait.count());
                    std::unique_lock<std::mutex> lk(impl_->mtx);
                    impl_->exit_cv.wait(lk, [this]() { return impl_->exited; });
                }
            }
        }

        if (impl_->monitor.joinable()) {
            if (impl_->monitor.get_id() == std::this_thread::get_id()) {
                impl_->monitor.detach();
            } else {
                impl_->monitor.join();
            }
        }
        close_fd(impl_->stderr_fd);

        {
            std::lock_guard<std::mutex> lk(impl_->mtx);
            impl_->final_status = impl_->status;
        }
        impl_->terminated = true;
        LOG_ENC_INFO("Encoder process terminated pid={} ({})", (int)impl_->pid, impl_->final_status.describe());
        return impl_->final_status;
    }

    bool EncoderProcess::running() const {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        return !impl_->exited;
    }

    int EncoderProcess::pid() const {
        return (int)impl_->pid;
    }

    ExitStatus EncoderProcess::exit_status() const {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        return impl_->status;
    }

    std::string EncoderProcess::last_error() const {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        return impl_->last_error;
    }

    std::chrono::steady_clock::time_point EncoderProcess::started_at() const {
        return impl_->started;
    }

    uint64_t EncoderProcess::bytes_written() const {
        return impl_->bytes_written.load();
    }

} // namespace canvasrelay::encoder
