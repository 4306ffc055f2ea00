/*
* @license
* (C) zachbabanov
*
*/

#include <common.hpp>
#include <fault.hpp>
#include <logger.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

#include <openssl/evp.h>

namespace canvasrelay {

    const char *fault_kind_name(FaultKind kind) {
        switch (kind) {
            case FaultKind::NONE: return "None";
            case FaultKind::CONFIGURATION_ERROR: return "ConfigurationError";
            case FaultKind::DECODE_ERROR: return "DecodeError";
            case FaultKind::PIPE_CLOSED: return "PipeClosed";
            case FaultKind::PROCESS_EXITED: return "ProcessExited";
            case FaultKind::PUBLISH_REJECTED: return "PublishRejected";
            case FaultKind::TRANSPORT_LOST: return "TransportLost";
            case FaultKind::CANCELLED: return "Cancelled";
        }
        return "Unknown";
    }

    namespace common {

        using namespace canvasrelay::log;

        int setSocketNonBlocking(sock_t fd) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags == -1) {
                LOG_NET_INFO("fcntl F_GETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                LOG_NET_INFO("fcntl F_SETFL failed: fd={} err={}", fd, strerror(errno));
                return -1;
            }
            return 0;
        }

        int setFdCloseOnExec(int fd) {
            int flags = fcntl(fd, F_GETFD, 0);
            if (flags == -1) return -1;
            return fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }

        void closeSocket(sock_t fd) {
            if (fd >= 0) {
                close(fd);
                LOG_NET_DEBUG("socket closed: {}", fd);
            }
        }

        int enableSocketKeepAliveAndNoDelay(sock_t fd) {
            int on = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0) {
                LOG_NET_INFO("setsockopt(SO_KEEPALIVE) failed fd={} err={}", fd, strerror(errno));
            }
            // keepalive tuning (best-effort)
#ifdef TCP_KEEPIDLE
            int idle = 30;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
#endif
#ifdef TCP_KEEPINTVL
            int interval = 5;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
#endif
#ifdef TCP_KEEPCNT
            int cnt = 3;
            setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif

            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) != 0) {
                LOG_NET_INFO("setsockopt(TCP_NODELAY) failed fd={} err={}", fd, strerror(errno));
            }
            return 0;
        }

        std::string redactSecret(const std::string &text, const std::string &secret) {
            if (secret.empty()) return text;
            std::string out;
            out.reserve(text.size());
            size_t pos = 0;
            while (true) {
                size_t hit = text.find(secret, pos);
                if (hit == std::string::npos) {
                    out.append(text, pos, std::string::npos);
                    break;
                }
                out.append(text, pos, hit - pos);
                out += "***";
                pos = hit + secret.size();
            }
            return out;
        }

        std::string redactDestination(const std::string &ingest_url, const std::string &stream_key) {
            std::string base = redactSecret(ingest_url, stream_key);
            while (!base.empty() && base.back() == '/') base.pop_back();
            return base + "/***";
        }

        std::string base64Encode(const unsigned char *data, size_t len) {
            if (len == 0) return std::string();
            std::string out(4 * ((len + 2) / 3) + 1, '\0');
            int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data, (int)len);
            out.resize(n > 0 ? (size_t)n : 0);
            return out;
        }

        bool base64Decode(const std::string &in, size_t begin, std::vector<uint8_t> &out) {
            out.clear();
            if (begin > in.size()) return false;

            std::string compact;
            compact.reserve(in.size() - begin);
            for (size_t i = begin; i < in.size(); ++i) {
                char c = in[i];
                if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
                compact.push_back(c);
            }
            if (compact.empty() || compact.size() % 4 != 0) return false;

            size_t padding = 0;
            if (compact[compact.size() - 1] == '=') padding++;
            if (compact[compact.size() - 2] == '=') padding++;

            out.resize(compact.size() / 4 * 3);
            int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(compact.data()), (int)compact.size());
            if (n < 0 || (size_t)n < padding) {
                out.clear();
                return false;
            }
            out.resize((size_t)n - padding);
            return true;
        }

        uint64_t steadyNowMs() {
            using namespace std::chrono;
            return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
        }

    } // namespace common
} // namespace canvasrelay
