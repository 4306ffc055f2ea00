/*
* @license
* (C) zachbabanov
*
*/

#include <server.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <cstring>
#include <cerrno>
#include <chrono>

#include <sys/socket.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using namespace canvasrelay::gateway;
using namespace canvasrelay::common;

Server::Server(const config::RelayConfig &cfg)
        : Server(cfg, config::session_settings(cfg))
{
}

Server::Server(const config::RelayConfig &cfg, const session::SessionSettings &settings)
        : cfg_(cfg),
          listenSocket_(INVALID_SOCK),
          epollFd_(-1),
          wakeFd_(-1),
          boundPort_(0),
          stopRequested_(false),
          connectionCount_(0),
          nextConnectionId_(1),
          lastStatus_(std::chrono::steady_clock::now())
{
    registry_.reset(new session::SessionRegistry(settings, this, cfg_.max_sessions_per_connection));
    dispatcher_.reset(new Dispatcher(*registry_, this));
}

Server::~Server() {
    // sessions publish through this object: stop them before anything else goes
    dispatcher_.reset();
    if (registry_) registry_->shutdown();
    registry_.reset();

    for (auto &kv : clients_) closeSocket(kv.first);
    clients_.clear();
    if (epollFd_ >= 0) close(epollFd_);
    if (wakeFd_ >= 0) close(wakeFd_);
    if (listenSocket_ != INVALID_SOCK) closeSocket(listenSocket_);
}

bool Server::setupListenSocket() {
    listenSocket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenSocket_ == INVALID_SOCK) {
        LOG_NET_ERROR("Failed to create listen socket: {}", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(listenSocket_, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg_.port);
    if (inet_pton(AF_INET, cfg_.bind_address.c_str(), &addr.sin_addr) != 1) {
        LOG_NET_ERROR("Invalid bind address '{}'", cfg_.bind_address);
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    if (bind(listenSocket_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_NET_ERROR("bind failed on {}:{}: {}", cfg_.bind_address, cfg_.port, strerror(errno));
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    if (setSocketNonBlocking(listenSocket_) < 0) {
        LOG_NET_ERROR("set nonblocking failed for listen socket");
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    if (listen(listenSocket_, 64) < 0) {
        LOG_NET_ERROR("listen failed: {}", strerror(errno));
        closeSocket(listenSocket_);
        listenSocket_ = INVALID_SOCK;
        return false;
    }

    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (getsockname(listenSocket_, (sockaddr*)&bound, &blen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = cfg_.port;
    }

    LOG_NET_INFO("Listening on {}:{}{}", cfg_.bind_address, boundPort_, cfg_.ws_path);
    return true;
}

bool Server::start() {
    if (!setupListenSocket()) return false;

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        LOG_NET_ERROR("epoll_create1 failed: {}", strerror(errno));
        return false;
    }
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listenSocket_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, listenSocket_, &ev) < 0) {
        LOG_NET_ERROR("epoll_ctl add listen failed: {}", strerror(errno));
        return false;
    }

    wakeFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeFd_ < 0) {
        LOG_NET_ERROR("eventfd failed: {}", strerror(errno));
        return false;
    }
    ev.events = EPOLLIN;
    ev.data.fd = wakeFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeFd_, &ev) < 0) {
        LOG_NET_ERROR("epoll_ctl add eventfd failed: {}", strerror(errno));
        return false;
    }

    LOG_GEN_INFO("Relay started on port {} with encoder '{}' (max {} pending frames/session)",
                 boundPort_, cfg_.encoder_binary, cfg_.max_pending_frames);
    return true;
}

void Server::requestStop() {
    stopRequested_.store(true);
    if (wakeFd_ >= 0) {
        uint64_t one = 1;
        ssize_t r = ::write(wakeFd_, &one, sizeof(one));
        (void)r; // counter saturation only means a wake is already pending
    }
}

void Server::publish(uint64_t connection_id, const protocol::OutboundMessage &msg) {
    {
        std::lock_guard<std::mutex> lk(outMtx_);
        outbound_.emplace_back(connection_id, msg);
    }
    if (wakeFd_ >= 0) {
        uint64_t one = 1;
        ssize_t r = ::write(wakeFd_, &one, sizeof(one));
        (void)r;
    }
}

void Server::runLoop() {
    std::vector<epoll_event> events(64);
    while (!stopRequested_.load()) {
        int n = epoll_wait(epollFd_, events.data(), (int)events.size(), 200);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_NET_ERROR("epoll_wait failed: {}", strerror(errno));
            break;
        }
        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;
            if (fd == listenSocket_) {
                acceptNewConnections();
            } else if (fd == wakeFd_) {
                uint64_t cnt;
                while (::read(wakeFd_, &cnt, sizeof(cnt)) > 0) {
                }
            } else if (clients_.count(fd)) {
                handleClientEvent(fd, ev);
            }
        }

        drainOutbound();
        onTick();
    }
    shutdownAll();
}

void Server::acceptNewConnections() {
    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        sock_t cfd = accept4(listenSocket_, (sockaddr*)&caddr, &clen, SOCK_CLOEXEC);
        if (cfd == INVALID_SOCK) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            LOG_NET_WARN("accept failed: {}", strerror(errno));
            break;
        }

        char hostbuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &caddr.sin_addr, hostbuf, sizeof(hostbuf));
        std::string peer = std::string(hostbuf) + ":" + std::to_string(ntohs(caddr.sin_port));

        if (clients_.size() >= cfg_.max_connections) {
            LOG_NET_WARN("Connection limit {} reached, refusing {}", cfg_.max_connections, peer);
            closeSocket(cfd);
            continue;
        }
        if (setSocketNonBlocking(cfd) < 0) {
            LOG_NET_ERROR("set nonblocking for client failed");
            closeSocket(cfd);
            continue;
        }

        // enable keepalive and TCP_NODELAY for accepted socket
        enableSocketKeepAliveAndNoDelay(cfd);

        epoll_event cev{};
        cev.events = EPOLLIN | EPOLLRDHUP;
        cev.data.fd = cfd;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, cfd, &cev) < 0) {
            LOG_NET_ERROR("epoll_ctl add client failed: {}", strerror(errno));
            closeSocket(cfd);
            continue;
        }

        uint64_t cid = nextConnectionId_++;
        Connection conn(cfd, cid, cfg_.max_message_bytes);
        conn.peer = peer;
        clients_.emplace(cfd, std::move(conn));
        connectionIndex_[cid] = cfd;
        connectionCount_.store(clients_.size());
        LOG_NET_INFO("Accepted connection {} from {} fd={}", cid, peer, (long long)cfd);
    }
}

void Server::handleClientEvent(sock_t fd, uint32_t events) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    Connection &conn = it->second;

    if (events & EPOLLERR) {
        closeConnection(fd, true);
        return;
    }

    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP)) {
        bool alive = readFromClient(conn);
        if (conn.state == State::HANDSHAKE) processHandshake(conn);
        if (conn.state == State::OPEN) processFrames(conn);
        if (!alive) {
            closeConnection(fd, true);
            return;
        }
    }

    flushOutBuffer(conn);
    if (conn.state == State::CLOSING && conn.outBuffer.empty()) {
        closeConnection(fd, true);
    }
}

bool Server::readFromClient(Connection &c) {
    char buf[BUFFER_SIZE];
    while (true) {
        ssize_t n = recv(c.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            c.inBuffer.append(buf, (size_t)n);
            c.lastActivity = std::chrono::steady_clock::now();
            if (c.state == State::HANDSHAKE && c.inBuffer.size() > MAX_HANDSHAKE_BYTES) break;
        } else if (n == 0) {
            LOG_NET_INFO("Peer closed connection {}", c.id);
            return false;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            LOG_NET_WARN("recv failed on connection {}: {}", c.id, strerror(errno));
            return false;
        }
    }
    return true;
}

void Server::processHandshake(Connection &c) {
    ws::HandshakeRequest req;
    size_t consumed = 0;
    std::string error;
    ws::ParseStatus st = ws::parse_handshake(c.inBuffer, MAX_HANDSHAKE_BYTES, req, consumed, error);
    if (st == ws::ParseStatus::NEED_MORE) return;
    if (st == ws::ParseStatus::ERROR) {
        LOG_NET_WARN("Bad handshake from {}: {}", c.peer, error);
        queueBytes(c, ws::http_error_response(400, "Bad Request"));
        c.inBuffer.clear();
        c.state = State::CLOSING;
        return;
    }
    if (req.path != cfg_.ws_path) {
        LOG_NET_WARN("Handshake for unknown path '{}' from {}", req.path, c.peer);
        queueBytes(c, ws::http_error_response(404, "Not Found"));
        c.inBuffer.clear();
        c.state = State::CLOSING;
        return;
    }

    queueBytes(c, ws::handshake_response(req.key));
    c.inBuffer.erase(0, consumed);
    c.state = State::OPEN;
    LOG_NET_INFO("Connection {} upgraded to websocket ({})", c.id, c.peer);
}

void Server::processFrames(Connection &c) {
    size_t offset = 0;
    while (c.state == State::OPEN) {
        ws::Frame frame;
        size_t consumed = 0;
        uint16_t closeCode = 0;
        ws::ParseStatus st = ws::parse_frame(c.inBuffer, offset, cfg_.max_message_bytes, frame, consumed, closeCode);
        if (st == ws::ParseStatus::NEED_MORE) break;
        if (st == ws::ParseStatus::ERROR) {
            LOG_NET_WARN("Protocol error on connection {} (close {})", c.id, (int)closeCode);
            queueBytes(c, ws::encode_close(closeCode));
            c.state = State::CLOSING;
            break;
        }
        offset += consumed;

        ws::Message msg;
        switch (c.assembler.push(frame, msg, closeCode)) {
            case ws::MessageAssembler::Result::NONE:
                break;
            case ws::MessageAssembler::Result::MESSAGE:
                handleMessage(c, msg);
                break;
            case ws::MessageAssembler::Result::CONTROL:
                if (msg.opcode == ws::Opcode::PING) {
                    queueBytes(c, ws::encode_frame(ws::Opcode::PONG, msg.data));
                } else if (msg.opcode == ws::Opcode::CLOSE) {
                    uint16_t code = ws::close_code_of(msg.data);
                    LOG_NET_INFO("Connection {} sent close ({})", c.id, (int)code);
                    queueBytes(c, ws::encode_close(code == ws::CLOSE_NO_STATUS ? ws::CLOSE_NORMAL : code));
                    c.state = State::CLOSING;
                }
                break;
            case ws::MessageAssembler::Result::ERROR:
                LOG_NET_WARN("Fragmentation error on connection {}", c.id);
                queueBytes(c, ws::encode_close(closeCode));
                c.state = State::CLOSING;
                break;
        }
    }
    if (c.state == State::CLOSING) {
        c.inBuffer.clear();
    } else if (offset > 0) {
        c.inBuffer.erase(0, offset);
    }
}

void Server::handleMessage(Connection &c, ws::Message &m) {
    protocol::InboundMessage msg;
    std::string error;
    bool ok = m.opcode == ws::Opcode::BINARY
              ? protocol::parse_binary_frame(m.data, msg, error)
              : protocol::parse_text_message(m.data, msg, error);
    if (!ok) {
        dispatcher_->handle_malformed(c.id, msg.session_id, error);
        return;
    }
    dispatcher_->handle(c.id, std::move(msg));
}

void Server::queueBytes(Connection &c, const std::string &bytes) {
    c.outBuffer += bytes;
    if (c.outBuffer.size() > MAX_OUTBOUND_BUFFER_HARD) {
        LOG_NET_WARN("Connection {} is not reading ({} bytes queued), dropping it", c.id, c.outBuffer.size());
        c.outBuffer.clear();
        c.state = State::CLOSING;
    }
}

void Server::flushOutBuffer(Connection &c) {
    while (!c.outBuffer.empty()) {
        ssize_t n = send(c.fd, c.outBuffer.data(), c.outBuffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            c.outBuffer.erase(0, (size_t)n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        } else {
            LOG_NET_WARN("send failed on connection {}: {}", c.id, strerror(errno));
            c.outBuffer.clear();
            c.state = State::CLOSING;
            break;
        }
    }
    updateInterest(c);
}

void Server::updateInterest(Connection &c) {
    bool want = !c.outBuffer.empty();
    if (want == c.wantWrite) return;
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP | (want ? EPOLLOUT : 0);
    ev.data.fd = c.fd;
    if (epoll_ctl(epollFd_, EPOLL_CTL_MOD, c.fd, &ev) == 0) {
        c.wantWrite = want;
    } else {
        LOG_NET_WARN("epoll_ctl mod failed for connection {}: {}", c.id, strerror(errno));
    }
}

void Server::drainOutbound() {
    std::vector<std::pair<uint64_t, protocol::OutboundMessage>> batch;
    {
        std::lock_guard<std::mutex> lk(outMtx_);
        batch.swap(outbound_);
    }
    if (batch.empty()) return;

    std::vector<sock_t> touched;
    for (auto &item : batch) {
        auto idx = connectionIndex_.find(item.first);
        if (idx == connectionIndex_.end()) continue; // connection already gone
        auto it = clients_.find(idx->second);
        if (it == clients_.end()) continue;
        Connection &c = it->second;
        if (c.state != State::OPEN) continue;
        // status is advisory: skip it for clients that are falling behind
        if (item.second.type == protocol::OutboundType::STATUS && c.outBuffer.size() > MAX_OUTBOUND_BUFFER) continue;
        queueBytes(c, ws::encode_frame(ws::Opcode::TEXT, protocol::serialize(item.second)));
        touched.push_back(c.fd);
    }

    for (sock_t fd : touched) {
        auto it = clients_.find(fd);
        if (it == clients_.end()) continue;
        flushOutBuffer(it->second);
        if (it->second.state == State::CLOSING && it->second.outBuffer.empty()) closeConnection(fd, true);
    }
}

void Server::onTick() {
    auto now = std::chrono::steady_clock::now();

    if (cfg_.status_interval_ms > 0 &&
        now - lastStatus_ >= std::chrono::milliseconds(cfg_.status_interval_ms)) {
        lastStatus_ = now;
        dispatcher_->emit_status();
    }

    if (cfg_.idle_timeout_ms > 0) {
        std::vector<sock_t> idle;
        for (auto &kv : clients_) {
            if (now - kv.second.lastActivity > std::chrono::milliseconds(cfg_.idle_timeout_ms)) idle.push_back(kv.first);
        }
        for (sock_t fd : idle) {
            LOG_NET_INFO("Connection fd={} idle for more than {} ms", (long long)fd, cfg_.idle_timeout_ms);
            closeConnection(fd, true);
        }
    }

    registry_->reap();
}

void Server::closeConnection(sock_t fd, bool transportLost) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    const uint64_t cid = it->second.id;

    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    closeSocket(fd);
    connectionIndex_.erase(cid);
    clients_.erase(it);
    connectionCount_.store(clients_.size());

    size_t stopped = 0;
    if (transportLost && dispatcher_) stopped = dispatcher_->connection_lost(cid);
    LOG_NET_INFO("Closed connection {} fd={} ({} session(s) torn down)", cid, (long long)fd, stopped);
}

void Server::shutdownAll() {
    LOG_GEN_INFO("Shutting down: {} connection(s), {} session(s)", clients_.size(), registry_->size());
    registry_->shutdown();

    drainOutbound();
    std::vector<sock_t> fds;
    for (auto &kv : clients_) {
        Connection &c = kv.second;
        if (c.state == State::OPEN) queueBytes(c, ws::encode_close(ws::CLOSE_GOING_AWAY));
        flushOutBuffer(c);
        fds.push_back(kv.first);
    }
    for (sock_t fd : fds) closeConnection(fd, false);
    LOG_GEN_INFO("Relay stopped");
}
