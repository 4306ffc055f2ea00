/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_SERVER_HPP
#define CANVASRELAY_SERVER_HPP

#pragma once

#include <common.hpp>
#include <config.hpp>
#include <dispatcher.hpp>
#include <protocol.hpp>
#include <registry.hpp>
#include <session.hpp>
#include <websocket.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace canvasrelay {
    namespace gateway {

        using canvasrelay::common::sock_t;

// Connection state machine
        enum class State : int {
            HANDSHAKE,
            OPEN,
            CLOSING
        };

        struct Connection {
            sock_t fd;
            uint64_t id;
            State state;
            std::string inBuffer;   // raw bytes received, not yet parsed
            std::string outBuffer;  // encoded frames waiting for the socket
            ws::MessageAssembler assembler;
            std::chrono::steady_clock::time_point lastActivity;
            bool wantWrite;         // EPOLLOUT currently registered
            std::string peer;

            Connection(sock_t s, uint64_t cid, size_t maxMessage)
                    : fd(s), id(cid), state(State::HANDSHAKE), assembler(maxMessage),
                      lastActivity(std::chrono::steady_clock::now()), wantWrite(false) {}
        };

        /**
         * WebSocket gateway on a single epoll loop.
         *
         * The loop owns every socket. Sessions publish from their own threads
         * into a mutex-guarded queue and wake the loop through an eventfd; the
         * loop serializes and frames those messages for the owning connection.
         */
        class Server : public session::EventSink {
        public:
            explicit Server(const config::RelayConfig &cfg);
            Server(const config::RelayConfig &cfg, const session::SessionSettings &settings);
            ~Server() override;

            bool start();
            void runLoop();

            /// Ask runLoop() to finish. Async-signal-safe.
            void requestStop();

            /// Port actually bound (differs from the configured one when that was 0).
            int port() const { return boundPort_; }

            size_t connectionCount() const { return connectionCount_.load(); }
            session::SessionRegistry &registry() { return *registry_; }

            // session::EventSink
            void publish(uint64_t connection_id, const protocol::OutboundMessage &msg) override;

        private:
            bool setupListenSocket();
            void acceptNewConnections();
            void handleClientEvent(sock_t fd, uint32_t events);
            bool readFromClient(Connection &c);
            void processHandshake(Connection &c);
            void processFrames(Connection &c);
            void handleMessage(Connection &c, ws::Message &m);
            void queueBytes(Connection &c, const std::string &bytes);
            void flushOutBuffer(Connection &c);
            void updateInterest(Connection &c);
            void closeConnection(sock_t fd, bool transportLost);
            void drainOutbound();
            void onTick();
            void shutdownAll();

        private:
            config::RelayConfig cfg_;
            sock_t listenSocket_;
            int epollFd_;
            int wakeFd_;
            int boundPort_;
            std::atomic<bool> stopRequested_;
            std::atomic<size_t> connectionCount_;

            std::unordered_map<sock_t, Connection> clients_;       // key is socket fd
            std::unordered_map<uint64_t, sock_t> connectionIndex_; // connection id -> fd
            uint64_t nextConnectionId_;
            std::chrono::steady_clock::time_point lastStatus_;

            std::mutex outMtx_;
            std::vector<std::pair<uint64_t, protocol::OutboundMessage>> outbound_;

            // declared last: destroyed first, while the queue above still exists
            std::unique_ptr<session::SessionRegistry> registry_;
            std::unique_ptr<Dispatcher> dispatcher_;
        };

    } // namespace gateway
} // namespace canvasrelay

#endif // CANVASRELAY_SERVER_HPP
