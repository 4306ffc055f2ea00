/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_REGISTRY_HPP
#define CANVASRELAY_REGISTRY_HPP

#pragma once

#include <session.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace canvasrelay::session {

    enum class StartResult {
        STARTED,
        DUPLICATE,
        LIMIT_REACHED,
        SHUTTING_DOWN
    };

/**
 * @brief The table of live sessions, keyed by session id.
 *
 * All inserts and removals happen under one mutex. A session removes itself
 * (through its finished hook) once it is STOPPED or ERROR; its worker thread
 * is joined later by reap() or shutdown(), never from inside the session.
 */
    class SessionRegistry {
    public:
        SessionRegistry(SessionSettings settings, EventSink *sink, size_t max_sessions_per_connection = 0);
        ~SessionRegistry();

        SessionRegistry(const SessionRegistry &) = delete;
        SessionRegistry &operator=(const SessionRegistry &) = delete;

        /**
         * @brief Create and launch a session.
         *
         * Refused with DUPLICATE while a non-terminal session holds the id, so
         * one id never has two encoders. `existing` receives the current holder.
         */
        StartResult start_session(StartRequest req, std::shared_ptr<StreamSession> *existing = nullptr);

        std::shared_ptr<StreamSession> find(const std::string &id) const;
        std::vector<std::shared_ptr<StreamSession>> owned_by(uint64_t connection_id) const;
        std::vector<std::shared_ptr<StreamSession>> snapshot() const;

        /// Stop every session of a lost connection. Returns how many teardowns were started.
        size_t teardown_connection(uint64_t connection_id);

        /// Ask every session to stop (SHUTDOWN).
        size_t stop_all();

        /// Join the workers of finished sessions and release them.
        size_t reap();

        /// stop_all() and wait for every worker. Later start_session() calls are refused.
        void shutdown();

        size_t size() const;
        const SessionSettings &settings() const { return settings_; }

    private:
        void on_session_finished(StreamSession *s);

        const SessionSettings settings_;
        EventSink *sink_;
        const size_t max_per_connection_;

        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<StreamSession>> sessions_;
        std::vector<std::shared_ptr<StreamSession>> retired_;
        bool shutting_down_;
    };

} // namespace canvasrelay::session

#endif // CANVASRELAY_REGISTRY_HPP
