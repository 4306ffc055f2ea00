/*
* @license
* (C) zachbabanov
*
*/

#include <registry.hpp>
#include <logger.hpp>

#include <utility>

namespace canvasrelay::session {

    SessionRegistry::SessionRegistry(SessionSettings settings, EventSink *sink, size_t max_sessions_per_connection)
            : settings_(std::move(settings)),
              sink_(sink),
              max_per_connection_(max_sessions_per_connection),
              shutting_down_(false) {}

    SessionRegistry::~SessionRegistry() {
        shutdown();
    }

    StartResult SessionRegistry::start_session(StartRequest req, std::shared_ptr<StreamSession> *existing) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutting_down_) return StartResult::SHUTTING_DOWN;

        auto it = sessions_.find(req.session_id);
        if (it != sessions_.end()) {
            if (!is_terminal(it->second->state())) {
                if (existing) *existing = it->second;
                LOG_SESSION_WARN("Rejecting duplicate start for session {} (state {})", req.session_id,
                                 state_name(it->second->state()));
                return StartResult::DUPLICATE;
            }
            // finished but its worker has not unregistered yet
            retired_.push_back(std::move(it->second));
            sessions_.erase(it);
        }

        if (max_per_connection_ != 0) {
            size_t owned = 0;
            for (const auto &kv : sessions_) {
                if (kv.second->connection_id() == req.connection_id && !is_terminal(kv.second->state())) ++owned;
            }
            if (owned >= max_per_connection_) {
                LOG_SESSION_WARN("Connection {} already owns {} sessions, refusing {}", req.connection_id, owned, req.session_id);
                return StartResult::LIMIT_REACHED;
            }
        }

        const std::string id = req.session_id;
        auto s = std::make_shared<StreamSession>(std::move(req), settings_, sink_,
                                                 [this](StreamSession *done) { on_session_finished(done); });
        sessions_.emplace(id, s);
        s->start();
        return StartResult::STARTED;
    }

    void SessionRegistry::on_session_finished(StreamSession *s) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(s->id());
        if (it != sessions_.end() && it->second.get() == s) {
            retired_.push_back(std::move(it->second));
            sessions_.erase(it);
            LOG_SESSION_DEBUG("Session {} removed from registry ({} active)", s->id(), sessions_.size());
        }
    }

    std::shared_ptr<StreamSession> SessionRegistry::find(const std::string &id) const {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    std::vector<std::shared_ptr<StreamSession>> SessionRegistry::owned_by(uint64_t connection_id) const {
        std::vector<std::shared_ptr<StreamSession>> out;
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : sessions_) {
            if (kv.second->connection_id() == connection_id) out.push_back(kv.second);
        }
        return out;
    }

    std::vector<std::shared_ptr<StreamSession>> SessionRegistry::snapshot() const {
        std::vector<std::shared_ptr<StreamSession>> out;
        std::lock_guard<std::mutex> lk(mtx_);
        out.reserve(sessions_.size());
        for (const auto &kv : sessions_) out.push_back(kv.second);
        return out;
    }

    size_t SessionRegistry::teardown_connection(uint64_t connection_id) {
        size_t n = 0;
        for (auto &s : owned_by(connection_id)) {
            if (s->request_stop(StopReason::TRANSPORT_LOST) != StopResult::ALREADY_TERMINAL) ++n;
        }
        if (n) LOG_SESSION_INFO("Connection {} lost, tearing down {} session(s)", connection_id, n);
        return n;
    }

    size_t SessionRegistry::stop_all() {
        size_t n = 0;
        for (auto &s : snapshot()) {
            if (s->request_stop(StopReason::SHUTDOWN) == StopResult::ACCEPTED) ++n;
        }
        return n;
    }

    size_t SessionRegistry::reap() {
        std::vector<std::shared_ptr<StreamSession>> done;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            for (auto it = retired_.begin(); it != retired_.end();) {
                if ((*it)->finished()) {
                    done.push_back(std::move(*it));
                    it = retired_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto &s : done) s->join();
        return done.size();
    }

    void SessionRegistry::shutdown() {
        std::vector<std::shared_ptr<StreamSession>> all;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (shutting_down_ && sessions_.empty() && retired_.empty()) return;
            shutting_down_ = true;
            for (const auto &kv : sessions_) all.push_back(kv.second);
            for (const auto &s : retired_) all.push_back(s);
        }
        if (!all.empty()) LOG_SESSION_INFO("Shutting down {} session(s)", all.size());
        for (auto &s : all) s->request_stop(StopReason::SHUTDOWN);
        for (auto &s : all) s->join();

        std::lock_guard<std::mutex> lk(mtx_);
        sessions_.clear();
        retired_.clear();
    }

    size_t SessionRegistry::size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return sessions_.size();
    }

} // namespace canvasrelay::session
