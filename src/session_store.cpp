//
// Copyright (c) 2024-2025 JLGxy
//

#include "session_store.h"

#include "runbox_logs.h"

namespace runbox {

std::string new_session_id() { return "sess_" + randstr(24); }

std::pair<bool, session_ptr> SessionStore::create(session_ptr s) {
    const std::lock_guard lk(lock_);
    session_ptr evicted;
    if (sessions_.size() >= capacity_) {
        session_ptr victim;
        std::unique_lock<std::mutex> victim_lk;
        for (const auto &[id, cur] : sessions_) {
            if (victim && cur->last_active >= victim->last_active) continue;
            std::unique_lock slk(cur->lock, std::try_to_lock);
            // a continuation is running on it
            if (!slk.owns_lock()) continue;
            victim = cur;
            victim_lk = std::move(slk);
        }
        if (!victim) return {false, nullptr};
        victim->closed = true;
        victim_lk.unlock();
        sessions_.erase(victim->id);
        jl::logger.println(RUNBOX_FMT("session table full, evicting {}"), victim->id);
        evicted = std::move(victim);
    }
    const std::string id = s->id;
    sessions_.emplace(id, std::move(s));
    return {true, evicted};
}

session_ptr SessionStore::get(std::string_view id) const {
    const std::lock_guard lk(lock_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionStore::update(std::string_view id, clock::time_point now) {
    auto s = get(id);
    if (!s) return false;
    s->touch(now);
    return true;
}

session_ptr SessionStore::remove(std::string_view id) {
    const std::lock_guard lk(lock_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    auto s = std::move(it->second);
    sessions_.erase(it);
    s->closed = true;
    return s;
}

std::vector<session_ptr> SessionStore::reap(clock::time_point now, tm_usage_t lifetime_ms,
                                            tm_usage_t ended_grace_ms, std::string_view keep) {
    std::vector<session_ptr> ret;
    const auto now_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    const std::lock_guard lk(lock_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto &s = it->second;
        if (s->id == keep) {
            ++it;
            continue;
        }
        std::unique_lock slk(s->lock, std::try_to_lock);
        if (!slk.owns_lock()) {
            ++it;
            continue;
        }
        const bool expired = lifetime_ms > 0 &&
                             now - s->start_time >= std::chrono::milliseconds(lifetime_ms);
        // an ended program stays until its last output could have been collected
        const bool ended = now_ms - s->last_active >= ended_grace_ms &&
                           (!s->program || !s->program->is_alive());
        if (!expired && !ended) {
            ++it;
            continue;
        }
        jl::logger.debug(RUNBOX_FMT("reaping session {} ({})"), s->id,
                         expired ? "expired" : "ended");
        s->closed = true;
        slk.unlock();
        ret.push_back(std::move(s));
        it = sessions_.erase(it);
    }
    return ret;
}

std::vector<session_ptr> SessionStore::clear() {
    std::vector<session_ptr> ret;
    const std::lock_guard lk(lock_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto &s = it->second;
        std::unique_lock slk(s->lock, std::try_to_lock);
        if (!slk.owns_lock()) {
            ++it;
            continue;
        }
        s->closed = true;
        slk.unlock();
        ret.push_back(std::move(s));
        it = sessions_.erase(it);
    }
    return ret;
}

std::size_t SessionStore::size() const {
    const std::lock_guard lk(lock_);
    return sessions_.size();
}

}  // namespace runbox
