//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "exec_core.h"
#include "sandbox.h"
#include "supervisor.h"
#include "workspace.h"

namespace runbox {

// A program blocked on input, kept alive between continuations. Every field
// but `id` and `last_active` is guarded by `lock`.
struct session_t {
    using clock = std::chrono::steady_clock;

    session_t(std::string sid, std::size_t out_cap)
            : id(std::move(sid)), out(out_cap), err(out_cap) {}

    const std::string id;
    std::string project_id;
    language_t language = language_t::_python;
    std::string entry;
    bool compiled = false;
    // appended to stderr if the program fails at runtime
    std::string failure_note;
    clock::time_point start_time;
    std::atomic<std::int64_t> last_active{0};

    // destroyed after the program, which may still have files open in it
    std::unique_ptr<Workspace> workspace;
    std::unique_ptr<RunningProgram> program;
    OutputBuffer out, err;
    watch_conf_t watch;
    // time spent supervised, summed over every attempt
    tm_usage_t execution_time_ms = 0;

    std::mutex lock;
    // set once the session left the store
    bool closed = false;

    void touch(clock::time_point now) {
        last_active = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
                              .count();
    }
};

using session_ptr = std::shared_ptr<session_t>;

std::string new_session_id();

// The table of live sessions, keyed by session id
class SessionStore {
  public:
    using clock = session_t::clock;

    explicit SessionStore(std::size_t capacity) : capacity_(capacity) {}
    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;

    // Adds `s`. In a full table the least recently active idle session is
    // closed and returned so the caller can finish it. Fails when the table
    // is full and every session is busy.
    std::pair<bool, session_ptr> create(session_ptr s);
    session_ptr get(std::string_view id) const;
    // Marks the session active now; false if it is gone
    bool update(std::string_view id, clock::time_point now);
    // Takes the session out of the table; the caller must hold its lock
    session_ptr remove(std::string_view id);
    // Closes and returns idle sessions whose lifetime ran out, and those whose
    // program ended and that saw no activity for `ended_grace_ms`. The session
    // named `keep` is left alone.
    std::vector<session_ptr> reap(clock::time_point now, tm_usage_t lifetime_ms,
                                  tm_usage_t ended_grace_ms, std::string_view keep = {});
    // Closes and returns every idle session
    std::vector<session_ptr> clear();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

  private:
    std::size_t capacity_;
    mutable std::mutex lock_;
    std::map<std::string, session_ptr, std::less<>> sessions_;
};

}  // namespace runbox
