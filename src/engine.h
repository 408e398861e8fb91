//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <string_view>
#include <thread>

#include "exec_core.h"
#include "language_suite.h"
#include "phase.h"
#include "run_history.h"
#include "sandbox.h"
#include "session_store.h"
#include "settings.h"
#include "supervisor.h"

namespace runbox {

// Entry point of every execution. Nothing thrown below escapes execute(),
// resume() or cancel(): failures come back as failed results.
class Engine {
  public:
    explicit Engine(engine_conf_t conf);
    ~Engine();
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    exec_result_t execute(const exec_request_t &req);
    // Sends one line of input to a waiting session
    exec_result_t resume(std::string_view session_id, std::string_view input);
    // Kills a waiting session and records it as failed
    exec_result_t cancel(std::string_view session_id);
    // Finishes sessions whose lifetime ran out, and sessions whose program
    // ended and that nobody continued within the continuation window; returns
    // how many. `keep` is skipped.
    std::size_t reap(std::string_view keep = {});

    // The language a request runs as, or why it has none
    std::optional<language_t> resolve_language(const exec_request_t &req, std::string &why) const;
    phase_result_t detect(const exec_request_t &req) const;
    // nullopt when `lang` can run here, otherwise what is missing
    std::optional<std::string> check(language_t lang);

    RunHistory &history() { return history_; }
    const engine_conf_t &conf() const { return conf_; }
    std::size_t live_sessions() const { return sessions_.size(); }

  private:
    engine_conf_t conf_;
    ProcessBackend process_;
    ContainerBackend container_;
    RunHistory history_;
    SessionStore sessions_;
    std::map<language_t, std::unique_ptr<LanguageSuite>> suites_;
    std::counting_semaphore<> slots_;

    std::mutex reaper_lock_;
    std::condition_variable reaper_cv_;
    bool stopping_ = false;
    std::thread reaper_;

    SandboxBackend &backend_for(language_t lang);
    LanguageSuite &suite(language_t lang) const { return *suites_.at(lang); }

    exec_result_t execute_impl(const exec_request_t &req);
    exec_result_t resume_impl(std::string_view session_id, std::string_view input);
    exec_result_t cancel_impl(std::string_view session_id);

    // Turns a finished attempt into a result; keeps the session in the store
    // while it waits for input
    exec_result_t waiting(const session_t &s);
    exec_result_t settle(const session_ptr &s, const watch_outcome_t &o, bool stored);
    exec_result_t terminal(session_t &s, exec_state_t state, int exit_code, error_kind_t kind);
    exec_result_t infrastructure(language_t lang, std::string_view diagnostic, tm_usage_t tm);
    // Ends an evicted, expired or exited session nobody is waiting on
    void finish_abandoned(const session_ptr &s, std::string_view note, error_kind_t kind);
    void record(const exec_result_t &res, const std::string &project_id, language_t lang,
                const std::string &entry);

    void reaper_loop();
};

}  // namespace runbox
