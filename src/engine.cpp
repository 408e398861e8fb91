//
// Copyright (c) 2024-2025 JLGxy
//

#include "engine.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <string>
#include <utility>

#include "assist.h"
#include "build_pipeline.h"
#include "runbox_logs.h"
#include "workspace.h"

namespace runbox {

namespace chrono = std::chrono;
using clock = session_t::clock;

namespace {

constexpr tm_usage_t _drain_budget_ms = 300;
constexpr tm_usage_t _stdin_write_lim_ms = 1000;

tm_usage_t to_ms(clock::duration d) {
    return chrono::duration_cast<chrono::milliseconds>(d).count();
}

// One of the max_concurrent supervision slots
class AdmissionSlot {
  public:
    AdmissionSlot(std::counting_semaphore<> &sem, tm_usage_t wait_ms)
            : sem_(sem), held_(sem.try_acquire_for(chrono::milliseconds(wait_ms))) {}
    ~AdmissionSlot() {
        if (held_) sem_.release();
    }
    AdmissionSlot(const AdmissionSlot &) = delete;
    AdmissionSlot &operator=(const AdmissionSlot &) = delete;

    explicit operator bool() const { return held_; }

  private:
    std::counting_semaphore<> &sem_;
    bool held_;
};

std::string display_name(language_t lang) {
    switch (lang) {
        case language_t::_python: return "Python";
        case language_t::_javascript: return "JavaScript";
        case language_t::_java: return "Java";
        case language_t::_c: return "C";
    }
    return "unknown";
}

bool all_blank(const std::vector<source_file_t> &files) {
    return std::ranges::all_of(files, [](const source_file_t &f) {
        return std::ranges::all_of(f.content, [](unsigned char c) { return std::isspace(c); });
    });
}

std::string timeout_note(tm_usage_t limit_ms) {
    return fmt::format(RUNBOX_FMT("[Execution timeout after {:g}s]"),
                       static_cast<double>(limit_ms) / 1000);
}

}  // namespace

Engine::Engine(engine_conf_t conf)
        : conf_(std::move(conf)),
          container_(conf_.container),
          history_(conf_.history),
          sessions_(conf_.sessions.capacity),
          slots_(std::max<std::ptrdiff_t>(conf_.sessions.max_concurrent, 1)) {
    // a closed stdin shows up as EPIPE
    std::signal(SIGPIPE, SIG_IGN);
    if (!conf_.log_file.empty()) jl::logger.set_file(conf_.log_file);
    for (auto l : _all_languages) suites_.emplace(l, make_suite(l, conf_.lang(l)));
    std::error_code ec;
    fs::create_directories(conf_.workspace_root, ec);
    if (ec) {
        jl::logger.warn(RUNBOX_FMT("cannot create {}: {}"), conf_.workspace_root.string(),
                        ec.message());
    }
    if (conf_.sessions.reaper_interval_ms > 0) reaper_ = std::thread([this] { reaper_loop(); });
}

Engine::~Engine() {
    {
        const std::lock_guard lk(reaper_lock_);
        stopping_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
    for (const auto &s : sessions_.clear()) {
        const std::lock_guard lk(s->lock);
        jl::logger.debug(RUNBOX_FMT("shutting down session {}"), s->id);
        s->program.reset();
        s->workspace.reset();
    }
}

SandboxBackend &Engine::backend_for(language_t lang) {
    if (conf_.lang(lang).backend == backend_kind_t::_container) return container_;
    return process_;
}

std::optional<language_t> Engine::resolve_language(const exec_request_t &req,
                                                   std::string &why) const {
    if (req.language.empty()) {
        auto lang = infer_language(req.files);
        if (!lang) why = "Could not determine the language: no .py, .js, .java or .c file found";
        return lang;
    }
    auto lang = to_language(req.language);
    if (!lang) why = fmt::format(RUNBOX_FMT("Unsupported language: {}"), req.language);
    return lang;
}

phase_result_t Engine::detect(const exec_request_t &req) const {
    std::string why;
    auto lang = resolve_language(req, why);
    if (!lang) return phase_result_t::fail(error_kind_t::_request, why);
    return suite(*lang).detect(req.files, req.entry_file);
}

std::optional<std::string> Engine::check(language_t lang) {
    const auto &lc = conf_.lang(lang);
    if (lc.backend == backend_kind_t::_browser) return "runs in the browser sandbox";
    if (auto reason = backend_for(lang).unavailable_reason()) return reason;
    if (lc.backend == backend_kind_t::_container) {
        auto code = std::get<0>(run_get_output(
                conf_.container.runtime, {"image", "inspect", "--format", "{{.Id}}", lc.image}));
        if (code != 0) return fmt::format(RUNBOX_FMT("image `{}` is not built"), lc.image);
        return std::nullopt;
    }
    for (const auto *t : {&lc.compile, &lc.compile_object, &lc.link, &lc.run}) {
        if (t->empty()) continue;
        if (std::get<0>(run_get_output(t->program, {"--version"})) == -1) {
            return fmt::format(RUNBOX_FMT("`{}` is not installed"), t->program);
        }
    }
    return std::nullopt;
}

exec_result_t Engine::execute(const exec_request_t &req) {
    try {
        return execute_impl(req);
    } catch (const std::exception &e) {
        jl::logger.println(RUNBOX_FMT("execute: {}"), e.what());
        return failed_result(error_kind_t::_infrastructure,
                             conf_.production ? "Internal error while running the program"
                                              : std::string(e.what()));
    }
}

exec_result_t Engine::resume(std::string_view session_id, std::string_view input) {
    try {
        return resume_impl(session_id, input);
    } catch (const std::exception &e) {
        jl::logger.println(RUNBOX_FMT("resume {}: {}"), session_id, e.what());
        return failed_result(error_kind_t::_infrastructure,
                             conf_.production ? "Internal error while running the program"
                                              : std::string(e.what()));
    }
}

exec_result_t Engine::cancel(std::string_view session_id) {
    try {
        return cancel_impl(session_id);
    } catch (const std::exception &e) {
        jl::logger.println(RUNBOX_FMT("cancel {}: {}"), session_id, e.what());
        return failed_result(error_kind_t::_infrastructure,
                             conf_.production ? "Internal error while running the program"
                                              : std::string(e.what()));
    }
}

exec_result_t Engine::infrastructure(language_t lang, std::string_view diagnostic, tm_usage_t tm) {
    jl::logger.println(RUNBOX_FMT("infrastructure failure ({}): {}"), language_to_str(lang),
                       diagnostic);
    if (conf_.production) {
        return failed_result(error_kind_t::_infrastructure,
                             fmt::format(RUNBOX_FMT("The {} execution environment is temporarily "
                                                    "unavailable. Please try again later."),
                                         display_name(lang)),
                             tm);
    }
    const auto &lc = conf_.lang(lang);
    std::string hint;
    if (lc.backend == backend_kind_t::_container) {
        hint = fmt::format(RUNBOX_FMT("Hint: start the container daemon (check `{} info`) and "
                                      "build the `{}` image."),
                           conf_.container.runtime, lc.image);
    } else {
        const auto &prog = lc.compile.empty() ? lc.run.program : lc.compile.program;
        hint = fmt::format(RUNBOX_FMT("Hint: install the {} toolchain and make sure `{}` is on "
                                      "PATH."),
                           display_name(lang), prog);
    }
    return failed_result(error_kind_t::_infrastructure,
                         fmt::format(RUNBOX_FMT("{}\n{}"), diagnostic, hint), tm);
}

void Engine::record(const exec_result_t &res, const std::string &project_id, language_t lang,
                    const std::string &entry) {
    if (!res.is_terminal() || res.error_kind == error_kind_t::_request) return;
    auto e = history_.append(make_run_entry(res, project_id, lang, entry));
    jl::logger.debug(RUNBOX_FMT("recorded {} ({}) for project `{}`"), e.id,
                     run_status_to_str(e.status), project_id);
}

exec_result_t Engine::terminal(session_t &s, exec_state_t state, int exit_code, error_kind_t kind) {
    exec_result_t r;
    r.state = state;
    r.out_data = s.out.str();
    r.err_data = s.err.str();
    r.exit_code = exit_code;
    r.execution_time_ms = s.execution_time_ms;
    r.error_kind = kind;
    if (s.compiled) r.compile_error = false;
    if (kind == error_kind_t::_runtime && !s.failure_note.empty()) {
        append_line(r.err_data, s.failure_note);
    }
    return r;
}

exec_result_t Engine::waiting(const session_t &s) {
    exec_result_t r;
    r.state = exec_state_t::_waiting_for_input;
    r.out_data = s.out.str();
    r.err_data = s.err.str();
    r.execution_time_ms = s.execution_time_ms;
    r.session_id = s.id;
    if (s.compiled) r.compile_error = false;
    return r;
}

exec_result_t Engine::settle(const session_ptr &s, const watch_outcome_t &o, bool stored) {
    auto &backend = s->program->backend();
    exec_result_t r;
    switch (o.event) {
        case watch_event_t::_waiting_for_input: {
            if (stored) return waiting(*s);
            session_ptr evicted;
            {
                // published below; the reaper may look at it from then on
                const std::lock_guard lk(s->lock);
                s->touch(clock::now());
                auto [ok, victim] = sessions_.create(s);
                evicted = std::move(victim);
                if (ok) {
                    jl::logger.debug(RUNBOX_FMT("session {} created for pid {}"), s->id,
                                     s->program->process().pid());
                    r = waiting(*s);
                } else {
                    s->program->terminate();
                }
            }
            if (evicted) {
                finish_abandoned(evicted, "[Session evicted: too many interactive sessions]",
                                 error_kind_t::_runtime);
            }
            if (r.session_id) return r;
            r = infrastructure(s->language, "too many interactive sessions are open",
                               s->execution_time_ms);
            break;
        }
        case watch_event_t::_timed_out:
            if (o.in_build) {
                r = failed_result(error_kind_t::_timeout, o.build_log, s->execution_time_ms);
                r.compile_error = true;
                append_line(r.err_data,
                            fmt::format(RUNBOX_FMT("[Compilation timeout after {:g}s]"),
                                        static_cast<double>(o.limit_ms) / 1000));
                break;
            }
            r = terminal(*s, exec_state_t::_failed, _exit_timeout, error_kind_t::_timeout);
            append_line(r.err_data,
                        stored ? fmt::format(RUNBOX_FMT("[Execution timeout: the session exceeded "
                                                        "its {:g}s lifetime]"),
                                             static_cast<double>(conf_.sessions.lifetime_ms) / 1000)
                               : timeout_note(o.limit_ms));
            break;
        case watch_event_t::_exited:
            if (o.in_build) {
                if (auto infra = backend.infrastructure_failure(o.exit_code, o.build_log)) {
                    r = infrastructure(s->language, *infra, s->execution_time_ms);
                } else if (o.exit_code != 0) {
                    r = failed_result(error_kind_t::_compile, o.build_log, s->execution_time_ms);
                    r.exit_code = o.exit_code;
                } else {
                    r = terminal(*s, exec_state_t::_completed, 0, error_kind_t::_none);
                }
                break;
            }
            if (auto infra = backend.infrastructure_failure(o.exit_code, s->err.str())) {
                r = infrastructure(s->language, *infra, s->execution_time_ms);
                break;
            }
            r = o.exit_code == 0
                        ? terminal(*s, exec_state_t::_completed, 0, error_kind_t::_none)
                        : terminal(*s, exec_state_t::_failed, o.exit_code, error_kind_t::_runtime);
            break;
    }

    jl::logger.debug(RUNBOX_FMT("{} {}: {}"), s->id, state_to_str(r.state),
                     error_kind_to_str(r.error_kind));
    if (stored) sessions_.remove(s->id);
    s->program.reset();
    s->workspace.reset();
    record(r, s->project_id, s->language, s->entry);
    return r;
}

exec_result_t Engine::execute_impl(const exec_request_t &req) {
    const auto start = clock::now();
    auto elapsed = [&] { return to_ms(clock::now() - start); };
    reap();

    if (req.files.empty()) return failed_result(error_kind_t::_request, "No files provided");
    if (all_blank(req.files)) return failed_result(error_kind_t::_request, "No code provided");
    std::string why;
    auto lang = resolve_language(req, why);
    if (!lang) return failed_result(error_kind_t::_request, why);
    const auto &lc = conf_.lang(*lang);
    if (lc.backend == backend_kind_t::_browser) {
        return failed_result(error_kind_t::_request,
                             fmt::format(RUNBOX_FMT("{} is configured to run in the browser "
                                                    "sandbox, not on the server"),
                                         display_name(*lang)));
    }

    auto &st = suite(*lang);
    const auto ph = st.detect(req.files, req.entry_file);
    if (!ph.has_phase()) {
        const auto &e = ph.error();
        jl::logger.debug(RUNBOX_FMT("rejected {} request: {}"), language_to_str(*lang), e.message);
        auto r = failed_result(e.kind, e.message, elapsed());
        record(r, req.project_id, *lang, req.entry_file.value_or(""));
        return r;
    }
    const auto &info = ph.info();
    jl::logger.debug(RUNBOX_FMT("{}: {}"), language_to_str(*lang), info.to_str());

    auto &backend = backend_for(*lang);
    auto fail_infra = [&](std::string_view diagnostic) {
        auto r = infrastructure(*lang, diagnostic, elapsed());
        record(r, req.project_id, *lang, info.entry);
        return r;
    };
    if (auto reason = backend.unavailable_reason()) return fail_infra(*reason);

    const AdmissionSlot slot(slots_, conf_.sessions.admission_wait_ms);
    if (!slot) {
        return fail_infra(fmt::format(RUNBOX_FMT("no execution slot became free within {} ms"),
                                      conf_.sessions.admission_wait_ms));
    }

    auto s = std::make_shared<session_t>(new_session_id(), lc.output_limit);
    s->project_id = req.project_id;
    s->language = *lang;
    s->entry = info.entry;
    s->compiled = st.compiled();
    s->start_time = start;
    if (*lang == language_t::_javascript) {
        std::vector<browser_api_t> apis;
        for (const auto &f : req.files) {
            for (const auto &api : find_browser_apis(f.content)) {
                if (std::ranges::none_of(apis, [&](const auto &a) { return a.name == api.name; })) {
                    apis.push_back(api);
                }
            }
        }
        s->failure_note = browser_api_note(apis);
    }

    s->workspace = std::make_unique<Workspace>(conf_.workspace_root);
    if (auto bad = s->workspace->materialize(req.files)) {
        return failed_result(error_kind_t::_request,
                             fmt::format(RUNBOX_FMT("Invalid file path: {}"), *bad));
    }
    const auto base = st.base_launch(*s->workspace);

    BuildPipeline pipeline(backend);
    auto built = st.build(info, req.files, pipeline, base);
    if (!built.success) {
        exec_result_t r;
        if (built.structural_error) {
            r = failed_result(built.structural_error->kind, built.structural_error->message,
                              elapsed());
        } else if (built.infrastructure_error) {
            r = infrastructure(*lang, *built.infrastructure_error, elapsed());
        } else if (built.timed_out) {
            r = failed_result(error_kind_t::_timeout, built.log, elapsed());
            append_line(r.err_data, fmt::format(RUNBOX_FMT("[Compilation timeout after {:g}s]"),
                                                static_cast<double>(built.limit_ms) / 1000));
        } else {
            r = failed_result(error_kind_t::_compile, built.log, elapsed());
            r.exit_code = built.exit_code;
        }
        if (r.error_kind == error_kind_t::_timeout) r.compile_error = true;
        record(r, req.project_id, *lang, info.entry);
        return r;
    }

    auto run = st.prepare_run(info, base, conf_.detection);
    auto launched = backend.launch(run.launch);
    if (!launched.program) return fail_infra(launched.error);
    s->program = std::move(launched.program);
    s->watch = std::move(run.watch);

    Supervisor sup(*s->program, s->out, s->err, s->watch);
    const auto o = sup.watch();
    s->execution_time_ms = elapsed();
    return settle(s, o, false);
}

exec_result_t Engine::resume_impl(std::string_view session_id, std::string_view input) {
    // this session's own outcome is collected below, even if its program ended
    reap(session_id);
    auto s = sessions_.get(session_id);
    if (!s) return failed_result(error_kind_t::_request, "Session not found or expired");
    const std::lock_guard lk(s->lock);
    if (s->closed) return failed_result(error_kind_t::_request, "Session not found or expired");
    const auto now = clock::now();
    s->touch(now);

    auto end_now = [&](exec_result_t r, std::string_view note) {
        append_line(r.err_data, note);
        jl::logger.debug(RUNBOX_FMT("{} {}: {}"), s->id, state_to_str(r.state), note);
        sessions_.remove(s->id);
        s->program.reset();
        s->workspace.reset();
        record(r, s->project_id, s->language, s->entry);
        return r;
    };

    auto &prog = *s->program;
    if (!prog.is_alive()) {
        drain_output(prog, s->out, s->err, _drain_budget_ms);
        const int code = prog.process().shell_status();
        auto r = code == 0 ? terminal(*s, exec_state_t::_completed, 0, error_kind_t::_none)
                           : terminal(*s, exec_state_t::_failed, code, error_kind_t::_runtime);
        return end_now(std::move(r), "[Process already terminated]");
    }

    std::string line(input);
    line += '\n';
    // the transcript reads like a terminal's
    if (looks_like_prompt(s->out.str())) s->out.append(line);
    if (!prog.write_stdin(line, _stdin_write_lim_ms)) {
        prog.terminate();
        drain_output(prog, s->out, s->err, _drain_budget_ms);
        return end_now(terminal(*s, exec_state_t::_failed, _exit_failure, error_kind_t::_runtime),
                       "[Stdin closed]");
    }

    auto wc = s->watch;
    wc.window_ms = conf_.detection.continuation_window_ms;
    wc.build_sentinel.clear();
    if (conf_.sessions.lifetime_ms > 0) {
        wc.time_lim_ms =
                std::max<tm_usage_t>(conf_.sessions.lifetime_ms - to_ms(now - s->start_time), 1);
    }
    Supervisor sup(prog, s->out, s->err, std::move(wc));
    const auto o = sup.watch();
    s->execution_time_ms += o.elapsed_ms;
    return settle(s, o, true);
}

exec_result_t Engine::cancel_impl(std::string_view session_id) {
    auto s = sessions_.get(session_id);
    if (!s) return failed_result(error_kind_t::_request, "Session not found or expired");
    const std::lock_guard lk(s->lock);
    if (s->closed) return failed_result(error_kind_t::_request, "Session not found or expired");
    sessions_.remove(s->id);

    auto &prog = *s->program;
    if (prog.is_alive()) prog.terminate();
    drain_output(prog, s->out, s->err, _drain_budget_ms);
    auto r = terminal(*s, exec_state_t::_failed, prog.process().shell_status(),
                      error_kind_t::_runtime);
    append_line(r.err_data, "[Execution cancelled]");
    jl::logger.debug(RUNBOX_FMT("session {} cancelled"), s->id);
    s->program.reset();
    s->workspace.reset();
    record(r, s->project_id, s->language, s->entry);
    return r;
}

void Engine::finish_abandoned(const session_ptr &s, std::string_view note, error_kind_t kind) {
    const std::lock_guard lk(s->lock);
    if (!s->program) return;
    auto &prog = *s->program;
    exec_result_t r;
    if (prog.is_alive()) {
        prog.terminate();
        drain_output(prog, s->out, s->err, _drain_budget_ms);
        r = terminal(*s, exec_state_t::_failed,
                     kind == error_kind_t::_timeout ? _exit_timeout : prog.process().shell_status(),
                     kind);
        append_line(r.err_data, note);
    } else {
        drain_output(prog, s->out, s->err, _drain_budget_ms);
        const int code = prog.process().shell_status();
        r = code == 0 ? terminal(*s, exec_state_t::_completed, 0, error_kind_t::_none)
                      : terminal(*s, exec_state_t::_failed, code, error_kind_t::_runtime);
    }
    jl::logger.println(RUNBOX_FMT("session {} finished unattended: {}"), s->id,
                       state_to_str(r.state));
    s->program.reset();
    s->workspace.reset();
    record(r, s->project_id, s->language, s->entry);
}

std::size_t Engine::reap(std::string_view keep) {
    auto reaped = sessions_.reap(clock::now(), conf_.sessions.lifetime_ms,
                                 conf_.detection.continuation_window_ms, keep);
    for (const auto &s : reaped) {
        finish_abandoned(s,
                         fmt::format(RUNBOX_FMT("[Session expired after {:g}s]"),
                                     static_cast<double>(conf_.sessions.lifetime_ms) / 1000),
                         error_kind_t::_timeout);
    }
    return reaped.size();
}

void Engine::reaper_loop() {
    std::unique_lock lk(reaper_lock_);
    while (!stopping_) {
        reaper_cv_.wait_for(lk, chrono::milliseconds(conf_.sessions.reaper_interval_ms),
                            [this] { return stopping_; });
        if (stopping_) break;
        lk.unlock();
        try {
            reap();
        } catch (const std::exception &e) {
            jl::logger.warn(RUNBOX_FMT("reaper: {}"), e.what());
        }
        lk.lock();
    }
}

}  // namespace runbox
