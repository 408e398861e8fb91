//
// Copyright (c) 2024-2025 JLGxy
//

#include "build_pipeline.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "runbox_logs.h"
#include "supervisor.h"

namespace runbox {

namespace chrono = std::chrono;

std::string build_script(const std::vector<std::vector<std::string>> &steps,
                         std::string_view marker_prefix) {
    std::string s;
    for (std::size_t i = 0; i < steps.size(); i++) {
        s += fmt::format(RUNBOX_FMT("printf '%s\\n' {} >&2\n"),
                         shell_quote(fmt::format(RUNBOX_FMT("{}{}@@"), marker_prefix, i)));
        s += join_command(steps[i]) + " || exit $?\n";
    }
    return s;
}

std::size_t strip_step_markers(std::string &log, std::string_view marker_prefix) {
    std::string kept;
    std::size_t started = 0;
    std::size_t lst = 0;
    while (lst < log.size()) {
        auto ed = log.find('\n', lst);
        const bool has_nl = ed != std::string::npos;
        if (!has_nl) ed = log.size();
        std::string_view line(log.data() + lst, ed - lst);
        if (line.starts_with(marker_prefix)) {
            auto num = line.substr(marker_prefix.size());
            std::size_t idx = 0;
            if (std::from_chars(num.data(), num.data() + num.size(), idx).ec == std::errc{}) {
                started = std::max(started, idx + 1);
            }
        } else {
            kept.append(line);
            if (has_nl) kept += '\n';
        }
        lst = ed + 1;
    }
    log = std::move(kept);
    return started;
}

build_outcome_t BuildPipeline::run(const std::vector<build_step_t> &steps,
                                   const launch_conf_t &base, tm_usage_t time_lim_ms,
                                   std::size_t log_cap, bool list_commands) {
    if (steps.empty()) return build_outcome_t::nothing_to_do();
    auto o = backend_.batches_build_steps() ? run_batched(steps, base, time_lim_ms, log_cap)
                                            : run_each(steps, base, time_lim_ms, log_cap);
    o.limit_ms = time_lim_ms;
    if (o.success) {
        jl::logger.debug(RUNBOX_FMT("build finished in {} ms"), o.elapsed_ms);
        return o;
    }
    if (list_commands && !o.attempted.empty()) {
        std::string head = "Build commands:\n";
        for (const auto &cmd : o.attempted) head += "  $ " + cmd + "\n";
        o.log = head + o.log;
    }
    jl::logger.debug(RUNBOX_FMT("build failed after {} of {} steps (exit {}{})"),
                     o.attempted.size(), steps.size(), o.exit_code,
                     o.timed_out ? ", timed out" : "");
    return o;
}

build_outcome_t BuildPipeline::run_each(const std::vector<build_step_t> &steps,
                                        const launch_conf_t &base, tm_usage_t time_lim_ms,
                                        std::size_t log_cap) {
    const auto start = chrono::steady_clock::now();
    auto elapsed = [&] {
        return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start)
                .count();
    };
    build_outcome_t o;
    OutputBuffer log(log_cap);
    bool failed = false;
    for (const auto &step : steps) {
        const tm_usage_t left = time_lim_ms - elapsed();
        if (left <= 0) {
            o.timed_out = true;
            failed = true;
            break;
        }
        launch_conf_t conf = base;
        conf.argv = step.argv;
        conf.interactive = false;
        o.attempted.push_back(join_command(backend_.resolve_all(step.argv, conf)));
        jl::logger.debug(RUNBOX_FMT("build step: {}"), o.attempted.back());

        auto launched = backend_.launch(conf);
        if (!launched.program) {
            o.infrastructure_error = launched.error;
            failed = true;
            break;
        }
        OutputBuffer out(log_cap), err(log_cap);
        watch_conf_t wc;
        wc.time_lim_ms = left;
        wc.detect_input = false;
        Supervisor sup(*launched.program, out, err, std::move(wc));
        auto res = sup.watch();
        log.append(out.str());
        log.append(err.str());
        if (res.event == watch_event_t::_timed_out) {
            o.timed_out = true;
            o.exit_code = _exit_timeout;
            failed = true;
            break;
        }
        o.exit_code = res.exit_code;
        if (res.exit_code != 0) {
            o.infrastructure_error = backend_.infrastructure_failure(res.exit_code, err.str());
            failed = true;
            break;
        }
    }
    o.log = log.str();
    o.success = !failed;
    o.elapsed_ms = elapsed();
    return o;
}

build_outcome_t BuildPipeline::run_batched(const std::vector<build_step_t> &steps,
                                           const launch_conf_t &base, tm_usage_t time_lim_ms,
                                           std::size_t log_cap) {
    const std::string marker = "@@runbox-step-" + randstr(10) + ":";
    std::vector<std::vector<std::string>> resolved;
    std::vector<std::string> display;
    for (const auto &step : steps) {
        resolved.push_back(backend_.resolve_all(step.argv, base));
        display.push_back(join_command(resolved.back()));
    }
    launch_conf_t conf = base;
    conf.argv = {"sh", "-c", build_script(resolved, marker)};
    conf.interactive = false;

    build_outcome_t o;
    auto launched = backend_.launch(conf);
    if (!launched.program) {
        o.infrastructure_error = launched.error;
        o.attempted = display;
        return o;
    }
    OutputBuffer out(log_cap), err(log_cap);
    watch_conf_t wc;
    wc.time_lim_ms = time_lim_ms;
    wc.detect_input = false;
    Supervisor sup(*launched.program, out, err, std::move(wc));
    auto res = sup.watch();

    std::string err_log = err.str();
    auto started = std::min(strip_step_markers(err_log, marker), display.size());
    o.attempted.assign(display.begin(), display.begin() + static_cast<std::ptrdiff_t>(started));
    o.log = out.str() + err_log;
    o.elapsed_ms = res.elapsed_ms;
    if (res.event == watch_event_t::_timed_out) {
        o.timed_out = true;
        o.exit_code = _exit_timeout;
        return o;
    }
    o.exit_code = res.exit_code;
    if (res.exit_code != 0) {
        o.infrastructure_error = backend_.infrastructure_failure(res.exit_code, err_log);
        return o;
    }
    o.success = true;
    return o;
}

}  // namespace runbox
