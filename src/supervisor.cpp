//
// Copyright (c) 2024-2025 JLGxy
//

#include "supervisor.h"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "runbox_logs.h"

namespace runbox {

namespace chrono = std::chrono;

std::string wait_reason_to_str(wait_reason_t r) {
    switch (r) {
        case wait_reason_t::_none: return "none";
        case wait_reason_t::_eof_marker: return "eof-marker";
        case wait_reason_t::_prompt: return "prompt";
        case wait_reason_t::_idle: return "idle";
        case wait_reason_t::_silence: return "silence";
        case wait_reason_t::_window: return "window";
    }
    return "unknown";
}

bool looks_like_prompt(std::string_view out) {
    if (out.empty() || out.back() == '\n') return false;
    auto end = out.find_last_not_of(" \t");
    if (end == std::string_view::npos) return false;
    char c = out[end];
    return c == ':' || c == '?' || c == '>';
}

bool has_eof_marker(std::string_view err, const std::vector<std::string> &markers) {
    return std::ranges::any_of(markers, [&](const std::string &m) {
        return !m.empty() && err.find(m) != std::string_view::npos;
    });
}

namespace {

using clock = Supervisor::clock;

constexpr tm_usage_t _probe_throttle_ms = 50;
constexpr tm_usage_t _drain_budget_ms = 300;

tm_usage_t to_ms(clock::duration d) {
    return chrono::duration_cast<chrono::milliseconds>(d).count();
}

enum class read_status_t : std::int8_t { _data, _again, _closed };

read_status_t read_chunk(int fd, std::string &chunk) {
    char buf[1 << 16];
    ::ssize_t n;
    do {
        n = ::read(fd, buf, sizeof(buf));
    } while (n == -1 && errno == EINTR);
    if (n > 0) {
        chunk.assign(buf, static_cast<std::size_t>(n));
        return read_status_t::_data;
    }
    if (n == -1 && errno == EAGAIN) return read_status_t::_again;
    return read_status_t::_closed;
}

}  // namespace

Supervisor::Supervisor(RunningProgram &prog, OutputBuffer &out, OutputBuffer &err,
                       watch_conf_t conf)
        : prog_(prog), out_(out), err_(err), conf_(std::move(conf)), build_log_(err.cap()) {}

void Supervisor::settle(watch_outcome_t o) {
    if (outcome_) return;
    outcome_ = std::move(o);
}

void Supervisor::settle_exit() {
    drain(_drain_budget_ms);
    if (in_build_) {
        build_log_.append(pending_build_);
        pending_build_.clear();
    }
    watch_outcome_t o;
    o.event = watch_event_t::_exited;
    o.exit_code = prog_.process().shell_status();
    o.in_build = in_build_;
    o.build_log = build_log_.str();
    settle(std::move(o));
}

void Supervisor::settle_timeout(tm_usage_t limit) {
    jl::logger.println(RUNBOX_FMT("pid {} exceeded {} ms{}, killing"), prog_.process().pid(), limit,
                       in_build_ ? " while building" : "");
    prog_.terminate();
    drain(_drain_budget_ms);
    if (in_build_) {
        build_log_.append(pending_build_);
        pending_build_.clear();
    }
    watch_outcome_t o;
    o.event = watch_event_t::_timed_out;
    o.exit_code = _exit_timeout;
    o.in_build = in_build_;
    o.build_log = build_log_.str();
    o.limit_ms = limit;
    settle(std::move(o));
}

void Supervisor::settle_waiting(wait_reason_t reason) {
    jl::logger.debug(RUNBOX_FMT("pid {} waiting for input ({})"), prog_.process().pid(),
                     wait_reason_to_str(reason));
    watch_outcome_t o;
    o.event = watch_event_t::_waiting_for_input;
    o.reason = reason;
    settle(std::move(o));
}

void Supervisor::mark_probe(clock::time_point now) {
    probe_mark_ = now;
    probe_cpu_ = prog_.backend().cpu_time_ms(prog_);
}

void Supervisor::request_wait(wait_reason_t reason) {
    if (pending_wait_ && reason != wait_reason_t::_eof_marker) return;
    pending_wait_ = reason;
    pending_since_ = clock::now();
}

void Supervisor::on_stdout(std::string_view chunk) {
    const auto now = clock::now();
    out_.append(chunk);
    last_output_ = now;
    next_probe_ = now;
    if (to_ms(now - probe_mark_) >= _probe_throttle_ms) mark_probe(now);
    if (!conf_.detect_input || in_build_) return;
    if (looks_like_prompt(out_.str())) {
        request_wait(wait_reason_t::_prompt);
    } else if (pending_wait_ == wait_reason_t::_prompt) {
        pending_wait_.reset();
    }
}

void Supervisor::on_stderr(std::string_view chunk) {
    if (in_build_) {
        feed_build(chunk);
        return;
    }
    const auto now = clock::now();
    err_.append(chunk);
    last_output_ = now;
    next_probe_ = now;
    if (to_ms(now - probe_mark_) >= _probe_throttle_ms) mark_probe(now);
    if (!conf_.detect_input) return;
    const std::string_view fresh = std::string_view(err_.str()).substr(
            std::min(err_scan_from_, err_.str().size()));
    if (has_eof_marker(fresh, conf_.eof_markers)) request_wait(wait_reason_t::_eof_marker);
}

void Supervisor::feed_build(std::string_view chunk) {
    const auto &sentinel = conf_.build_sentinel;
    pending_build_.append(chunk);
    auto pos = pending_build_.find(sentinel);
    if (pos == std::string::npos) {
        // keep a tail that may hold the start of the sentinel
        if (pending_build_.size() > sentinel.size()) {
            auto cut = pending_build_.size() - sentinel.size();
            build_log_.append(std::string_view(pending_build_).substr(0, cut));
            pending_build_.erase(0, cut);
        }
        return;
    }
    build_log_.append(std::string_view(pending_build_).substr(0, pos));
    std::string rest = pending_build_.substr(pos + sentinel.size());
    if (rest.starts_with('\n')) rest.erase(0, 1);
    pending_build_.clear();

    const auto now = clock::now();
    jl::logger.debug(RUNBOX_FMT("pid {} build finished after {} ms"), prog_.process().pid(),
                     to_ms(now - phase_start_));
    in_build_ = false;
    phase_start_ = now;
    last_output_ = now;
    next_probe_ = now;
    mark_probe(now);
    err_scan_from_ = err_.str().size();
    if (!rest.empty()) on_stderr(rest);
}

void Supervisor::read_stream(bool is_stdout) {
    const int fd = is_stdout ? prog_.stdout_fd() : prog_.stderr_fd();
    if (fd == -1) return;
    std::string chunk;
    switch (read_chunk(fd, chunk)) {
        case read_status_t::_data:
            if (is_stdout)
                on_stdout(chunk);
            else
                on_stderr(chunk);
            break;
        case read_status_t::_again: break;
        case read_status_t::_closed:
            if (is_stdout)
                prog_.close_stdout();
            else
                prog_.close_stderr();
            break;
    }
}

void Supervisor::drain(tm_usage_t budget_ms) {
    const auto deadline = clock::now() + chrono::milliseconds(budget_ms);
    while (prog_.stdout_fd() != -1 || prog_.stderr_fd() != -1) {
        auto left = to_ms(deadline - clock::now());
        if (left <= 0) break;
        pollfd fds[2];
        nfds_t n = 0;
        if (prog_.stdout_fd() != -1) fds[n++] = {prog_.stdout_fd(), POLLIN, 0};
        if (prog_.stderr_fd() != -1) fds[n++] = {prog_.stderr_fd(), POLLIN, 0};
        int r = poll(fds, n, static_cast<int>(left));
        if (r == -1 && errno == EINTR) continue;
        if (r <= 0) break;
        for (nfds_t i = 0; i < n; i++) {
            if (fds[i].revents == 0) continue;
            read_stream(fds[i].fd == prog_.stdout_fd());
        }
    }
}

void Supervisor::check_deadlines(clock::time_point now) {
    const auto since_phase = to_ms(now - phase_start_);
    if (in_build_) {
        if (conf_.build_time_lim_ms > 0 && since_phase >= conf_.build_time_lim_ms) {
            settle_timeout(conf_.build_time_lim_ms);
        }
        return;
    }
    if (conf_.time_lim_ms > 0 && since_phase >= conf_.time_lim_ms) {
        settle_timeout(conf_.time_lim_ms);
        return;
    }
    if (!conf_.detect_input) return;

    auto wait_or_exit = [&](wait_reason_t reason) {
        // an exit that raced the signal wins
        if (prog_.process().try_wait())
            settle_exit();
        else
            settle_waiting(reason);
    };
    if (pending_wait_ && to_ms(now - pending_since_) >= conf_.detection.prompt_grace_ms) {
        wait_or_exit(*pending_wait_);
        return;
    }
    if (conf_.window_ms > 0 && to_ms(now - start_) >= conf_.window_ms) {
        wait_or_exit(wait_reason_t::_window);
        return;
    }
    check_idle(now);
}

void Supervisor::check_idle(clock::time_point now) {
    const auto &det = conf_.detection;
    const auto silent = to_ms(now - last_output_);
    if (silent < det.idle_threshold_ms || now < next_probe_) return;

    auto cpu = prog_.backend().cpu_time_ms(prog_);
    if (cpu && probe_cpu_) {
        const auto wall = to_ms(now - probe_mark_);
        const auto used = *cpu - *probe_cpu_;
        if (wall > 0 &&
            static_cast<double>(used) >= det.busy_cpu_ratio * static_cast<double>(wall)) {
            // still computing
            probe_mark_ = now;
            probe_cpu_ = cpu;
            next_probe_ = now + chrono::milliseconds(det.idle_threshold_ms);
            return;
        }
        if (prog_.process().try_wait())
            settle_exit();
        else
            settle_waiting(wait_reason_t::_idle);
        return;
    }
    if (cpu) {
        probe_mark_ = now;
        probe_cpu_ = cpu;
        next_probe_ = now + chrono::milliseconds(det.idle_threshold_ms);
        return;
    }
    // the probe can't answer, only total silence counts
    if (silent >= det.silence_ceiling_ms) {
        if (prog_.process().try_wait())
            settle_exit();
        else
            settle_waiting(wait_reason_t::_silence);
        return;
    }
    next_probe_ = last_output_ + chrono::milliseconds(det.silence_ceiling_ms);
}

int Supervisor::next_wake_ms(clock::time_point now) const {
    tm_usage_t wake = prog_.process().pidfd() == -1 ? 20 : 1000;
    auto consider = [&](clock::time_point t) { wake = std::min(wake, to_ms(t - now)); };
    if (in_build_) {
        if (conf_.build_time_lim_ms > 0) {
            consider(phase_start_ + chrono::milliseconds(conf_.build_time_lim_ms));
        }
    } else {
        if (conf_.time_lim_ms > 0) consider(phase_start_ + chrono::milliseconds(conf_.time_lim_ms));
        if (conf_.detect_input) {
            const auto &det = conf_.detection;
            if (pending_wait_) consider(pending_since_ + chrono::milliseconds(det.prompt_grace_ms));
            if (conf_.window_ms > 0) consider(start_ + chrono::milliseconds(conf_.window_ms));
            consider(std::max(last_output_ + chrono::milliseconds(det.idle_threshold_ms),
                              next_probe_));
        }
    }
    return static_cast<int>(std::max<tm_usage_t>(wake, 0));
}

watch_outcome_t Supervisor::watch() {
    start_ = phase_start_ = last_output_ = next_probe_ = clock::now();
    in_build_ = !conf_.build_sentinel.empty();
    // markers left over from an earlier attempt don't count
    err_scan_from_ = err_.str().size();
    mark_probe(start_);
    const int pidfd = prog_.process().pidfd();

    while (!outcome_) {
        check_deadlines(clock::now());
        if (outcome_) break;

        pollfd fds[3];
        nfds_t n = 0;
        int idx_out = -1, idx_err = -1, idx_pid = -1;
        if (prog_.stdout_fd() != -1) {
            idx_out = static_cast<int>(n);
            fds[n++] = {prog_.stdout_fd(), POLLIN, 0};
        }
        if (prog_.stderr_fd() != -1) {
            idx_err = static_cast<int>(n);
            fds[n++] = {prog_.stderr_fd(), POLLIN, 0};
        }
        if (pidfd != -1) {
            idx_pid = static_cast<int>(n);
            fds[n++] = {pidfd, POLLIN, 0};
        }
        int r = poll(fds, n, next_wake_ms(clock::now()));
        if (r == -1) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (idx_out != -1 && fds[idx_out].revents != 0) read_stream(true);
        if (idx_err != -1 && fds[idx_err].revents != 0) read_stream(false);

        const bool maybe_exited = pidfd == -1 || (idx_pid != -1 && fds[idx_pid].revents != 0);
        if (maybe_exited && prog_.process().try_wait()) settle_exit();
    }
    auto o = std::move(*outcome_);
    o.elapsed_ms = to_ms(clock::now() - start_);
    return o;
}

void drain_output(RunningProgram &prog, OutputBuffer &out, OutputBuffer &err,
                  tm_usage_t budget_ms) {
    const auto deadline = clock::now() + chrono::milliseconds(budget_ms);
    while (prog.stdout_fd() != -1 || prog.stderr_fd() != -1) {
        auto left = to_ms(deadline - clock::now());
        if (left <= 0) break;
        pollfd fds[2];
        nfds_t n = 0;
        if (prog.stdout_fd() != -1) fds[n++] = {prog.stdout_fd(), POLLIN, 0};
        if (prog.stderr_fd() != -1) fds[n++] = {prog.stderr_fd(), POLLIN, 0};
        int r = poll(fds, n, static_cast<int>(left));
        if (r == -1 && errno == EINTR) continue;
        if (r <= 0) break;
        for (nfds_t i = 0; i < n; i++) {
            if (fds[i].revents == 0) continue;
            const bool is_stdout = fds[i].fd == prog.stdout_fd();
            std::string chunk;
            switch (read_chunk(fds[i].fd, chunk)) {
                case read_status_t::_data: (is_stdout ? out : err).append(chunk); break;
                case read_status_t::_again: break;
                case read_status_t::_closed:
                    if (is_stdout)
                        prog.close_stdout();
                    else
                        prog.close_stderr();
                    break;
            }
        }
    }
}

}  // namespace runbox
