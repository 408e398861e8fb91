//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"
#include "sandbox.h"

namespace runbox {

enum class watch_event_t : std::int8_t { _exited, _timed_out, _waiting_for_input };

// Which signal put the program into waiting_for_input
enum class wait_reason_t : std::int8_t { _none, _eof_marker, _prompt, _idle, _silence, _window };

std::string wait_reason_to_str(wait_reason_t r);

struct watch_conf_t {
    // Hard ceiling of the run, 0 for none
    tm_usage_t time_lim_ms = 0;
    // Settle as waiting once this elapses, 0 for none
    tm_usage_t window_ms = 0;
    bool detect_input = true;
    detection_conf_t detection;
    std::vector<std::string> eof_markers;
    // When set, stderr carries a build log up to this line
    std::string build_sentinel;
    tm_usage_t build_time_lim_ms = 0;
};

struct watch_outcome_t {
    watch_event_t event = watch_event_t::_exited;
    wait_reason_t reason = wait_reason_t::_none;
    int exit_code = 0;
    // The program ended before the build sentinel was seen
    bool in_build = false;
    std::string build_log;
    // The limit that fired
    tm_usage_t limit_ms = 0;
    tm_usage_t elapsed_ms = 0;
};

// stdout ends with `:`, `?` or `>` plus optional blanks, and no newline
bool looks_like_prompt(std::string_view out);
bool has_eof_marker(std::string_view err, const std::vector<std::string> &markers);

// Watches one attempt of a running program and settles on the first of:
// exit, hard timeout, or a waiting-for-input signal. Output is appended to
// the buffers in delivery order.
class Supervisor {
  public:
    using clock = std::chrono::steady_clock;

    Supervisor(RunningProgram &prog, OutputBuffer &out, OutputBuffer &err, watch_conf_t conf);
    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    watch_outcome_t watch();

  private:
    RunningProgram &prog_;
    OutputBuffer &out_, &err_;
    watch_conf_t conf_;

    // single assignment: the first event wins
    std::optional<watch_outcome_t> outcome_;

    clock::time_point start_, phase_start_, last_output_;
    bool in_build_ = false;
    std::string pending_build_;
    OutputBuffer build_log_;
    std::size_t err_scan_from_ = 0;

    std::optional<wait_reason_t> pending_wait_;
    clock::time_point pending_since_;

    clock::time_point probe_mark_, next_probe_;
    std::optional<tm_usage_t> probe_cpu_;

    void settle(watch_outcome_t o);
    void settle_exit();
    void settle_timeout(tm_usage_t limit);
    void settle_waiting(wait_reason_t reason);

    void check_deadlines(clock::time_point now);
    void check_idle(clock::time_point now);
    int next_wake_ms(clock::time_point now) const;

    void read_stream(bool is_stdout);
    void drain(tm_usage_t budget_ms);
    void on_stdout(std::string_view chunk);
    void on_stderr(std::string_view chunk);
    void feed_build(std::string_view chunk);
    void request_wait(wait_reason_t reason);
    void mark_probe(clock::time_point now);
};

// Reads whatever is still buffered in the program's pipes, waiting at most
// `budget_ms` for them to close.
void drain_output(RunningProgram &prog, OutputBuffer &out, OutputBuffer &err, tm_usage_t budget_ms);

}  // namespace runbox
