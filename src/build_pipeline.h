//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"
#include "phase.h"
#include "sandbox.h"

namespace runbox {

struct build_step_t {
    // May hold ${workspace} and ${scratch}
    std::vector<std::string> argv;
};

struct build_outcome_t {
    bool success = false;
    bool timed_out = false;
    int exit_code = 0;
    // Diagnostics, prefixed with the attempted commands when requested
    std::string log;
    std::vector<std::string> attempted;
    std::optional<std::string> infrastructure_error;
    // Layout problems found before any compiler ran
    std::optional<phase_error_t> structural_error;
    tm_usage_t elapsed_ms = 0;
    tm_usage_t limit_ms = 0;

    static build_outcome_t nothing_to_do() {
        build_outcome_t o;
        o.success = true;
        return o;
    }
};

// Runs the compile and link steps of one request, in order, stopping at the
// first failure. Backends that batch build steps get a single shell script
// whose steps announce themselves on stderr.
class BuildPipeline {
  public:
    explicit BuildPipeline(SandboxBackend &backend) : backend_(backend) {}

    build_outcome_t run(const std::vector<build_step_t> &steps, const launch_conf_t &base,
                        tm_usage_t time_lim_ms, std::size_t log_cap, bool list_commands);

  private:
    SandboxBackend &backend_;

    build_outcome_t run_each(const std::vector<build_step_t> &steps, const launch_conf_t &base,
                             tm_usage_t time_lim_ms, std::size_t log_cap);
    build_outcome_t run_batched(const std::vector<build_step_t> &steps, const launch_conf_t &base,
                                tm_usage_t time_lim_ms, std::size_t log_cap);
};

// A POSIX shell script running `steps` in order; step i first prints
// "<marker_prefix><i>@@" on stderr.
std::string build_script(const std::vector<std::vector<std::string>> &steps,
                         std::string_view marker_prefix);
// Removes marker lines from `log`; returns how many steps started.
std::size_t strip_step_markers(std::string &log, std::string_view marker_prefix);

}  // namespace runbox
