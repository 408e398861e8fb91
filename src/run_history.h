//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"
#include "settings.h"

namespace runbox {

enum class run_status_t : std::int8_t { _success, _failed };

std::string run_status_to_str(run_status_t s);
std::optional<run_status_t> to_run_status(std::string_view s);

struct run_entry_t {
    std::string id;
    std::string project_id;
    language_t language = language_t::_python;
    std::string entry_file;
    run_status_t status = run_status_t::_success;
    tm_usage_t execution_time_ms = 0;
    std::string out_data;
    // absent when the run wrote nothing to stderr
    std::optional<std::string> err_data;
    // unix milliseconds
    std::int64_t executed_at = 0;
};

// Builds the history record of a terminal result
run_entry_t make_run_entry(const exec_result_t &res, std::string project_id, language_t lang,
                           std::string entry_file);

// Per-project ring of the most recent runs, optionally mirrored to a YAML file
class RunHistory {
  public:
    explicit RunHistory(history_conf_t conf);
    RunHistory(const RunHistory &) = delete;
    RunHistory &operator=(const RunHistory &) = delete;

    // Stores `entry` with a fresh id and timestamp and returns the stored copy
    run_entry_t append(run_entry_t entry);
    // Newest first
    std::vector<run_entry_t> list(std::string_view project_id) const;
    std::optional<run_entry_t> find(std::string_view project_id, std::string_view run_id) const;
    void clear(std::string_view project_id);

    std::size_t capacity() const { return conf_.capacity; }

    std::string to_yaml() const;

  private:
    using ring_t = boost::circular_buffer<run_entry_t>;

    history_conf_t conf_;
    mutable std::mutex lock_;
    std::map<std::string, ring_t, std::less<>> rings_;

    ring_t &ring_of(std::string_view project_id);
    std::string to_yaml_locked() const;
    void load();
    void save() const;
};

}  // namespace runbox
