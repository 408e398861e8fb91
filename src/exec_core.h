//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "config.h"  // IWYU pragma: export
#include "multiprocess.h"

#ifndef __linux__
#error "only linux is supported"
#endif

namespace runbox {

namespace mpc = multiproc;
namespace fs = std::filesystem;

using tm_usage_t = long;

constexpr tm_usage_t _tm_usage_inf = std::numeric_limits<tm_usage_t>::max();

// Reserved exit codes
constexpr int _exit_timeout = 124;
constexpr int _exit_failure = 1;

enum class language_t : std::int8_t { _python, _javascript, _java, _c };

constexpr language_t _all_languages[] = {language_t::_python, language_t::_javascript,
                                         language_t::_java, language_t::_c};

std::string language_to_str(language_t lang);
// Accepts the canonical names and the aliases py, js and node, case-insensitive.
std::optional<language_t> to_language(std::string_view s);

enum class exec_state_t : std::int8_t {
    _idle,
    _running,
    _waiting_for_input,
    _completed,
    _failed
};

std::string state_to_str(exec_state_t st);

enum class error_kind_t : std::int8_t {
    _none,
    _request,
    _structural,
    _compile,
    _runtime,
    _infrastructure,
    _timeout
};

std::string error_kind_to_str(error_kind_t k);

class RunboxError : public std::exception {
  public:
    explicit RunboxError(const std::string_view what_arg)
            : what_str_(std::string("\033[31m\033[1merror:\033[0m ") + std::string(what_arg)) {}
    const char *what() const noexcept override { return what_str_.c_str(); }

  protected:
    std::string what_str_;
};

class ConfigError : public RunboxError {
  public:
    ConfigError(const std::string_view file, const std::string_view what_arg)
            : RunboxError(std::string("in config ") + std::string(file) + ":\n  " +
                          std::string(what_arg)) {}
};

struct source_file_t {
    std::string path;
    std::string content;
};

struct exec_request_t {
    // Empty means "infer from the file extensions"
    std::string language;
    std::vector<source_file_t> files;
    std::optional<std::string> entry_file;
    std::string project_id;
};

struct exec_result_t {
    exec_state_t state = exec_state_t::_idle;
    std::string out_data, err_data;
    std::optional<int> exit_code;
    tm_usage_t execution_time_ms = 0;
    std::optional<std::string> session_id;
    std::optional<bool> compile_error;
    error_kind_t error_kind = error_kind_t::_none;

    bool is_terminal() const {
        return state == exec_state_t::_completed || state == exec_state_t::_failed;
    }
    // waiting_for_input <=> session id present and no exit code
    bool is_consistent() const;
    std::string to_str() const;
};

exec_result_t failed_result(error_kind_t kind, std::string message, tm_usage_t tm = 0);

// Thresholds of the input-detection heuristic
struct detection_conf_t {
    tm_usage_t idle_threshold_ms = 500;
    tm_usage_t silence_ceiling_ms = 3000;
    tm_usage_t continuation_window_ms = 10000;
    tm_usage_t prompt_grace_ms = 30;
    double busy_cpu_ratio = 0.5;
};

// Bounded accumulator. Once the cap is hit the marker is appended (within the
// cap) and every later chunk is dropped.
class OutputBuffer {
  public:
    explicit OutputBuffer(std::size_t cap) : cap_(cap) {}

    // Returns the number of bytes of `chunk` that were kept
    std::size_t append(std::string_view chunk);
    // Engine notes bypass the cap
    void append_note(std::string_view note);

    const std::string &str() const { return data_; }
    bool truncated() const { return truncated_; }
    bool empty() const { return data_.empty(); }
    std::size_t cap() const { return cap_; }

    static std::string marker(std::size_t cap);

  private:
    std::size_t cap_;
    std::string data_;
    bool truncated_ = false;
};

// Appends `note` on its own line
void append_line(std::string &s, std::string_view note);

inline std::string read_file(const fs::path &src) {
    std::stringstream ss;
    ss << std::ifstream(src).rdbuf();
    return ss.str();
}
// Returns false when the file cannot be written completely
inline bool write_file(const fs::path &dst, const std::string_view s) {
    std::ofstream fout(dst, std::ios::binary);
    fout << s;
    return static_cast<bool>(fout.flush());
}

class MyPipe {
  public:
    MyPipe() {
        if (pipe2(fd_, O_CLOEXEC) == -1) closed_[0] = closed_[1] = true;
    }
    MyPipe(MyPipe &&o) noexcept
            : fd_{std::exchange(o.fd_[0], -1), std::exchange(o.fd_[1], -1)},
              closed_{std::exchange(o.closed_[0], true), std::exchange(o.closed_[1], true)} {}
    MyPipe &operator=(MyPipe &&o) noexcept {
        if (this != &o) {
            close();
            fd_[0] = std::exchange(o.fd_[0], -1);
            fd_[1] = std::exchange(o.fd_[1], -1);
            closed_[0] = std::exchange(o.closed_[0], true);
            closed_[1] = std::exchange(o.closed_[1], true);
        }
        return *this;
    }
    MyPipe(const MyPipe &) = delete;
    MyPipe &operator=(const MyPipe &) = delete;
    ~MyPipe() { close(); }

    void close_read() {
        if (!closed_[0]) ::close(fd_[0]), closed_[0] = true;
    }
    void close_write() {
        if (!closed_[1]) ::close(fd_[1]), closed_[1] = true;
    }
    void close() {
        close_read();
        close_write();
    }

    // Returns false if fcntl fails
    bool set_nonblocking(bool read_end) const;

    int read_fd() const { return fd_[0]; }
    int write_fd() const { return fd_[1]; }

    bool is_read_closed() const { return closed_[0]; }
    bool is_write_closed() const { return closed_[1]; }

    friend MyPipe null_pipe();

  private:
    MyPipe(int read_fd, int write_fd) : fd_{read_fd, write_fd}, closed_{false, false} {}
    int fd_[2]{-1, -1};
    bool closed_[2]{false, false};
};

// A pipe whose ends are /dev/null
MyPipe null_pipe();

constexpr auto _randstr_default_length = 8;

std::string randstr(int len = _randstr_default_length);

// Quotes `s` for a POSIX shell
std::string shell_quote(std::string_view s);
std::string join_command(const std::vector<std::string> &argv);

// Converts `\` to `/` and drops leading "./"
std::string normalize_path(std::string_view p);
// Relative, non-empty and free of ".." components
bool is_safe_relative_path(std::string_view p);

// Runs a helper program to completion, capturing its output. The exit code is
// -1 when the program cannot be started and 124 when it is killed at the limit.
std::tuple<int, std::string, std::string> run_get_output(const std::string &name,
                                                         const std::vector<std::string> &args,
                                                         tm_usage_t time_lim_ms = 10000);

using template_vars_t = std::map<std::string, std::vector<std::string>, std::less<>>;

// A command line with ${name} placeholders. An argument that is exactly a
// placeholder expands to every value of the variable (possibly none); other
// occurrences are replaced by the first value. Unknown placeholders are kept.
class CommandTemplate {
  public:
    std::string program;
    std::vector<std::string> argvec;

    CommandTemplate() = default;
    CommandTemplate(std::string prog, std::vector<std::string> args)
            : program(std::move(prog)), argvec(std::move(args)) {}

    bool empty() const { return program.empty(); }
    std::vector<std::string> expand(const template_vars_t &vars) const;
};

std::string expand_placeholders(std::string_view arg, const template_vars_t &vars);

}  // namespace runbox
