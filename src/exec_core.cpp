//
// Copyright (c) 2024-2025 JLGxy
//

#include "exec_core.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "runbox_logs.h"

namespace runbox {

namespace chrono = std::chrono;

std::string language_to_str(language_t lang) {
    switch (lang) {
        case language_t::_python: return "python";
        case language_t::_javascript: return "javascript";
        case language_t::_java: return "java";
        case language_t::_c: return "c";
    }
    return "unknown";
}

std::optional<language_t> to_language(std::string_view s) {
    std::string t(s);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "python" || t == "py") return language_t::_python;
    if (t == "javascript" || t == "js" || t == "node") return language_t::_javascript;
    if (t == "java") return language_t::_java;
    if (t == "c") return language_t::_c;
    return std::nullopt;
}

std::string state_to_str(exec_state_t st) {
    switch (st) {
        case exec_state_t::_idle: return "idle";
        case exec_state_t::_running: return "running";
        case exec_state_t::_waiting_for_input: return "waiting_for_input";
        case exec_state_t::_completed: return "completed";
        case exec_state_t::_failed: return "failed";
    }
    return "unknown";
}

std::string error_kind_to_str(error_kind_t k) {
    switch (k) {
        case error_kind_t::_none: return "none";
        case error_kind_t::_request: return "request";
        case error_kind_t::_structural: return "structural";
        case error_kind_t::_compile: return "compile";
        case error_kind_t::_runtime: return "runtime";
        case error_kind_t::_infrastructure: return "infrastructure";
        case error_kind_t::_timeout: return "timeout";
    }
    return "unknown";
}

bool exec_result_t::is_consistent() const {
    if (state == exec_state_t::_waiting_for_input) {
        return session_id.has_value() && !exit_code.has_value();
    }
    if (is_terminal()) return !session_id.has_value() && exit_code.has_value();
    return true;
}

std::string exec_result_t::to_str() const {
    return fmt::format(RUNBOX_FMT("{{state: {}, exit: {}, time: {}ms, session: {}, compile_error: "
                                  "{}, kind: {}}}"),
                       state_to_str(state), exit_code ? std::to_string(*exit_code) : "null",
                       execution_time_ms, session_id.value_or("null"),
                       compile_error ? (*compile_error ? "true" : "false") : "null",
                       error_kind_to_str(error_kind));
}

exec_result_t failed_result(error_kind_t kind, std::string message, tm_usage_t tm) {
    exec_result_t r;
    r.state = exec_state_t::_failed;
    r.err_data = std::move(message);
    r.exit_code = kind == error_kind_t::_timeout ? _exit_timeout : _exit_failure;
    r.execution_time_ms = tm;
    r.error_kind = kind;
    if (kind == error_kind_t::_structural || kind == error_kind_t::_compile) {
        r.compile_error = true;
    }
    return r;
}

std::string OutputBuffer::marker(std::size_t cap) {
    return fmt::format(RUNBOX_FMT("\n[Output truncated: exceeded {} characters]"), cap);
}

std::size_t OutputBuffer::append(std::string_view chunk) {
    if (truncated_) return 0;
    if (data_.size() + chunk.size() <= cap_) {
        data_.append(chunk);
        return chunk.size();
    }
    const auto mk = marker(cap_);
    const std::size_t room = cap_ > mk.size() ? cap_ - mk.size() : 0;
    std::size_t kept = 0;
    if (data_.size() < room) {
        kept = std::min(chunk.size(), room - data_.size());
        data_.append(chunk.substr(0, kept));
    } else {
        data_.resize(room);
    }
    data_.append(mk.substr(0, cap_ - data_.size()));
    truncated_ = true;
    return kept;
}

void OutputBuffer::append_note(std::string_view note) { append_line(data_, note); }

void append_line(std::string &s, std::string_view note) {
    if (!s.empty() && s.back() != '\n') s += '\n';
    s.append(note);
}

bool MyPipe::set_nonblocking(bool read_end) const {
    int fd = read_end ? read_fd() : write_fd();
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

MyPipe null_pipe() {
    int read_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    int write_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (read_fd == -1 || write_fd == -1) {
        if (read_fd != -1) close(read_fd);
        if (write_fd != -1) close(write_fd);
        MyPipe p(-1, -1);
        p.closed_[0] = p.closed_[1] = true;
        return p;
    }
    return MyPipe(read_fd, write_fd);
}

std::string randstr(int len) {
    static const std::string set =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    static std::mutex rng_lock;
    static std::mt19937_64 rng(std::random_device{}());
    const std::lock_guard guard(rng_lock);
    std::string ret;
    for (int i = 0; i < len; i++) {
        ret += set[rng() % set.length()];
    }
    return ret;
}

std::string shell_quote(std::string_view s) {
    if (!s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) ||
                   (c != '\0' && std::strchr("_-./=:,+@%", c) != nullptr);
        })) {
        return std::string(s);
    }
    std::string ret = "'";
    for (auto c : s) {
        if (c == '\'')
            ret += "'\\''";
        else
            ret += c;
    }
    ret += '\'';
    return ret;
}

std::string join_command(const std::vector<std::string> &argv) {
    std::string ret;
    for (const auto &a : argv) {
        if (!ret.empty()) ret += ' ';
        ret += shell_quote(a);
    }
    return ret;
}

std::string normalize_path(std::string_view p) {
    std::string ret(p);
    std::replace(ret.begin(), ret.end(), '\\', '/');
    while (ret.starts_with("./")) ret.erase(0, 2);
    return ret;
}

bool is_safe_relative_path(std::string_view p) {
    const auto n = normalize_path(p);
    if (n.empty() || n.front() == '/' || n.back() == '/') return false;
    std::size_t lst = 0;
    for (std::size_t i = 0; i <= n.size(); i++) {
        if (i == n.size() || n[i] == '/') {
            auto part = std::string_view(n).substr(lst, i - lst);
            if (part.empty() || part == "." || part == "..") return false;
            lst = i + 1;
        }
    }
    return n.find('\0') == std::string::npos;
}

namespace {

void read_available(int fd, std::string &s, bool &open) {
    char buf[1 << 14];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            s.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && errno == EAGAIN) return;
        open = false;
        return;
    }
}

}  // namespace

std::tuple<int, std::string, std::string> run_get_output(const std::string &name,
                                                         const std::vector<std::string> &args,
                                                         tm_usage_t time_lim_ms) {
    MyPipe out, err, in = null_pipe();
    if (out.is_read_closed() || err.is_read_closed() || in.is_read_closed()) {
        return {-1, "", fmt::format(RUNBOX_FMT("failed to create pipes: {}"), strerror(errno))};
    }
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.emplace_back(const_cast<char *>(name.c_str()));
    for (const auto &arg : args) argv.emplace_back(const_cast<char *>(arg.c_str()));
    argv.emplace_back(nullptr);

    mpc::Process proc([&] {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        if (dup2(in.read_fd(), STDIN_FILENO) == -1 || dup2(out.write_fd(), STDOUT_FILENO) == -1 ||
            dup2(err.write_fd(), STDERR_FILENO) == -1) {
            _exit(127);
        }
        execvp(name.c_str(), argv.data());
        _exit(127);
    });
    if (proc.failed()) {
        return {-1, "", fmt::format(RUNBOX_FMT("fork failed: {}"), strerror(errno))};
    }
    setpgid(proc.pid(), proc.pid());
    out.close_write();
    err.close_write();
    in.close();
    if (!out.set_nonblocking(true) || !err.set_nonblocking(true)) {
        return {-1, "", "failed to configure pipes"};
    }

    std::string out_data, err_data;
    bool out_open = true, err_open = true;
    const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(time_lim_ms);
    bool timed_out = false;
    while (out_open || err_open) {
        auto left = chrono::duration_cast<chrono::milliseconds>(deadline -
                                                                chrono::steady_clock::now());
        if (left.count() <= 0) {
            timed_out = true;
            break;
        }
        pollfd fds[2];
        nfds_t n = 0;
        if (out_open) fds[n++] = {out.read_fd(), POLLIN, 0};
        if (err_open) fds[n++] = {err.read_fd(), POLLIN, 0};
        int r = poll(fds, n, static_cast<int>(left.count()));
        if (r == -1 && errno == EINTR) continue;
        if (r == -1) break;
        if (out_open) read_available(out.read_fd(), out_data, out_open);
        if (err_open) read_available(err.read_fd(), err_data, err_open);
    }
    if (timed_out) {
        proc.kill_group(SIGKILL);
        proc.join();
        return {_exit_timeout, out_data, err_data};
    }
    proc.join();
    int code = proc.shell_status();
    // exec failure inside the child
    if (code == 127 && out_data.empty() && err_data.empty()) code = -1;
    return {code, out_data, err_data};
}

std::string expand_placeholders(std::string_view arg, const template_vars_t &vars) {
    std::string ret;
    std::size_t pos = 0;
    while (pos < arg.size()) {
        auto st = arg.find("${", pos);
        if (st == std::string_view::npos) break;
        auto ed = arg.find('}', st);
        if (ed == std::string_view::npos) break;
        ret.append(arg.substr(pos, st - pos));
        auto key = arg.substr(st + 2, ed - st - 2);
        auto it = vars.find(key);
        if (it != vars.end() && !it->second.empty()) {
            ret.append(it->second.front());
        } else {
            ret.append(arg.substr(st, ed - st + 1));
        }
        pos = ed + 1;
    }
    ret.append(arg.substr(pos));
    return ret;
}

std::vector<std::string> CommandTemplate::expand(const template_vars_t &vars) const {
    std::vector<std::string> ret;
    ret.emplace_back(expand_placeholders(program, vars));
    for (const auto &arg : argvec) {
        if (arg.size() > 3 && arg.starts_with("${") && arg.ends_with('}') &&
            arg.find("${", 2) == std::string::npos) {
            auto it = vars.find(std::string_view(arg).substr(2, arg.size() - 3));
            if (it != vars.end()) {
                for (const auto &v : it->second) ret.emplace_back(v);
                continue;
            }
        }
        ret.emplace_back(expand_placeholders(arg, vars));
    }
    return ret;
}

}  // namespace runbox
