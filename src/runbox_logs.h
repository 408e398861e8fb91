#pragma once

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#define RUNBOX_FMT FMT_STRING

namespace runbox::jl {

class FileLock {
  public:
    explicit FileLock(int fd) : fd_(fd) {
        if (flock(fd_, LOCK_EX) == -1) {
            throw std::runtime_error(std::string{"failed to get lock "} + strerror(errno));
        }
    }
    ~FileLock() { flock(fd_, LOCK_UN); }
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    auto get_fd() const -> int { return fd_; }

  private:
    const int fd_;
};

// Engine log. Lines go to stderr, and to a shared log file when one is set.
class Logger {
  public:
    Logger() = default;
    ~Logger() { close_file(); }
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    void set_file(const std::string &path) {
        const std::lock_guard guard(lock_);
        close_file();
        if (path.empty()) return;
        log_file_fd_ = openat(AT_FDCWD, path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                              0644);
        if (log_file_fd_ == -1) {
            throw std::runtime_error("failed to open log file " + path + ": " + strerror(errno));
        }
    }
    void set_verbose(bool v) { verbose_ = v; }
    bool verbose() const { return verbose_; }
    // Tests silence the console; the log file still receives every line.
    void set_console(bool c) { console_ = c; }

    template <typename... Args>
    auto println(fmt::format_string<Args...> f, Args &&...args) -> void {
        write_line(fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    auto warn(fmt::format_string<Args...> f, Args &&...args) -> void {
        write_line("\033[35m\033[1mwarning:\033[0m " + fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    auto debug(fmt::format_string<Args...> f, Args &&...args) -> void {
        if (!verbose_) return;
        write_line(fmt::format(f, std::forward<Args>(args)...));
    }

  private:
    std::mutex lock_;
    std::atomic<bool> verbose_{false}, console_{true};
    int log_file_fd_{-1};

    void close_file() {
        if (log_file_fd_ != -1) ::close(log_file_fd_);
        log_file_fd_ = -1;
    }

    auto write_line(std::string s) -> void {
        s = fmt::format(RUNBOX_FMT("[runbox {}] {}\n"), getpid(), s);
        const std::lock_guard guard(lock_);
        if (console_) std::cerr << s << std::flush;
        if (log_file_fd_ == -1) return;
        FileLock f_lock(log_file_fd_);
        std::string_view rest = s;
        while (!rest.empty()) {
            auto n = ::write(log_file_fd_, rest.data(), rest.size());
            if (n == -1 && errno == EINTR) continue;
            if (n <= 0) {
                if (console_) {
                    std::cerr << "[runbox] log file write failed: " << strerror(errno) << '\n';
                }
                return;
            }
            rest.remove_prefix(static_cast<std::size_t>(n));
        }
    }
};

inline Logger logger;

}  // namespace runbox::jl
