#pragma once

#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <concepts>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <type_traits>
#include <utility>

namespace runbox::multiproc {

// Exit status as a shell reports it: 128 + signal for killed processes.
inline int shell_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// A forked child. The destructor kills the child's process group if it is
// still running, then reaps it.
class Process {
  public:
    Process() = default;
    Process(Process &&o) noexcept
            : pid_(std::exchange(o.pid_, 0)),
              pidfd_(std::exchange(o.pidfd_, -1)),
              status_(std::exchange(o.status_, 0)),
              alive_(std::exchange(o.alive_, false)),
              fail_(std::exchange(o.fail_, false)) {}
    template <typename T, typename... Args>
        requires(!std::same_as<Process, std::remove_cvref_t<T>>) && std::invocable<T, Args...>
    explicit Process(T &&f, Args &&...args) {
        int pid = fork();
        if (pid == -1) {
            fail_ = true;
            return;
        }
        if (pid == 0) {
            std::invoke(std::forward<T>(f), std::forward<Args>(args)...);
            _exit(0);
        }
        pid_ = pid;
        alive_ = true;
        open_pidfd();
    }
    Process(const Process &) = delete;
    Process &operator=(const Process &) = delete;
    ~Process() {
        if (alive_) kill_group(SIGKILL);
        join();
        close_pidfd();
    }

    void join() {
        if (!alive_) return;
        while (true) {
            int status;
            int wid = waitpid(pid_, &status, 0);
            if (wid == pid_) {
                status_ = status;
                break;
            }
            if (wid == -1 && errno == EINTR) continue;
            break;
        }
        alive_ = false;
    }
    // Reaps the child if it has exited. Returns true once it is gone.
    bool try_wait() {
        while (alive_) {
            int status;
            int wid = waitpid(pid_, &status, WNOHANG);
            if (wid == pid_) {
                status_ = status;
                alive_ = false;
            } else if (wid == -1 && errno == EINTR) {
                continue;
            } else if (wid == -1) {
                alive_ = false;
            }
            break;
        }
        return !alive_;
    }
    bool is_alive() { return !try_wait(); }
    bool failed() const { return fail_; }
    bool if_exited() { return try_wait() && WIFEXITED(status_); }
    bool if_signaled() { return try_wait() && WIFSIGNALED(status_); }
    int exit_status() { return if_exited() ? WEXITSTATUS(status_) : -1; }
    int term_sig() { return if_signaled() ? WTERMSIG(status_) : 0; }
    int shell_status() { return try_wait() ? multiproc::shell_status(status_) : -1; }

    int kill(int sig) const { return alive_ ? ::kill(pid_, sig) : -1; }
    // The child is expected to lead its own group (setpgid(0, 0) before exec).
    int kill_group(int sig) const {
        if (!alive_ || pid_ <= 0) return -1;
        if (::kill(-pid_, sig) == -1) return ::kill(pid_, sig);
        return 0;
    }
    int pid() const { return pid_; }
    // -1 when the kernel has no pidfd support
    int pidfd() const { return pidfd_; }

  private:
    pid_t pid_{};
    int pidfd_{-1};
    int status_{};
    bool alive_{false}, fail_{false};

    void open_pidfd() {
#ifdef SYS_pidfd_open
        pidfd_ = static_cast<int>(syscall(SYS_pidfd_open, pid_, 0));
#endif
    }
    void close_pidfd() {
        if (pidfd_ != -1) ::close(pidfd_);
        pidfd_ = -1;
    }
};

}  // namespace runbox::multiproc
