//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"

namespace runbox {

struct resource_limits_t {
    // 0 keeps the backend default
    long memory_mb = 0;
    double cpus = 0;
    long pids = 0;
};

struct launch_conf_t {
    // May hold ${workspace} and ${scratch}; the backend resolves them.
    std::vector<std::string> argv;
    // Host directory holding the sources
    fs::path work_dir;
    // Host directory receiving build output
    fs::path scratch_dir;
    // Extra KEY=VALUE entries
    std::vector<std::string> env;
    resource_limits_t limits;
    // stdin is a pipe kept open for continuations; otherwise /dev/null
    bool interactive = true;
    std::string image;
};

class SandboxBackend;

// A program started by a backend. Destroying it kills whatever is left of it.
class RunningProgram {
  public:
    RunningProgram(SandboxBackend &owner, mpc::Process &&proc, MyPipe &&in, MyPipe &&out,
                   MyPipe &&err, std::string handle, fs::path cid_file);
    ~RunningProgram();
    RunningProgram(const RunningProgram &) = delete;
    RunningProgram &operator=(const RunningProgram &) = delete;

    mpc::Process &process() { return proc_; }
    SandboxBackend &backend() { return *owner_; }

    int stdout_fd() const { return out_.is_read_closed() ? -1 : out_.read_fd(); }
    int stderr_fd() const { return err_.is_read_closed() ? -1 : err_.read_fd(); }
    void close_stdout() { out_.close_read(); }
    void close_stderr() { err_.close_read(); }
    void close_stdin() { in_.close_write(); }
    bool stdin_open() const { return !in_.is_write_closed(); }

    // Container name; empty for host processes
    const std::string &handle() const { return handle_; }
    const fs::path &cid_file() const { return cid_file_; }

    bool is_alive() { return proc_.is_alive(); }
    // Force-kills the program and reaps it
    void terminate();
    // Writes all of `data` to stdin. Returns false if stdin is closed or the
    // write does not complete within the limit.
    bool write_stdin(std::string_view data, tm_usage_t time_lim_ms);

  private:
    SandboxBackend *owner_;
    mpc::Process proc_;
    MyPipe in_, out_, err_;
    std::string handle_;
    fs::path cid_file_;
    bool terminated_ = false;
};

struct launch_result_t {
    std::unique_ptr<RunningProgram> program;
    // Why nothing was started
    std::string error;
};

class SandboxBackend {
  public:
    SandboxBackend() = default;
    virtual ~SandboxBackend() = default;
    SandboxBackend(const SandboxBackend &) = delete;
    SandboxBackend &operator=(const SandboxBackend &) = delete;

    virtual std::string_view name() const = 0;
    virtual launch_result_t launch(const launch_conf_t &conf) = 0;
    virtual void terminate(RunningProgram &prog) = 0;
    // CPU time consumed so far, if the backend can tell
    virtual std::optional<tm_usage_t> cpu_time_ms(RunningProgram &prog) = 0;
    // nullopt when usable, otherwise what is missing
    virtual std::optional<std::string> unavailable_reason() = 0;
    // Runtimes that report their own failures through the exit status
    virtual std::optional<std::string> infrastructure_failure(int /* exit_code */,
                                                              std::string_view /* err */) const {
        return std::nullopt;
    }
    // Whether a multi-step build is cheaper as one script
    virtual bool batches_build_steps() const { return false; }
    // Replaces ${workspace} and ${scratch} with the paths the program sees
    virtual std::string resolve(std::string_view arg, const launch_conf_t &conf) const = 0;

    std::vector<std::string> resolve_all(const std::vector<std::string> &argv,
                                         const launch_conf_t &conf) const;
};

// Runs programs directly on the host, each in its own process group
class ProcessBackend : public SandboxBackend {
  public:
    std::string_view name() const override { return "process"; }
    launch_result_t launch(const launch_conf_t &conf) override;
    void terminate(RunningProgram &prog) override;
    std::optional<tm_usage_t> cpu_time_ms(RunningProgram &prog) override;
    std::optional<std::string> unavailable_reason() override { return std::nullopt; }
    std::string resolve(std::string_view arg, const launch_conf_t &conf) const override;
};

struct container_conf_t {
    std::string runtime = "docker";
    long memory_mb = 128;
    double cpus = 1;
    long pids_limit = 64;
    long tmpfs_mb = 16;
    tm_usage_t probe_ttl_ms = 30000;
};

// Runs programs through a container runtime CLI
class ContainerBackend : public SandboxBackend {
  public:
    explicit ContainerBackend(container_conf_t conf) : conf_(std::move(conf)) {}

    std::string_view name() const override { return "container"; }
    launch_result_t launch(const launch_conf_t &conf) override;
    void terminate(RunningProgram &prog) override;
    std::optional<tm_usage_t> cpu_time_ms(RunningProgram &prog) override;
    std::optional<std::string> unavailable_reason() override;
    std::optional<std::string> infrastructure_failure(int exit_code,
                                                      std::string_view err) const override;
    bool batches_build_steps() const override { return true; }
    std::string resolve(std::string_view arg, const launch_conf_t &conf) const override;

    // The runtime command line for one invocation
    std::vector<std::string> compose_argv(const launch_conf_t &conf, const std::string &name,
                                          const fs::path &cid_file) const;
    const container_conf_t &conf() const { return conf_; }

  private:
    container_conf_t conf_;
    std::mutex probe_lock_;
    std::optional<std::string> probe_result_;
    std::chrono::steady_clock::time_point probe_time_;
    bool probed_ = false;
};

// Parses the utime + stime fields of /proc/<pid>/stat, in milliseconds
std::optional<tm_usage_t> parse_proc_stat_cpu(std::string_view stat);
// Parses usage_usec of a cgroup v2 cpu.stat, in milliseconds
std::optional<tm_usage_t> parse_cgroup_cpu_stat(std::string_view stat);

}  // namespace runbox
