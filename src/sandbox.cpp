//
// Copyright (c) 2024-2025 JLGxy
//

#include "sandbox.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "runbox_logs.h"

extern char **environ;

namespace runbox {

namespace chrono = std::chrono;

RunningProgram::RunningProgram(SandboxBackend &owner, mpc::Process &&proc, MyPipe &&in,
                               MyPipe &&out, MyPipe &&err, std::string handle, fs::path cid_file)
        : owner_(&owner),
          proc_(std::move(proc)),
          in_(std::move(in)),
          out_(std::move(out)),
          err_(std::move(err)),
          handle_(std::move(handle)),
          cid_file_(std::move(cid_file)) {}

RunningProgram::~RunningProgram() {
    if (!terminated_ && proc_.is_alive()) terminate();
    in_.close();
    out_.close();
    err_.close();
    proc_.join();
    if (!cid_file_.empty()) {
        std::error_code ec;
        fs::remove(cid_file_, ec);
    }
}

void RunningProgram::terminate() {
    terminated_ = true;
    owner_->terminate(*this);
}

bool RunningProgram::write_stdin(std::string_view data, tm_usage_t time_lim_ms) {
    if (in_.is_write_closed()) return false;
    const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(time_lim_ms);
    while (!data.empty()) {
        auto n = ::write(in_.write_fd(), data.data(), data.size());
        if (n > 0) {
            data.remove_prefix(static_cast<std::size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && errno == EAGAIN) {
            auto left = chrono::duration_cast<chrono::milliseconds>(deadline -
                                                                    chrono::steady_clock::now());
            if (left.count() <= 0) return false;
            pollfd pfd{in_.write_fd(), POLLOUT, 0};
            if (poll(&pfd, 1, static_cast<int>(left.count())) == -1 && errno != EINTR) {
                return false;
            }
            continue;
        }
        jl::logger.debug(RUNBOX_FMT("stdin write failed: {}"), strerror(errno));
        in_.close_write();
        return false;
    }
    return true;
}

std::vector<std::string> SandboxBackend::resolve_all(const std::vector<std::string> &argv,
                                                     const launch_conf_t &conf) const {
    std::vector<std::string> ret;
    ret.reserve(argv.size());
    for (const auto &a : argv) ret.emplace_back(resolve(a, conf));
    return ret;
}

namespace {

struct spawn_spec_t {
    std::vector<std::string> argv;
    fs::path cwd;
    std::vector<std::string> env;
    long memory_mb = 0;
    bool interactive = true;
    std::string handle;
    fs::path cid_file;
};

void set_mem_lim(long mem_mb) {
    if (mem_mb <= 0) return;
    rlimit rlim;
    rlim.rlim_cur = static_cast<rlim_t>(mem_mb) << 20;
    rlim.rlim_max = static_cast<rlim_t>(mem_mb) << 20;
    setrlimit(RLIMIT_DATA, &rlim);
    setrlimit(RLIMIT_STACK, &rlim);
}

[[noreturn]] void report_and_exit(int fd, int err) {
    while (::write(fd, &err, sizeof(err)) == -1 && errno == EINTR) {
    }
    _exit(127);
}

std::vector<std::string> merge_env(const std::vector<std::string> &extra) {
    std::vector<std::string> ret;
    auto key_of = [](std::string_view kv) { return kv.substr(0, kv.find('=')); };
    for (char **e = environ; e != nullptr && *e != nullptr; e++) {
        std::string_view kv(*e);
        bool overridden = false;
        for (const auto &x : extra) {
            if (key_of(x) == key_of(kv)) overridden = true;
        }
        if (!overridden) ret.emplace_back(kv);
    }
    for (const auto &x : extra) ret.push_back(x);
    return ret;
}

launch_result_t spawn_child(SandboxBackend &owner, const spawn_spec_t &spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) return {nullptr, "empty command"};
    MyPipe in = spec.interactive ? MyPipe() : null_pipe();
    MyPipe out, err, status;
    if (in.is_read_closed() || out.is_read_closed() || err.is_read_closed() ||
        status.is_read_closed()) {
        return {nullptr, fmt::format(RUNBOX_FMT("failed to create pipes: {}"), strerror(errno))};
    }

    // everything the child needs is prepared before fork
    std::vector<char *> c_argv;
    for (const auto &a : spec.argv) c_argv.emplace_back(const_cast<char *>(a.c_str()));
    c_argv.emplace_back(nullptr);
    const auto env = merge_env(spec.env);
    std::vector<char *> c_env;
    for (const auto &e : env) c_env.emplace_back(const_cast<char *>(e.c_str()));
    c_env.emplace_back(nullptr);
    const std::string cwd = spec.cwd.string();

    mpc::Process proc([&] {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        status.close_read();
        if (dup2(in.read_fd(), STDIN_FILENO) == -1 || dup2(out.write_fd(), STDOUT_FILENO) == -1 ||
            dup2(err.write_fd(), STDERR_FILENO) == -1) {
            report_and_exit(status.write_fd(), errno);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) == -1) report_and_exit(status.write_fd(), errno);
        rlimit core{0, 0};
        setrlimit(RLIMIT_CORE, &core);
        set_mem_lim(spec.memory_mb);
        execvpe(c_argv[0], c_argv.data(), c_env.data());
        report_and_exit(status.write_fd(), errno);
    });
    if (proc.failed()) {
        return {nullptr, fmt::format(RUNBOX_FMT("fork failed: {}"), strerror(errno))};
    }
    // the child may already have exec'd, in which case this fails harmlessly
    setpgid(proc.pid(), proc.pid());
    status.close_write();
    in.close_read();
    out.close_write();
    err.close_write();

    int child_errno = 0;
    ::ssize_t got;
    do {
        got = ::read(status.read_fd(), &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    if (got == static_cast<::ssize_t>(sizeof(child_errno))) {
        proc.join();
        return {nullptr, fmt::format(RUNBOX_FMT("failed to start `{}`: {}"), spec.argv.front(),
                                     strerror(child_errno))};
    }
    if (!out.set_nonblocking(true) || !err.set_nonblocking(true) ||
        (spec.interactive && !in.set_nonblocking(false))) {
        return {nullptr, "failed to configure pipes"};
    }
    jl::logger.debug(RUNBOX_FMT("spawned pid {}: {}"), proc.pid(), join_command(spec.argv));
    return {std::make_unique<RunningProgram>(owner, std::move(proc), std::move(in), std::move(out),
                                             std::move(err), spec.handle, spec.cid_file),
            ""};
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

}  // namespace

std::string ProcessBackend::resolve(std::string_view arg, const launch_conf_t &conf) const {
    auto s = replace_all(std::string(arg), "${workspace}", conf.work_dir.string());
    return replace_all(std::move(s), "${scratch}", conf.scratch_dir.string());
}

launch_result_t ProcessBackend::launch(const launch_conf_t &conf) {
    spawn_spec_t spec;
    spec.argv = resolve_all(conf.argv, conf);
    spec.cwd = conf.work_dir;
    spec.env = conf.env;
    spec.memory_mb = conf.limits.memory_mb;
    spec.interactive = conf.interactive;
    return spawn_child(*this, spec);
}

void ProcessBackend::terminate(RunningProgram &prog) {
    prog.process().kill_group(SIGKILL);
    prog.process().join();
}

std::optional<tm_usage_t> parse_proc_stat_cpu(std::string_view stat) {
    auto pos = stat.rfind(')');
    if (pos == std::string_view::npos) return std::nullopt;
    auto rest = stat.substr(pos + 1);
    // fields after the command name start at field 3 (state); utime is 14, stime is 15
    std::vector<std::string_view> fields;
    std::size_t lst = 0;
    for (std::size_t i = 0; i <= rest.size(); i++) {
        if (i == rest.size() || rest[i] == ' ') {
            if (lst < i) fields.push_back(rest.substr(lst, i - lst));
            lst = i + 1;
        }
    }
    if (fields.size() < 13) return std::nullopt;
    long utime = 0, stime = 0;
    if (std::from_chars(fields[11].data(), fields[11].data() + fields[11].size(), utime).ec !=
                std::errc{} ||
        std::from_chars(fields[12].data(), fields[12].data() + fields[12].size(), stime).ec !=
                std::errc{}) {
        return std::nullopt;
    }
    static const long ticks = sysconf(_SC_CLK_TCK);
    if (ticks <= 0) return std::nullopt;
    return (utime + stime) * 1000 / ticks;
}

std::optional<tm_usage_t> ProcessBackend::cpu_time_ms(RunningProgram &prog) {
    if (!prog.is_alive()) return std::nullopt;
    auto stat = read_file(fs::path("/proc") / std::to_string(prog.process().pid()) / "stat");
    if (stat.empty()) return std::nullopt;
    return parse_proc_stat_cpu(stat);
}

std::string ContainerBackend::resolve(std::string_view arg,
                                      const launch_conf_t & /* conf */) const {
    auto s = replace_all(std::string(arg), "${workspace}", "/workspace");
    return replace_all(std::move(s), "${scratch}", "/scratch");
}

std::vector<std::string> ContainerBackend::compose_argv(const launch_conf_t &conf,
                                                        const std::string &name,
                                                        const fs::path &cid_file) const {
    const long mem = conf.limits.memory_mb > 0 ? conf.limits.memory_mb : conf_.memory_mb;
    const double cpus = conf.limits.cpus > 0 ? conf.limits.cpus : conf_.cpus;
    const long pids = conf.limits.pids > 0 ? conf.limits.pids : conf_.pids_limit;

    std::vector<std::string> ret{conf_.runtime, "run", "--rm"};
    if (conf.interactive) ret.emplace_back("-i");
    ret.insert(ret.end(), {"--name", name});
    if (!cid_file.empty()) ret.insert(ret.end(), {"--cidfile", cid_file.string()});
    ret.insert(ret.end(), {"--network", "none", "--read-only"});
    ret.insert(ret.end(), {"--memory", fmt::format(RUNBOX_FMT("{}m"), mem)});
    ret.insert(ret.end(), {"--memory-swap", fmt::format(RUNBOX_FMT("{}m"), mem)});
    ret.insert(ret.end(), {"--cpus", fmt::format(RUNBOX_FMT("{}"), cpus)});
    ret.insert(ret.end(), {"--pids-limit", std::to_string(pids)});
    ret.insert(ret.end(), {"--cap-drop", "ALL", "--security-opt", "no-new-privileges"});
    ret.insert(ret.end(),
               {"--tmpfs", fmt::format(RUNBOX_FMT("/tmp:rw,exec,size={}m"), conf_.tmpfs_mb)});
    ret.insert(ret.end(), {"-v", conf.work_dir.string() + ":/workspace:ro"});
    if (!conf.scratch_dir.empty()) {
        ret.insert(ret.end(), {"-v", conf.scratch_dir.string() + ":/scratch:rw,exec"});
    }
    ret.insert(ret.end(), {"-w", "/workspace"});
    for (const auto &e : conf.env) ret.insert(ret.end(), {"-e", e});
    ret.push_back(conf.image);
    auto inner = resolve_all(conf.argv, conf);
    ret.insert(ret.end(), inner.begin(), inner.end());
    return ret;
}

launch_result_t ContainerBackend::launch(const launch_conf_t &conf) {
    if (auto why = unavailable_reason()) return {nullptr, *why};
    if (conf.image.empty()) return {nullptr, "no container image configured"};
    spawn_spec_t spec;
    spec.handle = "runbox-" + randstr(12);
    if (!conf.scratch_dir.empty()) {
        spec.cid_file = conf.scratch_dir.parent_path() / (spec.handle + ".cid");
    }
    spec.argv = compose_argv(conf, spec.handle, spec.cid_file);
    spec.cwd = conf.work_dir;
    spec.interactive = conf.interactive;
    return spawn_child(*this, spec);
}

void ContainerBackend::terminate(RunningProgram &prog) {
    if (!prog.handle().empty()) {
        auto [code, out, err] = run_get_output(conf_.runtime, {"rm", "-f", prog.handle()}, 10000);
        if (code != 0) {
            jl::logger.debug(RUNBOX_FMT("{} rm -f {} exited with {}: {}"), conf_.runtime,
                             prog.handle(), code, err);
        }
    }
    prog.process().kill_group(SIGKILL);
    prog.process().join();
}

std::optional<tm_usage_t> parse_cgroup_cpu_stat(std::string_view stat) {
    constexpr std::string_view key = "usage_usec ";
    auto pos = stat.find(key);
    if (pos == std::string_view::npos) return std::nullopt;
    auto num = stat.substr(pos + key.size());
    long long usec = 0;
    if (std::from_chars(num.data(), num.data() + num.size(), usec).ec != std::errc{}) {
        return std::nullopt;
    }
    return static_cast<tm_usage_t>(usec / 1000);
}

std::optional<tm_usage_t> ContainerBackend::cpu_time_ms(RunningProgram &prog) {
    if (prog.cid_file().empty()) return std::nullopt;
    auto id = read_file(prog.cid_file());
    while (!id.empty() && std::isspace(static_cast<unsigned char>(id.back()))) id.pop_back();
    if (id.empty()) return std::nullopt;
    const fs::path v2[] = {fs::path("/sys/fs/cgroup/system.slice") / ("docker-" + id + ".scope"),
                           fs::path("/sys/fs/cgroup/docker") / id};
    for (const auto &dir : v2) {
        std::error_code ec;
        if (!fs::exists(dir / "cpu.stat", ec)) continue;
        if (auto ms = parse_cgroup_cpu_stat(read_file(dir / "cpu.stat"))) return ms;
    }
    const auto v1 = fs::path("/sys/fs/cgroup/cpuacct/docker") / id / "cpuacct.usage";
    std::error_code ec;
    if (fs::exists(v1, ec)) {
        auto ns = read_file(v1);
        long long val = 0;
        if (std::from_chars(ns.data(), ns.data() + ns.size(), val).ec == std::errc{}) {
            return static_cast<tm_usage_t>(val / 1000000);
        }
    }
    return std::nullopt;
}

std::optional<std::string> ContainerBackend::unavailable_reason() {
    const std::lock_guard guard(probe_lock_);
    const auto now = chrono::steady_clock::now();
    if (probed_ && now - probe_time_ < chrono::milliseconds(conf_.probe_ttl_ms)) {
        return probe_result_;
    }
    auto [code, out, err] =
            run_get_output(conf_.runtime, {"version", "--format", "{{.Server.Version}}"}, 5000);
    if (code == 0) {
        probe_result_ = std::nullopt;
    } else if (code == -1) {
        probe_result_ = fmt::format(RUNBOX_FMT("container runtime `{}` is not installed"),
                                    conf_.runtime);
    } else {
        while (!err.empty() && std::isspace(static_cast<unsigned char>(err.back()))) err.pop_back();
        probe_result_ = fmt::format(RUNBOX_FMT("container runtime `{}` is not available: {}"),
                                    conf_.runtime, err.empty() ? "no daemon response" : err);
    }
    probed_ = true;
    probe_time_ = now;
    if (probe_result_) jl::logger.println(RUNBOX_FMT("{}"), *probe_result_);
    return probe_result_;
}

std::optional<std::string> ContainerBackend::infrastructure_failure(int exit_code,
                                                                    std::string_view err) const {
    // 125: the runtime failed, 126/127: the contained command could not be invoked
    if (exit_code < 125 || exit_code > 127) return std::nullopt;
    const auto prefix = conf_.runtime + ": ";
    auto st = err.find(prefix);
    if (st == std::string_view::npos) {
        if (err.find("Error response from daemon") == std::string_view::npos &&
            err.find("Cannot connect to the Docker daemon") == std::string_view::npos) {
            return std::nullopt;
        }
        st = 0;
    }
    auto ed = err.find('\n', st);
    return std::string(err.substr(st, ed == std::string_view::npos ? std::string_view::npos
                                                                   : ed - st));
}

}  // namespace runbox
