//
// Copyright (c) 2024-2025 JLGxy
//

#include "settings.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include "runbox_logs.h"

namespace runbox {

std::string backend_to_str(backend_kind_t b) {
    switch (b) {
        case backend_kind_t::_process: return "process";
        case backend_kind_t::_container: return "container";
        case backend_kind_t::_browser: return "browser";
    }
    return "unknown";
}

std::optional<backend_kind_t> to_backend(std::string_view s) {
    std::string t(s);
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return std::tolower(c); });
    if (t == "process") return backend_kind_t::_process;
    if (t == "container" || t == "docker") return backend_kind_t::_container;
    if (t == "browser") return backend_kind_t::_browser;
    return std::nullopt;
}

lang_conf_t default_lang_conf(language_t lang, backend_kind_t backend) {
    lang_conf_t c;
    c.backend = backend;
    c.output_limit = backend == backend_kind_t::_container ? 100000 : 10000;
    switch (lang) {
        case language_t::_python:
            c.image = "runner-python";
            c.env = {"PYTHONUNBUFFERED=1", "PYTHONDONTWRITEBYTECODE=1"};
            c.eof_markers = {"EOFError", "EOF when reading a line"};
            c.run = CommandTemplate("python3", {"-u", "${source}"});
            break;
        case language_t::_javascript:
            c.image = "runner-node";
            c.run = CommandTemplate("node", {"${source}"});
            break;
        case language_t::_java:
            c.image = "runner-java";
            c.eof_markers = {"java.util.NoSuchElementException"};
            // ${outdir} is empty when classes are written beside the sources
            c.compile = CommandTemplate("javac", {"-encoding", "UTF-8", "${outdir}", "${sources}"});
            c.run = CommandTemplate("java", {"-cp", "${classpath}", "${class}"});
            break;
        case language_t::_c:
            c.image = "runner-c";
            c.build_timeout_ms = 5000;
            c.run_timeout_ms = 2000;
            c.compile = CommandTemplate("gcc", {"${source}", "-o", "${executable}", "-lm"});
            c.compile_object =
                    CommandTemplate("gcc", {"-c", "${source}", "-o", "${object}", "${includes}"});
            c.link = CommandTemplate("gcc", {"${objects}", "-o", "${executable}", "-lm"});
            // stdout of a C program on a pipe is block buffered
            c.run = CommandTemplate("stdbuf", {"-o0", "-e0", "${executable}"});
            break;
    }
    return c;
}

engine_conf_t default_engine_conf() {
    engine_conf_t conf;
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    conf.workspace_root = (ec ? fs::path("/tmp") : tmp) / "runbox";
    for (auto l : _all_languages) {
        conf.languages[l] = default_lang_conf(
                l, l == language_t::_c ? backend_kind_t::_container : backend_kind_t::_process);
    }
    return conf;
}

namespace {

class ConfReader {
  public:
    explicit ConfReader(std::string_view source) : source_(source) {}

    [[noreturn]] void fail(std::string_view key, std::string_view what) const {
        throw ConfigError(source_, fmt::format(RUNBOX_FMT("`{}`: {}"), key, what));
    }

    template <typename T>
    void get(const YAML::Node &node, std::string_view key, T &to) const {
        const auto &cur = node[std::string(key)];
        if (!cur) return;
        try {
            to = cur.as<T>();
        } catch (const YAML::Exception &) {
            fail(key, "malformed value");
        }
    }

    template <typename T>
    void get_positive(const YAML::Node &node, std::string_view key, T &to) const {
        T v = to;
        get(node, key, v);
        if (v < 0) fail(key, "must not be negative");
        to = v;
    }

    void get_strings(const YAML::Node &node, std::string_view key,
                     std::vector<std::string> &to) const {
        const auto &cur = node[std::string(key)];
        if (!cur) return;
        if (!cur.IsSequence()) fail(key, "expected a list of strings");
        to.clear();
        for (const auto &snode : cur) {
            if (!snode.IsScalar()) fail(key, "expected a list of strings");
            to.emplace_back(snode.as<std::string>());
        }
    }

    void get_env(const YAML::Node &node, std::string_view key, std::vector<std::string> &to) const {
        const auto &cur = node[std::string(key)];
        if (!cur) return;
        if (cur.IsSequence()) {
            get_strings(node, key, to);
            for (const auto &kv : to) {
                if (kv.find('=') == std::string::npos || kv.front() == '=') {
                    fail(key, "entries must look like NAME=value");
                }
            }
            return;
        }
        if (!cur.IsMap()) fail(key, "expected a map of variables");
        to.clear();
        for (const auto &it : cur) {
            auto name = it.first.as<std::string>();
            if (name.empty() || name.find('=') != std::string::npos) fail(key, "bad variable name");
            if (!it.second.IsScalar()) fail(key, "values must be scalars");
            to.emplace_back(name + "=" + it.second.as<std::string>());
        }
    }

    void get_template(const YAML::Node &node, std::string_view key, CommandTemplate &to) const {
        const auto &cur = node[std::string(key)];
        if (!cur) return;
        std::vector<std::string> args;
        get_strings(node, key, args);
        if (args.empty() || args.front().empty()) fail(key, "command must name a program");
        to.program = args.front();
        to.argvec.assign(args.begin() + 1, args.end());
    }

    void read_language(const YAML::Node &node, language_t lang, lang_conf_t &conf) const {
        if (!node.IsMap()) fail(language_to_str(lang), "expected a map");
        if (const auto &bnode = node["backend"]) {
            auto b = to_backend(bnode.as<std::string>());
            if (!b) {
                fail("backend", fmt::format(RUNBOX_FMT("unknown backend `{}` (expected process, "
                                                       "container or browser)"),
                                            bnode.as<std::string>()));
            }
            // another backend brings its own defaults
            if (*b != conf.backend) conf = default_lang_conf(lang, *b);
        }
        get(node, "image", conf.image);
        get_positive(node, "build_timeout_ms", conf.build_timeout_ms);
        get_positive(node, "run_timeout_ms", conf.run_timeout_ms);
        get(node, "output_limit", conf.output_limit);
        get_positive(node, "memory_limit_mb", conf.memory_limit_mb);
        get_strings(node, "eof_markers", conf.eof_markers);
        get_env(node, "env", conf.env);
        get_template(node, "compile", conf.compile);
        get_template(node, "compile_object", conf.compile_object);
        get_template(node, "link", conf.link);
        get_template(node, "run", conf.run);
        if (conf.run.empty()) fail("run", "a run command is required");
        if (conf.output_limit == 0) fail("output_limit", "must be positive");
    }

  private:
    std::string source_;
};

}  // namespace

engine_conf_t parse_engine_conf(std::string_view yaml_text, std::string_view source_name) {
    const ConfReader rd(source_name);
    YAML::Node node;
    try {
        node = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception &e) {
        throw ConfigError(source_name, e.what());
    }

    engine_conf_t conf = default_engine_conf();
    if (node.IsNull()) return conf;
    if (!node.IsMap()) throw ConfigError(source_name, "top level must be a map");

    for (const auto &it : node) {
        static const char *const known[] = {"production", "workspace_root", "log_file",
                                            "history",    "sessions",       "detection",
                                            "container",  "languages"};
        auto key = it.first.as<std::string>();
        if (std::find(std::begin(known), std::end(known), key) == std::end(known)) {
            jl::logger.warn(RUNBOX_FMT("{}: ignoring unknown key `{}`"), source_name, key);
        }
    }

    rd.get(node, "production", conf.production);
    std::string root;
    rd.get(node, "workspace_root", root);
    if (!root.empty()) conf.workspace_root = root;
    rd.get(node, "log_file", conf.log_file);

    if (const auto &h = node["history"]) {
        rd.get(h, "capacity", conf.history.capacity);
        rd.get(h, "file", conf.history.file);
        if (conf.history.capacity == 0) rd.fail("history.capacity", "must be positive");
    }
    if (const auto &s = node["sessions"]) {
        rd.get(s, "capacity", conf.sessions.capacity);
        rd.get_positive(s, "lifetime_ms", conf.sessions.lifetime_ms);
        rd.get_positive(s, "reaper_interval_ms", conf.sessions.reaper_interval_ms);
        rd.get(s, "max_concurrent", conf.sessions.max_concurrent);
        rd.get_positive(s, "admission_wait_ms", conf.sessions.admission_wait_ms);
        if (conf.sessions.capacity == 0) rd.fail("sessions.capacity", "must be positive");
        if (conf.sessions.max_concurrent <= 0) {
            rd.fail("sessions.max_concurrent", "must be positive");
        }
    }
    if (const auto &d = node["detection"]) {
        rd.get_positive(d, "idle_threshold_ms", conf.detection.idle_threshold_ms);
        rd.get_positive(d, "silence_ceiling_ms", conf.detection.silence_ceiling_ms);
        rd.get_positive(d, "continuation_window_ms", conf.detection.continuation_window_ms);
        rd.get_positive(d, "prompt_grace_ms", conf.detection.prompt_grace_ms);
        rd.get_positive(d, "busy_cpu_ratio", conf.detection.busy_cpu_ratio);
    }
    if (const auto &c = node["container"]) {
        rd.get(c, "runtime", conf.container.runtime);
        rd.get_positive(c, "memory_mb", conf.container.memory_mb);
        rd.get_positive(c, "cpus", conf.container.cpus);
        rd.get_positive(c, "pids_limit", conf.container.pids_limit);
        rd.get_positive(c, "tmpfs_mb", conf.container.tmpfs_mb);
        rd.get_positive(c, "probe_ttl_ms", conf.container.probe_ttl_ms);
        if (conf.container.runtime.empty()) rd.fail("container.runtime", "must not be empty");
    }
    if (const auto &langs = node["languages"]) {
        if (!langs.IsMap()) rd.fail("languages", "expected a map");
        for (const auto &it : langs) {
            auto name = it.first.as<std::string>();
            auto lang = to_language(name);
            if (!lang) rd.fail("languages", fmt::format(RUNBOX_FMT("unknown language `{}`"), name));
            rd.read_language(it.second, *lang, conf.languages[*lang]);
        }
    }
    return conf;
}

engine_conf_t load_engine_conf(const fs::path &file) {
    std::ifstream conf_stream(file);
    if (!conf_stream) throw ConfigError(file.string(), "cannot open file");
    std::stringstream ss;
    ss << conf_stream.rdbuf();
    return parse_engine_conf(ss.str(), file.string());
}

}  // namespace runbox
