//
// Copyright (c) 2024-2025 JLGxy
//

#include "language_suite.h"

#include <set>
#include <string>
#include <vector>

#include "runbox_logs.h"

namespace runbox {

namespace {

const std::string _executable = "${scratch}/main";

std::string parent_dir(const std::string &path) {
    auto p = fs::path(path).parent_path().string();
    return p.empty() ? "." : p;
}

}  // namespace

launch_conf_t LanguageSuite::base_launch(const Workspace &ws) const {
    launch_conf_t c;
    c.work_dir = ws.source_dir();
    c.scratch_dir = ws.scratch_dir();
    c.env = conf_.env;
    c.limits.memory_mb = conf_.memory_limit_mb;
    c.image = conf_.image;
    return c;
}

build_outcome_t LanguageSuite::build(const phase_info_t & /* info */,
                                     const std::vector<source_file_t> & /* files */,
                                     BuildPipeline & /* pipeline */,
                                     const launch_conf_t & /* base */) const {
    return build_outcome_t::nothing_to_do();
}

watch_conf_t LanguageSuite::base_watch(const detection_conf_t &det) const {
    watch_conf_t w;
    w.time_lim_ms = conf_.run_timeout_ms;
    w.detect_input = true;
    w.detection = det;
    w.eof_markers = conf_.eof_markers;
    return w;
}

prepared_run_t LanguageSuite::make_run(std::vector<std::string> argv, const launch_conf_t &base,
                                       const detection_conf_t &det) const {
    prepared_run_t r;
    r.launch = base;
    r.launch.argv = std::move(argv);
    r.launch.interactive = true;
    r.watch = base_watch(det);
    return r;
}

prepared_run_t LanguageSuite::prepare_run(const phase_info_t &info, const launch_conf_t &base,
                                          const detection_conf_t &det) const {
    template_vars_t vars{{"source", {info.entry}}, {"workspace", {"${workspace}"}}};
    return make_run(conf_.run.expand(vars), base, det);
}

bool JavaSuite::separate_outdir(const phase_info_t &info) const {
    // the container mounts the sources read-only
    return info.phase == phase_t::_java_package || conf_.backend != backend_kind_t::_process;
}

build_outcome_t JavaSuite::build(const phase_info_t &info, const std::vector<source_file_t> &files,
                                 BuildPipeline &pipeline, const launch_conf_t &base) const {
    if (info.phase == phase_t::_java_package) {
        if (auto err = check_package_layout(files)) {
            jl::logger.debug(RUNBOX_FMT("package layout rejected: {}"), err->message);
            build_outcome_t o;
            o.structural_error = std::move(err);
            return o;
        }
    }
    template_vars_t vars{{"sources", info.sources}, {"outdir", {}}};
    if (separate_outdir(info)) vars["outdir"] = {"-d", "${scratch}"};
    std::vector<build_step_t> steps{{conf_.compile.expand(vars)}};
    return pipeline.run(steps, base, conf_.build_timeout_ms, conf_.output_limit, false);
}

prepared_run_t JavaSuite::prepare_run(const phase_info_t &info, const launch_conf_t &base,
                                      const detection_conf_t &det) const {
    template_vars_t vars{{"class", {info.main_class}},
                         {"classpath", {separate_outdir(info) ? "${scratch}" : "."}},
                         {"source", {info.entry}}};
    return make_run(conf_.run.expand(vars), base, det);
}

std::vector<build_step_t> CSuite::multi_file_steps(const phase_info_t &info) const {
    std::set<std::string> dirs;
    std::vector<std::string> includes;
    auto add_dir = [&](const std::string &file) {
        auto d = parent_dir(file);
        if (dirs.insert(d).second) includes.push_back("-I" + d);
    };
    for (const auto &s : info.sources) add_dir(s);
    for (const auto &h : info.headers) add_dir(h);

    std::vector<build_step_t> steps;
    std::vector<std::string> objects;
    for (std::size_t i = 0; i < info.sources.size(); i++) {
        const auto &src = info.sources[i];
        auto obj =
                fmt::format(RUNBOX_FMT("${{scratch}}/{}_{}.o"), i, fs::path(src).stem().string());
        template_vars_t vars{{"source", {src}}, {"object", {obj}}, {"includes", includes}};
        steps.push_back({conf_.compile_object.expand(vars)});
        objects.push_back(std::move(obj));
    }
    template_vars_t vars{{"objects", objects}, {"executable", {_executable}}};
    steps.push_back({conf_.link.expand(vars)});
    return steps;
}

std::string CSuite::single_file_script(const phase_info_t &info,
                                       const std::string &sentinel) const {
    template_vars_t vars{{"source", {info.entry}}, {"executable", {_executable}}};
    return join_command(conf_.compile.expand(vars)) + " || exit $?\n" +
           fmt::format(RUNBOX_FMT("printf '%s\\n' {} >&2\n"), shell_quote(sentinel)) + "exec " +
           join_command(conf_.run.expand(vars)) + "\n";
}

build_outcome_t CSuite::build(const phase_info_t &info,
                              const std::vector<source_file_t> & /* files */,
                              BuildPipeline &pipeline, const launch_conf_t &base) const {
    if (info.phase == phase_t::_c_single) return build_outcome_t::nothing_to_do();
    return pipeline.run(multi_file_steps(info), base, conf_.build_timeout_ms, conf_.output_limit,
                        true);
}

prepared_run_t CSuite::prepare_run(const phase_info_t &info, const launch_conf_t &base,
                                   const detection_conf_t &det) const {
    if (info.phase == phase_t::_c_multi) {
        template_vars_t vars{{"executable", {_executable}}};
        return make_run(conf_.run.expand(vars), base, det);
    }
    const std::string sentinel = "@@runbox-built-" + randstr(16) + "@@";
    auto r = make_run({"sh", "-c", single_file_script(info, sentinel)}, base, det);
    r.watch.build_sentinel = sentinel;
    r.watch.build_time_lim_ms = conf_.build_timeout_ms;
    return r;
}

std::unique_ptr<LanguageSuite> make_suite(language_t lang, const lang_conf_t &conf) {
    switch (lang) {
        case language_t::_java: return std::make_unique<JavaSuite>(lang, conf);
        case language_t::_c: return std::make_unique<CSuite>(lang, conf);
        case language_t::_python:
        case language_t::_javascript: break;
    }
    return std::make_unique<InterpretedSuite>(lang, conf);
}

}  // namespace runbox
