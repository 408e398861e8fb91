//
// Copyright (c) 2024-2025 JLGxy
//

#include "runbox_cli.h"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "assist.h"
#include "config.h"
#include "engine.h"
#include "project_store.h"
#include "runbox_logs.h"

namespace runbox::cli {

engine_conf_t load_conf(const std::string &path) {
    std::string p = path;
    if (p.empty()) {
        if (const char *env = std::getenv("RUNBOX_CONFIG")) p = env;
    }
    if (p.empty()) return default_engine_conf();
    jl::logger.debug(RUNBOX_FMT("config: {}"), p);
    return load_engine_conf(p);
}

std::vector<source_file_t> read_sources(const std::vector<std::string> &paths) {
    std::vector<source_file_t> files;
    for (const auto &p : paths) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            throw RunboxError(fmt::format(RUNBOX_FMT("no such file: {}"), p));
        }
        auto name = normalize_path(p);
        if (!is_safe_relative_path(name)) name = fs::path(p).filename().string();
        files.push_back({name, read_file(p)});
    }
    return files;
}

std::size_t skip_echo(const std::string &now, std::size_t printed, const std::string &input) {
    const std::string echo = input + "\n";
    if (now.compare(printed, echo.size(), echo) == 0) return printed + echo.size();
    return printed;
}

namespace {

void add_verbose(po::Parser &p) { p.add("verbose", 0, "log engine decisions", true, 0, 0); }

void apply_verbose(po::Parser &p) {
    if (p.get<bool>("verbose")) jl::logger.set_verbose(true);
}

class RunCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "run"; }
    std::string_view get_desc() override {
        return "run a program, answering its input requests from the terminal";
    }
    void init_parser() override {
        parser.add("language", 'l', "python, javascript, java or c (default: from the files)", true,
                   1, 1);
        parser.add("entry", 'e', "entry file of an interpreted program", true, 1, 1);
        parser.add("project", 'p', "project id the run is recorded under", true, 1, 1);
        parser.add("dir", 'd', "run every file below this directory", true, 1, 1);
        parser.add("config", 'c', "engine configuration (YAML)", true, 1, 1);
        parser.add("explain", 'x', "write the explain request of a failed run here", true, 1, 1);
        add_verbose(parser);
        parser.set_positional("[files...]", 0, po::_size_inf);
    }

    int run() override {
        apply_verbose(parser);
        Engine engine(load_conf(parser.get<std::string>("config", "")));

        exec_request_t req;
        req.language = parser.get<std::string>("language", "");
        if (parser.get<bool>("entry")) req.entry_file = parser.get<std::string>("entry");
        const auto dir = parser.get<std::string>("dir", "");
        if (!dir.empty()) {
            req.files = collect_files(dir);
            req.project_id = fs::absolute(dir).lexically_normal().filename().string();
        }
        auto more = read_sources(parser.positional());
        req.files.insert(req.files.end(), more.begin(), more.end());
        if (req.project_id.empty()) req.project_id = "cli";
        req.project_id = parser.get<std::string>("project", req.project_id);
        if (req.files.empty()) throw RunboxError("no files to run (give files or --dir)");

        auto res = engine.execute(req);
        std::size_t out_shown = 0, err_shown = 0;
        auto show = [&] {
            const std::string_view out(res.out_data), err(res.err_data);
            std::cout << out.substr(std::min(out_shown, out.size())) << std::flush;
            std::cerr << err.substr(std::min(err_shown, err.size()));
            out_shown = res.out_data.size();
            err_shown = res.err_data.size();
        };
        show();
        while (res.state == exec_state_t::_waiting_for_input) {
            const auto id = *res.session_id;
            std::string line;
            if (!std::getline(std::cin, line)) {
                res = engine.cancel(id);
                show();
                break;
            }
            const bool prompted = looks_like_prompt(res.out_data);
            res = engine.resume(id, line);
            // the terminal already echoed what was typed
            if (prompted) out_shown = skip_echo(res.out_data, out_shown, line);
            show();
        }
        if (!res.err_data.empty() && res.err_data.back() != '\n') std::cerr << "\n";

        jl::logger.println(RUNBOX_FMT("{}, exit code {}, {} ms{}"), state_to_str(res.state),
                           res.exit_code.value_or(-1), res.execution_time_ms,
                           res.compile_error.value_or(false) ? ", compile error" : "");
        const auto explain = parser.get<std::string>("explain", "");
        if (!explain.empty()) {
            std::string why;
            auto lang = engine.resolve_language(req, why);
            if (auto ex = lang ? make_explain_request(res, req, *lang) : std::nullopt) {
                if (!write_file(explain, explain_request_to_yaml(*ex))) {
                    throw RunboxError("cannot write " + explain);
                }
            }
        }
        return res.exit_code.value_or(_exit_failure);
    }
};

class PhaseCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "phase"; }
    std::string_view get_desc() override { return "show how a set of files would be built"; }
    void init_parser() override {
        parser.add("language", 'l', "python, javascript, java or c (default: from the files)", true,
                   1, 1);
        parser.add("entry", 'e', "entry file of an interpreted program", true, 1, 1);
        parser.set_positional("<files...>", 1, po::_size_inf);
    }

    int run() override {
        exec_request_t req;
        req.language = parser.get<std::string>("language", "");
        if (parser.get<bool>("entry")) req.entry_file = parser.get<std::string>("entry");
        req.files = read_sources(parser.positional());
        auto conf = default_engine_conf();
        conf.sessions.reaper_interval_ms = 0;
        const Engine engine(std::move(conf));
        auto ph = engine.detect(req);
        std::cout << ph.to_str() << std::endl;
        return ph.has_phase() ? 0 : 1;
    }
};

class HistoryCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "history"; }
    std::string_view get_desc() override { return "list the recorded runs of a project"; }
    void init_parser() override {
        parser.add("project", 'p', "project id", false, 1, 1);
        parser.add("config", 'c', "engine configuration (YAML)", true, 1, 1);
        parser.add("count", 'n', "show at most this many runs", true, 1, 1);
    }

    int run() override {
        auto conf = load_conf(parser.get<std::string>("config", ""));
        if (conf.history.file.empty()) {
            jl::logger.warn(RUNBOX_FMT("history.file is not set, nothing was kept"));
        }
        const RunHistory history(conf.history);
        const auto runs = history.list(parser.get<std::string>("project"));
        const auto count = parser.get<std::size_t>("count", runs.size());
        for (std::size_t i = 0; i < runs.size() && i < count; i++) {
            const auto &r = runs[i];
            const std::time_t at = static_cast<std::time_t>(r.executed_at / 1000);
            char when[32];
            std::strftime(when, sizeof(when), "%F %T", std::localtime(&at));
            std::cout << fmt::format(RUNBOX_FMT("{}  {}  {:<7}  {:<10}  {:>6} ms  {}"), r.id, when,
                                     run_status_to_str(r.status), language_to_str(r.language),
                                     r.execution_time_ms, r.entry_file)
                      << std::endl;
        }
        return 0;
    }
};

class CheckCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "check"; }
    std::string_view get_desc() override { return "check which languages can run here"; }
    void init_parser() override {
        parser.add("config", 'c', "engine configuration (YAML)", true, 1, 1);
        add_verbose(parser);
    }

    int run() override {
        apply_verbose(parser);
        auto conf = load_conf(parser.get<std::string>("config", ""));
        conf.sessions.reaper_interval_ms = 0;
        Engine engine(std::move(conf));
        int ret = 0;
        for (auto l : _all_languages) {
            auto problem = engine.check(l);
            std::cout << fmt::format(RUNBOX_FMT("{:<11} {:<10} {}"), language_to_str(l),
                                     backend_to_str(engine.conf().lang(l).backend),
                                     problem ? "unavailable: " + *problem : std::string("ok"))
                      << std::endl;
            if (problem) ret = 1;
        }
        return ret;
    }
};

class VersionCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "version"; }
    std::string_view get_desc() override { return "show version"; }
    void init_parser() override {}

    int run() override {
        std::cout << fmt::format(RUNBOX_FMT("runbox version {} build {}"), RUNBOX_VERSION,
                                 RUNBOX_VERSION_BUILD)
                  << std::endl;
        return 0;
    }
};

}  // namespace

int CliHandler::run(int argc, char **argv) {
    try {
        return run_throw(argc, argv);
    } catch (std::exception &e) {
        jl::logger.println(RUNBOX_FMT("{}"), e.what());
        return 2;
    }
}

int CliHandler::run_throw(int argc, char **argv) {
    handler_.set_name("runbox");
    handler_.add_command(std::make_unique<RunCommand>());
    handler_.add_command(std::make_unique<PhaseCommand>());
    handler_.add_command(std::make_unique<HistoryCommand>());
    handler_.add_command(std::make_unique<CheckCommand>());
    handler_.add_command(std::make_unique<VersionCommand>());
    auto [name, ret] = handler_.parse(argc, argv);
    return ret;
}

}  // namespace runbox::cli
