#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <string>
#include <vector>

#include "assist.h"
#include "gtest/gtest.h"
#include "language_suite.h"
#include "settings.h"

using namespace runbox;

namespace {

launch_conf_t test_launch() {
    launch_conf_t c;
    c.work_dir = "/tmp/ws/src";
    c.scratch_dir = "/tmp/ws/build";
    return c;
}

bool contains(const std::vector<std::string> &v, const std::string &s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

TEST(engineConf, defaults) {
    auto conf = parse_engine_conf("", "empty.yaml");
    EXPECT_FALSE(conf.production);
    EXPECT_EQ(conf.languages.size(), 4U);
    EXPECT_EQ(conf.lang(language_t::_c).backend, backend_kind_t::_container);
    EXPECT_EQ(conf.lang(language_t::_c).output_limit, 100000U);
    EXPECT_EQ(conf.lang(language_t::_c).run_timeout_ms, 2000);
    EXPECT_EQ(conf.lang(language_t::_python).backend, backend_kind_t::_process);
    EXPECT_EQ(conf.lang(language_t::_python).output_limit, 10000U);
    EXPECT_EQ(conf.lang(language_t::_python).run.program, "python3");
    EXPECT_TRUE(contains(conf.lang(language_t::_python).eof_markers, "EOFError"));
    EXPECT_EQ(conf.lang(language_t::_java).compile.program, "javac");
    EXPECT_EQ(conf.sessions.capacity, 64U);
    EXPECT_EQ(conf.history.capacity, 20U);
    EXPECT_EQ(conf.detection.idle_threshold_ms, 500);
    EXPECT_TRUE(conf.history.file.empty());
}
TEST(engineConf, overrides) {
    const auto conf = parse_engine_conf(R"(
production: true
workspace_root: /srv/runbox
history:
  capacity: 5
  file: /var/lib/runbox/history.yaml
sessions:
  capacity: 8
  lifetime_ms: 60000
  max_concurrent: 2
detection:
  idle_threshold_ms: 250
  busy_cpu_ratio: 0.8
container:
  runtime: podman
  memory_mb: 64
languages:
  c:
    backend: process
  python:
    run_timeout_ms: 2000
    env:
      FOO: bar
    run: [python3, -X, utf8, "${source}"]
  js:
    backend: browser
)",
                                        "runbox.yaml");
    EXPECT_TRUE(conf.production);
    EXPECT_EQ(conf.workspace_root, fs::path("/srv/runbox"));
    EXPECT_EQ(conf.history.capacity, 5U);
    EXPECT_EQ(conf.history.file, "/var/lib/runbox/history.yaml");
    EXPECT_EQ(conf.sessions.capacity, 8U);
    EXPECT_EQ(conf.sessions.lifetime_ms, 60000);
    EXPECT_EQ(conf.sessions.max_concurrent, 2);
    EXPECT_EQ(conf.detection.idle_threshold_ms, 250);
    EXPECT_DOUBLE_EQ(conf.detection.busy_cpu_ratio, 0.8);
    EXPECT_EQ(conf.container.runtime, "podman");
    EXPECT_EQ(conf.container.memory_mb, 64);

    const auto &c = conf.lang(language_t::_c);
    EXPECT_EQ(c.backend, backend_kind_t::_process);
    EXPECT_EQ(c.output_limit, 10000U);
    EXPECT_EQ(c.link.program, "gcc");

    const auto &py = conf.lang(language_t::_python);
    EXPECT_EQ(py.run_timeout_ms, 2000);
    EXPECT_EQ(py.env, std::vector<std::string>({"FOO=bar"}));
    EXPECT_EQ(py.run.program, "python3");
    EXPECT_EQ(py.run.argvec, std::vector<std::string>({"-X", "utf8", "${source}"}));

    EXPECT_EQ(conf.lang(language_t::_javascript).backend, backend_kind_t::_browser);
}
TEST(engineConf, envAsList) {
    auto conf = parse_engine_conf("languages:\n  java:\n    env: [LANG=C.UTF-8]\n", "x");
    EXPECT_EQ(conf.lang(language_t::_java).env, std::vector<std::string>({"LANG=C.UTF-8"}));
    EXPECT_THROW(parse_engine_conf("languages:\n  java:\n    env: [LANG]\n", "x"), ConfigError);
}
TEST(engineConf, rejectsBadValues) {
    EXPECT_THROW(parse_engine_conf("[1, 2]", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("sessions: {capacity: 0}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("sessions: {lifetime_ms: -5}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("sessions: {max_concurrent: 0}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("languages: {cobol: {}}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("languages: {python: {run_timeout_ms: soon}}", "x"),
                 ConfigError);
    EXPECT_THROW(parse_engine_conf("languages: {python: {backend: moon}}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("languages: {python: {run: []}}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("languages: {python: {output_limit: 0}}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("history: {capacity: [1]}", "x"), ConfigError);
    EXPECT_THROW(parse_engine_conf("key: [unclosed", "x"), ConfigError);
}
TEST(engineConf, errorNamesSource) {
    try {
        parse_engine_conf("sessions: {capacity: 0}", "deploy/runbox.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("deploy/runbox.yaml"), std::string::npos);
        EXPECT_NE(what.find("sessions.capacity"), std::string::npos);
    }
}
TEST(engineConf, missingFile) {
    EXPECT_THROW(load_engine_conf("/nonexistent/runbox.yaml"), ConfigError);
}
TEST(engineConf, backendNames) {
    EXPECT_EQ(to_backend("Docker"), backend_kind_t::_container);
    EXPECT_EQ(to_backend("process"), backend_kind_t::_process);
    EXPECT_FALSE(to_backend("vm").has_value());
    EXPECT_EQ(backend_to_str(backend_kind_t::_browser), "browser");
}

TEST(languageSuite, interpretedRun) {
    const auto suite = make_suite(language_t::_python,
                                  default_lang_conf(language_t::_python, backend_kind_t::_process));
    EXPECT_FALSE(suite->compiled());
    auto ph = suite->detect({{"app/main.py", "print(1)"}}, std::nullopt);
    ASSERT_TRUE(ph.has_phase());
    auto run = suite->prepare_run(ph.info(), test_launch(), detection_conf_t{});
    EXPECT_EQ(run.launch.argv, std::vector<std::string>({"python3", "-u", "app/main.py"}));
    EXPECT_TRUE(run.launch.interactive);
    EXPECT_EQ(run.watch.time_lim_ms, 5000);
    EXPECT_TRUE(run.watch.detect_input);
    EXPECT_TRUE(run.watch.build_sentinel.empty());
    EXPECT_TRUE(contains(run.watch.eof_markers, "EOFError"));
}
TEST(languageSuite, javaClasspath) {
    phase_info_t info{phase_t::_java_single, "Main.java", "Main", {"Main.java"}, {}};
    const auto local = make_suite(language_t::_java,
                                  default_lang_conf(language_t::_java, backend_kind_t::_process));
    EXPECT_TRUE(local->compiled());
    EXPECT_EQ(local->prepare_run(info, test_launch(), {}).launch.argv,
              std::vector<std::string>({"java", "-cp", ".", "Main"}));

    const auto boxed = make_suite(language_t::_java,
                                  default_lang_conf(language_t::_java, backend_kind_t::_container));
    EXPECT_EQ(boxed->prepare_run(info, test_launch(), {}).launch.argv,
              std::vector<std::string>({"java", "-cp", "${scratch}", "Main"}));

    info.phase = phase_t::_java_package;
    info.main_class = "com.app.Main";
    EXPECT_EQ(local->prepare_run(info, test_launch(), {}).launch.argv,
              std::vector<std::string>({"java", "-cp", "${scratch}", "com.app.Main"}));
}
TEST(languageSuite, cMultiFileSteps) {
    const CSuite suite(language_t::_c, default_lang_conf(language_t::_c, backend_kind_t::_process));
    const phase_info_t info{phase_t::_c_multi, "main.c", "", {"main.c", "lib/util.c"},
                            {"lib/util.h"}};
    auto steps = suite.multi_file_steps(info);
    ASSERT_EQ(steps.size(), 3U);
    EXPECT_EQ(steps[0].argv, std::vector<std::string>({"gcc", "-c", "main.c", "-o",
                                                       "${scratch}/0_main.o", "-I.", "-Ilib"}));
    EXPECT_EQ(steps[1].argv, std::vector<std::string>({"gcc", "-c", "lib/util.c", "-o",
                                                       "${scratch}/1_util.o", "-I.", "-Ilib"}));
    EXPECT_EQ(steps[2].argv,
              std::vector<std::string>({"gcc", "${scratch}/0_main.o", "${scratch}/1_util.o", "-o",
                                        "${scratch}/main", "-lm"}));

    auto run = suite.prepare_run(info, test_launch(), {});
    EXPECT_EQ(run.launch.argv,
              std::vector<std::string>({"stdbuf", "-o0", "-e0", "${scratch}/main"}));
    EXPECT_TRUE(run.watch.build_sentinel.empty());
}
TEST(languageSuite, cSingleFileScript) {
    const CSuite suite(language_t::_c, default_lang_conf(language_t::_c, backend_kind_t::_process));
    const phase_info_t info{phase_t::_c_single, "hello.c", "", {"hello.c"}, {}};
    const auto script = suite.single_file_script(info, "@@built@@");
    EXPECT_EQ(script, "gcc hello.c -o '${scratch}/main' -lm || exit $?\n"
                      "printf '%s\\n' @@built@@ >&2\n"
                      "exec stdbuf -o0 -e0 '${scratch}/main'\n");

    auto run = suite.prepare_run(info, test_launch(), {});
    ASSERT_EQ(run.launch.argv.size(), 3U);
    EXPECT_EQ(run.launch.argv[0], "sh");
    EXPECT_EQ(run.launch.argv[1], "-c");
    EXPECT_TRUE(run.watch.build_sentinel.starts_with("@@runbox-built-"));
    EXPECT_NE(run.launch.argv[2].find(run.watch.build_sentinel), std::string::npos);
    EXPECT_EQ(run.watch.build_time_lim_ms, 5000);
    EXPECT_EQ(run.watch.time_lim_ms, 2000);
}

TEST(browserApis, detection) {
    auto apis = find_browser_apis("// localStorage is not used\n"
                                  "const s = 'window';\n"
                                  "const mywindow = 1;\n"
                                  "console.log(document.title, navigator.userAgent);\n");
    ASSERT_EQ(apis.size(), 2U);
    EXPECT_EQ(apis[0].name, "document");
    EXPECT_EQ(apis[1].name, "navigator");
    EXPECT_TRUE(find_browser_apis("console.log(process.argv)").empty());
}
TEST(browserApis, note) {
    EXPECT_EQ(browser_api_note({}), "");
    auto note = browser_api_note(find_browser_apis("localStorage.setItem('a', 1)"));
    EXPECT_TRUE(note.starts_with("[Browser API detected"));
    EXPECT_NE(note.find("localStorage"), std::string::npos);
    EXPECT_TRUE(note.ends_with("]"));
}

TEST(explainRequest, onlyFailures) {
    exec_request_t req;
    req.files = {{"main.py", "print(1/0)"}};
    exec_result_t ok;
    ok.state = exec_state_t::_completed;
    EXPECT_FALSE(make_explain_request(ok, req, language_t::_python).has_value());

    auto bad = failed_result(error_kind_t::_compile, "main.c:1: error: expected ';'");
    bad.out_data = "partial";
    auto ex = make_explain_request(bad, req, language_t::_c);
    ASSERT_TRUE(ex.has_value());
    EXPECT_TRUE(ex->compile_error);

    auto node = YAML::Load(explain_request_to_yaml(*ex));
    EXPECT_EQ(node["runtimeError"].as<std::string>(), "main.c:1: error: expected ';'");
    EXPECT_EQ(node["executionOutput"].as<std::string>(), "partial");
    EXPECT_EQ(node["language"].as<std::string>(), "c");
    EXPECT_TRUE(node["compileError"].as<bool>());
    ASSERT_EQ(node["files"].size(), 1U);
    EXPECT_EQ(node["files"][0]["path"].as<std::string>(), "main.py");
    EXPECT_EQ(node["files"][0]["content"].as<std::string>(), "print(1/0)");
}
