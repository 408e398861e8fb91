#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "engine.h"
#include "gtest/gtest.h"
#include "runbox_logs.h"

using namespace runbox;

namespace {

bool contains(const std::string &s, const std::string &what) {
    return s.find(what) != std::string::npos;
}

// Runs every language on the host so only the toolchains are needed
class EngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        jl::logger.set_console(false);
        root_ = fs::temp_directory_path() / ("runbox-test-" + randstr(12));
        conf_ = default_engine_conf();
        conf_.workspace_root = root_ / "ws";
        conf_.sessions.reaper_interval_ms = 0;
        conf_.sessions.lifetime_ms = 60000;
        for (auto l : _all_languages) {
            auto &lc = conf_.languages[l];
            lc = default_lang_conf(l, backend_kind_t::_process);
            lc.run_timeout_ms = 5000;
        }
    }
    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    Engine &engine() {
        if (!engine_) engine_ = std::make_unique<Engine>(conf_);
        return *engine_;
    }

    static exec_request_t request(std::string lang, std::vector<source_file_t> files) {
        exec_request_t req;
        req.language = std::move(lang);
        req.files = std::move(files);
        req.project_id = "test-project";
        return req;
    }

    fs::path root_;
    engine_conf_t conf_;
    std::unique_ptr<Engine> engine_;
};

}  // namespace

TEST_F(EngineTest, rejectsEmptyRequests) {
    auto none = engine().execute(request("python", {}));
    EXPECT_EQ(none.state, exec_state_t::_failed);
    EXPECT_EQ(none.err_data, "No files provided");
    EXPECT_EQ(none.exit_code, 1);
    EXPECT_EQ(none.error_kind, error_kind_t::_request);

    auto blank = engine().execute(request("python", {{"main.py", "  \n\t\n"}}));
    EXPECT_EQ(blank.err_data, "No code provided");

    auto lang = engine().execute(request("cobol", {{"main.cob", "DISPLAY 'HI'."}}));
    EXPECT_EQ(lang.error_kind, error_kind_t::_request);
    EXPECT_TRUE(contains(lang.err_data, "cobol"));

    auto guess = engine().execute(request("", {{"notes.txt", "hello"}}));
    EXPECT_EQ(guess.error_kind, error_kind_t::_request);
    EXPECT_TRUE(engine().history().list("test-project").empty());
}
TEST_F(EngineTest, browserBackendIsNotRunHere) {
    conf_.languages[language_t::_javascript] =
            default_lang_conf(language_t::_javascript, backend_kind_t::_browser);
    auto r = engine().execute(request("javascript", {{"main.js", "console.log(1)"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_request);
    EXPECT_TRUE(engine().check(language_t::_javascript).has_value());
}
TEST_F(EngineTest, structuralErrorsAreRecorded) {
    auto r = engine().execute(request(
            "c", {{"a.c", "int main(void) { return 0; }"}, {"b.c", "int main() { return 1; }"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_structural);
    EXPECT_EQ(r.compile_error, true);
    EXPECT_TRUE(contains(r.err_data, "Multiple main() definitions"));
    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].status, run_status_t::_failed);
}

TEST_F(EngineTest, pythonCompletes) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "print('hello')"}}));
    EXPECT_EQ(r.state, exec_state_t::_completed);
    EXPECT_EQ(r.out_data, "hello\n");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_FALSE(r.compile_error.has_value());
    EXPECT_FALSE(r.session_id.has_value());
    EXPECT_TRUE(r.is_consistent());

    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].status, run_status_t::_success);
    EXPECT_EQ(runs[0].entry_file, "main.py");
    EXPECT_EQ(runs[0].out_data, "hello\n");
    EXPECT_EQ(engine().live_sessions(), 0U);
}
TEST_F(EngineTest, pythonPromptAndContinue) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("python", {{"main.py", "name = input('Name: ')\nprint('Hello, ' + name)\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    EXPECT_EQ(r.out_data, "Name: ");
    ASSERT_TRUE(r.session_id.has_value());
    EXPECT_FALSE(r.exit_code.has_value());
    EXPECT_EQ(engine().live_sessions(), 1U);

    auto done = engine().resume(*r.session_id, "Ann");
    EXPECT_EQ(done.state, exec_state_t::_completed);
    EXPECT_EQ(done.out_data, "Name: Ann\nHello, Ann\n");
    EXPECT_EQ(done.exit_code, 0);
    EXPECT_FALSE(done.session_id.has_value());
    EXPECT_EQ(engine().live_sessions(), 0U);
    EXPECT_GE(done.execution_time_ms, r.execution_time_ms);

    auto again = engine().resume(*r.session_id, "Bob");
    EXPECT_EQ(again.state, exec_state_t::_failed);
    EXPECT_EQ(again.err_data, "Session not found or expired");
}
TEST_F(EngineTest, severalRounds) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "a = int(input('a? '))\n"
                                                             "b = int(input('b? '))\n"
                                                             "print(a + b)\n"}}));
    int rounds = 0;
    const std::vector<std::string> answers{"2", "40"};
    while (r.state == exec_state_t::_waiting_for_input && rounds < 2) {
        EXPECT_TRUE(r.is_consistent());
        r = engine().resume(*r.session_id, answers[rounds++]);
    }
    EXPECT_EQ(rounds, 2);
    EXPECT_EQ(r.state, exec_state_t::_completed);
    EXPECT_EQ(r.out_data, "a? 2\nb? 40\n42\n");
    EXPECT_TRUE(r.is_consistent());
}
TEST_F(EngineTest, inputWithoutPrompt) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "x = input()\nprint(x * 2)\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    auto done = engine().resume(*r.session_id, "ab");
    EXPECT_EQ(done.state, exec_state_t::_completed);
    EXPECT_EQ(done.out_data, "abab\n");
}
TEST_F(EngineTest, pythonRuntimeError) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "print('before')\n1 / 0\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_runtime);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.out_data, "before\n");
    EXPECT_TRUE(contains(r.err_data, "ZeroDivisionError"));
    EXPECT_FALSE(r.compile_error.has_value());
}
TEST_F(EngineTest, timeout) {
    conf_.languages[language_t::_python].run_timeout_ms = 1000;
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "while True:\n    pass\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_timeout);
    EXPECT_EQ(r.exit_code, _exit_timeout);
    EXPECT_TRUE(contains(r.err_data, "[Execution timeout after 1s]"));
}
TEST_F(EngineTest, outputIsTruncated) {
    conf_.languages[language_t::_python].output_limit = 1000;
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "print('x' * 5000)\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_completed);
    EXPECT_EQ(r.out_data.size(), 1000U);
    EXPECT_TRUE(r.out_data.ends_with(OutputBuffer::marker(1000)));
}
TEST_F(EngineTest, cancelSession) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "input('Go? ')\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    auto c = engine().cancel(*r.session_id);
    EXPECT_EQ(c.state, exec_state_t::_failed);
    EXPECT_TRUE(c.err_data.ends_with("[Execution cancelled]"));
    EXPECT_TRUE(c.is_consistent());
    EXPECT_EQ(engine().live_sessions(), 0U);
    EXPECT_EQ(engine().cancel(*r.session_id).error_kind, error_kind_t::_request);
    EXPECT_EQ(engine().history().list("test-project").size(), 1U);
}
TEST_F(EngineTest, unknownSession) {
    auto r = engine().resume("sess_doesnotexist", "1");
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_request);
    EXPECT_EQ(r.err_data, "Session not found or expired");
}
TEST_F(EngineTest, exitedSessionIsReaped) {
    conf_.detection.continuation_window_ms = 200;
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("python", {{"main.py", "import sys, time\nsys.stdout.write('Wait: ')\n"
                                           "sys.stdout.flush()\ntime.sleep(0.8)\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    while (engine().live_sessions() > 0 && engine().reap() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    EXPECT_EQ(engine().live_sessions(), 0U);
    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].status, run_status_t::_success);
}

TEST_F(EngineTest, exitedSessionIsCollected) {
    conf_.sessions.reaper_interval_ms = 100;
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("python", {{"main.py", "import sys, time\nsys.stdout.write('Wait: ')\n"
                                           "sys.stdout.flush()\ntime.sleep(0.8)\n"
                                           "print('done')\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    // the background reaper leaves it for the continuation
    EXPECT_EQ(engine().live_sessions(), 1U);

    auto c = engine().resume(*r.session_id, "x");
    EXPECT_EQ(c.state, exec_state_t::_completed);
    EXPECT_EQ(c.exit_code, 0);
    EXPECT_EQ(c.out_data, "Wait: done\n");
    EXPECT_TRUE(c.err_data.ends_with("[Process already terminated]"));
    EXPECT_TRUE(c.is_consistent());
    EXPECT_EQ(engine().live_sessions(), 0U);
    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].out_data, "Wait: done\n");
}
TEST_F(EngineTest, stdinClosed) {
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("python", {{"main.py", "import os, sys, time\nsys.stdout.write('Go: ')\n"
                                           "sys.stdout.flush()\nos.close(0)\ntime.sleep(5)\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    auto c = engine().resume(*r.session_id, "y");
    EXPECT_EQ(c.state, exec_state_t::_failed);
    EXPECT_EQ(c.error_kind, error_kind_t::_runtime);
    EXPECT_TRUE(c.err_data.ends_with("[Stdin closed]"));
    EXPECT_TRUE(c.is_consistent());
    EXPECT_EQ(engine().live_sessions(), 0U);
    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].status, run_status_t::_failed);
}
// A silent sleeper looks like a program blocked on input; only the session
// lifetime ends it
TEST_F(EngineTest, sleepingProgramWaitsUntilLifetime) {
    conf_.sessions.lifetime_ms = 1000;
    if (auto why = engine().check(language_t::_python)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("python", {{"main.py", "import time\ntime.sleep(3600)\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    EXPECT_TRUE(r.session_id.has_value());
    EXPECT_FALSE(r.exit_code.has_value());
    EXPECT_TRUE(r.is_consistent());

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(engine().reap(), 1U);
    EXPECT_EQ(engine().live_sessions(), 0U);
    auto runs = engine().history().list("test-project");
    ASSERT_EQ(runs.size(), 1U);
    EXPECT_EQ(runs[0].status, run_status_t::_failed);
    ASSERT_TRUE(runs[0].err_data.has_value());
    EXPECT_TRUE(contains(*runs[0].err_data, "[Session expired after 1s]"));
    EXPECT_EQ(engine().resume(*r.session_id, "").error_kind, error_kind_t::_request);
}

TEST_F(EngineTest, javascriptBrowserNote) {
    if (auto why = engine().check(language_t::_javascript)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("javascript", {{"main.js", "console.log(localStorage.getItem('k'))\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_runtime);
    EXPECT_TRUE(contains(r.err_data, "ReferenceError"));
    EXPECT_TRUE(contains(r.err_data, "[Browser API detected"));
}

TEST_F(EngineTest, cCompileError) {
    if (auto why = engine().check(language_t::_c)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("c", {{"main.c", "int main(void) { return 0 }\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_compile);
    EXPECT_EQ(r.compile_error, true);
    EXPECT_NE(r.exit_code, 0);
    EXPECT_TRUE(contains(r.err_data, "main.c"));
    EXPECT_TRUE(r.out_data.empty());
}
TEST_F(EngineTest, cRuntimeExitCode) {
    if (auto why = engine().check(language_t::_c)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("c", {{"main.c", "#include <stdio.h>\n"
                                     "int main(void) { printf(\"hi\\n\"); return 3; }\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_runtime);
    EXPECT_EQ(r.compile_error, false);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.out_data, "hi\n");
}
TEST_F(EngineTest, cInteractive) {
    if (auto why = engine().check(language_t::_c)) GTEST_SKIP() << *why;
    auto r = engine().execute(request("c", {{"main.c", "#include <stdio.h>\n"
                                                       "int main(void) {\n"
                                                       "    int n = 0;\n"
                                                       "    printf(\"n: \");\n"
                                                       "    if (scanf(\"%d\", &n) != 1) return 1;\n"
                                                       "    printf(\"%d\\n\", n * n);\n"
                                                       "    return 0;\n"
                                                       "}\n"}}));
    ASSERT_EQ(r.state, exec_state_t::_waiting_for_input);
    EXPECT_EQ(r.compile_error, false);
    auto done = engine().resume(*r.session_id, "7");
    EXPECT_EQ(done.state, exec_state_t::_completed);
    EXPECT_EQ(done.out_data, "n: 7\n49\n");
    EXPECT_EQ(done.compile_error, false);
}
TEST_F(EngineTest, cMultiFile) {
    if (auto why = engine().check(language_t::_c)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("c", {{"lib/add.h", "int add(int a, int b);\n"},
                          {"lib/add.c", "#include \"add.h\"\n"
                                        "int add(int a, int b) { return a + b; }\n"},
                          {"main.c", "#include <stdio.h>\n#include \"lib/add.h\"\n"
                                     "int main(void) {\n"
                                     "    printf(\"%d\\n\", add(2, 3));\n"
                                     "    return 0;\n"
                                     "}\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_completed);
    EXPECT_EQ(r.out_data, "5\n");
    EXPECT_EQ(r.compile_error, false);
}
TEST_F(EngineTest, cLinkError) {
    if (auto why = engine().check(language_t::_c)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("c", {{"util.c", "int helper(void);\n"
                                     "int twice(void) { return 2 * helper(); }\n"},
                          {"main.c", "int twice(void);\nint main(void) { return twice(); }\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.error_kind, error_kind_t::_compile);
    EXPECT_EQ(r.compile_error, true);
    EXPECT_TRUE(contains(r.err_data, "helper"));
}

TEST_F(EngineTest, javaSingleFile) {
    if (auto why = engine().check(language_t::_java)) GTEST_SKIP() << *why;
    auto r = engine().execute(
            request("java", {{"Main.java", "public class Main {\n"
                                           "    public static void main(String[] args) {\n"
                                           "        System.out.println(\"hi from java\");\n"
                                           "    }\n"
                                           "}\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_completed);
    EXPECT_EQ(r.out_data, "hi from java\n");
    EXPECT_EQ(r.compile_error, false);
}
TEST_F(EngineTest, javaPackageMismatch) {
    auto r = engine().execute(
            request("java", {{"src/Main.java", "package com.app;\npublic class Main {\n"
                                               "    public static void main(String[] a) {}\n"
                                               "}\n"}}));
    EXPECT_EQ(r.state, exec_state_t::_failed);
    EXPECT_EQ(r.compile_error, true);
    EXPECT_TRUE(contains(r.err_data, "Package/folder mismatch"));
}
