#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "prog_option.h"
#include "runbox_cli.h"

using namespace runbox;

namespace {

po::Parser run_parser() {
    po::Parser p;
    p.add("language", 'l', "language", true, 1, 1);
    p.add("entry", 'e', "entry file", true, 1, 1);
    p.add("project", 'p', "project id", false, 1, 1);
    p.add("count", 'n', "count", true, 1, 1);
    p.add("verbose", 0, "log more", true, 0, 0);
    p.set_positional("[files...]", 0, po::_size_inf);
    return p;
}

}  // namespace

TEST(optionParser, valuesAndPositional) {
    auto p = run_parser();
    p.parse_check(po::strvec{"run", "-lpython", "--entry=app.py", "-p", "demo", "--verbose",
                             "main.py", "--", "-odd.py"});
    EXPECT_EQ(p.get<std::string>("language"), "python");
    EXPECT_EQ(p.get<std::string>("entry"), "app.py");
    EXPECT_EQ(p.get<std::string>("project"), "demo");
    EXPECT_TRUE(p.get<bool>("verbose"));
    EXPECT_FALSE(p.get<bool>("count"));
    EXPECT_EQ(p.get<int>("count", 7), 7);
    EXPECT_EQ(p.positional(), po::strvec({"main.py", "-odd.py"}));
}
TEST(optionParser, flagDoesNotConsumeNext) {
    auto p = run_parser();
    p.parse_check(po::strvec{"run", "--verbose", "a.py", "--project", "x"});
    EXPECT_TRUE(p.get<bool>("verbose"));
    EXPECT_EQ(p.positional(), po::strvec({"a.py"}));
}
TEST(optionParser, numbers) {
    auto p = run_parser();
    p.parse_check(po::strvec{"history", "-p", "x", "-n", "12"});
    EXPECT_EQ(p.get<std::size_t>("count"), 12U);
    p.parse_check(po::strvec{"history", "-p", "x", "-n", "12abc"});
    EXPECT_THROW(p.get<int>("count"), po::InvalidArg);
}
TEST(optionParser, errors) {
    auto p = run_parser();
    EXPECT_THROW(p.parse_check(po::strvec{"run", "a.py"}), po::ArgNotFound);
    EXPECT_THROW(p.parse_check(po::strvec{"run", "-p", "x", "--colour"}), po::NotExist);
    EXPECT_THROW(p.parse_check(po::strvec{"run", "-p", "x", "-z"}), po::NotExist);
    EXPECT_THROW(p.parse_check(po::strvec{"run", "-p", "x", "-l"}), po::InvalidArg);
    EXPECT_THROW(p.parse_check(po::strvec{"run", "-p", "x", "-l", "c", "-l", "java"}),
                 po::InvalidArg);
    p.parse_check(po::strvec{"run", "-p", "x"});
    EXPECT_THROW(p.get<std::string>("language"), po::ArgNotFound);
    EXPECT_EQ(p.get<std::string>("language", ""), "");
}
TEST(optionParser, positionalBounds) {
    po::Parser p;
    p.set_positional("<files...>", 1, 2);
    EXPECT_THROW(p.parse_check(po::strvec{"phase"}), po::InvalidArg);
    EXPECT_THROW(p.parse_check(po::strvec{"phase", "a", "b", "c"}), po::InvalidArg);
    p.parse_check(po::strvec{"phase", "a"});
    EXPECT_EQ(p.positional(), po::strvec({"a"}));

    po::Parser none;
    EXPECT_THROW(none.parse_check(po::strvec{"version", "extra"}), po::InvalidArg);
}

TEST(cliEcho, skipsTypedLine) {
    const std::string now = "Name: Ann\nHello, Ann\n";
    EXPECT_EQ(cli::skip_echo(now, 6, "Ann"), 10U);
    EXPECT_EQ(cli::skip_echo(now, 6, "Bob"), 6U);
    EXPECT_EQ(cli::skip_echo("Name: ", 6, "Ann"), 6U);
}

TEST(cliSources, readFiles) {
    const auto dir = fs::temp_directory_path() / ("runbox-test-" + randstr(12));
    fs::create_directories(dir);
    const auto file = dir / "hello.py";
    ASSERT_TRUE(write_file(file, "print('hi')\n"));
    auto files = cli::read_sources({file.string()});
    ASSERT_EQ(files.size(), 1U);
    // absolute paths keep only the file name
    EXPECT_EQ(files[0].path, "hello.py");
    EXPECT_EQ(files[0].content, "print('hi')\n");
    EXPECT_THROW(cli::read_sources({(dir / "missing.py").string()}), RunboxError);
    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(cliConf, sources) {
    ::unsetenv("RUNBOX_CONFIG");
    auto conf = cli::load_conf("");
    EXPECT_EQ(conf.sessions.capacity, 64U);

    const auto file = fs::temp_directory_path() / ("runbox-test-" + randstr(12) + ".yaml");
    ASSERT_TRUE(write_file(file, "sessions:\n  capacity: 3\n"));
    EXPECT_EQ(cli::load_conf(file.string()).sessions.capacity, 3U);
    ::setenv("RUNBOX_CONFIG", file.c_str(), 1);
    EXPECT_EQ(cli::load_conf("").sessions.capacity, 3U);
    ::unsetenv("RUNBOX_CONFIG");
    std::error_code ec;
    fs::remove(file, ec);
    EXPECT_THROW(cli::load_conf(file.string()), ConfigError);
}
