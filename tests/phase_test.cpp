#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "phase.h"

using namespace runbox;

namespace {

using files_t = std::vector<source_file_t>;

const char *const _java_main = "public class Main {\n"
                               "    public static void main(String[] args) {}\n"
                               "}\n";

}  // namespace

TEST(interpretedPhase, preferredEntry) {
    const files_t files{{"util.py", "x = 1"}, {"app.py", "y = 2"}, {"main.py", "import util"}};
    auto ph = detect_phase(language_t::_python, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_single_file);
    EXPECT_EQ(ph.info().entry, "main.py");
}
TEST(interpretedPhase, firstSourceFallback) {
    const files_t files{{"README.md", "# hi"}, {"helper.py", "pass"}, {"other.py", "pass"}};
    auto ph = detect_phase(language_t::_python, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().entry, "helper.py");
}
TEST(interpretedPhase, javascriptIndex) {
    const files_t files{{"lib/math.js", "module.exports = {}"}, {"index.js", "console.log(1)"}};
    auto ph = detect_phase(language_t::_javascript, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().entry, "index.js");
}
TEST(interpretedPhase, explicitEntry) {
    const files_t files{{"main.py", "pass"}, {"tools/run.py", "pass"}, {"notes.txt", ""}};
    auto ph = detect_phase(language_t::_python, files, std::string("./tools/run.py"));
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().entry, "tools/run.py");

    auto missing = detect_phase(language_t::_python, files, std::string("gone.py"));
    ASSERT_FALSE(missing.has_phase());
    EXPECT_EQ(missing.error().kind, error_kind_t::_request);
    EXPECT_EQ(missing.error().message, "Entry file not found: gone.py");

    auto wrong = detect_phase(language_t::_python, files, std::string("notes.txt"));
    ASSERT_FALSE(wrong.has_phase());
    EXPECT_EQ(wrong.error().kind, error_kind_t::_request);
}
TEST(interpretedPhase, noSources) {
    auto ph = detect_phase(language_t::_javascript, {{"main.py", "pass"}});
    ASSERT_FALSE(ph.has_phase());
    EXPECT_EQ(ph.error().message, "No JavaScript file found");
    auto empty = detect_phase(language_t::_python, {});
    ASSERT_FALSE(empty.has_phase());
    EXPECT_EQ(empty.error().kind, error_kind_t::_request);
}

TEST(javaPhase, singleMain) {
    auto ph = detect_phase(language_t::_java, {{"Main.java", _java_main}});
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_java_single);
    EXPECT_EQ(ph.info().main_class, "Main");
}
TEST(javaPhase, multiFile) {
    const files_t files{{"Helper.java", "class Helper {}"}, {"Main.java", _java_main}};
    auto ph = detect_phase(language_t::_java, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_java_multi);
    EXPECT_EQ(ph.info().entry, "Main.java");
    EXPECT_EQ(ph.info().sources, std::vector<std::string>({"Helper.java", "Main.java"}));
}
TEST(javaPhase, multiFileWithoutMain) {
    const files_t files{{"Helper.java", "class Helper {}"}, {"App.java", "class App {}"}};
    auto ph = detect_phase(language_t::_java, files);
    ASSERT_FALSE(ph.has_phase());
    EXPECT_EQ(ph.error().kind, error_kind_t::_compile);
    EXPECT_NE(ph.error().message.find("Main.java"), std::string::npos);
}
TEST(javaPhase, packages) {
    const files_t files{
            {"src/com/app/App.java", "package com.app;\n\npublic class App {\n"
                                     "    public static void main(String[] args) {}\n}\n"},
            {"src/com/app/util/Strings.java", "package com.app.util;\nclass Strings {}\n"}};
    auto ph = detect_phase(language_t::_java, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_java_package);
    EXPECT_EQ(ph.info().entry, "src/com/app/App.java");
    EXPECT_EQ(ph.info().main_class, "com.app.App");
    EXPECT_FALSE(check_package_layout(files).has_value());
}
TEST(javaPhase, ambiguousMain) {
    const files_t files{{"a/One.java", "package a;\n" + std::string(_java_main)},
                        {"a/Two.java", "package a;\n" + std::string(_java_main)}};
    auto ph = detect_phase(language_t::_java, files);
    ASSERT_FALSE(ph.has_phase());
    EXPECT_EQ(ph.error().kind, error_kind_t::_structural);
    EXPECT_NE(ph.error().message.find("a/One.java"), std::string::npos);
}
TEST(javaPhase, packageMismatch) {
    const files_t files{{"com/other/Main.java", "package com.app;\n" + std::string(_java_main)}};
    auto err = check_package_layout(files);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, error_kind_t::_structural);
    EXPECT_NE(err->message.find("com/app/"), std::string::npos);
}
TEST(javaPhase, packageDeclaration) {
    EXPECT_EQ(java_package_of("// header\npackage org.example.demo;\nclass A {}"),
              "org.example.demo");
    EXPECT_FALSE(java_package_of("class A {}").has_value());
    EXPECT_TRUE(has_java_main("public  static void main (String... a)"));
    EXPECT_FALSE(has_java_main("static void main(String[] a)"));
}

TEST(cPhase, singleFile) {
    auto ph = detect_phase(language_t::_c, {{"hello.c", "int main(void) { return 0; }"}});
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_c_single);
    EXPECT_EQ(ph.info().entry, "hello.c");
}
TEST(cPhase, multiFile) {
    const files_t files{{"lib/util.c", "int add(int a, int b) { return a + b; }"},
                        {"lib/util.h", "int add(int a, int b);"},
                        {"main.c", "#include \"lib/util.h\"\n"
                                   "int main(void) { return add(1, 2); }"}};
    auto ph = detect_phase(language_t::_c, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_c_multi);
    EXPECT_EQ(ph.info().entry, "main.c");
    EXPECT_EQ(ph.info().sources, std::vector<std::string>({"lib/util.c", "main.c"}));
    EXPECT_EQ(ph.info().headers, std::vector<std::string>({"lib/util.h"}));
}
TEST(cPhase, singleFileWithHeader) {
    const files_t files{{"defs.h", "#define N 3"}, {"main.c", "int main() {\n return 0;\n}"}};
    auto ph = detect_phase(language_t::_c, files);
    ASSERT_TRUE(ph.has_phase());
    EXPECT_EQ(ph.info().phase, phase_t::_c_multi);
}
TEST(cPhase, mainCount) {
    const files_t none{{"a.c", "int f(void) { return 1; }"}, {"b.c", "int g(void);"}};
    auto ph = detect_phase(language_t::_c, none);
    ASSERT_FALSE(ph.has_phase());
    EXPECT_EQ(ph.error().kind, error_kind_t::_structural);

    const files_t two{{"a.c", "int main(void) { return 1; }"}, {"b.c", "int main() { }"}};
    auto dup = detect_phase(language_t::_c, two);
    ASSERT_FALSE(dup.has_phase());
    EXPECT_EQ(dup.error().kind, error_kind_t::_structural);
    EXPECT_NE(dup.error().message.find("a.c, b.c"), std::string::npos);
}

TEST(cMainScanner, ignoresNonDefinitions) {
    EXPECT_EQ(count_c_main_definitions("int main(void);\n"), 0);
    EXPECT_EQ(count_c_main_definitions("// int main() {}\n/* int main() { } */\n"), 0);
    EXPECT_EQ(count_c_main_definitions("const char *s = \"main() {\";\n"), 0);
    EXPECT_EQ(count_c_main_definitions("#define main() {\n"), 0);
    EXPECT_EQ(count_c_main_definitions("void f(void) { int domain(void); }\n"), 0);
    EXPECT_EQ(count_c_main_definitions("int f(void) { main(); }\n"), 0);
}
TEST(cMainScanner, countsDefinitions) {
    EXPECT_EQ(count_c_main_definitions("int main(void)\n{\n    return 0;\n}\n"), 1);
    EXPECT_EQ(count_c_main_definitions("int main(int argc, char *argv[]) { return 0; }"), 1);
    EXPECT_EQ(count_c_main_definitions("int\nmain (void) {}\nint main() {}"), 2);
}
TEST(cMainScanner, stripKeepsLines) {
    const std::string src = "a /* x\ny */ b // z\n\"q\\\"\" c";
    const auto out = strip_c_comments(src);
    EXPECT_EQ(out.size(), src.size());
    EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 2);
    EXPECT_EQ(out.find('x'), std::string::npos);
    EXPECT_EQ(out.find('z'), std::string::npos);
    EXPECT_EQ(out.find('q'), std::string::npos);
    EXPECT_NE(out.find('c'), std::string::npos);
}

TEST(inferLanguage, majority) {
    EXPECT_EQ(infer_language({{"a.py", ""}, {"b.c", ""}, {"b.h", ""}}), language_t::_c);
    EXPECT_EQ(infer_language({{"Main.java", ""}, {"x.txt", ""}}), language_t::_java);
    EXPECT_EQ(infer_language({{"a.py", ""}, {"b.js", ""}}), language_t::_python);
    EXPECT_FALSE(infer_language({{"README.md", ""}}).has_value());
}
