//
// Copyright (c) 2024-2025 JLGxy
//

#include "phase.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "runbox_logs.h"

namespace runbox {

std::string phase_to_str(phase_t ph) {
    switch (ph) {
        case phase_t::_single_file: return "single-file";
        case phase_t::_java_single: return "java-phase-1";
        case phase_t::_java_multi: return "java-phase-2";
        case phase_t::_java_package: return "java-phase-3";
        case phase_t::_c_single: return "c-phase-1";
        case phase_t::_c_multi: return "c-phase-3.5";
    }
    return "unknown";
}

std::string phase_info_t::to_str() const {
    std::string ret = fmt::format(RUNBOX_FMT("{} entry={}"), phase_to_str(phase), entry);
    if (!main_class.empty()) ret += " class=" + main_class;
    if (!sources.empty()) ret += fmt::format(RUNBOX_FMT(" sources={}"), sources.size());
    if (!headers.empty()) ret += fmt::format(RUNBOX_FMT(" headers={}"), headers.size());
    return ret;
}

std::string phase_result_t::to_str() const {
    if (has_phase()) return info().to_str();
    return error_kind_to_str(error().kind) + ": " + error().message;
}

namespace {

std::string file_name_of(std::string_view path) {
    auto n = normalize_path(path);
    auto pos = n.rfind('/');
    return pos == std::string::npos ? n : n.substr(pos + 1);
}

std::string dir_of(std::string_view path) {
    auto n = normalize_path(path);
    auto pos = n.rfind('/');
    return pos == std::string::npos ? std::string{} : n.substr(0, pos);
}

bool has_ext(std::string_view path, std::string_view ext) {
    return normalize_path(path).ends_with(ext);
}

std::string join_names(const std::vector<std::string> &v) {
    std::string ret;
    for (const auto &s : v) {
        if (!ret.empty()) ret += ", ";
        ret += s;
    }
    return ret;
}

phase_result_t detect_interpreted(language_t lang, const std::vector<source_file_t> &files,
                                  const std::optional<std::string> &entry_file) {
    const bool is_py = lang == language_t::_python;
    const std::string lang_name = is_py ? "Python" : "JavaScript";
    auto is_source = [&](std::string_view path) {
        if (is_py) return has_ext(path, ".py");
        return has_ext(path, ".js") || has_ext(path, ".mjs") || has_ext(path, ".cjs");
    };

    phase_info_t info{phase_t::_single_file, "", "", {}, {}};
    if (entry_file.has_value()) {
        const auto want = normalize_path(*entry_file);
        auto it = std::ranges::find_if(
                files, [&](const source_file_t &f) { return normalize_path(f.path) == want; });
        if (it == files.end()) {
            return phase_result_t::fail(error_kind_t::_request,
                                        "Entry file not found: " + *entry_file);
        }
        if (!is_source(want)) {
            return phase_result_t::fail(
                    error_kind_t::_request,
                    fmt::format(RUNBOX_FMT("Entry file {} is not a {} source file"), *entry_file,
                                lang_name));
        }
        info.entry = want;
        info.sources.push_back(want);
        return phase_result_t::ok(std::move(info));
    }

    const std::vector<std::string> preferred =
            is_py ? std::vector<std::string>{"main.py", "app.py"}
                  : std::vector<std::string>{"main.js", "app.js", "index.js"};
    for (const auto &name : preferred) {
        auto it = std::ranges::find_if(
                files, [&](const source_file_t &f) { return file_name_of(f.path) == name; });
        if (it != files.end()) {
            info.entry = normalize_path(it->path);
            info.sources.push_back(info.entry);
            return phase_result_t::ok(std::move(info));
        }
    }
    auto it = std::ranges::find_if(files,
                                   [&](const source_file_t &f) { return is_source(f.path); });
    if (it == files.end()) {
        return phase_result_t::fail(error_kind_t::_request,
                                    fmt::format(RUNBOX_FMT("No {} file found"), lang_name));
    }
    info.entry = normalize_path(it->path);
    info.sources.push_back(info.entry);
    return phase_result_t::ok(std::move(info));
}

phase_result_t detect_java(const std::vector<source_file_t> &files) {
    std::vector<const source_file_t *> javas;
    for (const auto &f : files) {
        if (has_ext(f.path, ".java")) javas.push_back(&f);
    }
    if (javas.empty()) return phase_result_t::fail(error_kind_t::_request, "No Java file found");

    phase_info_t info{phase_t::_java_single, "", "", {}, {}};
    for (const auto *f : javas) info.sources.push_back(normalize_path(f->path));

    const bool structured = std::ranges::any_of(javas, [](const source_file_t *f) {
        return normalize_path(f->path).find('/') != std::string::npos ||
               java_package_of(f->content).has_value();
    });
    if (structured) {
        std::vector<const source_file_t *> mains;
        for (const auto *f : javas) {
            if (has_java_main(f->content)) mains.push_back(f);
        }
        if (mains.empty()) {
            return phase_result_t::fail(
                    error_kind_t::_structural,
                    "No main method found: exactly one class must declare "
                    "`public static void main(String[] args)`");
        }
        if (mains.size() > 1) {
            std::vector<std::string> names;
            for (const auto *f : mains) names.push_back(normalize_path(f->path));
            return phase_result_t::fail(
                    error_kind_t::_structural,
                    fmt::format(RUNBOX_FMT("Multiple main methods found ({}): the entry point is "
                                           "ambiguous, keep `main` in exactly one class"),
                                join_names(names)));
        }
        info.phase = phase_t::_java_package;
        info.entry = normalize_path(mains.front()->path);
        auto stem = fs::path(info.entry).stem().string();
        auto pkg = java_package_of(mains.front()->content);
        info.main_class = pkg ? *pkg + "." + stem : stem;
        return phase_result_t::ok(std::move(info));
    }

    auto is_main_java = [](const source_file_t *f) { return file_name_of(f->path) == "Main.java"; };
    if (javas.size() == 1 && is_main_java(javas.front())) {
        info.phase = phase_t::_java_single;
        info.entry = normalize_path(javas.front()->path);
        info.main_class = "Main";
        return phase_result_t::ok(std::move(info));
    }
    auto it = std::ranges::find_if(javas, is_main_java);
    if (it == javas.end()) {
        return phase_result_t::fail(error_kind_t::_compile,
                                    "Main.java not found: a Java project without packages needs a "
                                    "Main.java whose class declares the main method");
    }
    info.phase = phase_t::_java_multi;
    info.entry = normalize_path((*it)->path);
    info.main_class = "Main";
    return phase_result_t::ok(std::move(info));
}

phase_result_t detect_c(const std::vector<source_file_t> &files) {
    std::vector<const source_file_t *> units;
    phase_info_t info{phase_t::_c_single, "", "", {}, {}};
    for (const auto &f : files) {
        if (has_ext(f.path, ".c")) {
            units.push_back(&f);
            info.sources.push_back(normalize_path(f.path));
        } else if (has_ext(f.path, ".h")) {
            info.headers.push_back(normalize_path(f.path));
        }
    }
    if (units.empty()) return phase_result_t::fail(error_kind_t::_request, "No C file found");
    if (units.size() == 1 && info.headers.empty()) {
        info.entry = info.sources.front();
        return phase_result_t::ok(std::move(info));
    }

    std::vector<std::string> mains;
    int total = 0;
    for (const auto *f : units) {
        int cnt = count_c_main_definitions(f->content);
        if (cnt > 0) mains.push_back(normalize_path(f->path));
        total += cnt;
    }
    if (total == 0) {
        return phase_result_t::fail(error_kind_t::_structural,
                                    "No main() function found in any .c file: exactly one file "
                                    "must define `int main(...)`");
    }
    if (total > 1) {
        return phase_result_t::fail(
                error_kind_t::_structural,
                fmt::format(RUNBOX_FMT("Multiple main() definitions found in: {}. Exactly one .c "
                                       "file may define main"),
                            join_names(mains)));
    }
    info.phase = phase_t::_c_multi;
    info.entry = mains.front();
    return phase_result_t::ok(std::move(info));
}

}  // namespace

phase_result_t detect_phase(language_t lang, const std::vector<source_file_t> &files,
                            const std::optional<std::string> &entry_file) {
    if (files.empty()) return phase_result_t::fail(error_kind_t::_request, "No files to execute");
    switch (lang) {
        case language_t::_python:
        case language_t::_javascript: return detect_interpreted(lang, files, entry_file);
        case language_t::_java: return detect_java(files);
        case language_t::_c: return detect_c(files);
    }
    return phase_result_t::fail(error_kind_t::_request, "Unsupported language");
}

std::optional<language_t> infer_language(const std::vector<source_file_t> &files) {
    std::array<int, std::size(_all_languages)> cnt{};
    for (const auto &f : files) {
        if (has_ext(f.path, ".py"))
            cnt[0]++;
        else if (has_ext(f.path, ".js") || has_ext(f.path, ".mjs"))
            cnt[1]++;
        else if (has_ext(f.path, ".java"))
            cnt[2]++;
        else if (has_ext(f.path, ".c") || has_ext(f.path, ".h"))
            cnt[3]++;
    }
    auto it = std::max_element(cnt.begin(), cnt.end());
    if (*it == 0) return std::nullopt;
    return _all_languages[it - cnt.begin()];
}

std::optional<std::string> java_package_of(std::string_view content) {
    static const std::regex package_re(R"(^\s*package\s+(\S+?)\s*;)");
    std::size_t lst = 0;
    while (lst <= content.size()) {
        auto ed = content.find('\n', lst);
        if (ed == std::string_view::npos) ed = content.size();
        std::string line(content.substr(lst, ed - lst));
        std::smatch m;
        if (std::regex_search(line, m, package_re)) return m[1].str();
        lst = ed + 1;
    }
    return std::nullopt;
}

bool has_java_main(std::string_view content) {
    static const std::regex main_re(R"(public\s+static\s+void\s+main\s*\()");
    return std::regex_search(content.begin(), content.end(), main_re);
}

std::optional<phase_error_t> check_package_layout(const std::vector<source_file_t> &files) {
    for (const auto &f : files) {
        if (!has_ext(f.path, ".java")) continue;
        auto pkg = java_package_of(f.content);
        if (!pkg) continue;
        std::string want = *pkg;
        std::replace(want.begin(), want.end(), '.', '/');
        const auto dir = dir_of(f.path);
        // a source root such as src/ may precede the package folders
        if (dir == want || dir.ends_with("/" + want)) continue;
        const auto name = file_name_of(f.path);
        return phase_error_t{
                error_kind_t::_structural,
                fmt::format(RUNBOX_FMT("Package/folder mismatch: {} declares `package {};` so it "
                                       "must live in a `{}/` folder (expected {}/{}, found {})"),
                            name, *pkg, want, want, name, normalize_path(f.path))};
    }
    return std::nullopt;
}

std::string strip_c_comments(std::string_view content) {
    std::string ret(content);
    enum class st_t : std::int8_t { _code, _line, _block, _str, _chr } st = st_t::_code;
    for (std::size_t i = 0; i < ret.size(); i++) {
        char c = ret[i];
        char nx = i + 1 < ret.size() ? ret[i + 1] : '\0';
        switch (st) {
            case st_t::_code:
                if (c == '/' && nx == '/') {
                    st = st_t::_line;
                    ret[i] = ret[i + 1] = ' ';
                    i++;
                } else if (c == '/' && nx == '*') {
                    st = st_t::_block;
                    ret[i] = ret[i + 1] = ' ';
                    i++;
                } else if (c == '"') {
                    st = st_t::_str;
                } else if (c == '\'') {
                    st = st_t::_chr;
                }
                break;
            case st_t::_line:
                if (c == '\n')
                    st = st_t::_code;
                else
                    ret[i] = ' ';
                break;
            case st_t::_block:
                if (c == '*' && nx == '/') {
                    st = st_t::_code;
                    ret[i] = ret[i + 1] = ' ';
                    i++;
                } else if (c != '\n') {
                    ret[i] = ' ';
                }
                break;
            case st_t::_str:
            case st_t::_chr:
                if (c == '\\' && i + 1 < ret.size()) {
                    ret[i] = ' ';
                    if (ret[i + 1] != '\n') ret[i + 1] = ' ';
                    i++;
                } else if ((st == st_t::_str && c == '"') || (st == st_t::_chr && c == '\'')) {
                    st = st_t::_code;
                } else if (c == '\n') {
                    st = st_t::_code;
                } else {
                    ret[i] = ' ';
                }
                break;
        }
    }
    return ret;
}

int count_c_main_definitions(std::string_view content) {
    auto code = strip_c_comments(content);
    // drop preprocessor lines, with their continuations
    bool line_start = true, in_directive = false;
    for (std::size_t i = 0; i < code.size(); i++) {
        char c = code[i];
        if (c == '\n') {
            if (!(in_directive && i > 0 && code[i - 1] == '\\')) in_directive = false;
            line_start = true;
            continue;
        }
        if (line_start && c == '#') in_directive = true;
        if (!std::isspace(static_cast<unsigned char>(c))) line_start = false;
        if (in_directive) code[i] = ' ';
    }

    auto is_ident = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
    auto skip_space = [&](std::size_t p) {
        while (p < code.size() && std::isspace(static_cast<unsigned char>(code[p]))) p++;
        return p;
    };
    int depth = 0, found = 0;
    for (std::size_t i = 0; i < code.size(); i++) {
        char c = code[i];
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (depth > 0) depth--;
        } else if (depth == 0 && code.compare(i, 4, "main") == 0 &&
                   (i == 0 || !is_ident(code[i - 1])) &&
                   (i + 4 >= code.size() || !is_ident(code[i + 4]))) {
            auto p = skip_space(i + 4);
            if (p >= code.size() || code[p] != '(') continue;
            int paren = 0;
            for (; p < code.size(); p++) {
                if (code[p] == '(') paren++;
                if (code[p] == ')' && --paren == 0) break;
            }
            if (p >= code.size()) continue;
            p = skip_space(p + 1);
            if (p < code.size() && code[p] == '{') found++;
            i += 3;
        }
    }
    return found;
}

}  // namespace runbox
