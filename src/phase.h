//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "exec_core.h"

namespace runbox {

enum class phase_t : std::int8_t {
    _single_file,   // interpreted languages
    _java_single,   // one Main.java, no packages
    _java_multi,    // several .java files, no packages, Main.java required
    _java_package,  // package declarations or folders
    _c_single,
    _c_multi  // compiled to objects, then linked
};

std::string phase_to_str(phase_t ph);

struct phase_info_t {
    phase_t phase;
    // The file holding the entry point
    std::string entry;
    // Fully qualified class to launch (java)
    std::string main_class;
    // Translation units in request order
    std::vector<std::string> sources;
    std::vector<std::string> headers;

    std::string to_str() const;
};

struct phase_error_t {
    error_kind_t kind;
    std::string message;
};

// Exactly one of a phase or an error
class phase_result_t {
  public:
    static phase_result_t ok(phase_info_t info) { return phase_result_t(std::move(info)); }
    static phase_result_t fail(error_kind_t kind, std::string msg) {
        return phase_result_t(phase_error_t{kind, std::move(msg)});
    }

    bool has_phase() const { return std::holds_alternative<phase_info_t>(v_); }
    const phase_info_t &info() const { return std::get<phase_info_t>(v_); }
    const phase_error_t &error() const { return std::get<phase_error_t>(v_); }
    std::string to_str() const;

  private:
    explicit phase_result_t(phase_info_t info) : v_(std::move(info)) {}
    explicit phase_result_t(phase_error_t err) : v_(std::move(err)) {}
    std::variant<phase_info_t, phase_error_t> v_;
};

phase_result_t detect_phase(language_t lang, const std::vector<source_file_t> &files,
                            const std::optional<std::string> &entry_file = std::nullopt);

// The language with the most recognised files; ties go to the earlier language.
std::optional<language_t> infer_language(const std::vector<source_file_t> &files);

std::optional<std::string> java_package_of(std::string_view content);
bool has_java_main(std::string_view content);
// Checks that each file's directory mirrors its package declaration
std::optional<phase_error_t> check_package_layout(const std::vector<source_file_t> &files);

// Blanks out comments, string and character literals, keeping line breaks
std::string strip_c_comments(std::string_view content);
// Counts `main(...) {` definitions at file scope
int count_c_main_definitions(std::string_view content);

}  // namespace runbox
