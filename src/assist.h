//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"

namespace runbox {

// What the explain/fix assistant receives about a failed run
struct explain_request_t {
    std::string runtime_error;
    std::string execution_output;
    language_t language = language_t::_python;
    std::vector<source_file_t> files;
    bool compile_error = false;
};

// Only failed runs can be explained
std::optional<explain_request_t> make_explain_request(const exec_result_t &res,
                                                      const exec_request_t &req, language_t lang);
std::string explain_request_to_yaml(const explain_request_t &ex);

struct browser_api_t {
    std::string_view name;
    std::string_view node_alternative;
};

// Browser-only globals a script refers to, outside comments and strings
std::vector<browser_api_t> find_browser_apis(std::string_view js);
// Empty when `apis` is
std::string browser_api_note(const std::vector<browser_api_t> &apis);

}  // namespace runbox
