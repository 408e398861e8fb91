//
// Copyright (c) 2024-2025 JLGxy
//

#include "assist.h"

#include <yaml-cpp/yaml.h>

#include <regex>

#include "phase.h"
#include "runbox_logs.h"

namespace runbox {

namespace {

constexpr browser_api_t _browser_apis[] = {
        {"localStorage", "the fs module, a database, or an in-memory object"},
        {"sessionStorage", "an in-memory object or environment variables"},
        {"window", "globalThis (a different API)"},
        {"document", "the jsdom package if a DOM is really needed"},
        {"navigator", "the os module or process.env"},
        {"location", "the url module"},
        {"history", "nothing; there is no navigation history in Node.js"},
};

}  // namespace

std::optional<explain_request_t> make_explain_request(const exec_result_t &res,
                                                      const exec_request_t &req, language_t lang) {
    if (res.state != exec_state_t::_failed) return std::nullopt;
    explain_request_t ex;
    ex.runtime_error = res.err_data;
    ex.execution_output = res.out_data;
    ex.language = lang;
    ex.files = req.files;
    ex.compile_error = res.compile_error.value_or(false);
    return ex;
}

std::string explain_request_to_yaml(const explain_request_t &ex) {
    YAML::Emitter em;
    em << YAML::BeginMap;
    em << YAML::Key << "runtimeError" << YAML::Value << ex.runtime_error;
    em << YAML::Key << "executionOutput" << YAML::Value << ex.execution_output;
    em << YAML::Key << "language" << YAML::Value << language_to_str(ex.language);
    em << YAML::Key << "compileError" << YAML::Value << ex.compile_error;
    em << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto &f : ex.files) {
        em << YAML::BeginMap << YAML::Key << "path" << YAML::Value << f.path;
        em << YAML::Key << "content" << YAML::Value << f.content << YAML::EndMap;
    }
    em << YAML::EndSeq << YAML::EndMap;
    return std::string(em.c_str()) + "\n";
}

std::vector<browser_api_t> find_browser_apis(std::string_view js) {
    // the C scanner understands // and /* */ comments and quoted strings too
    const std::string code = strip_c_comments(js);
    std::vector<browser_api_t> found;
    for (const auto &api : _browser_apis) {
        const std::regex re("(^|[^A-Za-z0-9_$])" + std::string(api.name) + "($|[^A-Za-z0-9_$])");
        if (std::regex_search(code, re)) found.push_back(api);
    }
    return found;
}

std::string browser_api_note(const std::vector<browser_api_t> &apis) {
    if (apis.empty()) return "";
    std::string names, alternatives;
    for (const auto &api : apis) {
        if (!names.empty()) names += ", ";
        names += api.name;
        alternatives += fmt::format(RUNBOX_FMT("\n  - {}: {}"), api.name, api.node_alternative);
    }
    return fmt::format(RUNBOX_FMT("[Browser API detected: this program uses {}, which Node.js does "
                                  "not provide. It was written for a browser; to run it here, "
                                  "replace them with:{}]"),
                       names, alternatives);
}

}  // namespace runbox
