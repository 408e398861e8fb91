//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"
#include "sandbox.h"

namespace runbox {

enum class backend_kind_t : std::int8_t { _process, _container, _browser };

std::string backend_to_str(backend_kind_t b);
std::optional<backend_kind_t> to_backend(std::string_view s);

// Toolchain and limits of one language
struct lang_conf_t {
    backend_kind_t backend = backend_kind_t::_process;
    std::string image;
    tm_usage_t build_timeout_ms = 10000;
    tm_usage_t run_timeout_ms = 5000;
    std::size_t output_limit = 10000;
    // 0 for no limit
    long memory_limit_mb = 0;
    std::vector<std::string> eof_markers;
    std::vector<std::string> env;
    // compile builds the whole program (javac, single-file gcc); compile_object
    // and link build multi-file C
    CommandTemplate compile, compile_object, link, run;
};

struct session_conf_t {
    std::size_t capacity = 64;
    tm_usage_t lifetime_ms = 300000;
    // 0 disables the background reaper
    tm_usage_t reaper_interval_ms = 1000;
    int max_concurrent = 4;
    tm_usage_t admission_wait_ms = 10000;
};

struct history_conf_t {
    std::size_t capacity = 20;
    // empty keeps history in memory only
    std::string file;
};

struct engine_conf_t {
    bool production = false;
    fs::path workspace_root;
    std::string log_file;
    history_conf_t history;
    session_conf_t sessions;
    detection_conf_t detection;
    container_conf_t container;
    std::map<language_t, lang_conf_t> languages;

    const lang_conf_t &lang(language_t l) const { return languages.at(l); }
};

// Built-in toolchain defaults for `lang` when run by `backend`
lang_conf_t default_lang_conf(language_t lang, backend_kind_t backend);
engine_conf_t default_engine_conf();

// Throws ConfigError naming `source_name`
engine_conf_t parse_engine_conf(std::string_view yaml_text, std::string_view source_name);
engine_conf_t load_engine_conf(const fs::path &file);

}  // namespace runbox
