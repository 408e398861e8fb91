//
// Copyright (c) 2024-2025 JLGxy
//

#include "run_history.h"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "runbox_logs.h"

namespace runbox {

std::string run_status_to_str(run_status_t s) {
    return s == run_status_t::_success ? "success" : "failed";
}

std::optional<run_status_t> to_run_status(std::string_view s) {
    if (s == "success") return run_status_t::_success;
    if (s == "failed") return run_status_t::_failed;
    return std::nullopt;
}

run_entry_t make_run_entry(const exec_result_t &res, std::string project_id, language_t lang,
                           std::string entry_file) {
    run_entry_t e;
    e.project_id = std::move(project_id);
    e.language = lang;
    e.entry_file = std::move(entry_file);
    e.status = res.state == exec_state_t::_completed ? run_status_t::_success
                                                      : run_status_t::_failed;
    e.execution_time_ms = res.execution_time_ms;
    e.out_data = res.out_data;
    if (!res.err_data.empty()) e.err_data = res.err_data;
    return e;
}

RunHistory::RunHistory(history_conf_t conf) : conf_(std::move(conf)) {
    if (conf_.capacity == 0) conf_.capacity = 1;
    if (!conf_.file.empty()) load();
}

RunHistory::ring_t &RunHistory::ring_of(std::string_view project_id) {
    auto it = rings_.find(project_id);
    if (it == rings_.end()) {
        it = rings_.emplace(std::string(project_id), ring_t(conf_.capacity)).first;
    }
    return it->second;
}

run_entry_t RunHistory::append(run_entry_t entry) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    entry.executed_at = now;
    entry.id = fmt::format(RUNBOX_FMT("run_{}_{}"), now, randstr(9));
    if (entry.err_data && entry.err_data->empty()) entry.err_data.reset();

    const std::lock_guard lk(lock_);
    // the oldest entry falls off the back of a full ring
    ring_of(entry.project_id).push_back(entry);
    save();
    return entry;
}

std::vector<run_entry_t> RunHistory::list(std::string_view project_id) const {
    const std::lock_guard lk(lock_);
    auto it = rings_.find(project_id);
    if (it == rings_.end()) return {};
    return {it->second.rbegin(), it->second.rend()};
}

std::optional<run_entry_t> RunHistory::find(std::string_view project_id,
                                            std::string_view run_id) const {
    const std::lock_guard lk(lock_);
    auto it = rings_.find(project_id);
    if (it == rings_.end()) return std::nullopt;
    for (const auto &e : it->second) {
        if (e.id == run_id) return e;
    }
    return std::nullopt;
}

void RunHistory::clear(std::string_view project_id) {
    const std::lock_guard lk(lock_);
    auto it = rings_.find(project_id);
    if (it == rings_.end()) return;
    rings_.erase(it);
    save();
}

std::string RunHistory::to_yaml() const {
    const std::lock_guard lk(lock_);
    return to_yaml_locked();
}

std::string RunHistory::to_yaml_locked() const {
    YAML::Emitter em;
    em << YAML::BeginMap << YAML::Key << "projects" << YAML::Value << YAML::BeginMap;
    for (const auto &[project, ring] : rings_) {
        em << YAML::Key << project << YAML::Value << YAML::BeginSeq;
        for (const auto &e : ring) {
            em << YAML::BeginMap;
            em << YAML::Key << "id" << YAML::Value << e.id;
            em << YAML::Key << "language" << YAML::Value << language_to_str(e.language);
            em << YAML::Key << "entry_file" << YAML::Value << e.entry_file;
            em << YAML::Key << "status" << YAML::Value << run_status_to_str(e.status);
            em << YAML::Key << "execution_time_ms" << YAML::Value << e.execution_time_ms;
            em << YAML::Key << "stdout" << YAML::Value << e.out_data;
            if (e.err_data) {
                em << YAML::Key << "stderr" << YAML::Value << *e.err_data;
            }
            em << YAML::Key << "executed_at" << YAML::Value << e.executed_at;
            em << YAML::EndMap;
        }
        em << YAML::EndSeq;
    }
    em << YAML::EndMap << YAML::EndMap;
    return std::string(em.c_str()) + "\n";
}

void RunHistory::load() {
    const fs::path file(conf_.file);
    std::error_code ec;
    if (!fs::exists(file, ec)) return;
    try {
        YAML::Node node = YAML::LoadFile(file.string());
        std::size_t count = 0;
        for (const auto &pnode : node["projects"]) {
            const auto project = pnode.first.as<std::string>();
            auto &ring = ring_of(project);
            for (const auto &enode : pnode.second) {
                run_entry_t e;
                e.project_id = project;
                e.id = enode["id"].as<std::string>();
                auto lang = to_language(enode["language"].as<std::string>());
                auto status = to_run_status(enode["status"].as<std::string>());
                if (!lang || !status) {
                    jl::logger.warn(RUNBOX_FMT("{}: skipping unreadable run {}"), conf_.file, e.id);
                    continue;
                }
                e.language = *lang;
                e.status = *status;
                e.entry_file = enode["entry_file"].as<std::string>("");
                e.execution_time_ms = enode["execution_time_ms"].as<tm_usage_t>(0);
                e.out_data = enode["stdout"].as<std::string>("");
                if (enode["stderr"]) e.err_data = enode["stderr"].as<std::string>();
                e.executed_at = enode["executed_at"].as<std::int64_t>(0);
                ring.push_back(std::move(e));
                count++;
            }
        }
        jl::logger.debug(RUNBOX_FMT("loaded {} runs from {}"), count, conf_.file);
    } catch (const YAML::Exception &e) {
        jl::logger.warn(RUNBOX_FMT("cannot load run history from {}: {}"), conf_.file, e.what());
    }
}

void RunHistory::save() const {
    if (conf_.file.empty()) return;
    const fs::path file(conf_.file);
    const fs::path tmp = file.string() + ".tmp";
    std::error_code ec;
    if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
    if (!write_file(tmp, to_yaml_locked())) {
        jl::logger.warn(RUNBOX_FMT("cannot write run history to {}"), tmp.string());
        return;
    }
    fs::rename(tmp, file, ec);
    if (ec) {
        jl::logger.warn(RUNBOX_FMT("cannot replace {}: {}"), conf_.file, ec.message());
        fs::remove(tmp, ec);
    }
}

}  // namespace runbox
