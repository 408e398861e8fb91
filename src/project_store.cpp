//
// Copyright (c) 2024-2025 JLGxy
//

#include "project_store.h"

#include <algorithm>
#include <system_error>

#include "runbox_logs.h"

namespace runbox {

std::vector<source_file_t> collect_files(const fs::path &dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw RunboxError(fmt::format(RUNBOX_FMT("{} is not a directory"), dir.string()));
    }
    std::vector<source_file_t> ret;
    auto it = fs::recursive_directory_iterator(dir, ec);
    if (ec) {
        throw RunboxError(
                fmt::format(RUNBOX_FMT("cannot read {}: {}"), dir.string(), ec.message()));
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto &entry = *it;
        const auto name = entry.path().filename().string();
        if (entry.is_directory() && name.starts_with('.')) {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file()) continue;
        ret.push_back({fs::relative(entry.path(), dir).generic_string(), read_file(entry.path())});
    }
    if (ec) {
        throw RunboxError(
                fmt::format(RUNBOX_FMT("cannot read {}: {}"), dir.string(), ec.message()));
    }
    std::sort(ret.begin(), ret.end(),
              [](const source_file_t &a, const source_file_t &b) { return a.path < b.path; });
    return ret;
}

std::vector<source_file_t> DirectoryFileStore::get_files(std::string_view project_id) const {
    if (!is_safe_relative_path(project_id)) {
        throw RunboxError(fmt::format(RUNBOX_FMT("bad project id `{}`"), project_id));
    }
    const auto dir = root_ / std::string(project_id);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw RunboxError(fmt::format(RUNBOX_FMT("project `{}` not found in {}"), project_id,
                                      root_.string()));
    }
    auto files = collect_files(dir);
    jl::logger.debug(RUNBOX_FMT("project {}: {} files"), project_id, files.size());
    return files;
}

}  // namespace runbox
