//
// Copyright (c) 2024-2025 JLGxy
//

#include "workspace.h"

#include <filesystem>
#include <string>
#include <system_error>

#include "runbox_logs.h"

namespace runbox {

Workspace::Workspace(const fs::path &root) {
    fs::create_directories(root);
    do {
        pth_ = root / ("ws-" + randstr(12));
    } while (fs::exists(pth_));
    fs::create_directories(source_dir());
    fs::create_directories(scratch_dir());
    // the container user is not the host user
    fs::permissions(scratch_dir(), fs::perms::all);
    fs::permissions(source_dir(), fs::perms::owner_all | fs::perms::group_read |
                                          fs::perms::group_exec | fs::perms::others_read |
                                          fs::perms::others_exec);
}

Workspace::~Workspace() {
    std::error_code ec;
    fs::remove_all(pth_, ec);
    if (ec) {
        jl::logger.warn(RUNBOX_FMT("failed to remove workspace {}: {}"), pth_.string(),
                        ec.message());
    }
}

std::optional<std::string> Workspace::materialize(const std::vector<source_file_t> &files) const {
    for (const auto &f : files) {
        if (!is_safe_relative_path(f.path)) return f.path;
    }
    for (const auto &f : files) {
        const auto dst = source_dir() / normalize_path(f.path);
        fs::create_directories(dst.parent_path());
        if (!write_file(dst, f.content)) {
            throw RunboxError("failed to write " + dst.string());
        }
    }
    return std::nullopt;
}

}  // namespace runbox
