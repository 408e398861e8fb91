//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "exec_core.h"

namespace runbox {

// Where the files of a saved project come from
class ProjectFileStore {
  public:
    virtual ~ProjectFileStore() = default;
    virtual std::vector<source_file_t> get_files(std::string_view project_id) const = 0;
};

// Projects as directories below a root: <root>/<project id>/...
class DirectoryFileStore : public ProjectFileStore {
  public:
    explicit DirectoryFileStore(fs::path root) : root_(std::move(root)) {}

    // Regular files sorted by path, hidden directories skipped. Throws
    // RunboxError for unknown projects.
    std::vector<source_file_t> get_files(std::string_view project_id) const override;

    const fs::path &root() const { return root_; }

  private:
    fs::path root_;
};

// Reads one directory tree the same way
std::vector<source_file_t> collect_files(const fs::path &dir);

}  // namespace runbox
