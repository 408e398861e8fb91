//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "exec_core.h"

namespace runbox {

// A private directory for one execution: src/ receives the submitted files,
// build/ receives compiler output. Removed on destruction.
class Workspace {
  public:
    explicit Workspace(const fs::path &root);
    ~Workspace();
    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    fs::path getpath() const { return pth_; }
    fs::path source_dir() const { return pth_ / "src"; }
    fs::path scratch_dir() const { return pth_ / "build"; }

    // Writes the files below source_dir(). Returns the offending path when one
    // is not a safe relative path; throws on I/O failure.
    std::optional<std::string> materialize(const std::vector<source_file_t> &files) const;

  private:
    fs::path pth_;
};

}  // namespace runbox
