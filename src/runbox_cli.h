//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <string>
#include <vector>

#include "exec_core.h"
#include "prog_option.h"
#include "settings.h"

namespace runbox::cli {

// --config, else $RUNBOX_CONFIG, else the built-in defaults
engine_conf_t load_conf(const std::string &path);

// Files named on the command line, keyed by the path they were given with
// when it is a safe relative one, by file name otherwise
std::vector<source_file_t> read_sources(const std::vector<std::string> &paths);

// How much of `now` is new since `printed` characters were shown, skipping
// the echo of `input` that the engine adds after a prompt
std::size_t skip_echo(const std::string &now, std::size_t printed, const std::string &input);

class CliHandler {
  public:
    int run(int argc, char **argv);

  private:
    po::CommandHandler handler_;

    int run_throw(int argc, char **argv);
};

}  // namespace runbox::cli
