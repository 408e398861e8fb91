//
// Copyright (c) 2024-2025 JLGxy
//

#include "runbox_cli.h"

int main(int argc, char **argv) {
    runbox::cli::CliHandler handler;
    return handler.run(argc, argv);
}
