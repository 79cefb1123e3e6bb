// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CLI_HPP
#define CLI_HPP

#include <string>
#include <CLI/App.hpp>

namespace lumen::cli {

struct options {
    std::string display;
    std::string method;
    bool json = false;
    bool verbose = false;
    bool no_return = false;
    int value = 0;
};

// Option values are bound to opt, so the object cannot be copied or moved.
class command_line {
public:
    options opt;
    CLI::App app;
    CLI::App *list_cmd;
    CLI::App *get_cmd;
    CLI::App *set_cmd;
    CLI::App *caps_cmd;

    command_line();
    command_line(const command_line &) = delete;
    command_line &operator=(const command_line &) = delete;
};

}

#endif // CLI_HPP
