// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include "cli.hpp"

namespace lumen::cli {

command_line::command_line()
    : app("Monitor brightness control for Linux.", "lumen") {
    app.require_subcommand(0, 1);

    app.add_option("-d,--display", opt.display, "Display index, serial, name, model or EDID. If omitted, all displays are used.");
    app.add_option("-m,--method", opt.method, "Restrict to one method.")->check(CLI::IsMember({"backlight", "ddc"}, CLI::ignore_case));
    app.add_flag("-j,--json", opt.json, "Print results as JSON.");

    list_cmd = app.add_subcommand("list", "List detected displays.");
    list_cmd->add_flag("-v,--verbose", opt.verbose, "Print every known field of each display.");

    get_cmd = app.add_subcommand("get", "Print the brightness percentage.");

    set_cmd = app.add_subcommand("set", "Set the brightness percentage.");
    set_cmd->add_option("value", opt.value, "Brightness percentage.")->required();
    set_cmd->add_flag("--no-return", opt.no_return, "Do not read the brightness back.");

    caps_cmd = app.add_subcommand("caps", "Print the DDC capability string.");

    // -d, -m and -j are accepted after the subcommand too
    for (CLI::App *cmd : {list_cmd, get_cmd, set_cmd, caps_cmd})
        cmd->fallthrough();
}

}
