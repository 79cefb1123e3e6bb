// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <lumen/config.hpp>
#include <lumen/control.hpp>
#include <lumen/errors.hpp>

#include "cli.hpp"

using lumen::cli::options;

nlohmann::json result_json(const lumen::brightness_result &res) {
    if (const auto val = std::get_if<int>(&res))
        return *val;

    nlohmann::json ret = nlohmann::json::array();
    for (const auto &v : std::get<std::vector<std::optional<int>>>(res))
        ret.push_back(v ? nlohmann::json(*v) : nlohmann::json(nullptr));
    return ret;
}

void print_result(const lumen::brightness_result &res, bool json) {
    const nlohmann::json j = result_json(res);
    if (json || j.is_array()) {
        std::cout << j.dump() << '\n';
    } else {
        std::cout << j.get<int>() << '\n';
    }
}

void list(lumen::brightness_control &ctl, const options &opt, std::optional<lumen::channel> method) {
    const auto monitors = ctl.list_monitors_info(method);

    if (opt.verbose) {
        std::cout << std::setw(4) << nlohmann::json(monitors) << '\n';
        return;
    }

    if (opt.json) {
        nlohmann::json names = nlohmann::json::array();
        for (const auto &m : monitors)
            names.push_back(m.name);
        std::cout << names.dump() << '\n';
        return;
    }

    for (size_t i = 0; i < monitors.size(); ++i)
        std::cout << fmt::format("{}: {} [{}]\n", i, monitors[i].name, lumen::channel_name(monitors[i].channel));
}

void caps(lumen::brightness_control &ctl, const lumen::monitor_query &query, const options &opt, std::optional<lumen::channel> method) {
    const auto entries = ctl.get_capabilities(query, method);

    if (opt.json) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &e : entries)
            j[e.record.name] = e.capabilities ? nlohmann::json(*e.capabilities) : nlohmann::json(nullptr);
        std::cout << j.dump() << '\n';
        return;
    }

    for (const auto &e : entries)
        std::cout << fmt::format("{}: {}\n", e.record.name, e.capabilities.value_or("none"));
}

int interface(int argc, char **argv)
{
    lumen::cli::command_line cl;
    CLI::App &app = cl.app;
    const options &opt = cl.opt;

    app.add_flag("--version", [] ([[maybe_unused]] int64_t t) {
        std::puts(VERSION);
        std::exit(0);
    }, "Print version and exit");

    spdlog::debug("parsing options...");
    try {
        if (argc == 1) {
            app.parse("-h");
        } else {
            app.parse(argc, argv);
        }
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    const lumen::config cfg;
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    spdlog::cfg::load_env_levels();

    lumen::configure(cfg);
    lumen::brightness_control &ctl = lumen::default_control();

    const std::optional<lumen::channel> method = opt.method.empty()
            ? std::nullopt
            : std::optional(lumen::channel_from_string(opt.method));

    const lumen::monitor_query query = lumen::monitor_query::parse(opt.display);

    try {
        if (*cl.list_cmd) {
            list(ctl, opt, method);
        } else if (*cl.get_cmd) {
            print_result(ctl.get_brightness(query, method), opt.json);
        } else if (*cl.set_cmd) {
            const auto res = ctl.set_brightness(opt.value, query, method, opt.no_return);
            if (res)
                print_result(*res, opt.json);
        } else if (*cl.caps_cmd) {
            caps(ctl, query, opt, method);
        } else {
            std::cout << app.help();
        }
    } catch (const lumen::error &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();
    return interface(argc, argv);
}
