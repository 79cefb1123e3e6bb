// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fstream>
#include <iomanip>
#include <system_error>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <lumen/config.hpp>
#include <lumen/file.hpp>
#include <lumen/constants.hpp>

using nlohmann::json;
using namespace lumen;

void config::defaults()
{
    brightness_cache_ms = constants::brightness_cache_ms;

    channels.backlight  = true;
    channels.ddc        = true;

    ddc.max_tries       = 0;
    ddc.verify          = false;

    log_level           = "warn";
}

config::config()
{
    defaults();

    try {
        filepath_ = xdg_config_dir() / constants::config_filename;
    } catch (const std::runtime_error &e) {
        spdlog::warn("[config] {}, using defaults", e.what());
        return;
    }

    if (!std::filesystem::exists(filepath_)) {
        try {
            file_pretty_write();
        } catch (const std::exception &e) {
            spdlog::warn("[config] unable to write {}: {}", filepath_.string(), e.what());
        }
        return;
    }

    file_parse();
}

config::config(const json &in)
{
    defaults();
    from_json(in);
}

void config::from_json(const json &in)
{
    if (!in.is_object())
        return;

    brightness_cache_ms = in.value("brightness_cache_ms", brightness_cache_ms);
    log_level           = in.value("log_level", log_level);

    if (in.contains("channels") && in["channels"].is_object()) {
        const json &ch = in["channels"];
        channels.backlight = ch.value("backlight", channels.backlight);
        channels.ddc       = ch.value("ddc", channels.ddc);
    }

    if (in.contains("ddc") && in["ddc"].is_object()) {
        const json &d = in["ddc"];
        ddc.max_tries = d.value("max_tries", ddc.max_tries);
        ddc.verify    = d.value("verify", ddc.verify);
    }
}

json config::to_json() const
{
    return {
        {"brightness_cache_ms", brightness_cache_ms},

        {"channels", {
                {"backlight", channels.backlight},
                {"ddc", channels.ddc},
        }},

        {"ddc", {
                {"max_tries", ddc.max_tries},
                {"verify", ddc.verify},
        }},

        {"log_level", log_level},
    };
}

void config::file_pretty_write() const
{
    std::filesystem::create_directories(filepath_.parent_path());
    std::ofstream fs(filepath_);
    fs.exceptions(std::fstream::failbit);
    fs << std::setw(4) << config::to_json();
}

void config::file_parse()
{
    const std::string data = [&] {
        try {
            return file_read(filepath_);
        } catch (std::system_error &e) {
            spdlog::warn("[config] unable to read {}: {}", filepath_.string(), e.what());
            return std::string();
        }
    }();

    const json jdata = [&] {
        try {
            return json::parse(data);
        } catch (json::exception &e) {
            spdlog::warn("[config] invalid json in {}, using defaults", filepath_.string());
            return json();
        }
    }();

    try {
        from_json(jdata);
    } catch (json::exception &e) {
        spdlog::warn("[config] {}, using defaults", e.what());
        defaults();
    }
}
