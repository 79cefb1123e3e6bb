// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <mutex>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/control.hpp>
#include <lumen/config.hpp>
#include <lumen/constants.hpp>
#include <lumen/errors.hpp>
#include <lumen/management.hpp>
#include <lumen/provider-backlight.hpp>
#include <lumen/provider-ddc.hpp>
#include <lumen/x11-xcb.hpp>

namespace lumen {

static std::vector<brightness_provider*> raw_pointers(const std::vector<std::unique_ptr<brightness_provider>> &vec) {
    std::vector<brightness_provider*> ret;
    for (const auto &p : vec)
        ret.push_back(p.get());
    return ret;
}

static std::string label(const monitor &m) {
    return fmt::format("{} ({})", m.name, m.serial);
}

brightness_control::brightness_control(std::vector<std::unique_ptr<brightness_provider>> providers, std::chrono::milliseconds brightness_expiry)
    : providers_(std::move(providers)),
      resolver_(raw_pointers(providers_)),
      brightness_expiry_(brightness_expiry) {
}

brightness_provider &brightness_control::provider_for(const monitor &m) const {
    brightness_provider *p = resolver_.provider(m.channel);
    if (!p) {
        throw channel_call_failure(fmt::format("{} channel is disabled", channel_name(m.channel)));
    }
    return *p;
}

std::optional<int> brightness_control::read(const monitor &m) {
    const cache_key key {cache_op::brightness, m.channel, m.channel_index};

    if (const auto cached = brightness_cache_.get(key))
        return cached;

    const std::optional<int> val = provider_for(m).get_brightness(m.channel_index);
    if (val)
        brightness_cache_.store(key, *val, brightness_expiry_);

    return val;
}

std::vector<monitor> brightness_control::list_monitors_info(std::optional<channel> constraint) {
    return resolver_.merge(constraint);
}

std::vector<std::string> brightness_control::list_monitors(std::optional<channel> constraint) {
    std::vector<std::string> ret;
    for (const auto &m : list_monitors_info(constraint))
        ret.push_back(m.name);
    return ret;
}

brightness_result brightness_control::get_brightness(const monitor_query &query, std::optional<channel> constraint) {
    const std::vector<monitor> records = resolver_.resolve(query, constraint);

    std::vector<std::optional<int>> values;
    std::vector<failure_entry> failures;

    for (const auto &m : records) {
        try {
            values.push_back(read(m));
        } catch (const std::exception &e) {
            spdlog::warn("[dispatch] {}: {}", label(m), e.what());
            failures.push_back({label(m), std::string(error_kind(e)), e.what()});
            values.push_back(std::nullopt);
        }
    }

    const bool any = std::any_of(values.begin(), values.end(), [] (const std::optional<int> &v) { return v.has_value(); });
    if (!any) {
        throw aggregate_failure(std::move(failures));
    }

    if (values.size() == 1)
        return *values.front();

    return values;
}

std::optional<brightness_result> brightness_control::set_brightness(int value, const monitor_query &query, std::optional<channel> constraint, bool no_return) {
    const std::vector<monitor> records = resolver_.resolve(query, constraint);

    const int clamped = std::clamp(value, constants::brightness_min, constants::brightness_max);
    if (clamped != value) {
        spdlog::warn("[dispatch] brightness {} clamped to {}", value, clamped);
    }

    std::vector<failure_entry> failures;
    size_t ok = 0;

    for (const auto &m : records) {
        try {
            spdlog::debug("[dispatch] {} -> {}", label(m), clamped);
            provider_for(m).set_brightness(m.channel_index, clamped);
            brightness_cache_.erase({cache_op::brightness, m.channel, m.channel_index});
            ++ok;
        } catch (const std::exception &e) {
            spdlog::warn("[dispatch] {}: {}", label(m), e.what());
            failures.push_back({label(m), std::string(error_kind(e)), e.what()});
        }
    }

    if (ok == 0) {
        throw aggregate_failure(std::move(failures));
    }

    if (no_return)
        return std::nullopt;

    return get_brightness(query, constraint);
}

std::vector<capabilities_entry> brightness_control::get_capabilities(const monitor_query &query, std::optional<channel> constraint) {
    std::vector<capabilities_entry> ret;
    for (const auto &m : resolver_.resolve(query, constraint)) {
        std::optional<std::string> caps;
        try {
            caps = provider_for(m).capabilities(m.channel_index);
        } catch (const std::exception &e) {
            spdlog::warn("[dispatch] {}: {}", label(m), e.what());
        }
        ret.push_back({m, std::move(caps)});
    }
    return ret;
}

std::unique_ptr<brightness_control> make_system_control(const config &cfg) {
    std::vector<std::unique_ptr<brightness_provider>> providers;

    try {
        management_api &api = system_management();

        if (cfg.channels.backlight) {
            providers.push_back(std::make_unique<backlight_provider>(api));
        }

        if (cfg.channels.ddc) {
            display_server &server = system_display_server(cfg.ddc.max_tries, cfg.ddc.verify);
            providers.push_back(std::make_unique<ddc_provider>(server, api));
        }
    } catch (const std::exception &e) {
        spdlog::warn("[dispatch] {}", e.what());
    }

    return std::make_unique<brightness_control>(std::move(providers), std::chrono::milliseconds(cfg.brightness_cache_ms));
}

static std::mutex default_mutex;
static std::unique_ptr<brightness_control> default_instance;

void configure(const config &cfg) {
    auto ctl = make_system_control(cfg);
    std::lock_guard lock(default_mutex);
    default_instance = std::move(ctl);
}

brightness_control &default_control() {
    std::lock_guard lock(default_mutex);
    if (!default_instance) {
        default_instance = make_system_control(config());
    }
    return *default_instance;
}

std::vector<monitor> list_monitors_info(std::optional<channel> constraint) {
    return default_control().list_monitors_info(constraint);
}

std::vector<std::string> list_monitors(std::optional<channel> constraint) {
    return default_control().list_monitors(constraint);
}

brightness_result get_brightness(const monitor_query &query, std::optional<channel> constraint) {
    return default_control().get_brightness(query, constraint);
}

std::optional<brightness_result> set_brightness(int value, const monitor_query &query, std::optional<channel> constraint, bool no_return) {
    return default_control().set_brightness(value, query, constraint, no_return);
}

}
