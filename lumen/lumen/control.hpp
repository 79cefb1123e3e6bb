// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONTROL_HPP
#define CONTROL_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <lumen/cache.hpp>
#include <lumen/monitor.hpp>
#include <lumen/provider.hpp>
#include <lumen/resolver.hpp>

namespace lumen {

class config;

// A single value when one monitor was resolved, otherwise one slot per monitor.
using brightness_result = std::variant<int, std::vector<std::optional<int>>>;

struct capabilities_entry {
    monitor record;
    std::optional<std::string> capabilities;
};

class brightness_control {
    std::vector<std::unique_ptr<brightness_provider>> providers_;
    resolver resolver_;
    expiring_cache<cache_key, int> brightness_cache_;
    std::chrono::milliseconds brightness_expiry_;

    brightness_provider &provider_for(const monitor &m) const;
    std::optional<int> read(const monitor &m);
public:
    brightness_control(std::vector<std::unique_ptr<brightness_provider>> providers, std::chrono::milliseconds brightness_expiry);

    std::vector<monitor> list_monitors_info(std::optional<channel> constraint = std::nullopt);
    std::vector<std::string> list_monitors(std::optional<channel> constraint = std::nullopt);

    // Throws a query error, or aggregate_failure when no monitor gave a value.
    brightness_result get_brightness(const monitor_query &query = {}, std::optional<channel> constraint = std::nullopt);

    // value is clamped to [0, 100].
    // Returns the new brightness unless no_return is set.
    // Throws a query error, or aggregate_failure when every write failed.
    std::optional<brightness_result> set_brightness(int value, const monitor_query &query = {}, std::optional<channel> constraint = std::nullopt, bool no_return = false);

    std::vector<capabilities_entry> get_capabilities(const monitor_query &query = {}, std::optional<channel> constraint = std::nullopt);
};

std::unique_ptr<brightness_control> make_system_control(const config &cfg);

// Replaces the process-wide instance. References from default_control()
// taken before the call are invalidated.
void configure(const config &cfg);

// Process-wide instance, built from the config file on first use.
brightness_control &default_control();

std::vector<monitor> list_monitors_info(std::optional<channel> constraint = std::nullopt);
std::vector<std::string> list_monitors(std::optional<channel> constraint = std::nullopt);
brightness_result get_brightness(const monitor_query &query = {}, std::optional<channel> constraint = std::nullopt);
std::optional<brightness_result> set_brightness(int value, const monitor_query &query = {}, std::optional<channel> constraint = std::nullopt, bool no_return = false);

}

#endif // CONTROL_HPP
