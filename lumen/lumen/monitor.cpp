// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <lumen/monitor.hpp>
#include <lumen/edid.hpp>
#include <lumen/errors.hpp>
#include <lumen/utils.hpp>

namespace lumen {

std::string_view channel_name(channel ch) {
    switch (ch) {
    case channel::backlight:
        return "backlight";
    case channel::ddc:
        return "ddc";
    }
    return "unknown";
}

channel channel_from_string(std::string_view name) {
    for (const channel ch : {channel::backlight, channel::ddc}) {
        if (iequals(name, channel_name(ch)))
            return ch;
    }
    throw std::invalid_argument(fmt::format("method must be 'backlight' or 'ddc', got '{}'", name));
}

std::string monitor::identity_hex() const {
    return identity_block ? edid::to_hex(*identity_block) : std::string();
}

std::string monitor::display_name(const std::optional<std::string> &manufacturer, std::string_view model) {
    if (!manufacturer || manufacturer->empty())
        return std::string(model);
    return fmt::format("{} {}", *manufacturer, model);
}

void to_json(nlohmann::json &j, const monitor &m) {
    const auto opt = [] (const std::optional<std::string> &s) {
        return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
    };

    j = {
        {"name", m.name},
        {"model", m.model},
        {"model_name", opt(m.model_name)},
        {"serial", m.serial},
        {"manufacturer", opt(m.manufacturer)},
        {"manufacturer_id", opt(m.manufacturer_id)},
        {"index", m.channel_index},
        {"method", std::string(channel_name(m.channel))},
        {"edid", m.identity_block ? nlohmann::json(m.identity_hex()) : nlohmann::json(nullptr)},
    };
}

monitor_query::monitor_query() : value_(std::monostate()) {}

monitor_query::monitor_query(int index) : value_(std::int64_t(index)) {}

monitor_query::monitor_query(std::int64_t index) : value_(index) {}

monitor_query::monitor_query(std::string text) : value_(std::move(text)) {}

monitor_query::monitor_query(const char *text) : value_(std::string(text)) {}

monitor_query monitor_query::from_json(const nlohmann::json &j) {
    if (j.is_null())
        return monitor_query();
    if (j.is_number_integer())
        return monitor_query(j.get<std::int64_t>());
    if (j.is_string())
        return monitor_query(j.get<std::string>());
    throw query_type_error(fmt::format("display must be an int or str, not {}", j.type_name()));
}

monitor_query monitor_query::parse(std::string_view s) {
    if (s.empty())
        return monitor_query();

    const bool digits = std::all_of(s.begin(), s.end(), [] (unsigned char c) { return std::isdigit(c); });
    if (digits && s.size() < 10)
        return monitor_query(std::stoi(std::string(s)));

    return monitor_query(std::string(s));
}

const monitor_query::value_type &monitor_query::value() const {
    return value_;
}

bool monitor_query::all() const {
    return std::holds_alternative<std::monostate>(value_);
}

std::string monitor_query::to_string() const {
    if (const auto idx = std::get_if<std::int64_t>(&value_))
        return std::to_string(*idx);
    if (const auto text = std::get_if<std::string>(&value_))
        return *text;
    return "all";
}

}
