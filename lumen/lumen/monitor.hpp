// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MONITOR_HPP
#define MONITOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace lumen {

enum class channel {
    backlight, // sysfs backlight class, identity from the DRM connector
    ddc        // DDC/CI handles, ordered by the display server
};

std::string_view channel_name(channel ch);

// Throws std::invalid_argument on an unknown name.
channel channel_from_string(std::string_view name);

// One physical monitor as seen through one channel.
// channel_index is only meaningful for the enumeration that produced it.
struct monitor {
    std::string name;
    std::string model;
    std::optional<std::string> model_name;
    std::string serial;
    std::optional<std::string> manufacturer;
    std::optional<std::string> manufacturer_id;
    std::optional<std::vector<uint8_t>> identity_block;
    size_t channel_index {0};
    lumen::channel channel {lumen::channel::backlight};

    // empty when there is no identity block
    std::string identity_hex() const;

    static std::string display_name(const std::optional<std::string> &manufacturer, std::string_view model);
};

void to_json(nlohmann::json &j, const monitor &m);

class monitor_query {
public:
    using value_type = std::variant<std::monostate, std::int64_t, std::string>;

    monitor_query();
    monitor_query(int index);
    monitor_query(std::int64_t index);
    monitor_query(std::string text);
    monitor_query(const char *text);

    // null -> all, integer -> index, string -> text.
    // Anything else throws query_type_error.
    static monitor_query from_json(const nlohmann::json &j);

    // Command line form: empty -> all, digits -> index, otherwise text.
    static monitor_query parse(std::string_view s);

    const value_type &value() const;
    bool all() const;
    std::string to_string() const;

private:
    value_type value_;
};

}

#endif // MONITOR_HPP
