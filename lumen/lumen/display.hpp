// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef DISPLAY_HPP
#define DISPLAY_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

// A display as the windowing system sees it.
struct logical_display {
    std::string id;
    std::vector<uint8_t> edid;
};

// Open handle to one physical monitor on the control bus.
// Destroying it releases the handle.
class physical_monitor {
public:
    struct feature_value {
        int current;
        int max;
    };

    virtual ~physical_monitor() = default;
    virtual std::vector<uint8_t> edid() const = 0;

    // capability string exchange: request-and-reply, then parse.
    // Both report failure instead of throwing.
    virtual std::optional<std::string> request_capabilities() = 0;
    virtual bool parse_capabilities(const std::string &caps) = 0;

    // throw on a failed bus transaction
    virtual feature_value read_feature(uint8_t code) = 0;
    virtual void write_feature(uint8_t code, int value) = 0;
};

class display_server {
public:
    virtual ~display_server() = default;

    // in the windowing system's order
    virtual std::vector<logical_display> displays() = 0;

    virtual std::vector<std::unique_ptr<physical_monitor>> physical_monitors(const logical_display &display) = 0;
};

}

#endif // DISPLAY_HPP
