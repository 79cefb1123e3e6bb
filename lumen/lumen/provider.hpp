// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PROVIDER_HPP
#define PROVIDER_HPP

#include <optional>
#include <string>
#include <vector>
#include <lumen/monitor.hpp>

namespace lumen {

// One brightness control channel.
class brightness_provider {
public:
    virtual ~brightness_provider() = default;

    virtual channel kind() const = 0;

    // Never throws: a failing channel yields no monitors.
    virtual std::vector<monitor> enumerate() = 0;

    // Value in [0, 100], or nullopt when the monitor gave no usable value.
    virtual std::optional<int> get_brightness(size_t index) = 0;

    // Expects a value already clamped to [0, 100].
    virtual void set_brightness(size_t index, int value) = 0;

    virtual std::optional<std::string> capabilities([[maybe_unused]] size_t index) {
        return std::nullopt;
    }
};

}

#endif // PROVIDER_HPP
