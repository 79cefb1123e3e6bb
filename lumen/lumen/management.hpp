// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MANAGEMENT_HPP
#define MANAGEMENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace lumen {

struct brightness_object {
    std::string syspath;
    std::string sysname;
    std::string instance; // DRM connector driving this backlight, may be empty
    int brightness;
    int max_brightness;
};

struct identity_object {
    std::string instance; // DRM connector sysname, e.g. card0-eDP-1
    std::vector<uint8_t> edid;
};

// Kernel device model: backlight brightness objects and EDID identity objects.
class management_api {
public:
    virtual ~management_api() = default;
    virtual std::vector<brightness_object> brightness_objects() = 0;
    virtual std::vector<identity_object> identity_objects() = 0;
    virtual void write_brightness(const std::string &syspath, int raw) = 0;
};

// Process-wide instance, created on first use from any thread.
management_api &system_management();

}

#endif // MANAGEMENT_HPP
