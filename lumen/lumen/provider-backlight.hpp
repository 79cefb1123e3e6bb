// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PROVIDER_BACKLIGHT_HPP
#define PROVIDER_BACKLIGHT_HPP

#include <lumen/provider.hpp>
#include <lumen/management.hpp>

namespace lumen {

// Kernel backlight devices, identified through the EDID of the connector they drive.
class backlight_provider : public brightness_provider {
    management_api &api_;
    brightness_object object_at(size_t index);
public:
    explicit backlight_provider(management_api &api);
    channel kind() const override;
    std::vector<monitor> enumerate() override;
    std::optional<int> get_brightness(size_t index) override;
    void set_brightness(size_t index, int value) override;
};

}

#endif // PROVIDER_BACKLIGHT_HPP
