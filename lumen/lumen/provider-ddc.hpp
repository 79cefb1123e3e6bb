// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PROVIDER_DDC_HPP
#define PROVIDER_DDC_HPP

#include <functional>
#include <lumen/provider.hpp>
#include <lumen/display.hpp>
#include <lumen/management.hpp>

namespace lumen {

// DDC/CI monitors, ordered by the display server and identified through
// the management API.
class ddc_provider : public brightness_provider {
    display_server &server_;
    management_api &api_;
    monitor correlate(const physical_monitor &handle, const std::vector<identity_object> &identities, size_t index) const;
public:
    ddc_provider(display_server &server, management_api &api);

    // Opens the physical monitors of each logical display in turn and passes
    // them to fn, until fn returns false. Every handle is released once,
    // however the iteration ends.
    void for_each_handle(const std::function<bool(physical_monitor &)> &fn);

    // nullopt if any step of the exchange fails
    static std::optional<std::string> get_monitor_capabilities(physical_monitor &handle);

    channel kind() const override;
    std::vector<monitor> enumerate() override;
    std::optional<int> get_brightness(size_t index) override;
    void set_brightness(size_t index, int value) override;
    std::optional<std::string> capabilities(size_t index) override;
};

}

#endif // PROVIDER_DDC_HPP
