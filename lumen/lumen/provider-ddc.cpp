// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/provider-ddc.hpp>
#include <lumen/brand.hpp>
#include <lumen/constants.hpp>
#include <lumen/edid.hpp>
#include <lumen/errors.hpp>
#include <lumen/utils.hpp>

namespace lumen {

ddc_provider::ddc_provider(display_server &server, management_api &api)
    : server_(server),
      api_(api) {
}

channel ddc_provider::kind() const {
    return channel::ddc;
}

void ddc_provider::for_each_handle(const std::function<bool(physical_monitor &)> &fn) {
    for (const auto &display : server_.displays()) {
        const auto handles = server_.physical_monitors(display);
        for (const auto &handle : handles) {
            if (!fn(*handle))
                return;
        }
    }
}

monitor ddc_provider::correlate(const physical_monitor &handle, const std::vector<identity_object> &identities, size_t index) const {
    try {
        const std::vector<uint8_t> block = edid::base_block(handle.edid());

        const auto identity = std::find_if(identities.begin(), identities.end(), [&block] (const identity_object &id) {
            return id.edid.size() >= block.size() && std::equal(block.begin(), block.end(), id.edid.begin());
        });

        if (identity == identities.end()) {
            throw correlation_failure(fmt::format("no identity object for edid {}", edid::to_hex(block)));
        }

        const edid::info info = edid::decode(identity->edid);

        monitor m;
        m.channel        = channel::ddc;
        m.channel_index  = index;
        m.identity_block = block;

        const auto space = info.name.find(' ');
        if (space != std::string::npos) {
            const std::string manufacturer = capitalize(info.name.substr(0, space));
            m.model        = trim(info.name.substr(space + 1));
            m.manufacturer = manufacturer;
            try {
                auto [code, name] = brand::lookup(manufacturer);
                m.manufacturer_id = std::move(code);
                m.manufacturer    = std::move(name);
            } catch (const brand::lookup_error &e) {
                spdlog::debug("[ddc] {}", e.what());
            }
        } else {
            m.model = info.name.empty() ? fmt::format("{}{:04X}", info.manufacturer_id, info.product_code) : info.name;
            m.manufacturer_id = info.manufacturer_id;
            try {
                m.manufacturer = brand::lookup(info.manufacturer_id).second;
            } catch (const brand::lookup_error &e) {
                spdlog::debug("[ddc] {}", e.what());
            }
        }

        if (!info.serial.empty())
            m.serial = info.serial;
        else if (info.serial_number != 0)
            m.serial = std::to_string(info.serial_number);
        else
            m.serial = identity->instance;

        m.name = monitor::display_name(m.manufacturer, m.model);
        return m;
    } catch (const std::invalid_argument &e) {
        throw correlation_failure(e.what());
    }
}

std::vector<monitor> ddc_provider::enumerate() {
    std::vector<monitor> vec;

    try {
        const std::vector<identity_object> identities = api_.identity_objects();

        size_t index = 0;
        for_each_handle([&] (physical_monitor &handle) {
            try {
                vec.push_back(correlate(handle, identities, index));
                spdlog::info("[ddc] found: {} ({})", vec.back().name, vec.back().serial);
            } catch (const correlation_failure &e) {
                spdlog::debug("[ddc] skipping handle {}: {}", index, e.what());
            }
            ++index;
            return true;
        });
    } catch (const std::exception &e) {
        spdlog::warn("[ddc] enumeration stopped after {} monitor(s): {}", vec.size(), e.what());
    }

    return vec;
}

std::optional<std::string> ddc_provider::get_monitor_capabilities(physical_monitor &handle) {
    try {
        std::optional<std::string> caps = handle.request_capabilities();
        if (!caps)
            return std::nullopt;
        if (!handle.parse_capabilities(*caps))
            return std::nullopt;
        return caps;
    } catch (const std::exception &e) {
        spdlog::debug("[ddc] capabilities: {}", e.what());
        return std::nullopt;
    }
}

std::optional<int> ddc_provider::get_brightness(size_t index) {
    std::optional<int> ret;
    bool found = false;
    size_t pos = 0;

    for_each_handle([&] (physical_monitor &handle) {
        if (pos++ != index)
            return true;

        found = true;
        try {
            const auto val = handle.read_feature(constants::vcp_brightness);
            if (val.max > 0) {
                ret = int(std::lround(remap(val.current, 0, val.max, constants::brightness_min, constants::brightness_max)));
            }
            spdlog::debug("[ddc] handle {} brightness: {}/{}", index, val.current, val.max);
        } catch (const std::exception &e) {
            spdlog::debug("[ddc] handle {}: {}", index, e.what());
        }
        return false;
    });

    if (!found) {
        throw channel_call_failure(fmt::format("no ddc handle at index {}", index));
    }

    return ret;
}

void ddc_provider::set_brightness(size_t index, int value) {
    bool found = false;
    size_t pos = 0;

    for_each_handle([&] (physical_monitor &handle) {
        if (pos++ != index)
            return true;

        found = true;
        try {
            const auto val = handle.read_feature(constants::vcp_brightness);
            if (val.max <= 0) {
                throw std::runtime_error(fmt::format("reported max brightness {}", val.max));
            }
            const int out_val = std::lround(remap(value, constants::brightness_min, constants::brightness_max, 0, val.max));
            spdlog::debug("[ddc] setting handle {} brightness: {}/{}", index, out_val, val.max);
            handle.write_feature(constants::vcp_brightness, out_val);
        } catch (const std::exception &e) {
            throw channel_call_failure(fmt::format("ddc handle {}: {}", index, e.what()));
        }
        return false;
    });

    if (!found) {
        throw channel_call_failure(fmt::format("no ddc handle at index {}", index));
    }
}

std::optional<std::string> ddc_provider::capabilities(size_t index) {
    std::optional<std::string> ret;
    size_t pos = 0;

    for_each_handle([&] (physical_monitor &handle) {
        if (pos++ != index)
            return true;
        ret = get_monitor_capabilities(handle);
        return false;
    });

    return ret;
}

}
