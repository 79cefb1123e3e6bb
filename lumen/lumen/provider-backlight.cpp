// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cmath>
#include <map>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/provider-backlight.hpp>
#include <lumen/brand.hpp>
#include <lumen/constants.hpp>
#include <lumen/edid.hpp>
#include <lumen/errors.hpp>
#include <lumen/utils.hpp>

namespace lumen {

namespace {

monitor make_monitor(const brightness_object &obj, const std::vector<uint8_t> *edid_data, size_t index) {
    monitor m;
    m.channel       = channel::backlight;
    m.channel_index = index;
    m.model         = obj.sysname;
    m.serial        = obj.sysname;

    if (edid_data) {
        try {
            const edid::info info = edid::decode(*edid_data);

            m.manufacturer_id = info.manufacturer_id;
            m.model           = fmt::format("{}{:04X}", info.manufacturer_id, info.product_code);
            m.identity_block  = edid::base_block(*edid_data);

            if (!info.name.empty())
                m.model_name = info.name;

            if (!info.serial.empty())
                m.serial = info.serial;
            else if (info.serial_number != 0)
                m.serial = std::to_string(info.serial_number);

            try {
                auto [code, name] = brand::lookup(info.manufacturer_id);
                m.manufacturer_id = std::move(code);
                m.manufacturer    = std::move(name);
            } catch (const brand::lookup_error &e) {
                spdlog::debug("[backlight] {}", e.what());
            }
        } catch (const std::invalid_argument &e) {
            spdlog::debug("[backlight] {}: unusable edid: {}", obj.sysname, e.what());
        }
    }

    m.name = monitor::display_name(m.manufacturer, m.model);
    return m;
}

}

backlight_provider::backlight_provider(management_api &api) : api_(api) {}

channel backlight_provider::kind() const {
    return channel::backlight;
}

std::vector<monitor> backlight_provider::enumerate() {
    try {
        const std::vector<brightness_object> objects = api_.brightness_objects();

        std::map<std::string, std::vector<uint8_t>> edids;
        try {
            for (auto &id : api_.identity_objects()) {
                edids.emplace(id.instance, std::move(id.edid));
            }
        } catch (const std::exception &e) {
            spdlog::warn("[backlight] identity objects unavailable: {}", e.what());
        }

        std::vector<monitor> vec;
        vec.reserve(objects.size());

        for (size_t i = 0; i < objects.size(); ++i) {
            const auto it = edids.find(objects[i].instance);
            vec.push_back(make_monitor(objects[i], it != edids.end() ? &it->second : nullptr, i));
            spdlog::info("[backlight] found: {} ({})", vec.back().name, vec.back().serial);
        }

        return vec;
    } catch (const std::exception &e) {
        spdlog::warn("[backlight] enumeration failed: {}", e.what());
        return {};
    }
}

brightness_object backlight_provider::object_at(size_t index) {
    std::vector<brightness_object> objects = api_.brightness_objects();
    if (index >= objects.size()) {
        throw channel_call_failure(fmt::format("no backlight at index {} ({} found)", index, objects.size()));
    }

    if (objects[index].max_brightness <= 0) {
        throw channel_call_failure(fmt::format("{} reports max_brightness {}", objects[index].sysname, objects[index].max_brightness));
    }

    return std::move(objects[index]);
}

std::optional<int> backlight_provider::get_brightness(size_t index) {
    const brightness_object obj = object_at(index);
    return int(std::lround(remap(obj.brightness, 0, obj.max_brightness, constants::brightness_min, constants::brightness_max)));
}

void backlight_provider::set_brightness(size_t index, int value) {
    const brightness_object obj = object_at(index);
    const int raw = std::lround(remap(value, constants::brightness_min, constants::brightness_max, 0, obj.max_brightness));
    spdlog::debug("[backlight] setting {}: {}/{}", obj.sysname, raw, obj.max_brightness);
    api_.write_brightness(obj.syspath, raw);
}

}
