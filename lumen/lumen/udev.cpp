// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <filesystem>
#include <libudev.h>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <lumen/udev.hpp>
#include <lumen/errors.hpp>
#include <lumen/file.hpp>
#include <lumen/utils.hpp>

namespace lumen::constants {
namespace {

namespace backlight {
constexpr std::string_view subsystem = "backlight";
constexpr std::string_view name      = "brightness";
constexpr std::string_view max_name  = "max_brightness";
} // namespace backlight

namespace drm {
constexpr std::string_view subsystem = "drm";
constexpr std::string_view status    = "status";
constexpr std::string_view edid      = "edid";
constexpr std::array<std::string_view, 3> internal_panels = {
    "-eDP-",
    "-LVDS-",
    "-DSI-"
};
} // namespace drm

} // anonymous namespace
} // namespace lumen::constants

namespace lumen {
namespace sysfs {

udev_context::udev_context() : addr_(udev_new()) {
    if (!addr_) {
        throw std::runtime_error("udev_new failed");
    }
}

udev_context::~udev_context() {
    udev_unref(addr_);
}

udev* udev_context::get() const {
    return addr_;
}

device::device(const udev_context &udev, std::filesystem::path path)
    : addr_(udev_device_new_from_syspath(udev.get(), path.generic_string().c_str())) {
    if (!addr_) {
        throw std::runtime_error(fmt::format("udev_device_new_from_syspath {}", path));
    }
}

device::~device() {
    udev_device_unref(addr_);
};

std::string device::path() const {
    return udev_device_get_syspath(addr_);
}

std::string device::sysname() const {
    const char *s = udev_device_get_sysname(addr_);
    return s ? s : "";
}

std::string device::get(std::string_view attr) const {
    const char *s = udev_device_get_sysattr_value(addr_, attr.data());
    return s ? s : "";
}

int device::set(std::string_view attr, std::string_view val) {
    return udev_device_set_sysattr_value(addr_, attr.data(), val.data());
}

std::string device::drm_connector() const {
    udev_device *parent = udev_device_get_parent_with_subsystem_devtype(addr_, constants::drm::subsystem.data(), nullptr);
    if (!parent)
        return {};
    const char *s = udev_device_get_sysname(parent);
    const std::string_view name = s ? s : "";
    // card0 is the card itself, card0-eDP-1 a connector
    return name.find('-') != std::string_view::npos ? std::string(name) : std::string();
}

std::vector<std::filesystem::path> enumerate(const udev_context &udev, std::string_view subsystem) {
    const std::unique_ptr<udev_enumerate, deleter<udev_enumerate, udev_enumerate_unref>> en(udev_enumerate_new(udev.get()));
    if (!en) {
        throw enumeration_failure("udev_enumerate_new failed");
    }

    udev_enumerate_add_match_subsystem(en.get(), subsystem.data());

    if (const int ret = udev_enumerate_scan_devices(en.get()); ret < 0) {
        throw enumeration_failure(fmt::format("udev_enumerate_scan_devices({}) {} ({})", subsystem, ret, std::strerror(-ret)));
    }

    std::vector<std::filesystem::path> vec;
    udev_list_entry *entry;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(en.get())) {
        vec.emplace_back(udev_list_entry_get_name(entry));
    }
    return vec;
}

} // namespace sysfs

namespace {

bool is_connector(std::string_view sysname) {
    return sysname.find('-') != std::string_view::npos;
}

bool is_internal_panel(std::string_view sysname) {
    for (const auto tag : constants::drm::internal_panels) {
        if (sysname.find(tag) != std::string_view::npos)
            return true;
    }
    return false;
}

}

std::vector<brightness_object> udev_management::brightness_objects() {
    // firmware backlights (acpi_video0, vendor drivers) are not parented to a
    // connector: they drive the internal panel
    const std::string internal_panel = [this] {
        for (const auto &path : sysfs::enumerate(udev_, constants::drm::subsystem)) {
            const sysfs::device dev(udev_, path);
            const std::string name = dev.sysname();
            if (is_connector(name) && is_internal_panel(name) && dev.get(constants::drm::status) == "connected")
                return name;
        }
        return std::string();
    }();

    std::vector<brightness_object> vec;

    for (const auto &path : sysfs::enumerate(udev_, constants::backlight::subsystem)) {
        try {
            const sysfs::device dev(udev_, path);
            const std::string connector = dev.drm_connector();

            brightness_object obj {
                dev.path(),
                dev.sysname(),
                connector.empty() ? internal_panel : connector,
                std::stoi(dev.get(constants::backlight::name)),
                std::stoi(dev.get(constants::backlight::max_name))
            };

            spdlog::debug("[udev] backlight {}: {}/{} ({})", obj.sysname, obj.brightness, obj.max_brightness, obj.instance);
            vec.push_back(std::move(obj));
        } catch (const std::exception &e) {
            spdlog::warn("[udev] skipping backlight {}: {}", path, e.what());
        }
    }

    return vec;
}

std::vector<identity_object> udev_management::identity_objects() {
    std::vector<identity_object> vec;

    for (const auto &path : sysfs::enumerate(udev_, constants::drm::subsystem)) {
        const std::string name = path.filename();

        if (!is_connector(name))
            continue;

        try {
            const sysfs::device dev(udev_, path);
            if (dev.get(constants::drm::status) != "connected")
                continue;

            const std::string data = file_read(path / constants::drm::edid);
            if (data.empty()) {
                spdlog::debug("[udev] {} has no edid", name);
                continue;
            }
            vec.push_back({name, std::vector<uint8_t>(data.begin(), data.end())});
            spdlog::debug("[udev] {} edid is {} bytes", name, data.size());
        } catch (const std::exception &e) {
            spdlog::warn("[udev] could not read edid of {}: {}", name, e.what());
        }
    }

    return vec;
}

void udev_management::write_brightness(const std::string &syspath, int raw) {
    sysfs::device dev(udev_, syspath);
    const int ret = dev.set(constants::backlight::name, std::to_string(raw));
    if (ret < 0) {
        throw channel_call_failure(fmt::format("[udev] writing {} to {} failed: {}", raw, syspath, std::strerror(-ret)));
    }
}

management_api &system_management() {
    static std::mutex mutex;
    static std::unique_ptr<udev_management> instance;

    std::lock_guard lock(mutex);
    if (!instance) {
        spdlog::debug("[udev] initializing context");
        instance = std::make_unique<udev_management>();
    }
    return *instance;
}

} // namespace lumen
