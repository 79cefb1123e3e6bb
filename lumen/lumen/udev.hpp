// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef UDEV_HPP
#define UDEV_HPP

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

#include <libudev.h>
#include <lumen/management.hpp>

namespace lumen {
namespace sysfs {

class udev_context {
    udev *addr_;
public:
    udev_context();
    ~udev_context();
    udev_context(const udev_context &) = delete;
    udev_context &operator=(const udev_context &) = delete;
    udev* get() const;
};

class device {
    udev_device *addr_;
public:
    device(const udev_context &udev, std::filesystem::path path);
    ~device();
    device(const device &) = delete;
    device &operator=(const device &) = delete;
    std::string path() const;
    std::string sysname() const;
    std::string get(std::string_view attr) const;
    int set(std::string_view attr, std::string_view val);
    // sysname of the DRM connector this device hangs off, or empty
    std::string drm_connector() const;
};

// syspaths of every device in a subsystem
std::vector<std::filesystem::path> enumerate(const udev_context &udev, std::string_view subsystem);

}

class udev_management : public management_api {
    sysfs::udev_context udev_;
public:
    std::vector<brightness_object> brightness_objects() override;
    std::vector<identity_object> identity_objects() override;
    void write_brightness(const std::string &syspath, int raw) override;
};

}

#endif // UDEV_HPP
