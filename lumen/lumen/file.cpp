// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <string>
#include <string_view>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <lumen/file.hpp>

namespace lumen {

// binary mode: sysfs edid attributes are raw bytes
std::string file_read(std::filesystem::path filepath) {
    std::ifstream fs(filepath, std::ios::binary);
    fs.exceptions(std::ifstream::failbit);

    std::ostringstream buf;
    buf << fs.rdbuf();

    return buf.str();
}

void file_write(std::filesystem::path filepath, const std::string &data) {
    std::ofstream fs(filepath);
    fs.exceptions(std::ofstream::failbit);
    fs.write(data.c_str(), data.size());
}

std::string env(std::string_view var) {
    const auto s = std::getenv(var.data());
    return s ? s : "";
}

std::filesystem::path xdg_config_dir() {
    constexpr std::array<std::array<std::string_view, 2>, 2> env_vars {{
        {"XDG_CONFIG_HOME", ""},
        {"HOME", "/.config"}
    }};

    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error("xdg_config_dir should be absolute");

    return ret;
}

} // namespace lumen
