// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <string_view>
#include <filesystem>

namespace lumen {

std::string file_read(std::filesystem::path filepath);
void file_write(std::filesystem::path filepath, const std::string &data);

std::string env(std::string_view var);

// https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
std::filesystem::path xdg_config_dir();
}

#endif // FILE_HPP
