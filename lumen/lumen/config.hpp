// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace lumen {
class config {

    void defaults();

    void file_parse();
    void file_pretty_write() const;

    void from_json(const nlohmann::json &data);

    std::filesystem::path filepath_;
public:

    int brightness_cache_ms;

    struct channels {
        bool backlight;
        bool ddc;
    } channels;

    struct ddc {
        int max_tries;
        bool verify;
    } ddc;

    std::string log_level;

    nlohmann::json to_json() const;

    // Reads the config file, writing the defaults if it does not exist.
    config();

    // Missing keys keep their defaults. Nothing is written.
    config(const nlohmann::json &data);
};
}

#endif // CONFIG_HPP
