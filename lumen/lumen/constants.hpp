// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <cstdint>
#include <cstddef>

namespace lumen {
namespace constants {
extern const char * const config_filename;
extern const int brightness_min;
extern const int brightness_max;
extern const int brightness_cache_ms;
extern const size_t edid_base_block_size;
extern const uint8_t vcp_brightness;
}}

#endif // CONSTANTS_HPP
