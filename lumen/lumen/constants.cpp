// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <lumen/constants.hpp>

namespace lumen {
namespace constants {
const char * const config_filename = "lumen.json";
const int brightness_min       = 0;
const int brightness_max       = 100;
const int brightness_cache_ms  = 500;

// https://en.wikipedia.org/wiki/Extended_Display_Identification_Data
const size_t edid_base_block_size = 128;

// MCCS luminance
const uint8_t vcp_brightness = 0x10;
}}
