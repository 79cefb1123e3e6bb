// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef EDID_HPP
#define EDID_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace lumen {
namespace edid {

struct info {
    std::string manufacturer_id; // 3-letter PNP code
    uint16_t product_code;
    uint32_t serial_number;
    std::string name;            // display product name descriptor (0xFC)
    std::string serial;          // display serial number descriptor (0xFF)
};

// First 128 bytes of an EDID blob.
// Throws std::invalid_argument if the blob is shorter than that.
std::vector<uint8_t> base_block(std::span<const uint8_t> edid);

// Throws std::invalid_argument on a short blob or a bad header.
info decode(std::span<const uint8_t> edid);

// Lowercase, two digits per byte.
std::string to_hex(std::span<const uint8_t> edid);

}
}

#endif // EDID_HPP
