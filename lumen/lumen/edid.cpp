// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <array>
#include <stdexcept>
#include <fmt/ranges.h>
#include <lumen/edid.hpp>
#include <lumen/constants.hpp>
#include <lumen/utils.hpp>

namespace lumen::edid {
namespace {

constexpr std::array<uint8_t, 8> header {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};

constexpr size_t descriptors_offset = 54;
constexpr size_t descriptor_size    = 18;
constexpr size_t descriptor_count   = 4;
constexpr size_t descriptor_text    = 13;

constexpr uint8_t tag_serial = 0xFF;
constexpr uint8_t tag_name   = 0xFC;

std::string descriptor_string(std::span<const uint8_t> edid, uint8_t tag) {
    for (size_t i = 0; i < descriptor_count; ++i) {
        const auto d = edid.subspan(descriptors_offset + i * descriptor_size, descriptor_size);

        // display descriptors start with a zero pixel clock
        if (d[0] != 0 || d[1] != 0 || d[2] != 0 || d[3] != tag)
            continue;

        const auto text = d.subspan(5, descriptor_text);
        const auto end  = std::find(text.begin(), text.end(), uint8_t('\n'));
        return trim(std::string(text.begin(), end));
    }
    return {};
}

}

std::vector<uint8_t> base_block(std::span<const uint8_t> edid) {
    if (edid.size() < constants::edid_base_block_size) {
        throw std::invalid_argument(fmt::format("edid is {} bytes, expected at least {}", edid.size(), constants::edid_base_block_size));
    }
    return std::vector<uint8_t>(edid.begin(), edid.begin() + constants::edid_base_block_size);
}

info decode(std::span<const uint8_t> edid) {
    if (edid.size() < constants::edid_base_block_size) {
        throw std::invalid_argument(fmt::format("edid is {} bytes, expected at least {}", edid.size(), constants::edid_base_block_size));
    }

    if (!std::equal(header.begin(), header.end(), edid.begin())) {
        throw std::invalid_argument("edid header mismatch");
    }

    // three 5-bit letters, big endian, 'A' = 1
    const uint16_t mfg = uint16_t(edid[8]) << 8 | edid[9];
    const std::array<char, 3> letters {
        char('A' + ((mfg >> 10) & 0x1F) - 1),
        char('A' + ((mfg >> 5) & 0x1F) - 1),
        char('A' + (mfg & 0x1F) - 1)
    };

    info ret;
    ret.manufacturer_id = std::string(letters.begin(), letters.end());
    ret.product_code    = uint16_t(edid[10]) | uint16_t(edid[11]) << 8;
    ret.serial_number   = uint32_t(edid[12])
                        | uint32_t(edid[13]) << 8
                        | uint32_t(edid[14]) << 16
                        | uint32_t(edid[15]) << 24;
    ret.name   = descriptor_string(edid, tag_name);
    ret.serial = descriptor_string(edid, tag_serial);
    return ret;
}

std::string to_hex(std::span<const uint8_t> edid) {
    return fmt::format("{:02x}", fmt::join(edid, ""));
}

}
