// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef DDC_HPP
#define DDC_HPP

#include <memory>
#include <span>
#include <vector>
#include <string>
#include <ddcutil_c_api.h>
#include <ddcutil_macros.h>
#include <ddcutil_status_codes.h>
#include <lumen/display.hpp>

namespace lumen {
namespace ddc {

class display_list {
    DDCA_Display_Info_List *list_;
public:
    display_list();
    ~display_list();
    display_list(const display_list &) = delete;
    display_list &operator=(const display_list &) = delete;
    DDCA_Display_Info_List *get() const;
};

class display : public physical_monitor {
    DDCA_Display_Handle handle_;
    std::vector<uint8_t> edid_;
public:
    display(DDCA_Display_Ref ref, std::vector<uint8_t> edid);
    ~display() override;
    display(const display &) = delete;
    display &operator=(const display &) = delete;

    std::vector<uint8_t> edid() const override;
    std::optional<std::string> request_capabilities() override;
    bool parse_capabilities(const std::string &caps) override;
    feature_value read_feature(uint8_t code) override;
    void write_feature(uint8_t code, int value) override;
};

// 0 max_tries: use ddcutil's maximum
void configure(int max_tries, bool verify);

// opens every DDC display whose EDID base block equals the given one
std::vector<std::unique_ptr<physical_monitor>> open_displays(std::span<const uint8_t> edid);

} // namespace ddc
} // namespace lumen

#endif // DDC_HPP
