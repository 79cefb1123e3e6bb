// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <ddcutil_c_api.h>
#include <ddcutil_macros.h>
#include <ddcutil_status_codes.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/utils.hpp>
#include <lumen/constants.hpp>
#include <lumen/ddc.hpp>

namespace lumen {

ddc::display_list::display_list() : list_(nullptr) {
    const DDCA_Status st = ddca_get_display_info_list2(false, &list_);
    if (st != DDCRC_OK) {
        throw std::runtime_error(fmt::format("ddca_get_display_info_list2 error {} ({})", st, ddca_rc_desc(st)));
    }
}

ddc::display_list::~display_list() {
    ddca_free_display_info_list(list_);
}

DDCA_Display_Info_List *ddc::display_list::get() const {
    return list_;
}

void ddc::configure(int max_tries, bool verify) {
    const int tries = max_tries > 0 ? std::min(max_tries, ddca_max_max_tries()) : ddca_max_max_tries();
    for (const DDCA_Retry_Type type : {DDCA_WRITE_READ_TRIES, DDCA_MULTI_PART_TRIES}) {
        const DDCA_Status st = ddca_set_max_tries(type, tries);
        if (st != DDCRC_OK) {
            spdlog::warn("[ddc] ddca_set_max_tries error {} ({})", st, ddca_rc_desc(st));
        }
    }
    ddca_enable_verify(verify);
    spdlog::debug("[ddc] max tries: {}, verify: {}", tries, verify);
}

std::vector<std::unique_ptr<physical_monitor>> ddc::open_displays(std::span<const uint8_t> edid) {
    const ddc::display_list list;
    std::vector<std::unique_ptr<physical_monitor>> vec;

    if (edid.size() < constants::edid_base_block_size)
        return vec;

    for (int i = 0; i < list.get()->ct; ++i) {
        const auto &display_data = list.get()->info[i];

        if (!std::equal(edid.begin(), edid.begin() + constants::edid_base_block_size, std::begin(display_data.edid_bytes), std::end(display_data.edid_bytes)))
            continue;

        spdlog::info("[ddc] found: {}-{}-{}", display_data.mfg_id, display_data.model_name, display_data.sn);

        try {
            vec.push_back(std::make_unique<ddc::display>(
                              display_data.dref,
                              std::vector<uint8_t>(std::begin(display_data.edid_bytes), std::end(display_data.edid_bytes))));
        } catch (const std::runtime_error &e) {
            spdlog::warn("[ddc] {}", e.what());
        }
    }

    return vec;
}

ddc::display::display(DDCA_Display_Ref ref, std::vector<uint8_t> edid) : handle_(nullptr), edid_(std::move(edid)) {
    const DDCA_Status st = ddca_open_display2(ref, true, &handle_);
    if (st != DDCRC_OK) {
        throw std::runtime_error(fmt::format("ddca_open_display2 error {} ({})", st, ddca_rc_desc(st)));
    }
}

ddc::display::~display() {
    if (handle_)
        ddca_close_display(handle_);
}

std::vector<uint8_t> ddc::display::edid() const {
    return edid_;
}

std::optional<std::string> ddc::display::request_capabilities() {
    char *buf = nullptr;
    const DDCA_Status st = ddca_get_capabilities_string(handle_, &buf);
    const c_unique_ptr<char> caps(buf);
    if (st != DDCRC_OK || !caps) {
        spdlog::debug("[ddc] ddca_get_capabilities_string error {} ({})", st, ddca_rc_desc(st));
        return std::nullopt;
    }
    return std::string(caps.get());
}

bool ddc::display::parse_capabilities(const std::string &caps) {
    std::string copy(caps);
    DDCA_Capabilities *parsed = nullptr;
    const DDCA_Status st = ddca_parse_capabilities_string(copy.data(), &parsed);
    const std::unique_ptr<DDCA_Capabilities, deleter<DDCA_Capabilities, ddca_free_parsed_capabilities>> guard(parsed);
    if (st != DDCRC_OK) {
        spdlog::debug("[ddc] ddca_parse_capabilities_string error {} ({})", st, ddca_rc_desc(st));
        return false;
    }
    return true;
}

physical_monitor::feature_value ddc::display::read_feature(uint8_t code) {
    DDCA_Non_Table_Vcp_Value val;
    const DDCA_Status st = ddca_get_non_table_vcp_value(handle_, code, &val);
    if (st != DDCRC_OK) {
        throw std::runtime_error(fmt::format("ddca_get_non_table_vcp_value error {} ({})", st, ddca_rc_desc(st)));
    }
    return {val.sh << 8 | val.sl, val.mh << 8 | val.ml};
}

void ddc::display::write_feature(uint8_t code, int value) {
    const uint16_t out_val = std::clamp(value, 0, 0xFFFF);
    spdlog::debug("[ddc] setting feature {:#04x}: {}", code, out_val);

    const DDCA_Status st = ddca_set_non_table_vcp_value(handle_, code, out_val >> 8, out_val & 0xFF);
    if (st != DDCRC_OK) {
        throw std::runtime_error(fmt::format("ddca_set_non_table_vcp_value error {} ({})", st, ddca_rc_desc(st)));
    }
}

} // namespace lumen
