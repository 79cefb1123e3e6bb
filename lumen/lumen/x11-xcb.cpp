// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cstring>
#include <mutex>
#include <span>
#include <xcb/xcb.h>
#include <xcb/randr.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/x11-xcb.hpp>
#include <lumen/ddc.hpp>
#include <lumen/constants.hpp>
#include <lumen/errors.hpp>
#include <lumen/utils.hpp>

namespace lumen {
namespace xcb {

void throw_if(xcb_generic_error_t *err, std::string err_str) {
    if (err) {
        const int code = err->error_code;
        std::free(err);
        throw std::runtime_error(err_str + " " + std::to_string(code));
    }
}

connection::connection() : addr_(xcb_connect(nullptr, nullptr)) {
    if (const int err = xcb_connection_has_error(addr_); err > 0) {
        xcb_disconnect(addr_);
        throw enumeration_failure("xcb_connect failed with error " + std::to_string(err));
    }

    auto setup = xcb_get_setup(addr_);
    auto it    = xcb_setup_roots_iterator(setup);

    while (it.rem > 0) {
        screens_.emplace_back(it.data);
        xcb_screen_next(&it);
    }

    if (screens_.empty()) {
        xcb_disconnect(addr_);
        throw enumeration_failure("XCB: no screens found");
    }
}

connection::~connection() {
    xcb_disconnect(addr_);
}

xcb_connection_t* connection::get() const {
    return addr_;
}

xcb_screen_t* connection::first_screen() const {
    return screens_[0];
}

std::vector<randr::output> randr::outputs(const connection &conn, xcb_screen_t *screen) {
    xcb_generic_error_t *err = nullptr;

    auto res_c = xcb_randr_get_screen_resources_current(conn.get(), screen->root);
    auto res_r = c_unique_ptr<xcb_randr_get_screen_resources_current_reply_t>(xcb_randr_get_screen_resources_current_reply(conn.get(), res_c, &err));
    throw_if(err, "xcb_randr_get_screen_resources_current");
    if (!res_r)
        throw enumeration_failure("xcb_randr_get_screen_resources_current: no reply");

    xcb_randr_output_t *outputs = xcb_randr_get_screen_resources_current_outputs(res_r.get());
    std::vector<output> ret;

    auto atom_c = xcb_intern_atom(conn.get(), 1, std::strlen("EDID"), "EDID");
    auto atom_r = c_unique_ptr<xcb_intern_atom_reply_t>(xcb_intern_atom_reply(conn.get(), atom_c, &err));
    throw_if(err, "xcb_intern_atom_reply");
    if (!atom_r)
        throw enumeration_failure("xcb_intern_atom_reply: no reply");

    // property length is counted in 32-bit units
    const uint32_t edid_len = constants::edid_base_block_size / 4;

    for (size_t i = 0; i < res_r->num_outputs; ++i) {
        auto output_c = xcb_randr_get_output_info(conn.get(), outputs[i], XCB_CURRENT_TIME);
        auto output_r = c_unique_ptr<xcb_randr_get_output_info_reply_t>(xcb_randr_get_output_info_reply(conn.get(), output_c, &err));
        throw_if(err, "xcb_randr_get_output_info");

        if (!output_r || output_r->crtc == XCB_NONE)
            continue;

        const uint8_t *buf = xcb_randr_get_output_info_name(output_r.get());
        const std::string dsp_id(buf, buf + output_r->name_len);
        spdlog::info("[x11] found: {}", dsp_id);

        std::vector<uint8_t> edid = [&] {
            auto outprop_c = xcb_randr_get_output_property(conn.get(), outputs[i], atom_r->atom, XCB_GET_PROPERTY_TYPE_ANY, 0, edid_len, 0, 0);
            auto outprop_r = c_unique_ptr<xcb_randr_get_output_property_reply_t>(xcb_randr_get_output_property_reply(conn.get(), outprop_c, &err));
            throw_if(err, "xcb_randr_get_output_property");
            if (!outprop_r)
                return std::vector<uint8_t>();

            const std::span data(
                        xcb_randr_get_output_property_data(outprop_r.get()),
                        xcb_randr_get_output_property_data_length(outprop_r.get()));

            const auto log = fmt::format("[x11] {} edid is {} bytes", dsp_id, data.size());

            if (data.size() < constants::edid_base_block_size) {
                spdlog::warn(log);
                return std::vector<uint8_t>();
            }

            spdlog::debug(log);
            return std::vector<uint8_t>(data.begin(), data.begin() + constants::edid_base_block_size);
        }();

        ret.push_back({
                          dsp_id,
                          std::move(edid),
                      });
    }

    return ret;
}

} // namespace xcb

x11_display_server::x11_display_server(int ddc_max_tries, bool ddc_verify) {
    ddc::configure(ddc_max_tries, ddc_verify);
}

std::vector<logical_display> x11_display_server::displays() {
    const xcb::connection conn;
    std::vector<logical_display> vec;
    for (auto &o : xcb::randr::outputs(conn, conn.first_screen())) {
        vec.push_back({std::move(o.name), std::move(o.edid)});
    }
    return vec;
}

std::vector<std::unique_ptr<physical_monitor>> x11_display_server::physical_monitors(const logical_display &display) {
    if (display.edid.empty()) {
        spdlog::debug("[x11] {} has no edid, no DDC handle can be bound to it", display.id);
        return {};
    }
    return ddc::open_displays(display.edid);
}

display_server &system_display_server(int ddc_max_tries, bool ddc_verify) {
    static std::mutex mutex;
    static std::unique_ptr<x11_display_server> instance;

    std::lock_guard lock(mutex);
    if (!instance) {
        instance = std::make_unique<x11_display_server>(ddc_max_tries, ddc_verify);
    }
    return *instance;
}

} // namespace lumen
