// Copyright 2021-2023 Francesco Fusco
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef X11_XCB_HPP
#define X11_XCB_HPP

#include <string>
#include <vector>
#include <xcb/xcb.h>
#include <xcb/randr.h>
#include <lumen/display.hpp>

namespace lumen {
namespace xcb {

void throw_if(xcb_generic_error_t *err, std::string err_str);

class connection {
    xcb_connection_t *addr_;
    std::vector<xcb_screen_t*> screens_;
public:
    connection();
    ~connection();
    connection(const connection &) = delete;
    connection &operator=(const connection &) = delete;
    xcb_connection_t* get() const;
    xcb_screen_t* first_screen() const;
};

class randr {
public:
    struct output {
        std::string name;
        std::vector<uint8_t> edid;
    };

    // active outputs only, in server order
    static std::vector<output> outputs(const connection &conn, xcb_screen_t *screen);
};

} // namespace xcb

// RandR outputs give the display order, ddcutil the physical handles.
class x11_display_server : public display_server {
public:
    x11_display_server(int ddc_max_tries, bool ddc_verify);
    std::vector<logical_display> displays() override;
    std::vector<std::unique_ptr<physical_monitor>> physical_monitors(const logical_display &display) override;
};

// Process-wide instance, created on first use from any thread.
display_server &system_display_server(int ddc_max_tries, bool ddc_verify);

} // namespace lumen

#endif // X11_XCB_HPP
