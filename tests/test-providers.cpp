// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <lumen/edid.hpp>
#include <lumen/errors.hpp>
#include <lumen/provider-backlight.hpp>
#include <lumen/provider-ddc.hpp>
#include "mocks.hpp"

using namespace lumen;

namespace {

test::mock_management laptop() {
    test::mock_management api;
    api.backlights.push_back({"/sys/class/backlight/intel_backlight", "intel_backlight", "card0-eDP-1", 480, 960});
    api.identities.push_back({"card0-eDP-1", test::make_edid("AUO", 0x123D, 0, "", "")});
    return api;
}

}

TEST(backlight_provider, enumerate_from_connector_edid) {
    test::mock_management api = laptop();
    backlight_provider p(api);

    const auto vec = p.enumerate();
    ASSERT_EQ(vec.size(), 1u);

    const monitor &m = vec.front();
    EXPECT_EQ(m.channel, channel::backlight);
    EXPECT_EQ(m.channel_index, 0u);
    EXPECT_EQ(m.manufacturer_id, "AUO");
    EXPECT_EQ(m.manufacturer, "AU Optronics");
    EXPECT_EQ(m.model, "AUO123D");
    EXPECT_EQ(m.name, "AU Optronics AUO123D");
    EXPECT_EQ(m.serial, "intel_backlight");
    ASSERT_TRUE(m.identity_block);
    EXPECT_EQ(m.identity_block->size(), 128u);
}

TEST(backlight_provider, enumerate_without_edid) {
    test::mock_management api = laptop();
    api.identities.clear();
    backlight_provider p(api);

    const auto vec = p.enumerate();
    ASSERT_EQ(vec.size(), 1u);
    EXPECT_EQ(vec.front().name, "intel_backlight");
    EXPECT_FALSE(vec.front().identity_block);
    EXPECT_FALSE(vec.front().manufacturer);
}

TEST(backlight_provider, enumeration_failure_is_absorbed) {
    test::mock_management api = laptop();
    api.fail_enumeration = true;
    backlight_provider p(api);

    EXPECT_TRUE(p.enumerate().empty());
}

TEST(backlight_provider, brightness_is_a_percentage) {
    test::mock_management api = laptop();
    backlight_provider p(api);

    EXPECT_EQ(p.get_brightness(0), 50);

    p.set_brightness(0, 25);
    EXPECT_EQ(api.writes["/sys/class/backlight/intel_backlight"], 240);
    EXPECT_EQ(p.get_brightness(0), 25);
}

TEST(backlight_provider, bad_index_throws) {
    test::mock_management api = laptop();
    backlight_provider p(api);

    EXPECT_THROW(p.get_brightness(1), channel_call_failure);
    EXPECT_THROW(p.set_brightness(1, 10), channel_call_failure);
}

namespace {

struct ddc_fixture : public ::testing::Test {
    test::mock_management api;
    test::mock_display_server server;

    void add(size_t display, std::vector<uint8_t> edid, std::string instance) {
        if (server.monitors.size() <= display)
            server.monitors.resize(display + 1);
        test::mock_ddc_monitor m;
        m.edid = edid;
        server.monitors[display].push_back(m);
        api.identities.push_back({std::move(instance), std::move(edid)});
    }
};

}

TEST_F(ddc_fixture, enumerate_correlates_by_edid) {
    add(0, test::make_edid("BNQ", 0x78E5, 0, "BENQ GL2450", "ETB3K01234"), "card0-DP-1");
    add(1, test::make_edid("DEL", 0xA0B3, 7, "DELL U2415"), "card0-HDMI-A-1");

    ddc_provider p(server, api);
    const auto vec = p.enumerate();
    ASSERT_EQ(vec.size(), 2u);

    EXPECT_EQ(vec[0].manufacturer, "BenQ");
    EXPECT_EQ(vec[0].manufacturer_id, "BNQ");
    EXPECT_EQ(vec[0].model, "GL2450");
    EXPECT_EQ(vec[0].name, "BenQ GL2450");
    EXPECT_EQ(vec[0].serial, "ETB3K01234");
    EXPECT_FALSE(vec[0].model_name);
    EXPECT_EQ(vec[0].channel_index, 0u);

    EXPECT_EQ(vec[1].name, "Dell U2415");
    EXPECT_EQ(vec[1].serial, "7");
    EXPECT_EQ(vec[1].channel_index, 1u);
}

TEST_F(ddc_fixture, every_handle_is_released) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    add(0, test::make_edid("BNQ", 2, 0, "BENQ B"), "card0-DP-2");
    add(1, test::make_edid("DEL", 3, 0, "DELL C"), "card0-DP-3");

    ddc_provider p(server, api);
    p.enumerate();
    EXPECT_EQ(server.opened, 3);
    EXPECT_EQ(server.released, 3);
}

TEST_F(ddc_fixture, early_stop_releases_remaining_handles) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    add(0, test::make_edid("BNQ", 2, 0, "BENQ B"), "card0-DP-2");
    add(1, test::make_edid("DEL", 3, 0, "DELL C"), "card0-DP-3");

    ddc_provider p(server, api);
    int visited = 0;
    p.for_each_handle([&] (physical_monitor &) {
        ++visited;
        return false;
    });

    EXPECT_EQ(visited, 1);
    // the second display is never opened
    EXPECT_EQ(server.opened, 2);
    EXPECT_EQ(server.released, 2);
}

TEST_F(ddc_fixture, throw_releases_handles) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    add(0, test::make_edid("BNQ", 2, 0, "BENQ B"), "card0-DP-2");

    ddc_provider p(server, api);
    EXPECT_THROW(p.for_each_handle([] (physical_monitor &) -> bool {
        throw std::runtime_error("stop");
    }), std::runtime_error);

    EXPECT_EQ(server.released, server.opened);
}

TEST_F(ddc_fixture, uncorrelated_handle_is_skipped) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    add(0, test::make_edid("DEL", 2, 0, "DELL B"), "card0-DP-2");
    api.identities.erase(api.identities.begin());

    ddc_provider p(server, api);
    const auto vec = p.enumerate();
    ASSERT_EQ(vec.size(), 1u);
    EXPECT_EQ(vec.front().name, "Dell B");
    // index is the handle position, so dispatch reaches the right handle
    EXPECT_EQ(vec.front().channel_index, 1u);
}

TEST_F(ddc_fixture, name_without_brand_prefix) {
    add(0, test::make_edid("GSM", 0x5B09, 0, "ULTRAGEAR"), "card0-DP-1");

    ddc_provider p(server, api);
    const auto vec = p.enumerate();
    ASSERT_EQ(vec.size(), 1u);
    EXPECT_EQ(vec.front().manufacturer, "LG");
    EXPECT_EQ(vec.front().model, "ULTRAGEAR");
    EXPECT_EQ(vec.front().serial, "card0-DP-1");
}

TEST_F(ddc_fixture, brightness_round_trip) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    server.monitors[0][0].max = 200;
    server.monitors[0][0].current = 100;

    ddc_provider p(server, api);
    EXPECT_EQ(p.get_brightness(0), 50);

    p.set_brightness(0, 80);
    EXPECT_EQ(server.monitors[0][0].current, 160);
    EXPECT_EQ(p.get_brightness(0), 80);
    EXPECT_EQ(server.released, server.opened);
}

TEST_F(ddc_fixture, failed_read_is_null) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    server.monitors[0][0].fail = true;

    ddc_provider p(server, api);
    EXPECT_FALSE(p.get_brightness(0));
    EXPECT_THROW(p.set_brightness(0, 10), channel_call_failure);
}

TEST_F(ddc_fixture, zero_max_is_never_written) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    server.monitors[0][0].current = 60;
    server.monitors[0][0].max = 0;

    ddc_provider p(server, api);
    EXPECT_THROW(p.set_brightness(0, 80), channel_call_failure);
    EXPECT_EQ(server.monitors[0][0].current, 60);
    EXPECT_FALSE(p.get_brightness(0));
    EXPECT_EQ(server.released, server.opened);
}

TEST_F(ddc_fixture, stale_index_throws) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");

    ddc_provider p(server, api);
    EXPECT_THROW(p.get_brightness(1), channel_call_failure);
    EXPECT_THROW(p.set_brightness(1, 10), channel_call_failure);
}

TEST_F(ddc_fixture, capabilities) {
    add(0, test::make_edid("BNQ", 1, 0, "BENQ A"), "card0-DP-1");
    add(0, test::make_edid("BNQ", 2, 0, "BENQ B"), "card0-DP-2");
    server.monitors[0][1].caps = "garbage";

    ddc_provider p(server, api);
    EXPECT_EQ(p.capabilities(0), "(prot(monitor)type(lcd)vcp(10 12))");
    EXPECT_FALSE(p.capabilities(1));
    EXPECT_FALSE(p.capabilities(2));
}
