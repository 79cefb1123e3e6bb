// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <new>
#include <gtest/gtest.h>
#include <lumen/control.hpp>
#include <lumen/errors.hpp>
#include <lumen/provider-ddc.hpp>
#include "mocks.hpp"

using namespace lumen;
using namespace std::chrono_literals;

namespace {

struct control_fixture : public ::testing::Test {
    test::echo_provider *backlight;
    test::echo_provider *ddc;
    std::unique_ptr<brightness_control> ctl;

    void SetUp() override {
        auto a = std::make_unique<test::echo_provider>(channel::backlight);
        auto b = std::make_unique<test::echo_provider>(channel::ddc);
        backlight = a.get();
        ddc = b.get();

        backlight->add("Laptop Panel", "intel_backlight", std::vector<uint8_t> {1});
        ddc->add("BenQ GL2450", "ETB3K01234", std::vector<uint8_t> {2});
        ddc->add("Dell U2415", "7", std::vector<uint8_t> {3});

        std::vector<std::unique_ptr<brightness_provider>> providers;
        providers.push_back(std::move(a));
        providers.push_back(std::move(b));
        ctl = std::make_unique<brightness_control>(std::move(providers), 1h);
    }
};

}

TEST_F(control_fixture, list_monitors) {
    EXPECT_EQ(ctl->list_monitors(), (std::vector<std::string> {"Laptop Panel", "BenQ GL2450", "Dell U2415"}));
    EXPECT_EQ(ctl->list_monitors(channel::ddc), (std::vector<std::string> {"BenQ GL2450", "Dell U2415"}));
    EXPECT_EQ(ctl->list_monitors_info().size(), 3u);
}

TEST_F(control_fixture, failing_channel_leaves_the_other) {
    backlight->fail_enumerate = true;
    EXPECT_EQ(ctl->list_monitors(), (std::vector<std::string> {"BenQ GL2450", "Dell U2415"}));
}

TEST_F(control_fixture, single_monitor_gives_scalar) {
    const brightness_result res = ctl->get_brightness("ETB3K01234");
    ASSERT_TRUE(std::holds_alternative<int>(res));
    EXPECT_EQ(std::get<int>(res), 50);
}

TEST_F(control_fixture, several_monitors_give_list) {
    ddc->values[1] = 70;
    const brightness_result res = ctl->get_brightness();
    ASSERT_TRUE((std::holds_alternative<std::vector<std::optional<int>>>(res)));
    EXPECT_EQ(std::get<std::vector<std::optional<int>>>(res), (std::vector<std::optional<int>> {50, 50, 70}));
}

TEST_F(control_fixture, set_then_get) {
    const auto res = ctl->set_brightness(30, 1);
    ASSERT_TRUE(res);
    EXPECT_EQ(std::get<int>(*res), 30);
    EXPECT_EQ(ddc->values[0], 30);
    EXPECT_EQ(std::get<int>(ctl->get_brightness(1)), 30);
}

TEST_F(control_fixture, set_invalidates_cached_read) {
    EXPECT_EQ(std::get<int>(ctl->get_brightness(0)), 50);
    EXPECT_EQ(std::get<int>(ctl->get_brightness(0)), 50);
    EXPECT_EQ(backlight->gets, 1);

    ctl->set_brightness(20, 0, std::nullopt, true);
    EXPECT_EQ(std::get<int>(ctl->get_brightness(0)), 20);
    EXPECT_EQ(backlight->gets, 2);
}

TEST_F(control_fixture, set_clamps) {
    ctl->set_brightness(150, 0, std::nullopt, true);
    EXPECT_EQ(backlight->values[0], 100);
    ctl->set_brightness(-5, 0, std::nullopt, true);
    EXPECT_EQ(backlight->values[0], 0);
}

TEST_F(control_fixture, no_return) {
    EXPECT_FALSE(ctl->set_brightness(40, {}, std::nullopt, true));
}

TEST_F(control_fixture, set_unknown_display_throws_lookup_error) {
    EXPECT_THROW(ctl->set_brightness(50, "nonexistent-serial-XYZ"), query_lookup_error);
    EXPECT_THROW(ctl->get_brightness(3), query_index_error);
}

TEST_F(control_fixture, partial_set_failure_still_succeeds) {
    backlight->fail_set = true;
    const auto res = ctl->set_brightness(10);
    ASSERT_TRUE(res);
    EXPECT_EQ(ddc->values[0], 10);
    EXPECT_EQ(ddc->values[1], 10);
}

TEST_F(control_fixture, total_set_failure_lists_every_record) {
    backlight->fail_set = true;
    ddc->fail_set = true;

    try {
        ctl->set_brightness(10);
        FAIL() << "expected aggregate_failure";
    } catch (const aggregate_failure &e) {
        ASSERT_EQ(e.entries().size(), 3u);
        EXPECT_EQ(e.entries()[0].record, "Laptop Panel (intel_backlight)");
        EXPECT_EQ(e.entries()[0].kind, "runtime_error");
        EXPECT_EQ(e.entries()[0].detail, "write failed");
        EXPECT_NE(std::string(e.what()).find("\tDell U2415 (7) -> runtime_error: write failed"), std::string::npos);
    }
}

TEST_F(control_fixture, failed_read_keeps_slot) {
    backlight->fail_get = true;
    const brightness_result res = ctl->get_brightness();
    EXPECT_EQ(std::get<std::vector<std::optional<int>>>(res), (std::vector<std::optional<int>> {std::nullopt, 50, 50}));
}

TEST_F(control_fixture, total_read_failure_throws) {
    backlight->fail_get = true;
    ddc->fail_get = true;
    EXPECT_THROW(ctl->get_brightness(), aggregate_failure);
}

TEST(control, stale_ddc_index_is_named_in_failure) {
    test::mock_management api;
    test::mock_display_server server;
    server.monitors.resize(1);
    test::mock_ddc_monitor m;
    m.edid = test::make_edid("BNQ", 1, 0, "BENQ A");
    server.monitors[0].push_back(m);
    api.identities.push_back({"card0-DP-1", m.edid});

    std::vector<std::unique_ptr<brightness_provider>> providers;
    providers.push_back(std::make_unique<ddc_provider>(server, api));
    brightness_control ctl(std::move(providers), 500ms);
    ASSERT_EQ(ctl.list_monitors().size(), 1u);

    // the monitor is unplugged after enumeration
    server.monitors[0].clear();

    try {
        ctl.get_brightness(0);
        FAIL() << "expected aggregate_failure";
    } catch (const aggregate_failure &e) {
        ASSERT_EQ(e.entries().size(), 1u);
        EXPECT_EQ(e.entries()[0].kind, "channel_call_failure");
        EXPECT_EQ(e.entries()[0].record, "BenQ A (card0-DP-1)");
    }
}

TEST(control, nothing_resolved_throws) {
    brightness_control ctl({}, 500ms);
    EXPECT_TRUE(ctl.list_monitors().empty());

    try {
        ctl.set_brightness(10);
        FAIL() << "expected aggregate_failure";
    } catch (const aggregate_failure &e) {
        EXPECT_TRUE(e.entries().empty());
        EXPECT_NE(std::string(e.what()).find("no valid output"), std::string::npos);
    }
}

TEST(errors, kind_names) {
    EXPECT_EQ(error_kind(channel_call_failure("x")), "channel_call_failure");
    EXPECT_EQ(error_kind(query_lookup_error("x")), "query_lookup_error");
    EXPECT_EQ(error_kind(std::runtime_error("x")), "runtime_error");
    EXPECT_EQ(error_kind(std::bad_alloc()), "exception");
}
