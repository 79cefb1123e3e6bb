// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <lumen/utils.hpp>

using namespace lumen;

TEST(utils, remap) {
    EXPECT_DOUBLE_EQ(remap(480, 0, 960, 0, 100), 50.0);
    EXPECT_DOUBLE_EQ(remap(25, 0, 100, 0, 960), 240.0);
}

TEST(utils, strings) {
    EXPECT_EQ(capitalize("BENQ"), "Benq");
    EXPECT_EQ(capitalize(""), "");
    EXPECT_EQ(trim("  GL2450 \n"), "GL2450");
    EXPECT_EQ(trim(" \n"), "");
    EXPECT_TRUE(iequals("eDP-1", "EDP-1"));
    EXPECT_FALSE(iequals("eDP-1", "eDP-10"));
}
