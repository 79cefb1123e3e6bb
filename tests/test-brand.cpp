// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <lumen/brand.hpp>

using namespace lumen;

TEST(brand, lookup_by_code) {
    const auto [code, name] = brand::lookup("BNQ");
    EXPECT_EQ(code, "BNQ");
    EXPECT_EQ(name, "BenQ");
}

TEST(brand, lookup_is_case_insensitive) {
    EXPECT_EQ(brand::lookup("del").second, "Dell");
    EXPECT_EQ(brand::lookup("Benq").first, "BNQ");
    EXPECT_EQ(brand::lookup("BENQ").first, "BNQ");
}

TEST(brand, code_matches_before_name) {
    EXPECT_EQ(brand::lookup("GSM").second, "LG");
    EXPECT_EQ(brand::lookup("lg").first, "GSM");
}

TEST(brand, unknown_brand_throws) {
    EXPECT_THROW(brand::lookup("ZZZ"), brand::lookup_error);
    EXPECT_THROW(brand::lookup(""), brand::lookup_error);
}
