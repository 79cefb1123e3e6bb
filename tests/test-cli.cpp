// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include "cli.hpp"

using lumen::cli::command_line;

TEST(cli, options_after_subcommand) {
    command_line cl;
    cl.app.parse("get -d 1 -m ddc -j");

    EXPECT_TRUE(*cl.get_cmd);
    EXPECT_EQ(cl.opt.display, "1");
    EXPECT_EQ(cl.opt.method, "ddc");
    EXPECT_TRUE(cl.opt.json);
}

TEST(cli, options_before_subcommand) {
    command_line cl;
    cl.app.parse("-d GL2450 set 40 --no-return");

    EXPECT_TRUE(*cl.set_cmd);
    EXPECT_EQ(cl.opt.display, "GL2450");
    EXPECT_EQ(cl.opt.value, 40);
    EXPECT_TRUE(cl.opt.no_return);
}

TEST(cli, list_verbose) {
    command_line cl;
    cl.app.parse("list -v -m backlight");

    EXPECT_TRUE(*cl.list_cmd);
    EXPECT_TRUE(cl.opt.verbose);
    EXPECT_EQ(cl.opt.method, "backlight");
}

TEST(cli, unknown_method_is_rejected) {
    command_line cl;
    EXPECT_THROW(cl.app.parse("get -m wmi"), CLI::ValidationError);
}
