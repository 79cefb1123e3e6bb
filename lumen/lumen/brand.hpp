// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef BRAND_HPP
#define BRAND_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lumen {
namespace brand {

class lookup_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Accepts either a 3-letter PNP code ("BNQ") or a brand name ("benq"),
// case-insensitively. Returns {code, name}.
std::pair<std::string, std::string> lookup(std::string_view code_or_name);

}
}

#endif // BRAND_HPP
