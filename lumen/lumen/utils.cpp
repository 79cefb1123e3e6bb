// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cctype>
#include <lumen/utils.hpp>

namespace lumen {

double invlerp(double val, double min, double max) {
    return (val - min) / (max - min);
}

double lerp(double a, double b, double t) {
    return ((1 - t) * a) + (t * b);
}

double remap(double val, double min, double max, double new_min, double new_max) {
    return lerp(new_min, new_max, invlerp(val, min, max));
}

std::string to_lower(std::string_view s) {
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), [] (unsigned char c) { return std::tolower(c); });
    return ret;
}

std::string to_upper(std::string_view s) {
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), [] (unsigned char c) { return std::toupper(c); });
    return ret;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [] (unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::string capitalize(std::string_view s) {
    std::string ret = to_lower(s);
    if (!ret.empty())
        ret[0] = std::toupper(static_cast<unsigned char>(ret[0]));
    return ret;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(first, last - first + 1));
}

}
