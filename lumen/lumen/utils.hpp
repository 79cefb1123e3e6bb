// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

namespace lumen {
// scale value in a [0, 1] range
double invlerp(double val, double min, double max);
// interpolate betweeen a and b
double lerp(double a, double b, double t);
// convert from one range to another
double remap(double val, double min, double max, double new_min, double new_max);

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
// case-insensitive (ASCII) equality
bool iequals(std::string_view a, std::string_view b);
// "BENQ" -> "Benq"
std::string capitalize(std::string_view s);
std::string trim(std::string_view s);

template <class T, auto fn>
struct deleter {
	void operator()(T *ptr) { fn(ptr); }
};

template <class T>
struct c_deleter {
	void operator()(T *ptr) { std::free(ptr); }
};

template <class T>
using c_unique_ptr = std::unique_ptr<T, c_deleter<T>>;
}

#endif // UTILS_HPP
