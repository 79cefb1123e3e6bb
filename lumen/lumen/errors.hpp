// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lumen {

class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Absorbed: a channel contributes no monitors.
class enumeration_failure : public error {
public:
    using error::error;
};

// Absorbed: one monitor of a channel is skipped.
class correlation_failure : public error {
public:
    using error::error;
};

class query_type_error : public error {
public:
    using error::error;
};

class query_index_error : public error {
public:
    using error::error;
};

class query_lookup_error : public error {
public:
    using error::error;
};

// A get/set call on a resolved monitor failed.
class channel_call_failure : public error {
public:
    using error::error;
};

struct failure_entry {
    std::string record;
    std::string kind;
    std::string detail;
};

// Every resolved monitor failed, or nothing usable was resolved.
class aggregate_failure : public error {
    std::vector<failure_entry> entries_;
public:
    explicit aggregate_failure(std::vector<failure_entry> entries);
    const std::vector<failure_entry> &entries() const;
};

std::string_view error_kind(const std::exception &e);

}

#endif // ERRORS_HPP
