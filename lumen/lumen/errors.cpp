// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <string>
#include <vector>
#include <fmt/core.h>
#include <lumen/errors.hpp>

namespace lumen {

static std::string aggregate_message(const std::vector<failure_entry> &entries) {
    std::string msg("\n");
    for (const auto &e : entries) {
        msg += fmt::format("\t{} -> {}: {}\n", e.record, e.kind, e.detail);
    }
    if (entries.empty()) {
        msg += "\tno valid output was received from brightness methods";
    }
    return msg;
}

aggregate_failure::aggregate_failure(std::vector<failure_entry> entries)
    : error(aggregate_message(entries)),
      entries_(std::move(entries)) {
}

const std::vector<failure_entry> &aggregate_failure::entries() const {
    return entries_;
}

std::string_view error_kind(const std::exception &e) {
    if (dynamic_cast<const channel_call_failure*>(&e))
        return "channel_call_failure";
    if (dynamic_cast<const correlation_failure*>(&e))
        return "correlation_failure";
    if (dynamic_cast<const enumeration_failure*>(&e))
        return "enumeration_failure";
    if (dynamic_cast<const query_lookup_error*>(&e))
        return "query_lookup_error";
    if (dynamic_cast<const query_index_error*>(&e))
        return "query_index_error";
    if (dynamic_cast<const query_type_error*>(&e))
        return "query_type_error";
    if (dynamic_cast<const aggregate_failure*>(&e))
        return "aggregate_failure";
    if (dynamic_cast<const error*>(&e))
        return "error";
    if (dynamic_cast<const std::runtime_error*>(&e))
        return "runtime_error";
    return "exception";
}

}
