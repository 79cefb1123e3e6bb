// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include <optional>
#include <vector>
#include <lumen/cache.hpp>
#include <lumen/monitor.hpp>
#include <lumen/provider.hpp>

namespace lumen {

// Selects records from a merged list.
// Throws query_index_error or query_lookup_error.
std::vector<monitor> filter(const monitor_query &query, const std::vector<monitor> &haystack, std::optional<channel> constraint = std::nullopt);

class resolver {
    std::vector<brightness_provider*> providers_;
    expiring_cache<cache_key, std::vector<monitor>> cache_;
    std::vector<monitor> enumerate(brightness_provider &p);
public:
    // Providers are not owned, and are queried in the given order.
    explicit resolver(std::vector<brightness_provider*> providers);

    // Concatenated provider lists, without duplicate identity blocks.
    std::vector<monitor> merge(std::optional<channel> constraint = std::nullopt);

    std::vector<monitor> resolve(const monitor_query &query, std::optional<channel> constraint = std::nullopt);

    // nullptr if the channel is disabled
    brightness_provider *provider(channel ch) const;

    void invalidate();
};

}

#endif // RESOLVER_HPP
