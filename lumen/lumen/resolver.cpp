// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <lumen/resolver.hpp>
#include <lumen/errors.hpp>
#include <lumen/utils.hpp>

namespace lumen {

std::vector<monitor> filter(const monitor_query &query, const std::vector<monitor> &haystack, std::optional<channel> constraint) {
    std::vector<monitor> candidates;
    for (const auto &m : haystack) {
        if (!constraint || m.channel == *constraint)
            candidates.push_back(m);
    }

    if (query.all())
        return candidates;

    if (const auto idx = std::get_if<std::int64_t>(&query.value())) {
        if (*idx < 0 || size_t(*idx) >= candidates.size()) {
            throw query_index_error(fmt::format("display index {} out of range, {} display(s) available", *idx, candidates.size()));
        }
        return { candidates[size_t(*idx)] };
    }

    const std::string &text = std::get<std::string>(query.value());

    using field_fn = std::string (*)(const monitor &);
    constexpr field_fn fields[] {
        [] (const monitor &m) { return m.serial; },
        [] (const monitor &m) { return m.name; },
        [] (const monitor &m) { return m.model; },
        [] (const monitor &m) { return m.identity_hex(); },
    };

    for (const auto field : fields) {
        std::vector<monitor> ret;
        for (const auto &m : candidates) {
            const std::string val = field(m);
            if (!val.empty() && iequals(val, text))
                ret.push_back(m);
        }
        if (!ret.empty())
            return ret;
    }

    throw query_lookup_error(fmt::format("display '{}' not found", text));
}

resolver::resolver(std::vector<brightness_provider*> providers)
    : providers_(std::move(providers)) {
}

std::vector<monitor> resolver::enumerate(brightness_provider &p) {
    const cache_key key {cache_op::enumerate, p.kind(), 0};

    if (auto cached = cache_.get(key))
        return *cached;

    std::vector<monitor> ret;
    try {
        ret = p.enumerate();
    } catch (const std::exception &e) {
        spdlog::warn("[resolver] {} enumeration failed: {}", channel_name(p.kind()), e.what());
    }

    cache_.store(key, ret);
    return ret;
}

std::vector<monitor> resolver::merge(std::optional<channel> constraint) {
    const cache_key key {cache_op::merge, constraint, 0};

    if (auto cached = cache_.get(key))
        return *cached;

    std::vector<monitor> ret;
    std::set<std::vector<uint8_t>> seen;

    for (brightness_provider *p : providers_) {
        if (constraint && p->kind() != *constraint)
            continue;

        for (auto &m : enumerate(*p)) {
            if (m.identity_block && !seen.insert(*m.identity_block).second) {
                spdlog::debug("[resolver] {} ({}) already found, skipping", m.name, channel_name(m.channel));
                continue;
            }
            ret.push_back(std::move(m));
        }
    }

    cache_.store(key, ret);
    return ret;
}

std::vector<monitor> resolver::resolve(const monitor_query &query, std::optional<channel> constraint) {
    return filter(query, merge(constraint), constraint);
}

brightness_provider *resolver::provider(channel ch) const {
    for (brightness_provider *p : providers_) {
        if (p->kind() == ch)
            return p;
    }
    return nullptr;
}

void resolver::invalidate() {
    cache_.clear();
}

}
