/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <limits>
#include <vector>
#include <fmt/core.h>

namespace dht {

// The Murmur3 partitioner never produces the lowest int64 value as a key
// token, so the addressable ring is symmetric: [-max, max].
constexpr int64_t first_ring_token = -std::numeric_limits<int64_t>::max();
constexpr int64_t last_ring_token = std::numeric_limits<int64_t>::max();

// A contiguous slice of the token ring, inclusive at both ends.
struct token_range {
    int64_t start;
    int64_t end;

    bool operator==(const token_range&) const = default;
};

// Splits the whole ring into consecutive ranges of (span / partition_count)
// tokens each. The ranges are ordered, do not overlap, leave no gaps, start
// at first_ring_token and the last one ends at exactly last_ring_token.
// Integer truncation means partition_count is a target, not a guarantee.
//
// Throws exceptions::configuration_exception when partition_count is zero
// or larger than the ring itself.
std::vector<token_range> split_token_ring(uint64_t partition_count);

}

template <> struct fmt::formatter<dht::token_range> : fmt::formatter<string_view> {
    auto format(const dht::token_range&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
