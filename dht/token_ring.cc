/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dht/token_ring.hh"
#include "exceptions/exceptions.hh"

namespace dht {

std::vector<token_range> split_token_ring(uint64_t partition_count) {
    if (partition_count == 0) {
        throw exceptions::configuration_exception("Token ring partition count must be positive");
    }
    // 2 * max, one less than the number of tokens in [-max, max]. Fits in
    // uint64_t but not in int64_t.
    constexpr uint64_t ring_span = uint64_t(last_ring_token) * 2;
    const uint64_t range_size = ring_span / partition_count;
    if (range_size == 0) {
        throw exceptions::configuration_exception(fmt::format("Token ring partition count {} exceeds the ring span {}", partition_count, ring_span));
    }

    std::vector<token_range> ranges;
    int64_t start = first_ring_token;
    for (;;) {
        // start <= last_ring_token, so the unsigned difference is the true distance.
        const uint64_t remaining = uint64_t(last_ring_token) - uint64_t(start);
        if (range_size >= remaining) {
            ranges.push_back(token_range{start, last_ring_token});
            break;
        }
        // range_size < remaining <= 2 * max, and range_size <= max whenever
        // partition_count >= 2, so neither the cast nor the sum overflows.
        const int64_t end = start + int64_t(range_size);
        ranges.push_back(token_range{start, end});
        start = end + 1;
    }
    return ranges;
}

}

auto fmt::formatter<dht::token_range>::format(const dht::token_range& r, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "[{}, {}]", r.start, r.end);
}
