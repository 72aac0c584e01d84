/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>

#include "client/execute_concurrent.hh"
#include "exceptions/exceptions.hh"

namespace client {

future<> execute_concurrent(cluster_session& session, const prepared_statement& stmt,
        const std::vector<dht::token_range>& ranges, size_t concurrency, outcome_consumer on_outcome) {
    if (concurrency == 0) {
        throw exceptions::configuration_exception("Request concurrency must be positive");
    }
    co_await max_concurrent_for_each(ranges, concurrency, [&] (const dht::token_range& range) -> future<> {
        range_outcome outcome;
        try {
            outcome = co_await session.count(stmt, range);
        } catch (...) {
            outcome = std::unexpected(std::current_exception());
        }
        on_outcome(range, std::move(outcome));
    });
}

}
