/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <exception>
#include <expected>

#include <seastar/util/noncopyable_function.hh>

#include "client/cluster.hh"

namespace client {

/// Row count of a range, or the reason it could not be counted.
using range_outcome = std::expected<uint64_t, std::exception_ptr>;

using outcome_consumer = noncopyable_function<void (const dht::token_range&, range_outcome)>;

/// Executes \c stmt once for every range, with at most \c concurrency
/// executions in flight.
///
/// Each outcome is passed to \c on_outcome as soon as it is known, in
/// completion order, which has no relation to the order of \c ranges.
/// \c on_outcome is never invoked concurrently with itself. A failed range
/// does not stop the dispatch of the remaining ones; the returned future
/// resolves once every range has been handed to \c on_outcome.
future<> execute_concurrent(cluster_session& session, const prepared_statement& stmt,
        const std::vector<dht::token_range>& ranges, size_t concurrency, outcome_consumer on_outcome);

}
