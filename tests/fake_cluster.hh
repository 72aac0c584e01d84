/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <set>

#include "client/cluster.hh"

namespace tests {

// In-memory stand-in for a cluster, shared by all sessions opened through
// a fake_connector. Everything runs on the test's shard.
class fake_cluster {
public:
    struct table {
        std::vector<sstring> partition_key = {"pk"};
        uint64_t rows_per_range = 10;
        // Start tokens of the ranges whose count fails.
        std::set<int64_t> failing_ranges;
        // Looking up the partition key throws.
        bool broken_schema = false;
    };

    std::map<sstring, std::map<sstring, table>> keyspaces;
    bool refuse_connections = false;
    // Upper bound of the latency added to every count, derived from the range
    // so that completions come back out of order.
    std::chrono::microseconds max_latency{0};

    // Instrumentation.
    size_t live_sessions = 0;
    size_t max_live_sessions = 0;
    size_t sessions_opened = 0;
    size_t counts_in_flight = 0;
    size_t max_counts_in_flight = 0;
    // Largest number of counts in flight on any single session.
    size_t max_counts_in_flight_per_session = 0;
    // Attempted ranges per "ks.table".
    std::map<sstring, uint64_t> attempts;
    // What prepare() was called with, per query.
    std::map<sstring, std::pair<db::consistency_level, std::chrono::milliseconds>> prepared;

    table& add_table(const sstring& keyspace, const sstring& name) {
        return keyspaces[keyspace][name];
    }

    table& find_table(const sstring& keyspace, const sstring& name);
};

class fake_connector final : public client::cluster_connector {
    fake_cluster& _cluster;
public:
    explicit fake_connector(fake_cluster& cluster) : _cluster(cluster) {}
    virtual future<std::unique_ptr<client::cluster_session>> connect() override;
};

}
