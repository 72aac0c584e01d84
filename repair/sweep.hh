/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "repair/table_repair.hh"

namespace repair {

struct sweep_options {
    // Keyspaces to repair; all keyspaces of the cluster when empty.
    std::vector<sstring> keyspaces;
    // Tables to repair in every selected keyspace; all of them when empty.
    std::vector<sstring> tables;
    // Target number of token ranges, see dht::split_token_ring().
    uint64_t partition_count = 10000;
    // Tables repaired at once, each through its own session.
    size_t process_limit = 5;
    table_repair_options table;
};

struct sweep_result {
    sstring keyspace;
    sstring table;
    bool ok;
};

struct keyspace_result {
    sstring keyspace;
    // Sorted by table name.
    std::vector<sweep_result> tables;
    // False if any table failed, or if the tables could not be listed.
    bool ok;
};

// Repairs every selected table of every selected keyspace.
//
// Keyspaces are swept one after another in name order. The tables of a
// keyspace are repaired concurrently, at most process_limit at a time,
// with up to table.concurrency range queries each.
class sweep_coordinator {
    client::cluster_connector& _connector;
    sweep_options _options;
    std::ostream& _out;
public:
    sweep_coordinator(client::cluster_connector& connector, sweep_options options, std::ostream& out);

    // Fails only if the token ranges can not be computed or the cluster can
    // not be reached for discovery; table failures are part of the result.
    future<std::vector<keyspace_result>> run();

private:
    future<keyspace_result> sweep_keyspace(client::cluster_session& control, sstring keyspace, const std::vector<dht::token_range>& ranges);
};

bool all_ok(const std::vector<keyspace_result>& results) noexcept;

}
