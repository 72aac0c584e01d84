/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <ostream>
#include <string_view>
#include <vector>

#include "client/cluster.hh"
#include "repair/progress.hh"

namespace repair {

struct repair_target {
    sstring keyspace;
    sstring table;
    // Resolved from the schema by repair_table().
    std::vector<sstring> partition_key;
};

struct table_repair_options {
    // Range queries in flight at once.
    size_t concurrency = 100;
    // Client side timeout of every range query.
    std::chrono::seconds timeout{60};
};

struct table_repair_result {
    // False only if the table could not be repaired at all. Failed ranges
    // are counted in stats and leave this true.
    bool ok = false;
    table_stats stats;
};

// Wraps a CQL identifier in double quotes, doubling the quotes it contains.
sstring quote_identifier(std::string_view name);

// The statement repairing one token range: a count of the range's rows. Read
// at CL=ALL, it makes the cluster read and reconcile every replica of every
// partition in the range.
sstring make_range_count_query(const repair_target& target);

// Repairs one table by reading each of \c ranges at CL=ALL, at most
// opts.concurrency ranges at a time, through a session of its own that is
// closed before returning.
//
// Every range is attempted once whatever happens to the others. Problems
// that prevent repairing the table at all (connection, schema, prepare) are
// printed to \c out and reported as ok == false, they do not propagate.
future<table_repair_result> repair_table(client::cluster_connector& connector, repair_target target,
        const std::vector<dht::token_range>& ranges, table_repair_options opts, std::ostream& out);

}
