/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "db/consistency_level_type.hh"
#include "dht/token_ring.hh"
#include "seastarx.hh"

namespace client {

/// A statement prepared on one session, executable only through that session.
class prepared_statement {
public:
    virtual ~prepared_statement() = default;
    virtual const sstring& query() const noexcept = 0;
};

using prepared_statement_ptr = std::unique_ptr<prepared_statement>;

/// A connection to the cluster, owned by exactly one worker.
///
/// Errors are reported as exceptions from exceptions/exceptions.hh, with the
/// error code the cluster (or the driver) reported.
class cluster_session {
public:
    virtual ~cluster_session() = default;

    /// Names of all keyspaces in the schema, sorted.
    virtual future<std::vector<sstring>> list_keyspaces() = 0;

    /// Names of all tables of a keyspace, sorted.
    virtual future<std::vector<sstring>> list_tables(sstring keyspace) = 0;

    /// Partition key columns of a table, in key order.
    virtual future<std::vector<sstring>> partition_key_columns(sstring keyspace, sstring table) = 0;

    /// Prepares a statement with two bind markers, the first and last token of a range.
    virtual future<prepared_statement_ptr> prepare(sstring query, db::consistency_level cl, std::chrono::milliseconds timeout) = 0;

    /// Executes a statement returned by prepare() for one token range and
    /// returns the value of the single count column of its result.
    virtual future<uint64_t> count(const prepared_statement& stmt, dht::token_range range) = 0;

    /// Closes the connection. Does not fail; problems are only logged.
    virtual future<> close() = 0;
};

class cluster_connector {
public:
    virtual ~cluster_connector() = default;

    /// Opens a new session. Every call returns a session of its own.
    virtual future<std::unique_ptr<cluster_session>> connect() = 0;
};

}
