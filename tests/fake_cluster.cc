/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/later.hh>
#include <seastar/core/sleep.hh>

#include "exceptions/exceptions.hh"
#include "repair/table_repair.hh"
#include "tests/fake_cluster.hh"

namespace tests {

fake_cluster::table& fake_cluster::find_table(const sstring& keyspace, const sstring& name) {
    auto ks = keyspaces.find(keyspace);
    if (ks == keyspaces.end()) {
        throw exceptions::invalid_request_exception(fmt::format("Keyspace {} does not exist", keyspace));
    }
    auto t = ks->second.find(name);
    if (t == ks->second.end()) {
        throw exceptions::invalid_request_exception(fmt::format("Table {}.{} does not exist", keyspace, name));
    }
    return t->second;
}

namespace {

class fake_prepared_statement final : public client::prepared_statement {
    sstring _query;
public:
    sstring keyspace;
    sstring table;

    fake_prepared_statement(sstring query, sstring ks, sstring t)
        : _query(std::move(query)), keyspace(std::move(ks)), table(std::move(t)) {}

    virtual const sstring& query() const noexcept override {
        return _query;
    }
};

class fake_session final : public client::cluster_session {
    fake_cluster& _cluster;
    size_t _in_flight = 0;
    bool _closed = false;
public:
    explicit fake_session(fake_cluster& cluster) : _cluster(cluster) {
        ++_cluster.sessions_opened;
        _cluster.max_live_sessions = std::max(_cluster.max_live_sessions, ++_cluster.live_sessions);
    }

    ~fake_session() {
        if (!_closed) {
            --_cluster.live_sessions;
        }
    }

    virtual future<std::vector<sstring>> list_keyspaces() override {
        std::vector<sstring> names;
        for (auto& [name, _] : _cluster.keyspaces) {
            names.push_back(name);
        }
        co_return names;
    }

    virtual future<std::vector<sstring>> list_tables(sstring keyspace) override {
        auto ks = _cluster.keyspaces.find(keyspace);
        if (ks == _cluster.keyspaces.end()) {
            throw exceptions::invalid_request_exception(fmt::format("Keyspace {} does not exist", keyspace));
        }
        std::vector<sstring> names;
        for (auto& [name, _] : ks->second) {
            names.push_back(name);
        }
        co_return names;
    }

    virtual future<std::vector<sstring>> partition_key_columns(sstring keyspace, sstring table) override {
        co_await seastar::yield();
        auto& t = _cluster.find_table(keyspace, table);
        if (t.broken_schema) {
            throw exceptions::server_exception(fmt::format("Schema of {}.{} is unavailable", keyspace, table));
        }
        co_return t.partition_key;
    }

    virtual future<client::prepared_statement_ptr> prepare(sstring query, db::consistency_level cl, std::chrono::milliseconds timeout) override {
        // Only the statements the repair would generate are understood.
        for (auto& [ks_name, tables] : _cluster.keyspaces) {
            for (auto& [table_name, t] : tables) {
                if (query == repair::make_range_count_query(repair::repair_target{ks_name, table_name, t.partition_key})) {
                    _cluster.prepared[query] = {cl, timeout};
                    co_return std::make_unique<fake_prepared_statement>(query, ks_name, table_name);
                }
            }
        }
        throw exceptions::syntax_exception(fmt::format("Unexpected query: {}", query));
    }

    virtual future<uint64_t> count(const client::prepared_statement& stmt, dht::token_range range) override {
        auto& p = static_cast<const fake_prepared_statement&>(stmt);
        ++_cluster.attempts[p.keyspace + "." + p.table];
        ++_cluster.counts_in_flight;
        ++_in_flight;
        _cluster.max_counts_in_flight = std::max(_cluster.max_counts_in_flight, _cluster.counts_in_flight);
        _cluster.max_counts_in_flight_per_session = std::max(_cluster.max_counts_in_flight_per_session, _in_flight);

        if (_cluster.max_latency.count()) {
            auto mix = uint64_t(range.start) ^ (uint64_t(range.start) >> 29);
            co_await seastar::sleep(std::chrono::microseconds(mix % uint64_t(_cluster.max_latency.count())));
        } else {
            co_await seastar::yield();
        }

        --_cluster.counts_in_flight;
        --_in_flight;
        auto& t = _cluster.find_table(p.keyspace, p.table);
        if (t.failing_ranges.contains(range.start)) {
            throw exceptions::request_timeout_exception(exceptions::exception_code::READ_TIMEOUT,
                    fmt::format("Operation timed out for {}.{} range {}", p.keyspace, p.table, range));
        }
        co_return t.rows_per_range;
    }

    virtual future<> close() override {
        if (!_closed) {
            _closed = true;
            --_cluster.live_sessions;
        }
        co_return;
    }
};

}

future<std::unique_ptr<client::cluster_session>> fake_connector::connect() {
    co_await seastar::yield();
    if (_cluster.refuse_connections) {
        throw exceptions::unavailable_exception("No hosts available");
    }
    co_return std::make_unique<fake_session>(_cluster);
}

}
