/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <seastar/core/coroutine.hh>

#include "client/execute_concurrent.hh"
#include "exceptions/exceptions.hh"
#include "log.hh"
#include "repair/table_repair.hh"

namespace repair {

static logging::logger tlogger("table_repair");

sstring quote_identifier(std::string_view name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted.push_back('"');
    for (auto c : name) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return sstring(quoted);
}

sstring make_range_count_query(const repair_target& target) {
    std::vector<sstring> columns;
    columns.reserve(target.partition_key.size());
    for (auto& c : target.partition_key) {
        columns.push_back(quote_identifier(c));
    }
    auto token = fmt::format("token({})", fmt::join(columns, ", "));
    return fmt::format("SELECT COUNT(1) FROM {}.{} WHERE {} >= ? AND {} <= ?",
            quote_identifier(target.keyspace), quote_identifier(target.table), token, token);
}

static future<table_stats> do_repair_table(client::cluster_session& session, repair_target& target,
        const std::vector<dht::token_range>& ranges, const table_repair_options& opts, std::ostream& out) {
    target.partition_key = co_await session.partition_key_columns(target.keyspace, target.table);
    if (target.partition_key.empty()) {
        throw exceptions::invalid_request_exception(fmt::format("Table {}.{} has no partition key", target.keyspace, target.table));
    }
    fmt::print(out, "{}.{} partition key: {}\n", target.keyspace, target.table, fmt::join(target.partition_key, ", "));

    auto stmt = co_await session.prepare(make_range_count_query(target), db::consistency_level::ALL, opts.timeout);

    table_stats stats;
    progress_reporter progress(target.keyspace, target.table, ranges.size(), out);
    tlogger.info("Repairing {}.{}: ranges={}, concurrency={}, timeout={}s",
            target.keyspace, target.table, ranges.size(), opts.concurrency, opts.timeout.count());
    co_await client::execute_concurrent(session, *stmt, ranges, opts.concurrency,
            [&] (const dht::token_range& range, client::range_outcome outcome) {
        if (outcome) {
            stats.record_success(*outcome);
        } else {
            tlogger.debug("{}.{}: range {} failed: {}", target.keyspace, target.table, range, outcome.error());
            stats.record_failure(outcome.error());
        }
        progress.report(stats);
    });
    // The last outcome may not have crossed a percentage boundary.
    progress.report(stats);
    progress.finish(stats);
    co_return stats;
}

future<table_repair_result> repair_table(client::cluster_connector& connector, repair_target target,
        const std::vector<dht::token_range>& ranges, table_repair_options opts, std::ostream& out) {
    table_repair_result result;
    std::unique_ptr<client::cluster_session> session;
    std::exception_ptr ex;
    try {
        session = co_await connector.connect();
        result.stats = co_await do_repair_table(*session, target, ranges, opts, out);
        result.ok = true;
    } catch (...) {
        ex = std::current_exception();
    }
    if (session) {
        co_await session->close();
    }
    if (ex) {
        tlogger.warn("Failed to repair {}.{}: {}", target.keyspace, target.table, ex);
        fmt::print(out, "{}.{} error: {}\n", target.keyspace, target.table, ex);
    } else if (result.stats.failed_partitions) {
        tlogger.warn("Repaired {}.{} with {} failed ranges out of {}",
                target.keyspace, target.table, result.stats.failed_partitions, ranges.size());
    }
    co_return result;
}

}
