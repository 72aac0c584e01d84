/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include <fmt/ostream.h>

#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>

#include "log.hh"
#include "repair/sweep.hh"

namespace repair {

static logging::logger slogger("sweep");

static std::vector<sstring> sorted_unique(std::vector<sstring> names) {
    std::ranges::sort(names);
    auto dups = std::ranges::unique(names);
    names.erase(dups.begin(), dups.end());
    return names;
}

sweep_coordinator::sweep_coordinator(client::cluster_connector& connector, sweep_options options, std::ostream& out)
    : _connector(connector)
    , _options(std::move(options))
    , _out(out)
{ }

future<std::vector<keyspace_result>> sweep_coordinator::run() {
    // Shared read-only by every table of the sweep.
    const auto ranges = dht::split_token_ring(_options.partition_count);
    slogger.info("Split the token ring into {} ranges", ranges.size());

    auto control = co_await _connector.connect();
    std::vector<keyspace_result> results;
    std::exception_ptr ex;
    try {
        auto keyspaces = _options.keyspaces;
        if (keyspaces.empty()) {
            keyspaces = co_await control->list_keyspaces();
        }
        for (auto& keyspace : sorted_unique(std::move(keyspaces))) {
            results.push_back(co_await sweep_keyspace(*control, keyspace, ranges));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    co_await control->close();
    if (ex) {
        std::rethrow_exception(ex);
    }
    co_return results;
}

future<keyspace_result> sweep_coordinator::sweep_keyspace(client::cluster_session& control, sstring keyspace, const std::vector<dht::token_range>& ranges) {
    keyspace_result result{keyspace, {}, false};
    auto tables = _options.tables;
    try {
        if (tables.empty()) {
            tables = co_await control.list_tables(keyspace);
        }
    } catch (...) {
        slogger.error("Could not list the tables of keyspace {}: {}", keyspace, std::current_exception());
        fmt::print(_out, "failed to repair all tables on keyspace {}...\n", keyspace);
        co_return result;
    }
    tables = sorted_unique(std::move(tables));

    fmt::print(_out, "repairing {} tables on keyspace {}...\n", tables.size(), keyspace);
    result.tables.reserve(tables.size());
    co_await max_concurrent_for_each(tables, _options.process_limit, [&] (const sstring& table) -> future<> {
        auto r = co_await repair_table(_connector, repair_target{keyspace, table, {}}, ranges, _options.table, _out);
        result.tables.push_back(sweep_result{keyspace, table, r.ok});
    });
    std::ranges::sort(result.tables, std::less<>(), &sweep_result::table);

    result.ok = std::ranges::all_of(result.tables, &sweep_result::ok);
    if (result.ok) {
        fmt::print(_out, "repaired {} tables on keyspace {}...\n", tables.size(), keyspace);
    } else {
        slogger.warn("Keyspace {}: {} of {} tables failed", keyspace,
                std::ranges::count(result.tables, false, &sweep_result::ok), tables.size());
        fmt::print(_out, "failed to repair all tables on keyspace {}...\n", keyspace);
    }
    co_return result;
}

bool all_ok(const std::vector<keyspace_result>& results) noexcept {
    return std::ranges::all_of(results, &keyspace_result::ok);
}

}
