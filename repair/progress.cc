/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include "repair/progress.hh"
#include "exceptions/exceptions.hh"

namespace repair {

void table_stats::record_success(uint64_t rows) noexcept {
    repaired_rows += rows;
    ++repaired_partitions;
}

void table_stats::record_failure(std::exception_ptr cause) {
    ++failed_partitions;
    ++failures_by_cause[exceptions::exception_category(std::move(cause))];
}

progress_reporter::progress_reporter(sstring keyspace, sstring table, uint64_t total_ranges, std::ostream& out)
    : _keyspace(std::move(keyspace))
    , _table(std::move(table))
    , _total_ranges(total_ranges)
    , _out(out)
{ }

int progress_reporter::percent(const table_stats& stats) const noexcept {
    if (_total_ranges == 0) {
        return 100;
    }
    return int(stats.completed_partitions() * 100 / _total_ranges);
}

std::optional<int> progress_reporter::report(const table_stats& stats) {
    auto pct = percent(stats);
    if (pct <= _last_reported_percent) {
        return std::nullopt;
    }
    fmt::print(_out, "{}.{} repaired {} rows, {}/{} partitions ({} failed) {}%\n",
            _keyspace, _table, stats.repaired_rows, stats.repaired_partitions, _total_ranges, stats.failed_partitions, pct);
    _last_reported_percent = pct;
    return pct;
}

void progress_reporter::finish(const table_stats& stats) {
    if (stats.failures_by_cause.empty()) {
        fmt::print(_out, "{}.{} finished: repaired {} rows, {}/{} partitions\n",
                _keyspace, _table, stats.repaired_rows, stats.repaired_partitions, _total_ranges);
        return;
    }
    fmt::print(_out, "{}.{} finished: repaired {} rows, {}/{} partitions, {} failed by cause {}\n",
            _keyspace, _table, stats.repaired_rows, stats.repaired_partitions, _total_ranges,
            stats.failed_partitions, stats.failures_by_cause);
}

}
