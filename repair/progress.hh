/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <ostream>

#include <seastar/core/sstring.hh>

#include "seastarx.hh"

namespace repair {

// Outcome counters of one table repair. Owned by a single table driver and
// updated only from its completion path, one outcome at a time.
struct table_stats {
    uint64_t repaired_rows = 0;
    uint64_t repaired_partitions = 0;
    uint64_t failed_partitions = 0;
    // Failed ranges by error category, see exceptions::exception_category().
    std::map<sstring, uint64_t> failures_by_cause;

    uint64_t completed_partitions() const noexcept {
        return repaired_partitions + failed_partitions;
    }

    void record_success(uint64_t rows) noexcept;
    void record_failure(std::exception_ptr cause);
};

// Prints the progress of one table, at most one line per integer percentage.
//
// Failed ranges count as completed, so a table whose ranges keep failing
// still advances visibly. The printed percentages of a table are strictly
// increasing, which bounds the output to 100 lines no matter how many ranges
// the table has.
class progress_reporter {
    sstring _keyspace;
    sstring _table;
    uint64_t _total_ranges;
    std::ostream& _out;
    int _last_reported_percent = 0;
public:
    progress_reporter(sstring keyspace, sstring table, uint64_t total_ranges, std::ostream& out);

    // Prints a progress line if the completed percentage went past the last
    // printed one. Returns the printed percentage.
    std::optional<int> report(const table_stats& stats);

    // Prints the closing summary of the table, whatever the percentage.
    void finish(const table_stats& stats);

    int last_reported_percent() const noexcept {
        return _last_reported_percent;
    }

    int percent(const table_stats& stats) const noexcept;
};

}
