/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <ostream>

#include <boost/program_options.hpp>

#include <seastar/util/noncopyable_function.hh>

#include "db/config.hh"
#include "repair/sweep.hh"

namespace repair {

// Process exit codes.
constexpr int sweep_succeeded = 0;
constexpr int sweep_failed = 1;
constexpr int invalid_configuration = 2;

using connector_factory = noncopyable_function<future<std::unique_ptr<client::cluster_connector>> (const db::config&)>;

// Loads the options file named by --options-file, if any, applies the
// command line on top of it and validates the result.
//
// Throws exceptions::configuration_exception, also when the file can not be
// read.
future<db::config> load_config(const boost::program_options::variables_map& opts);

// Runs a whole sweep as the scylla-read-repair tool does and returns its exit
// code. Configuration problems, including those raised by make_connector,
// are printed to \c err and yield invalid_configuration before anything is
// sent to the cluster.
future<int> run_read_repair(const boost::program_options::variables_map& opts, connector_factory make_connector,
        std::ostream& out, std::ostream& err);

int sweep_exit_code(const std::vector<keyspace_result>& results) noexcept;

}
