/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "client/cql_driver.hh"
#include "repair/sweep.hh"
#include "seastarx.hh"

namespace db {

namespace fs = std::filesystem;

// Operator settings of a sweep.
//
// Values come from, in increasing priority: the defaults below, the YAML
// file named by --options-file, and options given on the command line.
class config {
public:
    // The driver takes the request timeout as 32 bit milliseconds.
    static constexpr int max_timeout = 24 * 60 * 60;
    // Every range is held in memory for the whole sweep.
    static constexpr int64_t max_partitionsize = 100'000'000;

    std::vector<sstring> hosts;
    int port = 9042;
    std::optional<sstring> username;
    std::optional<sstring> password;
    std::optional<sstring> cacert;
    int timeout = 60;
    int concurrency = 100;
    int processes = 5;
    int64_t partitionsize = 10000;
    std::vector<sstring> keyspaces;
    std::vector<sstring> tables;

    void add_options(boost::program_options::options_description_easy_init& init);

    // Keys are the option names, lists may be YAML sequences or comma
    // separated strings.
    void read_from_yaml(const std::string& yaml);
    future<> read_from_file(fs::path path);

    // Applies the options given explicitly on the command line.
    void apply(const boost::program_options::variables_map& opts);

    // Throws exceptions::configuration_exception.
    void validate() const;

    client::cql_connection_config connection_config() const;
    repair::sweep_options sweep_options() const;
};

// Splits a comma separated list, dropping blanks around and between items.
std::vector<sstring> split_list(std::string_view list);

}
