/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <optional>
#include <system_error>

#include <fmt/ostream.h>

#include <seastar/core/coroutine.hh>

#include "exceptions/exceptions.hh"
#include "log.hh"
#include "repair/read_repair.hh"

namespace bpo = boost::program_options;

namespace repair {

static logging::logger rrlogger("read_repair");

future<db::config> load_config(const bpo::variables_map& opts) {
    db::config cfg;
    if (opts.contains("options-file")) {
        auto path = opts["options-file"].as<sstring>();
        try {
            co_await cfg.read_from_file(std::string(path));
        } catch (const std::system_error& e) {
            throw exceptions::configuration_exception(fmt::format("Could not read options file {}: {}", path, e.what()));
        }
    }
    cfg.apply(opts);
    cfg.validate();
    co_return cfg;
}

int sweep_exit_code(const std::vector<keyspace_result>& results) noexcept {
    return all_ok(results) ? sweep_succeeded : sweep_failed;
}

future<int> run_read_repair(const bpo::variables_map& opts, connector_factory make_connector,
        std::ostream& out, std::ostream& err) {
    std::optional<db::config> cfg;
    std::unique_ptr<client::cluster_connector> connector;
    try {
        cfg.emplace(co_await load_config(opts));
        connector = co_await make_connector(*cfg);
    } catch (const exceptions::configuration_exception& e) {
        fmt::print(err, "error: {}\n", e.what());
        co_return invalid_configuration;
    }

    sweep_coordinator sweep(*connector, cfg->sweep_options(), out);
    try {
        co_return sweep_exit_code(co_await sweep.run());
    } catch (const exceptions::configuration_exception& e) {
        fmt::print(err, "error: {}\n", e.what());
        co_return invalid_configuration;
    } catch (...) {
        rrlogger.error("Sweep aborted: {}", std::current_exception());
        fmt::print(err, "error: sweep aborted: {}\n", std::current_exception());
        co_return sweep_failed;
    }
}

}
