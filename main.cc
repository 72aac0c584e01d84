/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string_view>

#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>

#include "client/cql_driver.hh"
#include "repair/read_repair.hh"

// The CQL driver does the network I/O on threads of its own, one reactor
// shard is all the orchestration needs.
static std::vector<char*> with_default_smp(int ac, char** av) {
    static char smp_opt[] = "--smp";
    static char smp_default[] = "1";
    std::vector<char*> args(av, av + ac);
    bool has_smp = std::ranges::any_of(args, [] (const char* arg) {
        std::string_view a(arg);
        return a.starts_with("--smp") || a.starts_with("-c");
    });
    if (!has_smp) {
        args.push_back(smp_opt);
        args.push_back(smp_default);
    }
    args.push_back(nullptr);
    return args;
}

static future<std::unique_ptr<client::cluster_connector>> make_cql_connector(const db::config& cfg) {
    client::install_driver_logging();
    auto connector = std::make_unique<client::cql_connector>(cfg.connection_config());
    co_await connector->start();
    co_return std::unique_ptr<client::cluster_connector>(std::move(connector));
}

int main(int ac, char** av) {
    std::setvbuf(stdout, nullptr, _IOLBF, 1000);
    app_template::config app_cfg;
    app_cfg.name = "scylla-read-repair";
    app_cfg.description =
R"(scylla-read-repair - cluster wide read repair

Reads every partition of the selected tables at consistency level ALL, one
token range at a time, so that the cluster reconciles every replica it reads.
)";
    app_template app(std::move(app_cfg));

    db::config cfg;
    auto init = app.get_options_description().add_options();
    cfg.add_options(init);

    auto args = with_default_smp(ac, av);
    return app.run(int(args.size() - 1), args.data(), [&app] {
        return repair::run_read_repair(app.configuration(), make_cql_connector, std::cout, std::cerr);
    });
}
