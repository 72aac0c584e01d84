/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <seastar/core/coroutine.hh>
#include <seastar/testing/test_case.hh>

#include "client/cql_driver.hh"
#include "repair/read_repair.hh"
#include "tests/fake_cluster.hh"

namespace bpo = boost::program_options;
namespace fs = std::filesystem;

static bpo::variables_map parse(std::vector<const char*> args) {
    db::config defaults;
    bpo::options_description desc("test");
    auto init = desc.add_options();
    defaults.add_options(init);
    args.insert(args.begin(), "scylla-read-repair");
    bpo::variables_map vm;
    bpo::store(bpo::parse_command_line(int(args.size()), args.data(), desc), vm);
    bpo::notify(vm);
    return vm;
}

namespace {

// Hands out connectors to the fake cluster and remembers the options it was
// called with.
struct fake_factory {
    tests::fake_cluster cluster;
    size_t calls = 0;
    std::vector<sstring> hosts;
    uint64_t partition_count = 0;

    repair::connector_factory make() {
        return [this] (const db::config& cfg) {
            ++calls;
            hosts = cfg.hosts;
            partition_count = cfg.sweep_options().partition_count;
            return make_ready_future<std::unique_ptr<client::cluster_connector>>(std::make_unique<tests::fake_connector>(cluster));
        };
    }
};

}

SEASTAR_TEST_CASE(test_all_tables_repaired) {
    fake_factory f;
    f.cluster.add_table("ks", "t1");
    f.cluster.add_table("ks", "t2");
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "10.0.0.1, 10.0.0.2", "--partitionsize", "8"}), f.make(), out, err);

    BOOST_REQUIRE_EQUAL(code, repair::sweep_succeeded);
    BOOST_REQUIRE_EQUAL(f.calls, 1u);
    BOOST_REQUIRE(f.hosts == std::vector<sstring>({"10.0.0.1", "10.0.0.2"}));
    BOOST_REQUIRE_EQUAL(f.cluster.attempts["ks.t1"], 8u);
    BOOST_REQUIRE_EQUAL(f.cluster.attempts["ks.t2"], 8u);
    BOOST_REQUIRE(err.str().empty());
}

SEASTAR_TEST_CASE(test_failed_ranges_keep_exit_code) {
    fake_factory f;
    auto ranges = dht::split_token_ring(8);
    f.cluster.add_table("ks", "t").failing_ranges = {ranges[0].start, ranges[5].start};
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--partitionsize", "8"}), f.make(), out, err);

    BOOST_REQUIRE_EQUAL(code, repair::sweep_succeeded);
}

SEASTAR_TEST_CASE(test_table_failure) {
    fake_factory f;
    f.cluster.add_table("ks", "good");
    f.cluster.add_table("ks", "bad").broken_schema = true;
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--partitionsize", "8"}), f.make(), out, err);

    BOOST_REQUIRE_EQUAL(code, repair::sweep_failed);
    BOOST_REQUIRE_EQUAL(f.cluster.attempts["ks.good"], 8u);
}

SEASTAR_TEST_CASE(test_unreachable_cluster) {
    fake_factory f;
    f.cluster.add_table("ks", "t");
    f.cluster.refuse_connections = true;
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1"}), f.make(), out, err);

    BOOST_REQUIRE_EQUAL(code, repair::sweep_failed);
    BOOST_REQUIRE(err.str().starts_with("error: sweep aborted"));
}

SEASTAR_TEST_CASE(test_invalid_options) {
    fake_factory f;
    f.cluster.add_table("ks", "t");
    std::ostringstream out, err;

    // No --hosts.
    auto code = co_await repair::run_read_repair(parse({}), f.make(), out, err);
    BOOST_REQUIRE_EQUAL(code, repair::invalid_configuration);

    code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--concurrency", "0"}), f.make(), out, err);
    BOOST_REQUIRE_EQUAL(code, repair::invalid_configuration);

    code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--username", "cassandra"}), f.make(), out, err);
    BOOST_REQUIRE_EQUAL(code, repair::invalid_configuration);

    BOOST_REQUIRE_EQUAL(f.calls, 0u);
    BOOST_REQUIRE_EQUAL(f.cluster.sessions_opened, 0u);
    BOOST_REQUIRE(out.str().empty());
    BOOST_REQUIRE(err.str().starts_with("error: "));
}

SEASTAR_TEST_CASE(test_missing_options_file) {
    fake_factory f;
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--options-file", "/nonexistent/read-repair.yaml"}),
            f.make(), out, err);

    BOOST_REQUIRE_EQUAL(code, repair::invalid_configuration);
    BOOST_REQUIRE_EQUAL(f.calls, 0u);
    BOOST_REQUIRE(err.str().find("/nonexistent/read-repair.yaml") != std::string::npos);
}

SEASTAR_TEST_CASE(test_options_file_and_command_line) {
    auto path = fs::temp_directory_path() / fmt::format("read_repair_test_{}.yaml", ::getpid());
    {
        std::ofstream yaml(path);
        yaml << "hosts: 10.0.0.1\n"
             << "partitionsize: 4\n"
             << "tables: [t1]\n";
    }
    fake_factory f;
    f.cluster.add_table("ks", "t1");
    f.cluster.add_table("ks", "t2");
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--options-file", path.c_str(), "--partitionsize", "16"}), f.make(), out, err);
    fs::remove(path);

    BOOST_REQUIRE_EQUAL(code, repair::sweep_succeeded);
    BOOST_REQUIRE(f.hosts == std::vector<sstring>({"10.0.0.1"}));
    BOOST_REQUIRE_EQUAL(f.partition_count, 16u);
    BOOST_REQUIRE_EQUAL(f.cluster.attempts["ks.t1"], 16u);
    BOOST_REQUIRE(!f.cluster.attempts.contains("ks.t2"));
}

SEASTAR_TEST_CASE(test_unreadable_ca_certificate) {
    fake_factory f;
    std::ostringstream out, err;
    auto code = co_await repair::run_read_repair(parse({"--hosts", "127.0.0.1", "--cacert", "/nonexistent/ca.pem"}),
            [] (const db::config& cfg) -> future<std::unique_ptr<client::cluster_connector>> {
        auto connector = std::make_unique<client::cql_connector>(cfg.connection_config());
        co_await connector->start();
        co_return std::unique_ptr<client::cluster_connector>(std::move(connector));
    }, out, err);

    BOOST_REQUIRE_EQUAL(code, repair::invalid_configuration);
    BOOST_REQUIRE(err.str().find("/nonexistent/ca.pem") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_sweep_exit_code) {
    std::vector<repair::keyspace_result> results;
    BOOST_REQUIRE_EQUAL(repair::sweep_exit_code(results), repair::sweep_succeeded);
    results.push_back(repair::keyspace_result{"ks1", {{"ks1", "t", true}}, true});
    BOOST_REQUIRE_EQUAL(repair::sweep_exit_code(results), repair::sweep_succeeded);
    results.push_back(repair::keyspace_result{"ks2", {{"ks2", "t", false}}, false});
    BOOST_REQUIRE_EQUAL(repair::sweep_exit_code(results), repair::sweep_failed);
}
