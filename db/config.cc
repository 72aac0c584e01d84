/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/algorithm/string.hpp>
#include <yaml-cpp/yaml.h>

#include <seastar/core/coroutine.hh>
#include <seastar/util/file.hh>

#include "db/config.hh"
#include "exceptions/exceptions.hh"
#include "log.hh"

namespace bpo = boost::program_options;

namespace db {

static logging::logger cfglog("config");

std::vector<sstring> split_list(std::string_view list) {
    std::vector<std::string> items;
    boost::split(items, list, boost::algorithm::is_any_of(","));
    std::vector<sstring> result;
    for (auto& item : items) {
        boost::algorithm::trim(item);
        if (!item.empty()) {
            result.emplace_back(item);
        }
    }
    return result;
}

static std::vector<sstring> as_list(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<sstring> result;
        for (auto&& item : node) {
            result.emplace_back(item.as<std::string>());
        }
        return result;
    }
    return split_list(node.as<std::string>());
}

void config::add_options(bpo::options_description_easy_init& init) {
    init("hosts", bpo::value<sstring>(), "comma delimited target hosts to connect to (required)");
    init("port", bpo::value<int>()->default_value(port), "CQL native transport port");
    init("username", bpo::value<sstring>(), "username to login as");
    init("password", bpo::value<sstring>(), "user password");
    init("cacert", bpo::value<sstring>(), "SSL CA certificates path, enables TLS");
    init("timeout", bpo::value<int>()->default_value(timeout), "request timeout in seconds");
    init("concurrency", bpo::value<int>()->default_value(concurrency), "range queries in flight per table");
    init("processes", bpo::value<int>()->default_value(processes), "number of tables to repair in parallel");
    init("partitionsize", bpo::value<int64_t>()->default_value(partitionsize), "number of token ranges to split the ring into");
    init("keyspaces", bpo::value<sstring>(), "comma separated keyspaces to repair (default: all)");
    init("tables", bpo::value<sstring>(), "comma separated tables to repair (default: all)");
    init("options-file", bpo::value<sstring>(), "YAML file with values for any of the options above");
}

void config::read_from_yaml(const std::string& yaml) {
    try {
        auto doc = YAML::Load(yaml);
        if (doc.IsNull()) {
            return;
        }
        if (!doc.IsMap()) {
            throw exceptions::configuration_exception("Options file must be a YAML map");
        }
        for (auto&& kv : doc) {
            auto key = kv.first.as<std::string>();
            auto& value = kv.second;
            if (key == "hosts") {
                hosts = as_list(value);
            } else if (key == "port") {
                port = value.as<int>();
            } else if (key == "username") {
                username = value.as<std::string>();
            } else if (key == "password") {
                password = value.as<std::string>();
            } else if (key == "cacert") {
                cacert = value.as<std::string>();
            } else if (key == "timeout") {
                timeout = value.as<int>();
            } else if (key == "concurrency") {
                concurrency = value.as<int>();
            } else if (key == "processes") {
                processes = value.as<int>();
            } else if (key == "partitionsize") {
                partitionsize = value.as<int64_t>();
            } else if (key == "keyspaces") {
                keyspaces = as_list(value);
            } else if (key == "tables") {
                tables = as_list(value);
            } else {
                throw exceptions::configuration_exception(fmt::format("Unknown option {} in options file", key));
            }
        }
    } catch (const YAML::Exception& e) {
        throw exceptions::configuration_exception(fmt::format("Invalid options file: {}", e.what()));
    }
}

future<> config::read_from_file(fs::path path) {
    cfglog.info("Reading options from {}", path);
    auto yaml = co_await util::read_entire_file_contiguous(path);
    read_from_yaml(std::string(yaml.begin(), yaml.end()));
}

void config::apply(const bpo::variables_map& opts) {
    auto given = [&opts] (const char* name) {
        auto it = opts.find(name);
        return it != opts.end() && !it->second.defaulted();
    };
    if (given("hosts")) {
        hosts = split_list(opts["hosts"].as<sstring>());
    }
    if (given("port")) {
        port = opts["port"].as<int>();
    }
    if (given("username")) {
        username = opts["username"].as<sstring>();
    }
    if (given("password")) {
        password = opts["password"].as<sstring>();
    }
    if (given("cacert")) {
        cacert = opts["cacert"].as<sstring>();
    }
    if (given("timeout")) {
        timeout = opts["timeout"].as<int>();
    }
    if (given("concurrency")) {
        concurrency = opts["concurrency"].as<int>();
    }
    if (given("processes")) {
        processes = opts["processes"].as<int>();
    }
    if (given("partitionsize")) {
        partitionsize = opts["partitionsize"].as<int64_t>();
    }
    if (given("keyspaces")) {
        keyspaces = split_list(opts["keyspaces"].as<sstring>());
    }
    if (given("tables")) {
        tables = split_list(opts["tables"].as<sstring>());
    }
}

void config::validate() const {
    if (hosts.empty()) {
        log_error_and_throw<exceptions::configuration_exception>(cfglog, "--hosts is required");
    }
    if (port < 1 || port > 65535) {
        log_error_and_throw<exceptions::configuration_exception>(cfglog, "--port must be within [1, 65535], got {}", port);
    }
    auto require_positive = [] (const char* name, int64_t value) {
        if (value < 1) {
            log_error_and_throw<exceptions::configuration_exception>(cfglog, "--{} must be positive, got {}", name, value);
        }
    };
    auto require_at_most = [] (const char* name, int64_t value, int64_t limit) {
        if (value > limit) {
            log_error_and_throw<exceptions::configuration_exception>(cfglog, "--{} must be at most {}, got {}", name, limit, value);
        }
    };
    require_positive("timeout", timeout);
    require_at_most("timeout", timeout, max_timeout);
    require_positive("concurrency", concurrency);
    require_positive("processes", processes);
    require_positive("partitionsize", partitionsize);
    require_at_most("partitionsize", partitionsize, max_partitionsize);
    if (username.has_value() != password.has_value()) {
        log_error_and_throw<exceptions::configuration_exception>(cfglog, "--username and --password must be given together");
    }
}

client::cql_connection_config config::connection_config() const {
    client::cql_connection_config cfg;
    cfg.contact_points = hosts;
    cfg.port = uint16_t(port);
    // Empty credentials mean no authentication.
    if (username && password && !username->empty() && !password->empty()) {
        cfg.credentials = client::cql_credentials{*username, *password};
    }
    if (cacert) {
        cfg.ca_certificate = fs::path(std::string(*cacert));
    }
    cfg.request_timeout = std::chrono::seconds(timeout);
    return cfg;
}

repair::sweep_options config::sweep_options() const {
    repair::sweep_options opts;
    opts.keyspaces = keyspaces;
    opts.tables = tables;
    opts.partition_count = uint64_t(partitionsize);
    opts.process_limit = size_t(processes);
    opts.table.concurrency = size_t(concurrency);
    opts.table.timeout = std::chrono::seconds(timeout);
    return opts;
}

}
