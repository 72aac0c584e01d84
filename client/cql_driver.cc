/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <seastar/core/alien.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>
#include <seastar/util/file.hh>

#include "client/cql_driver.hh"
#include "exceptions/exceptions.hh"
#include "log.hh"

namespace client {

static logging::logger cqllog("cql_driver");

namespace {

struct cass_deleter {
    void operator()(CassCluster* p) const noexcept { cass_cluster_free(p); }
    void operator()(CassSession* p) const noexcept { cass_session_free(p); }
    void operator()(CassFuture* p) const noexcept { cass_future_free(p); }
    void operator()(CassStatement* p) const noexcept { cass_statement_free(p); }
    void operator()(CassSsl* p) const noexcept { cass_ssl_free(p); }
    void operator()(CassIterator* p) const noexcept { cass_iterator_free(p); }
    void operator()(const CassPrepared* p) const noexcept { cass_prepared_free(p); }
    void operator()(const CassResult* p) const noexcept { cass_result_free(p); }
    void operator()(const CassSchemaMeta* p) const noexcept { cass_schema_meta_free(p); }
};

template <typename T>
using cass_ptr = std::unique_ptr<T, cass_deleter>;

[[noreturn]] void throw_driver_error(CassError rc, std::string_view detail) {
    std::rethrow_exception(make_driver_error(rc, detail));
}

void check(CassError rc) {
    if (rc != CASS_OK) {
        throw_driver_error(rc, {});
    }
}

// Throws the error a completed driver future failed with, if any.
void check_future(CassFuture* f) {
    auto rc = cass_future_error_code(f);
    if (rc == CASS_OK) {
        return;
    }
    const char* msg = nullptr;
    size_t len = 0;
    cass_future_error_message(f, &msg, &len);
    throw_driver_error(rc, std::string_view(msg, len));
}

struct pending_wait {
    promise<> done;
    alien::instance& alien;
    unsigned shard;
};

// Runs on a driver I/O thread.
void on_future_ready(CassFuture*, void* data) {
    auto* w = static_cast<pending_wait*>(data);
    alien::run_on(w->alien, w->shard, [w] () noexcept {
        w->done.set_value();
    });
}

// Resolves once the driver future is ready, without blocking the reactor.
future<> wait_for(CassFuture* f) {
    if (cass_future_ready(f)) {
        co_return;
    }
    auto w = std::make_unique<pending_wait>(promise<>(), engine().alien(), this_shard_id());
    auto ready = w->done.get_future();
    check(cass_future_set_callback(f, on_future_ready, w.get()));
    co_await std::move(ready);
}

template <typename Meta>
sstring meta_name(void (*get)(const Meta*, const char**, size_t*), const Meta* meta) {
    const char* name = nullptr;
    size_t len = 0;
    get(meta, &name, &len);
    return sstring(name, len);
}

CassConsistency to_driver_consistency(db::consistency_level cl) {
    switch (cl) {
    using enum db::consistency_level;
    case ANY: return CASS_CONSISTENCY_ANY;
    case ONE: return CASS_CONSISTENCY_ONE;
    case TWO: return CASS_CONSISTENCY_TWO;
    case THREE: return CASS_CONSISTENCY_THREE;
    case QUORUM: return CASS_CONSISTENCY_QUORUM;
    case ALL: return CASS_CONSISTENCY_ALL;
    case LOCAL_QUORUM: return CASS_CONSISTENCY_LOCAL_QUORUM;
    case EACH_QUORUM: return CASS_CONSISTENCY_EACH_QUORUM;
    case SERIAL: return CASS_CONSISTENCY_SERIAL;
    case LOCAL_SERIAL: return CASS_CONSISTENCY_LOCAL_SERIAL;
    case LOCAL_ONE: return CASS_CONSISTENCY_LOCAL_ONE;
    }
    throw std::invalid_argument(fmt::format("Unknown consistency level {}", int(cl)));
}

class cql_prepared_statement final : public prepared_statement {
    sstring _query;
    cass_ptr<const CassPrepared> _prepared;
    CassConsistency _consistency;
    std::chrono::milliseconds _timeout;
public:
    cql_prepared_statement(sstring query, cass_ptr<const CassPrepared> prepared, CassConsistency cl, std::chrono::milliseconds timeout)
        : _query(std::move(query))
        , _prepared(std::move(prepared))
        , _consistency(cl)
        , _timeout(timeout)
    { }

    virtual const sstring& query() const noexcept override {
        return _query;
    }

    cass_ptr<CassStatement> bind(const dht::token_range& range) const {
        cass_ptr<CassStatement> stmt(cass_prepared_bind(_prepared.get()));
        check(cass_statement_set_consistency(stmt.get(), _consistency));
        check(cass_statement_set_request_timeout(stmt.get(), _timeout.count()));
        check(cass_statement_bind_int64(stmt.get(), 0, range.start));
        check(cass_statement_bind_int64(stmt.get(), 1, range.end));
        return stmt;
    }
};

class cql_session final : public cluster_session {
    // Declared before _session: a session must be freed before its cluster.
    cass_ptr<CassCluster> _cluster;
    cass_ptr<CassSession> _session;
private:
    cass_ptr<const CassSchemaMeta> schema() const {
        return cass_ptr<const CassSchemaMeta>(cass_session_get_schema_meta(_session.get()));
    }

    static const CassKeyspaceMeta* find_keyspace(const CassSchemaMeta* schema, const sstring& keyspace) {
        auto* ks = cass_schema_meta_keyspace_by_name_n(schema, keyspace.data(), keyspace.size());
        if (!ks) {
            throw exceptions::invalid_request_exception(fmt::format("Keyspace {} does not exist", keyspace));
        }
        return ks;
    }
public:
    cql_session(cass_ptr<CassCluster> cluster, cass_ptr<CassSession> session)
        : _cluster(std::move(cluster))
        , _session(std::move(session))
    { }

    virtual future<std::vector<sstring>> list_keyspaces() override {
        auto s = schema();
        cass_ptr<CassIterator> it(cass_iterator_keyspaces_from_schema_meta(s.get()));
        std::vector<sstring> names;
        while (cass_iterator_next(it.get())) {
            names.push_back(meta_name(cass_keyspace_meta_name, cass_iterator_get_keyspace_meta(it.get())));
        }
        std::ranges::sort(names);
        co_return names;
    }

    virtual future<std::vector<sstring>> list_tables(sstring keyspace) override {
        auto s = schema();
        cass_ptr<CassIterator> it(cass_iterator_tables_from_keyspace_meta(find_keyspace(s.get(), keyspace)));
        std::vector<sstring> names;
        while (cass_iterator_next(it.get())) {
            names.push_back(meta_name(cass_table_meta_name, cass_iterator_get_table_meta(it.get())));
        }
        std::ranges::sort(names);
        co_return names;
    }

    virtual future<std::vector<sstring>> partition_key_columns(sstring keyspace, sstring table) override {
        auto s = schema();
        auto* ks = find_keyspace(s.get(), keyspace);
        auto* t = cass_keyspace_meta_table_by_name_n(ks, table.data(), table.size());
        if (!t) {
            throw exceptions::invalid_request_exception(fmt::format("Table {}.{} does not exist", keyspace, table));
        }
        std::vector<sstring> columns;
        auto n = cass_table_meta_partition_key_count(t);
        columns.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            columns.push_back(meta_name(cass_column_meta_name, cass_table_meta_partition_key(t, i)));
        }
        co_return columns;
    }

    virtual future<prepared_statement_ptr> prepare(sstring query, db::consistency_level cl, std::chrono::milliseconds timeout) override {
        cass_ptr<CassFuture> f(cass_session_prepare_n(_session.get(), query.data(), query.size()));
        co_await wait_for(f.get());
        check_future(f.get());
        cass_ptr<const CassPrepared> prepared(cass_future_get_prepared(f.get()));
        cqllog.debug("Prepared {} at CL={}, timeout={}", query, cl, timeout);
        co_return std::make_unique<cql_prepared_statement>(std::move(query), std::move(prepared), to_driver_consistency(cl), timeout);
    }

    virtual future<uint64_t> count(const prepared_statement& stmt, dht::token_range range) override {
        auto bound = static_cast<const cql_prepared_statement&>(stmt).bind(range);
        cass_ptr<CassFuture> f(cass_session_execute(_session.get(), bound.get()));
        co_await wait_for(f.get());
        check_future(f.get());
        cass_ptr<const CassResult> result(cass_future_get_result(f.get()));
        auto* row = cass_result_first_row(result.get());
        if (!row) {
            throw exceptions::protocol_exception(fmt::format("Empty result for range {} of {}", range, stmt.query()));
        }
        cass_int64_t n = 0;
        check(cass_value_get_int64(cass_row_get_column(row, 0), &n));
        co_return uint64_t(n);
    }

    virtual future<> close() override {
        if (!_session) {
            co_return;
        }
        cass_ptr<CassFuture> f(cass_session_close(_session.get()));
        co_await wait_for(f.get());
        if (auto rc = cass_future_error_code(f.get()); rc != CASS_OK) {
            cqllog.warn("Closing session failed: {}", cass_error_desc(rc));
        }
        _session.reset();
    }
};

void on_driver_log(const CassLogMessage* message, void*) {
    auto level = logging::log_level::info;
    switch (message->severity) {
    case CASS_LOG_CRITICAL:
    case CASS_LOG_ERROR:
        level = logging::log_level::error;
        break;
    case CASS_LOG_WARN:
        level = logging::log_level::warn;
        break;
    case CASS_LOG_DEBUG:
        level = logging::log_level::debug;
        break;
    case CASS_LOG_TRACE:
        level = logging::log_level::trace;
        break;
    default:
        break;
    }
    cqllog.log(level, "{} ({}:{})", message->message, message->file, message->line);
}

} // anonymous namespace

std::exception_ptr make_driver_error(CassError rc, std::string_view detail) {
    auto msg = detail.empty() ? sstring(cass_error_desc(rc)) : sstring(detail);
    switch (rc) {
    case CASS_ERROR_LIB_REQUEST_TIMED_OUT:
    case CASS_ERROR_SERVER_READ_TIMEOUT:
        return std::make_exception_ptr(exceptions::request_timeout_exception(exceptions::exception_code::READ_TIMEOUT, std::move(msg)));
    case CASS_ERROR_SERVER_WRITE_TIMEOUT:
        return std::make_exception_ptr(exceptions::request_timeout_exception(exceptions::exception_code::WRITE_TIMEOUT, std::move(msg)));
    case CASS_ERROR_SERVER_UNAVAILABLE:
    case CASS_ERROR_LIB_NO_HOSTS_AVAILABLE:
        return std::make_exception_ptr(exceptions::unavailable_exception(std::move(msg)));
    case CASS_ERROR_SERVER_OVERLOADED:
        return std::make_exception_ptr(exceptions::overloaded_exception(std::move(msg)));
    case CASS_ERROR_SERVER_IS_BOOTSTRAPPING:
        return std::make_exception_ptr(exceptions::request_execution_exception(exceptions::exception_code::IS_BOOTSTRAPPING, std::move(msg)));
    case CASS_ERROR_SERVER_READ_FAILURE:
        return std::make_exception_ptr(exceptions::request_execution_exception(exceptions::exception_code::READ_FAILURE, std::move(msg)));
    case CASS_ERROR_SERVER_BAD_CREDENTIALS:
        return std::make_exception_ptr(exceptions::authentication_exception(std::move(msg)));
    case CASS_ERROR_SERVER_UNAUTHORIZED:
        return std::make_exception_ptr(exceptions::unauthorized_exception(std::move(msg)));
    case CASS_ERROR_SERVER_SYNTAX_ERROR:
        return std::make_exception_ptr(exceptions::syntax_exception(std::move(msg)));
    case CASS_ERROR_SERVER_INVALID_QUERY:
        return std::make_exception_ptr(exceptions::invalid_request_exception(std::move(msg)));
    case CASS_ERROR_SERVER_CONFIG_ERROR:
    case CASS_ERROR_LIB_BAD_PARAMS:
        return std::make_exception_ptr(exceptions::configuration_exception(std::move(msg)));
    case CASS_ERROR_SERVER_PROTOCOL_ERROR:
    case CASS_ERROR_LIB_UNEXPECTED_RESPONSE:
        return std::make_exception_ptr(exceptions::protocol_exception(std::move(msg)));
    default:
        return std::make_exception_ptr(exceptions::server_exception(std::move(msg)));
    }
}

cql_connector::cql_connector(cql_connection_config cfg)
    : _cfg(std::move(cfg))
{ }

future<> cql_connector::start() {
    if (!_cfg.ca_certificate) {
        co_return;
    }
    try {
        _ca_certificate = co_await util::read_entire_file_contiguous(*_cfg.ca_certificate);
    } catch (const std::system_error& e) {
        throw exceptions::configuration_exception(fmt::format("Could not read CA certificate {}: {}", *_cfg.ca_certificate, e.what()));
    }
    cqllog.info("Loaded CA certificate {}", *_cfg.ca_certificate);
}

future<std::unique_ptr<cluster_session>> cql_connector::connect() {
    cass_ptr<CassCluster> cluster(cass_cluster_new());
    auto hosts = fmt::format("{}", fmt::join(_cfg.contact_points, ","));
    check(cass_cluster_set_contact_points_n(cluster.get(), hosts.data(), hosts.size()));
    check(cass_cluster_set_port(cluster.get(), _cfg.port));
    cass_cluster_set_request_timeout(cluster.get(), _cfg.request_timeout.count());
    if (_cfg.credentials) {
        auto& c = *_cfg.credentials;
        cass_cluster_set_credentials_n(cluster.get(), c.username.data(), c.username.size(), c.password.data(), c.password.size());
    }
    if (_cfg.ca_certificate) {
        cass_ptr<CassSsl> ssl(cass_ssl_new());
        check(cass_ssl_add_trusted_cert_n(ssl.get(), _ca_certificate.data(), _ca_certificate.size()));
        cass_ssl_set_verify_flags(ssl.get(), CASS_SSL_VERIFY_NONE);
        check(cass_ssl_set_min_protocol_version(ssl.get(), CASS_SSL_VERSION_TLS1_2));
        cass_cluster_set_ssl(cluster.get(), ssl.get());
    }

    cass_ptr<CassSession> session(cass_session_new());
    cass_ptr<CassFuture> f(cass_session_connect(session.get(), cluster.get()));
    co_await wait_for(f.get());
    check_future(f.get());
    cqllog.debug("Connected to {}:{}", hosts, _cfg.port);
    co_return std::make_unique<cql_session>(std::move(cluster), std::move(session));
}

void install_driver_logging() {
    cass_log_set_level(CASS_LOG_WARN);
    cass_log_set_callback(on_driver_log, nullptr);
}

}
