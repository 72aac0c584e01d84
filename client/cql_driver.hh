/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <exception>
#include <filesystem>
#include <optional>
#include <string_view>

#include <cassandra.h>

#include "client/cluster.hh"

namespace client {

struct cql_credentials {
    sstring username;
    sstring password;
};

struct cql_connection_config {
    std::vector<sstring> contact_points;
    uint16_t port = 9042;
    std::optional<cql_credentials> credentials;
    // Enables TLS. Peers are not verified against it, it is only handed to
    // the driver as a trusted certificate.
    std::optional<std::filesystem::path> ca_certificate;
    std::chrono::milliseconds request_timeout = std::chrono::seconds(60);
};

/// Opens sessions through the CQL native protocol driver.
///
/// The driver runs its own I/O threads; completions are forwarded to the
/// shard that issued the request, so sessions must be used on the shard
/// that created them.
class cql_connector final : public cluster_connector {
    cql_connection_config _cfg;
    sstring _ca_certificate;
public:
    explicit cql_connector(cql_connection_config cfg);

    /// Loads the CA certificate, if configured. Must resolve before connect().
    /// Fails with exceptions::configuration_exception if it can not be read.
    future<> start();

    virtual future<std::unique_ptr<cluster_session>> connect() override;
};

/// Translates a driver error code into the matching exception from
/// exceptions/exceptions.hh. Codes without a CQL counterpart become a
/// server_exception. The driver's own description is used when \c detail is
/// empty.
std::exception_ptr make_driver_error(CassError rc, std::string_view detail);

/// Forwards the driver's warnings and errors to the cql_driver logger.
/// Must be called before the first connection is opened.
void install_driver_logging();

}
