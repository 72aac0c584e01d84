/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <fmt/ostream.h> // remove once all seastar types can be formatted via formatter
#include <filesystem>
#include <seastar/util/log.hh>

using namespace seastar;

template <> struct fmt::formatter<std::filesystem::path> : fmt::ostream_formatter {};
