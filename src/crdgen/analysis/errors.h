// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "base/outcome.h"
#include "base/seastarx.h"
#include "schema/path.h"

#include <seastar/core/sstring.hh>

#include <fmt/core.h>

#include <exception>
#include <string>
#include <system_error>

namespace crdgen::analysis {

enum class analysis_errc {
    unsupported_schema_construct = 1,
    naming_collision,
    irreconcilable_union,
    reconcile_error,
    cycle_depth_exceeded,
    cancelled,
};

struct analysis_category final : public std::error_category {
    const char* name() const noexcept final { return "crdgen::analysis"; }
    std::string message(int c) const final;
};
const std::error_category& error_category() noexcept;
std::error_code make_error_code(analysis_errc e) noexcept;

std::ostream& operator<<(std::ostream&, analysis_errc);

/// Failure of an analysis step: the classification, the location in the
/// schema it applies to, and a human readable explanation.
class analysis_error final : public std::exception {
public:
    analysis_error(analysis_errc code, schema::path where, ss::sstring detail);

    analysis_errc code() const noexcept { return _code; }
    const schema::path& where() const noexcept { return _where; }
    const ss::sstring& detail() const noexcept { return _detail; }

    const char* what() const noexcept final { return _msg.c_str(); }

private:
    analysis_errc _code;
    schema::path _where;
    ss::sstring _detail;
    std::string _msg;
};

template<typename T>
using analysis_outcome = checked<T, analysis_error>;

} // namespace crdgen::analysis

namespace std {
template<>
struct is_error_code_enum<crdgen::analysis::analysis_errc> : true_type {};
} // namespace std

template<>
struct fmt::formatter<crdgen::analysis::analysis_errc>
  : fmt::formatter<std::string_view> {
    auto format(crdgen::analysis::analysis_errc, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};
