// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/errors.h"

#include <fmt/format.h>

#include <ostream>

namespace crdgen::analysis {

namespace {
std::string_view to_string_view(analysis_errc e) {
    switch (e) {
    case analysis_errc::unsupported_schema_construct:
        return "unsupported_schema_construct";
    case analysis_errc::naming_collision:
        return "naming_collision";
    case analysis_errc::irreconcilable_union:
        return "irreconcilable_union";
    case analysis_errc::reconcile_error:
        return "reconcile_error";
    case analysis_errc::cycle_depth_exceeded:
        return "cycle_depth_exceeded";
    case analysis_errc::cancelled:
        return "cancelled";
    }
    return "unknown";
}
} // namespace

std::string analysis_category::message(int c) const {
    switch (static_cast<analysis_errc>(c)) {
    case analysis_errc::unsupported_schema_construct:
        return "Schema construct is not supported";
    case analysis_errc::naming_collision:
        return "No unique name could be derived for a type";
    case analysis_errc::irreconcilable_union:
        return "Union variants cannot be told apart";
    case analysis_errc::reconcile_error:
        return "Schema versions cannot be reconciled";
    case analysis_errc::cycle_depth_exceeded:
        return "Schema nesting exceeds the supported depth";
    case analysis_errc::cancelled:
        return "Analysis was cancelled";
    default:
        return "Unknown error";
    }
}

const std::error_category& error_category() noexcept {
    static analysis_category e;
    return e;
}

std::error_code make_error_code(analysis_errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

std::ostream& operator<<(std::ostream& o, analysis_errc e) {
    return o << to_string_view(e);
}

analysis_error::analysis_error(
  analysis_errc code, schema::path where, ss::sstring detail)
  : _code(code)
  , _where(std::move(where))
  , _detail(std::move(detail))
  , _msg(fmt::format("{} at {}: {}", to_string_view(code), _where, _detail)) {}

} // namespace crdgen::analysis

auto fmt::formatter<crdgen::analysis::analysis_errc>::format(
  crdgen::analysis::analysis_errc e, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
      crdgen::analysis::to_string_view(e), ctx);
}
