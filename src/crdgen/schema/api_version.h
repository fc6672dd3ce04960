// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <fmt/core.h>

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace crdgen::schema {

/// Kubernetes version label ordering: any label that is not of the form
/// v<N>[alpha|beta[<M>]] sorts below every alpha, alpha below beta, beta
/// below GA. Within a stability level the major number decides, then the
/// minor number, where a missing minor sorts below any present one.
/// Unrecognized labels are ranked in lexical order, "foo1" above "foo10".
class api_version {
public:
    enum class stability : uint8_t { other, alpha, beta, ga };

    static api_version parse(std::string_view);

    stability level() const { return _level; }
    uint64_t major() const { return _major; }
    std::optional<uint64_t> minor() const { return _minor; }
    const ss::sstring& label() const { return _label; }

    friend bool operator==(const api_version& a, const api_version& b) {
        return (a <=> b) == std::strong_ordering::equal;
    }
    friend std::strong_ordering
    operator<=>(const api_version&, const api_version&);

    friend std::ostream& operator<<(std::ostream&, const api_version&);

private:
    api_version() = default;

    stability _level{stability::other};
    uint64_t _major{0};
    std::optional<uint64_t> _minor;
    ss::sstring _label;
};

} // namespace crdgen::schema

template<>
struct fmt::formatter<crdgen::schema::api_version>
  : fmt::formatter<std::string_view> {
    auto
    format(const crdgen::schema::api_version& v, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(v.label(), ctx);
    }
};
