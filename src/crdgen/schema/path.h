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

#include <iosfwd>
#include <variant>
#include <vector>

namespace crdgen::schema {

struct property_segment {
    ss::sstring name;
    bool operator==(const property_segment&) const = default;
};
struct items_segment {
    bool operator==(const items_segment&) const = default;
};
struct value_segment {
    bool operator==(const value_segment&) const = default;
};
struct variant_segment {
    ss::sstring name;
    bool operator==(const variant_segment&) const = default;
};

using path_segment = std::
  variant<property_segment, items_segment, value_segment, variant_segment>;

/// Location of a schema node relative to the schema root, e.g.
/// "Root.spec.groups[].name". Array items render as "[]", map values as "{}"
/// and union variants as "|Variant".
class path {
public:
    path() = default;
    explicit path(ss::sstring root)
      : _root(std::move(root)) {}

    const ss::sstring& root() const { return _root; }
    const std::vector<path_segment>& segments() const { return _segments; }
    bool is_root() const { return _segments.empty(); }
    size_t depth() const { return _segments.size(); }

    path operator/(path_segment) const;
    void push(path_segment s) { _segments.push_back(std::move(s)); }
    void pop() { _segments.pop_back(); }

    // Property and variant names from the root downwards. Items and map
    // values contribute nothing: they are named after their holder.
    std::vector<ss::sstring> named_segments() const;

    bool operator==(const path&) const = default;

    friend std::ostream& operator<<(std::ostream&, const path&);

private:
    ss::sstring _root;
    std::vector<path_segment> _segments;
};

} // namespace crdgen::schema

template<>
struct fmt::formatter<crdgen::schema::path>
  : fmt::formatter<std::string_view> {
    auto format(const crdgen::schema::path&, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};
