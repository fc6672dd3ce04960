// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "schema/path.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <iterator>

namespace crdgen::schema {

path path::operator/(path_segment s) const {
    path copy = *this;
    copy.push(std::move(s));
    return copy;
}

std::vector<ss::sstring> path::named_segments() const {
    std::vector<ss::sstring> out;
    for (const auto& s : _segments) {
        if (const auto* p = std::get_if<property_segment>(&s)) {
            out.push_back(p->name);
        } else if (const auto* v = std::get_if<variant_segment>(&s)) {
            out.push_back(v->name);
        }
    }
    return out;
}

namespace {
struct segment_printer {
    fmt::memory_buffer& buf;
    void operator()(const property_segment& s) const {
        fmt::format_to(std::back_inserter(buf), ".{}", s.name);
    }
    void operator()(const items_segment&) const {
        fmt::format_to(std::back_inserter(buf), "[]");
    }
    void operator()(const value_segment&) const {
        fmt::format_to(std::back_inserter(buf), "{{}}");
    }
    void operator()(const variant_segment& s) const {
        fmt::format_to(std::back_inserter(buf), "|{}", s.name);
    }
};

std::string render(const path& p) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "{}", p.root());
    for (const auto& s : p.segments()) {
        std::visit(segment_printer{buf}, s);
    }
    return fmt::to_string(buf);
}
} // namespace

std::ostream& operator<<(std::ostream& o, const path& p) {
    return o << render(p);
}

} // namespace crdgen::schema

auto fmt::formatter<crdgen::schema::path>::format(
  const crdgen::schema::path& p, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
      crdgen::schema::render(p), ctx);
}
