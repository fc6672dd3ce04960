// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "typegraph/datatypes.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <sstream>

namespace crdgen::typegraph {

namespace {

std::string_view to_string_view(primitive p) {
    switch (p) {
    case primitive::boolean:
        return "boolean";
    case primitive::int8:
        return "int8";
    case primitive::int16:
        return "int16";
    case primitive::int32:
        return "int32";
    case primitive::int64:
        return "int64";
    case primitive::int128:
        return "int128";
    case primitive::uint8:
        return "uint8";
    case primitive::uint16:
        return "uint16";
    case primitive::uint32:
        return "uint32";
    case primitive::uint64:
        return "uint64";
    case primitive::uint128:
        return "uint128";
    case primitive::float32:
        return "float32";
    case primitive::float64:
        return "float64";
    case primitive::string:
        return "string";
    case primitive::date:
        return "date";
    case primitive::date_time:
        return "date-time";
    }
    return "unknown";
}

std::string_view to_string_view(known_shape s) {
    switch (s) {
    case known_shape::condition:
        return "condition";
    case known_shape::object_reference:
        return "object_reference";
    case known_shape::int_or_string:
        return "int_or_string";
    }
    return "unknown";
}

type_ref_ptr copy_ptr(const type_ref_ptr& p) {
    if (!p) {
        return nullptr;
    }
    return std::make_unique<type_ref>(make_copy(*p));
}

bool equal_ptr(const type_ref_ptr& lhs, const type_ref_ptr& rhs) {
    if (!lhs || !rhs) {
        return lhs == rhs;
    }
    return *lhs == *rhs;
}

struct type_copying_visitor {
    type_ref operator()(const primitive_ref& t) const { return t; }
    type_ref operator()(const generated_ref& t) const { return t; }
    type_ref operator()(const external_ref& t) const { return t; }
    type_ref operator()(const unknown_ref& t) const { return t; }
    type_ref operator()(const sequence_ref& t) const {
        return sequence_ref{copy_ptr(t.element)};
    }
    type_ref operator()(const map_ref& t) const {
        return map_ref{copy_ptr(t.value)};
    }
    type_ref operator()(const optional_ref& t) const {
        return optional_ref{copy_ptr(t.inner)};
    }
};

struct type_printing_visitor {
    std::ostream& o;
    void operator()(const primitive_ref& t) const { o << t.type; }
    void operator()(const generated_ref& t) const {
        o << (t.boxed ? "indirect#" : "#") << t.id;
    }
    void operator()(const external_ref& t) const {
        o << "external:" << t.shape;
    }
    void operator()(const unknown_ref&) const { o << "unknown"; }
    void operator()(const sequence_ref& t) const {
        o << "sequence<" << *t.element << ">";
    }
    void operator()(const map_ref& t) const {
        o << "map<string, " << *t.value << ">";
    }
    void operator()(const optional_ref& t) const {
        o << "optional<" << *t.inner << ">";
    }
};

} // namespace

std::ostream& operator<<(std::ostream& o, primitive p) {
    return o << to_string_view(p);
}

std::ostream& operator<<(std::ostream& o, known_shape s) {
    return o << to_string_view(s);
}

bool operator==(const primitive_ref& lhs, const primitive_ref& rhs) {
    return lhs.type == rhs.type;
}
bool operator==(const generated_ref& lhs, const generated_ref& rhs) {
    return lhs.id == rhs.id && lhs.boxed == rhs.boxed;
}
bool operator==(const external_ref& lhs, const external_ref& rhs) {
    return lhs.shape == rhs.shape;
}
bool operator==(const unknown_ref&, const unknown_ref&) { return true; }
bool operator==(const sequence_ref& lhs, const sequence_ref& rhs) {
    return equal_ptr(lhs.element, rhs.element);
}
bool operator==(const map_ref& lhs, const map_ref& rhs) {
    return equal_ptr(lhs.value, rhs.value);
}
bool operator==(const optional_ref& lhs, const optional_ref& rhs) {
    return equal_ptr(lhs.inner, rhs.inner);
}

type_ref make_copy(const type_ref& t) {
    return std::visit(type_copying_visitor{}, t);
}

type_ref sequence_of(type_ref element) {
    return sequence_ref{std::make_unique<type_ref>(std::move(element))};
}

type_ref map_of(type_ref value) {
    return map_ref{std::make_unique<type_ref>(std::move(value))};
}

type_ref optional_of(type_ref inner) {
    return optional_ref{std::make_unique<type_ref>(std::move(inner))};
}

std::ostream& operator<<(std::ostream& o, const type_ref& t) {
    std::visit(type_printing_visitor{o}, t);
    return o;
}

} // namespace crdgen::typegraph

auto fmt::formatter<crdgen::typegraph::primitive>::format(
  crdgen::typegraph::primitive p, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
      crdgen::typegraph::to_string_view(p), ctx);
}

auto fmt::formatter<crdgen::typegraph::known_shape>::format(
  crdgen::typegraph::known_shape s, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
      crdgen::typegraph::to_string_view(s), ctx);
}

auto fmt::formatter<crdgen::typegraph::type_ref>::format(
  const crdgen::typegraph::type_ref& t, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    std::ostringstream o;
    o << t;
    return fmt::formatter<std::string_view>::format(o.str(), ctx);
}
