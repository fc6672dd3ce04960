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
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>
#include <seastar/util/bool_class.hh>

#include <fmt/core.h>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <variant>

namespace crdgen::typegraph {

using type_id = named_type<uint32_t, struct type_id_tag>;

enum class primitive : uint8_t {
    boolean,
    int8,
    int16,
    int32,
    int64,
    int128,
    uint8,
    uint16,
    uint32,
    uint64,
    uint128,
    float32,
    float64,
    string,
    date,
    date_time,
};
std::ostream& operator<<(std::ostream&, primitive);

// Shapes with a canonical definition outside of the generated code.
enum class known_shape : uint8_t {
    condition,
    object_reference,
    int_or_string,
};
std::ostream& operator<<(std::ostream&, known_shape);

struct primitive_ref {
    primitive type;
};

// A reference that must go through a level of indirection, because the
// target type contains the referencing type.
using indirect = ss::bool_class<struct indirect_tag>;

struct generated_ref {
    type_id id;
    indirect boxed{false};
};

struct external_ref {
    known_shape shape;
};

// Opaque JSON value.
struct unknown_ref {};

struct sequence_ref;
struct map_ref;
struct optional_ref;
using type_ref = std::variant<
  primitive_ref,
  generated_ref,
  external_ref,
  unknown_ref,
  sequence_ref,
  map_ref,
  optional_ref>;
using type_ref_ptr = std::unique_ptr<type_ref>;

struct sequence_ref {
    type_ref_ptr element;
};

// Keys are always strings.
struct map_ref {
    type_ref_ptr value;
};

struct optional_ref {
    type_ref_ptr inner;
};

bool operator==(const primitive_ref&, const primitive_ref&);
bool operator==(const generated_ref&, const generated_ref&);
bool operator==(const external_ref&, const external_ref&);
bool operator==(const unknown_ref&, const unknown_ref&);
bool operator==(const sequence_ref&, const sequence_ref&);
bool operator==(const map_ref&, const map_ref&);
bool operator==(const optional_ref&, const optional_ref&);

type_ref make_copy(const type_ref&);
type_ref sequence_of(type_ref);
type_ref map_of(type_ref);
type_ref optional_of(type_ref);

// Prints generated references by id, e.g. "sequence<#3>".
std::ostream& operator<<(std::ostream&, const type_ref&);

} // namespace crdgen::typegraph

template<>
struct fmt::formatter<crdgen::typegraph::primitive>
  : fmt::formatter<std::string_view> {
    auto format(crdgen::typegraph::primitive, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};

template<>
struct fmt::formatter<crdgen::typegraph::known_shape>
  : fmt::formatter<std::string_view> {
    auto format(crdgen::typegraph::known_shape, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};

template<>
struct fmt::formatter<crdgen::typegraph::type_ref>
  : fmt::formatter<std::string_view> {
    auto
    format(const crdgen::typegraph::type_ref&, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};
