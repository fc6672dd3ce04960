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
#include "schema/node.h"
#include "schema/path.h"
#include "typegraph/capability.h"
#include "typegraph/datatypes.h"

#include <seastar/core/sstring.hh>
#include <seastar/util/bool_class.hh>

#include <fmt/core.h>

#include <iosfwd>
#include <optional>
#include <variant>
#include <vector>

namespace crdgen::typegraph {

using field_required = ss::bool_class<struct field_required_tag>;

// What a consumer should do with a field missing from a document.
enum class absent_policy : uint8_t {
    // the field is an error to omit (or optional, for non required fields)
    none,
    // required containers may be omitted and read as empty
    treat_as_empty,
};

struct field {
    ss::sstring name;
    type_ref type;
    field_required required{false};
    absent_policy absent{absent_policy::none};
    std::optional<ss::sstring> doc;
};

struct composite {
    std::vector<field> fields;
};

struct enum_literal {
    // spelling as written in the schema, e.g. "Always" or "3"
    ss::sstring text;
    schema::scalar_kind kind;
};

struct unit_enum {
    std::vector<enum_literal> literals;
};

struct tagged_variant {
    ss::sstring name;
    type_ref type;
};

struct tagged_enum {
    std::vector<tagged_variant> variants;
};

using type_body = std::variant<composite, unit_enum, tagged_enum>;

enum class type_kind : uint8_t { composite, unit_enum, tagged_enum };
type_kind kind_of(const type_body&);
std::ostream& operator<<(std::ostream&, type_kind);

enum class type_role : uint8_t { root, spec, status, nested };
std::ostream& operator<<(std::ostream&, type_role);

enum class map_representation : uint8_t { ordered, unordered };
std::ostream& operator<<(std::ostream&, map_representation);

// How an emitter provides a schema for each generated type.
enum class schema_mode : uint8_t { disabled, manual, derived };
std::ostream& operator<<(std::ostream&, schema_mode);

struct generated_type {
    type_id id;
    ss::sstring name;
    schema::path origin;
    type_body body;
    std::optional<ss::sstring> doc;
    type_role role{type_role::nested};
    capability_set capabilities;
    // kept in the graph for reference but not to be emitted
    bool elided{false};

    type_kind kind() const { return kind_of(body); }
};

// A construct that relaxed mode replaced with an unknown value.
struct diagnostic {
    schema::path where;
    ss::sstring message;
};

/**
 * The result of the analysis: every generated type, the reference to the
 * root type and the settings an emitter needs. Types refer to each other by
 * type_id, which is the index of the type in types().
 *
 * The graph may be decorated until freeze() is called; after that every
 * mutating call throws std::logic_error.
 */
class type_graph {
public:
    type_graph() = default;
    type_graph(type_graph&&) noexcept = default;
    type_graph& operator=(type_graph&&) noexcept = default;
    type_graph(const type_graph&) = delete;
    type_graph& operator=(const type_graph&) = delete;
    ~type_graph() = default;

    // The id of the type is overwritten with its position in the graph.
    type_id add(generated_type);

    const generated_type& get(type_id) const;
    generated_type& get_mutable(type_id);
    const generated_type* find(std::string_view name) const;
    const std::vector<generated_type>& types() const { return _types; }
    size_t size() const { return _types.size(); }

    const type_ref& root() const { return _root; }
    void set_root(type_ref);

    map_representation maps() const { return _maps; }
    void set_map_representation(map_representation);
    schema_mode schemas() const { return _schemas; }
    void set_schema_mode(schema_mode);

    // Set when the graph describes a custom resource: the analyzed version
    // label and whether the resource has a status subresource.
    const std::optional<ss::sstring>& version() const { return _version; }
    bool status_subresource() const { return _status_subresource; }
    void set_resource(ss::sstring version, bool status_subresource);

    const std::vector<diagnostic>& diagnostics() const { return _diagnostics; }
    void add_diagnostic(diagnostic);

    void freeze() { _frozen = true; }
    bool frozen() const { return _frozen; }

    // Renders a reference with generated types by name, e.g.
    // "sequence<RootGroups>".
    ss::sstring describe(const type_ref&) const;

    friend std::ostream& operator<<(std::ostream&, const type_graph&);

private:
    void check_mutable() const;

    std::vector<generated_type> _types;
    type_ref _root{unknown_ref{}};
    map_representation _maps{map_representation::ordered};
    schema_mode _schemas{schema_mode::disabled};
    std::optional<ss::sstring> _version;
    bool _status_subresource{false};
    std::vector<diagnostic> _diagnostics;
    bool _frozen{false};
};

/// Returns a description of the first broken invariant: a reference to a
/// missing type, two types with one name, a field name used twice in one
/// composite, or a type containing itself without an indirect reference.
std::optional<ss::sstring> check_invariants(const type_graph&);

/// Calls f for every generated reference reachable from t without passing
/// through another generated type.
template<typename Func>
void for_each_generated(const type_ref& t, Func&& f) {
    struct visitor {
        Func& f;
        void operator()(const primitive_ref&) const {}
        void operator()(const generated_ref& r) const { f(r); }
        void operator()(const external_ref&) const {}
        void operator()(const unknown_ref&) const {}
        void operator()(const sequence_ref& r) const {
            std::visit(*this, *r.element);
        }
        void operator()(const map_ref& r) const { std::visit(*this, *r.value); }
        void operator()(const optional_ref& r) const {
            std::visit(*this, *r.inner);
        }
    };
    std::visit(visitor{f}, t);
}

/// Calls f for every type reference held directly by a type body.
template<typename Func>
void for_each_member(const type_body& body, Func&& f) {
    if (const auto* c = std::get_if<composite>(&body)) {
        for (const auto& fld : c->fields) {
            f(fld.type);
        }
    } else if (const auto* t = std::get_if<tagged_enum>(&body)) {
        for (const auto& v : t->variants) {
            f(v.type);
        }
    }
}

} // namespace crdgen::typegraph

template<>
struct fmt::formatter<crdgen::typegraph::type_graph>
  : fmt::formatter<std::string_view> {
    auto format(
      const crdgen::typegraph::type_graph&, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};
