// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "typegraph/type_graph.h"

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <sstream>
#include <stdexcept>

namespace crdgen::typegraph {

type_kind kind_of(const type_body& body) {
    struct visitor {
        type_kind operator()(const composite&) const {
            return type_kind::composite;
        }
        type_kind operator()(const unit_enum&) const {
            return type_kind::unit_enum;
        }
        type_kind operator()(const tagged_enum&) const {
            return type_kind::tagged_enum;
        }
    };
    return std::visit(visitor{}, body);
}

std::ostream& operator<<(std::ostream& o, type_kind k) {
    switch (k) {
    case type_kind::composite:
        return o << "composite";
    case type_kind::unit_enum:
        return o << "unit_enum";
    case type_kind::tagged_enum:
        return o << "tagged_enum";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, type_role r) {
    switch (r) {
    case type_role::root:
        return o << "root";
    case type_role::spec:
        return o << "spec";
    case type_role::status:
        return o << "status";
    case type_role::nested:
        return o << "nested";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, map_representation m) {
    switch (m) {
    case map_representation::ordered:
        return o << "ordered";
    case map_representation::unordered:
        return o << "unordered";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, schema_mode m) {
    switch (m) {
    case schema_mode::disabled:
        return o << "disabled";
    case schema_mode::manual:
        return o << "manual";
    case schema_mode::derived:
        return o << "derived";
    }
    return o << "unknown";
}

void type_graph::check_mutable() const {
    if (_frozen) {
        throw std::logic_error("type graph is frozen");
    }
}

type_id type_graph::add(generated_type t) {
    check_mutable();
    type_id id(static_cast<type_id::type>(_types.size()));
    t.id = id;
    _types.push_back(std::move(t));
    return id;
}

const generated_type& type_graph::get(type_id id) const {
    if (id() >= _types.size()) {
        throw std::out_of_range(fmt::format("type {} not found", id));
    }
    return _types[id()];
}

generated_type& type_graph::get_mutable(type_id id) {
    check_mutable();
    if (id() >= _types.size()) {
        throw std::out_of_range(fmt::format("type {} not found", id));
    }
    return _types[id()];
}

const generated_type* type_graph::find(std::string_view name) const {
    for (const auto& t : _types) {
        if (t.name == name) {
            return &t;
        }
    }
    return nullptr;
}

void type_graph::set_root(type_ref r) {
    check_mutable();
    _root = std::move(r);
}

void type_graph::set_map_representation(map_representation m) {
    check_mutable();
    _maps = m;
}

void type_graph::set_schema_mode(schema_mode m) {
    check_mutable();
    _schemas = m;
}

void type_graph::set_resource(ss::sstring version, bool status_subresource) {
    check_mutable();
    _version = std::move(version);
    _status_subresource = status_subresource;
}

void type_graph::add_diagnostic(diagnostic d) {
    check_mutable();
    _diagnostics.push_back(std::move(d));
}

namespace {

struct describing_visitor {
    const type_graph& g;
    std::ostream& o;

    void operator()(const primitive_ref& t) const { o << t.type; }
    void operator()(const generated_ref& t) const {
        const auto& name = t.id() < g.size() ? g.get(t.id).name
                                             : ss::sstring("<dangling>");
        if (t.boxed) {
            o << "indirect<" << name << ">";
        } else {
            o << name;
        }
    }
    void operator()(const external_ref& t) const { o << t.shape; }
    void operator()(const unknown_ref&) const { o << "unknown"; }
    void operator()(const sequence_ref& t) const {
        o << "sequence<";
        std::visit(*this, *t.element);
        o << ">";
    }
    void operator()(const map_ref& t) const {
        o << "map<string, ";
        std::visit(*this, *t.value);
        o << ">";
    }
    void operator()(const optional_ref& t) const {
        o << "optional<";
        std::visit(*this, *t.inner);
        o << ">";
    }
};

void print_body(std::ostream& o, const type_graph& g, const type_body& body) {
    if (const auto* c = std::get_if<composite>(&body)) {
        for (const auto& f : c->fields) {
            o << fmt::format(
              "  {}: {}{}{}\n",
              f.name,
              g.describe(f.type),
              f.required ? " required" : "",
              f.absent == absent_policy::treat_as_empty ? " default_empty"
                                                        : "");
        }
    } else if (const auto* u = std::get_if<unit_enum>(&body)) {
        for (const auto& l : u->literals) {
            o << fmt::format("  \"{}\" ({})\n", l.text, l.kind);
        }
    } else if (const auto* t = std::get_if<tagged_enum>(&body)) {
        for (const auto& v : t->variants) {
            o << fmt::format("  {}({})\n", v.name, g.describe(v.type));
        }
    }
}

enum class visit_state { in_progress, done };

// Depth first search over direct (not indirect) references. Returns the id
// of a type that contains itself.
std::optional<type_id> find_direct_cycle(
  const type_graph& g,
  type_id id,
  absl::btree_map<type_id, visit_state>& states) {
    auto [it, inserted] = states.emplace(id, visit_state::in_progress);
    if (!inserted) {
        if (it->second == visit_state::in_progress) {
            return id;
        }
        return std::nullopt;
    }
    std::optional<type_id> found;
    for_each_member(g.get(id).body, [&](const type_ref& member) {
        for_each_generated(member, [&](const generated_ref& r) {
            if (!found && !r.boxed) {
                found = find_direct_cycle(g, r.id, states);
            }
        });
    });
    states[id] = visit_state::done;
    return found;
}

} // namespace

ss::sstring type_graph::describe(const type_ref& t) const {
    std::ostringstream o;
    std::visit(describing_visitor{*this, o}, t);
    return o.str();
}

std::ostream& operator<<(std::ostream& o, const type_graph& g) {
    o << fmt::format(
      "root: {}\nmaps: {}\nschemas: {}\n",
      g.describe(g.root()),
      fmt::streamed(g.maps()),
      fmt::streamed(g.schemas()));
    if (g.version()) {
        o << fmt::format(
          "version: {}{}\n",
          *g.version(),
          g.status_subresource() ? " with status subresource" : "");
    }
    for (const auto& t : g.types()) {
        o << fmt::format(
          "type {} ({}, {}) at {}{}\n",
          t.name,
          fmt::streamed(t.kind()),
          fmt::streamed(t.role),
          t.origin,
          t.elided ? " elided" : "");
        if (!t.capabilities.empty()) {
            o << "  derives " << t.capabilities << "\n";
        }
        if (t.doc) {
            o << fmt::format("  doc: {}\n", *t.doc);
        }
        print_body(o, g, t.body);
    }
    for (const auto& d : g.diagnostics()) {
        o << fmt::format("diagnostic at {}: {}\n", d.where, d.message);
    }
    return o;
}

std::optional<ss::sstring> check_invariants(const type_graph& g) {
    std::optional<ss::sstring> violation;
    auto check_ref = [&](const type_ref& r, std::string_view owner) {
        for_each_generated(r, [&](const generated_ref& ref) {
            if (!violation && ref.id() >= g.size()) {
                violation = fmt::format(
                  "{} refers to missing type {}", owner, ref.id);
            }
        });
    };

    check_ref(g.root(), "root");
    absl::btree_set<std::string_view> names;
    for (const auto& t : g.types()) {
        if (!names.insert(t.name).second) {
            return fmt::format("type name {} is used twice", t.name);
        }
        if (const auto* c = std::get_if<composite>(&t.body)) {
            absl::btree_set<std::string_view> fields;
            for (const auto& f : c->fields) {
                if (!fields.insert(f.name).second) {
                    return fmt::format(
                      "field {} appears twice in {}", f.name, t.name);
                }
            }
        }
        for_each_member(
          t.body, [&](const type_ref& member) { check_ref(member, t.name); });
        if (violation) {
            return violation;
        }
    }

    absl::btree_map<type_id, visit_state> states;
    for (const auto& t : g.types()) {
        if (auto cycle = find_direct_cycle(g, t.id, states)) {
            return fmt::format(
              "type {} contains itself without indirection",
              g.get(*cycle).name);
        }
    }
    return std::nullopt;
}

} // namespace crdgen::typegraph

auto fmt::formatter<crdgen::typegraph::type_graph>::format(
  const crdgen::typegraph::type_graph& g, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    std::ostringstream o;
    o << g;
    return fmt::formatter<std::string_view>::format(o.str(), ctx);
}
