// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "schema/node.h"

#include <fmt/format.h>

#include <ostream>
#include <stdexcept>

namespace crdgen::schema {

namespace {
std::string_view to_string_view(scalar_kind k) {
    switch (k) {
    case scalar_kind::string:
        return "string";
    case scalar_kind::integer:
        return "integer";
    case scalar_kind::number:
        return "number";
    case scalar_kind::boolean:
        return "boolean";
    }
    return "unknown";
}

struct kind_name_visitor {
    std::string_view operator()(const scalar_node& s) const {
        return to_string_view(s.kind);
    }
    std::string_view operator()(const object_node&) const { return "object"; }
    std::string_view operator()(const array_node&) const { return "array"; }
    std::string_view operator()(const map_node&) const { return "map"; }
    std::string_view operator()(const union_node& u) const {
        return u.kind == union_kind::one_of ? "oneOf" : "anyOf";
    }
    std::string_view operator()(const enumeration_node&) const {
        return "enum";
    }
    std::string_view operator()(const intersection_node&) const {
        return "allOf";
    }
    std::string_view operator()(const unknown_node&) const {
        return "unknown";
    }
};
} // namespace

std::ostream& operator<<(std::ostream& o, scalar_kind k) {
    return o << to_string_view(k);
}

std::ostream& operator<<(std::ostream& o, union_kind k) {
    return o << (k == union_kind::one_of ? "oneOf" : "anyOf");
}

std::string_view kind_name(const node_kind& k) {
    return std::visit(kind_name_visitor{}, k);
}

const property* object_node::find(std::string_view name) const {
    for (const auto& p : properties) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

node_id tree::add(node n) {
    validate(n);
    node_id id(static_cast<node_id::type>(_nodes.size()));
    _nodes.emplace_back(std::move(n));
    return id;
}

node_id tree::reserve() {
    node_id id(static_cast<node_id::type>(_nodes.size()));
    _nodes.emplace_back(std::nullopt);
    return id;
}

void tree::define(node_id id, node n) {
    if (!contains(id)) {
        throw std::out_of_range(fmt::format("schema node {} not found", id));
    }
    auto& slot = _nodes[id()];
    if (slot.has_value()) {
        throw std::logic_error(
          fmt::format("schema node {} is already defined", id));
    }
    validate(n);
    slot = std::move(n);
}

const node& tree::get(node_id id) const {
    if (!contains(id)) {
        throw std::out_of_range(fmt::format("schema node {} not found", id));
    }
    const auto& slot = _nodes[id()];
    if (!slot.has_value()) {
        throw std::logic_error(
          fmt::format("schema node {} is reserved but not defined", id));
    }
    return *slot;
}

node_id tree::root() const {
    if (!_root) {
        throw std::logic_error("schema tree has no root");
    }
    return *_root;
}

void tree::set_root(node_id id) {
    if (!contains(id)) {
        throw std::out_of_range(fmt::format("schema node {} not found", id));
    }
    _root = id;
}

void tree::validate(const node& n) const {
    const auto* obj = std::get_if<object_node>(&n.kind);
    if (obj == nullptr) {
        return;
    }
    absl::btree_set<std::string_view> names;
    for (const auto& p : obj->properties) {
        if (!names.insert(p.name).second) {
            throw std::invalid_argument(
              fmt::format("duplicate property '{}'", p.name));
        }
    }
    for (const auto& r : obj->required) {
        if (!names.contains(r)) {
            throw std::invalid_argument(fmt::format(
              "required property '{}' is not a declared property", r));
        }
    }
}

} // namespace crdgen::schema

auto fmt::formatter<crdgen::schema::scalar_kind>::format(
  crdgen::schema::scalar_kind k, fmt::format_context& ctx) const
  -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
      crdgen::schema::to_string_view(k), ctx);
}
