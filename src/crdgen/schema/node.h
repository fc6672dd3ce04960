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

#include <absl/container/btree_set.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <variant>
#include <vector>

namespace crdgen::schema {

using node_id = named_type<uint32_t, struct node_id_tag>;

enum class scalar_kind : uint8_t { string, integer, number, boolean };
std::ostream& operator<<(std::ostream&, scalar_kind);

struct scalar_node {
    scalar_kind kind;
    std::optional<ss::sstring> format;
    bool operator==(const scalar_node&) const = default;
};

struct property {
    ss::sstring name;
    node_id node;
    bool operator==(const property&) const = default;
};

// Whether the property order of an object is the order in which the source
// declared it. When it is not, consumers sort fields lexically.
using declared_order = ss::bool_class<struct declared_order_tag>;

struct object_node {
    std::vector<property> properties;
    absl::btree_set<ss::sstring> required;
    declared_order ordered{true};

    const property* find(std::string_view name) const;
};

struct array_node {
    // Absent when the source omitted the items schema.
    std::optional<node_id> items;
};

struct map_node {
    node_id value;
};

enum class union_kind : uint8_t { one_of, any_of };
std::ostream& operator<<(std::ostream&, union_kind);

struct union_node {
    union_kind kind;
    std::vector<node_id> variants;
};

struct literal {
    scalar_kind kind;
    // The literal as spelled in the source, e.g. "Always" or "42".
    ss::sstring text;
    bool operator==(const literal&) const = default;
};

struct enumeration_node {
    scalar_kind kind;
    std::vector<literal> literals;
};

// allOf
struct intersection_node {
    std::vector<node_id> branches;
};

// No schema at all, or x-kubernetes-preserve-unknown-fields on a node with
// no structure of its own.
struct unknown_node {};

using node_kind = std::variant<
  scalar_node,
  object_node,
  array_node,
  map_node,
  union_node,
  enumeration_node,
  intersection_node,
  unknown_node>;

std::string_view kind_name(const node_kind&);

struct node {
    node_kind kind{unknown_node{}};
    bool nullable{false};
    bool int_or_string{false};
    bool preserve_unknown_fields{false};
    bool embedded_resource{false};
    std::optional<ss::sstring> title;
    std::optional<ss::sstring> description;
};

/// Arena owning every node of one schema. Nodes refer to each other through
/// node_id, which lets a definition be shared by several parents and lets a
/// descendant refer back to its ancestor.
class tree {
public:
    tree() = default;
    tree(tree&&) noexcept = default;
    tree& operator=(tree&&) noexcept = default;
    tree(const tree&) = delete;
    tree& operator=(const tree&) = delete;
    ~tree() = default;

    node_id add(node);
    // Allocates an id whose content is supplied later through define().
    // Used for forward references while a $ref target is being parsed.
    node_id reserve();
    void define(node_id, node);

    const node& get(node_id) const;
    bool contains(node_id id) const { return id() < _nodes.size(); }
    // false for ids that were reserved but not defined yet
    bool is_defined(node_id id) const {
        return contains(id) && _nodes[id()].has_value();
    }
    size_t size() const { return _nodes.size(); }

    node_id root() const;
    bool has_root() const { return _root.has_value(); }
    void set_root(node_id id);

private:
    void validate(const node&) const;

    std::vector<std::optional<node>> _nodes;
    std::optional<node_id> _root;
};

} // namespace crdgen::schema

template<>
struct fmt::formatter<crdgen::schema::scalar_kind>
  : fmt::formatter<std::string_view> {
    auto format(crdgen::schema::scalar_kind, fmt::format_context& ctx) const
      -> decltype(ctx.out());
};
