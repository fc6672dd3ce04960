// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/known_shapes.h"

#include <array>
#include <string_view>

namespace crdgen::analysis {

namespace {
constexpr std::array<std::string_view, 5> condition_properties{
  "lastTransitionTime", "message", "reason", "status", "type"};
constexpr std::array<std::string_view, 2> condition_required{"status", "type"};
constexpr std::string_view condition_optional = "observedGeneration";

constexpr std::array<std::string_view, 7> object_reference_properties{
  "apiVersion",
  "fieldPath",
  "kind",
  "name",
  "namespace",
  "resourceVersion",
  "uid"};

bool is_string_scalar(const schema::tree& t, schema::node_id id) {
    const auto* s = std::get_if<schema::scalar_node>(&t.get(id).kind);
    return s != nullptr && s->kind == schema::scalar_kind::string;
}

std::optional<schema::scalar_kind>
plain_scalar_kind(const schema::tree& t, schema::node_id id) {
    const auto* s = std::get_if<schema::scalar_node>(&t.get(id).kind);
    if (s == nullptr) {
        return std::nullopt;
    }
    return s->kind;
}
} // namespace

bool is_condition(const schema::tree&, const schema::node& n) {
    const auto* obj = std::get_if<schema::object_node>(&n.kind);
    if (obj == nullptr) {
        return false;
    }
    for (auto name : condition_properties) {
        if (obj->find(name) == nullptr) {
            return false;
        }
    }
    for (auto name : condition_required) {
        if (!obj->required.contains(ss::sstring(name))) {
            return false;
        }
    }
    return obj->properties.size() == condition_properties.size()
           || (obj->properties.size() == condition_properties.size() + 1
               && obj->find(condition_optional) != nullptr);
}

bool is_conditions_entry(const schema::path& p) {
    const auto& segments = p.segments();
    if (
      segments.size() < 2
      || !std::holds_alternative<schema::items_segment>(segments.back())) {
        return false;
    }
    const auto* holder = std::get_if<schema::property_segment>(
      &segments[segments.size() - 2]);
    return holder != nullptr && holder->name == "conditions";
}

bool is_object_reference(const schema::tree& t, const schema::node& n) {
    const auto* obj = std::get_if<schema::object_node>(&n.kind);
    if (
      obj == nullptr
      || obj->properties.size() != object_reference_properties.size()) {
        return false;
    }
    for (auto name : object_reference_properties) {
        const auto* p = obj->find(name);
        if (p == nullptr || !is_string_scalar(t, p->node)) {
            return false;
        }
    }
    return true;
}

bool is_int_or_string(const schema::tree& t, const schema::node& n) {
    if (n.int_or_string) {
        return true;
    }
    if (const auto* s = std::get_if<schema::scalar_node>(&n.kind)) {
        return s->kind == schema::scalar_kind::string
               && s->format == "int-or-string";
    }
    const auto* u = std::get_if<schema::union_node>(&n.kind);
    if (u == nullptr || u->variants.size() != 2) {
        return false;
    }
    auto a = plain_scalar_kind(t, u->variants[0]);
    auto b = plain_scalar_kind(t, u->variants[1]);
    if (!a || !b) {
        return false;
    }
    return (*a == schema::scalar_kind::integer
            && *b == schema::scalar_kind::string)
           || (*a == schema::scalar_kind::string
               && *b == schema::scalar_kind::integer);
}

std::optional<typegraph::known_shape> detect_known_shape(
  const schema::tree& t, const schema::node& n, const schema::path& p) {
    if (is_int_or_string(t, n)) {
        return typegraph::known_shape::int_or_string;
    }
    if (is_conditions_entry(p) && is_condition(t, n)) {
        return typegraph::known_shape::condition;
    }
    if (is_object_reference(t, n)) {
        return typegraph::known_shape::object_reference;
    }
    return std::nullopt;
}

} // namespace crdgen::analysis
