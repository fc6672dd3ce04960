// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/annotation_resolver.h"

#include "analysis/logger.h"
#include "base/vlog.h"

#include <fmt/format.h>

#include <array>
#include <variant>
#include <vector>

namespace crdgen::analysis {

using typegraph::capability;
using typegraph::capability_set;
using typegraph::type_kind;

namespace {

// Capabilities that a type can only have when every type it refers to has
// them too.
constexpr std::array<capability, 4> transitive_capabilities{
  capability::equality,
  capability::ordering,
  capability::default_construction,
  capability::schema_reflection,
};

capability_set requested_for(
  const typegraph::generated_type& t, const configuration& cfg) {
    capability_set out;
    if (cfg.enable_builders && t.kind() == type_kind::composite) {
        out.insert(capability::builder);
    }
    if (cfg.effective_schema_mode() == typegraph::schema_mode::derived) {
        out.insert(capability::schema_reflection);
    }
    for (const auto& d : cfg.extra_capabilities) {
        if (d.applies_to(t)) {
            out.insert(d.requested);
        }
    }
    return out;
}

struct holds_unordered_value {
    bool unordered_maps;

    bool operator()(const typegraph::primitive_ref&) const { return false; }
    bool operator()(const typegraph::generated_ref&) const { return false; }
    bool operator()(const typegraph::external_ref&) const { return false; }
    bool operator()(const typegraph::unknown_ref&) const { return true; }
    bool operator()(const typegraph::sequence_ref& r) const {
        return std::visit(*this, *r.element);
    }
    bool operator()(const typegraph::map_ref& r) const {
        return unordered_maps || std::visit(*this, *r.value);
    }
    bool operator()(const typegraph::optional_ref& r) const {
        return std::visit(*this, *r.inner);
    }
};

bool is_orderable(
  const typegraph::type_body& body, typegraph::map_representation maps) {
    holds_unordered_value check{
      .unordered_maps = maps == typegraph::map_representation::unordered};
    bool orderable = true;
    typegraph::for_each_member(body, [&](const typegraph::type_ref& r) {
        orderable = orderable && !std::visit(check, r);
    });
    return orderable;
}

void withhold(
  typegraph::generated_type& t, capability c, std::string_view reason) {
    if (t.capabilities.erase(c) > 0) {
        crdgen_log(
          analysis_log.debug, "{}: withholding {}: {}", t.name, c, reason);
    }
}

void elide_locally(
  typegraph::generated_type& t, typegraph::map_representation maps) {
    switch (t.kind()) {
    case type_kind::composite:
        break;
    case type_kind::unit_enum:
        withhold(t, capability::default_construction, "enum has no default");
        withhold(t, capability::builder, "not a struct");
        break;
    case type_kind::tagged_enum:
        withhold(t, capability::default_construction, "enum has no default");
        withhold(t, capability::builder, "not a struct");
        break;
    }
    if (!is_orderable(t.body, maps)) {
        withhold(t, capability::ordering, "holds an unordered value");
    }
}

// Generated types whose capabilities t depends on for c.
std::vector<typegraph::type_id> dependencies(
  const typegraph::generated_type& t, capability c) {
    std::vector<typegraph::type_id> out;
    auto collect = [&out](const typegraph::generated_ref& r) {
        out.push_back(r.id);
    };
    if (c != capability::default_construction) {
        typegraph::for_each_member(t.body, [&](const typegraph::type_ref& r) {
            typegraph::for_each_generated(r, collect);
        });
        return out;
    }
    // containers and optionals default to empty; only required fields
    // holding a generated type directly need its default
    if (const auto* comp = std::get_if<typegraph::composite>(&t.body)) {
        for (const auto& f : comp->fields) {
            if (!f.required) {
                continue;
            }
            if (const auto* g = std::get_if<typegraph::generated_ref>(&f.type)) {
                out.push_back(g->id);
            }
        }
    }
    return out;
}

void elide_transitively(typegraph::type_graph& graph) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& t : graph.types()) {
            for (auto c : transitive_capabilities) {
                if (!t.capabilities.contains(c)) {
                    continue;
                }
                for (auto dep : dependencies(t, c)) {
                    const auto& d = graph.get(dep);
                    if (d.capabilities.contains(c)) {
                        continue;
                    }
                    withhold(
                      graph.get_mutable(t.id),
                      c,
                      fmt::format("{} does not have it", d.name));
                    changed = true;
                    break;
                }
            }
        }
    }
}

} // namespace

void resolve_annotations(
  typegraph::type_graph& graph, const configuration& cfg) {
    for (size_t i = 0; i < graph.size(); ++i) {
        auto& t = graph.get_mutable(typegraph::type_id(i));
        t.capabilities = requested_for(t, cfg);
        elide_locally(t, graph.maps());
    }
    elide_transitively(graph);

    for (const auto& name : cfg.elide) {
        const auto* t = graph.find(name);
        if (t == nullptr) {
            crdgen_log(
              analysis_log.warn, "cannot elide {}: no type with that name", name);
            continue;
        }
        graph.get_mutable(t->id).elided = true;
    }

    for (const auto& t : graph.types()) {
        crdgen_log(
          analysis_log.trace,
          "{}: capabilities [{}]{}",
          t.name,
          fmt::join(t.capabilities, ", "),
          t.elided ? " (elided)" : "");
    }
}

} // namespace crdgen::analysis
