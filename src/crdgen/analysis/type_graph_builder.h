// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "analysis/configuration.h"
#include "analysis/errors.h"
#include "base/seastarx.h"
#include "schema/node.h"
#include "schema/path.h"
#include "typegraph/type_graph.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/sstring.hh>

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <absl/container/flat_hash_map.h>

#include <optional>
#include <vector>

namespace crdgen::analysis {

// Deepest chain of nested schema nodes the builder follows.
inline constexpr size_t max_schema_depth = 100;

/**
 * Walks a schema tree and synthesizes the generated types describing it.
 *
 * Every schema node is analyzed once: a node reached again through another
 * reference resolves to the type produced the first time, and a node reached
 * again while it is still being analyzed (a recursive schema) resolves to an
 * indirect reference to its own type. Structurally identical types found at
 * different places are merged into one.
 *
 * Once the walk is complete every type is named after its origin: the root
 * name followed by each property and union variant name on the way to it.
 * Two different types that end up with the same name are a naming collision.
 *
 * A builder instance runs once. On failure nothing is returned but the
 * error; the partially built types are discarded.
 */
class type_graph_builder {
public:
    type_graph_builder(
      const schema::tree&,
      ss::sstring root_name,
      const configuration&,
      ss::abort_source* as = nullptr);

    analysis_outcome<typegraph::type_graph> build() &&;

private:
    struct slot {
        typegraph::generated_type type;
        // entered again while being analyzed, refers to itself
        bool recursive{false};
        // merged into a structurally identical type
        bool merged{false};
        bool complete{false};
    };

    struct flattened_object {
        std::vector<schema::property> properties;
        absl::btree_set<ss::sstring> required;
    };

    using ref_outcome = analysis_outcome<typegraph::type_ref>;

    ref_outcome visit(schema::node_id, const schema::path&, size_t depth);
    // Analyzes `to` in place of `from`, which produces no type of its own.
    ref_outcome visit_as(
      schema::node_id from, schema::node_id to, const schema::path&, size_t depth);
    std::optional<size_t> slot_under_analysis(schema::node_id) const;
    ref_outcome
    visit_node(schema::node_id, const schema::path&, size_t depth);

    typegraph::type_ref visit_scalar(const schema::scalar_node&);
    ref_outcome visit_object(
      schema::node_id,
      const schema::node&,
      const std::vector<schema::property>&,
      const absl::btree_set<ss::sstring>& required,
      schema::declared_order,
      const schema::path&,
      size_t depth);
    ref_outcome visit_array(
      const schema::array_node&, const schema::path&, size_t depth);
    ref_outcome
    visit_map(const schema::map_node&, const schema::path&, size_t depth);
    ref_outcome visit_union(
      schema::node_id,
      const schema::node&,
      const schema::union_node&,
      const schema::path&,
      size_t depth);
    ref_outcome visit_enumeration(
      schema::node_id,
      const schema::node&,
      const schema::enumeration_node&,
      const schema::path&);
    ref_outcome visit_intersection(
      schema::node_id,
      const schema::node&,
      const schema::intersection_node&,
      const schema::path&,
      size_t depth);

    analysis_outcome<flattened_object> flatten(
      const schema::intersection_node&, const schema::path&, size_t depth);

    // Wraps a nullable element of a sequence or map in optional_of.
    typegraph::type_ref element_ref(schema::node_id, typegraph::type_ref);

    size_t open_slot(schema::node_id, const schema::node&, const schema::path&);
    typegraph::type_ref close_slot(size_t, typegraph::type_body);

    // In relaxed mode unsupported constructs and irreconcilable unions
    // become unknown values, recorded as diagnostics.
    ref_outcome fail_or_relax(
      analysis_errc,
      const schema::path&,
      ss::sstring detail,
      typegraph::type_ref fallback = typegraph::unknown_ref{});

    analysis_outcome<typegraph::type_graph> finish(typegraph::type_ref root);
    std::optional<analysis_error> assign_names(std::vector<slot*>& live);

    const schema::tree& _tree;
    ss::sstring _root_name;
    const configuration& _cfg;
    ss::abort_source* _as;

    std::vector<slot> _slots;
    struct frame {
        // slot of the type this node produces
        std::optional<size_t> slot;
        // node this one is analyzed as, when it has no type of its own
        std::optional<schema::node_id> forward;
    };
    // nodes under analysis
    absl::flat_hash_map<schema::node_id, frame> _stack;
    absl::flat_hash_map<schema::node_id, typegraph::type_ref> _memo;
    // structural key -> slot
    absl::btree_map<ss::sstring, size_t> _by_key;
    std::vector<typegraph::diagnostic> _diagnostics;
};

/// Convenience wrapper running a type_graph_builder once.
analysis_outcome<typegraph::type_graph> build_type_graph(
  const schema::tree&,
  ss::sstring root_name,
  const configuration&,
  ss::abort_source* as = nullptr);

} // namespace crdgen::analysis
