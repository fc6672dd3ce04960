// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/analyzer.h"

#include "analysis/annotation_resolver.h"
#include "analysis/logger.h"
#include "analysis/type_graph_builder.h"
#include "analysis/version_reconciler.h"
#include "base/vlog.h"

#include <fmt/format.h>

#include <stdexcept>

namespace crdgen::analysis {

namespace {

// Builds the graph and resolves its capabilities, leaving it unfrozen.
analysis_outcome<typegraph::type_graph> build_and_resolve(
  const schema::tree& tree,
  const ss::sstring& root_name,
  const configuration& cfg,
  ss::abort_source* as) {
    auto built = build_type_graph(tree, root_name, cfg, as);
    if (built.has_error()) {
        return built.error();
    }
    auto graph = std::move(built.value());
    resolve_annotations(graph, cfg);
    if (auto broken = check_invariants(graph); broken) {
        // the builder only produces consistent graphs
        throw std::logic_error(
          fmt::format("{}: inconsistent type graph: {}", root_name, *broken));
    }
    return std::move(graph);
}

typegraph::type_graph
finish(typegraph::type_graph graph, const ss::sstring& root_name) {
    graph.freeze();
    crdgen_log(
      analysis_log.info,
      "{}: {} types, {} diagnostics",
      root_name,
      graph.size(),
      graph.diagnostics().size());
    return graph;
}

} // namespace

analysis_outcome<typegraph::type_graph> analyze(
  const schema::tree& tree,
  ss::sstring root_name,
  const configuration& cfg,
  ss::abort_source* as) {
    auto res = build_and_resolve(tree, root_name, cfg, as);
    if (res.has_error()) {
        return res.error();
    }
    return finish(std::move(res.value()), root_name);
}

analysis_outcome<typegraph::type_graph> analyze(
  schema::custom_resource resource,
  const configuration& cfg,
  ss::abort_source* as) {
    crdgen_log(
      analysis_log.debug,
      "analyzing {}.{} (versions: {})",
      resource.plural,
      resource.group,
      fmt::join(resource.version_names(), ", "));
    auto reconciled = reconcile(
      std::move(resource.versions), resource.kind, cfg);
    if (reconciled.has_error()) {
        return reconciled.error();
    }
    auto& schema = reconciled.value();
    crdgen_log(
      analysis_log.info,
      "{}: analyzing version {}",
      resource.kind,
      schema.version);
    auto res = build_and_resolve(schema.schema, resource.kind, cfg, as);
    if (res.has_error()) {
        return res.error();
    }
    auto graph = std::move(res.value());
    graph.set_resource(std::move(schema.version), schema.status_subresource);
    return finish(std::move(graph), resource.kind);
}

} // namespace crdgen::analysis
