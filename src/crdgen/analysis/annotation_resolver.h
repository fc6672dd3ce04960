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
#include "typegraph/type_graph.h"

namespace crdgen::analysis {

/**
 * Decorates every type of a graph with the capabilities requested by the
 * configuration that an emitter can soundly derive for it, and marks the
 * types named by configuration::elide.
 *
 * A capability is withheld from a type when its own members rule it out
 * (default construction of an enum, ordering of an unknown value) or when a
 * type it refers to lacks it. The second rule is applied until nothing
 * changes, so the result does not depend on the order of the types.
 *
 * Throws std::logic_error when the graph is already frozen.
 */
void resolve_annotations(typegraph::type_graph&, const configuration&);

} // namespace crdgen::analysis
