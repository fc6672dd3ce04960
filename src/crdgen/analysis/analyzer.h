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
#include "schema/custom_resource.h"
#include "schema/node.h"
#include "typegraph/type_graph.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/sstring.hh>

namespace crdgen::analysis {

/**
 * Runs the whole analysis of a custom resource: picks (or combines) the
 * versions to analyze, builds the type graph rooted at the resource kind,
 * resolves capabilities and freezes the graph. The analyzed version and the
 * presence of a status subresource are recorded on the graph.
 */
analysis_outcome<typegraph::type_graph> analyze(
  schema::custom_resource,
  const configuration&,
  ss::abort_source* as = nullptr);

/// Same as above for a single schema, the root type being named root_name.
analysis_outcome<typegraph::type_graph> analyze(
  const schema::tree&,
  ss::sstring root_name,
  const configuration&,
  ss::abort_source* as = nullptr);

} // namespace crdgen::analysis
