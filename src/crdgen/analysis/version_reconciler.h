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

#include <seastar/core/sstring.hh>

#include <vector>

namespace crdgen::analysis {

/**
 * Picks the version an analysis should run on. Versions without a schema
 * are never picked.
 *
 *  - a pinned version must exist and carry a schema;
 *  - otherwise, among the served versions (or every version when none is
 *    served), the storage version wins; two storage versions are an error;
 *  - without a storage version the highest api_version wins.
 *
 * Returns the index of the version in the input.
 */
analysis_outcome<size_t>
select_version(const std::vector<schema::schema_version>&, const configuration&);

struct reconciled_schema {
    // the selected label, or the merged labels joined with '+'
    ss::sstring version;
    // versions that contributed, highest priority first
    std::vector<ss::sstring> sources;
    schema::tree schema;
    bool status_subresource{false};
};

/**
 * Produces the schema to analyze. Without combine_versions (or with a pinned
 * version) this is the schema picked by select_version(). With
 * combine_versions every candidate version is merged into one schema, highest
 * priority first: properties missing from some version become optional,
 * scalar types may only differ by a lossless promotion and enumerations
 * accept the literals of every version.
 */
analysis_outcome<reconciled_schema> reconcile(
  std::vector<schema::schema_version> versions,
  ss::sstring root_name,
  const configuration&);

} // namespace crdgen::analysis
