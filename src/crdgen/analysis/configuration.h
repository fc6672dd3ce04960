// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "analysis/capability_directive.h"
#include "base/seastarx.h"
#include "typegraph/datatypes.h"
#include "typegraph/type_graph.h"

#include <seastar/core/sstring.hh>

#include <absl/container/btree_set.h>
#include <yaml-cpp/yaml.h>

#include <iosfwd>
#include <map>
#include <optional>
#include <vector>

namespace crdgen::analysis {

/// Settings of one analysis run. Every field has a usable default; a YAML
/// document can override any subset of them through read_yaml().
struct configuration {
    using error_map_t = std::map<ss::sstring, ss::sstring>;

    // Analyze this version instead of the one picked by the selection policy.
    std::optional<ss::sstring> version_pin;
    // Merge every served version into one schema.
    bool combine_versions{false};
    // Keep schema descriptions as documentation in the graph.
    bool enable_docs{false};
    // Request a builder for every composite type.
    bool enable_builders{false};
    typegraph::schema_mode schema{typegraph::schema_mode::disabled};
    std::vector<capability_directive> extra_capabilities;
    // Names of types that the emitter should skip.
    std::vector<ss::sstring> elide;
    // Replace unsupported constructs with unknown values instead of failing.
    bool relaxed{false};
    // Known shapes that are generated like any other object.
    absl::btree_set<typegraph::known_shape> suppress_known_shapes;
    typegraph::map_representation maps{typegraph::map_representation::ordered};
    // Shorthand for derived schemas with documentation.
    bool auto_mode{false};

    bool docs_enabled() const { return enable_docs || auto_mode; }
    typegraph::schema_mode effective_schema_mode() const {
        return auto_mode ? typegraph::schema_mode::derived : schema;
    }
    bool is_suppressed(typegraph::known_shape s) const {
        return suppress_known_shapes.contains(s);
    }

    /**
     * Applies the keys of a YAML mapping. Throws std::invalid_argument for a
     * key that is not a setting; values that cannot be read are reported in
     * the returned map (setting name to message) and leave the setting
     * untouched.
     */
    error_map_t read_yaml(const YAML::Node& root_node);

    friend std::ostream& operator<<(std::ostream&, const configuration&);
};

} // namespace crdgen::analysis
