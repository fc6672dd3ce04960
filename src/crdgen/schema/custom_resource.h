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
#include "schema/node.h"

#include <seastar/core/sstring.hh>

#include <optional>
#include <vector>

namespace crdgen::schema {

/// One entry of a CustomResourceDefinition's version list.
struct schema_version {
    ss::sstring name;
    bool served{true};
    bool storage{false};
    // spec.versions[].subresources.status is present
    bool status_subresource{false};
    // Absent when the version declares no openAPIV3Schema.
    std::optional<tree> schema;
};

enum class resource_scope { namespaced, cluster };

struct custom_resource {
    ss::sstring group;
    ss::sstring kind;
    ss::sstring plural;
    resource_scope scope{resource_scope::namespaced};
    std::vector<schema_version> versions;

    std::vector<ss::sstring> version_names() const {
        std::vector<ss::sstring> out;
        out.reserve(versions.size());
        for (const auto& v : versions) {
            out.push_back(v.name);
        }
        return out;
    }
};

} // namespace crdgen::schema
