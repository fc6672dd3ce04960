// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "typegraph/capability.h"

#include <fmt/format.h>

#include <ostream>

namespace crdgen::typegraph {

std::string_view to_string_view(capability c) {
    switch (c) {
    case capability::equality:
        return "equality";
    case capability::ordering:
        return "ordering";
    case capability::default_construction:
        return "default";
    case capability::schema_reflection:
        return "schema";
    case capability::builder:
        return "builder";
    }
    return "unknown";
}

std::optional<capability> capability_from_string(std::string_view s) {
    for (auto c : all_capabilities) {
        if (to_string_view(c) == s) {
            return c;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& o, capability c) {
    return o << to_string_view(c);
}

std::ostream& operator<<(std::ostream& o, const capability_set& set) {
    o << "[" << fmt::format("{}", fmt::join(set, ", ")) << "]";
    return o;
}

} // namespace crdgen::typegraph
