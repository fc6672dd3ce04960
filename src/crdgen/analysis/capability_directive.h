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
#include "typegraph/capability.h"
#include "typegraph/type_graph.h"

#include <seastar/core/sstring.hh>

#include <iosfwd>
#include <string_view>

namespace crdgen::analysis {

/**
 * A request for one capability on a set of generated types, written as
 * "target=capability" or just "capability" for every type. Targets:
 *
 *   TypeName      the type with that name
 *   @struct       every composite type (also @structs)
 *   @enum         every enumerated type (also @enums)
 *   @enum:simple  every unit enum (also @enums:simple)
 */
struct capability_directive {
    enum class target_kind { all, named, composites, enums, unit_enums };

    target_kind target{target_kind::all};
    // set for target_kind::named only
    ss::sstring type_name;
    typegraph::capability requested;

    // Throws std::invalid_argument when the directive is malformed.
    static capability_directive parse(std::string_view);

    bool applies_to(const typegraph::generated_type&) const;

    bool operator==(const capability_directive&) const = default;
    friend std::ostream&
    operator<<(std::ostream&, const capability_directive&);
};

} // namespace crdgen::analysis
