// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include <absl/container/btree_set.h>
#include <fmt/core.h>

#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace crdgen::typegraph {

// Behaviour an emitter may attach to a generated type.
enum class capability : uint8_t {
    equality,
    ordering,
    default_construction,
    schema_reflection,
    builder,
};

inline constexpr std::array<capability, 5> all_capabilities{
  capability::equality,
  capability::ordering,
  capability::default_construction,
  capability::schema_reflection,
  capability::builder,
};

using capability_set = absl::btree_set<capability>;

std::string_view to_string_view(capability);
// Accepts the names printed by to_string_view.
std::optional<capability> capability_from_string(std::string_view);

std::ostream& operator<<(std::ostream&, capability);
std::ostream& operator<<(std::ostream&, const capability_set&);

} // namespace crdgen::typegraph

template<>
struct fmt::formatter<crdgen::typegraph::capability>
  : fmt::formatter<std::string_view> {
    auto format(crdgen::typegraph::capability c, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(
          crdgen::typegraph::to_string_view(c), ctx);
    }
};
