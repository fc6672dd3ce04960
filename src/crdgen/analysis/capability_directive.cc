// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/capability_directive.h"

#include <fmt/format.h>

#include <ostream>
#include <stdexcept>

namespace crdgen::analysis {

namespace {
typegraph::capability
parse_capability(std::string_view directive, std::string_view name) {
    if (name.empty()) {
        throw std::invalid_argument(
          fmt::format("capability cannot be empty in '{}'", directive));
    }
    auto c = typegraph::capability_from_string(name);
    if (!c) {
        throw std::invalid_argument(fmt::format(
          "unknown capability '{}' in '{}', must be one of {}",
          name,
          directive,
          fmt::join(typegraph::all_capabilities, ", ")));
    }
    return *c;
}
} // namespace

capability_directive capability_directive::parse(std::string_view value) {
    using enum target_kind;
    auto eq = value.find('=');
    if (eq == std::string_view::npos) {
        return {all, {}, parse_capability(value, value)};
    }
    auto target = value.substr(0, eq);
    auto requested = parse_capability(value, value.substr(eq + 1));
    if (target.empty()) {
        throw std::invalid_argument(
          fmt::format("directive target cannot be empty in '{}'", value));
    }
    if (!target.starts_with('@')) {
        return {named, ss::sstring(target), requested};
    }
    target.remove_prefix(1);
    if (target == "struct" || target == "structs") {
        return {composites, {}, requested};
    }
    if (target == "enum" || target == "enums") {
        return {enums, {}, requested};
    }
    if (target == "enum:simple" || target == "enums:simple") {
        return {unit_enums, {}, requested};
    }
    throw std::invalid_argument(fmt::format(
      "unknown directive target @{}, must be one of @struct, @enum, or "
      "@enum:simple",
      target));
}

bool capability_directive::applies_to(
  const typegraph::generated_type& t) const {
    switch (target) {
    case target_kind::all:
        return true;
    case target_kind::named:
        return t.name == type_name;
    case target_kind::composites:
        return t.kind() == typegraph::type_kind::composite;
    case target_kind::enums:
        return t.kind() != typegraph::type_kind::composite;
    case target_kind::unit_enums:
        return t.kind() == typegraph::type_kind::unit_enum;
    }
    return false;
}

std::ostream& operator<<(std::ostream& o, const capability_directive& d) {
    using enum capability_directive::target_kind;
    switch (d.target) {
    case all:
        return o << d.requested;
    case named:
        return o << d.type_name << "=" << d.requested;
    case composites:
        return o << "@struct=" << d.requested;
    case enums:
        return o << "@enum=" << d.requested;
    case unit_enums:
        return o << "@enum:simple=" << d.requested;
    }
    return o;
}

} // namespace crdgen::analysis
