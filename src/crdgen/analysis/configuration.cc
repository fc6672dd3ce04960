// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/configuration.h"

#include "analysis/logger.h"
#include "base/vlog.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <functional>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace YAML {

template<>
struct convert<ss::sstring> {
    static Node encode(const ss::sstring& rhs) { return Node(rhs.c_str()); }
    static bool decode(const Node& node, ss::sstring& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        rhs = node.as<std::string>();
        return true;
    }
};

template<>
struct convert<crdgen::typegraph::schema_mode> {
    using type = crdgen::typegraph::schema_mode;
    static bool decode(const Node& node, type& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        const auto& v = node.Scalar();
        if (v == "disabled") {
            rhs = type::disabled;
        } else if (v == "manual") {
            rhs = type::manual;
        } else if (v == "derived") {
            rhs = type::derived;
        } else {
            return false;
        }
        return true;
    }
};

template<>
struct convert<crdgen::typegraph::map_representation> {
    using type = crdgen::typegraph::map_representation;
    static bool decode(const Node& node, type& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        const auto& v = node.Scalar();
        if (v == "ordered" || v == "btree") {
            rhs = type::ordered;
        } else if (v == "unordered" || v == "hash") {
            rhs = type::unordered;
        } else {
            return false;
        }
        return true;
    }
};

template<>
struct convert<crdgen::typegraph::known_shape> {
    using type = crdgen::typegraph::known_shape;
    static bool decode(const Node& node, type& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        // int-or-string is always substituted
        const auto& v = node.Scalar();
        if (v == "condition") {
            rhs = type::condition;
        } else if (v == "object_reference") {
            rhs = type::object_reference;
        } else {
            return false;
        }
        return true;
    }
};

} // namespace YAML

namespace crdgen::analysis {

namespace {
using setter = std::function<void(configuration&, const YAML::Node&)>;

template<typename T>
setter set_field(T configuration::*member) {
    return [member](configuration& cfg, const YAML::Node& n) {
        cfg.*member = n.as<T>();
    };
}

const std::map<std::string_view, setter>& setters() {
    static const std::map<std::string_view, setter> table{
      {"version_pin",
       [](configuration& cfg, const YAML::Node& n) {
           if (n.IsNull()) {
               cfg.version_pin = std::nullopt;
           } else {
               cfg.version_pin = n.as<ss::sstring>();
           }
       }},
      {"combine_versions", set_field(&configuration::combine_versions)},
      {"enable_docs", set_field(&configuration::enable_docs)},
      {"enable_builders", set_field(&configuration::enable_builders)},
      {"schema_mode", set_field(&configuration::schema)},
      {"extra_capabilities",
       [](configuration& cfg, const YAML::Node& n) {
           std::vector<capability_directive> directives;
           for (const auto& d : n.as<std::vector<ss::sstring>>()) {
               directives.push_back(capability_directive::parse(d));
           }
           cfg.extra_capabilities = std::move(directives);
       }},
      {"elide", set_field(&configuration::elide)},
      {"relaxed", set_field(&configuration::relaxed)},
      {"suppress_known_shapes",
       [](configuration& cfg, const YAML::Node& n) {
           absl::btree_set<typegraph::known_shape> shapes;
           for (auto s : n.as<std::vector<typegraph::known_shape>>()) {
               shapes.insert(s);
           }
           cfg.suppress_known_shapes = std::move(shapes);
       }},
      {"map_representation", set_field(&configuration::maps)},
      {"auto", set_field(&configuration::auto_mode)},
    };
    return table;
}
} // namespace

configuration::error_map_t
configuration::read_yaml(const YAML::Node& root_node) {
    error_map_t errors;
    if (!root_node.IsDefined() || root_node.IsNull()) {
        return errors;
    }
    if (!root_node.IsMap()) {
        throw std::invalid_argument("configuration must be a mapping");
    }

    for (const auto& node : root_node) {
        auto name = node.first.as<ss::sstring>();
        auto found = setters().find(std::string_view(name));
        if (found == setters().end()) {
            throw std::invalid_argument(
              fmt::format("Unknown property {}", name));
        }
        try {
            found->second(*this, node.second);
        } catch (const YAML::InvalidNode& e) {
            errors[name] = fmt::format("Invalid syntax: {}", e.what());
        } catch (const YAML::BadConversion& e) {
            errors[name] = fmt::format("Invalid value: {}", e.what());
        } catch (const std::invalid_argument& e) {
            errors[name] = fmt::format("Validation error: {}", e.what());
        }
    }
    for (const auto& [name, error] : errors) {
        crdgen_log(analysis_log.warn, "configuration {}: {}", name, error);
    }
    return errors;
}

std::ostream& operator<<(std::ostream& o, const configuration& c) {
    std::vector<ss::sstring> directives;
    directives.reserve(c.extra_capabilities.size());
    for (const auto& d : c.extra_capabilities) {
        directives.push_back(fmt::format("{}", fmt::streamed(d)));
    }
    fmt::print(
      o,
      "{{version_pin: {}, combine_versions: {}, enable_docs: {}, "
      "enable_builders: {}, schema_mode: {}, extra_capabilities: [{}], "
      "elide: [{}], relaxed: {}, suppress_known_shapes: [{}], "
      "map_representation: {}, auto: {}}}",
      c.version_pin.value_or("<none>"),
      c.combine_versions,
      c.enable_docs,
      c.enable_builders,
      fmt::streamed(c.schema),
      fmt::join(directives, ", "),
      fmt::join(c.elide, ", "),
      c.relaxed,
      fmt::join(c.suppress_known_shapes, ", "),
      fmt::streamed(c.maps),
      c.auto_mode);
    return o;
}

} // namespace crdgen::analysis
