// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "schema/loader.h"

#include "base/vlog.h"
#include "schema/logger.h"

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace crdgen::schema {

namespace {

// A missing key on a const node yields an invalid node that throws on any
// Is*() query, so callers always get a plain undefined node instead.
YAML::Node child(const YAML::Node& n, const std::string& key) {
    if (!n.IsDefined() || !n.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    auto v = n[key];
    if (!v.IsDefined()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return v;
}

bool has(const YAML::Node& n, const std::string& key) {
    return child(n, key).IsDefined();
}

std::optional<ss::sstring>
read_string(const YAML::Node& n, const std::string& key, std::string_view where) {
    const auto v = child(n, key);
    if (!v.IsDefined() || v.IsNull()) {
        return std::nullopt;
    }
    if (!v.IsScalar()) {
        throw parse_error(
          fmt::format("{}: '{}' must be a string", where, key));
    }
    return ss::sstring(v.Scalar());
}

ss::sstring require_string(
  const YAML::Node& n, const std::string& key, std::string_view where) {
    auto v = read_string(n, key, where);
    if (!v) {
        throw parse_error(fmt::format("{}: missing '{}'", where, key));
    }
    return std::move(*v);
}

std::optional<bool>
read_bool(const YAML::Node& n, const std::string& key, std::string_view where) {
    const auto v = child(n, key);
    if (!v.IsDefined() || v.IsNull()) {
        return std::nullopt;
    }
    try {
        return v.as<bool>();
    } catch (const YAML::BadConversion&) {
        throw parse_error(
          fmt::format("{}: '{}' must be a boolean", where, key));
    }
}

bool read_flag(
  const YAML::Node& n, const std::string& key, std::string_view where) {
    return read_bool(n, key, where).value_or(false);
}

std::optional<scalar_kind> scalar_kind_from_type(std::string_view type) {
    if (type == "string") {
        return scalar_kind::string;
    }
    if (type == "integer") {
        return scalar_kind::integer;
    }
    if (type == "number") {
        return scalar_kind::number;
    }
    if (type == "boolean") {
        return scalar_kind::boolean;
    }
    return std::nullopt;
}

// Kind of an untyped enum literal, following YAML core schema resolution.
// Quoted scalars are always strings.
scalar_kind infer_literal_kind(const YAML::Node& n) {
    static const std::regex integer_re{R"(^[-+]?[0-9]+$)"};
    static const std::regex number_re{
      R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)"};
    static const std::regex boolean_re{
      R"(^(true|True|TRUE|false|False|FALSE)$)"};

    if (n.Tag() == "!") {
        return scalar_kind::string;
    }
    const auto& text = n.Scalar();
    if (std::regex_match(text, boolean_re)) {
        return scalar_kind::boolean;
    }
    if (std::regex_match(text, integer_re)) {
        return scalar_kind::integer;
    }
    if (std::regex_match(text, number_re)) {
        return scalar_kind::number;
    }
    return scalar_kind::string;
}

// A oneOf/anyOf/allOf branch that only adds validation (pattern, format,
// required, ...) without describing a shape of its own.
bool is_shape_branch(const YAML::Node& n) {
    static const std::array<std::string, 10> shape_keys{
      "type",
      "properties",
      "items",
      "additionalProperties",
      "enum",
      "const",
      "$ref",
      "oneOf",
      "anyOf",
      "allOf"};
    if (!n.IsMap()) {
        return false;
    }
    return std::any_of(
      shape_keys.begin(), shape_keys.end(), [&n](const std::string& k) {
          return has(n, k);
      });
}

std::optional<std::string_view> definition_name(std::string_view ref) {
    for (std::string_view prefix : {"#/definitions/", "#/$defs/"}) {
        if (ref.starts_with(prefix) && ref.size() > prefix.size()) {
            return ref.substr(prefix.size());
        }
    }
    return std::nullopt;
}

class schema_parser {
public:
    schema_parser(tree& t, YAML::Node document)
      : _tree(t)
      , _document(std::move(document)) {}

    node_id parse(const YAML::Node& y, const std::string& where, size_t depth) {
        if (has(y, "$ref")) {
            return resolve_reference(y, where, depth);
        }
        return _tree.add(parse_node(y, where, depth));
    }

private:
    node parse_node(const YAML::Node& y, const std::string& where, size_t depth);
    node_kind parse_object(
      const YAML::Node& y, node& out, const std::string& where, size_t depth);
    node_kind
    parse_array(const YAML::Node& y, const std::string& where, size_t depth);
    node_kind parse_enum(
      const YAML::Node& literals,
      std::optional<scalar_kind> declared,
      node& out,
      const std::string& where);
    std::vector<node_id> parse_branches(
      const YAML::Node& y,
      const std::string& key,
      const std::string& where,
      size_t depth);
    node_id
    resolve_reference(const YAML::Node& y, const std::string& where, size_t depth);
    YAML::Node lookup_definition(std::string_view name, std::string_view where);

    tree& _tree;
    YAML::Node _document;
    absl::btree_map<ss::sstring, node_id> _definitions;
};

node schema_parser::parse_node(
  const YAML::Node& y, const std::string& where, size_t depth) {
    if (depth > max_document_depth) {
        throw parse_error(fmt::format(
          "{}: schema nesting exceeds {} levels", where, max_document_depth));
    }
    node out;
    if (!y.IsDefined() || y.IsNull()) {
        return out;
    }
    if (y.IsScalar()) {
        // boolean schema: true accepts anything
        bool accepts_anything = false;
        try {
            accepts_anything = y.as<bool>();
        } catch (const YAML::BadConversion&) {
            throw parse_error(
              fmt::format("{}: schema must be a mapping", where));
        }
        if (!accepts_anything) {
            throw parse_error(
              fmt::format("{}: schema 'false' accepts no value", where));
        }
        out.preserve_unknown_fields = true;
        return out;
    }
    if (!y.IsMap()) {
        throw parse_error(fmt::format("{}: schema must be a mapping", where));
    }

    out.nullable = read_flag(y, "nullable", where);
    out.int_or_string = read_flag(y, "x-kubernetes-int-or-string", where);
    out.preserve_unknown_fields = read_flag(
      y, "x-kubernetes-preserve-unknown-fields", where);
    out.embedded_resource = read_flag(
      y, "x-kubernetes-embedded-resource", where);
    out.title = read_string(y, "title", where);
    out.description = read_string(y, "description", where);

    const auto type = read_string(y, "type", where);
    std::optional<scalar_kind> scalar;
    if (type) {
        scalar = scalar_kind_from_type(*type);
        if (!scalar && *type != "object" && *type != "array") {
            throw parse_error(
              fmt::format("{}: unsupported type '{}'", where, *type));
        }
    }

    if (has(y, "enum")) {
        if (type && !scalar) {
            throw parse_error(fmt::format(
              "{}: enum is only supported on scalar types, got '{}'",
              where,
              *type));
        }
        out.kind = parse_enum(y["enum"], scalar, out, where);
        return out;
    }
    if (has(y, "const")) {
        YAML::Node single(YAML::NodeType::Sequence);
        single.push_back(y["const"]);
        out.kind = parse_enum(single, scalar, out, where);
        return out;
    }

    const bool own_shape = scalar.has_value() || has(y, "properties")
                           || has(y, "items")
                           || has(y, "additionalProperties");
    auto one_of = parse_branches(y, "oneOf", where, depth);
    auto any_of = parse_branches(y, "anyOf", where, depth);
    auto all_of = parse_branches(y, "allOf", where, depth);

    // a scalar restricted to a union of literals is an enumeration
    auto only_literals = [this](const std::vector<node_id>& ids) {
        return !ids.empty()
               && std::all_of(ids.begin(), ids.end(), [this](node_id id) {
                      return _tree.is_defined(id)
                             && std::holds_alternative<enumeration_node>(
                               _tree.get(id).kind);
                  });
    };
    const bool literal_union = scalar.has_value()
                               && (only_literals(one_of) || only_literals(any_of));

    if (
      (!own_shape || literal_union)
      && (!one_of.empty() || !any_of.empty())) {
        if (!one_of.empty() && !any_of.empty()) {
            throw parse_error(fmt::format(
              "{}: oneOf and anyOf on the same schema are not supported",
              where));
        }
        if (!all_of.empty()) {
            crdgen_log(
              schema_log.warn,
              "{}: ignoring allOf next to a oneOf/anyOf union",
              where);
        }
        out.kind = one_of.empty()
                     ? union_node{union_kind::any_of, std::move(any_of)}
                     : union_node{union_kind::one_of, std::move(one_of)};
        return out;
    }
    if (own_shape && (!one_of.empty() || !any_of.empty())) {
        crdgen_log(
          schema_log.debug,
          "{}: dropping oneOf/anyOf on a schema with its own shape",
          where);
    }

    if (!all_of.empty()) {
        if (own_shape && scalar.has_value()) {
            crdgen_log(
              schema_log.debug, "{}: dropping allOf on a scalar schema", where);
        } else {
            if (own_shape) {
                // the schema's own properties form one more branch
                node own;
                own.kind = parse_object(y, own, where, depth);
                all_of.insert(all_of.begin(), _tree.add(std::move(own)));
            }
            out.kind = intersection_node{std::move(all_of)};
            return out;
        }
    }

    if (scalar) {
        out.kind = scalar_node{*scalar, read_string(y, "format", where)};
    } else if (
      (type && *type == "array") || (!type && has(y, "items"))) {
        out.kind = parse_array(y, where, depth);
    } else if (type || has(y, "properties") || has(y, "additionalProperties")) {
        out.kind = parse_object(y, out, where, depth);
    } else {
        out.kind = unknown_node{};
    }
    return out;
}

node_kind schema_parser::parse_object(
  const YAML::Node& y, node& out, const std::string& where, size_t depth) {
    const auto props = child(y, "properties");
    if (props.IsDefined() && !props.IsNull() && !props.IsMap()) {
        throw parse_error(
          fmt::format("{}: properties must be a mapping", where));
    }
    object_node obj;
    if (props.IsMap()) {
        for (const auto& kv : props) {
            ss::sstring name(kv.first.as<std::string>());
            auto id = parse(
              kv.second, fmt::format("{}.properties.{}", where, name), depth + 1);
            obj.properties.push_back(property{std::move(name), id});
        }
    }

    const auto required = child(y, "required");
    if (required.IsDefined() && !required.IsNull()) {
        if (!required.IsSequence()) {
            throw parse_error(
              fmt::format("{}: required must be a list", where));
        }
        for (const auto& r : required) {
            ss::sstring name(r.as<std::string>());
            if (obj.find(name) == nullptr) {
                crdgen_log(
                  schema_log.warn,
                  "{}: required property '{}' is not declared, ignoring",
                  where,
                  name);
                continue;
            }
            obj.required.insert(std::move(name));
        }
    }

    const auto additional = child(y, "additionalProperties");
    if (!obj.properties.empty()) {
        if (additional.IsDefined()) {
            crdgen_log(
              schema_log.debug,
              "{}: additionalProperties ignored next to properties",
              where);
        }
        return obj;
    }
    if (additional.IsDefined() && !additional.IsNull()) {
        if (additional.IsScalar()) {
            bool open = false;
            try {
                open = additional.as<bool>();
            } catch (const YAML::BadConversion&) {
                throw parse_error(fmt::format(
                  "{}: additionalProperties must be a boolean or a schema",
                  where));
            }
            if (open) {
                node value;
                value.preserve_unknown_fields = true;
                return map_node{_tree.add(std::move(value))};
            }
        } else {
            return map_node{parse(
              additional,
              fmt::format("{}.additionalProperties", where),
              depth + 1)};
        }
    }
    if (out.preserve_unknown_fields) {
        return unknown_node{};
    }
    return obj;
}

node_kind schema_parser::parse_array(
  const YAML::Node& y, const std::string& where, size_t depth) {
    const auto items = child(y, "items");
    if (!items.IsDefined() || items.IsNull()) {
        return array_node{};
    }
    if (items.IsSequence()) {
        throw parse_error(
          fmt::format("{}: tuple-typed items are not supported", where));
    }
    return array_node{parse(items, where + ".items", depth + 1)};
}

node_kind schema_parser::parse_enum(
  const YAML::Node& literals,
  std::optional<scalar_kind> declared,
  node& out,
  const std::string& where) {
    if (!literals.IsSequence()) {
        throw parse_error(fmt::format("{}: enum must be a list", where));
    }
    enumeration_node e{declared.value_or(scalar_kind::string), {}};
    std::optional<scalar_kind> inferred;
    for (const auto& l : literals) {
        if (l.IsNull()) {
            out.nullable = true;
            continue;
        }
        if (!l.IsScalar()) {
            throw parse_error(
              fmt::format("{}: enum literals must be scalars", where));
        }
        auto kind = declared ? *declared : infer_literal_kind(l);
        if (!declared) {
            if (inferred && *inferred != kind) {
                throw parse_error(fmt::format(
                  "{}: enum mixes {} and {} literals", where, *inferred, kind));
            }
            inferred = kind;
        }
        e.literals.push_back(literal{kind, ss::sstring(l.Scalar())});
    }
    if (inferred) {
        e.kind = *inferred;
    }
    return e;
}

std::vector<node_id> schema_parser::parse_branches(
  const YAML::Node& y,
  const std::string& key,
  const std::string& where,
  size_t depth) {
    std::vector<node_id> out;
    const auto branches = child(y, key);
    if (!branches.IsDefined() || branches.IsNull()) {
        return out;
    }
    if (!branches.IsSequence()) {
        throw parse_error(fmt::format("{}: {} must be a list", where, key));
    }
    for (size_t i = 0; i < branches.size(); ++i) {
        const auto& b = branches[i];
        if (!is_shape_branch(b)) {
            continue;
        }
        out.push_back(
          parse(b, fmt::format("{}.{}[{}]", where, key, i), depth + 1));
    }
    return out;
}

YAML::Node
schema_parser::lookup_definition(std::string_view name, std::string_view where) {
    for (const auto& section : {"definitions", "$defs"}) {
        const auto defs = child(_document, section);
        if (defs.IsMap()) {
            const auto target = defs[std::string(name)];
            if (target.IsDefined()) {
                return target;
            }
        }
    }
    throw parse_error(
      fmt::format("{}: unresolved reference to '{}'", where, name));
}

node_id schema_parser::resolve_reference(
  const YAML::Node& y, const std::string& where, size_t depth) {
    auto ref = require_string(y, "$ref", where);
    auto name = definition_name(ref);
    if (!name) {
        throw parse_error(
          fmt::format("{}: unsupported reference '{}'", where, ref));
    }

    // a definition that is itself only a reference is an alias
    absl::btree_set<ss::sstring> seen;
    ss::sstring target_name(*name);
    auto target = lookup_definition(target_name, where);
    while (has(target, "$ref")) {
        if (!seen.insert(target_name).second) {
            throw parse_error(fmt::format(
              "{}: reference '{}' is an alias of itself", where, ref));
        }
        auto next_ref = require_string(target, "$ref", where);
        auto next = definition_name(next_ref);
        if (!next) {
            throw parse_error(
              fmt::format("{}: unsupported reference '{}'", where, next_ref));
        }
        target_name = ss::sstring(*next);
        target.reset(lookup_definition(target_name, where));
    }

    if (auto it = _definitions.find(target_name); it != _definitions.end()) {
        return it->second;
    }
    auto id = _tree.reserve();
    _definitions.emplace(target_name, id);
    _tree.define(
      id,
      parse_node(
        target, fmt::format("#/definitions/{}", target_name), depth + 1));
    return id;
}

ss::sstring scope_name(resource_scope s) {
    return s == resource_scope::namespaced ? "Namespaced" : "Cluster";
}

} // namespace

tree parse_schema(const YAML::Node& schema) {
    tree t;
    schema_parser parser(t, schema);
    t.set_root(parser.parse(schema, "#", 0));
    crdgen_log(schema_log.debug, "parsed schema with {} nodes", t.size());
    return t;
}

custom_resource parse_custom_resource(const YAML::Node& document) {
    if (!document.IsMap()) {
        throw parse_error("custom resource definition must be a mapping");
    }
    if (auto kind = read_string(document, "kind", "#");
        kind && *kind != "CustomResourceDefinition") {
        throw parse_error(fmt::format(
          "expected a CustomResourceDefinition document, got '{}'", *kind));
    }
    const auto spec = child(document, "spec");
    if (!spec.IsMap()) {
        throw parse_error("custom resource definition has no spec");
    }

    custom_resource cr;
    cr.group = require_string(spec, "group", "spec");
    const auto names = child(spec, "names");
    cr.kind = require_string(names, "kind", "spec.names");
    cr.plural = read_string(names, "plural", "spec.names").value_or("");
    auto scope = read_string(spec, "scope", "spec").value_or(
      scope_name(resource_scope::namespaced));
    if (scope == scope_name(resource_scope::namespaced)) {
        cr.scope = resource_scope::namespaced;
    } else if (scope == scope_name(resource_scope::cluster)) {
        cr.scope = resource_scope::cluster;
    } else {
        throw parse_error(fmt::format("spec.scope: unknown scope '{}'", scope));
    }

    // v1beta1 documents may carry one schema for every version
    const auto legacy_schema = child(child(spec, "validation"), "openAPIV3Schema");
    const bool legacy_status = has(child(spec, "subresources"), "status");
    auto read_schema = [&](const YAML::Node& s) -> std::optional<tree> {
        if (s.IsMap()) {
            return parse_schema(s);
        }
        if (legacy_schema.IsMap()) {
            return parse_schema(legacy_schema);
        }
        return std::nullopt;
    };

    const auto versions = child(spec, "versions");
    if (versions.IsSequence()) {
        for (size_t i = 0; i < versions.size(); ++i) {
            const auto& v = versions[i];
            auto where = fmt::format("spec.versions[{}]", i);
            schema_version sv;
            sv.name = require_string(v, "name", where);
            sv.served = read_bool(v, "served", where).value_or(true);
            sv.storage = read_flag(v, "storage", where);
            sv.status_subresource = legacy_status
                                    || has(child(v, "subresources"), "status");
            sv.schema = read_schema(
              child(child(v, "schema"), "openAPIV3Schema"));
            cr.versions.push_back(std::move(sv));
        }
    } else if (auto single = read_string(spec, "version", "spec")) {
        schema_version sv;
        sv.name = std::move(*single);
        sv.storage = true;
        sv.status_subresource = legacy_status;
        sv.schema = read_schema(YAML::Node(YAML::NodeType::Undefined));
        cr.versions.push_back(std::move(sv));
    }
    if (cr.versions.empty()) {
        throw parse_error(
          fmt::format("custom resource {} declares no versions", cr.kind));
    }
    crdgen_log(
      schema_log.debug,
      "read custom resource {}/{} with {} versions",
      cr.group,
      cr.kind,
      cr.versions.size());
    return cr;
}

} // namespace crdgen::schema
