// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/type_graph_builder.h"

#include "analysis/known_shapes.h"
#include "analysis/logger.h"
#include "base/vlog.h"
#include "utils/case_conversion.h"

#include <seastar/util/defer.hh>
#include <seastar/util/variant_utils.hh>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace crdgen::analysis {

using typegraph::absent_policy;
using typegraph::composite;
using typegraph::field;
using typegraph::field_required;
using typegraph::generated_ref;
using typegraph::primitive;
using typegraph::primitive_ref;
using typegraph::tagged_enum;
using typegraph::type_id;
using typegraph::type_ref;
using typegraph::unit_enum;
using typegraph::unknown_ref;

namespace {

constexpr std::array<std::string_view, 3> envelope_properties{
  "apiVersion", "kind", "metadata"};

bool is_envelope(std::string_view name) {
    return std::find(
             envelope_properties.begin(), envelope_properties.end(), name)
           != envelope_properties.end();
}

primitive integer_primitive(const std::optional<ss::sstring>& format) {
    static constexpr std::array<std::pair<std::string_view, primitive>, 10>
      formats{{
        {"int8", primitive::int8},
        {"int16", primitive::int16},
        {"int32", primitive::int32},
        {"int64", primitive::int64},
        {"int128", primitive::int128},
        {"uint8", primitive::uint8},
        {"uint16", primitive::uint16},
        {"uint32", primitive::uint32},
        {"uint64", primitive::uint64},
        {"uint128", primitive::uint128},
      }};
    if (format) {
        for (const auto& [name, p] : formats) {
            if (*format == name) {
                return p;
            }
        }
    }
    return primitive::int64;
}

bool is_container(const type_ref& t) {
    return std::holds_alternative<typegraph::sequence_ref>(t)
           || std::holds_alternative<typegraph::map_ref>(t);
}

typegraph::type_role role_of(const schema::path& p) {
    if (p.is_root()) {
        return typegraph::type_role::root;
    }
    if (p.depth() == 1) {
        if (const auto* prop = std::get_if<schema::property_segment>(
              &p.segments().front())) {
            if (prop->name == "spec") {
                return typegraph::type_role::spec;
            }
            if (prop->name == "status") {
                return typegraph::type_role::status;
            }
        }
    }
    return typegraph::type_role::nested;
}

// Key identifying a type body up to field order and documentation. Two bodies
// with equal keys describe the same type.
struct structural_key_visitor {
    ss::sstring operator()(const composite& c) const {
        std::vector<std::string> parts;
        parts.reserve(c.fields.size());
        for (const auto& f : c.fields) {
            parts.push_back(fmt::format(
              "{}:{}:{}:{}",
              f.name,
              f.type,
              static_cast<bool>(f.required),
              static_cast<int>(f.absent)));
        }
        std::sort(parts.begin(), parts.end());
        return fmt::format("composite{{{}}}", fmt::join(parts, ","));
    }
    ss::sstring operator()(const unit_enum& u) const {
        std::vector<std::string> parts;
        parts.reserve(u.literals.size());
        for (const auto& l : u.literals) {
            parts.push_back(fmt::format("{}/{}", l.kind, l.text));
        }
        std::sort(parts.begin(), parts.end());
        return fmt::format("enum{{{}}}", fmt::join(parts, ","));
    }
    ss::sstring operator()(const tagged_enum& t) const {
        std::vector<std::string> parts;
        parts.reserve(t.variants.size());
        for (const auto& v : t.variants) {
            parts.push_back(fmt::format("{}:{}", v.name, v.type));
        }
        return fmt::format("tagged[{}]", fmt::join(parts, ","));
    }
};

ss::sstring structural_key(const typegraph::type_body& body) {
    return std::visit(structural_key_visitor{}, body);
}

struct remapping_visitor {
    const std::vector<type_id>& table;

    void operator()(primitive_ref&) const {}
    void operator()(generated_ref& r) const {
        auto to = table.at(r.id());
        if (to == type_id::max()) {
            throw std::logic_error(
              fmt::format("reference to discarded type {}", r.id));
        }
        r.id = to;
    }
    void operator()(typegraph::external_ref&) const {}
    void operator()(unknown_ref&) const {}
    void operator()(typegraph::sequence_ref& r) const {
        std::visit(*this, *r.element);
    }
    void operator()(typegraph::map_ref& r) const {
        std::visit(*this, *r.value);
    }
    void operator()(typegraph::optional_ref& r) const {
        std::visit(*this, *r.inner);
    }
};

void remap_body(typegraph::type_body& body, const std::vector<type_id>& table) {
    ss::visit(
      body,
      [&table](composite& c) {
          for (auto& f : c.fields) {
              std::visit(remapping_visitor{table}, f.type);
          }
      },
      [](unit_enum&) {},
      [&table](tagged_enum& t) {
          for (auto& v : t.variants) {
              std::visit(remapping_visitor{table}, v.type);
          }
      });
}

bool equivalent(
  const schema::tree&, schema::node_id, schema::node_id, size_t depth);

// Structural equality of two schema subtrees, used to accept a property that
// several allOf branches declare identically.
struct schema_equivalence_visitor {
    const schema::tree& t;
    size_t depth;

    template<typename T, typename U>
    bool operator()(const T&, const U&) const {
        return false;
    }
    bool operator()(
      const schema::scalar_node& lhs, const schema::scalar_node& rhs) const {
        return lhs == rhs;
    }
    bool operator()(
      const schema::object_node& lhs, const schema::object_node& rhs) const {
        if (
          lhs.required != rhs.required
          || lhs.properties.size() != rhs.properties.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.properties.size(); ++i) {
            const auto& l = lhs.properties[i];
            const auto& r = rhs.properties[i];
            if (l.name != r.name || !equivalent(t, l.node, r.node, depth + 1)) {
                return false;
            }
        }
        return true;
    }
    bool operator()(
      const schema::array_node& lhs, const schema::array_node& rhs) const {
        if (!lhs.items || !rhs.items) {
            return lhs.items.has_value() == rhs.items.has_value();
        }
        return equivalent(t, *lhs.items, *rhs.items, depth + 1);
    }
    bool
    operator()(const schema::map_node& lhs, const schema::map_node& rhs) const {
        return equivalent(t, lhs.value, rhs.value, depth + 1);
    }
    bool operator()(
      const schema::union_node& lhs, const schema::union_node& rhs) const {
        return lhs.kind == rhs.kind && all_equivalent(lhs.variants, rhs.variants);
    }
    bool operator()(
      const schema::enumeration_node& lhs,
      const schema::enumeration_node& rhs) const {
        return lhs.kind == rhs.kind && lhs.literals == rhs.literals;
    }
    bool operator()(
      const schema::intersection_node& lhs,
      const schema::intersection_node& rhs) const {
        return all_equivalent(lhs.branches, rhs.branches);
    }
    bool operator()(const schema::unknown_node&, const schema::unknown_node&)
      const {
        return true;
    }

    bool all_equivalent(
      const std::vector<schema::node_id>& lhs,
      const std::vector<schema::node_id>& rhs) const {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (!equivalent(t, lhs[i], rhs[i], depth + 1)) {
                return false;
            }
        }
        return true;
    }
};

bool equivalent(
  const schema::tree& t, schema::node_id a, schema::node_id b, size_t depth) {
    if (a == b) {
        return true;
    }
    if (depth > max_schema_depth) {
        return false;
    }
    const auto& x = t.get(a);
    const auto& y = t.get(b);
    if (
      x.nullable != y.nullable || x.int_or_string != y.int_or_string
      || x.preserve_unknown_fields != y.preserve_unknown_fields) {
        return false;
    }
    return std::visit(schema_equivalence_visitor{t, depth}, x.kind, y.kind);
}

ss::sstring default_variant_name(const schema::node& n) {
    return ss::visit(
      n.kind,
      [](const schema::scalar_node& s) -> ss::sstring {
          switch (s.kind) {
          case schema::scalar_kind::string:
              return "String";
          case schema::scalar_kind::integer:
              return "Integer";
          case schema::scalar_kind::number:
              return "Number";
          case schema::scalar_kind::boolean:
              return "Boolean";
          }
          return "Value";
      },
      [](const schema::array_node&) -> ss::sstring { return "Array"; },
      [](const schema::map_node&) -> ss::sstring { return "Map"; },
      [](const schema::object_node&) -> ss::sstring { return "Object"; },
      [](const schema::intersection_node&) -> ss::sstring { return "Object"; },
      [](const schema::union_node&) -> ss::sstring { return "Union"; },
      [](const schema::enumeration_node&) -> ss::sstring { return "Enum"; },
      [](const schema::unknown_node&) -> ss::sstring { return "Value"; });
}

// Variant names come from titles when present, otherwise from the shape.
// Names shared by several variants are numbered: Object1, Object2.
std::vector<ss::sstring>
variant_names(const schema::tree& t, const schema::union_node& u) {
    std::vector<ss::sstring> names;
    names.reserve(u.variants.size());
    absl::btree_map<ss::sstring, size_t> occurrences;
    for (auto id : u.variants) {
        const auto& n = t.get(id);
        ss::sstring name = n.title ? to_pascal_case(*n.title) : "";
        if (name.empty()) {
            name = default_variant_name(n);
        }
        ++occurrences[name];
        names.push_back(std::move(name));
    }
    absl::btree_map<ss::sstring, size_t> seen;
    for (auto& name : names) {
        if (occurrences[name] > 1) {
            name = fmt::format("{}{}", name, ++seen[name]);
        }
    }
    return names;
}

} // namespace

type_graph_builder::type_graph_builder(
  const schema::tree& tree,
  ss::sstring root_name,
  const configuration& cfg,
  ss::abort_source* as)
  : _tree(tree)
  , _root_name(to_pascal_case(root_name))
  , _cfg(cfg)
  , _as(as) {}

analysis_outcome<typegraph::type_graph> type_graph_builder::build() && {
    schema::path root(_root_name);
    if (!_tree.has_root()) {
        return analysis_error(
          analysis_errc::unsupported_schema_construct,
          root,
          "schema has no root node");
    }
    auto res = visit(_tree.root(), root, 0);
    if (res.has_error()) {
        crdgen_log(analysis_log.debug, "analysis failed: {}", res.error().what());
        return res.error();
    }
    return finish(std::move(res.value()));
}

type_graph_builder::ref_outcome type_graph_builder::visit(
  schema::node_id id, const schema::path& p, size_t depth) {
    if (_as != nullptr && _as->abort_requested()) {
        return analysis_error(analysis_errc::cancelled, p, "analysis aborted");
    }
    if (depth > max_schema_depth) {
        return analysis_error(
          analysis_errc::cycle_depth_exceeded,
          p,
          fmt::format("schema nesting exceeds {} levels", max_schema_depth));
    }
    if (_stack.contains(id)) {
        auto target = slot_under_analysis(id);
        if (!target) {
            return fail_or_relax(
              analysis_errc::unsupported_schema_construct,
              p,
              "recursive schema does not pass through an object or a union");
        }
        auto& s = _slots[*target];
        s.recursive = true;
        crdgen_log(
          analysis_log.debug,
          "{}: recursive reference to the type at {}",
          p,
          s.type.origin);
        return type_ref{generated_ref{s.type.id, typegraph::indirect::yes}};
    }
    if (auto it = _memo.find(id); it != _memo.end()) {
        return make_copy(it->second);
    }

    _stack.emplace(id, frame{});
    auto deferred_pop = ss::defer([this, id] { _stack.erase(id); });

    auto res = visit_node(id, p, depth);
    if (res.has_value()) {
        _memo.emplace(id, make_copy(res.value()));
    }
    return res;
}

type_graph_builder::ref_outcome type_graph_builder::visit_as(
  schema::node_id from,
  schema::node_id to,
  const schema::path& p,
  size_t depth) {
    _stack[from].forward = to;
    return visit(to, p, depth);
}

std::optional<size_t>
type_graph_builder::slot_under_analysis(schema::node_id id) const {
    // follow nodes analyzed in place of another one; a chain is never longer
    // than the stack itself
    for (size_t hops = 0; hops <= _stack.size(); ++hops) {
        auto it = _stack.find(id);
        if (it == _stack.end()) {
            return std::nullopt;
        }
        if (it->second.slot) {
            return it->second.slot;
        }
        if (!it->second.forward) {
            return std::nullopt;
        }
        id = *it->second.forward;
    }
    return std::nullopt;
}

type_graph_builder::ref_outcome type_graph_builder::visit_node(
  schema::node_id id, const schema::path& p, size_t depth) {
    const auto& n = _tree.get(id);
    if (auto shape = detect_known_shape(_tree, n, p);
        shape && !_cfg.is_suppressed(*shape)) {
        crdgen_log(analysis_log.debug, "{}: using known shape {}", p, *shape);
        return type_ref{typegraph::external_ref{*shape}};
    }

    return ss::visit(
      n.kind,
      [this](const schema::scalar_node& s) -> ref_outcome {
          return visit_scalar(s);
      },
      [&](const schema::object_node& o) -> ref_outcome {
          return visit_object(
            id, n, o.properties, o.required, o.ordered, p, depth);
      },
      [&](const schema::array_node& a) -> ref_outcome {
          return visit_array(a, p, depth);
      },
      [&](const schema::map_node& m) -> ref_outcome {
          return visit_map(m, p, depth);
      },
      [&](const schema::union_node& u) -> ref_outcome {
          return visit_union(id, n, u, p, depth);
      },
      [&](const schema::enumeration_node& e) -> ref_outcome {
          return visit_enumeration(id, n, e, p);
      },
      [&](const schema::intersection_node& x) -> ref_outcome {
          return visit_intersection(id, n, x, p, depth);
      },
      [&](const schema::unknown_node&) -> ref_outcome {
          if (n.preserve_unknown_fields) {
              return type_ref{unknown_ref{}};
          }
          return fail_or_relax(
            analysis_errc::unsupported_schema_construct,
            p,
            "schema without a type must preserve unknown fields");
      });
}

type_ref type_graph_builder::visit_scalar(const schema::scalar_node& s) {
    switch (s.kind) {
    case schema::scalar_kind::string:
        if (s.format == "date") {
            return primitive_ref{primitive::date};
        }
        if (s.format == "date-time") {
            return primitive_ref{primitive::date_time};
        }
        return primitive_ref{primitive::string};
    case schema::scalar_kind::integer:
        return primitive_ref{integer_primitive(s.format)};
    case schema::scalar_kind::number:
        if (s.format == "float") {
            return primitive_ref{primitive::float32};
        }
        return primitive_ref{primitive::float64};
    case schema::scalar_kind::boolean:
        return primitive_ref{primitive::boolean};
    }
    return unknown_ref{};
}

type_graph_builder::ref_outcome type_graph_builder::visit_object(
  schema::node_id id,
  const schema::node& n,
  const std::vector<schema::property>& properties,
  const absl::btree_set<ss::sstring>& required,
  schema::declared_order ordered,
  const schema::path& p,
  size_t depth) {
    std::vector<const schema::property*> order;
    order.reserve(properties.size());
    for (const auto& prop : properties) {
        if (p.is_root() && is_envelope(prop.name)) {
            crdgen_log(analysis_log.debug, "{}: skipping {}", p, prop.name);
            continue;
        }
        order.push_back(&prop);
    }
    if (order.empty()) {
        crdgen_log(
          analysis_log.debug, "{}: object without properties is a map", p);
        return typegraph::map_of(unknown_ref{});
    }
    if (!ordered) {
        std::sort(order.begin(), order.end(), [](const auto* a, const auto* b) {
            return a->name < b->name;
        });
    }

    auto slot = open_slot(id, n, p);
    composite c;
    for (const auto* prop : order) {
        const auto& child = _tree.get(prop->node);
        auto res = visit(
          prop->node, p / schema::property_segment{prop->name}, depth + 1);
        if (res.has_error()) {
            return res.error();
        }
        auto type = std::move(res.value());

        field_required req{required.contains(prop->name) && !child.nullable};
        auto absent = req && is_container(type) ? absent_policy::treat_as_empty
                                                : absent_policy::none;
        std::optional<ss::sstring> doc;
        if (_cfg.docs_enabled()) {
            doc = child.description;
        }
        c.fields.push_back(
          field{prop->name, std::move(type), req, absent, std::move(doc)});
    }
    return close_slot(slot, std::move(c));
}

type_ref type_graph_builder::element_ref(schema::node_id id, type_ref t) {
    if (_tree.get(id).nullable) {
        return typegraph::optional_of(std::move(t));
    }
    return t;
}

type_graph_builder::ref_outcome type_graph_builder::visit_array(
  const schema::array_node& a, const schema::path& p, size_t depth) {
    if (!a.items) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "array without an items schema",
          typegraph::sequence_of(unknown_ref{}));
    }
    auto res = visit(*a.items, p / schema::items_segment{}, depth + 1);
    if (res.has_error()) {
        return res.error();
    }
    return typegraph::sequence_of(
      element_ref(*a.items, std::move(res.value())));
}

type_graph_builder::ref_outcome type_graph_builder::visit_map(
  const schema::map_node& m, const schema::path& p, size_t depth) {
    auto res = visit(m.value, p / schema::value_segment{}, depth + 1);
    if (res.has_error()) {
        return res.error();
    }
    return typegraph::map_of(element_ref(m.value, std::move(res.value())));
}

type_graph_builder::ref_outcome type_graph_builder::visit_union(
  schema::node_id id,
  const schema::node& n,
  const schema::union_node& u,
  const schema::path& p,
  size_t depth) {
    if (u.variants.empty()) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "union without variants");
    }
    if (u.variants.size() == 1) {
        return visit_as(id, u.variants.front(), p, depth + 1);
    }

    size_t literal_variants = 0;
    for (auto v : u.variants) {
        const auto& vn = _tree.get(v);
        if (std::holds_alternative<schema::enumeration_node>(vn.kind)) {
            ++literal_variants;
        } else if (
          std::holds_alternative<schema::unknown_node>(vn.kind)
          && !vn.int_or_string) {
            return fail_or_relax(
              analysis_errc::irreconcilable_union,
              p,
              "a union variant without a schema accepts every value");
        }
    }

    if (literal_variants == u.variants.size()) {
        unit_enum body;
        for (auto v : u.variants) {
            const auto& e = std::get<schema::enumeration_node>(
              _tree.get(v).kind);
            if (e.kind == schema::scalar_kind::number) {
                return fail_or_relax(
                  analysis_errc::unsupported_schema_construct,
                  p,
                  "enumerations of floating point numbers are not supported");
            }
            for (const auto& l : e.literals) {
                auto dup = std::find_if(
                  body.literals.begin(),
                  body.literals.end(),
                  [&l](const auto& existing) {
                      return existing.text == l.text
                             && existing.kind == l.kind;
                  });
                if (dup == body.literals.end()) {
                    body.literals.push_back({l.text, l.kind});
                }
            }
        }
        if (body.literals.empty()) {
            return fail_or_relax(
              analysis_errc::unsupported_schema_construct,
              p,
              "enumeration without literals");
        }
        auto slot = open_slot(id, n, p);
        return close_slot(slot, std::move(body));
    }
    if (literal_variants > 0) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "union mixes literal values with typed variants");
    }

    auto names = variant_names(_tree, u);
    auto slot = open_slot(id, n, p);
    tagged_enum body;
    for (size_t i = 0; i < u.variants.size(); ++i) {
        auto res = visit(
          u.variants[i], p / schema::variant_segment{names[i]}, depth + 1);
        if (res.has_error()) {
            return res.error();
        }
        for (const auto& prior : body.variants) {
            if (prior.type == res.value()) {
                auto detail = fmt::format(
                  "variants {} and {} have the same shape",
                  prior.name,
                  names[i]);
                if (_slots[slot].recursive) {
                    return analysis_error(
                      analysis_errc::irreconcilable_union, p, detail);
                }
                _slots[slot].merged = true;
                return fail_or_relax(
                  analysis_errc::irreconcilable_union, p, detail);
            }
        }
        body.variants.push_back({names[i], std::move(res.value())});
    }
    return close_slot(slot, std::move(body));
}

type_graph_builder::ref_outcome type_graph_builder::visit_enumeration(
  schema::node_id id,
  const schema::node& n,
  const schema::enumeration_node& e,
  const schema::path& p) {
    if (e.kind == schema::scalar_kind::number) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "enumerations of floating point numbers are not supported");
    }
    unit_enum body;
    for (const auto& l : e.literals) {
        auto dup = std::find_if(
          body.literals.begin(),
          body.literals.end(),
          [&l](const auto& existing) {
              return existing.text == l.text && existing.kind == l.kind;
          });
        if (dup == body.literals.end()) {
            body.literals.push_back({l.text, l.kind});
        }
    }
    if (body.literals.empty()) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "enumeration without literals");
    }
    auto slot = open_slot(id, n, p);
    return close_slot(slot, std::move(body));
}

type_graph_builder::ref_outcome type_graph_builder::visit_intersection(
  schema::node_id id,
  const schema::node& n,
  const schema::intersection_node& x,
  const schema::path& p,
  size_t depth) {
    if (x.branches.empty()) {
        return fail_or_relax(
          analysis_errc::unsupported_schema_construct,
          p,
          "allOf without branches");
    }
    // allOf over one scalar type only narrows its values
    const auto* first = std::get_if<schema::scalar_node>(
      &_tree.get(x.branches.front()).kind);
    if (
      first != nullptr
      && std::all_of(
        x.branches.begin(), x.branches.end(), [&](schema::node_id b) {
            const auto* s = std::get_if<schema::scalar_node>(
              &_tree.get(b).kind);
            return s != nullptr && s->kind == first->kind;
        })) {
        return visit_as(id, x.branches.front(), p, depth + 1);
    }

    auto flat = flatten(x, p, depth);
    if (flat.has_error()) {
        const auto& e = flat.error();
        return fail_or_relax(e.code(), e.where(), e.detail());
    }
    return visit_object(
      id,
      n,
      flat.value().properties,
      flat.value().required,
      schema::declared_order::yes,
      p,
      depth);
}

analysis_outcome<type_graph_builder::flattened_object>
type_graph_builder::flatten(
  const schema::intersection_node& x, const schema::path& p, size_t depth) {
    if (depth > max_schema_depth) {
        return analysis_error(
          analysis_errc::cycle_depth_exceeded,
          p,
          fmt::format("allOf nesting exceeds {} levels", max_schema_depth));
    }
    flattened_object out;
    auto merge = [&](
                   const std::vector<schema::property>& properties,
                   const absl::btree_set<ss::sstring>& required)
      -> std::optional<analysis_error> {
        for (const auto& prop : properties) {
            auto existing = std::find_if(
              out.properties.begin(),
              out.properties.end(),
              [&prop](const auto& e) { return e.name == prop.name; });
            if (existing == out.properties.end()) {
                out.properties.push_back(prop);
            } else if (!equivalent(_tree, existing->node, prop.node, 0)) {
                return analysis_error(
                  analysis_errc::unsupported_schema_construct,
                  p,
                  fmt::format(
                    "property {} is declared differently by two allOf "
                    "branches",
                    prop.name));
            }
        }
        out.required.insert(required.begin(), required.end());
        return std::nullopt;
    };

    for (auto b : x.branches) {
        const auto& bn = _tree.get(b);
        if (const auto* obj = std::get_if<schema::object_node>(&bn.kind)) {
            if (auto err = merge(obj->properties, obj->required)) {
                return *err;
            }
        } else if (
          const auto* nested = std::get_if<schema::intersection_node>(
            &bn.kind)) {
            auto res = flatten(*nested, p, depth + 1);
            if (res.has_error()) {
                return res.error();
            }
            if (auto err = merge(res.value().properties, res.value().required)) {
                return *err;
            }
        } else if (
          std::holds_alternative<schema::unknown_node>(bn.kind)
          && bn.preserve_unknown_fields) {
            crdgen_log(
              analysis_log.debug,
              "{}: ignoring an allOf branch that preserves unknown fields",
              p);
        } else {
            return analysis_error(
              analysis_errc::unsupported_schema_construct,
              p,
              fmt::format(
                "allOf branch of kind {} cannot be merged into an object",
                schema::kind_name(bn.kind)));
        }
    }
    return out;
}

size_t type_graph_builder::open_slot(
  schema::node_id id, const schema::node& n, const schema::path& p) {
    auto idx = _slots.size();
    slot s;
    s.type.id = type_id(static_cast<type_id::type>(idx));
    s.type.origin = p;
    s.type.role = role_of(p);
    if (_cfg.docs_enabled()) {
        s.type.doc = n.description;
    }
    _slots.push_back(std::move(s));
    _stack[id].slot = idx;
    return idx;
}

type_ref type_graph_builder::close_slot(size_t idx, typegraph::type_body body) {
    auto& s = _slots[idx];
    s.complete = true;
    if (!s.recursive) {
        auto key = structural_key(body);
        if (auto it = _by_key.find(key); it != _by_key.end()) {
            s.merged = true;
            crdgen_log(
              analysis_log.debug,
              "{}: same structure as the type at {}",
              s.type.origin,
              _slots[it->second].type.origin);
            return generated_ref{_slots[it->second].type.id};
        }
        _by_key.emplace(std::move(key), idx);
    }
    s.type.body = std::move(body);
    return generated_ref{s.type.id};
}

type_graph_builder::ref_outcome type_graph_builder::fail_or_relax(
  analysis_errc code,
  const schema::path& p,
  ss::sstring detail,
  type_ref fallback) {
    const bool relaxable = code == analysis_errc::unsupported_schema_construct
                           || code == analysis_errc::irreconcilable_union;
    if (!_cfg.relaxed || !relaxable) {
        return analysis_error(code, p, std::move(detail));
    }
    crdgen_log(
      analysis_log.warn, "{}: {}, using an unknown value", p, detail);
    _diagnostics.push_back(typegraph::diagnostic{p, std::move(detail)});
    return std::move(fallback);
}

analysis_outcome<typegraph::type_graph>
type_graph_builder::finish(type_ref root) {
    std::vector<type_id> table(_slots.size(), type_id::max());
    std::vector<slot*> live;
    for (size_t i = 0; i < _slots.size(); ++i) {
        auto& s = _slots[i];
        if (s.merged) {
            continue;
        }
        if (!s.complete) {
            throw std::logic_error(fmt::format(
              "type at {} was never completed", s.type.origin));
        }
        table[i] = type_id(static_cast<type_id::type>(live.size()));
        live.push_back(&s);
    }
    for (auto* s : live) {
        remap_body(s->type.body, table);
    }
    std::visit(remapping_visitor{table}, root);

    if (auto err = assign_names(live)) {
        return *err;
    }

    typegraph::type_graph graph;
    graph.set_map_representation(_cfg.maps);
    graph.set_schema_mode(_cfg.effective_schema_mode());
    for (auto* s : live) {
        graph.add(std::move(s->type));
    }
    graph.set_root(std::move(root));
    for (auto& d : _diagnostics) {
        graph.add_diagnostic(std::move(d));
    }
    crdgen_log(
      analysis_log.debug,
      "built {} types from {} schema nodes, {} diagnostics",
      graph.size(),
      _tree.size(),
      graph.diagnostics().size());
    return std::move(graph);
}

std::optional<analysis_error>
type_graph_builder::assign_names(std::vector<slot*>& live) {
    absl::btree_map<ss::sstring, const schema::path*> taken;
    for (auto* s : live) {
        // Root followed by every named segment of the origin
        ss::sstring name = _root_name;
        for (const auto& seg : s->type.origin.named_segments()) {
            name += to_pascal_case(seg);
        }
        auto [it, inserted] = taken.emplace(name, &s->type.origin);
        if (!inserted) {
            return analysis_error(
              analysis_errc::naming_collision,
              s->type.origin,
              fmt::format("name {} is already taken by {}", name, *it->second));
        }
        crdgen_log(analysis_log.debug, "{}: named {}", s->type.origin, name);
        s->type.name = std::move(name);
    }
    return std::nullopt;
}

analysis_outcome<typegraph::type_graph> build_type_graph(
  const schema::tree& tree,
  ss::sstring root_name,
  const configuration& cfg,
  ss::abort_source* as) {
    return type_graph_builder(tree, std::move(root_name), cfg, as).build();
}

} // namespace crdgen::analysis
