// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/version_reconciler.h"

#include "analysis/logger.h"
#include "analysis/type_graph_builder.h"
#include "base/vlog.h"
#include "schema/api_version.h"
#include "utils/case_conversion.h"

#include <seastar/util/variant_utils.hh>

#include <absl/container/flat_hash_map.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <utility>

namespace crdgen::analysis {

namespace {

std::vector<const schema::schema_version*>
by_priority(std::vector<const schema::schema_version*> versions) {
    std::stable_sort(
      versions.begin(), versions.end(), [](const auto* a, const auto* b) {
          return schema::api_version::parse(a->name)
                 > schema::api_version::parse(b->name);
      });
    return versions;
}

ss::sstring
describe_available(const std::vector<schema::schema_version>& versions) {
    std::vector<const schema::schema_version*> with_schema;
    for (const auto& v : versions) {
        if (v.schema) {
            with_schema.push_back(&v);
        }
    }
    std::vector<ss::sstring> names;
    for (const auto* v : by_priority(std::move(with_schema))) {
        names.push_back(v->name);
    }
    return fmt::format("{}", fmt::join(names, ", "));
}

// Served versions carrying a schema, or every version with a schema when
// none of them is served.
std::vector<const schema::schema_version*>
candidates(const std::vector<schema::schema_version>& versions) {
    std::vector<const schema::schema_version*> served;
    std::vector<const schema::schema_version*> all;
    for (const auto& v : versions) {
        if (!v.schema) {
            continue;
        }
        all.push_back(&v);
        if (v.served) {
            served.push_back(&v);
        }
    }
    return served.empty() ? all : served;
}

struct integer_format {
    bool is_signed;
    int width;
};

std::optional<integer_format>
parse_integer_format(const std::optional<ss::sstring>& format) {
    static constexpr std::array<std::pair<std::string_view, integer_format>, 10>
      formats{{
        {"int8", {true, 8}},
        {"int16", {true, 16}},
        {"int32", {true, 32}},
        {"int64", {true, 64}},
        {"int128", {true, 128}},
        {"uint8", {false, 8}},
        {"uint16", {false, 16}},
        {"uint32", {false, 32}},
        {"uint64", {false, 64}},
        {"uint128", {false, 128}},
      }};
    if (!format) {
        return integer_format{true, 64};
    }
    for (const auto& [name, f] : formats) {
        if (*format == name) {
            return f;
        }
    }
    // unknown formats read as the default integer
    return integer_format{true, 64};
}

int number_width(const std::optional<ss::sstring>& format) {
    return format == "float" ? 32 : 64;
}

/// The scalar able to hold the values of both inputs without loss, if any:
/// narrower integers widen (int32 -> int64), float widens to double, and
/// strings with different formats become plain strings.
std::optional<schema::scalar_node>
promote(const schema::scalar_node& lhs, const schema::scalar_node& rhs) {
    if (lhs.kind != rhs.kind) {
        return std::nullopt;
    }
    if (lhs.format == rhs.format) {
        return lhs;
    }
    switch (lhs.kind) {
    case schema::scalar_kind::integer: {
        auto l = parse_integer_format(lhs.format);
        auto r = parse_integer_format(rhs.format);
        if (l->is_signed != r->is_signed) {
            return std::nullopt;
        }
        return l->width >= r->width ? lhs : rhs;
    }
    case schema::scalar_kind::number:
        return number_width(lhs.format) >= number_width(rhs.format) ? lhs
                                                                    : rhs;
    case schema::scalar_kind::string:
        return schema::scalar_node{schema::scalar_kind::string, std::nullopt};
    case schema::scalar_kind::boolean:
        return lhs;
    }
    return std::nullopt;
}

/// Merges schema trees pairwise into a fresh tree. Nodes are memoized on the
/// pair of source nodes, which makes recursive schemas terminate.
class schema_merger {
public:
    explicit schema_merger(schema::tree& out)
      : _out(out) {}

    analysis_outcome<schema::node_id> merge(
      const schema::tree& a,
      schema::node_id x,
      const schema::tree& b,
      schema::node_id y,
      const schema::path& p,
      size_t depth);

    schema::node_id import(const schema::tree& src, schema::node_id id);

private:
    analysis_outcome<schema::node_kind> merge_kind(
      const schema::tree& a,
      const schema::node& x,
      const schema::tree& b,
      const schema::node& y,
      const schema::path& p,
      size_t depth);

    analysis_outcome<std::vector<schema::node_id>> merge_pairwise(
      const schema::tree& a,
      const std::vector<schema::node_id>& x,
      const schema::tree& b,
      const std::vector<schema::node_id>& y,
      const schema::path& p,
      size_t depth);

    schema::tree& _out;
    absl::flat_hash_map<std::pair<schema::node_id, schema::node_id>, schema::node_id>
      _merged;
    absl::flat_hash_map<
      std::pair<const schema::tree*, schema::node_id>,
      schema::node_id>
      _imported;
};

schema::node_id
schema_merger::import(const schema::tree& src, schema::node_id id) {
    auto key = std::make_pair(&src, id);
    if (auto it = _imported.find(key); it != _imported.end()) {
        return it->second;
    }
    auto out_id = _out.reserve();
    _imported.emplace(key, out_id);

    schema::node copy = src.get(id);
    ss::visit(
      copy.kind,
      [](schema::scalar_node&) {},
      [&](schema::object_node& o) {
          for (auto& prop : o.properties) {
              prop.node = import(src, prop.node);
          }
      },
      [&](schema::array_node& a) {
          if (a.items) {
              a.items = import(src, *a.items);
          }
      },
      [&](schema::map_node& m) { m.value = import(src, m.value); },
      [&](schema::union_node& u) {
          for (auto& v : u.variants) {
              v = import(src, v);
          }
      },
      [](schema::enumeration_node&) {},
      [&](schema::intersection_node& x) {
          for (auto& b : x.branches) {
              b = import(src, b);
          }
      },
      [](schema::unknown_node&) {});
    _out.define(out_id, std::move(copy));
    return out_id;
}

analysis_outcome<schema::node_id> schema_merger::merge(
  const schema::tree& a,
  schema::node_id x,
  const schema::tree& b,
  schema::node_id y,
  const schema::path& p,
  size_t depth) {
    auto key = std::make_pair(x, y);
    if (auto it = _merged.find(key); it != _merged.end()) {
        return it->second;
    }
    if (depth > max_schema_depth) {
        return analysis_error(
          analysis_errc::cycle_depth_exceeded,
          p,
          fmt::format("schema nesting exceeds {} levels", max_schema_depth));
    }
    const auto& nx = a.get(x);
    const auto& ny = b.get(y);

    // int-or-string accepts either scalar kind of the other version
    if (nx.int_or_string || ny.int_or_string) {
        auto id = nx.int_or_string ? import(a, x) : import(b, y);
        _merged.emplace(key, id);
        return id;
    }

    auto out_id = _out.reserve();
    _merged.emplace(key, out_id);

    auto kind = merge_kind(a, nx, b, ny, p, depth);
    if (kind.has_error()) {
        return kind.error();
    }
    schema::node merged;
    merged.kind = std::move(kind.value());
    merged.nullable = nx.nullable || ny.nullable;
    merged.preserve_unknown_fields = nx.preserve_unknown_fields
                                     || ny.preserve_unknown_fields;
    merged.embedded_resource = nx.embedded_resource || ny.embedded_resource;
    merged.title = nx.title ? nx.title : ny.title;
    merged.description = nx.description ? nx.description : ny.description;
    _out.define(out_id, std::move(merged));
    return out_id;
}

analysis_outcome<std::vector<schema::node_id>> schema_merger::merge_pairwise(
  const schema::tree& a,
  const std::vector<schema::node_id>& x,
  const schema::tree& b,
  const std::vector<schema::node_id>& y,
  const schema::path& p,
  size_t depth) {
    if (x.size() != y.size()) {
        return analysis_error(
          analysis_errc::reconcile_error,
          p,
          fmt::format(
            "versions declare {} and {} union branches", x.size(), y.size()));
    }
    std::vector<schema::node_id> out;
    out.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        auto res = merge(
          a,
          x[i],
          b,
          y[i],
          p / schema::variant_segment{fmt::format("{}", i)},
          depth + 1);
        if (res.has_error()) {
            return res.error();
        }
        out.push_back(res.value());
    }
    return out;
}

analysis_outcome<schema::node_kind> schema_merger::merge_kind(
  const schema::tree& a,
  const schema::node& x,
  const schema::tree& b,
  const schema::node& y,
  const schema::path& p,
  size_t depth) {
    if (x.kind.index() != y.kind.index()) {
        auto code = std::holds_alternative<schema::scalar_node>(x.kind)
                        && std::holds_alternative<schema::scalar_node>(y.kind)
                      ? analysis_errc::irreconcilable_union
                      : analysis_errc::reconcile_error;
        return analysis_error(
          code,
          p,
          fmt::format(
            "{} in one version and {} in another",
            schema::kind_name(x.kind),
            schema::kind_name(y.kind)));
    }

    if (const auto* sx = std::get_if<schema::scalar_node>(&x.kind)) {
        const auto& sy = std::get<schema::scalar_node>(y.kind);
        auto promoted = promote(*sx, sy);
        if (!promoted) {
            return analysis_error(
              analysis_errc::irreconcilable_union,
              p,
              fmt::format(
                "{}{} in one version and {}{} in another",
                sx->kind,
                sx->format ? fmt::format(" ({})", *sx->format) : "",
                sy.kind,
                sy.format ? fmt::format(" ({})", *sy.format) : ""));
        }
        return schema::node_kind{*promoted};
    }

    if (const auto* ox = std::get_if<schema::object_node>(&x.kind)) {
        const auto& oy = std::get<schema::object_node>(y.kind);
        schema::object_node out;
        out.ordered = schema::declared_order(
          static_cast<bool>(ox->ordered) && static_cast<bool>(oy.ordered));
        for (const auto& px : ox->properties) {
            const auto* py = oy.find(px.name);
            if (py == nullptr) {
                crdgen_log(
                  analysis_log.debug,
                  "{}.{} is missing from a version, making it optional",
                  p,
                  px.name);
                out.properties.push_back({px.name, import(a, px.node)});
                continue;
            }
            auto res = merge(
              a,
              px.node,
              b,
              py->node,
              p / schema::property_segment{px.name},
              depth + 1);
            if (res.has_error()) {
                return res.error();
            }
            out.properties.push_back({px.name, res.value()});
            if (ox->required.contains(px.name) && oy.required.contains(px.name)) {
                out.required.insert(px.name);
            }
        }
        for (const auto& py : oy.properties) {
            if (ox->find(py.name) == nullptr) {
                crdgen_log(
                  analysis_log.debug,
                  "{}.{} is missing from a version, making it optional",
                  p,
                  py.name);
                out.properties.push_back({py.name, import(b, py.node)});
            }
        }
        return schema::node_kind{std::move(out)};
    }

    if (const auto* ax = std::get_if<schema::array_node>(&x.kind)) {
        const auto& ay = std::get<schema::array_node>(y.kind);
        if (!ax->items || !ay.items) {
            if (ax->items) {
                return schema::node_kind{schema::array_node{import(a, *ax->items)}};
            }
            if (ay.items) {
                return schema::node_kind{schema::array_node{import(b, *ay.items)}};
            }
            return schema::node_kind{schema::array_node{}};
        }
        auto res = merge(
          a, *ax->items, b, *ay.items, p / schema::items_segment{}, depth + 1);
        if (res.has_error()) {
            return res.error();
        }
        return schema::node_kind{schema::array_node{res.value()}};
    }

    if (const auto* mx = std::get_if<schema::map_node>(&x.kind)) {
        const auto& my = std::get<schema::map_node>(y.kind);
        auto res = merge(
          a, mx->value, b, my.value, p / schema::value_segment{}, depth + 1);
        if (res.has_error()) {
            return res.error();
        }
        return schema::node_kind{schema::map_node{res.value()}};
    }

    if (const auto* ux = std::get_if<schema::union_node>(&x.kind)) {
        const auto& uy = std::get<schema::union_node>(y.kind);
        auto res = merge_pairwise(a, ux->variants, b, uy.variants, p, depth);
        if (res.has_error()) {
            return res.error();
        }
        return schema::node_kind{
          schema::union_node{ux->kind, std::move(res.value())}};
    }

    if (const auto* ex = std::get_if<schema::enumeration_node>(&x.kind)) {
        const auto& ey = std::get<schema::enumeration_node>(y.kind);
        if (ex->kind != ey.kind) {
            return analysis_error(
              analysis_errc::irreconcilable_union,
              p,
              fmt::format(
                "enumeration of {} in one version and of {} in another",
                ex->kind,
                ey.kind));
        }
        schema::enumeration_node out = *ex;
        for (const auto& l : ey.literals) {
            if (
              std::find(out.literals.begin(), out.literals.end(), l)
              == out.literals.end()) {
                out.literals.push_back(l);
            }
        }
        return schema::node_kind{std::move(out)};
    }

    if (const auto* ix = std::get_if<schema::intersection_node>(&x.kind)) {
        const auto& iy = std::get<schema::intersection_node>(y.kind);
        auto res = merge_pairwise(a, ix->branches, b, iy.branches, p, depth);
        if (res.has_error()) {
            return res.error();
        }
        return schema::node_kind{schema::intersection_node{std::move(res.value())}};
    }

    return schema::node_kind{schema::unknown_node{}};
}

} // namespace

analysis_outcome<size_t> select_version(
  const std::vector<schema::schema_version>& versions,
  const configuration& cfg) {
    schema::path root;
    if (cfg.version_pin) {
        for (size_t i = 0; i < versions.size(); ++i) {
            if (versions[i].name != *cfg.version_pin) {
                continue;
            }
            if (!versions[i].schema) {
                return analysis_error(
                  analysis_errc::reconcile_error,
                  root,
                  fmt::format(
                    "version {} declares no schema", *cfg.version_pin));
            }
            return i;
        }
        return analysis_error(
          analysis_errc::reconcile_error,
          root,
          fmt::format(
            "version {} not found, available versions: {}",
            *cfg.version_pin,
            describe_available(versions)));
    }

    auto pool = candidates(versions);
    if (pool.empty()) {
        return analysis_error(
          analysis_errc::reconcile_error, root, "no version declares a schema");
    }

    const schema::schema_version* storage = nullptr;
    for (const auto* v : pool) {
        if (!v->storage) {
            continue;
        }
        if (storage != nullptr) {
            return analysis_error(
              analysis_errc::reconcile_error,
              root,
              fmt::format(
                "versions {} and {} are both marked as storage version",
                storage->name,
                v->name));
        }
        storage = v;
    }
    const auto* chosen = storage != nullptr ? storage
                                            : by_priority(pool).front();
    crdgen_log(
      analysis_log.debug,
      "selected version {}{}",
      chosen->name,
      storage != nullptr ? " (storage)" : "");
    return static_cast<size_t>(chosen - versions.data());
}

analysis_outcome<reconciled_schema> reconcile(
  std::vector<schema::schema_version> versions,
  ss::sstring root_name,
  const configuration& cfg) {
    if (!cfg.combine_versions || cfg.version_pin) {
        if (cfg.combine_versions) {
            crdgen_log(
              analysis_log.warn,
              "version {} is pinned, not combining versions",
              *cfg.version_pin);
        }
        auto selected = select_version(versions, cfg);
        if (selected.has_error()) {
            return selected.error();
        }
        auto& v = versions[selected.value()];
        return reconciled_schema{
          .version = v.name,
          .sources = {v.name},
          .schema = std::move(*v.schema),
          .status_subresource = v.status_subresource};
    }

    auto pool = by_priority(candidates(versions));
    if (pool.empty()) {
        return analysis_error(
          analysis_errc::reconcile_error,
          schema::path(root_name),
          "no version declares a schema");
    }

    reconciled_schema out;
    out.status_subresource = false;
    for (const auto* v : pool) {
        out.sources.push_back(v->name);
        out.status_subresource = out.status_subresource
                                 || v->status_subresource;
    }
    out.version = fmt::format("{}", fmt::join(out.sources, "+"));

    // the candidates point into versions, which outlives the merge below
    schema::tree acc;
    {
        schema_merger first(acc);
        acc.set_root(first.import(*pool.front()->schema, pool.front()->schema->root()));
    }
    for (size_t i = 1; i < pool.size(); ++i) {
        const auto& next = *pool[i]->schema;
        schema::tree merged;
        schema_merger merger(merged);
        auto root = merger.merge(
          acc,
          acc.root(),
          next,
          next.root(),
          schema::path(to_pascal_case(root_name)),
          0);
        if (root.has_error()) {
            crdgen_log(
              analysis_log.debug,
              "cannot combine {} into {}: {}",
              pool[i]->name,
              fmt::join(out.sources.begin(), out.sources.begin() + i, "+"),
              root.error().what());
            return root.error();
        }
        merged.set_root(root.value());
        acc = std::move(merged);
    }
    out.schema = std::move(acc);
    crdgen_log(
      analysis_log.info,
      "combined versions {} into {} schema nodes",
      out.version,
      out.schema.size());
    return std::move(out);
}

} // namespace crdgen::analysis
