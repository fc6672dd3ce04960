// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/type_graph_builder.h"
#include "analysis/version_reconciler.h"
#include "schema/loader.h"

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace crdgen;
using analysis::analysis_errc;
using analysis::configuration;

namespace {

struct version_opts {
    bool storage{false};
    bool served{true};
};

schema::schema_version
version(ss::sstring name, const char* doc, version_opts opts = {}) {
    schema::schema_version v;
    v.name = std::move(name);
    v.storage = opts.storage;
    v.served = opts.served;
    if (doc != nullptr) {
        v.schema = schema::parse_schema(YAML::Load(doc));
    }
    return v;
}

template<typename... Versions>
std::vector<schema::schema_version> versions(Versions... vs) {
    std::vector<schema::schema_version> out;
    (out.push_back(std::move(vs)), ...);
    return out;
}

constexpr auto object = "{type: object}";

configuration combined() {
    configuration cfg;
    cfg.combine_versions = true;
    return cfg;
}

typegraph::type_graph build(const analysis::reconciled_schema& r) {
    auto res = analysis::build_type_graph(r.schema, "Widget", {});
    if (res.has_error()) {
        throw std::runtime_error(res.error().what());
    }
    return std::move(res.value());
}

} // namespace

TEST(VersionSelection, StorageVersionWins) {
    auto vs = versions(
      version("v1", object),
      version("v1beta1", object, {.storage = true}),
      version("v2alpha1", object));
    auto res = analysis::select_version(vs, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(vs[res.value()].name, "v1beta1");
}

TEST(VersionSelection, HighestPriorityWithoutStorage) {
    auto vs = versions(
      version("v1beta2", object),
      version("v2", object),
      version("v1", object),
      version("v3alpha1", object));
    auto res = analysis::select_version(vs, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(vs[res.value()].name, "v2");
}

TEST(VersionSelection, ServedVersionsFirst) {
    auto vs = versions(
      version("v2", object, {.served = false}), version("v1", object));
    auto res = analysis::select_version(vs, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(vs[res.value()].name, "v1");

    auto none_served = versions(
      version("v2", object, {.served = false}),
      version("v1", object, {.served = false}));
    res = analysis::select_version(none_served, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(none_served[res.value()].name, "v2");
}

TEST(VersionSelection, VersionsWithoutSchemaAreIgnored) {
    auto vs = versions(
      version("v2", nullptr, {.storage = true}), version("v1", object));
    auto res = analysis::select_version(vs, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(vs[res.value()].name, "v1");

    auto empty = versions(version("v1", nullptr));
    res = analysis::select_version(empty, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::reconcile_error);
}

TEST(VersionSelection, TwoStorageVersions) {
    auto vs = versions(
      version("v1", object, {.storage = true}),
      version("v2", object, {.storage = true}));
    auto res = analysis::select_version(vs, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::reconcile_error);
}

TEST(VersionSelection, Pin) {
    auto vs = versions(
      version("v1", object, {.storage = true}),
      version("v2", object),
      version("v3", nullptr));
    configuration cfg;
    cfg.version_pin = "v2";
    auto res = analysis::select_version(vs, cfg);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 1);

    cfg.version_pin = "v4";
    res = analysis::select_version(vs, cfg);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::reconcile_error);
    EXPECT_EQ(
      res.error().detail(), "version v4 not found, available versions: v2, v1");

    cfg.version_pin = "v3";
    res = analysis::select_version(vs, cfg);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().detail(), "version v3 declares no schema");
}

TEST(VersionReconciler, SingleVersion) {
    auto res = analysis::reconcile(
      versions(
        version("v1", "{type: object, properties: {a: {type: string}}}"),
        version("v1beta1", object)),
      "Widget",
      {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().version, "v1");
    EXPECT_EQ(res.value().sources, std::vector<ss::sstring>{"v1"});
    auto g = build(res.value());
    EXPECT_EQ(g.describe(g.root()), "Widget");
}

TEST(VersionReconciler, ConflictingScalarsAreIrreconcilable) {
    auto res = analysis::reconcile(
      versions(
        version("v1", "{type: object, properties: {x: {type: string}}}"),
        version("v1beta1", "{type: object, properties: {x: {type: integer}}}")),
      "Widget",
      combined());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::irreconcilable_union);
    EXPECT_EQ(fmt::format("{}", res.error().where()), "Widget.x");
}

TEST(VersionReconciler, SignednessMismatch) {
    auto res = analysis::reconcile(
      versions(
        version(
          "v2", "{type: object, properties: {x: {type: integer, format: int32}}}"),
        version(
          "v1",
          "{type: object, properties: {x: {type: integer, format: uint32}}}")),
      "Widget",
      combined());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::irreconcilable_union);
}

TEST(VersionReconciler, KindMismatch) {
    auto res = analysis::reconcile(
      versions(
        version("v2", "{type: object, properties: {x: {type: string}}}"),
        version(
          "v1",
          "{type: object, properties: {x: {type: array, items: {type: "
          "string}}}}")),
      "Widget",
      combined());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::reconcile_error);
}

TEST(VersionReconciler, CombinePromotesAndRelaxes) {
    auto res = analysis::reconcile(
      versions(
        version("v1beta1", R"(
type: object
required: [name]
properties:
  name: {type: string}
  size: {type: integer}
  legacy: {type: boolean}
  ratio: {type: number}
  mode: {type: string, enum: [B, C]}
)"),
        version("v1", R"(
type: object
required: [name, size]
properties:
  name: {type: string, description: the name}
  size: {type: integer, format: int32}
  ratio: {type: number, format: float}
  mode: {type: string, enum: [A, B]}
)")),
      "Widget",
      combined());
    ASSERT_TRUE(res.has_value()) << res.error().what();
    EXPECT_EQ(res.value().version, "v1+v1beta1");
    EXPECT_EQ(
      res.value().sources, (std::vector<ss::sstring>{"v1", "v1beta1"}));

    configuration docs;
    docs.enable_docs = true;
    auto built = analysis::build_type_graph(res.value().schema, "Widget", docs);
    ASSERT_TRUE(built.has_value());
    const auto& g = built.value();
    EXPECT_EQ(
      fmt::format("{}", g),
      "root: Widget\n"
      "maps: ordered\n"
      "schemas: disabled\n"
      "type Widget (composite, root) at Widget\n"
      "  name: string required\n"
      "  size: int64\n"
      "  ratio: float64\n"
      "  mode: WidgetMode\n"
      "  legacy: boolean\n"
      "type WidgetMode (unit_enum, nested) at Widget.mode\n"
      "  \"A\" (string)\n"
      "  \"B\" (string)\n"
      "  \"C\" (string)\n");
    ASSERT_NE(g.find("Widget"), nullptr);
    EXPECT_EQ(
      std::get<typegraph::composite>(g.find("Widget")->body).fields[0].doc,
      "the name");
}

TEST(VersionReconciler, CombineRecursiveSchemas) {
    constexpr auto recursive = R"(
$ref: "#/definitions/Node"
definitions:
  Node:
    type: object
    properties:
      value: {type: integer, format: int32}
      next: {$ref: "#/definitions/Node"}
)";
    auto res = analysis::reconcile(
      versions(version("v1", recursive), version("v2", recursive)),
      "Widget",
      combined());
    ASSERT_TRUE(res.has_value()) << res.error().what();
    auto g = build(res.value());
    EXPECT_EQ(g.size(), 1);
    EXPECT_FALSE(typegraph::check_invariants(g).has_value());
}

TEST(VersionReconciler, PinOverridesCombine) {
    auto cfg = combined();
    cfg.version_pin = "v1beta1";
    auto res = analysis::reconcile(
      versions(
        version("v1", "{type: object, properties: {x: {type: string}}}"),
        version("v1beta1", "{type: object, properties: {x: {type: integer}}}")),
      "Widget",
      cfg);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().version, "v1beta1");
}
