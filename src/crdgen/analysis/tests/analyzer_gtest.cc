// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/analyzer.h"
#include "schema/loader.h"

#include <seastar/core/abort_source.hh>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace crdgen;
using analysis::analysis_errc;
using analysis::configuration;

namespace {

constexpr auto widget_crd = R"(
apiVersion: apiextensions.k8s.io/v1
kind: CustomResourceDefinition
spec:
  group: example.com
  names: {kind: Widget, plural: widgets}
  scope: Namespaced
  versions:
    - name: v1
      served: true
      storage: true
      subresources: {status: {}}
      schema:
        openAPIV3Schema:
          type: object
          properties:
            apiVersion: {type: string}
            kind: {type: string}
            metadata: {type: object}
            spec:
              type: object
              required: [size]
              properties:
                size: {type: integer, format: int32, description: widget size}
                color: {type: string, enum: [red, blue]}
            status:
              type: object
              properties:
                conditions:
                  type: array
                  items:
                    type: object
                    required: [status, type]
                    properties:
                      lastTransitionTime: {type: string, format: date-time}
                      message: {type: string}
                      reason: {type: string}
                      status: {type: string}
                      type: {type: string}
    - name: v1beta1
      served: true
      storage: false
      schema:
        openAPIV3Schema:
          type: object
          properties:
            spec:
              type: object
              properties:
                size: {type: string}
)";

schema::custom_resource widget() {
    return schema::parse_custom_resource(YAML::Load(widget_crd));
}

} // namespace

TEST(Analyzer, CustomResource) {
    configuration cfg;
    cfg.auto_mode = true;
    cfg.extra_capabilities.push_back(
      analysis::capability_directive::parse("equality"));
    auto res = analysis::analyze(widget(), cfg);
    ASSERT_TRUE(res.has_value()) << res.error().what();
    const auto& g = res.value();
    EXPECT_TRUE(g.frozen());
    EXPECT_FALSE(typegraph::check_invariants(g).has_value());
    EXPECT_EQ(
      fmt::format("{}", g),
      "root: Widget\n"
      "maps: ordered\n"
      "schemas: derived\n"
      "version: v1 with status subresource\n"
      "type Widget (composite, root) at Widget\n"
      "  derives [equality, schema]\n"
      "  spec: WidgetSpec\n"
      "  status: WidgetStatus\n"
      "type WidgetSpec (composite, spec) at Widget.spec\n"
      "  derives [equality, schema]\n"
      "  size: int32 required\n"
      "  color: WidgetSpecColor\n"
      "type WidgetSpecColor (unit_enum, nested) at Widget.spec.color\n"
      "  derives [equality, schema]\n"
      "  \"red\" (string)\n"
      "  \"blue\" (string)\n"
      "type WidgetStatus (composite, status) at Widget.status\n"
      "  derives [equality, schema]\n"
      "  conditions: sequence<condition>\n");
    EXPECT_EQ(
      std::get<typegraph::composite>(g.find("WidgetSpec")->body).fields[0].doc,
      "widget size");
    EXPECT_TRUE(g.status_subresource());
}

TEST(Analyzer, CombinedVersionsFail) {
    configuration cfg;
    cfg.combine_versions = true;
    auto res = analysis::analyze(widget(), cfg);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::irreconcilable_union);
    EXPECT_EQ(fmt::format("{}", res.error().where()), "Widget.spec.size");
}

TEST(Analyzer, PinnedVersion) {
    configuration cfg;
    cfg.version_pin = "v1beta1";
    auto res = analysis::analyze(widget(), cfg);
    ASSERT_TRUE(res.has_value()) << res.error().what();
    const auto& g = res.value();
    EXPECT_EQ(g.describe(g.root()), "Widget");
    EXPECT_EQ(g.size(), 2);
    EXPECT_EQ(g.find("WidgetStatus"), nullptr);
    EXPECT_EQ(g.version(), "v1beta1");
    EXPECT_FALSE(g.status_subresource());
}

TEST(Analyzer, Cancelled) {
    ss::abort_source as;
    as.request_abort();
    auto res = analysis::analyze(widget(), {}, &as);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code(), analysis_errc::cancelled);
}
