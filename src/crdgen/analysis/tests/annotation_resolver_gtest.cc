// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "analysis/annotation_resolver.h"
#include "analysis/capability_directive.h"
#include "analysis/type_graph_builder.h"
#include "schema/loader.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace crdgen;
using namespace crdgen::typegraph;
using analysis::capability_directive;
using analysis::configuration;

namespace {

type_graph resolved(const char* doc, const configuration& cfg) {
    auto tree = schema::parse_schema(YAML::Load(doc));
    auto res = analysis::build_type_graph(tree, "Root", cfg);
    if (res.has_error()) {
        throw std::runtime_error(res.error().what());
    }
    auto g = std::move(res.value());
    analysis::resolve_annotations(g, cfg);
    return g;
}

configuration requesting(std::initializer_list<const char*> directives) {
    configuration cfg;
    for (const auto* d : directives) {
        cfg.extra_capabilities.push_back(capability_directive::parse(d));
    }
    return cfg;
}

const capability_set& caps(const type_graph& g, std::string_view name) {
    const auto* t = g.find(name);
    if (t == nullptr) {
        throw std::out_of_range(std::string(name));
    }
    return t->capabilities;
}

constexpr auto mixed_schema = R"(
type: object
required: [mode]
properties:
  mode: {type: string, enum: [A, B]}
  nested:
    type: object
    properties:
      raw: {type: object, x-kubernetes-preserve-unknown-fields: true}
  plain:
    type: object
    properties:
      x: {type: string}
)";

generated_type
make_type(ss::sstring name, std::vector<field> fields) {
    generated_type t;
    t.name = std::move(name);
    t.origin = schema::path(t.name);
    t.body = composite{std::move(fields)};
    return t;
}

field ref_field(ss::sstring name, type_ref type) {
    return field{.name = std::move(name), .type = std::move(type)};
}

} // namespace

TEST(AnnotationResolver, LocalAndTransitiveElision) {
    auto g = resolved(
      mixed_schema, requesting({"equality", "default", "ordering"}));

    EXPECT_EQ(caps(g, "RootMode"), (capability_set{
      capability::equality, capability::ordering}));
    EXPECT_EQ(caps(g, "RootNested"), (capability_set{
      capability::equality, capability::default_construction}));
    EXPECT_EQ(caps(g, "RootPlain"), (capability_set{
      capability::equality,
      capability::ordering,
      capability::default_construction}));
    // required enum field rules out a default, unknown value in a nested
    // type rules out ordering
    EXPECT_EQ(caps(g, "Root"), capability_set{capability::equality});
}

TEST(AnnotationResolver, OptionalFieldsKeepDefault) {
    auto g = resolved(
      R"(
type: object
properties:
  mode: {type: string, enum: [A, B]}
  modes: {type: array, items: {type: string, enum: [C, D]}}
)",
      requesting({"default"}));
    EXPECT_EQ(caps(g, "Root"), capability_set{capability::default_construction});
    EXPECT_TRUE(caps(g, "RootMode").empty());
}

TEST(AnnotationResolver, BuildersAndSchemas) {
    auto cfg = requesting({"@enum=builder"});
    cfg.enable_builders = true;
    cfg.schema = schema_mode::derived;
    auto g = resolved(mixed_schema, cfg);
    EXPECT_EQ(caps(g, "Root"), (capability_set{
      capability::schema_reflection, capability::builder}));
    EXPECT_EQ(caps(g, "RootMode"), capability_set{capability::schema_reflection});

    configuration manual;
    manual.schema = schema_mode::manual;
    auto m = resolved(mixed_schema, manual);
    EXPECT_TRUE(caps(m, "Root").empty());

    configuration automatic;
    automatic.auto_mode = true;
    auto a = resolved(mixed_schema, automatic);
    EXPECT_EQ(a.schemas(), schema_mode::derived);
    EXPECT_TRUE(caps(a, "RootPlain").contains(capability::schema_reflection));
}

TEST(AnnotationResolver, DirectiveTargets) {
    auto g = resolved(
      mixed_schema,
      requesting({"RootPlain=ordering", "@struct=equality", "@enum:simple=default"}));
    EXPECT_EQ(caps(g, "RootPlain"), (capability_set{
      capability::equality, capability::ordering}));
    EXPECT_EQ(caps(g, "RootNested"), capability_set{capability::equality});
    // unit enums never get a default, and without equality on RootMode the
    // root cannot keep it either
    EXPECT_TRUE(caps(g, "RootMode").empty());
    EXPECT_TRUE(caps(g, "Root").empty());
}

TEST(AnnotationResolver, UnorderedMapsCannotBeOrdered) {
    constexpr auto doc = R"(
type: object
properties:
  labels: {type: object, additionalProperties: {type: string}}
)";
    auto ordered = resolved(doc, requesting({"ordering"}));
    EXPECT_EQ(caps(ordered, "Root"), capability_set{capability::ordering});

    auto cfg = requesting({"ordering"});
    cfg.maps = map_representation::unordered;
    auto unordered = resolved(doc, cfg);
    EXPECT_EQ(unordered.maps(), map_representation::unordered);
    EXPECT_TRUE(caps(unordered, "Root").empty());
}

TEST(AnnotationResolver, Elide) {
    auto cfg = requesting({});
    cfg.elide = {"RootPlain", "NoSuchType"};
    auto g = resolved(mixed_schema, cfg);
    EXPECT_TRUE(g.find("RootPlain")->elided);
    EXPECT_FALSE(g.find("Root")->elided);
}

TEST(AnnotationResolver, IndependentOfTypeOrder) {
    // A -> B -> C, C holds an unknown value
    auto make_graph = [](bool reversed) {
        type_graph g;
        auto id = [reversed](uint32_t i) {
            return type_id(reversed ? 2 - i : i);
        };
        std::vector<generated_type> types;
        std::vector<field> a;
        a.push_back(ref_field("b", generated_ref{id(1)}));
        types.push_back(make_type("A", std::move(a)));
        std::vector<field> b;
        b.push_back(ref_field("c", sequence_of(generated_ref{id(2)})));
        types.push_back(make_type("B", std::move(b)));
        std::vector<field> c;
        c.push_back(ref_field("raw", unknown_ref{}));
        c.push_back(ref_field("a", optional_of(generated_ref{id(0), indirect::yes})));
        types.push_back(make_type("C", std::move(c)));
        if (reversed) {
            std::reverse(types.begin(), types.end());
        }
        for (auto& t : types) {
            g.add(std::move(t));
        }
        return g;
    };
    auto cfg = requesting({"equality", "ordering", "default"});
    auto forward = make_graph(false);
    auto backward = make_graph(true);
    analysis::resolve_annotations(forward, cfg);
    analysis::resolve_annotations(backward, cfg);
    for (std::string_view name : {"A", "B", "C"}) {
        EXPECT_EQ(caps(forward, name), caps(backward, name)) << name;
        EXPECT_FALSE(caps(forward, name).contains(capability::ordering));
        EXPECT_TRUE(caps(forward, name).contains(capability::equality));
    }
}

TEST(AnnotationResolver, FrozenGraph) {
    type_graph g;
    g.add(make_type("A", {}));
    g.freeze();
    EXPECT_THROW(analysis::resolve_annotations(g, {}), std::logic_error);
}
