// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "typegraph/type_graph.h"

#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace crdgen::typegraph;
using crdgen::schema::path;
using crdgen::schema::property_segment;

namespace {

generated_type make_type(ss::sstring name, type_body body) {
    generated_type t;
    t.name = name;
    t.origin = path("Root");
    t.body = std::move(body);
    return t;
}

field make_field(ss::sstring name, type_ref type, bool required = false) {
    return field{
      .name = std::move(name),
      .type = std::move(type),
      .required = field_required(required)};
}

composite with_fields(std::vector<field> fields) {
    return composite{std::move(fields)};
}

} // namespace

TEST(TypeRef, CopyAndCompare) {
    auto t = map_of(sequence_of(optional_of(generated_ref{type_id(3)})));
    auto copy = make_copy(t);
    EXPECT_EQ(t, copy);
    EXPECT_EQ(fmt::format("{}", copy), "map<string, sequence<optional<#3>>>");
    EXPECT_NE(t, map_of(sequence_of(generated_ref{type_id(3)})));
    EXPECT_EQ(
      fmt::format("{}", type_ref{generated_ref{type_id(1), indirect::yes}}),
      "indirect#1");
}

TEST(TypeGraph, DumpIsDeterministic) {
    type_graph g;
    std::vector<field> root_fields;
    root_fields.push_back(make_field(
      "groups", sequence_of(generated_ref{type_id(1)}), true));
    root_fields.back().absent = absent_policy::treat_as_empty;
    root_fields.push_back(
      make_field("port", external_ref{known_shape::int_or_string}));
    auto root = g.add(make_type("Root", with_fields(std::move(root_fields))));

    std::vector<field> group_fields;
    group_fields.push_back(
      make_field("name", primitive_ref{primitive::string}, true));
    group_fields.push_back(
      make_field("interval", primitive_ref{primitive::int64}));
    auto group = make_type("RootGroups", with_fields(std::move(group_fields)));
    group.origin = path("Root") / property_segment{"groups"};
    group.doc = "a group";
    group.capabilities = {capability::equality, capability::default_construction};
    g.add(std::move(group));

    g.add(make_type(
      "RootMode",
      unit_enum{{{"Fast", crdgen::schema::scalar_kind::string},
                 {"Slow", crdgen::schema::scalar_kind::string}}}));

    g.set_root(generated_ref{root});
    g.add_diagnostic({path("Root"), "something odd"});

    EXPECT_FALSE(check_invariants(g).has_value());
    EXPECT_EQ(
      fmt::format("{}", g),
      "root: Root\n"
      "maps: ordered\n"
      "schemas: disabled\n"
      "type Root (composite, nested) at Root\n"
      "  groups: sequence<RootGroups> required default_empty\n"
      "  port: int_or_string\n"
      "type RootGroups (composite, nested) at Root.groups\n"
      "  derives [equality, default]\n"
      "  doc: a group\n"
      "  name: string required\n"
      "  interval: int64\n"
      "type RootMode (unit_enum, nested) at Root\n"
      "  \"Fast\" (string)\n"
      "  \"Slow\" (string)\n"
      "diagnostic at Root: something odd\n");
    EXPECT_EQ(g.find("RootGroups")->id, type_id(1));
    EXPECT_EQ(g.find("Missing"), nullptr);
}

TEST(TypeGraph, ResourceDetails) {
    type_graph g;
    g.set_root(unknown_ref{});
    EXPECT_FALSE(g.version().has_value());
    EXPECT_EQ(
      fmt::format("{}", g), "root: unknown\nmaps: ordered\nschemas: disabled\n");

    g.set_resource("v1beta2", false);
    EXPECT_EQ(g.version(), "v1beta2");
    EXPECT_FALSE(g.status_subresource());
    EXPECT_EQ(
      fmt::format("{}", g),
      "root: unknown\nmaps: ordered\nschemas: disabled\nversion: v1beta2\n");
}

TEST(TypeGraph, FrozenGraphRejectsMutation) {
    type_graph g;
    auto id = g.add(make_type("Root", composite{}));
    g.freeze();
    EXPECT_TRUE(g.frozen());
    EXPECT_THROW(g.add(make_type("Other", composite{})), std::logic_error);
    EXPECT_THROW(g.get_mutable(id), std::logic_error);
    EXPECT_THROW(g.set_root(unknown_ref{}), std::logic_error);
    EXPECT_THROW(g.set_resource("v1", true), std::logic_error);
    EXPECT_NO_THROW(g.get(id));
    EXPECT_THROW(g.get(type_id(7)), std::out_of_range);
}

TEST(TypeGraphInvariants, MissingReference) {
    type_graph g;
    std::vector<field> fields;
    fields.push_back(make_field("x", optional_of(generated_ref{type_id(5)})));
    g.add(make_type("Root", with_fields(std::move(fields))));
    auto violation = check_invariants(g);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, "Root refers to missing type 5");
}

TEST(TypeGraphInvariants, DuplicateNames) {
    type_graph g;
    g.add(make_type("Root", composite{}));
    g.add(make_type("Root", composite{}));
    EXPECT_TRUE(check_invariants(g).has_value());
}

TEST(TypeGraphInvariants, DuplicateFields) {
    type_graph g;
    std::vector<field> fields;
    fields.push_back(make_field("x", unknown_ref{}));
    fields.push_back(make_field("x", unknown_ref{}));
    g.add(make_type("Root", with_fields(std::move(fields))));
    EXPECT_TRUE(check_invariants(g).has_value());
}

TEST(TypeGraphInvariants, SelfReferenceNeedsIndirection) {
    type_graph direct;
    std::vector<field> fields;
    fields.push_back(make_field("next", generated_ref{type_id(0)}));
    direct.add(make_type("Node", with_fields(std::move(fields))));
    auto violation = check_invariants(direct);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(*violation, "type Node contains itself without indirection");

    type_graph boxed;
    std::vector<field> boxed_fields;
    boxed_fields.push_back(
      make_field("next", optional_of(generated_ref{type_id(0), indirect::yes})));
    boxed.add(make_type("Node", with_fields(std::move(boxed_fields))));
    EXPECT_FALSE(check_invariants(boxed).has_value());
}
