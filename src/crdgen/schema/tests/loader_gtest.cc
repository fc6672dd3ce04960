// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "schema/loader.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

using namespace crdgen::schema;

namespace {

tree parse(const char* doc) { return parse_schema(YAML::Load(doc)); }

const node& property_node(const tree& t, const node& obj, std::string_view name) {
    const auto& o = std::get<object_node>(obj.kind);
    const auto* p = o.find(name);
    if (p == nullptr) {
        throw std::out_of_range(std::string(name));
    }
    return t.get(p->node);
}

} // namespace

TEST(SchemaLoader, ObjectWithRequiredProperties) {
    auto t = parse(R"(
type: object
required: [name, missing]
properties:
  name:
    type: string
    description: the name
  replicas:
    type: integer
    format: int32
)");
    const auto& root = t.get(t.root());
    const auto& obj = std::get<object_node>(root.kind);
    ASSERT_EQ(obj.properties.size(), 2);
    EXPECT_EQ(obj.properties[0].name, "name");
    EXPECT_EQ(obj.properties[1].name, "replicas");
    EXPECT_EQ(obj.required, absl::btree_set<ss::sstring>{"name"});

    const auto& name = property_node(t, root, "name");
    EXPECT_EQ(name.description, "the name");
    const auto& replicas = std::get<scalar_node>(
      property_node(t, root, "replicas").kind);
    EXPECT_EQ(replicas.kind, scalar_kind::integer);
    EXPECT_EQ(replicas.format, "int32");
}

TEST(SchemaLoader, AdditionalPropertiesForms) {
    auto t = parse(R"(
type: object
properties:
  labels:
    type: object
    additionalProperties:
      type: string
  anything:
    type: object
    additionalProperties: true
  opaque:
    type: object
    x-kubernetes-preserve-unknown-fields: true
  empty:
    type: object
)");
    const auto& root = t.get(t.root());

    const auto& labels = std::get<map_node>(property_node(t, root, "labels").kind);
    EXPECT_TRUE(std::holds_alternative<scalar_node>(t.get(labels.value).kind));

    const auto& anything = std::get<map_node>(
      property_node(t, root, "anything").kind);
    EXPECT_TRUE(t.get(anything.value).preserve_unknown_fields);

    const auto& opaque = property_node(t, root, "opaque");
    EXPECT_TRUE(std::holds_alternative<unknown_node>(opaque.kind));
    EXPECT_TRUE(opaque.preserve_unknown_fields);

    const auto& empty = property_node(t, root, "empty");
    EXPECT_TRUE(std::get<object_node>(empty.kind).properties.empty());
}

TEST(SchemaLoader, AbsentKeysAreNotErrors) {
    auto map = parse("{type: object, additionalProperties: {type: string}}");
    EXPECT_TRUE(std::holds_alternative<map_node>(map.get(map.root()).kind));

    auto bare = parse("{type: object}");
    EXPECT_TRUE(
      std::get<object_node>(bare.get(bare.root()).kind).properties.empty());

    auto cr = parse_custom_resource(YAML::Load(R"(
kind: CustomResourceDefinition
spec:
  group: example.com
  names: {kind: Widget}
  versions:
    - name: v1
      schema:
        openAPIV3Schema: {type: object}
)"));
    ASSERT_EQ(cr.versions.size(), 1);
    EXPECT_TRUE(cr.versions[0].served);
    EXPECT_FALSE(cr.versions[0].status_subresource);
    EXPECT_TRUE(cr.versions[0].schema.has_value());
}

TEST(SchemaLoader, IntOrStringFlag) {
    auto t = parse(R"(
type: object
properties:
  port:
    x-kubernetes-int-or-string: true
    anyOf:
      - type: integer
      - type: string
)");
    const auto& port = property_node(t, t.get(t.root()), "port");
    EXPECT_TRUE(port.int_or_string);
}

TEST(SchemaLoader, ValidationOnlyBranchesAreDropped) {
    auto t = parse(R"(
type: object
properties:
  selector:
    type: object
    properties:
      a: {type: string}
      b: {type: string}
    oneOf:
      - required: [a]
      - required: [b]
  value:
    anyOf:
      - required: [x]
      - type: string
      - type: boolean
)");
    const auto& root = t.get(t.root());
    EXPECT_TRUE(std::holds_alternative<object_node>(
      property_node(t, root, "selector").kind));
    const auto& value = std::get<union_node>(property_node(t, root, "value").kind);
    EXPECT_EQ(value.kind, union_kind::any_of);
    EXPECT_EQ(value.variants.size(), 2);
}

TEST(SchemaLoader, EnumLiterals) {
    auto t = parse(R"(
type: object
properties:
  policy:
    type: string
    enum: [Always, "Never", null]
  level:
    enum: [1, 2, 3]
  answer:
    const: "42"
)");
    const auto& root = t.get(t.root());
    const auto& policy = property_node(t, root, "policy");
    EXPECT_TRUE(policy.nullable);
    const auto& literals = std::get<enumeration_node>(policy.kind).literals;
    ASSERT_EQ(literals.size(), 2);
    EXPECT_EQ(literals[0].text, "Always");
    EXPECT_EQ(literals[1].text, "Never");

    EXPECT_EQ(
      std::get<enumeration_node>(property_node(t, root, "level").kind).kind,
      scalar_kind::integer);
    EXPECT_EQ(
      std::get<enumeration_node>(property_node(t, root, "answer").kind).kind,
      scalar_kind::string);
}

TEST(SchemaLoader, LiteralUnionOnScalar) {
    auto t = parse(R"(
type: string
oneOf:
  - const: A
  - const: B
  - const: C
)");
    const auto& u = std::get<union_node>(t.get(t.root()).kind);
    EXPECT_EQ(u.variants.size(), 3);
}

TEST(SchemaLoader, RecursiveReferenceIsShared) {
    auto t = parse(R"(
$ref: "#/definitions/Node"
definitions:
  Node:
    type: object
    properties:
      value: {type: string}
      children:
        type: array
        items:
          $ref: "#/definitions/Node"
)");
    const auto& root = t.get(t.root());
    const auto& children = std::get<array_node>(
      property_node(t, root, "children").kind);
    ASSERT_TRUE(children.items.has_value());
    EXPECT_EQ(*children.items, t.root());
}

TEST(SchemaLoader, ReferenceAliases) {
    auto t = parse(R"(
type: object
properties:
  a: {$ref: "#/$defs/Alias"}
  b: {$ref: "#/$defs/Target"}
$defs:
  Alias: {$ref: "#/$defs/Target"}
  Target: {type: integer}
)");
    const auto& root = std::get<object_node>(t.get(t.root()).kind);
    EXPECT_EQ(root.find("a")->node, root.find("b")->node);
}

TEST(SchemaLoader, AllOfBecomesIntersection) {
    auto t = parse(R"(
type: object
properties:
  own: {type: string}
allOf:
  - type: object
    properties:
      other: {type: integer}
)");
    const auto& x = std::get<intersection_node>(t.get(t.root()).kind);
    ASSERT_EQ(x.branches.size(), 2);
    const auto& own = std::get<object_node>(t.get(x.branches[0]).kind);
    EXPECT_NE(own.find("own"), nullptr);
}

TEST(SchemaLoader, MalformedDocuments) {
    EXPECT_THROW(parse("[1, 2]"), parse_error);
    EXPECT_THROW(parse("false"), parse_error);
    EXPECT_THROW(parse("{type: tuple}"), parse_error);
    EXPECT_THROW(parse("{type: array, items: [{type: string}]}"), parse_error);
    EXPECT_THROW(parse("{$ref: '#/definitions/Missing'}"), parse_error);
    EXPECT_THROW(parse("{$ref: 'http://example.com/schema'}"), parse_error);
    EXPECT_THROW(
      parse("{$ref: '#/definitions/A', definitions: {A: {$ref: "
            "'#/definitions/A'}}}"),
      parse_error);
    EXPECT_THROW(parse("{type: object, enum: [a]}"), parse_error);
    EXPECT_THROW(parse("{enum: [1, a]}"), parse_error);
}

TEST(SchemaLoader, DepthLimit) {
    std::string doc = "{type: string}";
    for (size_t i = 0; i <= max_document_depth + 1; ++i) {
        doc = "{type: array, items: " + doc + "}";
    }
    EXPECT_THROW(parse(doc.c_str()), parse_error);
}

TEST(SchemaLoader, CustomResourceDefinition) {
    auto cr = parse_custom_resource(YAML::Load(R"(
apiVersion: apiextensions.k8s.io/v1
kind: CustomResourceDefinition
metadata:
  name: widgets.example.com
spec:
  group: example.com
  scope: Cluster
  names:
    kind: Widget
    plural: widgets
  versions:
    - name: v1beta1
      served: true
      storage: false
      schema:
        openAPIV3Schema:
          type: object
    - name: v1
      served: true
      storage: true
      subresources:
        status: {}
      schema:
        openAPIV3Schema:
          type: object
          properties:
            spec: {type: object}
    - name: v2alpha1
      served: false
)"));
    EXPECT_EQ(cr.group, "example.com");
    EXPECT_EQ(cr.kind, "Widget");
    EXPECT_EQ(cr.plural, "widgets");
    EXPECT_EQ(cr.scope, resource_scope::cluster);
    ASSERT_EQ(cr.versions.size(), 3);
    EXPECT_EQ(
      cr.version_names(),
      (std::vector<ss::sstring>{"v1beta1", "v1", "v2alpha1"}));
    EXPECT_FALSE(cr.versions[0].storage);
    EXPECT_TRUE(cr.versions[1].storage);
    EXPECT_TRUE(cr.versions[1].status_subresource);
    EXPECT_FALSE(cr.versions[0].status_subresource);
    EXPECT_TRUE(cr.versions[1].schema.has_value());
    EXPECT_FALSE(cr.versions[2].served);
    EXPECT_FALSE(cr.versions[2].schema.has_value());
}

TEST(SchemaLoader, LegacyCustomResourceDefinition) {
    auto cr = parse_custom_resource(YAML::Load(R"(
apiVersion: apiextensions.k8s.io/v1beta1
kind: CustomResourceDefinition
spec:
  group: example.com
  version: v1alpha1
  names: {kind: Gadget}
  subresources:
    status: {}
  validation:
    openAPIV3Schema:
      type: object
)"));
    ASSERT_EQ(cr.versions.size(), 1);
    EXPECT_EQ(cr.versions[0].name, "v1alpha1");
    EXPECT_TRUE(cr.versions[0].storage);
    EXPECT_TRUE(cr.versions[0].status_subresource);
    EXPECT_TRUE(cr.versions[0].schema.has_value());
    EXPECT_EQ(cr.scope, resource_scope::namespaced);
}

TEST(SchemaLoader, MalformedCustomResourceDefinition) {
    EXPECT_THROW(
      parse_custom_resource(YAML::Load("{kind: Deployment, spec: {}}")),
      parse_error);
    EXPECT_THROW(
      parse_custom_resource(YAML::Load(
        "{spec: {group: g, names: {kind: K}, scope: Galaxy, version: v1}}")),
      parse_error);
    EXPECT_THROW(
      parse_custom_resource(
        YAML::Load("{spec: {group: g, names: {kind: K}, versions: []}}")),
      parse_error);
}
