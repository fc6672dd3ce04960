// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "schema/custom_resource.h"
#include "schema/node.h"

#include <yaml-cpp/yaml.h>

#include <exception>
#include <string>

namespace crdgen::schema {

class parse_error final : public std::exception {
public:
    explicit parse_error(std::string msg) noexcept
      : _msg(std::move(msg)) {}

    const char* what() const noexcept final { return _msg.c_str(); }

private:
    std::string _msg;
};

// Nesting limit of a schema document. Deeper documents are rejected before
// any analysis runs.
inline constexpr size_t max_document_depth = 128;

/**
 * Converts a structural schema (the value of openAPIV3Schema) into a schema
 * tree. "$ref" pointers of the form "#/definitions/<name>" or
 * "#/$defs/<name>" are resolved against the same document; a definition
 * referenced from several places, or from inside itself, becomes a single
 * shared node.
 *
 * Throws parse_error when the document is not a valid structural schema.
 */
tree parse_schema(const YAML::Node& schema);

/**
 * Reads a CustomResourceDefinition document (apiextensions.k8s.io/v1, or
 * the legacy v1beta1 layout with a single top level validation schema).
 *
 * Throws parse_error on malformed documents.
 */
custom_resource parse_custom_resource(const YAML::Node& document);

} // namespace crdgen::schema
