// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "schema/node.h"
#include "schema/path.h"
#include "typegraph/datatypes.h"

#include <optional>

namespace crdgen::analysis {

// Entries of a `conditions` array as defined by metav1.Condition. Objects
// with properties metav1.Condition does not have are not conditions.
bool is_condition(const schema::tree&, const schema::node&);
// Whether a path leads to the items of an array property named conditions.
bool is_conditions_entry(const schema::path&);
// corev1.ObjectReference, recognized by its exact set of string properties
bool is_object_reference(const schema::tree&, const schema::node&);
// x-kubernetes-int-or-string, format int-or-string, or anyOf/oneOf of one
// integer and one string
bool is_int_or_string(const schema::tree&, const schema::node&);

/// The canonical shape the node found at a path matches, if any. Conditions
/// are checked before object references.
std::optional<typegraph::known_shape> detect_known_shape(
  const schema::tree&, const schema::node&, const schema::path&);

} // namespace crdgen::analysis
