// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <string_view>
#include <vector>

namespace crdgen {

/// Splits an identifier into words. Boundaries are any non alphanumeric
/// character, a lower to upper case transition, and the last capital of an
/// acronym that is followed by a lower case letter ("HTTPServer" yields
/// "HTTP" and "Server").
std::vector<ss::sstring> split_words(std::string_view);

/// "lastTransitionTime" -> "LastTransitionTime", "x-foo_bar" -> "XFooBar",
/// "URL" -> "Url".
ss::sstring to_pascal_case(std::string_view);

} // namespace crdgen
