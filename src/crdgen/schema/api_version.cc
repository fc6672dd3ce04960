// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "schema/api_version.h"

#include <charconv>
#include <ostream>
#include <regex>
#include <string>

namespace crdgen::schema {

namespace {
std::optional<uint64_t> parse_number(std::string_view s) {
    uint64_t v{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}
} // namespace

api_version api_version::parse(std::string_view text) {
    static const std::regex re{R"(^v(\d+)(?:(alpha|beta)(\d*))?$)"};

    api_version v;
    v._label = ss::sstring(text);

    std::smatch m;
    std::string s(text);
    if (!std::regex_match(s, m, re)) {
        return v;
    }
    auto major = parse_number(m[1].str());
    if (!major) {
        // too large to be a version number; keep it as an opaque label
        return v;
    }
    v._major = *major;
    if (!m[2].matched) {
        v._level = stability::ga;
        return v;
    }
    v._level = m[2].str() == "alpha" ? stability::alpha : stability::beta;
    if (m[3].length() > 0) {
        v._minor = parse_number(m[3].str());
    }
    return v;
}

std::strong_ordering operator<=>(const api_version& a, const api_version& b) {
    if (auto c = a._level <=> b._level; c != 0) {
        return c;
    }
    if (a._level == api_version::stability::other) {
        // the lexically first label has the highest priority
        return std::string_view(b._label) <=> std::string_view(a._label);
    }
    if (auto c = a._major <=> b._major; c != 0) {
        return c;
    }
    // std::optional orders nullopt below any value
    return a._minor <=> b._minor;
}

std::ostream& operator<<(std::ostream& o, const api_version& v) {
    return o << v._label;
}

} // namespace crdgen::schema
