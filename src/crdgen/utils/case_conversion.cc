// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "utils/case_conversion.h"

#include <cctype>
#include <string>
#include <utility>

namespace crdgen {

namespace {
bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)); }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)); }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)); }
} // namespace

std::vector<ss::sstring> split_words(std::string_view in) {
    std::vector<ss::sstring> words;
    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            words.emplace_back(std::exchange(current, {}));
        }
    };
    for (size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }
        if (is_upper(c) && !current.empty()) {
            const char prev = current.back();
            const bool next_lower = i + 1 < in.size() && is_lower(in[i + 1]);
            if (!is_upper(prev) || next_lower) {
                flush();
            }
        }
        current += c;
    }
    flush();
    return words;
}

ss::sstring to_pascal_case(std::string_view in) {
    std::string out;
    for (const auto& word : split_words(in)) {
        for (size_t i = 0; i < word.size(); ++i) {
            const auto c = static_cast<unsigned char>(word[i]);
            out += static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
        }
    }
    return out;
}

} // namespace crdgen
