// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include <fmt/format.h>

#include <source_location>
#include <string_view>

namespace crdgen::logging {

// Where a log line comes from, printed as "loader.cc:42".
struct file_line {
    std::string_view file;
    unsigned line;

    static constexpr file_line
    here(std::source_location src = std::source_location::current()) {
        std::string_view file = src.file_name();
        if (auto slash = file.find_last_of("/\\");
            slash != std::string_view::npos) {
            file.remove_prefix(slash + 1);
        }
        return {file, src.line()};
    }
};

} // namespace crdgen::logging

template<>
struct fmt::formatter<crdgen::logging::file_line>
  : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const crdgen::logging::file_line& fl, FormatContext& ctx) const
      -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}:{}", fl.file, fl.line);
    }
};

// NOLINTNEXTLINE
#define crdgen_log(method, fmt, args...)                                       \
    method("{} - " fmt, crdgen::logging::file_line::here(), ##args)
