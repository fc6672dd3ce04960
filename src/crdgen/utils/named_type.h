// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <compare>
#include <cstddef>
#include <functional>
#include <limits>
#include <ostream>
#include <type_traits>
#include <utility>

namespace crdgen {

/// Strongly typed wrapper around an arithmetic value. Two named types with
/// different tags never convert into each other.
template<typename T, typename Tag>
requires std::is_arithmetic_v<T>
class named_type {
public:
    using type = T;

    constexpr named_type() = default;
    constexpr explicit named_type(type v)
      : _value(v) {}

    friend constexpr bool operator==(const named_type&, const named_type&)
      = default;
    friend constexpr auto operator<=>(const named_type&, const named_type&)
      = default;

    friend constexpr bool
    operator==(const named_type& lhs, const type& rhs) noexcept {
        return lhs._value == rhs;
    }
    friend constexpr auto
    operator<=>(const named_type& lhs, const type& rhs) noexcept {
        return lhs._value <=> rhs;
    }

    constexpr named_type& operator++() {
        ++_value;
        return *this;
    }
    constexpr named_type operator++(int) {
        auto copy = *this;
        ++_value;
        return copy;
    }

    // explicit getter
    constexpr type operator()() const { return _value; }

    static constexpr named_type max() {
        return named_type(std::numeric_limits<type>::max());
    }

    template<typename H>
    friend H AbslHashValue(H h, const named_type& t) {
        return H::combine(std::move(h), t._value);
    }

    friend std::ostream& operator<<(std::ostream& o, const named_type& t) {
        fmt::print(o, "{}", t._value);
        return o;
    }

private:
    type _value{};
};

} // namespace crdgen

template<typename T, typename Tag>
struct std::hash<crdgen::named_type<T, Tag>> {
    size_t operator()(const crdgen::named_type<T, Tag>& x) const {
        return std::hash<T>()(x());
    }
};

template<typename T, typename Tag>
struct fmt::formatter<crdgen::named_type<T, Tag>> : fmt::formatter<T> {
    template<typename FormatContext>
    auto format(const crdgen::named_type<T, Tag>& t, FormatContext& ctx) const {
        return fmt::formatter<T>::format(t(), ctx);
    }
};
