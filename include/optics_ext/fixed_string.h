// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file fixed_string.h
/// @brief Member name carried as a non-type template parameter.
///
/// @code
/// auto name = field_optic<"name">();
/// @endcode

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace optics_ext {

/// Literal of N - 1 characters plus the terminator.
template <std::size_t N>
struct FixedString {
    char data[N]{};

    constexpr FixedString(const char (&literal)[N]) {
        for (std::size_t i = 0; i < N; ++i) {
            data[i] = literal[i];
        }
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept { return N - 1; }
    [[nodiscard]] constexpr std::string_view view() const noexcept { return {data, N - 1}; }
    [[nodiscard]] std::string to_string() const { return std::string{view()}; }
};

template <std::size_t N>
FixedString(const char (&)[N]) -> FixedString<N>;

} // namespace optics_ext
