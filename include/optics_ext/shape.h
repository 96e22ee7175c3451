// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file shape.h
/// @brief Human-readable description of an optic, used in error messages.

#pragma once

#include <optics_ext/optics.h>

#include <string>
#include <typeinfo>

namespace optics_ext {

template <typename Optic>
concept has_shape = requires(const Optic& optic) {
    { optic.shape() } -> std::convertible_to<std::string>;
};

/// shape() where the optic provides one, compose(outer, inner) for
/// composites, the type name otherwise.
template <typename Optic>
[[nodiscard]] std::string shape_of(const Optic& optic) {
    if constexpr (has_shape<Optic>) {
        return optic.shape();
    } else if constexpr (composed_optic<Optic>) {
        return "compose(" + shape_of(optic.outer()) + ", " + shape_of(optic.inner()) + ")";
    } else {
        return typeid(Optic).name();
    }
}

} // namespace optics_ext
