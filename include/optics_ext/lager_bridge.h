// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_bridge.h
/// @brief Interoperability between optics over Value and lager lenses.
///
/// to_lager_lens() turns any optic that can read and write a Value into a
/// lager::lenses::getset lens, so it works with lager::view / set / over and
/// pipes with other lager lenses through zug composition (operator|).
/// from_lager_lens() goes the other way and wraps a type-erased
/// lager::lens<Value, Value> as an ErasedOptic.
///
/// @code
///   auto name = to_lager_lens(field_optic("name"));
///   Value n  = lager::view(name, person);
///   Value p2 = lager::set(name, person, Value{"Bob"});
///
///   LagerValueLens erased = to_lager_lens(field_optic("users") | index_optic(0));
///   ErasedOptic back = from_lager_lens(erased);
/// @endcode

#pragma once

#include <optics_ext/api.h>
#include <optics_ext/erased_optic.h>
#include <optics_ext/optics.h>
#include <optics_ext/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <zug/compose.hpp>

#include <string>
#include <utility>

namespace optics_ext {

using LagerValueLens = lager::lens<Value, Value>;

template <typename Optic>
    requires has_get_primitive<Optic, Value>
[[nodiscard]] auto to_lager_lens(Optic optic) {
    return lager::lenses::getset(
        // Getter
        [optic](const Value& whole) -> Value {
            return Value(optics_ext::get(whole, optic));
        },
        // Setter
        [optic](Value whole, Value part) -> Value {
            return optics_ext::set(std::move(whole), optic, std::move(part));
        });
}

/// Wrap a lager lens as a set-based ErasedOptic named `shape`.
[[nodiscard]] OPTICS_EXT_API ErasedOptic from_lager_lens(LagerValueLens lens,
                                                         std::string shape = "lager_lens");

} // namespace optics_ext
