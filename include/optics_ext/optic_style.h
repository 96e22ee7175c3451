// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optic_style.h
/// @brief Compile-time style trait that selects an optic's primitive.
///
/// Every optic has exactly one style:
///   - SetBased:    the optic implements set(obj, val); modify is derived as
///                  set(obj, f(get(obj)))
///   - ModifyBased: the optic implements modify(f, obj); set is derived as
///                  modify(Constant{val}, obj)
///
/// An optic declares its style with a nested alias, or a specialization of
/// optic_style<O> supplies it for a type that cannot be changed:
/// @code
/// struct Everything {
///     using style = ModifyBased;
///     template <typename F, typename Obj> Obj modify(F&& f, Obj obj) const;
/// };
///
/// template <> struct optics_ext::optic_style<ThirdPartyLens> { using type = SetBased; };
/// @endcode
///
/// Optics that declare nothing are SetBased.

#pragma once

#include <concepts>
#include <type_traits>

namespace optics_ext {

struct SetBased {};
struct ModifyBased {};

template <typename Optic>
struct optic_style {
    using type = SetBased;
};

template <typename Optic>
    requires requires { typename Optic::style; }
struct optic_style<Optic> {
    using type = typename Optic::style;
};

template <typename Optic>
using optic_style_t = typename optic_style<std::remove_cvref_t<Optic>>::type;

/// Style of compose(outer, inner): ModifyBased if either part is.
template <typename OuterStyle, typename InnerStyle>
struct composed_optic_style {
    using type = ModifyBased;
};

template <>
struct composed_optic_style<SetBased, SetBased> {
    using type = SetBased;
};

template <typename OuterStyle, typename InnerStyle>
using composed_optic_style_t = typename composed_optic_style<OuterStyle, InnerStyle>::type;

template <typename Optic>
concept set_based_optic = std::same_as<optic_style_t<Optic>, SetBased>;

template <typename Optic>
concept modify_based_optic = std::same_as<optic_style_t<Optic>, ModifyBased>;

} // namespace optics_ext
