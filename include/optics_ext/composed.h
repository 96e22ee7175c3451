// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file composed.h
/// @brief Optic composition: ComposedOptic, compose(), opcompose(), operator|.
///
/// compose(outer, inner) focuses with inner first, then with outer:
///   get(obj, compose(outer, inner)) == get(get(obj, inner), outer)
///
/// opcompose() and operator| take the optics in application order, the way
/// zug/lager pipe lenses:
///   field_optic("a") | index_optic(0)  ==  compose(index_optic(0), field_optic("a"))
///
/// The composite is ModifyBased as soon as one side is; identity optics are
/// dropped at composition time.

#pragma once

#include <optics_ext/lenses.h>
#include <optics_ext/optic_style.h>
#include <optics_ext/optics.h>

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace optics_ext {

template <typename Outer, typename Inner>
class ComposedOptic : public OpticBase {
public:
    using outer_type = Outer;
    using inner_type = Inner;
    using style = composed_optic_style_t<optic_style_t<Outer>, optic_style_t<Inner>>;

    ComposedOptic(Outer outer, Inner inner)
        : outer_(std::move(outer))
        , inner_(std::move(inner))
    {}

    [[nodiscard]] const Outer& outer() const noexcept { return outer_; }
    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }

    template <typename Obj>
        requires has_get_primitive<Inner, Obj> &&
                 has_get_primitive<Outer, std::remove_cvref_t<std::invoke_result_t<const Inner&, const Obj&>>>
    [[nodiscard]] auto operator()(const Obj& obj) const {
        return outer_(inner_(obj));
    }

    /// SetBased composite: read the intermediate object, update it with
    /// outer, write it back with inner.
    template <typename Obj, typename V>
    [[nodiscard]] Obj set(Obj obj, V&& val) const {
        auto inner_obj = inner_(std::as_const(obj));
        auto inner_val = optics_ext::set(std::move(inner_obj), outer_, std::forward<V>(val));
        return optics_ext::set(std::move(obj), inner_, std::move(inner_val));
    }

    /// ModifyBased composite: modify every inner focus by modifying its
    /// outer focus.
    template <typename F, typename Obj>
    [[nodiscard]] Obj modify(F&& f, Obj obj) const {
        return optics_ext::modify(
            [this, &f](auto part) -> decltype(part) {
                return optics_ext::modify(f, std::move(part), outer_);
            },
            std::move(obj), inner_);
    }

private:
    Outer outer_;
    Inner inner_;
};

// ============================================================
// compose
// ============================================================

template <typename Optic>
inline constexpr bool is_identity_optic_v = std::is_same_v<std::remove_cvref_t<Optic>, IdentityOptic>;

[[nodiscard]] constexpr IdentityOptic compose() noexcept { return {}; }

template <typename Optic>
[[nodiscard]] Optic compose(Optic optic) {
    return optic;
}

template <typename Outer, typename Inner>
[[nodiscard]] auto compose(Outer outer, Inner inner) {
    if constexpr (is_identity_optic_v<Outer>) {
        return inner;
    } else if constexpr (is_identity_optic_v<Inner>) {
        return outer;
    } else {
        return ComposedOptic<Outer, Inner>{std::move(outer), std::move(inner)};
    }
}

/// compose(o1, o2, o3, ...) == compose(compose(o1, o2), o3, ...)
template <typename O1, typename O2, typename O3, typename... Rest>
[[nodiscard]] auto compose(O1 o1, O2 o2, O3 o3, Rest... rest) {
    return compose(compose(std::move(o1), std::move(o2)), std::move(o3), std::move(rest)...);
}

// ============================================================
// opcompose / operator|
// ============================================================

[[nodiscard]] constexpr IdentityOptic opcompose() noexcept { return {}; }

template <typename Optic>
[[nodiscard]] Optic opcompose(Optic optic) {
    return optic;
}

/// Application order: o1 is applied first.
template <typename First, typename... Rest>
    requires(sizeof...(Rest) > 0)
[[nodiscard]] auto opcompose(First first, Rest... rest) {
    return compose(opcompose(std::move(rest)...), std::move(first));
}

template <typename Lhs, typename Rhs>
    requires library_optic<Lhs> || library_optic<Rhs>
[[nodiscard]] auto operator|(Lhs lhs, Rhs rhs) {
    return opcompose(std::move(lhs), std::move(rhs));
}

} // namespace optics_ext
