// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics.h
/// @brief Generic get / set / modify over any optic.
///
/// The three operations consult the optic's static style (optic_style.h)
/// and route to the single primitive the optic implements, synthesizing
/// the other:
///
///   get(obj, o)        = o(obj)
///   set(obj, o, v)     = SetBased    -> o.set(obj, v)
///                        ModifyBased -> modify(Constant{v}, obj, o)
///   modify(f, obj, o)  = ModifyBased -> o.modify(f, obj)
///                        SetBased    -> set(obj, o, f(get(obj, o)))
///
/// A static optic missing the primitive its style requires fails to
/// compile with a static_assert.
///
/// Mutability modes:
///   set(obj, o, v, immutable_mode) returns an updated copy (the default).
///   set(obj, o, v, mutable_mode) writes into obj through references where
///   the optic and object allow it, rebinding the affected sub-object
///   elsewhere, and returns obj.

#pragma once

#include <optics_ext/object_traits.h>
#include <optics_ext/optic_style.h>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace optics_ext {

// ============================================================
// Base class and primitive detection
// ============================================================

/// Tag base of the library optics; enables operator| composition.
struct OpticBase {};

template <typename Optic>
concept library_optic = std::derived_from<std::remove_cvref_t<Optic>, OpticBase>;

template <typename Optic, typename Obj>
concept has_get_primitive = requires(const Optic& optic, const Obj& obj) {
    optic(obj);
};

template <typename Optic, typename Obj, typename V>
concept has_set_primitive = requires(const Optic& optic, Obj obj, V&& val) {
    { optic.set(std::move(obj), std::forward<V>(val)) } -> std::convertible_to<Obj>;
};

template <typename Optic, typename Obj, typename F>
concept has_modify_primitive = requires(const Optic& optic, Obj obj, F&& f) {
    { optic.modify(std::forward<F>(f), std::move(obj)) } -> std::convertible_to<Obj>;
};

namespace detail {

struct PassThrough {
    template <typename T>
    T operator()(T x) const { return x; }
};

} // namespace detail

/// modify(f, obj, optic) is well formed for obj, by either style.
template <typename Optic, typename Obj>
concept modifiable_with =
    (modify_based_optic<Optic> && has_modify_primitive<Optic, Obj, const detail::PassThrough&>) ||
    (!modify_based_optic<Optic> && has_get_primitive<Optic, Obj> &&
     has_set_primitive<Optic, Obj, std::remove_cvref_t<std::invoke_result_t<const Optic&, const Obj&>>>);

/// Optics whose focus can be reached as an lvalue inside obj.
template <typename Optic, typename Obj>
concept has_focus_ref = requires(const Optic& optic, Obj& obj) {
    optic.focus_ref(obj);
};

/// Optics whose focus can be created in obj when absent (map insertion).
template <typename Optic, typename Obj>
concept has_insert_ref = requires(const Optic& optic, Obj& obj) {
    optic.insert_ref(obj);
};

/// A pair of optics applied in sequence (see composed.h).
template <typename Optic>
concept composed_optic = requires(const Optic& optic) {
    typename Optic::outer_type;
    typename Optic::inner_type;
    optic.outer();
    optic.inner();
};

// ============================================================
// Constant / mutability modes
// ============================================================

/// Function ignoring its argument; set on a ModifyBased optic is
/// modify(Constant{val}, ...).
template <typename T>
struct Constant {
    T value;

    template <typename... Args>
    const T& operator()(Args&&...) const noexcept {
        return value;
    }
};

template <typename T>
Constant(T) -> Constant<T>;

template <typename T>
inline constexpr bool is_constant_v = false;

template <typename T>
inline constexpr bool is_constant_v<Constant<T>> = true;

struct Mutable {};
struct Immutable {};

inline constexpr Mutable mutable_mode{};
inline constexpr Immutable immutable_mode{};

// ============================================================
// get / set / modify
// ============================================================

template <typename Obj, typename Optic>
[[nodiscard]] auto get(const Obj& obj, const Optic& optic)
    -> std::remove_cvref_t<std::invoke_result_t<const Optic&, const Obj&>>
{
    return optic(obj);
}

template <typename F, typename Obj, typename Optic>
[[nodiscard]] Obj modify(F&& f, Obj obj, const Optic& optic);

template <typename Obj, typename Optic, typename V>
[[nodiscard]] Obj set(Obj obj, const Optic& optic, V&& val)
{
    if constexpr (modify_based_optic<Optic>) {
        return optics_ext::modify(Constant<std::decay_t<V>>{std::forward<V>(val)}, std::move(obj), optic);
    } else {
        static_assert(has_set_primitive<Optic, Obj, V>,
                      "set: the optic is SetBased but has no set(obj, value) primitive for this object");
        return optic.set(std::move(obj), std::forward<V>(val));
    }
}

template <typename F, typename Obj, typename Optic>
Obj modify(F&& f, Obj obj, const Optic& optic)
{
    if constexpr (modify_based_optic<Optic>) {
        static_assert(has_modify_primitive<Optic, Obj, F>,
                      "modify: the optic is ModifyBased but has no modify(f, obj) primitive for this object");
        return optic.modify(std::forward<F>(f), std::move(obj));
    } else {
        auto current = optic(std::as_const(obj));
        return optics_ext::set(std::move(obj), optic, std::invoke(std::forward<F>(f), std::move(current)));
    }
}

template <typename Obj, typename Optic, typename V>
[[nodiscard]] Obj set(Obj obj, const Optic& optic, V&& val, Immutable)
{
    return optics_ext::set(std::move(obj), optic, std::forward<V>(val));
}

namespace detail {

/// Replace obj with an updated copy; obj is untouched if the update throws.
template <typename Obj, typename Optic, typename V>
void rebind(Obj& obj, const Optic& optic, V&& val)
{
    auto updated = optics_ext::set(Obj(std::as_const(obj)), optic, std::forward<V>(val));
    obj = std::move(updated);
}

/// Write val at the focus of optic inside obj, in place where possible.
/// Intermediate stages must already exist; only the last one may insert.
template <typename Obj, typename Optic, typename V>
void assign_in_place(Obj& obj, const Optic& optic, V&& val)
{
    if (!detail::writable_in_place(std::as_const(obj))) {
        detail::rebind(obj, optic, std::forward<V>(val));
        return;
    }
    if constexpr (composed_optic<Optic>) {
        if constexpr (has_focus_ref<typename Optic::inner_type, Obj>) {
            auto& inner_focus = optic.inner().focus_ref(obj);
            detail::assign_in_place(inner_focus, optic.outer(), std::forward<V>(val));
        } else {
            detail::rebind(obj, optic, std::forward<V>(val));
        }
    } else if constexpr (has_insert_ref<Optic, Obj>) {
        optic.insert_ref(obj) = std::forward<V>(val);
    } else if constexpr (has_focus_ref<Optic, Obj>) {
        optic.focus_ref(obj) = std::forward<V>(val);
    } else {
        detail::rebind(obj, optic, std::forward<V>(val));
    }
}

} // namespace detail

template <typename Obj, typename Optic, typename V>
Obj& set(Obj& obj, const Optic& optic, V&& val, Mutable)
{
    detail::assign_in_place(obj, optic, std::forward<V>(val));
    return obj;
}

} // namespace optics_ext
