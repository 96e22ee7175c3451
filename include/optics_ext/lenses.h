// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lenses.h
/// @brief Primitive set-based optics: identity, field, member, index, dynamic index.
///
/// Each lens reads its focus with operator() and writes it with set(), both
/// routed through object_traits<Obj>. Where the object is in-place capable
/// the lens also exposes focus_ref(), used by the Mutable mode.
///
/// @code
/// auto name  = field_optic("name");             // runtime field name
/// auto x     = field_optic<"x">();              // compile-time name (Hana structs)
/// auto first = index_optic(0);
/// auto last  = dynamic_index_optic([](const Value& v) { return v.size() - 1; });
/// @endcode

#pragma once

#include <optics_ext/fixed_string.h>
#include <optics_ext/object_traits.h>
#include <optics_ext/optics.h>

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace optics_ext {

namespace detail {

/// String-like keys are stored as std::string, everything else decayed.
template <typename K>
using index_key_t = std::conditional_t<
    std::is_convertible_v<K, std::string_view> && !std::is_same_v<std::decay_t<K>, std::string>,
    std::string,
    std::decay_t<K>>;

template <typename K>
[[nodiscard]] index_key_t<K> make_index_key(K&& key) {
    return index_key_t<K>(std::forward<K>(key));
}

template <typename T>
inline constexpr bool is_tuple_v = false;

template <typename... Ts>
inline constexpr bool is_tuple_v<std::tuple<Ts...>> = true;

/// Normalize a dynamic index result into a tuple of keys.
template <typename R>
[[nodiscard]] auto as_key_tuple(R&& result) {
    if constexpr (is_tuple_v<std::remove_cvref_t<R>>) {
        return std::apply([](auto&&... keys) {
            return std::make_tuple(make_index_key(std::forward<decltype(keys)>(keys))...);
        }, std::forward<R>(result));
    } else {
        return std::make_tuple(make_index_key(std::forward<R>(result)));
    }
}

template <typename Obj, typename KeyTuple>
inline constexpr bool index_readable_with = false;

template <typename Obj, typename... Ks>
inline constexpr bool index_readable_with<Obj, std::tuple<Ks...>> = index_readable<Obj, Ks...>;

template <typename Obj, typename V, typename KeyTuple>
inline constexpr bool index_writable_with = false;

template <typename Obj, typename V, typename... Ks>
inline constexpr bool index_writable_with<Obj, V, std::tuple<Ks...>> = index_writable<Obj, V, Ks...>;

template <typename Obj, typename KeyTuple>
inline constexpr bool index_referenceable_with = false;

template <typename Obj, typename... Ks>
inline constexpr bool index_referenceable_with<Obj, std::tuple<Ks...>> = index_referenceable<Obj, Ks...>;

template <typename Obj, typename KeyTuple>
inline constexpr bool index_insertable_with = false;

template <typename Obj, typename... Ks>
inline constexpr bool index_insertable_with<Obj, std::tuple<Ks...>> = index_insertable<Obj, Ks...>;

template <typename K>
[[nodiscard]] std::string format_key(const K& key) {
    if constexpr (std::is_convertible_v<const K&, std::string_view>) {
        return "\"" + std::string{std::string_view{key}} + "\"";
    } else if constexpr (std::is_integral_v<K>) {
        return std::to_string(key);
    } else {
        return "?";
    }
}

template <typename... Ks>
[[nodiscard]] std::string format_keys(const std::tuple<Ks...>& keys) {
    std::string out;
    std::apply([&out](const auto&... k) {
        ((out += (out.empty() ? "" : ", ") + format_key(k)), ...);
    }, keys);
    return out;
}

} // namespace detail

// ============================================================
// IdentityOptic
// ============================================================

/// Focuses on the whole object. Neutral element of compose().
struct IdentityOptic : OpticBase {
    template <typename Obj>
    [[nodiscard]] const Obj& operator()(const Obj& obj) const noexcept {
        return obj;
    }

    template <typename Obj, typename V>
        requires std::constructible_from<Obj, V&&>
    [[nodiscard]] Obj set(Obj, V&& val) const {
        return Obj(std::forward<V>(val));
    }

    template <typename Obj>
    [[nodiscard]] Obj& focus_ref(Obj& obj) const noexcept {
        return obj;
    }

    [[nodiscard]] std::string shape() const { return "identity"; }
};

[[nodiscard]] constexpr IdentityOptic identity_optic() noexcept { return {}; }

// ============================================================
// FieldOptic - runtime field name
// ============================================================

class FieldOptic : public OpticBase {
public:
    explicit FieldOptic(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    template <typename Obj>
        requires field_readable<Obj>
    [[nodiscard]] auto operator()(const Obj& obj) const {
        return object_traits<Obj>::get_field(obj, name_);
    }

    template <typename Obj, typename V>
        requires field_writable<Obj, V>
    [[nodiscard]] Obj set(Obj obj, V&& val) const {
        return object_traits<Obj>::set_field(std::move(obj), name_, std::forward<V>(val));
    }

    template <typename Obj>
        requires field_referenceable<Obj>
    [[nodiscard]] decltype(auto) focus_ref(Obj& obj) const {
        return object_traits<Obj>::field_ref(obj, name_);
    }

    [[nodiscard]] std::string shape() const { return "field(\"" + name_ + "\")"; }

private:
    std::string name_;
};

[[nodiscard]] inline FieldOptic field_optic(std::string name) {
    return FieldOptic{std::move(name)};
}

// ============================================================
// MemberOptic<Name> - compile-time field name
// ============================================================

template <typename Obj, FixedString Name>
concept static_member_readable = requires(const Obj& obj) {
    object_traits<Obj>::template get_member<Name>(obj);
};

/// Field optic whose name is fixed at compile time. Uses the static member
/// access of Hana structs and falls back to runtime field lookup for
/// dynamic objects.
template <FixedString Name>
struct MemberOptic : OpticBase {
    [[nodiscard]] static constexpr std::string_view name() noexcept { return Name.view(); }

    template <typename Obj>
        requires static_member_readable<Obj, Name> || field_readable<Obj>
    [[nodiscard]] auto operator()(const Obj& obj) const {
        if constexpr (static_member_readable<Obj, Name>) {
            return object_traits<Obj>::template get_member<Name>(obj);
        } else {
            return object_traits<Obj>::get_field(obj, Name.view());
        }
    }

    template <typename Obj, typename V>
        requires static_member_readable<Obj, Name> || field_writable<Obj, V>
    [[nodiscard]] Obj set(Obj obj, V&& val) const {
        if constexpr (static_member_readable<Obj, Name>) {
            return object_traits<Obj>::template set_member<Name>(std::move(obj), std::forward<V>(val));
        } else {
            return object_traits<Obj>::set_field(std::move(obj), Name.view(), std::forward<V>(val));
        }
    }

    template <typename Obj>
        requires static_member_readable<Obj, Name> || field_referenceable<Obj>
    [[nodiscard]] decltype(auto) focus_ref(Obj& obj) const {
        if constexpr (static_member_readable<Obj, Name>) {
            return object_traits<Obj>::template member_ref<Name>(obj);
        } else {
            return object_traits<Obj>::field_ref(obj, Name.view());
        }
    }

    [[nodiscard]] std::string shape() const { return "field<\"" + Name.to_string() + "\">"; }
};

template <FixedString Name>
[[nodiscard]] constexpr MemberOptic<Name> field_optic() noexcept {
    return {};
}

// ============================================================
// IndexOptic - fixed key tuple
// ============================================================

/// Focuses on object_traits<Obj>::get_index(obj, keys...). Several keys
/// are passed to the traits together; Value resolves them as a nested
/// path, other objects need a specialization that accepts them.

template <typename... Keys>
class IndexOptic : public OpticBase {
public:
    explicit IndexOptic(Keys... keys) : keys_(std::move(keys)...) {}

    [[nodiscard]] const std::tuple<Keys...>& indices() const noexcept { return keys_; }

    template <typename Obj>
        requires index_readable<Obj, Keys...>
    [[nodiscard]] auto operator()(const Obj& obj) const {
        return std::apply([&obj](const auto&... keys) {
            return object_traits<Obj>::get_index(obj, keys...);
        }, keys_);
    }

    template <typename Obj, typename V>
        requires index_writable<Obj, V, Keys...>
    [[nodiscard]] Obj set(Obj obj, V&& val) const {
        return std::apply([&](const auto&... keys) -> Obj {
            return object_traits<Obj>::set_index(std::move(obj), std::forward<V>(val), keys...);
        }, keys_);
    }

    template <typename Obj>
        requires index_referenceable<Obj, Keys...>
    [[nodiscard]] decltype(auto) focus_ref(Obj& obj) const {
        return std::apply([&obj](const auto&... keys) -> decltype(auto) {
            return object_traits<Obj>::index_ref(obj, keys...);
        }, keys_);
    }

    template <typename Obj>
        requires index_insertable<Obj, Keys...>
    [[nodiscard]] decltype(auto) insert_ref(Obj& obj) const {
        return std::apply([&obj](const auto&... keys) -> decltype(auto) {
            return object_traits<Obj>::index_insert_ref(obj, keys...);
        }, keys_);
    }

    [[nodiscard]] std::string shape() const { return "index(" + detail::format_keys(keys_) + ")"; }

private:
    std::tuple<Keys...> keys_;
};

template <typename... Keys>
[[nodiscard]] IndexOptic<detail::index_key_t<Keys>...> index_optic(Keys&&... keys) {
    return IndexOptic<detail::index_key_t<Keys>...>{detail::make_index_key(std::forward<Keys>(keys))...};
}

// ============================================================
// DynamicIndexOptic - keys computed from the object
// ============================================================

/// Like IndexOptic, but the keys are fn(obj), re-evaluated on every
/// application. fn may return a single key or a std::tuple of keys.
template <typename F>
class DynamicIndexOptic : public OpticBase {
public:
    template <typename Obj>
    using key_tuple_t = decltype(detail::as_key_tuple(std::invoke(std::declval<const F&>(), std::declval<const Obj&>())));

    explicit DynamicIndexOptic(F fn) : fn_(std::move(fn)) {}

    template <typename Obj>
        requires detail::index_readable_with<Obj, key_tuple_t<Obj>>
    [[nodiscard]] auto operator()(const Obj& obj) const {
        return std::apply([&obj](const auto&... keys) {
            return object_traits<Obj>::get_index(obj, keys...);
        }, keys_for(obj));
    }

    template <typename Obj, typename V>
        requires detail::index_writable_with<Obj, V, key_tuple_t<Obj>>
    [[nodiscard]] Obj set(Obj obj, V&& val) const {
        auto keys = keys_for(std::as_const(obj));
        return std::apply([&](const auto&... k) -> Obj {
            return object_traits<Obj>::set_index(std::move(obj), std::forward<V>(val), k...);
        }, keys);
    }

    template <typename Obj>
        requires detail::index_referenceable_with<Obj, key_tuple_t<Obj>>
    [[nodiscard]] decltype(auto) focus_ref(Obj& obj) const {
        auto keys = keys_for(std::as_const(obj));
        return std::apply([&obj](const auto&... k) -> decltype(auto) {
            return object_traits<Obj>::index_ref(obj, k...);
        }, keys);
    }

    template <typename Obj>
        requires detail::index_insertable_with<Obj, key_tuple_t<Obj>>
    [[nodiscard]] decltype(auto) insert_ref(Obj& obj) const {
        auto keys = keys_for(std::as_const(obj));
        return std::apply([&obj](const auto&... k) -> decltype(auto) {
            return object_traits<Obj>::index_insert_ref(obj, k...);
        }, keys);
    }

    template <typename Obj>
    [[nodiscard]] key_tuple_t<Obj> keys_for(const Obj& obj) const {
        return detail::as_key_tuple(std::invoke(fn_, obj));
    }

    [[nodiscard]] std::string shape() const { return "dynamic_index(<fn>)"; }

private:
    F fn_;
};

template <typename F>
[[nodiscard]] DynamicIndexOptic<std::decay_t<F>> dynamic_index_optic(F&& fn) {
    return DynamicIndexOptic<std::decay_t<F>>{std::forward<F>(fn)};
}

} // namespace optics_ext
