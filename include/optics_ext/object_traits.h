// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object_traits.h
/// @brief Structural introspection protocol used by the library optics.
///
/// object_traits<T> is the customization point through which field, index,
/// element and property optics read and rebuild objects of type T. A
/// specialization exposes any subset of the following static members:
///
///   Field access (runtime name)
///     get_field(const T&, std::string_view)            -> part
///     set_field(T, std::string_view, part)             -> T
///     field_ref(T&, std::string_view)                  -> part&   (in place)
///
///   Index access
///     get_index(const T&, const Key&...)               -> part
///     set_index(T, part, const Key&...)                -> T
///     index_ref(T&, const Key&...)                     -> part&   (in place, existing part)
///     index_insert_ref(T&, const Key&...)              -> part&   (in place, inserted if absent)
///
///   Traversal
///     map_elements(F&&, T)                             -> T
///     map_properties(F&&, T)                           -> T
///
///   In-place guard
///     writable_in_place(const T&)                      -> bool
///
/// Objects whose traits provide the *_ref members are "in-place capable":
/// the Mutable mode writes through those references. writable_in_place()
/// lets a specialization refuse this for particular objects, which are then
/// rebuilt through set_field / set_index instead.
///
/// Only object_traits<Value> accepts several keys at once: index_optic("a", 0)
/// looks up "a" and then position 0 inside it. Other objects take one key;
/// user specializations may accept more.
///
/// Specializations shipped here: Value, MutableValue, std::vector,
/// std::array, std::map. Boost.Hana structs live in hana_struct.h.

#pragma once

#include <optics_ext/api.h>
#include <optics_ext/errors.h>
#include <optics_ext/log.h>
#include <optics_ext/mutable_value.h>
#include <optics_ext/record.h>
#include <optics_ext/value.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace optics_ext {

/// Primary template: no structural access.
template <typename T, typename Enable = void>
struct object_traits {};

// ============================================================
// Capability concepts
// ============================================================

template <typename Obj>
concept field_readable = requires(const Obj& obj, std::string_view name) {
    object_traits<Obj>::get_field(obj, name);
};

template <typename Obj, typename V>
concept field_writable = requires(Obj obj, std::string_view name, V&& val) {
    { object_traits<Obj>::set_field(std::move(obj), name, std::forward<V>(val)) } -> std::convertible_to<Obj>;
};

template <typename Obj>
concept field_referenceable = requires(Obj& obj, std::string_view name) {
    object_traits<Obj>::field_ref(obj, name);
};

template <typename Obj, typename... Keys>
concept index_readable = requires(const Obj& obj, const Keys&... keys) {
    object_traits<Obj>::get_index(obj, keys...);
};

template <typename Obj, typename V, typename... Keys>
concept index_writable = requires(Obj obj, V&& val, const Keys&... keys) {
    { object_traits<Obj>::set_index(std::move(obj), std::forward<V>(val), keys...) } -> std::convertible_to<Obj>;
};

template <typename Obj, typename... Keys>
concept index_referenceable = requires(Obj& obj, const Keys&... keys) {
    object_traits<Obj>::index_ref(obj, keys...);
};

template <typename Obj, typename... Keys>
concept index_insertable = requires(Obj& obj, const Keys&... keys) {
    object_traits<Obj>::index_insert_ref(obj, keys...);
};

template <typename Obj, typename F>
concept element_mappable = requires(Obj obj, F&& f) {
    { object_traits<Obj>::map_elements(std::forward<F>(f), std::move(obj)) } -> std::convertible_to<Obj>;
};

template <typename Obj, typename F>
concept property_mappable = requires(Obj obj, F&& f) {
    { object_traits<Obj>::map_properties(std::forward<F>(f), std::move(obj)) } -> std::convertible_to<Obj>;
};

namespace detail {

template <std::integral I>
[[nodiscard]] std::size_t checked_position(I index, std::string_view func)
{
    if constexpr (std::is_signed_v<I>) {
        if (index < 0) {
            log_access_error(func, "negative index");
            throw std::out_of_range(std::string{func} + ": negative index " + std::to_string(index));
        }
    }
    return static_cast<std::size_t>(index);
}

[[noreturn]] OPTICS_EXT_API void throw_not_a_collection(std::string_view func, std::string_view type_name);

template <typename K>
concept value_key = std::same_as<K, std::string> || std::integral<K>;

} // namespace detail

// ============================================================
// Value
// ============================================================

template <>
struct OPTICS_EXT_API object_traits<Value> {
    /// @throws definition_error(missing_field) if obj has no such field
    [[nodiscard]] static Value get_field(const Value& obj, std::string_view name);
    [[nodiscard]] static Value set_field(Value obj, std::string_view name, Value val);

    /// Map lookup. @throws std::out_of_range for a missing key
    [[nodiscard]] static Value get_index(const Value& obj, const std::string& key);
    /// Map insert-or-replace.
    [[nodiscard]] static Value set_index(Value obj, Value val, const std::string& key);

    template <std::integral I>
    [[nodiscard]] static Value get_index(const Value& obj, I index) {
        return get_position(obj, detail::checked_position(index, "object_traits<Value>::get_index"));
    }

    template <std::integral I>
    [[nodiscard]] static Value set_index(Value obj, Value val, I index) {
        return set_position(std::move(obj), std::move(val),
                            detail::checked_position(index, "object_traits<Value>::set_index"));
    }

    /// Nested lookup: obj[k0][k1]...
    template <detail::value_key K0, detail::value_key K1, detail::value_key... Rest>
    [[nodiscard]] static Value get_index(const Value& obj, const K0& k0, const K1& k1, const Rest&... rest) {
        return get_index(get_index(obj, k0), k1, rest...);
    }

    /// Nested update; every level on the way must already exist except the
    /// last map key.
    template <detail::value_key K0, detail::value_key K1, detail::value_key... Rest>
    [[nodiscard]] static Value set_index(Value obj, Value val, const K0& k0, const K1& k1, const Rest&... rest) {
        auto child = set_index(get_index(obj, k0), std::move(val), k1, rest...);
        return set_index(std::move(obj), std::move(child), k0);
    }

    /// Vector elements, map values, or record fields in order.
    template <typename F>
    [[nodiscard]] static Value map_elements(F&& f, Value obj) {
        if (auto* v = obj.get_if<ValueVector>()) {
            auto t = ValueVector{}.transient();
            for (const auto& box : *v) {
                t.push_back(ValueBox{Value(std::invoke(f, box.get()))});
            }
            return Value{t.persistent()};
        }
        if (obj.is_map() || obj.is_record()) {
            return optics_ext::map_properties(std::forward<F>(f), obj);
        }
        detail::throw_not_a_collection("object_traits<Value>::map_elements", value_type_name(obj));
    }

    template <typename F>
    [[nodiscard]] static Value map_properties(F&& f, Value obj) {
        return optics_ext::map_properties(std::forward<F>(f), obj);
    }

private:
    [[nodiscard]] static Value get_position(const Value& obj, std::size_t index);
    [[nodiscard]] static Value set_position(Value obj, Value val, std::size_t index);
};

// ============================================================
// MutableValue
// ============================================================

template <>
struct OPTICS_EXT_API object_traits<MutableValue> {
    [[nodiscard]] static MutableValue get_field(const MutableValue& obj, std::string_view name);
    [[nodiscard]] static MutableValue set_field(MutableValue obj, std::string_view name, MutableValue val);
    [[nodiscard]] static MutableValue& field_ref(MutableValue& obj, std::string_view name);

    [[nodiscard]] static MutableValue get_index(const MutableValue& obj, const std::string& key);
    [[nodiscard]] static MutableValue set_index(MutableValue obj, MutableValue val, const std::string& key);
    /// Existing map entry. @throws std::out_of_range for a missing key
    [[nodiscard]] static MutableValue& index_ref(MutableValue& obj, const std::string& key);
    /// Map entry, inserted as null when absent.
    [[nodiscard]] static MutableValue& index_insert_ref(MutableValue& obj, const std::string& key);

    /// False for records whose kind has an invariant: their fields change
    /// only through RecordKind validation.
    [[nodiscard]] static bool writable_in_place(const MutableValue& obj);

    template <std::integral I>
    [[nodiscard]] static MutableValue get_index(const MutableValue& obj, I index) {
        return position(obj, detail::checked_position(index, "object_traits<MutableValue>::get_index"));
    }

    template <std::integral I>
    [[nodiscard]] static MutableValue set_index(MutableValue obj, MutableValue val, I index) {
        position_ref(obj, detail::checked_position(index, "object_traits<MutableValue>::set_index")) = std::move(val);
        return obj;
    }

    template <std::integral I>
    [[nodiscard]] static MutableValue& index_ref(MutableValue& obj, I index) {
        return position_ref(obj, detail::checked_position(index, "object_traits<MutableValue>::index_ref"));
    }

    template <typename F>
    [[nodiscard]] static MutableValue map_elements(F&& f, MutableValue obj) {
        if (auto* v = obj.as_vector_ptr()) {
            for (auto& element : *v) {
                element = MutableValue(std::invoke(f, std::move(element)));
            }
            return obj;
        }
        if (obj.is_map() || obj.is_record()) {
            return optics_ext::map_properties(std::forward<F>(f), std::move(obj));
        }
        detail::throw_not_a_collection("object_traits<MutableValue>::map_elements", "scalar");
    }

    template <typename F>
    [[nodiscard]] static MutableValue map_properties(F&& f, MutableValue obj) {
        return optics_ext::map_properties(std::forward<F>(f), std::move(obj));
    }

private:
    /// Vector element. @throws std::out_of_range / std::invalid_argument
    [[nodiscard]] static const MutableValue& position(const MutableValue& obj, std::size_t index);
    [[nodiscard]] static MutableValue& position_ref(MutableValue& obj, std::size_t index);
    [[nodiscard]] static const MutableValue& field(const MutableValue& obj, std::string_view name);
};

// ============================================================
// Standard containers
// ============================================================

template <typename T, typename A>
struct object_traits<std::vector<T, A>> {
    using object_type = std::vector<T, A>;

    template <std::integral I>
    [[nodiscard]] static decltype(auto) get_index(const object_type& obj, I index) {
        return obj.at(detail::checked_position(index, "object_traits<std::vector>::get_index"));
    }

    template <typename V, std::integral I>
    [[nodiscard]] static object_type set_index(object_type obj, V&& val, I index) {
        obj.at(detail::checked_position(index, "object_traits<std::vector>::set_index")) = std::forward<V>(val);
        return obj;
    }

    template <std::integral I>
    [[nodiscard]] static decltype(auto) index_ref(object_type& obj, I index) {
        return obj.at(detail::checked_position(index, "object_traits<std::vector>::index_ref"));
    }

    template <typename F>
    [[nodiscard]] static object_type map_elements(F&& f, object_type obj) {
        for (auto&& element : obj) {
            element = static_cast<T>(std::invoke(f, std::move(element)));
        }
        return obj;
    }
};

template <typename T, std::size_t N>
struct object_traits<std::array<T, N>> {
    using object_type = std::array<T, N>;

    template <std::integral I>
    [[nodiscard]] static const T& get_index(const object_type& obj, I index) {
        return obj.at(detail::checked_position(index, "object_traits<std::array>::get_index"));
    }

    template <typename V, std::integral I>
    [[nodiscard]] static object_type set_index(object_type obj, V&& val, I index) {
        obj.at(detail::checked_position(index, "object_traits<std::array>::set_index")) = std::forward<V>(val);
        return obj;
    }

    template <std::integral I>
    [[nodiscard]] static T& index_ref(object_type& obj, I index) {
        return obj.at(detail::checked_position(index, "object_traits<std::array>::index_ref"));
    }

    template <typename F>
    [[nodiscard]] static object_type map_elements(F&& f, object_type obj) {
        for (auto& element : obj) {
            element = static_cast<T>(std::invoke(f, std::move(element)));
        }
        return obj;
    }
};

template <typename K, typename V, typename C, typename A>
struct object_traits<std::map<K, V, C, A>> {
    using object_type = std::map<K, V, C, A>;

    /// @throws std::out_of_range for a missing key
    template <typename Key>
        requires std::convertible_to<const Key&, K>
    [[nodiscard]] static const V& get_index(const object_type& obj, const Key& key) {
        return obj.at(key);
    }

    template <typename P, typename Key>
        requires std::convertible_to<const Key&, K>
    [[nodiscard]] static object_type set_index(object_type obj, P&& val, const Key& key) {
        obj.insert_or_assign(K(key), std::forward<P>(val));
        return obj;
    }

    /// @throws std::out_of_range for a missing key
    template <typename Key>
        requires std::convertible_to<const Key&, K>
    [[nodiscard]] static V& index_ref(object_type& obj, const Key& key) {
        return obj.at(K(key));
    }

    template <typename Key>
        requires std::convertible_to<const Key&, K> && std::default_initializable<V>
    [[nodiscard]] static V& index_insert_ref(object_type& obj, const Key& key) {
        return obj[K(key)];
    }

    template <typename F>
    [[nodiscard]] static object_type map_elements(F&& f, object_type obj) {
        for (auto& [key, val] : obj) {
            val = static_cast<V>(std::invoke(f, std::move(val)));
        }
        return obj;
    }
};

namespace detail {

/// object_traits<Obj>::writable_in_place(obj) where provided, true otherwise.
template <typename Obj>
[[nodiscard]] bool writable_in_place(const Obj& obj)
{
    if constexpr (requires { { object_traits<Obj>::writable_in_place(obj) } -> std::convertible_to<bool>; }) {
        return object_traits<Obj>::writable_in_place(obj);
    } else {
        return true;
    }
}

} // namespace detail

} // namespace optics_ext
