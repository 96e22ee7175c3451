// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file hana_struct.h
/// @brief object_traits for Boost.Hana-adapted C++ structs.
///
/// Any aggregate adapted with BOOST_HANA_DEFINE_STRUCT or
/// BOOST_HANA_ADAPT_STRUCT becomes an object for the optics:
///   - field_optic<"name">() reads and writes its members
///   - properties_optic() maps over every member
///   - the Mutable mode writes members in place
///
/// Reconstruction is derived from the adapted member list: a new struct is
/// aggregate-initialized from the members in declaration order, with the
/// updated member substituted.
///
/// @code
/// struct Point {
///     BOOST_HANA_DEFINE_STRUCT(Point, (int, x), (int, y));
/// };
/// Point p{1, 2};
/// auto q = set(p, field_optic<"x">(), 10);     // Point{10, 2}
/// @endcode
///
/// Naming a member the struct does not have fails to compile.

#pragma once

#include <optics_ext/optics_ext_config.h>
#include <optics_ext/fixed_string.h>
#include <optics_ext/object_traits.h>

#include <boost/hana/accessors.hpp>
#include <boost/hana/concept/struct.hpp>
#include <boost/hana/core/to.hpp>
#include <boost/hana/equal.hpp>
#include <boost/hana/find_if.hpp>
#include <boost/hana/first.hpp>
#include <boost/hana/for_each.hpp>
#include <boost/hana/optional.hpp>
#include <boost/hana/second.hpp>
#include <boost/hana/string.hpp>
#include <boost/hana/unpack.hpp>

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace optics_ext {

template <typename T>
concept hana_struct = boost::hana::Struct<T>::value;

namespace detail {

template <FixedString Name, std::size_t... Is>
constexpr auto hana_key_impl(std::index_sequence<Is...>) {
    return boost::hana::string_c<Name.data[Is]...>;
}

/// Compile-time hana string for a member name.
template <FixedString Name>
constexpr auto hana_key() {
    return hana_key_impl<Name>(std::make_index_sequence<Name.size()>{});
}

template <typename T, typename Key>
constexpr auto find_accessor(Key key) {
    return boost::hana::find_if(boost::hana::accessors<T>(), [key](auto pair) {
        return boost::hana::equal(boost::hana::first(pair), key);
    });
}

template <typename T, FixedString Name>
inline constexpr bool has_hana_member_v =
    decltype(boost::hana::is_just(find_accessor<T>(hana_key<Name>())))::value;

/// Reference to the member called Name (const-ness follows obj).
template <FixedString Name, typename Obj>
decltype(auto) hana_member(Obj&& obj) {
    using T = std::remove_cvref_t<Obj>;
    static_assert(has_hana_member_v<T, Name>,
                  "field_optic<Name>: the adapted struct has no member with this name");
    auto accessor = boost::hana::second(*find_accessor<T>(hana_key<Name>()));
    return accessor(std::forward<Obj>(obj));
}

/// Aggregate-initialize a T from one value per adapted member, in order.
template <typename T, typename Pick>
T hana_rebuild(Pick&& pick) {
    return boost::hana::unpack(boost::hana::accessors<T>(), [&](auto... pairs) {
        return T{pick(pairs)...};
    });
}

} // namespace detail

template <typename T>
struct object_traits<T, std::enable_if_t<boost::hana::Struct<T>::value>> {
    template <FixedString Name>
    static constexpr bool has_member = detail::has_hana_member_v<T, Name>;

    template <FixedString Name>
    [[nodiscard]] static auto get_member(const T& obj) {
        return detail::hana_member<Name>(obj);
    }

    template <FixedString Name>
    [[nodiscard]] static decltype(auto) member_ref(T& obj) {
        return detail::hana_member<Name>(obj);
    }

    template <FixedString Name, typename V>
    [[nodiscard]] static T set_member(T obj, V&& val) {
        static_assert(has_member<Name>, "field_optic<Name>: the adapted struct has no member with this name");
        constexpr auto key = detail::hana_key<Name>();
        return detail::hana_rebuild<T>([&](auto pair) {
            auto& member = boost::hana::second(pair)(obj);
            using Member = std::remove_cvref_t<decltype(member)>;
            if constexpr (decltype(boost::hana::equal(boost::hana::first(pair), key))::value) {
                return Member(std::forward<V>(val));
            } else {
                return Member(std::move(member));
            }
        });
    }

    template <typename F>
    [[nodiscard]] static T map_properties(F&& f, T obj) {
        return detail::hana_rebuild<T>([&](auto pair) {
            auto& member = boost::hana::second(pair)(obj);
            using Member = std::remove_cvref_t<decltype(member)>;
            return Member(std::invoke(f, std::move(member)));
        });
    }

    [[nodiscard]] static std::vector<std::string> property_names(const T&) {
        std::vector<std::string> names;
        boost::hana::for_each(boost::hana::accessors<T>(), [&](auto pair) {
            names.emplace_back(boost::hana::to<char const*>(boost::hana::first(pair)));
        });
        return names;
    }
};

} // namespace optics_ext
