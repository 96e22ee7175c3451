// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversals.h
/// @brief Modify-based structural optics: Elements, Properties, If, Recursive.
///
/// These optics focus on zero or more parts at once, so they implement
/// modify() only; set() on them replaces every focused part.
///
/// @code
/// auto is_even = [](int x) { return x % 2 == 0; };
/// std::vector<int> v{1, 2, 3, 4};
/// modify([](int x) { return 10 * x; }, v, elements_optic() | if_optic(is_even));   // [1, 20, 3, 40]
/// @endcode

#pragma once

#include <optics_ext/optics_ext_config.h>
#include <optics_ext/errors.h>
#include <optics_ext/log.h>
#include <optics_ext/object_traits.h>
#include <optics_ext/optics.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace optics_ext {

// ============================================================
// Elements
// ============================================================

/// Every element of a collection: vector elements, map values, record
/// fields in order.
struct Elements : OpticBase {
    using style = ModifyBased;

    template <typename F, typename Obj>
        requires element_mappable<Obj, F>
    [[nodiscard]] Obj modify(F&& f, Obj obj) const {
        return object_traits<Obj>::map_elements(std::forward<F>(f), std::move(obj));
    }

    [[nodiscard]] std::string shape() const { return "elements()"; }
};

[[nodiscard]] constexpr Elements elements_optic() noexcept { return {}; }

// ============================================================
// Properties
// ============================================================

/// Every named field. The object is rebuilt through its reconstruction
/// helper; objects without named fields come back unchanged.
struct Properties : OpticBase {
    using style = ModifyBased;

    template <typename F, typename Obj>
    [[nodiscard]] Obj modify(F&& f, Obj obj) const {
        if constexpr (property_mappable<Obj, F>) {
            return object_traits<Obj>::map_properties(std::forward<F>(f), std::move(obj));
        } else {
            return obj;
        }
    }

    [[nodiscard]] std::string shape() const { return "properties()"; }
};

[[nodiscard]] constexpr Properties properties_optic() noexcept { return {}; }

// ============================================================
// If
// ============================================================

/// Focuses on the object itself when pred(obj) holds, on nothing otherwise.
template <typename Pred>
class If : public OpticBase {
public:
    using style = ModifyBased;

    explicit If(Pred pred) : pred_(std::move(pred)) {}

    [[nodiscard]] const Pred& predicate() const noexcept { return pred_; }

    template <typename F, typename Obj>
        requires std::predicate<const Pred&, const Obj&>
    [[nodiscard]] Obj modify(F&& f, Obj obj) const {
        if (std::invoke(pred_, std::as_const(obj))) {
            return Obj(std::invoke(std::forward<F>(f), std::move(obj)));
        }
        return obj;
    }

    [[nodiscard]] std::string shape() const { return "if(<pred>)"; }

private:
    Pred pred_;
};

template <typename Pred>
[[nodiscard]] If<std::decay_t<Pred>> if_optic(Pred&& pred) {
    return If<std::decay_t<Pred>>{std::forward<Pred>(pred)};
}

// ============================================================
// Recursive
// ============================================================

namespace detail {

/// f(part) can stand in for part.
template <typename F, typename Part>
concept maps_into = std::invocable<F, Part> && std::constructible_from<Part, std::invoke_result_t<F, Part>>;

} // namespace detail

/// Depth-first traversal: every part the inner optic focuses on is either
/// descended into (descent(part) is true) or handed to f.
///
/// With statically typed objects a part is only descended into when the
/// inner optic applies to its type and descent accepts it, and only handed
/// to f when f accepts it; parts that fit neither are left as they are.
///
/// Descending deeper than max_depth() throws recursion_depth_error.
template <typename Descent, typename Inner>
class Recursive : public OpticBase {
public:
    using style = ModifyBased;

    Recursive(Descent descent, Inner inner, std::size_t max_depth = OPTICS_EXT_DEFAULT_MAX_RECURSION_DEPTH)
        : descent_(std::move(descent))
        , inner_(std::move(inner))
        , max_depth_(max_depth)
    {}

    [[nodiscard]] const Descent& descent() const noexcept { return descent_; }
    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }
    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

    [[nodiscard]] Recursive with_max_depth(std::size_t depth) const {
        return Recursive{descent_, inner_, depth};
    }

    template <typename F, typename Obj>
    [[nodiscard]] Obj modify(F&& f, Obj obj) const {
        return modify_at_depth(f, std::move(obj), 0);
    }

    [[nodiscard]] std::string shape() const { return "recursive(<descent>, ...)"; }

private:
    template <typename F, typename Obj>
    Obj modify_at_depth(F& f, Obj obj, std::size_t depth) const {
        if (depth >= max_depth_) {
            detail::log_access_error("Recursive::modify", "maximum recursion depth exceeded");
            throw recursion_depth_error(max_depth_);
        }
        return optics_ext::modify(
            [this, &f, depth](auto part) -> decltype(part) {
                using Part = decltype(part);
                if constexpr (modifiable_with<Inner, Part> && std::predicate<const Descent&, const Part&>) {
                    if (std::invoke(descent_, std::as_const(part))) {
                        return modify_at_depth(f, std::move(part), depth + 1);
                    }
                }
                if constexpr (detail::maps_into<F&, Part>) {
                    return Part(std::invoke(f, std::move(part)));
                } else {
                    return part;
                }
            },
            std::move(obj), inner_);
    }

    Descent descent_;
    Inner inner_;
    std::size_t max_depth_;
};

template <typename Descent, typename Inner>
[[nodiscard]] Recursive<std::decay_t<Descent>, Inner> recursive_optic(Descent&& descent, Inner inner) {
    return Recursive<std::decay_t<Descent>, Inner>{std::forward<Descent>(descent), std::move(inner)};
}

} // namespace optics_ext
