// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file focused.h
/// @brief Focused - an object paired with an optic.
///
/// A Focused value remembers where it points, so the focus can be read and
/// updated without passing the optic again. Every update returns a new
/// Focused over the updated object; the original is left untouched.
///
/// @code
///   auto f = focus(state, field_optic("users") | index_optic(0));
///   Value user = f.get();
///   auto g = f.set(Value{"alice"});
///   Value new_state = g.object();
///
///   auto h = f / field_optic("name");   // zoom further
/// @endcode

#pragma once

#include <optics_ext/composed.h>
#include <optics_ext/optics.h>

#include <utility>

namespace optics_ext {

template <typename Obj, typename Optic>
class Focused {
public:
    Focused(Obj obj, Optic optic)
        : obj_(std::move(obj))
        , optic_(std::move(optic))
    {}

    [[nodiscard]] const Obj& object() const& noexcept { return obj_; }
    [[nodiscard]] Obj object() && noexcept { return std::move(obj_); }
    [[nodiscard]] const Optic& optic() const noexcept { return optic_; }

    [[nodiscard]] auto get() const { return optics_ext::get(obj_, optic_); }

    template <typename V>
    [[nodiscard]] Focused set(V&& val) const {
        return Focused{optics_ext::set(obj_, optic_, std::forward<V>(val)), optic_};
    }

    template <typename F>
    [[nodiscard]] Focused modify(F&& f) const {
        return Focused{optics_ext::modify(std::forward<F>(f), obj_, optic_), optic_};
    }

    /// Refocus through a further optic applied after this one.
    template <typename Next>
    [[nodiscard]] auto zoom(Next next) const {
        auto optic = opcompose(optic_, std::move(next));
        return Focused<Obj, decltype(optic)>{obj_, std::move(optic)};
    }

    template <typename Next>
    [[nodiscard]] auto operator/(Next next) const {
        return zoom(std::move(next));
    }

private:
    Obj obj_;
    Optic optic_;
};

template <typename Obj, typename Optic>
[[nodiscard]] Focused<Obj, Optic> focus(Obj obj, Optic optic) {
    return Focused<Obj, Optic>{std::move(obj), std::move(optic)};
}

} // namespace optics_ext
