// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file erased_optic.h
/// @brief Type-erased optic over Value with a style chosen at run time.
///
/// ErasedOptic stores its primitives as std::function, so optics built from
/// configuration or user input can be kept in containers and composed at
/// run time. The static style is ModifyBased; the runtime style decides
/// which stored primitive answers set and modify:
///
///   runtime_style::set_based     getter + setter, modify is synthesized
///   runtime_style::modify_based  modifier (+ optional getter), set is
///                                modify with a constant function
///
/// A primitive that was never supplied raises definition_error when it is
/// needed.
///
/// @code
/// auto name = ErasedOptic::erase(field_optic("name"));
/// auto all  = ErasedOptic::erase(elements_optic());
/// auto names = all | name;                         // still an ErasedOptic
/// Value v2 = modify([](const Value& s) { return Value{s.as_string() + "!"}; }, v, names);
/// @endcode

#pragma once

#include <optics_ext/api.h>
#include <optics_ext/errors.h>
#include <optics_ext/optics.h>
#include <optics_ext/shape.h>
#include <optics_ext/value.h>

#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace optics_ext {

class OPTICS_EXT_API ErasedOptic : public OpticBase {
public:
    using style = ModifyBased;

    using Getter = std::function<Value(const Value&)>;
    using Setter = std::function<Value(Value, Value)>;
    using Updater = std::function<Value(const Value&)>;
    using Modifier = std::function<Value(const Updater&, Value)>;

    enum class runtime_style { set_based, modify_based };

    /// Identity optic.
    ErasedOptic();

    [[nodiscard]] static ErasedOptic set_based(std::string shape, Getter getter, Setter setter);
    [[nodiscard]] static ErasedOptic modify_based(std::string shape, Modifier modifier, Getter getter = {});

    /// Wrap a static optic, keeping its style and its getter when it has one.
    template <typename Optic>
    [[nodiscard]] static ErasedOptic erase(Optic optic) {
        if constexpr (std::is_same_v<Optic, ErasedOptic>) {
            return optic;
        } else {
            auto shape = shape_of(optic);
            Getter getter;
            if constexpr (has_get_primitive<Optic, Value>) {
                getter = [optic](const Value& whole) -> Value { return Value(optic(whole)); };
            }
            if constexpr (modify_based_optic<Optic>) {
                return modify_based(std::move(shape),
                                    [optic](const Updater& f, Value whole) -> Value {
                                        return optics_ext::modify(f, std::move(whole), optic);
                                    },
                                    std::move(getter));
            } else {
                return set_based(std::move(shape), std::move(getter),
                                 [optic](Value whole, Value part) -> Value {
                                     return optics_ext::set(std::move(whole), optic, std::move(part));
                                 });
            }
        }
    }

    [[nodiscard]] runtime_style dynamic_style() const noexcept { return style_; }
    [[nodiscard]] bool is_identity() const noexcept { return identity_; }
    [[nodiscard]] const std::string& shape() const noexcept { return shape_; }

    [[nodiscard]] bool has_getter() const noexcept { return static_cast<bool>(getter_); }
    [[nodiscard]] bool has_setter() const noexcept { return static_cast<bool>(setter_); }
    [[nodiscard]] bool has_modifier() const noexcept { return static_cast<bool>(modifier_); }

    /// Read the focus. Throws definition_error(missing_get) without a getter.
    [[nodiscard]] Value operator()(const Value& whole) const;

    [[nodiscard]] Value set_value(Value whole, Value part) const;
    [[nodiscard]] Value modify_value(const Updater& f, Value whole) const;

    /// Generic modify entry point. A Constant function (what set() passes
    /// for ModifyBased optics) goes straight to set_value, so set on a
    /// set-based erased optic only needs the setter.
    template <typename F>
    [[nodiscard]] Value modify(F&& f, Value whole) const {
        if constexpr (is_constant_v<std::remove_cvref_t<F>>) {
            return set_value(std::move(whole), Value(f.value));
        } else {
            return modify_value(Updater{[&f](const Value& part) -> Value {
                                    return Value(std::invoke(f, part));
                                }},
                                std::move(whole));
        }
    }

    /// compose(*this, inner): inner focuses first, this one second.
    [[nodiscard]] ErasedOptic compose(const ErasedOptic& inner) const;

    /// Application order, left to right.
    friend ErasedOptic operator|(const ErasedOptic& first, const ErasedOptic& second) {
        return second.compose(first);
    }

private:
    ErasedOptic(runtime_style style, std::string shape, Getter getter, Setter setter, Modifier modifier);

    runtime_style style_;
    std::string shape_;
    Getter getter_;
    Setter setter_;
    Modifier modifier_;
    bool identity_ = false;
};

} // namespace optics_ext
