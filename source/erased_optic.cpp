// erased_optic.cpp - ErasedOptic: runtime-style type-erased optic over Value

#include <optics_ext/erased_optic.h>

namespace optics_ext {

using error_type = definition_error::error_type;

// ============================================================
// Construction
// ============================================================

ErasedOptic::ErasedOptic()
    : ErasedOptic(runtime_style::set_based,
                  "identity",
                  [](const Value& v) { return v; },
                  [](Value, Value part) { return part; },
                  {})
{
    identity_ = true;
}

ErasedOptic::ErasedOptic(runtime_style style, std::string shape, Getter getter, Setter setter, Modifier modifier)
    : style_(style)
    , shape_(std::move(shape))
    , getter_(std::move(getter))
    , setter_(std::move(setter))
    , modifier_(std::move(modifier))
{
}

ErasedOptic ErasedOptic::set_based(std::string shape, Getter getter, Setter setter)
{
    return ErasedOptic{runtime_style::set_based, std::move(shape), std::move(getter), std::move(setter), {}};
}

ErasedOptic ErasedOptic::modify_based(std::string shape, Modifier modifier, Getter getter)
{
    return ErasedOptic{runtime_style::modify_based, std::move(shape), std::move(getter), {}, std::move(modifier)};
}

// ============================================================
// Primitives
// ============================================================

Value ErasedOptic::operator()(const Value& whole) const
{
    if (!getter_) {
        detail::throw_missing_primitive("ErasedOptic::get", error_type::missing_get, shape_);
    }
    return getter_(whole);
}

Value ErasedOptic::set_value(Value whole, Value part) const
{
    if (style_ == runtime_style::modify_based) {
        if (!modifier_) {
            detail::throw_missing_primitive("ErasedOptic::set", error_type::missing_modify, shape_);
        }
        return modifier_([&part](const Value&) { return part; }, std::move(whole));
    }
    if (!setter_) {
        detail::throw_missing_primitive("ErasedOptic::set", error_type::missing_set, shape_);
    }
    return setter_(std::move(whole), std::move(part));
}

Value ErasedOptic::modify_value(const Updater& f, Value whole) const
{
    if (style_ == runtime_style::modify_based) {
        if (!modifier_) {
            detail::throw_missing_primitive("ErasedOptic::modify", error_type::missing_modify, shape_);
        }
        return modifier_(f, std::move(whole));
    }
    if (!setter_) {
        detail::throw_missing_primitive("ErasedOptic::modify", error_type::missing_set, shape_);
    }
    auto current = (*this)(whole);
    return setter_(std::move(whole), f(current));
}

// ============================================================
// Composition
// ============================================================

ErasedOptic ErasedOptic::compose(const ErasedOptic& inner) const
{
    // Identity on either side is dropped
    if (inner.identity_) {
        return *this;
    }
    if (identity_) {
        return inner;
    }

    auto shape = "compose(" + shape_ + ", " + inner.shape_ + ")";
    auto outer = *this;

    Getter getter;
    if (getter_ && inner.getter_) {
        getter = [outer, inner](const Value& whole) { return outer(inner(whole)); };
    }

    if (style_ == runtime_style::set_based && inner.style_ == runtime_style::set_based) {
        return set_based(std::move(shape), std::move(getter), [outer, inner](Value whole, Value part) {
            auto inner_part = inner(whole);
            auto updated = outer.set_value(std::move(inner_part), std::move(part));
            return inner.set_value(std::move(whole), std::move(updated));
        });
    }

    return modify_based(
        std::move(shape),
        [outer, inner](const Updater& f, Value whole) {
            return inner.modify_value([&outer, &f](const Value& part) { return outer.modify_value(f, part); },
                                      std::move(whole));
        },
        std::move(getter));
}

} // namespace optics_ext
