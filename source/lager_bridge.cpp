// lager_bridge.cpp - Wrapping lager lenses as ErasedOptic

#include <optics_ext/lager_bridge.h>

namespace optics_ext {

ErasedOptic from_lager_lens(LagerValueLens lens, std::string shape)
{
    return ErasedOptic::set_based(
        std::move(shape),
        [lens](const Value& whole) -> Value { return lager::view(lens, whole); },
        [lens](Value whole, Value part) -> Value { return lager::set(lens, std::move(whole), std::move(part)); });
}

} // namespace optics_ext
