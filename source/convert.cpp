// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <optics_ext/convert.h>
#include <optics_ext/record.h>

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

namespace optics_ext {

// ============================================================
// MutableValue -> Value Conversion
// ============================================================

Value to_value(const MutableValue& mv) {
    return std::visit(
        [](const auto& val) -> Value {
            using T = std::decay_t<decltype(val)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, MutableValueMapPtr>) {
                auto transient = ValueMap{}.transient();
                if (val) {
                    for (const auto& [key, child] : *val) {
                        transient.set(key, ValueBox{to_value(child)});
                    }
                }
                return Value{transient.persistent()};
            } else if constexpr (std::is_same_v<T, MutableValueVectorPtr>) {
                auto transient = ValueVector{}.transient();
                if (val) {
                    for (const auto& child : *val) {
                        transient.push_back(ValueBox{to_value(child)});
                    }
                }
                return Value{transient.persistent()};
            } else if constexpr (std::is_same_v<T, MutableRecordPtr>) {
                auto transient = ValueVector{}.transient();
                for (const auto& field : val->fields) {
                    transient.push_back(ValueBox{to_value(field)});
                }
                return val->kind->construct(transient.persistent());
            } else {
                return Value{val};
            }
        },
        mv.data);
}

Value to_value(MutableValue&& mv) {
    return std::visit(
        [](auto&& val) -> Value {
            using T = std::decay_t<decltype(val)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return Value{std::move(val)};
            } else if constexpr (std::is_same_v<T, MutableValueMapPtr>) {
                auto transient = ValueMap{}.transient();
                if (val) {
                    for (auto it = val->begin(); it != val->end(); ++it) {
                        transient.set(it->first, ValueBox{to_value(std::move(it.value()))});
                    }
                }
                return Value{transient.persistent()};
            } else if constexpr (std::is_same_v<T, MutableValueVectorPtr>) {
                auto transient = ValueVector{}.transient();
                if (val) {
                    for (auto& child : *val) {
                        transient.push_back(ValueBox{to_value(std::move(child))});
                    }
                }
                return Value{transient.persistent()};
            } else if constexpr (std::is_same_v<T, MutableRecordPtr>) {
                auto transient = ValueVector{}.transient();
                for (auto& field : val->fields) {
                    transient.push_back(ValueBox{to_value(std::move(field))});
                }
                return val->kind->construct(transient.persistent());
            } else {
                return Value{val};
            }
        },
        std::move(mv.data));
}

// ============================================================
// Value -> MutableValue Conversion
// ============================================================

MutableValue to_mutable_value(const Value& v) {
    return std::visit(
        [](const auto& val) -> MutableValue {
            using T = std::decay_t<decltype(val)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return MutableValue{};
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                MutableValueMap result;
                result.reserve(val.size());
                for (const auto& [key, box] : val) {
                    result.insert_or_assign(key, to_mutable_value(box.get()));
                }
                return MutableValue{std::move(result)};
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                MutableValueVector result;
                result.reserve(val.size());
                for (const auto& box : val) {
                    result.push_back(to_mutable_value(box.get()));
                }
                return MutableValue{std::move(result)};
            } else if constexpr (std::is_same_v<T, ValueRecord>) {
                std::vector<MutableValue> fields;
                fields.reserve(val.fields.size());
                for (const auto& box : val.fields) {
                    fields.push_back(to_mutable_value(box.get()));
                }
                return MutableValue{MutableRecord{val.kind, std::move(fields)}};
            } else {
                return MutableValue{val};
            }
        },
        v.data);
}

} // namespace optics_ext
