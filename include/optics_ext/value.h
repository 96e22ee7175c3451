// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable dynamic value backed by immer persistent containers.
///
/// Value is the dynamic object model the optics operate on when the data
/// shape is only known at runtime. It holds one of:
///   null, bool, int32, int64, double, string,
///   map (string -> Value), vector (Value...), record (kind + fields).
///
/// Every "modification" returns a new Value; unchanged sub-trees are shared
/// structurally with the original. Copies are O(1).

#pragma once

#include <optics_ext/optics_ext_config.h>
#include <optics_ext/api.h>
#include <optics_ext/log.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace optics_ext {

// ============================================================
// Memory Policy
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks.
/// Optics evaluation is synchronous, so Value trees are never shared
/// across threads.
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

struct Value;
class RecordKind;

using RecordKindPtr = std::shared_ptr<const RecordKind>;
using ValueBox      = immer::box<Value, memory_policy>;
using ValueMap      = immer::map<std::string,
                                 ValueBox,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 memory_policy>;
using ValueVector   = immer::vector<ValueBox, memory_policy>;

/// A record: an instance of a RecordKind with one value per declared field,
/// stored in declaration order.
struct ValueRecord {
    RecordKindPtr kind;
    ValueVector fields;
};

// ============================================================
// Value
// ============================================================

struct OPTICS_EXT_API Value
{
    using Data = std::variant<std::monostate,
                              bool,
                              int32_t,
                              int64_t,
                              double,
                              std::string,
                              ValueMap,
                              ValueVector,
                              ValueRecord>;

    Data data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueRecord v) : data(std::move(v)) {}

    // Factory functions for container types
    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    /// Checked access; throws std::bad_variant_access on mismatch.
    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_record() const noexcept { return is<ValueRecord>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }

    // Lenient accessors: log and return null on failure
    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] Value at_or(const std::string& key, Value default_val) const {
        auto result = at(key);
        return result.is_null() ? std::move(default_val) : std::move(result);
    }

    [[nodiscard]] Value at_or(std::size_t index, Value default_val) const {
        auto result = at(index);
        return result.is_null() ? std::move(default_val) : std::move(result);
    }

    template<typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const;
    [[nodiscard]] double as_number(double default_val = 0.0) const;
    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        return get_or<std::string>(std::move(default_val));
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }
    [[nodiscard]] std::size_t count(const std::string& key) const;

    /// Number of elements of a map, vector or record; 0 for scalars.
    [[nodiscard]] std::size_t size() const;

    // Lenient persistent updates: return *this unchanged on type mismatch.
    // Record fields are rebuilt through RecordKind::construct, whose
    // invariant may throw.
    [[nodiscard]] Value set(const std::string& key, Value val) const;
    [[nodiscard]] Value set(std::size_t index, Value val) const;

    [[nodiscard]] Value push_back(Value val) const;
};

// ============================================================
// Equality and printing
// ============================================================

/// Two kinds are the same kind when they are the same object or declare the
/// same name and field list.
[[nodiscard]] OPTICS_EXT_API bool same_record_kind(const RecordKindPtr& a, const RecordKindPtr& b);

inline bool operator==(const ValueRecord& a, const ValueRecord& b) {
    return same_record_kind(a.kind, b.kind) && a.fields == b.fields;
}

inline bool operator==(const Value& a, const Value& b) {
    return a.data == b.data;
}

/// Name of the alternative held ("null", "int32", "map", ...); for records,
/// the kind name.
[[nodiscard]] OPTICS_EXT_API std::string value_type_name(const Value& val);

/// Compact single-line rendering, e.g. {a: 1, b: [1, 2]} or Point(x=1, y=2)
[[nodiscard]] OPTICS_EXT_API std::string value_to_string(const Value& val);

OPTICS_EXT_API std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace optics_ext
