// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file mutable_value.h
/// @brief Mutable dynamic value type supporting in-place optic updates.
///
/// MutableValue is the in-place capable counterpart of Value. It holds the
/// same alternatives (null, bool, int32, int64, double, string, map, vector,
/// record) but its containers are ordinary mutable containers:
/// - maps are tsl::robin_map with heterogeneous string lookup
/// - vectors are std::vector
/// - records keep their RecordKind and a std::vector of fields
///
/// Containers are boxed (unique_ptr) to break the recursive type dependency;
/// children are stored directly inside them. Copying a MutableValue copies
/// the whole tree, so an optic's immutable path never aliases the input.
///
/// Under the Mutable mode, field and index optics write through references
/// returned by field_ref()/index_ref(), keeping the addresses of untouched
/// children stable.
///
/// ## Usage Example
/// ```cpp
/// MutableValue root = MutableValue::map({{"user", MutableValue::map({{"name", "John"}})}});
/// set(root, field_optic("user") | field_optic("name"), "Jane", mutable_mode);
/// ```

#pragma once

#include <optics_ext/api.h>
#include <optics_ext/value.h>

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <tsl/robin_map.h>
#include <utility>
#include <variant>
#include <vector>

namespace optics_ext {

// ============================================================
// Transparent Hash/Equal for robin_map heterogeneous lookup
// ============================================================

/// Transparent hash functor for string types
/// Supports: std::string, std::string_view, const char*
struct MutableValueStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

/// Transparent equality comparator for string types
struct MutableValueStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

struct MutableValue;
struct MutableRecord;

/// Raw map type - stores MutableValue directly
using MutableValueMap = tsl::robin_map<std::string, MutableValue, MutableValueStringHash, MutableValueStringEqual>;

/// Raw vector type - stores MutableValue directly
using MutableValueVector = std::vector<MutableValue>;

using MutableValueMapPtr    = std::unique_ptr<MutableValueMap>;
using MutableValueVectorPtr = std::unique_ptr<MutableValueVector>;
using MutableRecordPtr      = std::unique_ptr<MutableRecord>;

struct OPTICS_EXT_API MutableValue {
    using DataVariant = std::variant<std::monostate,
                                     bool,
                                     int32_t,
                                     int64_t,
                                     double,
                                     std::string,
                                     MutableValueMapPtr,
                                     MutableValueVectorPtr,
                                     MutableRecordPtr>;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so that optics can assign plain values:
    //   set(root, field_optic("age"), 30, mutable_mode);

    MutableValue() : data(std::monostate{}) {}
    MutableValue(bool v) noexcept : data(v) {}
    MutableValue(int32_t v) noexcept : data(v) {}
    MutableValue(int64_t v) noexcept : data(v) {}
    MutableValue(double v) noexcept : data(v) {}
    MutableValue(std::string v) : data(std::move(v)) {}
    MutableValue(const char* v) : data(std::string(v)) {}
    MutableValue(std::string_view v) : data(std::string(v)) {}
    MutableValue(MutableValueMap v);
    MutableValue(MutableValueVector v);
    MutableValue(MutableRecord v);

    /// Deep copy
    MutableValue(const MutableValue& other);
    MutableValue& operator=(const MutableValue& other);

    MutableValue(MutableValue&&) noexcept = default;
    MutableValue& operator=(MutableValue&&) noexcept = default;

    ~MutableValue();

    // ============================================================
    // Factory Methods (consistent with Value class naming)
    // ============================================================

    [[nodiscard]] static MutableValue map();
    [[nodiscard]] static MutableValue map(std::initializer_list<std::pair<std::string, MutableValue>> init);
    [[nodiscard]] static MutableValue vector();
    [[nodiscard]] static MutableValue vector(std::initializer_list<MutableValue> init);

    /// Build a record through the kind's canonical constructor rules
    /// (arity check and invariant).
    [[nodiscard]] static MutableValue record(RecordKindPtr kind, std::vector<MutableValue> fields);

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_map() const { return is<MutableValueMapPtr>(); }
    [[nodiscard]] bool is_vector() const { return is<MutableValueVectorPtr>(); }
    [[nodiscard]] bool is_record() const { return is<MutableRecordPtr>(); }
    [[nodiscard]] bool is_string() const { return is<std::string>(); }

    // ============================================================
    // Value Access
    // ============================================================

    /// Get value as specific type (throws std::bad_variant_access if wrong type)
    template <typename T>
    [[nodiscard]] T& as() {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] T* get_if() {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* p = std::get_if<T>(&data))
            return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        return get_or<std::string>(std::move(default_val));
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const;

    [[nodiscard]] MutableValueMap* as_map_ptr();
    [[nodiscard]] const MutableValueMap* as_map_ptr() const;
    [[nodiscard]] MutableValueVector* as_vector_ptr();
    [[nodiscard]] const MutableValueVector* as_vector_ptr() const;
    [[nodiscard]] MutableRecord* as_record_ptr();
    [[nodiscard]] const MutableRecord* as_record_ptr() const;

    // ============================================================
    // Map / Record Operations
    // ============================================================

    /// Map child or record field by name (nullptr if absent or not a map/record)
    [[nodiscard]] MutableValue* get(std::string_view key);
    [[nodiscard]] const MutableValue* get(std::string_view key) const;

    /// Insert or replace a map child; assigns an existing record field, going
    /// through RecordKind validation when the kind has an invariant.
    /// Returns *this for chaining.
    MutableValue& set(std::string_view key, MutableValue val);

    [[nodiscard]] bool contains(std::string_view key) const { return get(key) != nullptr; }

    // ============================================================
    // Vector Operations
    // ============================================================

    /// Vector element (nullptr if out of range or not a vector)
    [[nodiscard]] MutableValue* get(std::size_t index);
    [[nodiscard]] const MutableValue* get(std::size_t index) const;

    MutableValue& push_back(MutableValue val);

    /// Number of elements of a map, vector or record; 0 for scalars.
    [[nodiscard]] std::size_t size() const;
};

/// A record instance: kind plus one field per declared name.
struct OPTICS_EXT_API MutableRecord {
    RecordKindPtr kind;
    std::vector<MutableValue> fields;
};

[[nodiscard]] OPTICS_EXT_API bool operator==(const MutableValue& a, const MutableValue& b);

[[nodiscard]] OPTICS_EXT_API std::string value_to_string(const MutableValue& val);

OPTICS_EXT_API std::ostream& operator<<(std::ostream& os, const MutableValue& val);

// ============================================================
// Reconstruction helper (MutableValue flavor)
// ============================================================

using MutablePropertyPatch = std::vector<std::pair<std::string, MutableValue>>;

[[nodiscard]] OPTICS_EXT_API std::vector<std::string> property_names(const MutableValue& obj);

/// Build a new object with the named fields replaced.
/// @throws definition_error(missing_field) for a name obj does not have
[[nodiscard]] OPTICS_EXT_API MutableValue set_properties(MutableValue obj, MutablePropertyPatch patch);

/// Apply f to every named field (record fields, map values) and rebuild.
template <typename F>
[[nodiscard]] MutableValue map_properties(F&& f, MutableValue obj)
{
    if (auto* r = obj.as_record_ptr()) {
        std::vector<MutableValue> fields;
        fields.reserve(r->fields.size());
        for (auto& field : r->fields) {
            fields.push_back(MutableValue(std::invoke(f, std::move(field))));
        }
        return MutableValue::record(r->kind, std::move(fields));
    }
    if (auto* m = obj.as_map_ptr()) {
        for (auto it = m->begin(); it != m->end(); ++it) {
            it.value() = MutableValue(std::invoke(f, std::move(it.value())));
        }
    }
    return obj;
}

} // namespace optics_ext
