// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record.h
/// @brief Record kinds and the object reconstruction helper.
///
/// A RecordKind describes a record type: its name, its ordered field names
/// and an optional invariant. RecordKind::construct() is the canonical
/// constructor; every optic update of a record goes through it, so the
/// invariant holds for every record an optic produces.
///
/// @code
/// auto point = RecordKind::make("Point", {"x", "y"});
/// Value p = point->make_record({1, 2});
/// Value q = set_properties(p, {{"x", 10}});      // Point(x=10, y=2)
/// @endcode

#pragma once

#include <optics_ext/value.h>
#include <optics_ext/errors.h>

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace optics_ext {

class OPTICS_EXT_API RecordKind : public std::enable_shared_from_this<RecordKind> {
public:
    /// Called with the candidate fields before a record is built;
    /// throws (typically std::invalid_argument) to reject them.
    using Invariant = std::function<void(const RecordKind&, const ValueVector&)>;

    [[nodiscard]] static RecordKindPtr make(std::string name,
                                            std::vector<std::string> field_names,
                                            Invariant invariant = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<std::string>& field_names() const noexcept { return field_names_; }
    [[nodiscard]] std::size_t arity() const noexcept { return field_names_.size(); }

    [[nodiscard]] std::optional<std::size_t> field_index(std::string_view field) const noexcept;
    [[nodiscard]] bool has_field(std::string_view field) const noexcept { return field_index(field).has_value(); }
    [[nodiscard]] bool has_invariant() const noexcept { return static_cast<bool>(invariant_); }

    /// Arity check followed by the invariant.
    /// @throws std::invalid_argument if fields.size() != arity()
    void validate(const ValueVector& fields) const;

    /// Canonical constructor: validate(), then build the record.
    [[nodiscard]] Value construct(ValueVector fields) const;

    [[nodiscard]] Value make_record(std::initializer_list<Value> fields) const;

private:
    RecordKind(std::string name, std::vector<std::string> field_names, Invariant invariant);

    std::string name_;
    std::vector<std::string> field_names_;
    Invariant invariant_;
};

// ============================================================
// Reconstruction helper
// ============================================================

using PropertyPatch = std::vector<std::pair<std::string, Value>>;

/// Named fields of obj in order: record fields, or map keys. Empty for
/// scalars and vectors.
[[nodiscard]] OPTICS_EXT_API std::vector<std::string> property_names(const Value& obj);

/// Replace the named fields of obj, keeping kind and field order.
/// @throws definition_error(missing_field) for a name obj does not have
[[nodiscard]] OPTICS_EXT_API Value set_properties(const Value& obj, const PropertyPatch& patch);

/// Apply f to every named field and rebuild. Objects without named fields
/// are returned unchanged.
template <typename F>
[[nodiscard]] Value map_properties(F&& f, const Value& obj)
{
    if (auto* r = obj.get_if<ValueRecord>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : r->fields) {
            t.push_back(ValueBox{Value(std::invoke(f, box.get()))});
        }
        return r->kind->construct(t.persistent());
    }
    if (auto* m = obj.get_if<ValueMap>()) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, box] : *m) {
            t.set(key, ValueBox{Value(std::invoke(f, box.get()))});
        }
        return Value{t.persistent()};
    }
    return obj;
}

} // namespace optics_ext
