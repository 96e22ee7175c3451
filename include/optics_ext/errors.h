// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions raised by optic operations.
///
/// Two families of failure exist:
///   - definition errors: an optic or object cannot perform the requested
///     operation at all (missing primitive, unknown field name). Raised as
///     definition_error for runtime-built optics; static optics report the
///     same condition with a static_assert.
///   - data errors: the structure does not hold what the optic expects
///     (index out of range, missing key, wrong alternative). These are the
///     standard exceptions of the underlying operation and are propagated
///     unchanged.

#pragma once

#include <optics_ext/api.h>

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace optics_ext {

class OPTICS_EXT_API definition_error : public std::logic_error {
public:
    enum class error_type {
        missing_get,    // optic cannot be applied to read a focus
        missing_set,    // SetBased optic without a set primitive
        missing_modify, // ModifyBased optic without a modify primitive
        missing_field   // object has no field with the requested name
    };

    definition_error(error_type type, std::string subject, std::string_view detail);

    [[nodiscard]] error_type type() const noexcept { return type_; }

    /// Shape of the offending optic, or the kind name of the offending object.
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    error_type type_;
    std::string subject_;
};

class OPTICS_EXT_API recursion_depth_error : public std::runtime_error {
public:
    explicit recursion_depth_error(std::size_t max_depth);

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    std::size_t max_depth_;
};

[[nodiscard]] OPTICS_EXT_API const char* to_string(definition_error::error_type type) noexcept;

namespace detail {

/// Log, then throw definition_error(missing_field).
[[noreturn]] OPTICS_EXT_API void throw_missing_field(
    std::string_view func,
    std::string_view owner,
    std::string_view field,
    std::source_location loc = std::source_location::current());

/// Log, then throw definition_error for a missing optic primitive.
[[noreturn]] OPTICS_EXT_API void throw_missing_primitive(
    std::string_view func,
    definition_error::error_type type,
    std::string_view optic_shape,
    std::source_location loc = std::source_location::current());

} // namespace detail
} // namespace optics_ext
