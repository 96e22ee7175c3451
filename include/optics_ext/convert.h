// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file convert.h
/// @brief Conversions between MutableValue and Value.
///
/// - Use `MutableValue` when a tree is edited in place (Mutable mode optics)
/// - Use `Value` when updates must leave earlier versions intact
///
/// Records keep their RecordKind across conversions; both directions run
/// through the kind's validation.
///
/// ```cpp
/// MutableValue root = MutableValue::map();
/// root.set("name", "Alice");
/// Value immutable = to_value(root);
/// MutableValue again = to_mutable_value(immutable);
/// ```

#pragma once

#include <optics_ext/api.h>
#include <optics_ext/mutable_value.h>
#include <optics_ext/value.h>

namespace optics_ext {

[[nodiscard]] OPTICS_EXT_API Value to_value(const MutableValue& mv);

/// Move overload: strings and children are moved out of mv.
[[nodiscard]] OPTICS_EXT_API Value to_value(MutableValue&& mv);

[[nodiscard]] OPTICS_EXT_API MutableValue to_mutable_value(const Value& v);

} // namespace optics_ext
