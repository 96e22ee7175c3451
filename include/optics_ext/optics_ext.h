// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics_ext.h
/// @brief Umbrella header: every optic, object adapter and bridge.

#pragma once

#include <optics_ext/optics_ext_config.h>

#include <optics_ext/errors.h>
#include <optics_ext/value.h>
#include <optics_ext/record.h>
#include <optics_ext/mutable_value.h>
#include <optics_ext/convert.h>
#include <optics_ext/object_traits.h>
#include <optics_ext/hana_struct.h>

#include <optics_ext/optic_style.h>
#include <optics_ext/optics.h>
#include <optics_ext/lenses.h>
#include <optics_ext/composed.h>
#include <optics_ext/traversals.h>
#include <optics_ext/shape.h>
#include <optics_ext/erased_optic.h>
#include <optics_ext/focused.h>
#include <optics_ext/lager_bridge.h>
