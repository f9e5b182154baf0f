// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file keydiff.h
/// @brief Umbrella header: everything needed to diff maps and sets.
///
/// @code
///   #include <keydiff/keydiff.h>
///
///   std::map<std::string, int> before = ..., after = ...;
///   auto changeset = keydiff::diff_with(before, after);
///   for (const auto& change : changeset.changes()) { ... }
/// @endcode

#pragma once

// Must come first: sets the immer macros before any immer header is seen.
#include <keydiff/keydiff_config.h>

#include <keydiff/api.h>
#include <keydiff/change.h>
#include <keydiff/changeset.h>
#include <keydiff/concepts.h>
#include <keydiff/diff_traits.h>
#include <keydiff/errors.h>
#include <keydiff/iterators.h>
#include <keydiff/key_partition.h>
#include <keydiff/map_diff.h>
#include <keydiff/modification.h>
#include <keydiff/owned_changeset.h>
#include <keydiff/report.h>
#include <keydiff/scopes.h>
#include <keydiff/set_diff.h>
#include <keydiff/strategy.h>
