// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change.cpp
/// @brief Names of the change and shape enums.

#include <keydiff/change.h>
#include <keydiff/diff_traits.h>

namespace keydiff {

std::string_view to_string(ChangeKind kind) noexcept
{
    switch (kind) {
        case ChangeKind::Add:    return "add";
        case ChangeKind::Remove: return "remove";
        case ChangeKind::Modify: return "modify";
    }
    return "unknown";
}

std::string_view to_string(ChangeShape shape) noexcept
{
    switch (shape) {
        case ChangeShape::Leaf: return "leaf";
        case ChangeShape::Map:  return "map";
        case ChangeShape::Set:  return "set";
    }
    return "unknown";
}

} // namespace keydiff
