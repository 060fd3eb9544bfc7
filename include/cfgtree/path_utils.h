// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_utils.h
/// @brief Path resolution against a Value tree.

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>

#include <optional>
#include <string_view>

namespace cfgtree {

/// Single step: field of an object or element of an array, nullptr when absent
[[nodiscard]] inline const Value* find_child(const Value& node, const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return node.find(*key);
    }
    return node.find(std::get<std::size_t>(elem));
}

/// Resolve @p path inside @p root.
/// @return pointer into @p root's structure (valid while @p root is alive),
///         or nullptr when an index is out of range, a field is missing, or a
///         segment traverses a leaf
[[nodiscard]] CFGTREE_API const Value* find_at_path(const Value& root, const Path& path);

/// Resolve a canonical path string; malformed strings resolve to nothing
[[nodiscard]] CFGTREE_API std::optional<Value> get_at_path(const Value& root, std::string_view canonical);

} // namespace cfgtree
