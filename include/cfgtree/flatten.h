// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file flatten.h
/// @brief Linear, expand/collapse-aware projection of a Value tree.
///
/// flatten() walks the tree depth-first and emits one FlattenedNode per
/// visible path. Children of a container are visited only when its path is
/// expanded, so the cost is bounded by the number of visible rows rather than
/// the size of the document. Field names are visited in lexical order and
/// array elements in index order.
///
/// The root container itself is not emitted; its children are visible only
/// while the root path "" is expanded. When an original tree is supplied,
/// fields that exist only there appear as ghost rows carrying the original
/// value, so deleted branches stay browsable.

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>
#include <cfgtree/value_diff.h>

#include <immer/flex_vector.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace cfgtree {

enum class ParentKind : std::uint8_t {
    Root,
    Object,
    Array,
};

struct FlattenedNode {
    std::string id;                   ///< canonical path
    std::string label;                ///< field name, or "[i]" for array elements
    Value value;                      ///< current value, or the original one for ghost rows
    std::size_t depth = 0;            ///< 0 for children of the root
    ParentKind parent_kind = ParentKind::Root;
    ValueKind kind = ValueKind::Null;
    std::size_t child_count = 0;      ///< fields or elements when kind is a container
    bool expanded = false;
    bool is_current_match = false;    ///< the active search hit
    std::optional<ChangeKind> change; ///< absent when unchanged

    [[nodiscard]] bool is_container() const noexcept { return is_container_kind(kind); }

    bool operator==(const FlattenedNode& other) const = default;
};

using NodeList = immer::flex_vector<FlattenedNode>;

/// "object (3 keys)", "array (1 item)", "string", "number", ...
[[nodiscard]] CFGTREE_API std::string node_type_label(const FlattenedNode& node);

// ============================================================
// Expansion state
//
// A path is expanded iff it is in search_expanded, or it is in expanded
// and not in manually_collapsed. Collapsing moves a path from expanded to
// manually_collapsed; expanding does the reverse.
// ============================================================

struct CFGTREE_API ExpansionState {
    PathSet expanded;
    PathSet manually_collapsed;
    PathSet search_expanded;

    [[nodiscard]] bool is_expanded(const std::string& path) const;

    [[nodiscard]] ExpansionState expand(const std::string& path) const;
    [[nodiscard]] ExpansionState collapse(const std::string& path) const;

    /// Flip the explicit state of @p path (search forcing is not considered)
    [[nodiscard]] ExpansionState toggle(const std::string& path) const;

    bool operator==(const ExpansionState& other) const = default;
};

/// Every container path in @p current and @p original, the root "" included
[[nodiscard]] CFGTREE_API PathSet collect_container_paths(const Value& current, const Value* original);

/// Expand every path of @p inventory and forget manual collapses
[[nodiscard]] CFGTREE_API ExpansionState expand_all(const ExpansionState& state, const PathSet& inventory);

/// Keep the root and its direct children expanded; mark deeper containers
/// as manually collapsed
[[nodiscard]] CFGTREE_API ExpansionState collapse_all_except_root(const ExpansionState& state,
                                                                  const PathSet& inventory);

/// Paths that must be expanded to reveal @p target: all its proper ancestors
[[nodiscard]] CFGTREE_API PathSet paths_to_expand(std::string_view target);

/// Every recorded path of @p changes plus all of its ancestors
[[nodiscard]] CFGTREE_API PathSet changed_paths_with_ancestors(const ChangeMap& changes);

// ============================================================
// Flattening
// ============================================================

struct FlattenOptions {
    std::optional<PathSet> keep_only;         ///< when set, rows outside it are skipped
    std::optional<std::string> current_match; ///< path flagged is_current_match
};

[[nodiscard]] CFGTREE_API NodeList flatten(const Value& current,
                                           const Value* original,
                                           const ChangeMap& changes,
                                           const ExpansionState& expansion,
                                           const FlattenOptions& options = {});

} // namespace cfgtree
