// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path addressing into a Value tree and its canonical string form.
///
/// A Path is a sequence of segments, each a field name (std::string) or an
/// array index (std::size_t). The canonical string joins segments with '.'
/// and writes indices in brackets:
///
///   {"items", 1, "name"}  <->  "items.[1].name"
///   {}                    <->  ""            (the root)
///
/// Field names escape the characters that carry meaning in the canonical
/// form ('.', '[', ']', '\') with a backslash, and an empty field name is
/// written as "\_". This keeps the mapping injective, so canonical strings
/// are safe to use as map and set keys.

#pragma once

#include <cfgtree/cfgtree_config.h>
#include <cfgtree/api.h>

#include <immer/set.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cfgtree {

using PathElement = std::variant<std::string, std::size_t>;

/// Set of canonical path strings (edited paths, expansion state, filters)
using PathSet = immer::set<std::string>;

class CFGTREE_API Path
{
public:
    using container_type = std::vector<PathElement>;
    using const_iterator = container_type::const_iterator;

    Path() = default;
    Path(std::initializer_list<PathElement> elements) : elements_(elements) {}
    explicit Path(container_type elements) : elements_(std::move(elements)) {}

    /// Parse a canonical string. Returns std::nullopt for malformed input
    /// (empty segments, unknown escapes, stray brackets, bad indices).
    [[nodiscard]] static std::optional<Path> parse(std::string_view canonical);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }
    [[nodiscard]] const PathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const PathElement& front() const { return elements_.front(); }
    [[nodiscard]] const PathElement& back() const { return elements_.back(); }
    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }
    [[nodiscard]] const container_type& elements() const noexcept { return elements_; }

    [[nodiscard]] Path child(PathElement elem) const;

    /// Path without its last segment; the root's parent is the root
    [[nodiscard]] Path parent() const;

    /// Every proper ancestor, root first (the root has none)
    [[nodiscard]] std::vector<Path> ancestors() const;

    /// True when this path equals @p other or is one of its ancestors
    [[nodiscard]] bool is_prefix_of(const Path& other) const;

    bool operator==(const Path& other) const = default;

private:
    container_type elements_;
};

// ============================================================
// Canonical string helpers
//
// These work on canonical strings directly so hot loops (diffing,
// flattening) can extend a path without building Path objects.
// ============================================================

/// Escape a field name for use as one canonical segment
[[nodiscard]] CFGTREE_API std::string escape_field(std::string_view name);

/// Canonical string of @p parent extended by one segment
[[nodiscard]] CFGTREE_API std::string join_path(std::string_view parent, const PathElement& elem);

/// Segment-boundary-aware prefix test: "a.b" has prefix "a" but not "a.b"'s
/// sibling "a.bc". Every path has the root "" as prefix; a path is its own prefix.
[[nodiscard]] CFGTREE_API bool path_has_prefix(std::string_view path, std::string_view prefix) noexcept;

/// Canonical strings of every proper ancestor of @p canonical, root ("") first.
/// Malformed input yields an empty list.
[[nodiscard]] CFGTREE_API std::vector<std::string> ancestor_paths(std::string_view canonical);

/// Build a PathSet from canonical strings
[[nodiscard]] CFGTREE_API PathSet make_path_set(std::initializer_list<std::string> paths);

/// Readable form for logs: "(root)" for the root, the canonical string otherwise
[[nodiscard]] CFGTREE_API std::string path_to_display(std::string_view canonical);

} // namespace cfgtree
