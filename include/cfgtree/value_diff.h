// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Change classification of a current tree against an original tree.
///
/// The result is a sparse ChangeMap: canonical path -> Added | Modified | Deleted.
/// A path without an entry is unchanged.
///
/// Plain rules (compare):
/// - leaf present on both sides with different values -> Modified
/// - container present on both sides -> not recorded, children are compared
/// - present only in current -> leaves Added, containers not recorded
/// - present only in original -> the path and every path below it Deleted
///
/// Hybrid rules (compare_hybrid), for documents that were added or deleted
/// as a whole: edited paths and everything below them follow the plain
/// rules; every other current path, leaf or container, takes the document
/// status; original-only paths are always Deleted.
///
/// The root itself ("") is never recorded.

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>

#include <immer/map.hpp>
#include <immer/map_transient.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cfgtree {

enum class ChangeKind : std::uint8_t {
    Added,
    Modified,
    Deleted,
};

/// Version-control status of a whole document
enum class DocumentStatus : std::uint8_t {
    Unchanged,
    Added,
    Modified,
    Deleted,
};

[[nodiscard]] CFGTREE_API std::string_view to_string(ChangeKind kind) noexcept;
[[nodiscard]] CFGTREE_API std::string_view to_string(DocumentStatus status) noexcept;

// ============================================================
// ChangeMap
// ============================================================

class CFGTREE_API ChangeMap {
public:
    using map_type = immer::map<std::string, ChangeKind>;

    ChangeMap() = default;
    explicit ChangeMap(map_type entries) : entries_(std::move(entries)) {}

    [[nodiscard]] std::optional<ChangeKind> find(const std::string& path) const
    {
        if (auto* kind = entries_.find(path)) return *kind;
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const std::string& path) const { return entries_.count(path) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.size() == 0; }
    [[nodiscard]] const map_type& entries() const noexcept { return entries_; }

    /// Number of entries with the given classification
    [[nodiscard]] std::size_t count(ChangeKind kind) const;

    /// Badge count shown to the user: Added + Modified
    [[nodiscard]] std::size_t changed_field_count() const;

    /// All recorded paths in lexical order
    [[nodiscard]] std::vector<std::string> sorted_paths() const;

    bool operator==(const ChangeMap& other) const = default;

private:
    map_type entries_;
};

// ============================================================
// ChangeCollector
//
// Walks the union of both trees once, extending the current path
// string as it descends, and records classifications into a transient
// map that is frozen into the ChangeMap at the end.
// ============================================================

class CFGTREE_API ChangeCollector {
private:
    ChangeMap::map_type::transient_type changes_ = ChangeMap::map_type{}.transient();
    ChangeMap result_;
    DocumentStatus status_ = DocumentStatus::Unchanged;
    PathSet edited_;

    void record(const std::string& path, ChangeKind kind);
    void diff_node(const Value* current, const Value* original, const std::string& path);
    void hybrid_node(const Value* current, const Value* original, const std::string& path);
    void collect_deleted(const Value& original, const std::string& path);

    /// True when @p path is an edited path or lies below one
    [[nodiscard]] bool is_edited(const std::string& path) const;

public:
    /// Plain diff. A null @p original is treated as an empty document.
    void compare(const Value& current, const Value* original);

    /// Hybrid diff. Status Added or Deleted overlays non-edited paths;
    /// any other status falls back to the plain diff.
    void compare_hybrid(const Value& current,
                        const Value* original,
                        DocumentStatus status,
                        const PathSet& edited_paths);

    [[nodiscard]] const ChangeMap& result() const { return result_; }
    [[nodiscard]] bool has_changes() const { return !result_.empty(); }
    void clear();
};

/// Plain diff of @p current against @p original (nullptr = no original)
[[nodiscard]] CFGTREE_API ChangeMap compare(const Value& current, const Value* original);

/// Hybrid diff blending a whole-document status with per-field diffs
[[nodiscard]] CFGTREE_API ChangeMap compare_hybrid(const Value& current,
                                                   const Value* original,
                                                   DocumentStatus status,
                                                   const PathSet& edited_paths);

} // namespace cfgtree
