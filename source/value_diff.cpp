// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_diff.cpp - plain and hybrid change classification

#include <cfgtree/value_diff.h>

#include <algorithm>

namespace cfgtree {

std::string_view to_string(ChangeKind kind) noexcept
{
    switch (kind) {
        case ChangeKind::Added:    return "added";
        case ChangeKind::Modified: return "modified";
        case ChangeKind::Deleted:  return "deleted";
    }
    return "unknown";
}

std::string_view to_string(DocumentStatus status) noexcept
{
    switch (status) {
        case DocumentStatus::Unchanged: return "unchanged";
        case DocumentStatus::Added:     return "added";
        case DocumentStatus::Modified:  return "modified";
        case DocumentStatus::Deleted:   return "deleted";
    }
    return "unknown";
}

// ============================================================
// ChangeMap
// ============================================================

std::size_t ChangeMap::count(ChangeKind kind) const
{
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [kind](const auto& entry) { return entry.second == kind; }));
}

std::size_t ChangeMap::changed_field_count() const
{
    return count(ChangeKind::Added) + count(ChangeKind::Modified);
}

std::vector<std::string> ChangeMap::sorted_paths() const
{
    std::vector<std::string> paths;
    paths.reserve(entries_.size());
    for (const auto& entry : entries_) {
        paths.push_back(entry.first);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// ============================================================
// Child enumeration over the union of two trees
// ============================================================

namespace {

[[nodiscard]] const Value* child_of(const Value* parent, const PathElement& elem)
{
    if (!parent) return nullptr;
    if (auto* key = std::get_if<std::string>(&elem)) return parent->find(*key);
    return parent->find(std::get<std::size_t>(elem));
}

/// Calls fn(elem, current_child, original_child) for every child of either
/// side. Children of a container whose counterpart has another kind are
/// reported with a null partner.
template <typename Fn>
void for_each_child(const Value* current, const Value* original, Fn&& fn)
{
    auto visit_side = [](const Value* side, auto&& visit) {
        if (!side) return;
        if (auto* obj = side->as_object()) {
            obj->for_each([&](const std::string& key, const Value&) { visit(PathElement{key}); });
        } else if (auto* arr = side->as_array()) {
            for (std::size_t i = 0; i < arr->size(); ++i) visit(PathElement{i});
        }
    };

    visit_side(current, [&](const PathElement& elem) {
        fn(elem, child_of(current, elem), child_of(original, elem));
    });
    visit_side(original, [&](const PathElement& elem) {
        if (!child_of(current, elem)) {
            fn(elem, nullptr, child_of(original, elem));
        }
    });
}

} // anonymous namespace

// ============================================================
// ChangeCollector
// ============================================================

void ChangeCollector::record(const std::string& path, ChangeKind kind)
{
    if (path.empty()) {
        return;
    }
    changes_.set(path, kind);
}

void ChangeCollector::collect_deleted(const Value& original, const std::string& path)
{
    record(path, ChangeKind::Deleted);
    for_each_child(nullptr, &original, [&](const PathElement& elem, const Value*, const Value* orig) {
        collect_deleted(*orig, join_path(path, elem));
    });
}

void ChangeCollector::diff_node(const Value* current, const Value* original, const std::string& path)
{
    if (!current) {
        if (original) collect_deleted(*original, path);
        return;
    }

    if (original && *current == *original) {
        return;
    }

    if (current->is_container()) {
        // Containers are never recorded themselves; only what changed below them.
        for_each_child(current, original, [&](const PathElement& elem, const Value* cur, const Value* orig) {
            diff_node(cur, orig, join_path(path, elem));
        });
        return;
    }

    if (!original) {
        record(path, ChangeKind::Added);
        return;
    }

    record(path, ChangeKind::Modified);
    // A container replaced by a leaf: everything that lived below it is gone.
    for_each_child(nullptr, original, [&](const PathElement& elem, const Value*, const Value* orig) {
        collect_deleted(*orig, join_path(path, elem));
    });
}

bool ChangeCollector::is_edited(const std::string& path) const
{
    return std::any_of(edited_.begin(), edited_.end(),
                       [&path](const std::string& edited) { return path_has_prefix(path, edited); });
}

void ChangeCollector::hybrid_node(const Value* current, const Value* original, const std::string& path)
{
    if (is_edited(path)) {
        diff_node(current, original, path);
        return;
    }
    if (!current) {
        if (original) collect_deleted(*original, path);
        return;
    }

    record(path, status_ == DocumentStatus::Added ? ChangeKind::Added : ChangeKind::Deleted);
    for_each_child(current, original, [&](const PathElement& elem, const Value* cur, const Value* orig) {
        hybrid_node(cur, orig, join_path(path, elem));
    });
}

void ChangeCollector::compare(const Value& current, const Value* original)
{
    clear();
    diff_node(&current, original, std::string{});
    result_ = ChangeMap{changes_.persistent()};
}

void ChangeCollector::compare_hybrid(const Value& current,
                                     const Value* original,
                                     DocumentStatus status,
                                     const PathSet& edited_paths)
{
    if (status != DocumentStatus::Added && status != DocumentStatus::Deleted) {
        compare(current, original);
        return;
    }
    clear();
    status_ = status;
    edited_ = edited_paths;
    hybrid_node(&current, original, std::string{});
    result_ = ChangeMap{changes_.persistent()};
}

void ChangeCollector::clear()
{
    changes_ = ChangeMap::map_type{}.transient();
    result_ = ChangeMap{};
    status_ = DocumentStatus::Unchanged;
    edited_ = PathSet{};
}

// ============================================================
// Free functions
// ============================================================

ChangeMap compare(const Value& current, const Value* original)
{
    ChangeCollector collector;
    collector.compare(current, original);
    return collector.result();
}

ChangeMap compare_hybrid(const Value& current,
                         const Value* original,
                         DocumentStatus status,
                         const PathSet& edited_paths)
{
    ChangeCollector collector;
    collector.compare_hybrid(current, original, status, edited_paths);
    return collector.result();
}

} // namespace cfgtree
