// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// flatten.cpp - visible-row projection and expansion bookkeeping

#include <cfgtree/flatten.h>

#include <algorithm>
#include <vector>

namespace cfgtree {

std::string node_type_label(const FlattenedNode& node)
{
    switch (node.kind) {
        case ValueKind::Object:
            return "object (" + std::to_string(node.child_count) +
                   (node.child_count == 1 ? " key)" : " keys)");
        case ValueKind::Array:
            return "array (" + std::to_string(node.child_count) +
                   (node.child_count == 1 ? " item)" : " items)");
        default:
            return std::string{kind_name(node.kind)};
    }
}

// ============================================================
// ExpansionState
// ============================================================

bool ExpansionState::is_expanded(const std::string& path) const
{
    if (search_expanded.count(path)) {
        return true;
    }
    return expanded.count(path) && !manually_collapsed.count(path);
}

ExpansionState ExpansionState::expand(const std::string& path) const
{
    ExpansionState next = *this;
    next.expanded = expanded.insert(path);
    next.manually_collapsed = manually_collapsed.erase(path);
    return next;
}

ExpansionState ExpansionState::collapse(const std::string& path) const
{
    ExpansionState next = *this;
    next.expanded = expanded.erase(path);
    next.manually_collapsed = manually_collapsed.insert(path);
    return next;
}

ExpansionState ExpansionState::toggle(const std::string& path) const
{
    const bool open = expanded.count(path) && !manually_collapsed.count(path);
    return open ? collapse(path) : expand(path);
}

// ============================================================
// Inventories
// ============================================================

namespace {

void collect_containers(const Value& val, const std::string& path, PathSet& out)
{
    if (!val.is_container()) {
        return;
    }
    out = std::move(out).insert(path);
    if (auto* obj = val.as_object()) {
        obj->for_each([&](const std::string& key, const Value& child) {
            collect_containers(child, join_path(path, PathElement{key}), out);
        });
    } else if (auto* arr = val.as_array()) {
        for (std::size_t i = 0; i < arr->size(); ++i) {
            collect_containers((*arr)[i].get(), join_path(path, PathElement{i}), out);
        }
    }
}

[[nodiscard]] bool is_top_level(const std::string& path)
{
    auto parsed = Path::parse(path);
    return parsed && parsed->size() <= 1;
}

} // anonymous namespace

PathSet collect_container_paths(const Value& current, const Value* original)
{
    PathSet result;
    collect_containers(current, std::string{}, result);
    if (original) {
        collect_containers(*original, std::string{}, result);
    }
    return result;
}

ExpansionState expand_all(const ExpansionState& state, const PathSet& inventory)
{
    ExpansionState next = state;
    next.expanded = inventory;
    next.manually_collapsed = PathSet{};
    return next;
}

ExpansionState collapse_all_except_root(const ExpansionState& state, const PathSet& inventory)
{
    ExpansionState next = state;
    PathSet open;
    PathSet closed;
    for (const auto& path : inventory) {
        if (is_top_level(path)) {
            open = std::move(open).insert(path);
        } else {
            closed = std::move(closed).insert(path);
        }
    }
    next.expanded = std::move(open);
    next.manually_collapsed = std::move(closed);
    return next;
}

PathSet paths_to_expand(std::string_view target)
{
    PathSet result;
    for (auto& ancestor : ancestor_paths(target)) {
        result = std::move(result).insert(std::move(ancestor));
    }
    return result;
}

PathSet changed_paths_with_ancestors(const ChangeMap& changes)
{
    PathSet result;
    for (const auto& [path, kind] : changes.entries()) {
        result = std::move(result).insert(path);
        for (auto& ancestor : ancestor_paths(path)) {
            result = std::move(result).insert(std::move(ancestor));
        }
    }
    return result;
}

// ============================================================
// Flattening
// ============================================================

namespace {

class Flattener {
public:
    Flattener(const ChangeMap& changes, const ExpansionState& expansion, const FlattenOptions& options)
        : changes_(changes), expansion_(expansion), options_(options), rows_(NodeList{}.transient())
    {
    }

    void visit_children(const Value* current, const Value* original, const std::string& path, std::size_t depth)
    {
        const Value* shape = current ? current : original;
        const ParentKind parent_kind = depth == 0 ? ParentKind::Root
                                     : shape->is_array() ? ParentKind::Array
                                                         : ParentKind::Object;

        for (const auto& elem : child_elements(current, original)) {
            const Value* cur = child_of(current, elem);
            const Value* orig = child_of(original, elem);
            const Value& val = cur ? *cur : *orig;

            std::string child_path = join_path(path, elem);
            if (options_.keep_only && !options_.keep_only->count(child_path)) {
                continue;
            }

            FlattenedNode node;
            node.label = label_of(elem);
            node.value = val;
            node.depth = depth;
            node.parent_kind = parent_kind;
            node.kind = val.kind();
            node.child_count = val.size();
            node.expanded = val.is_container() && expansion_.is_expanded(child_path);
            node.is_current_match = options_.current_match && *options_.current_match == child_path;
            node.change = changes_.find(child_path);
            node.id = child_path;

            const bool descend = node.expanded;
            rows_.push_back(std::move(node));
            if (descend) {
                visit_children(cur, orig, child_path, depth + 1);
            }
        }
    }

    NodeList finish() { return rows_.persistent(); }

private:
    const ChangeMap& changes_;
    const ExpansionState& expansion_;
    const FlattenOptions& options_;
    NodeList::transient_type rows_;

    static const Value* child_of(const Value* parent, const PathElement& elem)
    {
        if (!parent) return nullptr;
        if (auto* key = std::get_if<std::string>(&elem)) return parent->find(*key);
        return parent->find(std::get<std::size_t>(elem));
    }

    static std::string label_of(const PathElement& elem)
    {
        if (auto* key = std::get_if<std::string>(&elem)) return *key;
        return "[" + std::to_string(std::get<std::size_t>(elem)) + "]";
    }

    /// Union of both sides' children: field names sorted, then indices ascending
    static std::vector<PathElement> child_elements(const Value* current, const Value* original)
    {
        std::vector<PathElement> elems;
        auto add_side = [&elems](const Value* side) {
            if (!side) return;
            if (auto* obj = side->as_object()) {
                for (const auto& key : obj->keys()) elems.emplace_back(key);
            } else if (auto* arr = side->as_array()) {
                for (std::size_t i = 0; i < arr->size(); ++i) elems.emplace_back(i);
            }
        };
        add_side(current);
        add_side(original);
        std::sort(elems.begin(), elems.end());
        elems.erase(std::unique(elems.begin(), elems.end()), elems.end());
        return elems;
    }
};

} // anonymous namespace

NodeList flatten(const Value& current,
                 const Value* original,
                 const ChangeMap& changes,
                 const ExpansionState& expansion,
                 const FlattenOptions& options)
{
    if (!expansion.is_expanded(std::string{})) {
        return {};
    }
    Flattener flattener(changes, expansion, options);
    flattener.visit_children(&current, original, std::string{}, 0);
    return flattener.finish();
}

} // namespace cfgtree
