// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// patcher.cpp - structural single-value edits

#include <cfgtree/patcher.h>
#include <cfgtree/path_utils.h>

namespace cfgtree {

namespace {

std::optional<Value> fail(std::string* error_out, const Path& path, std::string_view reason)
{
    std::string message = "cannot edit '" + path_to_display(path.to_string()) + "': " + std::string(reason);
    if (error_out) *error_out = message;
    detail::log_access_error("patcher", message);
    return std::nullopt;
}

/// Rebuild the spine from @p depth down, applying @p leaf_op to the parent
/// of the final segment. leaf_op(parent, last_elem) -> optional<Value>.
template <typename LeafOp>
std::optional<Value> rewrite(const Value& node, const Path& path, std::size_t depth,
                             LeafOp&& leaf_op, std::string* error_out)
{
    const PathElement& elem = path[depth];
    if (depth + 1 == path.size()) {
        return leaf_op(node, elem);
    }

    if (auto* key = std::get_if<std::string>(&elem)) {
        if (!node.is_object()) return fail(error_out, path, "segment '" + *key + "' traverses a non-object");
        const Value* child = node.find(*key);
        if (!child) return fail(error_out, path, "field '" + *key + "' does not exist");
        auto sub = rewrite(*child, path, depth + 1, leaf_op, error_out);
        if (!sub) return std::nullopt;
        return node.set(*key, std::move(*sub));
    }

    const std::size_t index = std::get<std::size_t>(elem);
    if (!node.is_array()) return fail(error_out, path, "index [" + std::to_string(index) + "] traverses a non-array");
    const Value* child = node.find(index);
    if (!child) return fail(error_out, path, "index [" + std::to_string(index) + "] is out of range");
    auto sub = rewrite(*child, path, depth + 1, leaf_op, error_out);
    if (!sub) return std::nullopt;
    return node.set(index, std::move(*sub));
}

} // anonymous namespace

std::optional<Value> set_value(const Value& root, const Path& path, Value new_value, std::string* error_out)
{
    if (path.empty()) {
        return new_value;
    }
    return rewrite(root, path, 0, [&](const Value& parent, const PathElement& elem) -> std::optional<Value> {
        if (auto* key = std::get_if<std::string>(&elem)) {
            if (!parent.is_object()) return fail(error_out, path, "parent is not an object");
            return parent.set(*key, new_value);
        }
        const std::size_t index = std::get<std::size_t>(elem);
        if (!parent.is_array()) return fail(error_out, path, "parent is not an array");
        if (index < parent.size()) return parent.set(index, new_value);
        if (index == parent.size()) return parent.push_back(new_value);
        return fail(error_out, path, "index is past the end of the array");
    }, error_out);
}

std::optional<Value> remove_value(const Value& root, const Path& path, std::string* error_out)
{
    if (path.empty()) {
        return fail(error_out, path, "the root cannot be removed");
    }
    return rewrite(root, path, 0, [&](const Value& parent, const PathElement& elem) -> std::optional<Value> {
        if (auto* key = std::get_if<std::string>(&elem)) {
            auto* obj = parent.as_object();
            if (!obj) return fail(error_out, path, "parent is not an object");
            if (!obj->contains(*key)) return fail(error_out, path, "field does not exist");
            return Value{obj->erase(*key)};
        }
        const std::size_t index = std::get<std::size_t>(elem);
        auto* arr = parent.as_array();
        if (!arr) return fail(error_out, path, "parent is not an array");
        if (index >= arr->size()) return fail(error_out, path, "index is out of range");
        return Value{arr->erase(index)};
    }, error_out);
}

std::optional<Value> insert_element(const Value& root, const Path& array_path, std::size_t index,
                                    Value element, std::string* error_out)
{
    const Value* target = find_at_path(root, array_path);
    if (!target) return fail(error_out, array_path, "path does not resolve");
    auto* arr = target->as_array();
    if (!arr) return fail(error_out, array_path, "target is not an array");
    if (index > arr->size()) return fail(error_out, array_path, "insert position is past the end");
    return set_value(root, array_path, Value{arr->insert(index, ValueBox{std::move(element)})}, error_out);
}

std::optional<Value> move_element(const Value& root, const Path& array_path, std::size_t from,
                                  std::size_t to, std::string* error_out)
{
    const Value* target = find_at_path(root, array_path);
    if (!target) return fail(error_out, array_path, "path does not resolve");
    auto* arr = target->as_array();
    if (!arr) return fail(error_out, array_path, "target is not an array");
    if (from >= arr->size() || to >= arr->size()) return fail(error_out, array_path, "move position is out of range");
    if (from == to) return root;

    ValueBox moved = (*arr)[from];
    auto without = arr->erase(from);
    return set_value(root, array_path, Value{without.insert(to, std::move(moved))}, error_out);
}

} // namespace cfgtree
