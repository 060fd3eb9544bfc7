// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <cfgtree/path_utils.h>

namespace cfgtree {

const Value* find_at_path(const Value& root, const Path& path)
{
    const Value* node = &root;
    for (const auto& elem : path) {
        node = find_child(*node, elem);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}

std::optional<Value> get_at_path(const Value& root, std::string_view canonical)
{
    auto parsed = Path::parse(canonical);
    if (!parsed) {
        detail::log_path_error("get_at_path", canonical, "is malformed");
        return std::nullopt;
    }
    if (auto* found = find_at_path(root, *parsed)) {
        return *found;
    }
    return std::nullopt;
}

} // namespace cfgtree
