// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <cfgtree/sparse.h>
#include <cfgtree/path_utils.h>

#include <algorithm>
#include <optional>

namespace cfgtree {

namespace {

/// Filler for untouched array slots and fresh intermediates
Value placeholder()
{
    return Value::object();
}

[[nodiscard]] bool is_empty_object(const Value& val)
{
    auto* obj = val.as_object();
    return obj && obj->empty();
}

/// Copy @p leaf into @p dest at path[depth..], creating skeleton on the way.
/// Returns std::nullopt when @p dest already holds something of the other
/// container kind at a level the path needs.
std::optional<Value> place(const Value& dest, const Path& path, std::size_t depth, const Value& leaf)
{
    if (depth == path.size()) {
        return leaf;
    }

    const PathElement& elem = path[depth];

    if (auto* key = std::get_if<std::string>(&elem)) {
        if (!dest.is_object()) {
            return std::nullopt;
        }
        const Value* existing = dest.find(*key);
        auto sub = place(existing ? *existing : placeholder(), path, depth + 1, leaf);
        if (!sub) return std::nullopt;
        return dest.set(*key, std::move(*sub));
    }

    const std::size_t index = std::get<std::size_t>(elem);
    Value arr = dest;
    if (is_empty_object(dest)) {
        arr = Value::array();
    } else if (!dest.is_array()) {
        return std::nullopt;
    }

    if (arr.size() <= index) {
        auto t = arr.as_array()->transient();
        while (t.size() <= index) {
            t.push_back(ValueBox{placeholder()});
        }
        arr = Value{t.persistent()};
    }

    auto sub = place(*arr.find(index), path, depth + 1, leaf);
    if (!sub) return std::nullopt;
    return arr.set(index, std::move(*sub));
}

} // anonymous namespace

Value reconstruct_sparse(const Value& current, const PathSet& edited, std::vector<std::string>* skipped_out)
{
    // Sorted so a container edit is placed before the edits below it
    std::vector<std::string> ordered(edited.begin(), edited.end());
    std::sort(ordered.begin(), ordered.end());

    auto skip = [&](const std::string& canonical, std::string_view reason) {
        detail::log_path_error("reconstruct_sparse", canonical, reason);
        if (skipped_out) skipped_out->push_back(canonical);
    };

    Value result = Value::object();
    std::vector<Path> placed;
    for (const auto& canonical : ordered) {
        auto path = Path::parse(canonical);
        if (!path) {
            skip(canonical, "is malformed; skipped");
            continue;
        }

        const Value* source = find_at_path(current, *path);
        if (!source) {
            skip(canonical, "does not resolve in the current document; skipped");
            continue;
        }

        // Already copied whole with an edited ancestor
        const bool covered = std::any_of(placed.begin(), placed.end(),
                                         [&](const Path& done) { return done.is_prefix_of(*path); });
        if (covered) {
            continue;
        }

        auto value = place(result, *path, 0, *source);
        if (!value) {
            skip(canonical, "conflicts with skeleton already placed; skipped");
            continue;
        }
        result = std::move(*value);
        placed.push_back(std::move(*path));
    }
    return result;
}

} // namespace cfgtree
