// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patcher.h
/// @brief Single-edit updates of a tree and of its serialized text.
///
/// Structural edits return the new tree, or std::nullopt when the edit is
/// impossible (traversing a leaf, missing intermediate, index past the end,
/// wrong container kind). The message goes to @p error_out.
///
/// Text edits keep every untouched byte of the document. They locate the
/// exact span of the old value and splice the new serialization in; when the
/// span is missing or ambiguous (duplicate keys, text that no longer matches
/// the in-memory tree) they fall back to applying the edit structurally and
/// re-serializing the whole document with its detected indentation. The
/// caller sees one interface either way; PatchResult::strategy reports which
/// tier ran.

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cfgtree {

// ============================================================
// Structural edits
// ============================================================

/// Replace the value at @p path. The last segment may name a new field, or
/// the index one past the end of an array (append). An empty path replaces
/// the root.
[[nodiscard]] CFGTREE_API std::optional<Value> set_value(const Value& root,
                                                         const Path& path,
                                                         Value new_value,
                                                         std::string* error_out = nullptr);

/// Remove a field or an array element (later elements shift down)
[[nodiscard]] CFGTREE_API std::optional<Value> remove_value(const Value& root,
                                                            const Path& path,
                                                            std::string* error_out = nullptr);

/// Insert @p element before position @p index (index == size appends)
[[nodiscard]] CFGTREE_API std::optional<Value> insert_element(const Value& root,
                                                              const Path& array_path,
                                                              std::size_t index,
                                                              Value element,
                                                              std::string* error_out = nullptr);

/// Move the element at @p from so that it ends up at position @p to
[[nodiscard]] CFGTREE_API std::optional<Value> move_element(const Value& root,
                                                            const Path& array_path,
                                                            std::size_t from,
                                                            std::size_t to,
                                                            std::string* error_out = nullptr);

// ============================================================
// Text edits
// ============================================================

enum class PatchStrategy : std::uint8_t {
    Splice,   ///< only the bytes of the edited value changed
    Rebuild,  ///< the document was re-serialized
};

struct PatchResult {
    bool ok = false;
    std::string text;
    PatchStrategy strategy = PatchStrategy::Rebuild;
    std::string error;  ///< set when !ok
};

/// Replace the value at @p path inside serialized @p text.
/// @param tree the in-memory tree @p text is expected to describe; when it
///        differs from the parsed text, the edit is applied to @p tree and
///        the document is rebuilt from it. Without it the text is the source
///        of truth and must parse.
[[nodiscard]] CFGTREE_API PatchResult apply_minimal_edit(std::string_view text,
                                                         const Path& path,
                                                         const Value& new_value,
                                                         const Value* tree = nullptr);

/// Remove the field or element at @p path together with its separator
[[nodiscard]] CFGTREE_API PatchResult apply_minimal_delete(std::string_view text,
                                                           const Path& path,
                                                           const Value* tree = nullptr);

} // namespace cfgtree
