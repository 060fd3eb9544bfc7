// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value conversion.
///
/// Usage:
/// @code
///   std::string error;
///   auto doc = parse_json(text, &error);
///   if (!doc) { report(error); }
///
///   JsonWriteOptions opts;
///   opts.indent = detect_indentation(text);
///   opts.sort_keys = true;
///   std::string out = to_json(*doc, opts);
/// @endcode
///
/// Objects are written in insertion order unless sort_keys is set. Integers
/// are written without a fraction; floating values always carry one ("2.0")
/// so a re-parse yields the same kind.

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace cfgtree {

// ============================================================
// Writing
// ============================================================

struct JsonWriteOptions {
    bool compact = false;       ///< single line, no spaces
    std::string indent = "  "; ///< one indentation level when not compact
    bool sort_keys = false;     ///< lexical field order instead of insertion order
};

[[nodiscard]] CFGTREE_API std::string to_json(const Value& val, const JsonWriteOptions& options = {});

/// Shorthand: compact or two-space pretty output in insertion order
[[nodiscard]] CFGTREE_API std::string to_json(const Value& val, bool compact);

/// Escape a string body for a JSON string literal (no surrounding quotes)
[[nodiscard]] CFGTREE_API std::string json_escape_string(std::string_view s);

// ============================================================
// Reading
// ============================================================

/// Parse a complete JSON document.
/// @param error_out receives a message with the byte offset on failure
/// @return the parsed value, or std::nullopt when the text is not valid JSON
[[nodiscard]] CFGTREE_API std::optional<Value> parse_json(std::string_view text,
                                                          std::string* error_out = nullptr);

/// Like parse_json, but yields a null Value on failure
[[nodiscard]] CFGTREE_API Value from_json(std::string_view text, std::string* error_out = nullptr);

/// Indentation unit used by a pretty-printed document: a tab, or the leading
/// spaces of the first indented line. Defaults to two spaces.
[[nodiscard]] CFGTREE_API std::string detect_indentation(std::string_view text);

} // namespace cfgtree
