// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sparse.h
/// @brief Minimal document holding only a set of edited paths.
///
/// Used when saving a document that was deleted upstream: only the fields the
/// user explicitly restored or edited are persisted, inside just enough
/// skeleton (intermediate objects and arrays) to keep them at their paths.
///
/// Array slots below an edited index that nobody edited are filled with empty
/// objects so indices stay aligned:
///
/// @code
///   current: {"items": ["x", "y", "z"]}
///   edited:  {"items.[1]"}
///   result:  {"items": [{}, "y"]}
/// @endcode

#pragma once

#include <cfgtree/api.h>
#include <cfgtree/path.h>
#include <cfgtree/value.h>

#include <string>
#include <vector>

namespace cfgtree {

/// Build the sparse document for @p edited from @p current.
///
/// Paths that are malformed or do not resolve in @p current (index out of
/// range, segment through a leaf) are skipped one by one; the rest are still
/// placed. When nothing resolves the result is an empty object. The edited
/// root ("") copies @p current whole.
///
/// @param skipped_out receives the canonical strings of skipped paths
[[nodiscard]] CFGTREE_API Value reconstruct_sparse(const Value& current,
                                                   const PathSet& edited,
                                                   std::vector<std::string>* skipped_out = nullptr);

} // namespace cfgtree
