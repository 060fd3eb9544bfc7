// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value instantiation and utilities

#include <cfgtree/serialization.h>
#include <cfgtree/value.h>

namespace cfgtree {

// ============================================================
// Explicit Template Instantiations
// ============================================================

template class BasicObject<immer::default_memory_policy>;
template struct BasicValue<immer::default_memory_policy>;

// ============================================================
// Utility functions
// ============================================================

std::string value_to_string(const Value& val)
{
    return to_json(val, true);
}

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:     return "null";
        case ValueKind::Bool:     return "bool";
        case ValueKind::Integer:
        case ValueKind::Floating: return "number";
        case ValueKind::String:   return "string";
        case ValueKind::Object:   return "object";
        case ValueKind::Array:    return "array";
    }
    return "unknown";
}

} // namespace cfgtree
