// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macros for the cfgtree library.
///
/// - Shared build: CMake defines CFGTREE_SHARED (public) and CFGTREE_EXPORTS
///   (private to the library target). Anything marked CFGTREE_API is exported.
/// - Consumers of a shared build only see CFGTREE_SHARED and import the symbols.
/// - Static build: neither macro is defined and CFGTREE_API is empty.
///
/// @code
/// class CFGTREE_API DocumentSession { ... };
/// CFGTREE_API ChangeMap compare(const Value& current, const Value* original);
/// @endcode

#pragma once

// ============================================================
// Export / Import
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CFGTREE_SHARED
        #ifdef CFGTREE_EXPORTS
            #define CFGTREE_API __declspec(dllexport)
        #else
            #define CFGTREE_API __declspec(dllimport)
        #endif
    #else
        #define CFGTREE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CFGTREE_SHARED) && defined(CFGTREE_EXPORTS)
        #define CFGTREE_API __attribute__((visibility("default")))
    #else
        #define CFGTREE_API
    #endif
#else
    #define CFGTREE_API
#endif
