// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Fluent builders for object and array Values.
///
/// @code
///   Value doc = ObjectBuilder()
///       .set("locale", "en")
///       .set("strings", ArrayBuilder().push_back("Yes").push_back("No").finish())
///       .finish();
/// @endcode
///
/// ArrayBuilder appends through an immer transient, so building n elements is
/// O(n). ObjectBuilder preserves the order in which fields were first set.

#pragma once

#include "value.h"

namespace cfgtree {

template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_object = BasicObject<MemoryPolicy>;

    BasicObjectBuilder() = default;

    /// Start from the fields of an existing object (other kinds start empty)
    explicit BasicObjectBuilder(const value_type& existing)
    {
        if (auto* o = existing.as_object()) object_ = *o;
    }

    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    BasicObjectBuilder& set(const std::string& key, value_type val)
    {
        object_ = object_.set(key, std::move(val));
        return *this;
    }

    BasicObjectBuilder& erase(const std::string& key)
    {
        object_ = object_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return object_.contains(key); }
    [[nodiscard]] std::size_t size() const { return object_.size(); }

    [[nodiscard]] value_type finish() { return value_type{std::move(object_)}; }

private:
    value_object object_;
};

template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_array    = BasicValueArray<MemoryPolicy>;
    using transient_type = typename value_array::transient_type;

    BasicArrayBuilder() : transient_(value_array{}.transient()) {}

    explicit BasicArrayBuilder(const value_type& existing)
        : transient_(existing.is_array()
            ? existing.as_array()->transient()
            : value_array{}.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    BasicArrayBuilder& push_back(value_type val)
    {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    /// Replace an element; out-of-range indices are ignored
    BasicArrayBuilder& set(std::size_t index, value_type val)
    {
        if (index < transient_.size()) {
            transient_.set(index, value_box{std::move(val)});
        } else {
            detail::log_index_error("ArrayBuilder::set", index, "out of range");
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] value_type finish() { return value_type{transient_.persistent()}; }

private:
    transient_type transient_;
};

using ObjectBuilder = BasicObjectBuilder<immer::default_memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<immer::default_memory_policy>;

} // namespace cfgtree
