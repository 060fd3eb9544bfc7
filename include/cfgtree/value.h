// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON tree value used for both the current and the original document.
///
/// A Value is one of:
/// - null (std::monostate), bool, integer (int64_t), floating (double), string
/// - object: field name -> Value, insertion order preserved
/// - array:  ordered sequence of Value
///
/// Containers are immer persistent structures, so copying a Value is O(1) and
/// every "mutation" returns a new Value sharing structure with the old one.
/// Integer and floating numbers compare equal when they denote the same number.

#pragma once

#include <cfgtree/cfgtree_config.h>
#include <cfgtree/api.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cfgtree {

// ============================================================
// Diagnostics (compiled out unless CFGTREE_VERBOSE_LOG)
// ============================================================

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CFGTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CFGTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CFGTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_path_error(
    std::string_view func,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if CFGTREE_VERBOSE_LOG
    std::cerr << "[" << func << "] path '" << (path.empty() ? "(root)" : path) << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// ============================================================
// Value kinds
// ============================================================

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Integer,
    Floating,
    String,
    Object,
    Array,
};

[[nodiscard]] constexpr bool is_container_kind(ValueKind kind) noexcept
{
    return kind == ValueKind::Object || kind == ValueKind::Array;
}

[[nodiscard]] constexpr bool is_number_kind(ValueKind kind) noexcept
{
    return kind == ValueKind::Integer || kind == ValueKind::Floating;
}

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::flex_vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

// ============================================================
// BasicObject - insertion-ordered field map
//
// Lookup goes through an immer::map; a parallel flex_vector keeps the
// order in which fields were first inserted, which is the order used
// when the object is written back out. Equality ignores order.
// ============================================================

template <typename MemoryPolicy>
class BasicObject
{
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box  = BasicValueBox<MemoryPolicy>;
    using entry_map  = immer::map<std::string,
                                  value_box,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;
    using key_list   = immer::flex_vector<std::string, MemoryPolicy>;

    BasicObject() = default;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.size() == 0; }

    [[nodiscard]] const value_box* find(const std::string& key) const { return entries_.find(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return entries_.count(key) > 0; }

    /// Field names in insertion order
    [[nodiscard]] const key_list& keys() const noexcept { return order_; }

    /// Field names in lexical order (display and deterministic output)
    [[nodiscard]] std::vector<std::string> sorted_keys() const
    {
        std::vector<std::string> result(order_.begin(), order_.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    /// Replace an existing field in place, or append a new one
    [[nodiscard]] BasicObject set(const std::string& key, value_type val) const
    {
        BasicObject result;
        result.order_ = entries_.count(key) ? order_ : order_.push_back(key);
        result.entries_ = entries_.set(key, value_box{std::move(val)});
        return result;
    }

    /// Remove a field; unknown keys leave the object unchanged
    [[nodiscard]] BasicObject erase(const std::string& key) const
    {
        if (!entries_.count(key)) {
            return *this;
        }
        BasicObject result;
        result.entries_ = entries_.erase(key);
        for (std::size_t i = 0; i < order_.size(); ++i) {
            if (order_[i] == key) {
                result.order_ = order_.erase(i);
                break;
            }
        }
        return result;
    }

    /// Visit fields in insertion order: fn(const std::string&, const value_type&)
    template <typename Fn>
    void for_each(Fn&& fn) const
    {
        for (const auto& key : order_) {
            if (const auto* box = entries_.find(key)) {
                fn(key, box->get());
            }
        }
    }

    bool operator==(const BasicObject& other) const
    {
        if (entries_.size() != other.entries_.size()) {
            return false;
        }
        for (const auto& [key, val_box] : entries_) {
            const auto* rhs = other.entries_.find(key);
            if (!rhs || !(val_box.get() == rhs->get())) {
                return false;
            }
        }
        return true;
    }

private:
    entry_map entries_;
    key_list order_;
};

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_object  = BasicObject<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;

    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 value_object,
                 value_array,
                 std::monostate>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}
    BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    BasicValue(int64_t v) noexcept : data(v) {}
    BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_object v) : data(std::move(v)) {}
    BasicValue(value_array v) : data(std::move(v)) {}

    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init = {})
    {
        value_object obj;
        for (const auto& [key, val] : init) {
            obj = obj.set(key, val);
        }
        return BasicValue{std::move(obj)};
    }

    static BasicValue array(std::initializer_list<BasicValue> init = {})
    {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept
    {
        switch (data.index()) {
            case 0: return ValueKind::Bool;
            case 1: return ValueKind::Integer;
            case 2: return ValueKind::Floating;
            case 3: return ValueKind::String;
            case 4: return ValueKind::Object;
            case 5: return ValueKind::Array;
            default: return ValueKind::Null;
        }
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

    [[nodiscard]] const value_object* as_object() const { return get_if<value_object>(); }
    [[nodiscard]] const value_array* as_array() const { return get_if<value_array>(); }

    [[nodiscard]] double as_number(double default_val = 0.0) const
    {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const
    {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const
    {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    /// Child lookup that distinguishes "absent" (nullptr) from an explicit null
    [[nodiscard]] const BasicValue* find(const std::string& key) const
    {
        if (auto* o = as_object()) {
            if (auto* box = o->find(key)) return &box->get();
        }
        return nullptr;
    }

    [[nodiscard]] const BasicValue* find(std::size_t index) const
    {
        if (auto* a = as_array()) {
            if (index < a->size()) return &(*a)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const
    {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const
    {
        if (auto* found = find(index)) return *found;
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }
    [[nodiscard]] bool contains(std::size_t index) const { return find(index) != nullptr; }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const
    {
        if (auto* o = as_object()) return o->set(key, std::move(val));
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const
    {
        if (auto* a = as_array()) {
            if (index < a->size()) return a->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-array type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const
    {
        if (auto* a = as_array()) return a->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot append to non-array type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const
    {
        if (auto* o = as_object()) return o->size();
        if (auto* a = as_array()) return a->size();
        return 0;
    }
};

// ============================================================
// Default Value type
//
// Only the thread-safe (default) immer policy is instantiated: diffs of
// independent documents may run on worker threads while the session keeps
// sharing nodes with them.
// ============================================================

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = BasicValueBox<immer::default_memory_policy>;
using ValueObject = BasicObject<immer::default_memory_policy>;
using ValueArray  = BasicValueArray<immer::default_memory_policy>;

// ============================================================
// Comparison
// ============================================================

/// Structural equality. Numbers compare by numeric value (1 == 1.0),
/// objects ignore field order, arrays compare element-wise.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    if (a.is_number() && b.is_number() && a.data.index() != b.data.index()) {
        return a.as_number() == b.as_number();
    }
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable rendering (compact JSON for containers)
[[nodiscard]] CFGTREE_API std::string value_to_string(const Value& val);

/// Name of a value kind ("null", "bool", "number", "string", "object", "array")
[[nodiscard]] CFGTREE_API std::string_view kind_name(ValueKind kind) noexcept;

// Instantiated once in value.cpp
extern template class BasicObject<immer::default_memory_policy>;
extern template struct BasicValue<immer::default_memory_policy>;

} // namespace cfgtree
