// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// path.cpp
// Canonical path strings: escaping, parsing and prefix queries

#include <cfgtree/path.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace cfgtree {

namespace {

constexpr std::string_view kEmptyFieldMarker = "\\_";

[[nodiscard]] bool is_escapable(char c) noexcept
{
    return c == '.' || c == '[' || c == ']' || c == '\\';
}

/// Split on unescaped '.'; escape sequences are kept verbatim
std::vector<std::string_view> split_segments(std::string_view canonical)
{
    std::vector<std::string_view> raw;
    std::size_t start = 0;
    for (std::size_t i = 0; i < canonical.size(); ++i) {
        if (canonical[i] == '\\') {
            ++i;  // the escaped character never splits
            continue;
        }
        if (canonical[i] == '.') {
            raw.push_back(canonical.substr(start, i - start));
            start = i + 1;
        }
    }
    raw.push_back(canonical.substr(start));
    return raw;
}

std::optional<PathElement> decode_segment(std::string_view raw)
{
    if (raw.empty()) {
        return std::nullopt;
    }
    if (raw == kEmptyFieldMarker) {
        return PathElement{std::string{}};
    }

    if (raw.front() == '[') {
        if (raw.size() < 3 || raw.back() != ']') {
            return std::nullopt;
        }
        auto digits = raw.substr(1, raw.size() - 2);
        if (!std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        std::size_t index = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
        return PathElement{index};
    }

    std::string name;
    name.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\') {
            if (i + 1 >= raw.size() || !is_escapable(raw[i + 1])) {
                return std::nullopt;
            }
            name += raw[++i];
        } else if (c == '[' || c == ']') {
            return std::nullopt;
        } else {
            name += c;
        }
    }
    return PathElement{std::move(name)};
}

void append_segment(std::string& out, const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        out += escape_field(*key);
    } else {
        out += '[';
        out += std::to_string(std::get<std::size_t>(elem));
        out += ']';
    }
}

} // anonymous namespace

// ============================================================
// Path
// ============================================================

std::optional<Path> Path::parse(std::string_view canonical)
{
    Path result;
    if (canonical.empty()) {
        return result;
    }
    for (auto raw : split_segments(canonical)) {
        auto elem = decode_segment(raw);
        if (!elem) {
            return std::nullopt;
        }
        result.elements_.push_back(std::move(*elem));
    }
    return result;
}

std::string Path::to_string() const
{
    std::string out;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) out += '.';
        append_segment(out, elements_[i]);
    }
    return out;
}

Path Path::child(PathElement elem) const
{
    Path result = *this;
    result.elements_.push_back(std::move(elem));
    return result;
}

Path Path::parent() const
{
    if (elements_.empty()) {
        return {};
    }
    return Path{container_type(elements_.begin(), elements_.end() - 1)};
}

std::vector<Path> Path::ancestors() const
{
    std::vector<Path> result;
    result.reserve(elements_.size());
    for (std::size_t len = 0; len < elements_.size(); ++len) {
        result.emplace_back(container_type(elements_.begin(), elements_.begin() + len));
    }
    return result;
}

bool Path::is_prefix_of(const Path& other) const
{
    if (elements_.size() > other.elements_.size()) {
        return false;
    }
    return std::equal(elements_.begin(), elements_.end(), other.elements_.begin());
}

// ============================================================
// Canonical string helpers
// ============================================================

std::string escape_field(std::string_view name)
{
    if (name.empty()) {
        return std::string{kEmptyFieldMarker};
    }
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (is_escapable(c)) out += '\\';
        out += c;
    }
    return out;
}

std::string join_path(std::string_view parent, const PathElement& elem)
{
    std::string out{parent};
    if (!out.empty()) out += '.';
    append_segment(out, elem);
    return out;
}

bool path_has_prefix(std::string_view path, std::string_view prefix) noexcept
{
    if (prefix.empty() || path == prefix) {
        return true;
    }
    // A complete canonical prefix never ends inside an escape, so the
    // character after it is a real separator when it is '.'.
    return path.size() > prefix.size() &&
           path.substr(0, prefix.size()) == prefix &&
           path[prefix.size()] == '.';
}

std::vector<std::string> ancestor_paths(std::string_view canonical)
{
    std::vector<std::string> result;
    auto parsed = Path::parse(canonical);
    if (!parsed) {
        return result;
    }
    std::string current;
    result.reserve(parsed->size());
    for (std::size_t i = 0; i < parsed->size(); ++i) {
        result.push_back(current);
        current = join_path(current, (*parsed)[i]);
    }
    return result;
}

PathSet make_path_set(std::initializer_list<std::string> paths)
{
    PathSet result;
    for (const auto& p : paths) {
        result = std::move(result).insert(p);
    }
    return result;
}

std::string path_to_display(std::string_view canonical)
{
    return canonical.empty() ? std::string{"(root)"} : std::string{canonical};
}

} // namespace cfgtree
