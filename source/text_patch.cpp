// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// text_patch.cpp - byte-span splicing of serialized documents
//
// Two tiers: locate the exact span of the old value and splice, or apply
// the edit structurally and re-serialize. Every splice is re-parsed and
// compared against the structural result before it is accepted.

#include <cfgtree/patcher.h>
#include <cfgtree/serialization.h>

#include <vector>

namespace cfgtree {

namespace {

constexpr std::size_t npos = std::string_view::npos;

/// One field or element inside a container
struct Slot {
    std::size_t member_begin = npos;  ///< opening quote of the key, or the element's first byte
    std::size_t value_begin = npos;
    std::size_t value_end = npos;     ///< one past the last byte of the value
};

struct ContainerScan {
    std::size_t open = npos;   ///< '{' or '['
    std::size_t close = npos;  ///< matching '}' or ']'
    std::vector<Slot> slots;
    std::vector<std::string> keys;  ///< decoded field names (objects only)
};

enum class LocateStatus : std::uint8_t { Found, NotFound, Ambiguous, Malformed };

struct Location {
    LocateStatus status = LocateStatus::NotFound;
    Slot slot;
    ContainerScan parent;  ///< container holding the slot (empty for the root)
    std::size_t slot_index = 0;
};

// ============================================================
// SpanScanner - walks raw JSON text without building values
// ============================================================

class SpanScanner {
public:
    explicit SpanScanner(std::string_view text) : text_(text) {}

    std::size_t skip_ws(std::size_t pos) const
    {
        while (pos < text_.size()) {
            char c = text_[pos];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos;
        }
        return pos;
    }

    std::optional<std::size_t> skip_string(std::size_t pos) const
    {
        if (pos >= text_.size() || text_[pos] != '"') return std::nullopt;
        for (++pos; pos < text_.size(); ++pos) {
            if (text_[pos] == '\\') {
                ++pos;
            } else if (text_[pos] == '"') {
                return pos + 1;
            }
        }
        return std::nullopt;
    }

    std::optional<std::size_t> skip_value(std::size_t pos) const
    {
        if (pos >= text_.size()) return std::nullopt;
        char c = text_[pos];
        if (c == '"') return skip_string(pos);
        if (c == '{' || c == '[') {
            int depth = 0;
            while (pos < text_.size()) {
                char ch = text_[pos];
                if (ch == '"') {
                    auto end = skip_string(pos);
                    if (!end) return std::nullopt;
                    pos = *end;
                    continue;
                }
                if (ch == '{' || ch == '[') ++depth;
                if (ch == '}' || ch == ']') {
                    if (--depth == 0) return pos + 1;
                }
                ++pos;
            }
            return std::nullopt;
        }
        std::size_t end = pos;
        while (end < text_.size()) {
            char ch = text_[end];
            if (ch == ',' || ch == '}' || ch == ']' || ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') break;
            ++end;
        }
        return end == pos ? std::nullopt : std::optional<std::size_t>{end};
    }

    std::optional<ContainerScan> scan_container(std::size_t pos) const
    {
        if (pos >= text_.size() || (text_[pos] != '{' && text_[pos] != '[')) return std::nullopt;
        const bool is_object = text_[pos] == '{';
        const char close_char = is_object ? '}' : ']';

        ContainerScan scan;
        scan.open = pos;
        pos = skip_ws(pos + 1);
        if (pos < text_.size() && text_[pos] == close_char) {
            scan.close = pos;
            return scan;
        }

        while (pos < text_.size()) {
            Slot slot;
            slot.member_begin = pos;
            if (is_object) {
                auto key_end = skip_string(pos);
                if (!key_end) return std::nullopt;
                auto key = parse_json(text_.substr(pos, *key_end - pos));
                if (!key || !key->is<std::string>()) return std::nullopt;
                scan.keys.push_back(key->as_string());
                pos = skip_ws(*key_end);
                if (pos >= text_.size() || text_[pos] != ':') return std::nullopt;
                pos = skip_ws(pos + 1);
            }
            slot.value_begin = pos;
            auto value_end = skip_value(pos);
            if (!value_end) return std::nullopt;
            slot.value_end = *value_end;
            scan.slots.push_back(slot);

            pos = skip_ws(*value_end);
            if (pos >= text_.size()) return std::nullopt;
            if (text_[pos] == close_char) {
                scan.close = pos;
                return scan;
            }
            if (text_[pos] != ',') return std::nullopt;
            pos = skip_ws(pos + 1);
        }
        return std::nullopt;
    }

    Location locate(const Path& path) const
    {
        Location loc;
        std::size_t begin = skip_ws(0);
        auto end = skip_value(begin);
        if (!end) {
            loc.status = LocateStatus::Malformed;
            return loc;
        }
        loc.slot = Slot{begin, begin, *end};

        for (const auto& elem : path) {
            auto scan = scan_container(loc.slot.value_begin);
            if (!scan) {
                loc.status = LocateStatus::NotFound;
                return loc;
            }

            std::size_t index = 0;
            if (auto* key = std::get_if<std::string>(&elem)) {
                if (text_[scan->open] != '{') {
                    loc.status = LocateStatus::NotFound;
                    return loc;
                }
                std::size_t matches = 0;
                for (std::size_t i = 0; i < scan->keys.size(); ++i) {
                    if (scan->keys[i] == *key) {
                        index = i;
                        ++matches;
                    }
                }
                if (matches == 0) {
                    loc.status = LocateStatus::NotFound;
                    return loc;
                }
                if (matches > 1) {
                    loc.status = LocateStatus::Ambiguous;
                    return loc;
                }
            } else {
                index = std::get<std::size_t>(elem);
                if (text_[scan->open] != '[' || index >= scan->slots.size()) {
                    loc.status = LocateStatus::NotFound;
                    return loc;
                }
            }

            loc.slot = scan->slots[index];
            loc.slot_index = index;
            loc.parent = std::move(*scan);
        }
        loc.status = LocateStatus::Found;
        return loc;
    }

private:
    std::string_view text_;
};

// ============================================================
// Formatting helpers
// ============================================================

[[nodiscard]] bool is_single_line(std::string_view text)
{
    return text.find('\n') == npos;
}

/// Leading whitespace of the line containing @p pos
std::string line_indent(std::string_view text, std::size_t pos)
{
    std::size_t line_start = text.rfind('\n', pos == 0 ? 0 : pos - 1);
    line_start = (line_start == npos) ? 0 : line_start + 1;
    std::size_t i = line_start;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    return std::string{text.substr(line_start, i - line_start)};
}

/// Non-empty container written on one line, e.g. "[1, 2]"
[[nodiscard]] bool is_inline_container(std::string_view span)
{
    return span.size() > 2 && (span.front() == '{' || span.front() == '[') && is_single_line(span);
}

/// Serialization of @p val that fits in place of @p slot of @p text
std::string render_at(std::string_view text, const Slot& slot, const Value& val)
{
    const auto old_span = text.substr(slot.value_begin, slot.value_end - slot.value_begin);
    if (!val.is_container() || val.size() == 0 || is_single_line(text) || is_inline_container(old_span)) {
        return to_json(val, true);
    }
    JsonWriteOptions opts;
    opts.indent = detect_indentation(text);
    std::string body = to_json(val, opts);
    const std::string base = line_indent(text, slot.value_begin);

    std::string out;
    out.reserve(body.size());
    for (char c : body) {
        out += c;
        if (c == '\n') out += base;
    }
    return out;
}

std::string rebuild_document(std::string_view text, const Value& tree)
{
    JsonWriteOptions opts;
    opts.compact = !text.empty() && is_single_line(text);
    opts.indent = detect_indentation(text);
    std::string out = to_json(tree, opts);
    if (!text.empty() && text.back() == '\n') out += '\n';
    return out;
}

PatchResult rebuilt(std::string_view text, const Value& tree)
{
    PatchResult result;
    result.ok = true;
    result.strategy = PatchStrategy::Rebuild;
    result.text = rebuild_document(text, tree);
    return result;
}

PatchResult failed(std::string error)
{
    PatchResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

/// Spliced text is accepted only if it parses to exactly @p expected
[[nodiscard]] bool splice_is_faithful(std::string_view spliced, const Value& expected)
{
    auto reparsed = parse_json(spliced);
    return reparsed && *reparsed == expected;
}

/// Resolve the tree the edit applies to. Sets @p drifted when @p tree is
/// given but the text does not describe it.
std::optional<Value> resolve_base(std::string_view text, const Value* tree, bool& drifted, std::string& error)
{
    auto parsed = parse_json(text, &error);
    if (tree) {
        drifted = !parsed || !(*parsed == *tree);
        return *tree;
    }
    drifted = false;
    return parsed;
}

} // anonymous namespace

// ============================================================
// Public API
// ============================================================

PatchResult apply_minimal_edit(std::string_view text, const Path& path, const Value& new_value, const Value* tree)
{
    bool drifted = false;
    std::string parse_error;
    auto base = resolve_base(text, tree, drifted, parse_error);
    if (!base) {
        return failed("document does not parse: " + parse_error);
    }

    std::string edit_error;
    auto expected = set_value(*base, path, new_value, &edit_error);
    if (!expected) {
        return failed(edit_error);
    }

    const std::string canonical = path.to_string();
    if (drifted) {
        detail::log_path_error("apply_minimal_edit", canonical, "text differs from tree; re-serializing");
        return rebuilt(text, *expected);
    }

    Location loc = SpanScanner{text}.locate(path);
    if (loc.status != LocateStatus::Found) {
        detail::log_path_error("apply_minimal_edit", canonical,
                               loc.status == LocateStatus::Ambiguous ? "span is ambiguous; re-serializing"
                                                                      : "span not found; re-serializing");
        return rebuilt(text, *expected);
    }

    std::string spliced;
    spliced.reserve(text.size() + 16);
    spliced.append(text.substr(0, loc.slot.value_begin));
    spliced.append(render_at(text, loc.slot, new_value));
    spliced.append(text.substr(loc.slot.value_end));

    if (!splice_is_faithful(spliced, *expected)) {
        detail::log_path_error("apply_minimal_edit", canonical, "splice did not round-trip; re-serializing");
        return rebuilt(text, *expected);
    }

    PatchResult result;
    result.ok = true;
    result.strategy = PatchStrategy::Splice;
    result.text = std::move(spliced);
    return result;
}

PatchResult apply_minimal_delete(std::string_view text, const Path& path, const Value* tree)
{
    bool drifted = false;
    std::string parse_error;
    auto base = resolve_base(text, tree, drifted, parse_error);
    if (!base) {
        return failed("document does not parse: " + parse_error);
    }

    std::string edit_error;
    auto expected = remove_value(*base, path, &edit_error);
    if (!expected) {
        return failed(edit_error);
    }

    const std::string canonical = path.to_string();
    if (drifted) {
        detail::log_path_error("apply_minimal_delete", canonical, "text differs from tree; re-serializing");
        return rebuilt(text, *expected);
    }

    Location loc = SpanScanner{text}.locate(path);
    if (loc.status != LocateStatus::Found || loc.parent.open == npos) {
        detail::log_path_error("apply_minimal_delete", canonical, "span not located; re-serializing");
        return rebuilt(text, *expected);
    }

    // Cut the member and exactly one separator so the container stays valid.
    const auto& slots = loc.parent.slots;
    const std::size_t i = loc.slot_index;
    std::size_t cut_begin = 0;
    std::size_t cut_end = 0;
    if (slots.size() == 1) {
        cut_begin = loc.parent.open + 1;
        cut_end = loc.parent.close;
    } else if (i + 1 < slots.size()) {
        cut_begin = slots[i].member_begin;
        cut_end = slots[i + 1].member_begin;
    } else {
        cut_begin = slots[i - 1].value_end;
        cut_end = slots[i].value_end;
    }

    std::string spliced;
    spliced.reserve(text.size());
    spliced.append(text.substr(0, cut_begin));
    spliced.append(text.substr(cut_end));

    if (!splice_is_faithful(spliced, *expected)) {
        detail::log_path_error("apply_minimal_delete", canonical, "splice did not round-trip; re-serializing");
        return rebuilt(text, *expected);
    }

    PatchResult result;
    result.ok = true;
    result.strategy = PatchStrategy::Splice;
    result.text = std::move(spliced);
    return result;
}

} // namespace cfgtree
