// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json.cpp - JSON reader and writer for Value

#include <cfgtree/serialization.h>

#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cfgtree {

// ============================================================
// JSON Writer
// ============================================================

std::string json_escape_string(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static constexpr char hex[] = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {

void write_double(double d, std::ostringstream& oss)
{
    if (!std::isfinite(d)) {
        oss << "null";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text{buf, static_cast<std::size_t>(ptr - buf)};
    oss << text;
    if (text.find_first_of(".eE") == std::string_view::npos) {
        oss << ".0";
    }
}

void to_json_impl(const Value& val, std::ostringstream& oss, const JsonWriteOptions& opts, int depth)
{
    auto write_indent = [&](int level) {
        for (int i = 0; i < level; ++i) oss << opts.indent;
    };
    const char* newline = opts.compact ? "" : "\n";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            write_double(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << '"' << json_escape_string(arg) << '"';
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
                return;
            }
            std::vector<std::string> keys = opts.sort_keys
                ? arg.sorted_keys()
                : std::vector<std::string>(arg.keys().begin(), arg.keys().end());
            oss << '{' << newline;
            bool first = true;
            for (const auto& key : keys) {
                if (!first) oss << ',' << newline;
                first = false;
                if (!opts.compact) write_indent(depth + 1);
                oss << '"' << json_escape_string(key) << "\":" << (opts.compact ? "" : " ");
                to_json_impl(arg.find(key)->get(), oss, opts, depth + 1);
            }
            oss << newline;
            if (!opts.compact) write_indent(depth);
            oss << '}';
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (arg.size() == 0) {
                oss << "[]";
                return;
            }
            oss << '[' << newline;
            bool first = true;
            for (const auto& item : arg) {
                if (!first) oss << ',' << newline;
                first = false;
                if (!opts.compact) write_indent(depth + 1);
                to_json_impl(item.get(), oss, opts, depth + 1);
            }
            oss << newline;
            if (!opts.compact) write_indent(depth);
            oss << ']';
        }
    }, val.data);
}

} // anonymous namespace

std::string to_json(const Value& val, const JsonWriteOptions& options)
{
    std::ostringstream oss;
    to_json_impl(val, oss, options, 0);
    return oss.str();
}

std::string to_json(const Value& val, bool compact)
{
    JsonWriteOptions opts;
    opts.compact = compact;
    return to_json(val, opts);
}

// ============================================================
// JSON Parser
// ============================================================

namespace {

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    std::optional<Value> parse(std::string* error_out)
    {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Empty JSON input");
            }
            Value result = parse_value(0);
            skip_whitespace();
            if (pos_ < json_.size()) {
                fail("Unexpected trailing content");
            }
            return result;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            return std::nullopt;
        }
    }

private:
    static constexpr int kMaxDepth = 512;

    std::string_view json_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& message) const
    {
        throw std::runtime_error(message + " at position " + std::to_string(pos_));
    }

    char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }

    char consume() { return pos_ < json_.size() ? json_[pos_++] : '\0'; }

    void skip_whitespace()
    {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (peek() != c) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    Value parse_value(int depth)
    {
        if (depth > kMaxDepth) {
            fail("Nesting too deep");
        }
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't') return parse_literal("true", Value{true});
        if (c == 'f') return parse_literal("false", Value{false});
        if (c == 'n') return parse_literal("null", Value{});
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();

        if (pos_ >= json_.size()) fail("Unexpected end of input");
        fail("Unexpected character '" + std::string(1, c) + "'");
    }

    Value parse_object(int depth)
    {
        expect('{');
        skip_whitespace();

        ValueObject obj;
        if (peek() == '}') {
            consume();
            return Value{obj};
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') fail("Expected string key");
            std::string key = parse_string_raw();
            expect(':');
            obj = obj.set(key, parse_value(depth + 1));

            skip_whitespace();
            char c = consume();
            if (c == '}') break;
            if (c != ',') {
                --pos_;
                fail("Expected ',' or '}' in object");
            }
        }
        return Value{std::move(obj)};
    }

    Value parse_array(int depth)
    {
        expect('[');
        skip_whitespace();

        auto transient = ValueArray{}.transient();
        if (peek() == ']') {
            consume();
            return Value{transient.persistent()};
        }

        while (true) {
            transient.push_back(ValueBox{parse_value(depth + 1)});

            skip_whitespace();
            char c = consume();
            if (c == ']') break;
            if (c != ',') {
                --pos_;
                fail("Expected ',' or ']' in array");
            }
        }
        return Value{transient.persistent()};
    }

    unsigned parse_hex4()
    {
        if (pos_ + 4 > json_.size()) fail("Invalid unicode escape");
        unsigned code = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, code, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) fail("Invalid unicode escape");
        pos_ += 4;
        return code;
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string_raw()
    {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("Unescaped control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("Unexpected end of string escape");
            }
            char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    // Combine a UTF-16 surrogate pair into one code point
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        json_.substr(pos_, 2) == "\\u") {
                        std::size_t save = pos_;
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            pos_ = save;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        fail("Unterminated string");
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    std::size_t skip_digits()
    {
        std::size_t begin = pos_;
        while (is_digit(peek())) consume();
        return pos_ - begin;
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    Value parse_number()
    {
        std::size_t start = pos_;
        bool is_floating = false;

        if (peek() == '-') consume();
        if (peek() == '0') {
            consume();
            if (is_digit(peek())) fail("Leading zeros are not allowed");
        } else if (skip_digits() == 0) {
            fail("Invalid number");
        }

        if (peek() == '.') {
            consume();
            is_floating = true;
            if (skip_digits() == 0) fail("Expected digit after decimal point");
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            is_floating = true;
            if (peek() == '+' || peek() == '-') consume();
            if (skip_digits() == 0) fail("Expected digit in exponent");
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (!is_floating) {
            int64_t ival = 0;
            auto [ptr, ec] = std::from_chars(first, last, ival);
            if (ec == std::errc{} && ptr == last) {
                return Value{ival};
            }
            // Out of int64 range: keep it as a floating value
        }

        double dval = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, dval);
        if (ptr != last || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
            pos_ = start;
            fail("Invalid number");
        }
        return Value{dval};
    }

    Value parse_literal(std::string_view word, Value result)
    {
        if (json_.substr(pos_, word.size()) != word) {
            fail("Expected '" + std::string(word) + "'");
        }
        pos_ += word.size();
        return result;
    }
};

} // anonymous namespace

std::optional<Value> parse_json(std::string_view text, std::string* error_out)
{
    JsonParser parser(text);
    return parser.parse(error_out);
}

Value from_json(std::string_view text, std::string* error_out)
{
    auto parsed = parse_json(text, error_out);
    return parsed ? std::move(*parsed) : Value{};
}

std::string detect_indentation(std::string_view text)
{
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) break;
        std::size_t line_start = eol + 1;
        std::size_t i = line_start;
        while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
        bool blank = i >= text.size() || text[i] == '\n' || text[i] == '\r';
        if (i > line_start && !blank) {
            if (text[line_start] == '\t') return "\t";
            return std::string(i - line_start, ' ');
        }
        pos = line_start;
    }
    return "  ";
}

} // namespace cfgtree
