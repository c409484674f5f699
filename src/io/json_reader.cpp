/**
 * JSON Reader Implementation
 *
 * Scenario and rules files are hand-edited, so errors carry a line and
 * column, and an object that repeats a key is rejected instead of letting
 * the last value silently win.
 */

#include "io/json_reader.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace strat {

namespace {

constexpr int kMaxDepth = 256;

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    JsonValue document() {
        JsonValue root = value(0);
        skip_space();
        if (!at_end()) fail("trailing characters after document");
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    char next() {
        if (at_end()) fail("unexpected end of input");
        char c = text_[pos_++];
        if (c == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        return c;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at line " + std::to_string(line_) +
                                 ", column " + std::to_string(column_) + ": " + what);
    }

    void skip_space() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) next();
    }

    void expect(char c) {
        skip_space();
        char got = next();
        if (got != c) fail(std::string("expected '") + c + "', got '" + got + "'");
    }

    void keyword(const char* word) {
        for (const char* p = word; *p; ++p) {
            if (next() != *p) fail(std::string("invalid literal, expected '") + word + "'");
        }
    }

    JsonValue value(int depth) {
        if (depth > kMaxDepth) fail("nesting deeper than " + std::to_string(kMaxDepth));
        skip_space();
        switch (peek()) {
            case '{': return object(depth);
            case '[': return array(depth);
            case '"': return JsonValue(read_string());
            case 't': keyword("true");  return JsonValue(true);
            case 'f': keyword("false"); return JsonValue(false);
            case 'n': keyword("null");  return JsonValue();
            default: break;
        }
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
        if (at_end()) fail("unexpected end of input");
        fail(std::string("unexpected character '") + peek() + "'");
    }

    JsonValue object(int depth) {
        expect('{');
        JsonValue obj = JsonValue::object();
        skip_space();
        if (peek() == '}') {
            next();
            return obj;
        }
        do {
            skip_space();
            std::string key = read_string();
            if (obj.has(key)) fail("duplicate key \"" + key + "\"");
            expect(':');
            obj.set(key, value(depth + 1));
            skip_space();
        } while (peek() == ',' && next());
        expect('}');
        return obj;
    }

    JsonValue array(int depth) {
        expect('[');
        JsonValue arr = JsonValue::array();
        skip_space();
        if (peek() == ']') {
            next();
            return arr;
        }
        do {
            arr.push_back(value(depth + 1));
            skip_space();
        } while (peek() == ',' && next());
        expect(']');
        return arr;
    }

    unsigned hex4() {
        unsigned code = 0;
        for (int i = 0; i < 4; i++) {
            char c = next();
            code <<= 4;
            if (c >= '0' && c <= '9')      code |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') code |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') code |= static_cast<unsigned>(c - 'A' + 10);
            else fail("bad \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string read_string() {
        expect('"');
        std::string out;
        for (;;) {
            if (at_end()) fail("unterminated string");
            char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned code = hex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (next() != '\\' || next() != 'u') fail("unpaired surrogate");
                        unsigned low = hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("unpaired surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    fail(std::string("unknown escape \\") + esc);
            }
        }
    }

    void digits(const char* what) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) fail(what);
        while (std::isdigit(static_cast<unsigned char>(peek()))) next();
    }

    JsonValue number() {
        const size_t start = pos_;
        bool integral = true;

        if (peek() == '-') next();
        if (peek() == '0') {
            next();
        } else {
            digits("expected digit in number");
        }
        if (peek() == '.') {
            integral = false;
            next();
            digits("expected digit after decimal point");
        }
        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            next();
            if (peek() == '+' || peek() == '-') next();
            digits("expected digit in exponent");
        }

        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;
        if (integral) {
            int64_t v = 0;
            auto [end, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && end == last) return JsonValue(v);
        }
        // Fractions, exponents and integers beyond int64 fall back to double.
        return JsonValue(std::strtod(std::string(first, last).c_str(), nullptr));
    }
};

} // anonymous namespace

JsonValue JsonReader::parse(const std::string& json) {
    return Parser(json).document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

} // namespace strat
