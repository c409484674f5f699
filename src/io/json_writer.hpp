/**
 * Streaming JSON Writer (header-only)
 *
 * Writes campaign reports straight to a stream without building a tree
 * first. Event records and status effects are already JsonValue trees and
 * go through value(const JsonValue&). Non-finite doubles are written as
 * null so a report always parses back.
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *   w.kv("army_id", 4).kv("status", "marching");
 *   w.key("route").begin_array();
 *   w.value(11); w.value(12);
 *   w.end_array();
 *   w.end_object();
 */

#ifndef STRAT_JSON_WRITER_HPP
#define STRAT_JSON_WRITER_HPP

#include "io/json_reader.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace strat {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent = 2) : os_(os), indent_(indent) {}

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object() { return close('}'); }
    JsonWriter& begin_array() { return open('['); }
    JsonWriter& end_array() { return close(']'); }

    JsonWriter& key(const std::string& name) {
        prefix();
        quoted(name);
        os_ << ": ";
        pending_key_ = true;
        return *this;
    }

    template <typename T>
    JsonWriter& kv(const std::string& name, const T& v) {
        key(name);
        return value(v);
    }

    // ── Scalars ──

    JsonWriter& null_value() { prefix(); os_ << "null"; return *this; }

    JsonWriter& value(bool b) { prefix(); os_ << (b ? "true" : "false"); return *this; }

    JsonWriter& value(const std::string& s) { prefix(); quoted(s); return *this; }
    JsonWriter& value(const char* s) { return value(std::string(s)); }

    template <typename Int,
              typename std::enable_if<std::is_integral<Int>::value &&
                                      !std::is_same<Int, bool>::value, int>::type = 0>
    JsonWriter& value(Int n) {
        prefix();
        os_ << n;
        return *this;
    }

    JsonWriter& value(double d) {
        if (!std::isfinite(d)) return null_value();
        prefix();
        const auto old = os_.precision(std::numeric_limits<double>::max_digits10);
        os_ << d;
        os_.precision(old);
        return *this;
    }

    JsonWriter& value(const JsonValue& v) {
        switch (v.kind()) {
            case JsonType::NIL:    return null_value();
            case JsonType::BOOL:   return value(v.as_bool());
            case JsonType::STRING: return value(v.as_string());
            case JsonType::NUMBER:
                if (v.is_integral()) return value(v.as_int64());
                return value(v.as_number());
            case JsonType::OBJECT:
                begin_object();
                for (const auto& [name, member] : v.as_object()) {
                    key(name);
                    value(member);
                }
                return end_object();
            case JsonType::ARRAY:
                begin_array();
                for (const auto& item : v.as_array()) value(item);
                return end_array();
        }
        return null_value();
    }

private:
    std::ostream& os_;
    int indent_;
    // One entry per open container: whether it has received an element yet.
    std::vector<bool> nonempty_;
    bool pending_key_ = false;

    JsonWriter& open(char bracket) {
        prefix();
        os_ << bracket;
        nonempty_.push_back(false);
        return *this;
    }

    JsonWriter& close(char bracket) {
        const bool had_items = !nonempty_.empty() && nonempty_.back();
        if (!nonempty_.empty()) nonempty_.pop_back();
        if (had_items) break_line();
        os_ << bracket;
        return *this;
    }

    // Comma and line break before the next element of the open container.
    void prefix() {
        if (pending_key_) {
            pending_key_ = false;
            return;
        }
        if (nonempty_.empty()) return;
        if (nonempty_.back()) os_ << ',';
        nonempty_.back() = true;
        break_line();
    }

    void break_line() {
        if (indent_ <= 0) return;
        os_ << '\n' << std::string(nonempty_.size() * static_cast<size_t>(indent_), ' ');
    }

    void quoted(const std::string& s) {
        static const char kHex[] = "0123456789abcdef";
        os_ << '"';
        for (char c : s) {
            const auto u = static_cast<unsigned char>(c);
            switch (c) {
                case '"':  os_ << "\\\""; continue;
                case '\\': os_ << "\\\\"; continue;
                case '\n': os_ << "\\n";  continue;
                case '\r': os_ << "\\r";  continue;
                case '\t': os_ << "\\t";  continue;
                case '\b': os_ << "\\b";  continue;
                case '\f': os_ << "\\f";  continue;
                default: break;
            }
            if (u < 0x20) {
                os_ << "\\u00" << kHex[u >> 4] << kHex[u & 0xF];
            } else {
                os_ << c;
            }
        }
        os_ << '"';
    }
};

}  // namespace strat

#endif  // STRAT_JSON_WRITER_HPP
