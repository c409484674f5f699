/**
 * JSON Values and Reader
 *
 * JsonValue is the document tree for scenario files and also the mutable
 * builder for order parameters, status effects and event records. Integer
 * literals keep their exact int64 value next to the double so that ids and
 * issue timestamps survive a load/report cycle. Object members are kept in
 * key order, which makes reports byte-stable across runs.
 *
 * Lookups on a missing key or index yield a shared null, so optional
 * scenario fields read as e.g. def["has_road"].get_bool(false).
 *
 * Usage:
 *   auto root = JsonReader::parse_file("campaign.json");
 *   int64_t day = root["current_day"].as_int64();
 *   JsonValue ev = JsonValue::object();
 *   ev.set("type", "movement").set("army_id", 4);
 */

#ifndef STRAT_JSON_READER_HPP
#define STRAT_JSON_READER_HPP

#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace strat {

enum class JsonType { NIL, BOOL, NUMBER, STRING, OBJECT, ARRAY };

class JsonValue {
public:
    using Object = std::map<std::string, JsonValue>;
    using Array = std::vector<JsonValue>;

    JsonValue() = default;
    explicit JsonValue(bool b) : kind_(JsonType::BOOL), flag_(b) {}
    explicit JsonValue(int n) : JsonValue(static_cast<int64_t>(n)) {}
    explicit JsonValue(int64_t n)
        : kind_(JsonType::NUMBER), real_(static_cast<double>(n)), whole_(n), exact_(true) {}
    explicit JsonValue(double d) : kind_(JsonType::NUMBER), real_(d), whole_(truncate(d)) {}
    explicit JsonValue(const char* s) : kind_(JsonType::STRING), text_(s) {}
    explicit JsonValue(std::string s) : kind_(JsonType::STRING), text_(std::move(s)) {}

    static JsonValue object() { return JsonValue(JsonType::OBJECT); }
    static JsonValue array() { return JsonValue(JsonType::ARRAY); }

    JsonType kind() const { return kind_; }

    bool is_null()     const { return kind_ == JsonType::NIL; }
    bool is_bool()     const { return kind_ == JsonType::BOOL; }
    bool is_number()   const { return kind_ == JsonType::NUMBER; }
    bool is_integral() const { return is_number() && exact_; }
    bool is_string()   const { return kind_ == JsonType::STRING; }
    bool is_object()   const { return kind_ == JsonType::OBJECT; }
    bool is_array()    const { return kind_ == JsonType::ARRAY; }

    // ── Strict access: std::runtime_error on the wrong kind ──

    bool as_bool() const { require(JsonType::BOOL, "bool"); return flag_; }
    double as_number() const { require(JsonType::NUMBER, "number"); return real_; }
    int64_t as_int64() const { require(JsonType::NUMBER, "number"); return whole_; }
    int as_int() const { return static_cast<int>(as_int64()); }
    const std::string& as_string() const { require(JsonType::STRING, "string"); return text_; }

    const Object& as_object() const { return members_; }
    const Array& as_array() const { return items_; }

    // ── Lenient access: fallback on the wrong kind ──

    bool get_bool(bool fallback = false) const { return is_bool() ? flag_ : fallback; }
    double get_number(double fallback = 0.0) const { return is_number() ? real_ : fallback; }
    int64_t get_int64(int64_t fallback = 0) const { return is_number() ? whole_ : fallback; }
    int get_int(int fallback = 0) const {
        return is_number() ? static_cast<int>(whole_) : fallback;
    }
    std::string get_string(const std::string& fallback = "") const {
        return is_string() ? text_ : fallback;
    }

    /** False for null, false, zero and empty strings or containers. */
    bool truthy() const {
        switch (kind_) {
            case JsonType::BOOL:   return flag_;
            case JsonType::NUMBER: return real_ != 0.0;
            case JsonType::STRING: return !text_.empty();
            case JsonType::OBJECT: return !members_.empty();
            case JsonType::ARRAY:  return !items_.empty();
            case JsonType::NIL:    break;
        }
        return false;
    }

    const JsonValue& operator[](const std::string& key) const {
        auto it = members_.find(key);
        return it == members_.end() ? nil() : it->second;
    }

    const JsonValue& operator[](size_t index) const {
        return index < items_.size() ? items_[index] : nil();
    }

    bool has(const std::string& key) const { return members_.count(key) > 0; }

    size_t size() const {
        if (is_array()) return items_.size();
        if (is_object()) return members_.size();
        return 0;
    }

    JsonValue* find(const std::string& key) {
        auto it = members_.find(key);
        return it == members_.end() ? nullptr : &it->second;
    }

    // ── Building; a null value becomes the container on first use ──

    JsonValue& set(const std::string& key, JsonValue member) {
        if (is_null()) kind_ = JsonType::OBJECT;
        members_[key] = std::move(member);
        return *this;
    }

    template <typename T>
    JsonValue& set(const std::string& key, const T& member) {
        return set(key, JsonValue(member));
    }

    JsonValue& push_back(JsonValue item) {
        if (is_null()) kind_ = JsonType::ARRAY;
        items_.push_back(std::move(item));
        return *this;
    }

    bool erase(const std::string& key) { return members_.erase(key) > 0; }

private:
    explicit JsonValue(JsonType kind) : kind_(kind) {}

    void require(JsonType want, const char* name) const {
        if (kind_ != want) throw std::runtime_error(std::string("JsonValue: not a ") + name);
    }

    /** Integer part of d, or 0 when it has none representable in int64. */
    static int64_t truncate(double d) {
        if (!std::isfinite(d) || d < -0x1p63 || d >= 0x1p63) return 0;
        return static_cast<int64_t>(d);
    }

    static const JsonValue& nil() {
        static const JsonValue null_node;
        return null_node;
    }

    JsonType kind_ = JsonType::NIL;
    bool flag_ = false;
    double real_ = 0.0;
    int64_t whole_ = 0;
    bool exact_ = false;
    std::string text_;
    Object members_;
    Array items_;
};

class JsonReader {
public:
    /**
     * Parse a JSON document.
     * @throws std::runtime_error naming the line and column of the first error
     */
    static JsonValue parse(const std::string& json);

    /** As parse(), with the file name prefixed to parse errors. */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace strat

#endif  // STRAT_JSON_READER_HPP
