/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes.
 * Objects remember member insertion order so that scripted scenarios
 * (stat stages, custom prior weights) are read back in the order the
 * author wrote them.
 *
 * Usage:
 *   auto request = JsonReader::parse_file("request.json");
 *   int step = request["payload"]["evConfig"]["axisStep"].get_int(8);
 *   const auto& turns = request["payload"]["scenario"]["turns"].as_array();
 */

#ifndef EVSIM_IO_JSON_READER_HPP
#define EVSIM_IO_JSON_READER_HPP

#include <limits>
#include <string>
#include <vector>
#include <unordered_map>
#include <stdexcept>

namespace evsim {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Strict accessors (throw on type mismatch)
    bool as_bool() const;
    double as_number() const;
    int as_int() const { return saturate_int(as_number()); }
    const std::string& as_string() const;

    // Lenient accessors (return the default on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? saturate_int(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    /**
     * Read a two-element numeric array such as [0, 252].
     * Returns false (leaving outputs untouched) for anything else.
     */
    bool get_number_pair(double& first, double& second) const;

    // Object access — missing keys yield a shared null value
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;

    /// Member names in insertion order.
    const std::vector<std::string>& keys() const { return keys_; }

    // Array access — out-of-range yields a shared null value
    const JsonValue& operator[](size_t index) const;
    const std::vector<JsonValue>& as_array() const { return arr_val_; }

    size_t size() const;

    // Mutators used while parsing
    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }
    void add_member(const std::string& key, JsonValue&& val);
    void add_element(JsonValue&& val) { arr_val_.push_back(std::move(val)); }

private:
    // Truncates toward zero, clamped to the int range
    static int saturate_int(double v) {
        if (!(v == v)) return 0;
        if (v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
        if (v <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
        return static_cast<int>(v);
    }

    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> obj_map_;
    std::vector<std::string> keys_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a JSON document.
     * @throws std::runtime_error with the line/column of the first error,
     *         including trailing garbage after the top-level value
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error on file or parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace evsim

#endif  // EVSIM_IO_JSON_READER_HPP
