/**
 * JSON Reader Implementation — Recursive descent parser
 */

#include "io/json_reader.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>

namespace evsim {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

bool JsonValue::as_bool() const {
    if (type != JsonType::BOOL) throw std::runtime_error("JsonValue: not a bool");
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type != JsonType::NUMBER) throw std::runtime_error("JsonValue: not a number");
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (type != JsonType::STRING) throw std::runtime_error("JsonValue: not a string");
    return str_val_;
}

bool JsonValue::get_number_pair(double& first, double& second) const {
    if (type != JsonType::ARRAY || arr_val_.size() != 2) return false;
    if (!arr_val_[0].is_number() || !arr_val_[1].is_number()) return false;
    first = arr_val_[0].num_val_;
    second = arr_val_[1].num_val_;
    return true;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (type != JsonType::OBJECT) return null_value();
    auto it = obj_map_.find(key);
    if (it == obj_map_.end()) return null_value();
    return it->second;
}

bool JsonValue::has(const std::string& key) const {
    if (type != JsonType::OBJECT) return false;
    return obj_map_.count(key) > 0;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (type != JsonType::ARRAY || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

size_t JsonValue::size() const {
    if (type == JsonType::ARRAY) return arr_val_.size();
    if (type == JsonType::OBJECT) return obj_map_.size();
    return 0;
}

void JsonValue::add_member(const std::string& key, JsonValue&& val) {
    auto it = obj_map_.find(key);
    if (it == obj_map_.end()) {
        keys_.push_back(key);
        obj_map_.emplace(key, std::move(val));
    } else {
        // Duplicate key: last one wins, position of the first is kept
        it->second = std::move(val);
    }
}

const JsonValue& JsonValue::null_value() {
    static JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input), pos_(0) {}

    JsonValue parse() {
        skip_whitespace();
        JsonValue val = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) {
            throw error("Trailing characters after JSON value");
        }
        return val;
    }

private:
    const std::string& src_;
    size_t pos_;

    char peek() const {
        if (pos_ >= src_.size()) return '\0';
        return src_[pos_];
    }

    char advance() {
        if (pos_ >= src_.size()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    std::runtime_error error(const std::string& msg) const {
        int line = 1;
        int column = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); i++) {
            if (src_[i] == '\n') {
                line++;
                column = 1;
            } else {
                column++;
            }
        }
        return std::runtime_error("JSON parse error at line " + std::to_string(line) +
                                  ", column " + std::to_string(column) + ": " + msg);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '"') return JsonValue(parse_string());
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        throw error(std::string("Unexpected character: '") + c + "'");
    }

    void append_utf8(std::string& out, unsigned long code) {
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

    unsigned long read_hex4() {
        if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
        std::string hex = src_.substr(pos_, 4);
        for (char h : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(h))) {
                throw error("Invalid \\u escape: " + hex);
            }
        }
        pos_ += 4;
        return std::strtoul(hex.c_str(), nullptr, 16);
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= src_.size()) throw error("Unterminated string");
            char c = src_[pos_++];

            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }

            if (pos_ >= src_.size()) throw error("Unterminated escape");
            char esc = src_[pos_++];
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned long code = read_hex4();
                    // Surrogate pair (species names with accents stay in the BMP,
                    // but free-text labels may carry emoji)
                    if (code >= 0xD800 && code <= 0xDBFF &&
                        src_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        unsigned long low = read_hex4();
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, code);
                    break;
                }
                default:
                    throw error(std::string("Unknown escape: \\") + esc);
            }
        }
        return result;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
            while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
        } else {
            throw error("Expected digit in number");
        }

        if (peek() == '.') {
            pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit after decimal point");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit in exponent");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
        }

        std::string numstr = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(numstr.c_str(), nullptr));
    }

    JsonValue parse_bool() {
        if (src_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return JsonValue(true);
        }
        if (src_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonValue(false);
        }
        throw error("Expected 'true' or 'false'");
    }

    JsonValue parse_null() {
        if (src_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return JsonValue();
        }
        throw error("Expected 'null'");
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj;
        obj.set_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            JsonValue val = parse_value();
            obj.add_member(key, std::move(val));

            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr;
        arr.set_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

}  // namespace evsim
