/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed JSON to an ostream. With indent_size > 0 the output
 * is pretty-printed; with indent_size == 0 everything stays on one line,
 * which is what the JSON Lines response stream needs.
 *
 * Usage:
 *   std::ostringstream line;
 *   JsonWriter w(line, 0);
 *   w.begin_object();
 *     w.kv("type", "progress");
 *     w.key("progress").begin_object();
 *       w.kv("processed", 100).kv("total", 400);
 *     w.end_object();
 *   w.end_object();
 */

#ifndef EVSIM_IO_JSON_WRITER_HPP
#define EVSIM_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace evsim {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() {
        open_value();
        os_ << '{';
        stack_.push_back(0);
        return *this;
    }

    JsonWriter& end_object() {
        close_scope();
        os_ << '}';
        return *this;
    }

    JsonWriter& begin_array() {
        open_value();
        os_ << '[';
        stack_.push_back(0);
        return *this;
    }

    JsonWriter& end_array() {
        close_scope();
        os_ << ']';
        return *this;
    }

    // ── Keys ──

    JsonWriter& key(const std::string& k) {
        next_item();
        write_string(k);
        os_ << (indent_size_ > 0 ? ": " : ":");
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        open_value();
        write_string(v);
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        open_value();
        os_ << v;
        return *this;
    }

    JsonWriter& value(long long v) {
        open_value();
        os_ << v;
        return *this;
    }

    JsonWriter& value(size_t v) {
        open_value();
        os_ << v;
        return *this;
    }

    /// Non-finite numbers have no JSON spelling and are written as null.
    JsonWriter& value(double v) {
        open_value();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            os_ << std::setprecision(12) << v;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        open_value();
        os_ << (v ? "true" : "false");
        return *this;
    }

    JsonWriter& null_value() {
        open_value();
        os_ << "null";
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        value(v);
        return *this;
    }

private:
    std::ostream& os_;
    int indent_size_;
    std::vector<int> stack_;    // items written per open scope
    bool after_key_ = false;

    // A value either follows its key directly or is a new array element.
    void open_value() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        next_item();
    }

    void next_item() {
        if (stack_.empty()) return;
        if (stack_.back() > 0) os_ << ',';
        newline(stack_.size());
        stack_.back()++;
    }

    void close_scope() {
        if (stack_.empty()) return;
        bool had_items = stack_.back() > 0;
        stack_.pop_back();
        if (had_items) newline(stack_.size());
    }

    void newline(size_t depth) {
        if (indent_size_ <= 0) return;
        os_ << '\n';
        os_ << std::string(depth * static_cast<size_t>(indent_size_), ' ');
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

}  // namespace evsim

#endif  // EVSIM_IO_JSON_WRITER_HPP
