#pragma once

#include <json/json.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace solrank {

// A Python value that can be rendered as a Python expression. Built from JSON
// test inputs and reshaped by the input coercions.
class PyValue {
public:
    enum class Kind {
        NONE,
        BOOL,
        INT, // kept as the literal text, so any size is exact
        FLOAT,
        STR,
        LIST,
        TUPLE,
        SET,
        DICT, // items() holds keys and values interleaved
        CALL, // call of a builtin constructor (e.g. complex) with one argument
    };

private:
    Kind kind_;
    bool bool_ = false;
    double float_ = 0;
    std::string text_; // INT: literal, STR: contents, CALL: callee
    std::vector<PyValue> items_;

    explicit PyValue(Kind kind) noexcept : kind_(kind) {}

public:
    PyValue() noexcept : kind_(Kind::NONE) {}

    static PyValue none() noexcept { return PyValue{}; }

    static PyValue boolean(bool val) noexcept {
        PyValue res{Kind::BOOL};
        res.bool_ = val;
        return res;
    }

    // @p literal has to be an optional '-' followed by decimal digits
    static PyValue integer(std::string literal);

    static PyValue floating(double val) noexcept {
        PyValue res{Kind::FLOAT};
        res.float_ = val;
        return res;
    }

    static PyValue string(std::string str) {
        PyValue res{Kind::STR};
        res.text_ = std::move(str);
        return res;
    }

    static PyValue list(std::vector<PyValue> items) { return sequence(Kind::LIST, std::move(items)); }

    static PyValue tuple(std::vector<PyValue> items) {
        return sequence(Kind::TUPLE, std::move(items));
    }

    static PyValue set(std::vector<PyValue> items) { return sequence(Kind::SET, std::move(items)); }

    static PyValue dict(std::vector<std::pair<PyValue, PyValue>> entries);

    // @p callee(@p arg), e.g. complex('1+2j')
    static PyValue call(std::string callee, PyValue arg);

    /**
     * @brief Converts a JSON value; objects become dicts with string keys
     * @details Integer literals that do not fit in 64 bits are recovered from
     *   @p source_text (the document @p json was parsed from), so they are not
     *   rounded to floats. Pass an empty @p source_text if there is none.
     */
    static PyValue from_json(const Json::Value& json, std::string_view source_text);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] const std::vector<PyValue>& items() const noexcept { return items_; }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    [[nodiscard]] bool is_sequence() const noexcept {
        return kind_ == Kind::LIST or kind_ == Kind::TUPLE or kind_ == Kind::SET;
    }

    // Elements as seen by Python's iter(): sequence items, characters of a
    // string or dict keys. Throws std::runtime_error for other kinds.
    [[nodiscard]] std::vector<PyValue> iterate() const;

    // Python's truthiness of the value
    [[nodiscard]] bool truthy() const noexcept;

    // Renders the value as a Python expression
    [[nodiscard]] std::string to_python_literal() const;

    friend bool operator==(const PyValue& a, const PyValue& b) noexcept;

private:
    static PyValue sequence(Kind kind, std::vector<PyValue> items) {
        PyValue res{kind};
        res.items_ = std::move(items);
        return res;
    }

    void append_python_literal(std::string& out) const;
};

// Python's repr() of a float, e.g. 1.0, 1000000000000000.0, 1e+16, 0.0001, 1e-05, inf, nan
std::string python_float_repr(double val);

// Python string literal with @p str as contents
std::string python_string_literal(std::string_view str);

} // namespace solrank
