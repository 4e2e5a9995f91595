#include <charconv>
#include <cmath>
#include <cstdlib>
#include <solrank/jsonl.hh>
#include <solrank/normalization/py_value.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>
#include <solranklib/throw_assert.hh>
#include <string>

namespace solrank {

namespace {

bool is_integer_literal(std::string_view str) noexcept {
    if (not str.empty() and str.front() == '-') {
        str.remove_prefix(1);
    }
    if (str.empty()) {
        return false;
    }
    for (char c : str) {
        if (c < '0' or c > '9') {
            return false;
        }
    }
    return true;
}

std::string_view kind_name(PyValue::Kind kind) noexcept {
    using Kind = PyValue::Kind;
    switch (kind) {
    case Kind::NONE: return "NoneType";
    case Kind::BOOL: return "bool";
    case Kind::INT: return "int";
    case Kind::FLOAT: return "float";
    case Kind::STR: return "str";
    case Kind::LIST: return "list";
    case Kind::TUPLE: return "tuple";
    case Kind::SET: return "set";
    case Kind::DICT: return "dict";
    case Kind::CALL: return "object";
    }
    return "object";
}

// Length of the UTF-8 sequence starting with byte @p c (1 for invalid bytes)
size_t utf8_sequence_length(unsigned char c) noexcept {
    if (c >= 0xf0 and c < 0xf8) {
        return 4;
    }
    if (c >= 0xe0) {
        return c < 0xf0 ? 3 : 1;
    }
    if (c >= 0xc0) {
        return 2;
    }
    return 1;
}

} // namespace

PyValue PyValue::integer(std::string literal) {
    if (not is_integer_literal(literal)) {
        THROW("invalid integer literal: `", literal, '`');
    }
    PyValue res{Kind::INT};
    res.text_ = std::move(literal);
    return res;
}

PyValue PyValue::dict(std::vector<std::pair<PyValue, PyValue>> entries) {
    PyValue res{Kind::DICT};
    res.items_.reserve(entries.size() * 2);
    for (auto& [key, value] : entries) {
        res.items_.emplace_back(std::move(key));
        res.items_.emplace_back(std::move(value));
    }
    return res;
}

PyValue PyValue::call(std::string callee, PyValue arg) {
    PyValue res{Kind::CALL};
    res.text_ = std::move(callee);
    res.items_.emplace_back(std::move(arg));
    return res;
}

PyValue PyValue::from_json(const Json::Value& json, std::string_view source_text) {
    switch (json.type()) {
    case Json::nullValue: return none();
    case Json::booleanValue: return boolean(json.asBool());
    case Json::intValue: return integer(std::to_string(json.asInt64()));
    case Json::uintValue: return integer(std::to_string(json.asUInt64()));
    case Json::realValue: {
        if (auto literal = source_integer_literal(json, source_text)) {
            return integer(std::string{*literal});
        }
        return floating(json.asDouble());
    }
    case Json::stringValue: return string(json.asString());
    case Json::arrayValue: {
        std::vector<PyValue> items;
        items.reserve(json.size());
        for (const auto& item : json) {
            items.emplace_back(from_json(item, source_text));
        }
        return list(std::move(items));
    }
    case Json::objectValue: {
        std::vector<std::pair<PyValue, PyValue>> entries;
        for (auto it = json.begin(); it != json.end(); ++it) {
            entries.emplace_back(string(it.name()), from_json(*it, source_text));
        }
        return dict(std::move(entries));
    }
    }
    THROW("unexpected JSON value type");
}

std::vector<PyValue> PyValue::iterate() const {
    switch (kind_) {
    case Kind::LIST:
    case Kind::TUPLE:
    case Kind::SET: return items_;
    case Kind::STR: {
        std::vector<PyValue> chars;
        for (size_t i = 0; i < text_.size();) {
            size_t len = std::min(utf8_sequence_length(text_[i]), text_.size() - i);
            chars.emplace_back(string(text_.substr(i, len)));
            i += len;
        }
        return chars;
    }
    case Kind::DICT: {
        std::vector<PyValue> keys;
        for (size_t i = 0; i < items_.size(); i += 2) {
            keys.emplace_back(items_[i]);
        }
        return keys;
    }
    case Kind::NONE:
    case Kind::BOOL:
    case Kind::INT:
    case Kind::FLOAT:
    case Kind::CALL: break;
    }
    THROW("'", kind_name(kind_), "' object is not iterable");
}

bool PyValue::truthy() const noexcept {
    switch (kind_) {
    case Kind::NONE: return false;
    case Kind::BOOL: return bool_;
    case Kind::INT: return text_ != "0" and text_ != "-0";
    case Kind::FLOAT: return float_ != 0;
    case Kind::STR: return not text_.empty();
    case Kind::LIST:
    case Kind::TUPLE:
    case Kind::SET:
    case Kind::DICT: return not items_.empty();
    case Kind::CALL: return true;
    }
    return true;
}

std::string PyValue::to_python_literal() const {
    std::string res;
    append_python_literal(res);
    return res;
}

void PyValue::append_python_literal(std::string& out) const {
    auto append_items = [&](const char* open, const char* close, size_t step) {
        out += open;
        for (size_t i = 0; i < items_.size(); i += step) {
            if (i > 0) {
                out += ", ";
            }
            items_[i].append_python_literal(out);
            if (step == 2) {
                out += ": ";
                items_[i + 1].append_python_literal(out);
            }
        }
        out += close;
    };

    switch (kind_) {
    case Kind::NONE: out += "None"; return;
    case Kind::BOOL: out += (bool_ ? "True" : "False"); return;
    case Kind::INT: out += text_; return;
    case Kind::FLOAT: out += python_float_repr(float_); return;
    case Kind::STR: out += python_string_literal(text_); return;
    case Kind::LIST: append_items("[", "]", 1); return;
    case Kind::TUPLE:
        if (items_.size() == 1) {
            out += '(';
            items_[0].append_python_literal(out);
            out += ",)";
            return;
        }
        append_items("(", ")", 1);
        return;
    case Kind::SET:
        if (items_.empty()) {
            out += "set()";
            return;
        }
        append_items("{", "}", 1);
        return;
    case Kind::DICT: append_items("{", "}", 2); return;
    case Kind::CALL:
        out += text_;
        out += '(';
        items_[0].append_python_literal(out);
        out += ')';
        return;
    }
}

bool operator==(const PyValue& a, const PyValue& b) noexcept {
    if (a.kind_ != b.kind_) {
        return false;
    }
    switch (a.kind_) {
    case PyValue::Kind::BOOL: return a.bool_ == b.bool_;
    case PyValue::Kind::FLOAT:
        return a.float_ == b.float_ or (std::isnan(a.float_) and std::isnan(b.float_));
    default: return a.text_ == b.text_ and a.items_ == b.items_;
    }
}

std::string python_float_repr(double val) {
    if (std::isnan(val)) {
        return "nan";
    }
    if (std::isinf(val)) {
        return val > 0 ? "inf" : "-inf";
    }

    // Shortest round-trip digits, as d.ddde[+-]XX
    char buff[64];
    auto [ptr, ec] = std::to_chars(buff, buff + sizeof(buff), val, std::chars_format::scientific);
    throw_assert(ec == std::errc{});
    std::string_view sci(buff, static_cast<size_t>(ptr - buff));
    auto e_pos = sci.find('e');
    std::string_view mantissa = sci.substr(0, e_pos);
    auto exp10 = str2num<int>(sci.substr(e_pos + (sci[e_pos + 1] == '+' ? 2 : 1)));
    throw_assert(exp10.has_value());

    std::string res;
    if (mantissa.front() == '-') {
        res += '-';
        mantissa.remove_prefix(1);
    }
    std::string digits;
    for (char c : mantissa) {
        if (c != '.') {
            digits += c;
        }
    }

    // Python switches to the exponent notation outside of [1e-4, 1e16)
    if (*exp10 < -4 or *exp10 >= 16) {
        res += digits[0];
        if (digits.size() > 1) {
            res += '.';
            res.append(digits, 1);
        }
        res += *exp10 < 0 ? "e-" : "e+";
        int abs_exp = std::abs(*exp10);
        if (abs_exp < 10) {
            res += '0';
        }
        res += std::to_string(abs_exp);
        return res;
    }

    if (*exp10 < 0) {
        res += "0.";
        res.append(static_cast<size_t>(-*exp10 - 1), '0');
        res += digits;
        return res;
    }
    auto int_len = static_cast<size_t>(*exp10 + 1);
    if (digits.size() <= int_len) {
        res += digits;
        res.append(int_len - digits.size(), '0');
        res += ".0";
    } else {
        res.append(digits, 0, int_len);
        res += '.';
        res.append(digits, int_len);
    }
    return res;
}

std::string python_string_literal(std::string_view str) {
    std::string res = "'";
    res.reserve(str.size() + 2);
    for (char c : str) {
        auto uc = static_cast<unsigned char>(c);
        switch (c) {
        case '\\': res += "\\\\"; break;
        case '\'': res += "\\'"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        default:
            if (uc < 0x20 or uc == 0x7f) {
                res += "\\x";
                res += dec2hex(uc >> 4);
                res += dec2hex(uc & 15);
            } else {
                res += c;
            }
        }
    }
    res += '\'';
    return res;
}

} // namespace solrank
