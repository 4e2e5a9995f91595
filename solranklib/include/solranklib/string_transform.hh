#pragma once

#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

constexpr bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\v' or c == '\f' or c == '\r';
}

/**
 * @brief Converts whole @p str to a number of type T
 *
 * @return std::nullopt if @p str is not a valid number or does not fit in T
 */
template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }

    if constexpr (std::is_same_v<T, bool>) {
        if (str == "0") {
            return false;
        }
        if (str == "1") {
            return true;
        }
        return std::nullopt;
    } else if constexpr (std::is_integral_v<T>) {
        if (str.front() == '+') {
            str.remove_prefix(1);
        }
        T res{};
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
        if (ec != std::errc{} or ptr != str.data() + str.size()) {
            return std::nullopt;
        }
        return res;
    } else {
        // strtod() accepts more formats (e.g. "inf") and needs a null-terminated string
        std::string s{str};
        char* end = nullptr;
        errno = 0;
        T res;
        if constexpr (std::is_same_v<T, float>) {
            res = strtof(s.c_str(), &end);
        } else if constexpr (std::is_same_v<T, double>) {
            res = strtod(s.c_str(), &end);
        } else {
            res = strtold(s.c_str(), &end);
        }
        if (errno != 0 or end != s.c_str() + s.size() or is_space(s.front())) {
            return std::nullopt;
        }
        return res;
    }
}

// Removes leading and trailing white-spaces (like Python's str.strip())
constexpr std::string_view trim(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

constexpr bool has_prefix(std::string_view str, std::string_view prefix) noexcept {
    return str.substr(0, prefix.size()) == prefix;
}

constexpr char to_lower(char c) noexcept { return (c >= 'A' and c <= 'Z' ? c - 'A' + 'a' : c); }

constexpr bool lower_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) {
            return false;
        }
    }
    return true;
}

constexpr char dec2hex(int x) noexcept { return static_cast<char>(x < 10 ? '0' + x : 'a' - 10 + x); }

constexpr int hex2dec(char c) noexcept {
    return (c >= '0' and c <= '9' ? c - '0' : (c >= 'a' and c <= 'f' ? c - 'a' + 10 : c - 'A' + 10));
}

constexpr bool is_xdigit(char c) noexcept {
    return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F');
}

// Formats @p val in fixed notation with @p precision digits after the point
inline std::string to_string(double val, int precision) {
    char buff[512];
    auto [ptr, ec] =
        std::to_chars(buff, buff + sizeof(buff), val, std::chars_format::fixed, precision);
    if (ec != std::errc{}) {
        return std::to_string(val);
    }
    return std::string(buff, ptr);
}
