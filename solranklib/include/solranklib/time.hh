#pragma once

#include <chrono>
#include <ctime>
#include <string>

// Returns local date and time in format "%Y-%m-%d %H:%M:%S"
std::string local_mysql_datetime();

// Returns UTC date and time in format "%Y-%m-%d %H:%M:%S"
std::string utc_mysql_datetime();

template <class Rep, class Period>
constexpr double to_seconds(std::chrono::duration<Rep, Period> dur) noexcept {
    return std::chrono::duration<double>(dur).count();
}

constexpr std::chrono::nanoseconds from_seconds(double seconds) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(seconds)
    );
}
