#pragma once

#include <solranklib/concat_tostr.hh>
#include <solranklib/logger.hh>
#include <stdexcept>

namespace solrank {

// Invalid command-line usage or configuration, reported without the throw site
class UsageError : protected std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit UsageError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}

    UsageError(const UsageError&) = default;
    UsageError(UsageError&&) noexcept = default;
    UsageError& operator=(const UsageError&) = default;
    UsageError& operator=(UsageError&&) noexcept = default;

    ~UsageError() override = default;

    using std::runtime_error::what;
};

// A violated data invariant that makes continuing pointless, e.g. a degenerate
// reference solution. Terminates the whole command.
class InvariantViolation : public std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit InvariantViolation(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}
};

template <class... Args>
auto log_warning(Args&&... args) {
    return errlog("\033[1;35mwarning\033[m: ", std::forward<Args>(args)...);
}

} // namespace solrank
