#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace wordsim::guard {

// Broken caller: bad word length, guess outside the dictionary, unknown answer
struct ContractViolation : std::logic_error {
    using std::logic_error::logic_error;
};

// Malformed dictionary or answer data
struct DictionaryError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Throws RuntimeException using fmt and ...args
template <typename RuntimeException = std::runtime_error, typename ...Args>
[[noreturn]] inline void formatError(std::format_string<Args...> fmt, Args&&... args) {
    throw RuntimeException(std::format(fmt, std::forward<Args>(args)...));
}

// Throws staticMsg at compile time, otherwise Exception(staticMsg)
template <typename Exception = std::runtime_error>
[[noreturn]] constexpr inline void hybridError(std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        throw staticMsg;
    } else {
        throw Exception(std::string{staticMsg});
    }
}

/*
Guard noExceptCond at compile time (if possible) otherwise runtime
*/
template <typename Exception = std::runtime_error>
constexpr inline void hybridGuard(bool noExceptCond, std::string_view staticMsg) {
    if (noExceptCond) return;
    hybridError<Exception>(staticMsg);
}

// Guard noExceptCond at runtime with a formatted message
template <typename Exception = std::runtime_error, typename ...Args>
inline void runtimeGuard(bool noExceptCond, std::format_string<Args...> fmt, Args&&... args) {
    if (!noExceptCond) formatError<Exception>(fmt, std::forward<Args>(args)...);
}

} // end namespace wordsim::guard
