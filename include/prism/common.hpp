//! # Common Definitions
//!
//! Types and utilities shared by every prism component.
//!
//! Errors are returned via `Result<T, E>`, never thrown.

#ifndef PRISM_COMMON_HPP
#define PRISM_COMMON_HPP

#include <string>
#include <variant>

namespace prism {

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// Operations that only succeed or fail use `Result<bool, E>` and return
/// `true` on success.
///
/// # Example
///
/// ```cpp
/// auto result = json::from_str<Config>(text);
/// if (is_ok(result)) {
///     Config& config = unwrap(result);
/// } else {
///     std::cerr << unwrap_err(result).to_string() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace prism

#endif // PRISM_COMMON_HPP
