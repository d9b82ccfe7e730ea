//! # Common Definitions
//!
//! Types and constants shared by every reqtree component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version string
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Read-only Queries**: Graph queries never mutate the catalog they read

#ifndef REQTREE_COMMON_HPP
#define REQTREE_COMMON_HPP

#include <filesystem>
#include <string>
#include <variant>

namespace reqtree {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

namespace fs = std::filesystem;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<std::string, GraphError> text = catalog.describe("a");
/// if (is_ok(text)) {
///     std::cout << unwrap(text);
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

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace reqtree

#endif // REQTREE_COMMON_HPP
