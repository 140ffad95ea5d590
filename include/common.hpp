//! # Common Definitions
//!
//! This module provides the common types, utilities, and constants used
//! throughout jcodec. Every other component depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Library version constants
//! - **Codec Options**: Global configuration for decoding
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! jcodec follows these principles in its internal API:
//!
//! - **No Exceptions on fallible paths**: Errors are returned via `Result<T, E>`
//! - **Shared Ownership**: `Rc<T>` for structure shared between trees
//! - **Immutable Values**: JSON trees are shared, never mutated in place

#ifndef JCODEC_COMMON_HPP
#define JCODEC_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace jcodec {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 3;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Codec Configuration
// ============================================================================

/// Global codec configuration options.
///
/// These options affect all decoding operations and can be set
/// programmatically before decoding starts.
///
/// # Example
///
/// ```cpp
/// CodecOptions::max_depth = 64;
/// ```
struct CodecOptions {
    /// Maximum nesting depth accepted when decoding a `JsonValue` or
    /// skipping an unknown value.
    static inline size_t max_depth = 1000;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions. This follows the Rust convention.
///
/// # Example
///
/// ```cpp
/// Result<int, std::string> parse_int(std::string_view s) {
///     // ... parsing logic ...
///     if (error) return "invalid integer";
///     return value;
/// }
///
/// auto result = parse_int("42");
/// if (is_ok(result)) {
///     int value = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// The success payload of operations that produce no value.
using Unit = std::monostate;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Reference-counted shared pointer (like Rust's `Rc<T>`).
///
/// `Rc<T>` allows multiple owners of the same heap-allocated value.
/// JSON containers are held through `Rc<const T>` so that copies of a
/// tree share structure.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Rc containing the given value.
///
/// # Example
///
/// ```cpp
/// auto ptr = make_rc<MyStruct>(arg1, arg2);
/// ```
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace jcodec

#endif // JCODEC_COMMON_HPP
