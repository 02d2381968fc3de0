//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! the Spark compiler back-end. It establishes the foundational abstractions
//! that the IR, lowering, and code generation components depend on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Compiler version constants
//! - **Compiler Options**: Global configuration for compilation
//! - **Source Locations**: Byte-offset spans and file handles
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//! - **Internal Errors**: The one fatal error category
//!
//! ## Design Philosophy
//!
//! - **No Exceptions for user errors**: type errors are returned via `Result<T, E>`
//! - **Exceptions for broken invariants**: `InternalError` means the compiler itself
//!   is malformed and compilation must stop
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef SPARK_COMMON_HPP
#define SPARK_COMMON_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace spark {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Compiler Configuration
// ============================================================================

/// Global compiler configuration options.
///
/// These options affect all compilation operations and can be set via
/// command-line flags or programmatically.
///
/// # Example
///
/// ```cpp
/// CompilerOptions::max_errors = 20;
/// CompilerOptions::optimization_level = 2;
/// ```
struct CompilerOptions {
    /// Optimization level handed to the LLVM backend: 0-3.
    static inline int optimization_level = 0;

    /// Target triple for code generation (empty = host system).
    static inline std::string target_triple;

    /// Stop collecting diagnostics after this many errors (0 = unlimited).
    static inline uint32_t max_errors = 0;

    /// Log a textual dump of every lowered function at debug level.
    static inline bool dump_ir = false;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// Handle of a source file registered with the diagnostics collaborator.
using FileId = uint32_t;

/// A byte-offset range into one source file.
///
/// `from` is inclusive, `to` is exclusive.
struct Span {
    uint32_t from = 0;
    uint32_t to = 0;

    [[nodiscard]] auto operator==(const Span& other) const -> bool = default;

    /// Returns a span from the start of `a` to the end of `b`.
    [[nodiscard]] static constexpr auto merge(const Span& a, const Span& b) -> Span {
        return {a.from, b.to};
    }

    [[nodiscard]] constexpr auto len() const -> uint32_t {
        return to > from ? to - from : 0;
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = lowerer.lower_expr(file, fun, expr, bb);
/// if (is_err(result)) {
///     diags.push_back(std::move(unwrap_err(result)));
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
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer (like Rust's `Box<T>`).
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer (like Rust's `Rc<T>`).
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Internal Errors
// ============================================================================

/// A broken compiler invariant: a stale or foreign handle, a reachable basic
/// block without a terminator, an `Invalid` type reaching code generation.
///
/// Never produced by bad user input. Compilation cannot continue.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& msg) : std::logic_error(msg) {}
};

/// Logs `msg` at fatal level under `module` and throws `InternalError`.
[[noreturn]] void internal_error(std::string_view module, const std::string& msg);

} // namespace spark

#endif // SPARK_COMMON_HPP
