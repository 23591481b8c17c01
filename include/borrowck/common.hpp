//! # Common Definitions
//!
//! This module provides the common types used throughout the borrowck
//! verifier. Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Checker Options**: Per-verifier configuration
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Conventions
//!
//! - **No Exceptions across APIs**: fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **No global mutable state**: options travel with the verifier instance

#ifndef BORROWCK_COMMON_HPP
#define BORROWCK_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace borrowck {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Checker Configuration
// ============================================================================

/// How the immutability phase decides that a dereference targets a raw pointer.
///
/// `Heuristic` pattern-matches the operand's syntax (casts to a raw pointer
/// type and calls to known allocation functions). `Typed` trusts the resolved
/// raw-pointer type carried on the operand instead.
enum class RawPointerDetection {
    Heuristic, ///< Syntax-shape matching (default)
    Typed,     ///< Resolved `PtrType` on the operand
};

/// Which policy decides when a borrow stops being live.
enum class BorrowEndStrategy {
    LexicalScope, ///< Borrows end when their creating scope exits
};

/// Configuration for a single verifier instance.
///
/// # Example
///
/// ```cpp
/// CheckerOptions options;
/// options.max_errors = 20;
/// options.jobs = 4;
/// Verifier verifier(oracle, contracts, options);
/// ```
struct CheckerOptions {
    /// Stop checking further units once this many errors were reported (0 = never).
    size_t max_errors = 0;

    /// Raw pointer dereference detection mode.
    RawPointerDetection raw_pointer_detection = RawPointerDetection::Heuristic;

    /// Borrow liveness policy.
    BorrowEndStrategy borrow_end = BorrowEndStrategy::LexicalScope;

    /// Worker threads for `Verifier::verify_parallel` (0 = hardware concurrency).
    unsigned jobs = 0;

    /// Call names whose result the heuristic treats as a raw pointer.
    std::vector<std::string> unsafe_alloc_names = {"malloc", "alloc", "realloc", "calloc"};
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// `line` and `column` are 1-based; a zero line marks an unknown location.
struct SourceLocation {
    /// Path to the source file.
    std::string_view file;

    /// Line number (1-based).
    uint32_t line = 0;

    /// Column number (1-based).
    uint32_t column = 0;

    /// Byte offset from start of file (0-based).
    uint32_t offset = 0;

    /// Length of the source element in bytes.
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;

    /// Returns true when the span points at real source text.
    [[nodiscard]] auto is_known() const -> bool {
        return start.line != 0;
    }

    /// Builds a single-line span, mostly for tests and synthesized nodes.
    [[nodiscard]] static auto at(uint32_t line, uint32_t column, uint32_t length = 1)
        -> SourceSpan {
        SourceLocation start{.file = {}, .line = line, .column = column, .offset = 0,
                             .length = length};
        SourceLocation end = start;
        end.column = column + length;
        return {start, end};
    }
};

/// Formats a span as `file:line:column` (or `<unknown>`).
[[nodiscard]] auto span_to_string(const SourceSpan& span) -> std::string;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = contracts.declare("Iterator", sig);
/// if (is_err(result)) {
///     report(unwrap_err(result));
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
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace borrowck

#endif // BORROWCK_COMMON_HPP
