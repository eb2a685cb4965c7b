//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! the SML front end. Every other component depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Library version constants
//! - **Parse Options**: Global configuration for scanning and parsing
//! - **Positions**: Byte offsets into the original source text
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//! - **Cancellation**: A flag checked by long-running parse and reduce calls
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef SML_COMMON_HPP
#define SML_COMMON_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace sml {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Parse Configuration
// ============================================================================

/// Global options for the scanner/parser pair.
///
/// These can be set via command-line flags of the driver or programmatically.
///
/// # Example
///
/// ```cpp
/// ParseOptions::concurrent_scan = false; // pull tokens synchronously
/// ```
struct ParseOptions {
    /// Run the scanner on its own thread behind a capacity-one hand-off.
    /// When false the parser pulls tokens from the scanner directly.
    static inline bool concurrent_scan = true;

    /// Enable verbose/debug output to stderr.
    static inline bool verbose = false;
};

/// Outputs a debug message to stderr if verbose mode is enabled.
#define SML_DEBUG_LN(msg)                                                                          \
    do {                                                                                           \
        if (::sml::ParseOptions::verbose) {                                                        \
            std::cerr << msg << "\n";                                                              \
        }                                                                                          \
    } while (0)

// ============================================================================
// Positions
// ============================================================================

/// A byte offset into the original source text.
///
/// Attached to every token and every tree node. Used only for diagnostics.
using Pos = std::size_t;

/// A resolved source location, produced on demand from a `Pos`.
struct SourceLocation {
    /// Name of the document the location belongs to.
    std::string_view file;

    /// Line number (1-based).
    uint32_t line;

    /// Column number (1-based, in bytes).
    uint32_t column;

    /// Byte offset from start of the document (0-based).
    uint32_t offset;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = parser::parse("doc", "rect 1 2 @ 3 4");
/// if (is_ok(result)) {
///     auto& tree = unwrap(result);
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
/// Throws `std::bad_variant_access` if the Result contains a success value.
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

// ============================================================================
// Cancellation
// ============================================================================

/// A cooperative cancellation flag.
///
/// The parser checks it at every token retrieval and `Node::reduce` at every
/// recursion level. Cancelling is sticky and may be done from any thread.
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Message used by every error produced because of cancellation.
constexpr const char* CANCELLED_MESSAGE = "operation cancelled";

} // namespace sml

#endif // SML_COMMON_HPP
