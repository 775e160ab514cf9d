//! # Common Definitions
//!
//! Types shared by every reform component.
//!
//! ## Conventions
//!
//! - I/O and configuration failures are returned as `Result<T, E>`
//! - A tree that breaks a parser contract (e.g. a declaration without
//!   bindings) makes the rule throw a standard exception
//! - Syntax nodes and tokens are held through `Rc<const T>` and never mutated

#ifndef REFORM_COMMON_HPP
#define REFORM_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace reform {

// ============================================================================
// Result
// ============================================================================

/// Either a value or an error.
///
/// ```cpp
/// auto loaded = config::load_config(root);
/// if (is_err(loaded)) {
///     REFORM_LOG_ERROR("config", unwrap_err(loaded));
///     return;
/// }
/// const auto& configuration = unwrap(loaded);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Shared Ownership
// ============================================================================

/// Reference-counted pointer. A rewritten syntax tree shares every untouched
/// subtree with the tree it was derived from.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace reform

#endif // REFORM_COMMON_HPP
