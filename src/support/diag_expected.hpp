//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container
//          used by the transform pipeline and tools.
// Key invariants: An Expected holds either a value or an error, never both.
// Ownership/Lifetime: Expected owns its payload by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace il::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with an error payload.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload; defaults to a rendered diagnostic.
/// @note Mirrors a subset of std::expected until the standard type becomes
///       universally available on our toolchain.
template <class T, class E = Diag> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to E to
    ///          avoid colliding with the error constructor below.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value() &
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const &
    {
        return *value_;
    }

    /// @brief Move the stored value out; requires hasValue().
    T &&value() &&
    {
        return std::move(*value_);
    }

    /// @brief Access the error payload; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

    /// @brief Move the error payload out; requires !hasValue().
    E &&error() &&
    {
        return std::move(*error_);
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for operations without a success payload.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const E &error() const &
    {
        return *error_;
    }

    E &&error() &&
    {
        return std::move(*error_);
    }

  private:
    std::optional<E> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @details Format: `[line:col: ]severity[ code]: message` followed by a newline.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace il::support
