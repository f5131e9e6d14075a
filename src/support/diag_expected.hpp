//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Value-or-diagnostic result passed between compilation and
//          execution stages.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace reltpl::support
{

using Diag = Diagnostic;

template <class T> class Expected
{
  public:
    /// @brief Successful result holding @p value.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    /// @brief Failed result described by @p diag.
    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Stored value; requires hasValue().
    T &value()
    {
        return std::get<0>(state_);
    }

    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @brief Failure diagnostic; requires !hasValue().
    const Diag &error() const
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const Diag &error() const
    {
        return *error_;
    }

  private:
    std::optional<Diag> error_;
};

} // namespace reltpl::support
