//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic records, the per-compilation engine that collects
//          them, and the printer shared by every reltpl tool.
// Key invariants: Diagnostics keep report order; errorCount() equals the
//                 number of Error records.
// Ownership/Lifetime: The engine owns its records.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace reltpl::support
{

class SourceManager;

enum class Severity
{
    Warning,
    Error
};

struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Template position; file_id 0 when not tied to a file
    std::string code{};  ///< T#### code from support/diag_codes.hpp; may be empty
};

/// @brief Lowercase name of @p severity as printed before the code.
const char *severityName(Severity severity);

/// @brief Build an error diagnostic.
Diagnostic makeError(SourceLoc loc, std::string msg, std::string_view code = {});

/// @brief Print one diagnostic as `path:line:col: error[T2001]: message`.
///
/// @details The location prefix is omitted when @p sm is null or the file is
/// unknown. When @p sm holds the template text, the offending line follows
/// with a caret under the reported column.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm = nullptr);

class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Record an error at @p loc.
    void error(SourceLoc loc, std::string_view code, std::string message);

    /// @brief Print all recorded diagnostics in report order.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    size_t errorCount() const
    {
        return errors_;
    }

    /// @brief First error reported, or nullptr when there is none.
    const Diagnostic *firstError() const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
};

} // namespace reltpl::support
