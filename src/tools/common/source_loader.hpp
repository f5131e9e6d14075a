//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Loads template files for the command-line tool.
// Key invariants: LoadedSource holds the complete file and its SourceManager id.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace reltpl::tools::common
{

/// @brief File contents and the identifier diagnostics use to name the file.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Read @p path and register it with @p sm.
///
/// Files larger than 256 MB are rejected before reading.
///
/// @return Loaded buffer, or a diagnostic describing the I/O failure or
///         SourceManager overflow.
reltpl::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                         reltpl::support::SourceManager &sm);

} // namespace reltpl::tools::common
