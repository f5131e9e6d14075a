//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/SideEffects.hpp
// Purpose: Validates side-effect paths and writes the files they name.
// Key invariants: No file is written unless every path validated.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Harness.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace reltpl::exec
{

/// @brief Check that @p path is a safe relative path and normalise it.
///
/// @details The path must be non-empty, use only `[-_./a-zA-Z0-9]`, be
/// relative, and contain no segment made only of dots between slashes. After
/// lexical normalisation it must not start with `..` or contain `:`.
///
/// @return Normalised path, or an InvalidOutputPath diagnostic.
reltpl::support::Expected<std::string> validateOutputPath(const std::string &path);

/// @brief Write each record under @p prefix.
///
/// @details All paths are validated before anything is written. Missing
/// directories are created. Progress lines `Creating directory: D` and
/// `Writing: F` go to @p log unless @p quiet. An empty @p prefix writes
/// nothing and, when records exist, prints a warning to @p log.
reltpl::support::Expected<void> materialize(const std::vector<SideEffectRecord> &records,
                                            const std::string &prefix,
                                            bool quiet,
                                            std::ostream &log);

} // namespace reltpl::exec
