//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.cpp
// Purpose: Implements SourceLoc helpers.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace il::support
{

/// @brief Report whether the location carries a line number.
/// @details Frontends that only know the file leave line at zero, which the
///          printers treat as "no location".
bool SourceLoc::isValid() const
{
    return line != 0;
}

} // namespace il::support
