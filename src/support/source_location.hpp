//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to IL instructions and
//          diagnostics.
// Key invariants: line == 0 denotes an unknown location; line/column are 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace il::support
{

/// @brief Position within the shader source that produced an IL entity.
/// @invariant line == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier of the originating file; 0 when the frontend did not record one.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether at least a line number is attached.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace il::support
