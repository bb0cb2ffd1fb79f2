//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that steer the fixed-point pipeline.
// Key invariants: None.
// Ownership/Lifetime: Value type; the trace stream is borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace il::support
{

/// @brief Holds global settings that influence the lowering pipeline.
/// These options control tracing, verification, and the ABI target.
/// @invariant Flags are independent booleans.
struct Options
{
    /// @brief Emit "[fixed32]" progress lines to @ref traceStream.
    bool trace = false;

    /// @brief Run the IL verifier on the transformed module.
    bool verify = true;

    /// @brief Dump each function before it is rewritten (requires a stream).
    bool printBefore = false;

    /// @brief Dump each function after it is rewritten (requires a stream).
    bool printAfter = false;

    /// @brief Target name resolved through codegen::abi::TargetInfo::byName.
    std::string target = "host";

    /// @brief Instrumentation sink; nullptr disables every trace and dump.
    std::ostream *traceStream = nullptr;
};
} // namespace il::support
