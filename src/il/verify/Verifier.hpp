//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Verifier, the structural checker run on IL before
// and after numeric-domain transforms.  It enforces unique symbols, one
// terminator per block, single definition of every temporary, operand arity,
// type agreement of arithmetic operands, valid branch targets and argument
// lists, valid stack-slot references and call/return arity against the
// callee signatures.  The first violation stops verification.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

namespace il::core
{
struct Module;
struct Function;
} // namespace il::core

namespace il::verify
{

class Verifier
{
  public:
    /// @brief Verify every extern and function of @p m.
    [[nodiscard]] static il::support::Expected<void> verify(const il::core::Module &m);

    /// @brief Verify one function; calls resolve against @p m.
    [[nodiscard]] static il::support::Expected<void> verifyFunction(const il::core::Function &fn,
                                                                    const il::core::Module &m);

    /// @brief Reject any f32/f64 type in the signature, block params or instructions of @p fn.
    [[nodiscard]] static il::support::Expected<void> verifyNoFloat(const il::core::Function &fn);
};

} // namespace il::verify
