//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts IL modules and
// functions to their textual representation.  The text is used for trace
// dumps, tool output and golden comparisons in tests.
//
// Output shape:
//   extern @name(params) -> (returns)
//   func @name(params) -> (returns) {
//     slot0: size 12, align 4
//   label(%0: f32, %1: f32):
//     %2 = fadd.f32 %0, %1
//     %3, %4 = call @helper(%2) -> (i32, i32)
//     ret %3, %4
//   }
//
// The serializer is stateless; two functions print identically exactly when
// their structure, types, temporaries and operands are identical.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/fwd.hpp"

#include <ostream>
#include <string>

namespace il::io
{

class Serializer
{
  public:
    /// @brief Write every extern and function of @p m to @p os.
    static void write(const il::core::Module &m, std::ostream &os);

    /// @brief Write a single function definition to @p os.
    static void write(const il::core::Function &fn, std::ostream &os);

    static std::string toString(const il::core::Module &m);

    static std::string toString(const il::core::Function &fn);
};

/// @brief Render one instruction without indentation or trailing newline.
std::string formatInstr(const il::core::Instr &in);

} // namespace il::io
