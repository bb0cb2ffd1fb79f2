//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/Target.hpp
// Purpose: Return-value calling-convention facts for the supported targets.
// Key invariants: Descriptions are immutable singletons; names are unique.
// Ownership/Lifetime: Static storage; callers hold const references.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace qshade::codegen::abi
{

enum class Arch
{
    X86_64,
    AArch64,
    RiscV32
};

/// @brief Register file a return slot travels in.
enum class RegClass
{
    Integer,
    Float
};

/// @brief What the return classifier needs to know about a target.
struct TargetInfo
{
    std::string name;
    Arch arch{Arch::X86_64};
    /// @brief Width of one general purpose register in bytes.
    unsigned gprBytes{8U};
    /// @brief Width of the part of a float register used for returns.
    unsigned fprBytes{8U};
    /// @brief Largest aggregate returned in registers, in bytes.
    unsigned maxRegisterReturnBytes{16U};
    /// @brief Homogeneous float aggregates up to this many members return one
    ///        member per float register (0 when the ABI has no such rule).
    unsigned maxHfaMembers{0U};
    /// @brief Float values return in float registers (false for soft-float ABIs).
    bool hasFloatReturnRegs{true};
    /// @brief Struct-return buffer address goes in a dedicated register rather
    ///        than the first argument.
    bool sretInRegister{false};
    std::vector<std::string> intReturnRegs{};
    std::vector<std::string> floatReturnRegs{};
    /// @brief Register or argument carrying the struct-return address.
    std::string sretLocation{};

    /// @brief Register name for @p cls index @p idx, or "?" when out of range.
    [[nodiscard]] std::string regName(RegClass cls, unsigned idx) const;

    /// @brief True when this description is the ABI of the running process.
    [[nodiscard]] bool isHost() const;

    static const TargetInfo &x86_64SysV();
    static const TargetInfo &aarch64Aapcs64();
    static const TargetInfo &riscv32Ilp32();

    /// @brief Description of the running host; x86-64 SysV on unknown hosts.
    static const TargetInfo &host();

    /// @brief Look up "x86_64-sysv", "aarch64-aapcs64", "riscv32-ilp32" or "host".
    /// @return nullptr for unknown names.
    static const TargetInfo *byName(std::string_view name);

    /// @brief Every concrete target, in a stable order.
    static std::array<const TargetInfo *, 3> all();
};

} // namespace qshade::codegen::abi
