//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/abi/Target.cpp
// Purpose: Static target descriptions.
//
//===----------------------------------------------------------------------===//

#include "codegen/abi/Target.hpp"

namespace qshade::codegen::abi
{

std::string TargetInfo::regName(RegClass cls, unsigned idx) const
{
    const auto &regs = cls == RegClass::Integer ? intReturnRegs : floatReturnRegs;
    return idx < regs.size() ? regs[idx] : std::string("?");
}

bool TargetInfo::isHost() const
{
#if defined(__x86_64__) && !defined(_WIN32)
    return arch == Arch::X86_64;
#elif defined(__aarch64__)
    return arch == Arch::AArch64;
#elif defined(__riscv) && __riscv_xlen == 32 && defined(__riscv_float_abi_soft)
    return arch == Arch::RiscV32;
#else
    return false;
#endif
}

const TargetInfo &TargetInfo::x86_64SysV()
{
    static const TargetInfo info = []
    {
        TargetInfo t;
        t.name = "x86_64-sysv";
        t.arch = Arch::X86_64;
        t.gprBytes = 8;
        t.fprBytes = 8;
        t.maxRegisterReturnBytes = 16;
        t.maxHfaMembers = 0;
        t.hasFloatReturnRegs = true;
        t.sretInRegister = false;
        t.intReturnRegs = {"rax", "rdx"};
        t.floatReturnRegs = {"xmm0", "xmm1"};
        t.sretLocation = "rdi";
        return t;
    }();
    return info;
}

const TargetInfo &TargetInfo::aarch64Aapcs64()
{
    static const TargetInfo info = []
    {
        TargetInfo t;
        t.name = "aarch64-aapcs64";
        t.arch = Arch::AArch64;
        t.gprBytes = 8;
        t.fprBytes = 8;
        t.maxRegisterReturnBytes = 16;
        t.maxHfaMembers = 4;
        t.hasFloatReturnRegs = true;
        t.sretInRegister = true;
        t.intReturnRegs = {"x0", "x1"};
        t.floatReturnRegs = {"v0", "v1", "v2", "v3"};
        t.sretLocation = "x8";
        return t;
    }();
    return info;
}

const TargetInfo &TargetInfo::riscv32Ilp32()
{
    static const TargetInfo info = []
    {
        TargetInfo t;
        t.name = "riscv32-ilp32";
        t.arch = Arch::RiscV32;
        t.gprBytes = 4;
        t.fprBytes = 0;
        t.maxRegisterReturnBytes = 8;
        t.maxHfaMembers = 0;
        t.hasFloatReturnRegs = false;
        t.sretInRegister = false;
        t.intReturnRegs = {"a0", "a1"};
        t.sretLocation = "a0";
        return t;
    }();
    return info;
}

const TargetInfo &TargetInfo::host()
{
#if defined(__aarch64__)
    return aarch64Aapcs64();
#elif defined(__riscv) && __riscv_xlen == 32
    return riscv32Ilp32();
#else
    return x86_64SysV();
#endif
}

const TargetInfo *TargetInfo::byName(std::string_view name)
{
    if (name == "host")
        return &host();
    for (const TargetInfo *t : all())
    {
        if (t->name == name)
            return t;
    }
    return nullptr;
}

std::array<const TargetInfo *, 3> TargetInfo::all()
{
    return {&x86_64SysV(), &aarch64Aapcs64(), &riscv32Ilp32()};
}

} // namespace qshade::codegen::abi
