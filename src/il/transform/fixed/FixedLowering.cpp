//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/fixed/FixedLowering.cpp
// Purpose: IL sequences for Q16.16 arithmetic.
// Key invariants: Division by zero and non-positive square roots are handled
//                 with selects so the block structure of the caller is never
//                 changed; divisors fed to udiv are never zero.
//
//===----------------------------------------------------------------------===//

#include "il/transform/fixed/FixedLowering.hpp"

#include "il/core/Instr.hpp"
#include "il/fixed/FixedPoint.hpp"

using namespace il::core;

namespace il::transform::lowering
{
namespace
{
const Type kI1(Type::Kind::I1);
const Type kI32(Type::Kind::I32);
const Type kI64(Type::Kind::I64);

Value imm(long long v)
{
    return Value::constInt(v);
}
} // namespace

Value FixedEmitter::emit(Opcode op, Type type, std::vector<Value> operands)
{
    return builder_.emit(op, type, std::move(operands));
}

Value FixedEmitter::finish(Opcode op, Type type, std::vector<Value> operands, unsigned resultId)
{
    Instr in;
    in.op = op;
    in.type = type;
    in.operands = std::move(operands);
    in.results.push_back({resultId, type});
    builder_.append(std::move(in));
    return Value::temp(resultId);
}

Value FixedEmitter::add(Value a, Value b, unsigned resultId)
{
    return finish(Opcode::Add, kI32, {a, b}, resultId);
}

Value FixedEmitter::sub(Value a, Value b, unsigned resultId)
{
    return finish(Opcode::Sub, kI32, {a, b}, resultId);
}

Value FixedEmitter::neg(Value a, unsigned resultId)
{
    return finish(Opcode::Sub, kI32, {imm(0), a}, resultId);
}

Value FixedEmitter::abs(Value a, unsigned resultId)
{
    const Value isNeg = emit(Opcode::SCmpLT, kI1, {a, imm(0)});
    const Value negated = emit(Opcode::Sub, kI32, {imm(0), a});
    return finish(Opcode::Select, kI32, {isNeg, negated, a}, resultId);
}

Value FixedEmitter::min(Value a, Value b, unsigned resultId)
{
    const Value lt = emit(Opcode::SCmpLT, kI1, {a, b});
    return finish(Opcode::Select, kI32, {lt, a, b}, resultId);
}

Value FixedEmitter::max(Value a, Value b, unsigned resultId)
{
    const Value gt = emit(Opcode::SCmpGT, kI1, {a, b});
    return finish(Opcode::Select, kI32, {gt, a, b}, resultId);
}

Value FixedEmitter::mul(Value a, Value b, unsigned resultId)
{
    const Value wa = emit(Opcode::Sext, kI64, {a});
    const Value wb = emit(Opcode::Sext, kI64, {b});
    const Value product = emit(Opcode::Mul, kI64, {wa, wb});
    const Value shifted = emit(Opcode::AShr, kI64, {product, imm(il::fixed::kFractionalBits)});
    return finish(Opcode::Trunc, kI32, {shifted}, resultId);
}

Value FixedEmitter::div(Value a, Value b, unsigned resultId)
{
    const Value bIsZero = emit(Opcode::ICmpEq, kI1, {b, imm(0)});
    const Value aIsZero = emit(Opcode::ICmpEq, kI1, {a, imm(0)});
    const Value aIsNeg = emit(Opcode::SCmpLT, kI1, {a, imm(0)});
    const Value bIsNeg = emit(Opcode::SCmpLT, kI1, {b, imm(0)});

    // Magnitudes as unsigned 32-bit values widened to 64 bits.
    const Value negA = emit(Opcode::Sub, kI32, {imm(0), a});
    const Value absA32 = emit(Opcode::Select, kI32, {aIsNeg, negA, a});
    const Value absA = emit(Opcode::Zext, kI64, {absA32});
    const Value negB = emit(Opcode::Sub, kI32, {imm(0), b});
    const Value absB32 = emit(Opcode::Select, kI32, {bIsNeg, negB, b});
    const Value absB = emit(Opcode::Zext, kI64, {absB32});
    const Value divisor = emit(Opcode::Select, kI64, {bIsZero, imm(1), absB});

    const Value recip = emit(Opcode::UDiv, kI64, {imm(il::fixed::kReciprocalNumerator), divisor});
    const Value product = emit(Opcode::Mul, kI64, {absA, recip});
    const Value doubled = emit(Opcode::Shl, kI64, {product, imm(1)});
    const Value scaled = emit(Opcode::LShr, kI64, {doubled, imm(il::fixed::kFractionalBits)});
    const Value quotient = emit(Opcode::Trunc, kI32, {scaled});

    const Value signs = emit(Opcode::Xor, kI32, {a, b});
    const Value signsDiffer = emit(Opcode::SCmpLT, kI1, {signs, imm(0)});
    const Value negQuotient = emit(Opcode::Sub, kI32, {imm(0), quotient});
    const Value signedQuotient = emit(Opcode::Select, kI32, {signsDiffer, negQuotient, quotient});

    const Value saturated =
        emit(Opcode::Select, kI32, {aIsNeg, imm(il::fixed::kMinFixed), imm(il::fixed::kMaxFixed)});
    const Value byZero = emit(Opcode::Select, kI32, {aIsZero, imm(0), saturated});
    return finish(Opcode::Select, kI32, {bIsZero, byZero, signedQuotient}, resultId);
}

Value FixedEmitter::sqrt(Value x, unsigned resultId)
{
    const Value positive = emit(Opcode::SCmpGT, kI1, {x, imm(0)});
    // Run the iteration on 1 for non-positive input; the result is discarded.
    const Value input = emit(Opcode::Select, kI32, {positive, x, imm(1)});
    const Value wide = emit(Opcode::Sext, kI64, {input});
    const Value scaled = emit(Opcode::Shl, kI64, {wide, imm(il::fixed::kFractionalBits)});

    const Value initial = emit(Opcode::AShr, kI64, {scaled, imm(il::fixed::kSqrtGuessShift)});
    const Value tooSmall = emit(Opcode::SCmpLT, kI1, {initial, imm(1)});
    Value guess = emit(Opcode::Select, kI64, {tooSmall, imm(1), initial});

    for (int i = 0; i < il::fixed::kSqrtIterations; ++i)
    {
        const Value inRange = emit(Opcode::SCmpLT, kI1, {guess, imm(il::fixed::kMaxFixed)});
        const Value clamped = emit(Opcode::Select, kI64, {inRange, guess, imm(il::fixed::kMaxFixed)});
        const Value recip = emit(Opcode::UDiv, kI64, {imm(il::fixed::kReciprocalNumerator), clamped});
        const Value product = emit(Opcode::Mul, kI64, {scaled, recip});
        const Value doubled = emit(Opcode::Shl, kI64, {product, imm(1)});
        const Value quotient = emit(Opcode::LShr, kI64, {doubled, imm(il::fixed::kFractionalBits)});
        const Value sum = emit(Opcode::Add, kI64, {guess, quotient});
        const Value halved = emit(Opcode::AShr, kI64, {sum, imm(1)});
        const Value isZero = emit(Opcode::ICmpEq, kI1, {halved, imm(0)});
        guess = emit(Opcode::Select, kI64, {isZero, imm(1), halved});
    }

    const Value rescaled = emit(Opcode::AShr, kI64, {guess, imm(8)});
    const Value root = emit(Opcode::Trunc, kI32, {rescaled});
    return finish(Opcode::Select, kI32, {positive, root, imm(0)}, resultId);
}

Value FixedEmitter::fromInt(Value v, Type from, unsigned resultId)
{
    Value narrow = v;
    if (from.kind == Type::Kind::I64)
        narrow = emit(Opcode::Trunc, kI32, {v});
    else if (from.kind != Type::Kind::I32)
        narrow = emit(Opcode::Sext, kI32, {v});
    return finish(Opcode::Shl, kI32, {narrow, imm(il::fixed::kFractionalBits)}, resultId);
}

Value FixedEmitter::toInt(Value v, Type to, unsigned resultId)
{
    if (to.kind == Type::Kind::I32)
        return finish(Opcode::AShr, kI32, {v, imm(il::fixed::kFractionalBits)}, resultId);
    const Value whole = emit(Opcode::AShr, kI32, {v, imm(il::fixed::kFractionalBits)});
    if (to.kind == Type::Kind::I64)
        return finish(Opcode::Sext, to, {whole}, resultId);
    return finish(Opcode::Trunc, to, {whole}, resultId);
}

std::optional<Opcode> FixedEmitter::compareOpcodeFor(Opcode op)
{
    switch (op)
    {
        case Opcode::FCmpEQ:
            return Opcode::ICmpEq;
        case Opcode::FCmpNE:
            return Opcode::ICmpNe;
        case Opcode::FCmpLT:
            return Opcode::SCmpLT;
        case Opcode::FCmpLE:
            return Opcode::SCmpLE;
        case Opcode::FCmpGT:
            return Opcode::SCmpGT;
        case Opcode::FCmpGE:
            return Opcode::SCmpGE;
        default:
            return std::nullopt;
    }
}

Value FixedEmitter::compare(Opcode op, Value a, Value b, unsigned resultId)
{
    return finish(*compareOpcodeFor(op), kI1, {a, b}, resultId);
}

} // namespace il::transform::lowering
