//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/IdentityTransform.cpp
// Purpose: Copy-through transform.
//
//===----------------------------------------------------------------------===//

#include "il/transform/IdentityTransform.hpp"

#include "il/transform/TransformDriver.hpp"

namespace il::transform
{

TransformResult<void> IdentityTransform::beginModule(TransformSession &session)
{
    session.target.externs = session.source.externs;
    return {};
}

TransformResult<void> IdentityTransform::transformInstr(TransformContext &ctx, const il::core::Instr &in)
{
    return copyInstruction(ctx, in);
}

} // namespace il::transform
