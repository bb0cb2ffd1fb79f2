//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/transform/Pipeline.cpp
// Purpose: Registry check, fixed-point rewrite, verification and tracing.
//
//===----------------------------------------------------------------------===//

#include "il/transform/Pipeline.hpp"

#include "codegen/abi/Target.hpp"
#include "il/builtins/BuiltinCatalog.hpp"
#include "il/io/Serializer.hpp"
#include "il/transform/TransformDriver.hpp"
#include "il/transform/fixed/FixedPointTransform.hpp"
#include "il/verify/Verifier.hpp"

using il::support::Expected;
using il::support::Options;

namespace il::transform
{
namespace
{
constexpr const char *kTag = "[fixed32] ";

void dump(std::ostream &os, const char *when, const il::core::Module &m)
{
    for (const auto &fn : m.functions)
    {
        os << kTag << when << " @" << fn.name << "\n";
        il::io::Serializer::write(fn, os);
    }
}
} // namespace

Expected<il::core::Module> runFixedPointPipeline(const il::core::Module &module,
                                                 const Options &options,
                                                 const TransformResult<il::builtins::BuiltinRegistry> &registry)
{
    std::ostream *trace = options.traceStream;

    if (!registry)
    {
        if (trace && options.trace)
            *trace << kTag << "builtin registry rejected: " << registry.error().message << "\n";
        return registry.error().toDiag();
    }

    const auto *target = qshade::codegen::abi::TargetInfo::byName(options.target);
    if (!target)
        return il::support::makeError({}, "unknown target '" + options.target + "'");

    if (trace && options.trace)
    {
        *trace << kTag << "target " << target->name << ", " << module.functions.size() << " function(s), "
               << registry.value().descriptors().size() << " builtin(s)\n";
    }
    if (trace && options.printBefore)
        dump(*trace, "before", module);

    FixedPointTransform transform(registry.value(), *target);
    auto lowered = transformModule(module, transform, options.trace ? trace : nullptr);
    if (!lowered)
        return lowered.error().toDiag();

    if (trace && options.printAfter)
        dump(*trace, "after", lowered.value());

    if (options.verify)
    {
        if (auto ok = il::verify::Verifier::verify(lowered.value()); !ok)
            return ok.error();
        for (const auto &fn : lowered.value().functions)
        {
            if (auto ok = il::verify::Verifier::verifyNoFloat(fn); !ok)
                return ok.error();
        }
        if (trace && options.trace)
            *trace << kTag << "verified\n";
    }
    return std::move(lowered).value();
}

Expected<il::core::Module> runFixedPointPipeline(const il::core::Module &module, const Options &options)
{
    return runFixedPointPipeline(module, options, il::builtins::defaultBuiltinRegistry());
}

} // namespace il::transform
