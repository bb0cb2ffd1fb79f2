//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `qfxc` developer driver.  Subcommands validate the builtin
// catalog, print the return plans chosen for each builtin on a target, and run
// a small shader through the fixed-point pipeline next to its float original.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point and subcommands for the `qfxc` driver.

#include "codegen/abi/ReturnAbi.hpp"
#include "codegen/abi/Target.hpp"
#include "il/build/IRBuilder.hpp"
#include "il/builtins/BuiltinCatalog.hpp"
#include "il/fixed/FixedPoint.hpp"
#include "il/interp/Interpreter.hpp"
#include "il/io/Serializer.hpp"
#include "il/transform/Pipeline.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace il::core;
namespace abi = qshade::codegen::abi;

namespace
{

void usage()
{
    std::cerr << "Usage: qfxc selfcheck\n"
              << "       qfxc abi [--target <name>]\n"
              << "       qfxc demo [--target <name>] [--trace] [-print-before] [-print-after]\n"
              << "\nTargets: host";
    for (const auto *t : abi::TargetInfo::all())
        std::cerr << ", " << t->name;
    std::cerr << "\n";
}

/// @brief Parse `--target <name>`; reports and returns false when malformed.
bool parseTarget(int &i, int argc, char **argv, std::string &target)
{
    if (i + 1 >= argc)
    {
        std::cerr << "--target requires a value\n";
        return false;
    }
    target = argv[++i];
    if (!abi::TargetInfo::byName(target))
    {
        std::cerr << "unknown target '" << target << "'\n";
        return false;
    }
    return true;
}

const il::builtins::BuiltinRegistry *registryOrReport()
{
    const auto &registry = il::builtins::defaultBuiltinRegistry();
    if (!registry)
    {
        il::support::printDiag(registry.error().toDiag(), std::cerr);
        return nullptr;
    }
    return &registry.value();
}

int cmdSelfcheck()
{
    const auto *registry = registryOrReport();
    if (!registry)
        return 1;
    for (const auto &desc : registry->descriptors())
    {
        std::cout << il::builtins::toString(desc.signature) << "\n";
        for (size_t idx : desc.members)
        {
            const auto &impl = registry->implementations()[idx];
            std::cout << "  " << (impl.variant ? il::builtins::toString(*impl.variant) : std::string("Any"))
                      << " -> " << impl.symbol << " (" << impl.site << ")\n";
        }
    }
    std::cout << registry->descriptors().size() << " builtins, " << registry->implementations().size()
              << " implementations: ok\n";
    return 0;
}

int cmdAbi(int argc, char **argv)
{
    std::string targetName = "host";
    for (int i = 0; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--target")
        {
            if (!parseTarget(i, argc, argv, targetName))
                return 1;
            continue;
        }
        usage();
        return 1;
    }
    const auto &target = *abi::TargetInfo::byName(targetName);
    const auto *registry = registryOrReport();
    if (!registry)
        return 1;

    std::cout << "target " << target.name << "\n";
    il::support::DiagnosticEngine de;
    for (const auto &desc : registry->descriptors())
    {
        const auto variant = il::builtins::BuiltinVariant::FixedPoint;
        const auto *impl = registry->implementationFor(desc, variant);
        if (!impl)
            continue;
        const Signature sig = il::builtins::flattenToIl(desc.signature, variant);
        auto plan = abi::classifyReturns(sig.returnTypes(), target);
        if (!plan)
        {
            de.report(plan.error());
            continue;
        }
        std::cout << "  " << impl->symbol << ": " << abi::describe(plan.value(), target) << "\n";
    }
    de.printAll(std::cerr);
    return de.errorCount() == 0 ? 0 : 1;
}

/// @brief Float shader computing `(a + b) * c`.
Module buildDemoModule()
{
    Module m;
    il::build::IRBuilder b(m);
    const Type f32(Type::Kind::F32);
    auto &fn = b.startFunction("shade", makeSignature({f32, f32, f32}, {f32}));
    auto &entry = b.addEntryBlock(fn, "entry");
    b.setInsertPoint(entry);
    Value sum = b.binary(Opcode::FAdd, f32, b.blockParam(entry, 0), b.blockParam(entry, 1));
    Value prod = b.binary(Opcode::FMul, f32, sum, b.blockParam(entry, 2));
    b.ret({prod});
    return m;
}

int cmdDemo(int argc, char **argv)
{
    il::support::Options opts;
    for (int i = 0; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--target")
        {
            if (!parseTarget(i, argc, argv, opts.target))
                return 1;
        }
        else if (arg == "--trace")
            opts.trace = true;
        else if (arg == "-print-before")
            opts.printBefore = true;
        else if (arg == "-print-after")
            opts.printAfter = true;
        else
        {
            usage();
            return 1;
        }
    }
    opts.traceStream = &std::cerr;

    const Module source = buildDemoModule();
    auto lowered = il::transform::runFixedPointPipeline(source, opts);
    if (!lowered)
    {
        il::support::printDiag(lowered.error(), std::cerr);
        return 1;
    }
    il::io::Serializer::write(lowered.value(), std::cout);

    const double a = 1.5;
    const double b = 2.5;
    const double c = 2.0;

    il::interp::Interpreter floatRun(source);
    auto ref = floatRun.call("shade",
                             {il::interp::Slot::fromFloat(a), il::interp::Slot::fromFloat(b),
                              il::interp::Slot::fromFloat(c)});
    if (!ref)
    {
        il::support::printDiag(ref.error(), std::cerr);
        return 1;
    }

    il::interp::Interpreter fixedRun(lowered.value(), registryOrReport());
    auto got = fixedRun.call("shade",
                             {il::interp::Slot::fromInt(il::fixed::toFixed(a)),
                              il::interp::Slot::fromInt(il::fixed::toFixed(b)),
                              il::interp::Slot::fromInt(il::fixed::toFixed(c))});
    if (!got)
    {
        il::support::printDiag(got.error(), std::cerr);
        return 1;
    }

    const double fixedResult = il::fixed::toFloat(static_cast<int32_t>(got.value()[0].i64));
    std::cout << "float:   (" << a << " + " << b << ") * " << c << " = " << ref.value()[0].f64 << "\n";
    std::cout << "fixed32: (" << a << " + " << b << ") * " << c << " = " << fixedResult << " (0x" << std::hex
              << static_cast<uint32_t>(got.value()[0].i64) << std::dec << ")\n";
    return fixedResult == ref.value()[0].f64 ? 0 : 1;
}

} // namespace

/// @brief Program entry for the `qfxc` command-line tool.
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        usage();
        return 1;
    }
    std::string_view cmd = argv[1];
    if (cmd == "selfcheck" && argc == 2)
        return cmdSelfcheck();
    if (cmd == "abi")
        return cmdAbi(argc - 2, argv + 2);
    if (cmd == "demo")
        return cmdDemo(argc - 2, argv + 2);
    usage();
    return 1;
}
