//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Expands Builtins.def into declaration rows and owns the process-wide default
// registry.  Each row records its position in Builtins.def as the declaration
// site so registry diagnostics point at the offending catalog line.
//
//===----------------------------------------------------------------------===//

#include "il/builtins/BuiltinCatalog.hpp"

#include "il/builtins/BuiltinHandlers.hpp"
#include "il/builtins/BuiltinSignatureParser.hpp"
#include "runtime/builtins/qs_builtins.h"

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

namespace il::builtins
{
namespace
{

namespace tag
{
constexpr std::optional<BuiltinVariant> Float{BuiltinVariant::Float};
constexpr std::optional<BuiltinVariant> FixedPoint{BuiltinVariant::FixedPoint};
constexpr std::optional<BuiltinVariant> Any{};
} // namespace tag

struct CatalogRow
{
    const char *prototype;
    std::optional<BuiltinVariant> variant;
    const char *symbol;
    const void *address;
    BuiltinHandler handler;
    int line;
};

#define QS_BUILTIN(PROTO, VARIANT, SYMBOL, RET, ...)                                                        \
    CatalogRow{PROTO,                                                                                       \
               tag::VARIANT,                                                                                \
               #SYMBOL,                                                                                     \
               reinterpret_cast<const void *>(&SYMBOL),                                                     \
               &DirectHandler<&SYMBOL, RET, __VA_ARGS__>::invoke,                                           \
               __LINE__},

const CatalogRow kCatalogRows[] = {
#include "il/builtins/Builtins.def"
};

} // namespace

il::support::Expected<std::vector<BuiltinImplDecl>> builtinCatalog()
{
    std::vector<BuiltinImplDecl> decls;
    decls.reserve(std::size(kCatalogRows));
    for (const auto &row : kCatalogRows)
    {
        auto sig = parseBuiltinPrototype(row.prototype);
        if (!sig)
            return sig.error();

        BuiltinImplDecl decl;
        decl.signature = std::move(sig).value();
        decl.variant = row.variant;
        decl.symbol = row.symbol;
        decl.site = "Builtins.def:" + std::to_string(row.line);
        decl.address = row.address;
        decl.handler = row.handler;
        decls.push_back(std::move(decl));
    }
    return decls;
}

const il::transform::TransformResult<BuiltinRegistry> &defaultBuiltinRegistry()
{
    static const il::transform::TransformResult<BuiltinRegistry> registry = []()
        -> il::transform::TransformResult<BuiltinRegistry>
    {
        auto decls = builtinCatalog();
        if (!decls)
        {
            // A catalog prototype that does not parse is a malformed
            // declaration; surface it as a signature problem.
            il::transform::TransformError err{qshade::diag::FixedDiag::BuiltinSignatureMismatch};
            err.message = decls.error().message;
            return err;
        }
        return BuiltinRegistry::create(std::move(decls).value());
    }();
    return registry;
}

} // namespace il::builtins
