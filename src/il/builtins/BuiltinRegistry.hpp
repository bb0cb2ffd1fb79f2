//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/builtins/BuiltinRegistry.hpp
// Purpose: Registry pairing the Float and FixedPoint implementations of each
//          shader builtin and answering call-site lookups.
// Key invariants: Implementations are grouped by logical signature (name,
//                 return type, parameter types and qualifiers; the variant tag
//                 is not part of the key).  A variant-dependent group holds
//                 exactly one Float and one FixedPoint member of equal shape.
//                 Domain-independent helpers (integer hashing) have a single
//                 untagged member used by both domains.
// Ownership/Lifetime: Immutable after create(); lookups are pure reads and
//                     returned pointers live as long as the registry.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Signature.hpp"
#include "il/transform/TransformError.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace il::builtins
{

/// @brief Shader-language types that appear in builtin signatures.
enum class GlslType
{
    Void,
    Bool,
    Int,
    UInt,
    Float,
    Vec2,
    Vec3,
    Vec4
};

/// @brief Parameter passing direction.
enum class ParamQualifier
{
    In,
    Out,
    InOut
};

/// @brief Numeric domain an implementation serves.
enum class BuiltinVariant
{
    Float,
    FixedPoint
};

const char *toString(GlslType type);
const char *toString(ParamQualifier qualifier);
const char *toString(BuiltinVariant variant);

/// @brief Scalar lanes occupied by @p type (vec3 -> 3, void -> 0).
unsigned laneCount(GlslType type);

struct BuiltinParam
{
    std::string name;
    GlslType type = GlslType::Float;
    ParamQualifier qualifier = ParamQualifier::In;
};

/// @brief Shader-level signature of a builtin implementation.
struct LogicalSignature
{
    std::string name;
    GlslType returnType = GlslType::Void;
    std::vector<BuiltinParam> params;

    /// @brief Grouping key: name, return type and (type, qualifier) per parameter.
    [[nodiscard]] std::string key() const;

    /// @brief Structural equality ignoring function and parameter names.
    [[nodiscard]] bool sameShape(const LogicalSignature &other) const;
};

/// @brief Render as "vec3 lpfx_hue2rgb(in float hue)".
std::string toString(const LogicalSignature &sig);

/// @brief Typed adapter invoking a native implementation with boxed arguments.
/// @details args[i] points at the i-th scalar lane; result receives the native
///          return value (a scalar or a struct of lanes).
using BuiltinHandler = void (*)(void **args, void *result);

/// @brief One implementation as declared by the builtin catalog.
struct BuiltinImplDecl
{
    LogicalSignature signature;
    std::optional<BuiltinVariant> variant; ///< nullopt for domain-independent helpers.
    std::string symbol;                    ///< Linker symbol called by generated code.
    std::string site;                      ///< Declaration site used in diagnostics.
    const void *address = nullptr;         ///< Native entry point; nullptr when not linked in.
    BuiltinHandler handler = nullptr;      ///< Adapter used by the interpreter.
};

using BuiltinImpl = BuiltinImplDecl;

/// @brief A validated logical builtin and its implementations.
struct BuiltinDescriptor
{
    LogicalSignature signature;
    bool variantDependent = false;
    std::vector<size_t> members; ///< Indices into BuiltinRegistry::implementations().
};

/// @brief Lower @p sig to an IL signature for @p variant.
/// @details vecN expands to N scalar lanes; float lanes become f32 for Float
///          and i32 for FixedPoint; int/uint become i32, bool i1; out/inout
///          parameters travel as ptr.  Multi-lane returns become multiple
///          IL returns.
il::core::Signature flattenToIl(const LogicalSignature &sig, BuiltinVariant variant);

class BuiltinRegistry
{
  public:
    /// @brief Validate @p decls and build the registry.
    static il::transform::TransformResult<BuiltinRegistry> create(std::vector<BuiltinImplDecl> decls);

    /// @brief Exact match on name and argument types; nullptr for unknown functions.
    [[nodiscard]] const BuiltinDescriptor *find(std::string_view name,
                                                const std::vector<GlslType> &argTypes) const;

    /// @brief Implementation serving @p variant; domain-independent builtins
    ///        return their single implementation for either variant.
    [[nodiscard]] const BuiltinImpl *implementationFor(const BuiltinDescriptor &descriptor,
                                                       BuiltinVariant variant) const;

    struct SymbolLookup
    {
        const BuiltinDescriptor *descriptor;
        const BuiltinImpl *impl;
    };

    /// @brief Resolve an implementation symbol back to its logical builtin.
    [[nodiscard]] std::optional<SymbolLookup> findBySymbol(std::string_view symbol) const;

    /// @brief Frontend-side check of a call: argument count and types.
    /// @return The builtin's return type or a diagnostic describing the mismatch.
    [[nodiscard]] il::support::Expected<GlslType> checkCall(std::string_view name,
                                                            const std::vector<GlslType> &argTypes) const;

    [[nodiscard]] const std::vector<BuiltinDescriptor> &descriptors() const
    {
        return descriptors_;
    }

    [[nodiscard]] const std::vector<BuiltinImpl> &implementations() const
    {
        return impls_;
    }

  private:
    std::vector<BuiltinImpl> impls_;
    std::vector<BuiltinDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> bySymbol_;
    std::vector<size_t> owner_; ///< impl index -> descriptor index
};

} // namespace il::builtins
