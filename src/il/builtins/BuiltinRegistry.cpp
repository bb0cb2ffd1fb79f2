//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: il/builtins/BuiltinRegistry.cpp
// Purpose: Grouping, pairing validation and lookups for builtin implementations.
// Key invariants: create() reports the first invalid group in declaration order.
// Ownership/Lifetime: The registry owns copies of all declarations.
//
//===----------------------------------------------------------------------===//

#include "il/builtins/BuiltinRegistry.hpp"

#include <sstream>

using il::core::AbiParam;
using il::core::Signature;
using il::core::Type;

namespace il::builtins
{

const char *toString(GlslType type)
{
    switch (type)
    {
        case GlslType::Void:
            return "void";
        case GlslType::Bool:
            return "bool";
        case GlslType::Int:
            return "int";
        case GlslType::UInt:
            return "uint";
        case GlslType::Float:
            return "float";
        case GlslType::Vec2:
            return "vec2";
        case GlslType::Vec3:
            return "vec3";
        case GlslType::Vec4:
            return "vec4";
    }
    return "?";
}

const char *toString(ParamQualifier qualifier)
{
    switch (qualifier)
    {
        case ParamQualifier::In:
            return "in";
        case ParamQualifier::Out:
            return "out";
        case ParamQualifier::InOut:
            return "inout";
    }
    return "?";
}

const char *toString(BuiltinVariant variant)
{
    return variant == BuiltinVariant::Float ? "Float" : "FixedPoint";
}

unsigned laneCount(GlslType type)
{
    switch (type)
    {
        case GlslType::Void:
            return 0;
        case GlslType::Vec2:
            return 2;
        case GlslType::Vec3:
            return 3;
        case GlslType::Vec4:
            return 4;
        default:
            return 1;
    }
}

namespace
{
bool isVector(GlslType type)
{
    return laneCount(type) > 1;
}

Type laneType(GlslType type, BuiltinVariant variant)
{
    switch (type)
    {
        case GlslType::Bool:
            return Type(Type::Kind::I1);
        case GlslType::Int:
        case GlslType::UInt:
            return Type(Type::Kind::I32);
        default:
            return Type(variant == BuiltinVariant::Float ? Type::Kind::F32 : Type::Kind::I32);
    }
}
} // namespace

std::string LogicalSignature::key() const
{
    std::string k = name;
    k += '|';
    k += toString(returnType);
    for (const auto &p : params)
    {
        k += '|';
        k += toString(p.qualifier);
        k += ' ';
        k += toString(p.type);
    }
    return k;
}

bool LogicalSignature::sameShape(const LogicalSignature &other) const
{
    if (returnType != other.returnType || params.size() != other.params.size())
        return false;
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (params[i].type != other.params[i].type || params[i].qualifier != other.params[i].qualifier)
            return false;
    }
    return true;
}

std::string toString(const LogicalSignature &sig)
{
    std::ostringstream os;
    os << toString(sig.returnType) << ' ' << sig.name << '(';
    for (size_t i = 0; i < sig.params.size(); ++i)
    {
        if (i)
            os << ", ";
        const auto &p = sig.params[i];
        os << toString(p.qualifier) << ' ' << toString(p.type);
        if (!p.name.empty())
            os << ' ' << p.name;
    }
    os << ')';
    return os.str();
}

Signature flattenToIl(const LogicalSignature &sig, BuiltinVariant variant)
{
    Signature out;
    for (const auto &p : sig.params)
    {
        if (p.qualifier != ParamQualifier::In)
        {
            out.params.emplace_back(Type(Type::Kind::Ptr));
            continue;
        }
        for (unsigned lane = 0; lane < laneCount(p.type); ++lane)
            out.params.emplace_back(laneType(p.type, variant));
    }
    for (unsigned lane = 0; lane < laneCount(sig.returnType); ++lane)
        out.returns.emplace_back(laneType(sig.returnType, variant));
    return out;
}

il::transform::TransformResult<BuiltinRegistry> BuiltinRegistry::create(std::vector<BuiltinImplDecl> decls)
{
    using namespace il::transform;

    // Group by logical signature, preserving declaration order.
    std::vector<std::vector<size_t>> groups;
    std::unordered_map<std::string, size_t> groupOf;
    for (size_t i = 0; i < decls.size(); ++i)
    {
        auto [it, inserted] = groupOf.emplace(decls[i].signature.key(), groups.size());
        if (inserted)
            groups.emplace_back();
        groups[it->second].push_back(i);
    }

    auto countVariant = [&](const std::vector<size_t> &group, BuiltinVariant v)
    {
        size_t n = 0;
        for (size_t idx : group)
            n += decls[idx].variant == v ? 1 : 0;
        return n;
    };

    BuiltinRegistry reg;
    for (const auto &group : groups)
    {
        const BuiltinImplDecl &head = decls[group.front()];
        const std::string &name = head.signature.name;

        const BuiltinImplDecl *untagged = nullptr;
        const BuiltinImplDecl *tagged = nullptr;
        for (size_t idx : group)
        {
            const auto &d = decls[idx];
            if (!d.variant)
            {
                if (untagged)
                    return duplicateBuiltinVariant(name, "Any", untagged->site, d.site);
                untagged = &d;
            }
            else if (!tagged)
            {
                tagged = &d;
            }
        }
        if (untagged && tagged)
            return duplicateBuiltinVariant(name, "Any", untagged->site, tagged->site);

        if (tagged)
        {
            for (BuiltinVariant v : {BuiltinVariant::Float, BuiltinVariant::FixedPoint})
            {
                const BuiltinImplDecl *first = nullptr;
                for (size_t idx : group)
                {
                    if (decls[idx].variant != v)
                        continue;
                    if (first)
                        return duplicateBuiltinVariant(name, toString(v), first->site, decls[idx].site);
                    first = &decls[idx];
                }
            }

            const bool hasFloat = countVariant(group, BuiltinVariant::Float) == 1;
            const bool hasFixed = countVariant(group, BuiltinVariant::FixedPoint) == 1;
            if (!hasFloat || !hasFixed)
            {
                const BuiltinVariant present = hasFloat ? BuiltinVariant::Float : BuiltinVariant::FixedPoint;
                const BuiltinVariant missing = hasFloat ? BuiltinVariant::FixedPoint : BuiltinVariant::Float;

                // A lone variant whose counterpart was declared under the same
                // name with a different shape is a signature disagreement.
                for (const auto &other : groups)
                {
                    if (&other == &group || decls[other.front()].signature.name != name)
                        continue;
                    if (countVariant(other, missing) == 1 && countVariant(other, present) == 0)
                    {
                        const BuiltinImplDecl *counterpart = nullptr;
                        for (size_t idx : other)
                        {
                            if (decls[idx].variant == missing)
                                counterpart = &decls[idx];
                        }
                        const BuiltinImplDecl &floatDecl = hasFloat ? *tagged : *counterpart;
                        const BuiltinImplDecl &fixedDecl = hasFloat ? *counterpart : *tagged;
                        return builtinSignatureMismatch(
                            name, toString(floatDecl.signature), toString(fixedDecl.signature));
                    }
                }
                return missingBuiltinVariant(name, toString(missing), {toString(present)});
            }
        }

        BuiltinDescriptor desc;
        desc.signature = head.signature;
        desc.variantDependent = tagged != nullptr;
        const size_t descIndex = reg.descriptors_.size();
        for (size_t idx : group)
        {
            const size_t implIndex = reg.impls_.size();
            reg.impls_.push_back(decls[idx]);
            reg.owner_.push_back(descIndex);
            reg.bySymbol_.emplace(decls[idx].symbol, implIndex);
            desc.members.push_back(implIndex);
        }
        reg.descriptors_.push_back(std::move(desc));
    }
    return reg;
}

const BuiltinDescriptor *BuiltinRegistry::find(std::string_view name, const std::vector<GlslType> &argTypes) const
{
    for (const auto &desc : descriptors_)
    {
        if (desc.signature.name != name || desc.signature.params.size() != argTypes.size())
            continue;
        bool match = true;
        for (size_t i = 0; i < argTypes.size() && match; ++i)
            match = desc.signature.params[i].type == argTypes[i];
        if (match)
            return &desc;
    }
    return nullptr;
}

const BuiltinImpl *BuiltinRegistry::implementationFor(const BuiltinDescriptor &descriptor,
                                                      BuiltinVariant variant) const
{
    for (size_t idx : descriptor.members)
    {
        const auto &impl = impls_[idx];
        if (impl.variant == variant)
            return &impl;
    }
    for (size_t idx : descriptor.members)
    {
        const auto &impl = impls_[idx];
        if (!impl.variant)
            return &impl;
    }
    return nullptr;
}

std::optional<BuiltinRegistry::SymbolLookup> BuiltinRegistry::findBySymbol(std::string_view symbol) const
{
    auto it = bySymbol_.find(std::string(symbol));
    if (it == bySymbol_.end())
        return std::nullopt;
    return SymbolLookup{&descriptors_[owner_[it->second]], &impls_[it->second]};
}

il::support::Expected<GlslType> BuiltinRegistry::checkCall(std::string_view name,
                                                           const std::vector<GlslType> &argTypes) const
{
    if (const auto *exact = find(name, argTypes))
        return exact->signature.returnType;

    const BuiltinDescriptor *candidate = nullptr;
    for (const auto &desc : descriptors_)
    {
        if (desc.signature.name != name)
            continue;
        if (!candidate || desc.signature.params.size() == argTypes.size())
            candidate = &desc;
        if (desc.signature.params.size() == argTypes.size())
            break;
    }

    std::ostringstream msg;
    if (!candidate)
    {
        msg << "unknown builtin function: " << name;
        return il::support::makeError({}, msg.str());
    }

    const auto &params = candidate->signature.params;
    if (params.size() != argTypes.size())
    {
        msg << "function `" << name << "` expects " << params.size() << " arguments, got " << argTypes.size();
        return il::support::makeError({}, msg.str());
    }

    for (size_t i = 0; i < params.size(); ++i)
    {
        const GlslType want = params[i].type;
        const GlslType got = argTypes[i];
        if (want == got)
            continue;
        msg << "function `" << name << "` parameter `" << params[i].name << "` expects ";
        if (isVector(want) && !isVector(got))
            msg << "vector type `" << toString(want) << "`, got scalar `" << toString(got) << '`';
        else if (!isVector(want) && isVector(got))
            msg << "scalar type `" << toString(want) << "`, got vector `" << toString(got) << '`';
        else
            msg << "type `" << toString(want) << "`, got `" << toString(got) << '`';
        return il::support::makeError({}, msg.str());
    }
    return candidate->signature.returnType;
}

} // namespace il::builtins
