//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Signature.cpp
// Purpose: Signature queries and textual rendering.
//
//===----------------------------------------------------------------------===//

#include "il/core/Signature.hpp"

#include <sstream>

namespace il::core
{

int Signature::structReturnIndex() const
{
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (params[i].purpose == ArgumentPurpose::StructReturn)
            return static_cast<int>(i);
    }
    return -1;
}

std::vector<Type> Signature::normalParamTypes() const
{
    std::vector<Type> types;
    for (const auto &p : params)
    {
        if (p.purpose == ArgumentPurpose::Normal)
            types.push_back(p.type);
    }
    return types;
}

std::vector<Type> Signature::returnTypes() const
{
    std::vector<Type> types;
    types.reserve(returns.size());
    for (const auto &r : returns)
        types.push_back(r.type);
    return types;
}

bool Signature::mentionsFloat() const
{
    for (const auto &p : params)
    {
        if (p.type.isFloat())
            return true;
    }
    for (const auto &r : returns)
    {
        if (r.type.isFloat())
            return true;
    }
    return false;
}

namespace
{
void printList(std::ostringstream &os, const std::vector<AbiParam> &list)
{
    os << '(';
    for (size_t i = 0; i < list.size(); ++i)
    {
        if (i)
            os << ", ";
        if (list[i].purpose == ArgumentPurpose::StructReturn)
            os << "sret ";
        os << list[i].type.toString();
    }
    os << ')';
}
} // namespace

std::string toString(const Signature &sig)
{
    std::ostringstream os;
    printList(os, sig.params);
    os << " -> ";
    printList(os, sig.returns);
    return os.str();
}

Signature makeSignature(const std::vector<Type> &params, const std::vector<Type> &returns)
{
    Signature sig;
    for (Type t : params)
        sig.params.emplace_back(t);
    for (Type t : returns)
        sig.returns.emplace_back(t);
    return sig;
}

} // namespace il::core
