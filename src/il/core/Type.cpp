//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Type.cpp
// Purpose: Implement the helpers for rendering and sizing IL type descriptors.
//
//===----------------------------------------------------------------------===//

#include "il/core/Type.hpp"

namespace il::core
{

Type::Type(Kind k) : kind(k) {}

/// @brief Render an IL type enumerator to its canonical textual spelling.
///
/// Used by diagnostics and the text serialiser to produce stable, lower-case
/// mnemonics.
std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::I1:
            return "i1";
        case Type::Kind::I8:
            return "i8";
        case Type::Kind::I16:
            return "i16";
        case Type::Kind::I32:
            return "i32";
        case Type::Kind::I64:
            return "i64";
        case Type::Kind::F32:
            return "f32";
        case Type::Kind::F64:
            return "f64";
        case Type::Kind::Ptr:
            return "ptr";
    }
    return "";
}

std::string Type::toString() const
{
    return kindToString(kind);
}

size_t sizeInBytes(Type t)
{
    switch (t.kind)
    {
        case Type::Kind::Void:
            return 0;
        case Type::Kind::I1:
        case Type::Kind::I8:
            return 1;
        case Type::Kind::I16:
            return 2;
        case Type::Kind::I32:
        case Type::Kind::F32:
            return 4;
        case Type::Kind::I64:
        case Type::Kind::F64:
            return 8;
        case Type::Kind::Ptr:
            return sizeof(void *);
    }
    return 0;
}

} // namespace il::core
