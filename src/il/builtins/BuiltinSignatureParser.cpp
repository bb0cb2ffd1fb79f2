//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the parser that turns the builtin catalog's textual prototypes
// into LogicalSignature records.  Parameters take an optional qualifier
// (in/out/inout, defaulting to in) followed by a type and an optional name.
//
//===----------------------------------------------------------------------===//

#include "il/builtins/BuiltinSignatureParser.hpp"

#include <string>

namespace il::builtins
{
namespace
{

constexpr bool isWhitespace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

/// @brief Split @p text on whitespace into at most a handful of words.
std::vector<std::string_view> words(std::string_view text)
{
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && isWhitespace(text[i]))
            ++i;
        size_t start = i;
        while (i < text.size() && !isWhitespace(text[i]))
            ++i;
        if (i > start)
            out.push_back(text.substr(start, i - start));
    }
    return out;
}

std::optional<ParamQualifier> parseQualifier(std::string_view token)
{
    if (token == "in")
        return ParamQualifier::In;
    if (token == "out")
        return ParamQualifier::Out;
    if (token == "inout")
        return ParamQualifier::InOut;
    return std::nullopt;
}

il::support::Diag malformed(std::string_view text, const std::string &why)
{
    return il::support::makeError({}, "malformed builtin prototype '" + std::string(text) + "': " + why);
}

} // namespace

std::string_view trim(std::string_view text)
{
    while (!text.empty() && isWhitespace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isWhitespace(text.back()))
        text.remove_suffix(1);
    return text;
}

std::vector<std::string_view> splitParamList(std::string_view text)
{
    std::vector<std::string_view> tokens;
    size_t start = 0;
    for (size_t i = 0; i <= text.size(); ++i)
    {
        if (i == text.size() || text[i] == ',')
        {
            auto token = trim(text.substr(start, i - start));
            if (!token.empty())
                tokens.push_back(token);
            start = i + 1;
        }
    }
    return tokens;
}

std::optional<GlslType> parseGlslType(std::string_view token)
{
    token = trim(token);
    if (token == "void")
        return GlslType::Void;
    if (token == "bool")
        return GlslType::Bool;
    if (token == "int")
        return GlslType::Int;
    if (token == "uint")
        return GlslType::UInt;
    if (token == "float")
        return GlslType::Float;
    if (token == "vec2")
        return GlslType::Vec2;
    if (token == "vec3")
        return GlslType::Vec3;
    if (token == "vec4")
        return GlslType::Vec4;
    return std::nullopt;
}

il::support::Expected<LogicalSignature> parseBuiltinPrototype(std::string_view text)
{
    const std::string_view proto = trim(text);
    const auto open = proto.find('(');
    const auto close = proto.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close <= open)
        return malformed(proto, "missing parameter list");

    const auto head = words(proto.substr(0, open));
    if (head.size() != 2)
        return malformed(proto, "expected '<type> <name>' before '('");

    LogicalSignature sig;
    const auto ret = parseGlslType(head[0]);
    if (!ret)
        return malformed(proto, "unknown return type '" + std::string(head[0]) + "'");
    sig.returnType = *ret;
    sig.name = std::string(head[1]);

    for (auto token : splitParamList(proto.substr(open + 1, close - open - 1)))
    {
        auto parts = words(token);
        BuiltinParam param;
        size_t next = 0;
        if (auto q = parseQualifier(parts[0]))
        {
            param.qualifier = *q;
            ++next;
        }
        if (next >= parts.size())
            return malformed(proto, "parameter '" + std::string(token) + "' has no type");
        const auto type = parseGlslType(parts[next]);
        if (!type || *type == GlslType::Void)
            return malformed(proto, "unknown parameter type '" + std::string(parts[next]) + "'");
        param.type = *type;
        ++next;
        if (next < parts.size())
            param.name = std::string(parts[next++]);
        if (next != parts.size())
            return malformed(proto, "unexpected tokens in parameter '" + std::string(token) + "'");
        sig.params.push_back(std::move(param));
    }
    return sig;
}

} // namespace il::builtins
