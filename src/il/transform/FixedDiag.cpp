//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/transform/FixedDiag.cpp
// Purpose: Descriptor table and message formatting for FixedDiag.
//
//===----------------------------------------------------------------------===//

#include "qshade/diag/FixedDiag.hpp"

#include <array>

namespace qshade::diag
{
namespace
{
using il::support::Severity;

constexpr std::array<FixedDiagInfo, 6> kInfos = {{
    {"unsupported-instruction",
     "E-FX001",
     Severity::Error,
     "function '{function}': no fixed-point lowering for '{opcode}' ({category})"},
    {"instruction-shape-mismatch",
     "E-FX002",
     Severity::Error,
     "function '{function}': malformed '{opcode}': {detail}"},
    {"missing-builtin-variant",
     "E-FX003",
     Severity::Error,
     "builtin '{builtin}' has no {variant} implementation (declared: {found})"},
    {"duplicate-builtin-variant",
     "E-FX004",
     Severity::Error,
     "builtin '{builtin}' declares its {variant} implementation twice: {first} and {second}"},
    {"builtin-signature-mismatch",
     "E-FX005",
     Severity::Error,
     "builtin '{builtin}' variants disagree: {float} vs {fixed}"},
    {"unknown-builtin-function",
     "E-FX006",
     Severity::Error,
     "function '{function}': call to unknown function '{builtin}'"},
}};
} // namespace

const FixedDiagInfo &getInfo(FixedDiag diag)
{
    return kInfos[static_cast<size_t>(diag)];
}

std::string_view getId(FixedDiag diag)
{
    return getInfo(diag).id;
}

std::string_view getCode(FixedDiag diag)
{
    return getInfo(diag).code;
}

std::string formatMessage(FixedDiag diag, std::initializer_list<Replacement> replacements)
{
    const std::string_view format = getInfo(diag).format;
    std::string out;
    out.reserve(format.size() + 32);
    size_t pos = 0;
    while (pos < format.size())
    {
        const size_t open = format.find('{', pos);
        if (open == std::string_view::npos)
        {
            out.append(format.substr(pos));
            break;
        }
        const size_t close = format.find('}', open);
        if (close == std::string_view::npos)
        {
            out.append(format.substr(pos));
            break;
        }
        out.append(format.substr(pos, open - pos));
        const std::string_view key = format.substr(open + 1, close - open - 1);
        bool replaced = false;
        for (const auto &r : replacements)
        {
            if (r.key == key)
            {
                out.append(r.value);
                replaced = true;
                break;
            }
        }
        if (!replaced)
            out.append(format.substr(open, close - open + 1));
        pos = close + 1;
    }
    return out;
}

} // namespace qshade::diag
