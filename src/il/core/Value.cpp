//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Value.cpp
// Purpose: Factories and textual rendering for IL operand values.
//
//===----------------------------------------------------------------------===//

#include "il/core/Value.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace il::core
{

Value Value::temp(unsigned t)
{
    Value v{Kind::Temp};
    v.id = t;
    return v;
}

Value Value::constInt(long long v)
{
    Value val{Kind::ConstInt};
    val.i64 = v;
    return val;
}

Value Value::constBool(bool v)
{
    Value val{Kind::ConstInt};
    val.i64 = v ? 1 : 0;
    val.isBool = true;
    return val;
}

Value Value::constFloat(double v)
{
    Value val{Kind::ConstFloat};
    val.f64 = v;
    return val;
}

Value Value::null()
{
    return Value{Kind::NullPtr};
}

bool operator==(const Value &a, const Value &b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case Value::Kind::Temp:
            return a.id == b.id;
        case Value::Kind::ConstInt:
            return a.i64 == b.i64 && a.isBool == b.isBool;
        case Value::Kind::ConstFloat:
            return a.f64 == b.f64;
        case Value::Kind::NullPtr:
            return true;
    }
    return false;
}

namespace
{
/// @brief Shortest decimal spelling that reads back to the same double.
std::string formatFloat(double d)
{
    std::ostringstream os;
    for (int precision = 6; precision <= std::numeric_limits<double>::max_digits10; ++precision)
    {
        os.str("");
        os << std::setprecision(precision) << d;
        std::istringstream in(os.str());
        double back = 0.0;
        in >> back;
        if (back == d)
            break;
    }
    std::string text = os.str();
    if (text.find_first_of(".eEni") == std::string::npos)
        text += ".0";
    return text;
}
} // namespace

std::string toString(const Value &v)
{
    switch (v.kind)
    {
        case Value::Kind::Temp:
            return "%" + std::to_string(v.id);
        case Value::Kind::ConstInt:
            if (v.isBool)
                return v.i64 ? "true" : "false";
            return std::to_string(v.i64);
        case Value::Kind::ConstFloat:
            return formatFloat(v.f64);
        case Value::Kind::NullPtr:
            return "null";
    }
    return "";
}

} // namespace il::core
