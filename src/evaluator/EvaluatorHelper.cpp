#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "evaluator.hpp"

// ----------------- Evaluator helpers -----------------

static std::string value_type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    return "unknown";
}

std::string Evaluator::type_name(const Value& v) const {
    return value_type_name(v);
}

// Numbers always show a fractional part: 8.0, -3.0, 0.5, 1e+16, 1e-05.
std::string Evaluator::format_number(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    char buf[64];
    if (std::floor(d) == d && std::fabs(d) < 1e16) {
        std::snprintf(buf, sizeof(buf), "%.1f", d);
        return buf;
    }

    // shortest %g form that reads back to the same double
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }

    std::string s = buf;
    if (s.find('.') == std::string::npos && s.find('e') == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string Evaluator::to_string_value(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return "հեչ";
    if (std::holds_alternative<double>(v)) return format_number(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "այո" : "ոչ";
    if (std::holds_alternative<FunctionPtr>(v)) {
        FunctionPtr fn = std::get<FunctionPtr>(v);
        return "[գործ " + (fn ? fn->name : std::string("<null>")) + "]";
    }
    return "";
}

// only հեչ and ոչ are falsy
bool Evaluator::to_bool(const Value& v) const {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    if (std::holds_alternative<std::monostate>(v)) return false;
    return true;
}

bool Evaluator::is_equal(const Value& a, const Value& b) const {
    // different variants are never equal
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;

    // numbers (nan != nan, 0.0 == -0.0)
    if (std::holds_alternative<double>(a))
        return std::get<double>(a) == std::get<double>(b);

    if (std::holds_alternative<bool>(a))
        return std::get<bool>(a) == std::get<bool>(b);

    if (std::holds_alternative<std::string>(a))
        return std::get<std::string>(a) == std::get<std::string>(b);

    // functions: identity
    if (std::holds_alternative<FunctionPtr>(a))
        return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);

    return false;
}
