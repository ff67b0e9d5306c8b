#include <quantum/runtime/value.hpp>
#include <quantum/support/str.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace quantum::runtime {

namespace str = support::str;

bool is_truthy(const Value& current)
{
    if (current.is_boolean()) return current.get<bool>();
    if (current.is_null()) return false;
    if (current.is_string()) return !current.get<std::string>().empty();
    if (current.is_number()) return current.get<double>() != 0;
    if (current.is_array() || current.is_object()) return !current.empty();
    return true;
}

std::string to_display(const Value& v)
{
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
            return std::to_string(static_cast<long long>(d));
        }
    }
    return v.dump();
}

static std::optional<Value> parse_number(const std::string& raw)
{
    auto text = str::trim(raw);
    if (text.empty()) return std::nullopt;

    const char* begin = text.c_str();
    char* end = nullptr;
    bool integral = text.find_first_of(".eE") == std::string::npos;
    if (integral) {
        errno = 0;
        long long n = std::strtoll(begin, &end, 10);
        if (end && *end == '\0' && errno == 0) return Value(static_cast<std::int64_t>(n));
    }
    double d = std::strtod(begin, &end);
    if (end && *end == '\0' && std::isfinite(d)) return Value(d);
    return std::nullopt;
}

std::optional<Value> numeric_value(const Value& v)
{
    if (v.is_number()) return v;
    if (v.is_boolean()) return Value(static_cast<std::int64_t>(v.get<bool>() ? 1 : 0));
    if (v.is_null()) return Value(static_cast<std::int64_t>(0));
    if (v.is_string()) return parse_number(v.get<std::string>());
    return std::nullopt;
}

std::optional<double> numeric(const Value& v)
{
    auto n = numeric_value(v);
    if (!n) return std::nullopt;
    return n->get<double>();
}

Value integer_arithmetic(char op, std::int64_t x, std::int64_t y)
{
    std::int64_t out = 0;
    switch (op) {
        case '+':
            if (__builtin_add_overflow(x, y, &out)) return static_cast<double>(x) + static_cast<double>(y);
            return out;
        case '-':
            if (__builtin_sub_overflow(x, y, &out)) return static_cast<double>(x) - static_cast<double>(y);
            return out;
        case '*':
            if (__builtin_mul_overflow(x, y, &out)) return static_cast<double>(x) * static_cast<double>(y);
            return out;
        case '%':
            // INT64_MIN % -1 traps on x86
            if (y == -1) return std::int64_t{0};
            return x % y;
        case '/':
            if (y == -1) return integer_arithmetic('-', 0, x);
            if (x % y == 0) return x / y;
            return static_cast<double>(x) / static_cast<double>(y);
    }
    throw std::invalid_argument(std::string("unknown integer operator '") + op + "'");
}

std::optional<std::int64_t> exact_integer(double d)
{
    // 2^63 is exactly representable; every double below it in magnitude fits
    constexpr double limit = 9223372036854775808.0;
    if (!std::isfinite(d) || d != std::floor(d) || d >= limit || d < -limit) return std::nullopt;
    return static_cast<std::int64_t>(d);
}

bool loosely_equal(const Value& a, const Value& b)
{
    if (a.is_null() || b.is_null()) {
        const Value& other = a.is_null() ? b : a;
        return other.is_null() || (other.is_string() && other.get<std::string>().empty());
    }
    if (a.is_number() || b.is_number()) {
        auto x = numeric(a);
        auto y = numeric(b);
        if (x && y) return *x == *y;
        return false;
    }
    if (a.is_boolean() && b.is_boolean()) return a.get<bool>() == b.get<bool>();
    if (a.is_string() && b.is_string()) return a.get<std::string>() == b.get<std::string>();
    return a == b;
}

int compare(const Value& a, const Value& b)
{
    bool both_strings = a.is_string() && b.is_string();
    if (!both_strings) {
        auto x = numeric(a);
        auto y = numeric(b);
        if (x && y) return *x < *y ? -1 : (*x > *y ? 1 : 0);
    }
    auto left = to_display(a);
    auto right = to_display(b);
    return left < right ? -1 : (left > right ? 1 : 0);
}

std::string type_name(const Value& v)
{
    switch (v.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float: return "decimal";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        default: return "unknown";
    }
}

std::optional<Value> member(const Value& base, const std::string& key)
{
    if (base.is_object()) {
        auto it = base.find(key);
        if (it != base.end()) return *it;
        if (key == "length") return Value(static_cast<std::int64_t>(base.size()));
        return std::nullopt;
    }
    if (base.is_array()) {
        if (key == "length") return Value(static_cast<std::int64_t>(base.size()));
        auto index = parse_number(key);
        if (index && index->is_number_integer()) {
            auto i = index->get<std::int64_t>();
            if (i >= 0 && static_cast<std::size_t>(i) < base.size()) return base[static_cast<std::size_t>(i)];
        }
        return std::nullopt;
    }
    if (base.is_string() && key == "length") {
        return Value(static_cast<std::int64_t>(base.get<std::string>().size()));
    }
    return std::nullopt;
}

Value literal(const std::string& text)
{
    auto trimmed = str::trim(text);
    if (trimmed == "true") return true;
    if (trimmed == "false") return false;
    if (trimmed == "null") return nullptr;
    if (auto n = parse_number(trimmed)) return *n;
    if (!trimmed.empty() && (trimmed.front() == '[' || trimmed.front() == '{')) {
        auto parsed = Value::parse(trimmed, nullptr, false);
        if (!parsed.is_discarded()) return parsed;
    }
    return text;
}

Value coerce(const Value& v, const std::string& raw_type)
{
    auto type = str::to_lower(str::trim(raw_type));
    if (type.empty() || type == "any") return v;

    if (type == "string") return to_display(v);

    if (type == "number" || type == "decimal" || type == "float") {
        if (v.is_null()) return v;
        auto n = numeric_value(v);
        if (!n) throw std::invalid_argument("cannot convert " + type_name(v) + " '" + to_display(v) + "' to " + type);
        if (type == "number") return *n;
        return Value(n->get<double>());
    }

    if (type == "integer" || type == "int") {
        if (v.is_null()) return v;
        auto n = numeric_value(v);
        if (!n) throw std::invalid_argument("cannot convert " + type_name(v) + " '" + to_display(v) + "' to integer");
        if (n->is_number_integer()) return *n;
        double d = n->get<double>();
        auto exact = exact_integer(d);
        if (!exact) {
            throw std::invalid_argument("'" + to_display(v) + "' is not " +
                                        (d == std::floor(d) ? "within the integer range" : "an integer"));
        }
        return Value(*exact);
    }

    if (type == "boolean" || type == "bool") {
        if (v.is_string()) {
            auto lower = str::to_lower(str::trim(v.get<std::string>()));
            if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
            if (lower == "false" || lower == "no" || lower == "0" || lower == "off" || lower.empty()) return false;
            throw std::invalid_argument("cannot convert '" + v.get<std::string>() + "' to boolean");
        }
        return is_truthy(v);
    }

    if (type == "array") {
        if (v.is_array()) return v;
        if (v.is_null()) return Value::array();
        if (v.is_string()) {
            auto parsed = Value::parse(v.get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && parsed.is_array()) return parsed;
            Value out = Value::array();
            if (!v.get<std::string>().empty()) {
                for (auto& item : str::split(v.get<std::string>(), ",")) out.push_back(str::trim(item));
            }
            return out;
        }
        throw std::invalid_argument("cannot convert " + type_name(v) + " to array");
    }

    if (type == "object" || type == "struct") {
        if (v.is_object()) return v;
        if (v.is_null()) return Value::object();
        if (v.is_string()) {
            auto parsed = Value::parse(v.get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object()) return parsed;
        }
        throw std::invalid_argument("cannot convert " + type_name(v) + " to object");
    }

    if (type == "json") {
        if (!v.is_string()) return v;
        auto parsed = Value::parse(v.get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) throw std::invalid_argument("invalid JSON: '" + v.get<std::string>() + "'");
        return parsed;
    }

    throw std::invalid_argument("unknown type '" + raw_type + "'");
}

} // namespace quantum::runtime
