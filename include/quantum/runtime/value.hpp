#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace quantum::runtime {

// Every runtime value is a JSON value: null, bool, integer, float, string,
// array or object.
using Value = nlohmann::json;

// false, null, 0, "", [] and {} are false; everything else is true.
bool is_truthy(const Value& value);

// Text form used when a value is emitted or concatenated. null renders as "",
// integral floats drop their fraction, containers render as JSON.
std::string to_display(const Value& value);

// Numeric view of a value: numbers as-is, bools as 1/0, null as 0, strings
// when they hold a complete number. Arrays, objects and other strings have none.
std::optional<double> numeric(const Value& value);

// Like numeric() but keeps integers integral ("42" -> 42, 3.0 stays float).
std::optional<Value> numeric_value(const Value& value);

// Integer arithmetic that widens to a float result instead of overflowing.
// "/" is exact when the quotient is whole. `y` must be non-zero for "/" and "%".
Value integer_arithmetic(char op, std::int64_t x, std::int64_t y);

// The integer equal to `d`, or nullopt when `d` is not finite, has a
// fraction or lies outside the int64 range.
std::optional<std::int64_t> exact_integer(double d);

// Loose equality: numbers compare numerically across types and numeric
// strings, null equals null and "", everything else compares by type+content.
bool loosely_equal(const Value& a, const Value& b);

// Ordering for < <= > >=: numeric when both sides have a numeric view,
// otherwise by display string. Returns <0, 0, >0.
int compare(const Value& a, const Value& b);

// Converts a value to a declared type ("string", "number", "integer",
// "decimal", "boolean", "array", "object"/"struct", "json", "any").
// Throws std::invalid_argument describing the mismatch.
Value coerce(const Value& value, const std::string& type);

// Parses a literal attribute string: JSON literals, numbers, true/false,
// otherwise the raw string.
Value literal(const std::string& text);

std::string type_name(const Value& value);

// Property access shared by scope paths and expressions: object keys,
// numeric array indexes and the "length" of arrays, strings and objects.
// Missing properties yield nullopt.
std::optional<Value> member(const Value& base, const std::string& key);

} // namespace quantum::runtime
