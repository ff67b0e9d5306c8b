#pragma once

#include <quantum/runtime/expression_cache.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace quantum::runtime {

// Resolves {expr} bindings embedded in attribute values and text.
class Interpolator {
public:
    explicit Interpolator(ExpressionCache& cache) : cache_(cache) {}

    // A value that is exactly one {expr} yields the raw value; anything else
    // yields the interpolated string.
    Value evaluate(std::string_view text, ExpressionEnvironment& env) const;

    // Every balanced {...} replaced by its display string. "\{" is a literal brace.
    std::string interpolate(std::string_view text, ExpressionEnvironment& env) const;

    // Inner text of `text` when it is a single {expr} and nothing else.
    static std::optional<std::string> sole_expression(std::string_view text);

    static bool has_bindings(std::string_view text);

private:
    ExpressionCache& cache_;
};

} // namespace quantum::runtime
