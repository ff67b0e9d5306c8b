#pragma once

#include <quantum/runtime/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quantum::runtime {

// What an expression can see while it is evaluated. The execution context
// implements it; tests can provide a map-backed one.
class ExpressionEnvironment {
public:
    virtual ~ExpressionEnvironment() = default;

    // Dotted names ("user.name", "session.cart") arrive whole. Undefined
    // names return nullopt.
    virtual std::optional<Value> lookup(const std::string& name) const = 0;

    // User-defined functions. nullopt means no function of that name.
    virtual std::optional<Value> call_function(const std::string& name, const std::vector<Value>& args) = 0;
};

struct ExprNode {
    enum Kind { LITERAL, NAME, MEMBER, INDEX, UNARY, BINARY, AND, OR, TERNARY, CALL, ARRAY, OBJECT } kind = LITERAL;
    Value literal;                  // LITERAL
    std::string text;               // NAME path, MEMBER key, operator, CALL name
    std::vector<std::string> keys;  // OBJECT keys, parallel to children
    std::vector<std::shared_ptr<const ExprNode>> children;
    std::size_t offset = 0;
};

// Immutable compiled form of one databinding expression. Holds no
// per-request state, so one instance serves every evaluation of that text.
class CompiledExpression {
public:
    // Throws core::EvaluationError on a syntax error.
    static std::shared_ptr<const CompiledExpression> compile(std::string_view text);

    // Trimmed, with one enclosing {...} pair removed.
    static std::string normalize(std::string_view text);

    // Throws core::EvaluationError on a runtime failure (division by zero,
    // arithmetic on non-numbers, unknown function).
    Value evaluate(ExpressionEnvironment& env) const;

    const std::string& source() const { return source_; }

private:
    struct ConstructionKey {};

public:
    // Reachable only through compile().
    CompiledExpression(ConstructionKey, std::string source, std::shared_ptr<const ExprNode> root);

private:

    std::string source_;
    std::shared_ptr<const ExprNode> root_;
};

using CompiledExpressionPtr = std::shared_ptr<const CompiledExpression>;

// Names of the built-in functions available to every expression.
const std::vector<std::string>& builtin_functions();

} // namespace quantum::runtime
