// include/quantum/core/errors.hpp
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace quantum::core {

struct SourceLocation {
    std::string file;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] bool known() const { return line > 0; }
    [[nodiscard]] std::string to_string() const;
};

// Base of every error the runtime reports to its host.
class Error : public std::runtime_error {
public:
    Error(const std::string& message, SourceLocation location = {});

    const SourceLocation& location() const { return location_; }
    const std::string& message() const { return message_; }

private:
    std::string message_;
    SourceLocation location_;
};

// Malformed markup, a missing mandatory attribute or child, invalid nesting.
class ParseError : public Error {
public:
    using Error::Error;
};

// Missing required parameter or a failed type coercion while binding one.
class ParamError : public Error {
public:
    ParamError(const std::string& parameter, const std::string& message, SourceLocation location = {});

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Databinding expression failed to compile or to evaluate.
class EvaluationError : public Error {
public:
    EvaluationError(const std::string& message, std::string expression, std::size_t offset, SourceLocation location = {});

    const std::string& expression() const { return expression_; }
    std::size_t offset() const { return offset_; }

    // Same error, pinned to the node that evaluated the expression.
    [[nodiscard]] EvaluationError at(const SourceLocation& location) const;

private:
    std::string expression_;
    std::size_t offset_;
};

// Anything an executor or a collaborator raised while running a node.
class ExecutionError : public Error {
public:
    using Error::Error;
};

// Internal to the caches; never escapes them.
class CacheError : public Error {
public:
    using Error::Error;
};

} // namespace quantum::core
