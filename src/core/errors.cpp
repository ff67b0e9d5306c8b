#include <quantum/core/errors.hpp>

#include <utility>

namespace quantum::core {

std::string SourceLocation::to_string() const
{
    std::string out = file.empty() ? "<source>" : file;
    if (line > 0) {
        out += ":" + std::to_string(line);
        if (column > 0) out += ":" + std::to_string(column);
    }
    return out;
}

static std::string with_location(const std::string& message, const SourceLocation& location)
{
    if (!location.known()) return message;
    return location.to_string() + ": " + message;
}

Error::Error(const std::string& message, SourceLocation location)
    : std::runtime_error(with_location(message, location)), message_(message), location_(std::move(location))
{
}

ParamError::ParamError(const std::string& parameter, const std::string& message, SourceLocation location)
    : Error(message, std::move(location)), parameter_(parameter)
{
}

EvaluationError::EvaluationError(const std::string& message, std::string expression, std::size_t offset, SourceLocation location)
    : Error(message + " in expression '" + expression + "' at offset " + std::to_string(offset), std::move(location)),
      expression_(std::move(expression)), offset_(offset)
{
}

EvaluationError EvaluationError::at(const SourceLocation& location) const
{
    // message() already carries the expression suffix; rebuild from the raw parts.
    std::string raw = message();
    auto suffix = raw.rfind(" in expression '");
    if (suffix != std::string::npos) raw = raw.substr(0, suffix);
    return EvaluationError(raw, expression_, offset_, location);
}

} // namespace quantum::core
