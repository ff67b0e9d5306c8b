#include <quantum/runtime/interpolator.hpp>
#include <quantum/support/str.hpp>

namespace quantum::runtime {

// Index of the '}' closing the '{' at `open`, skipping quoted strings.
static std::size_t find_close(std::string_view text, std::size_t open)
{
    int depth = 0;
    char quote = 0;
    for (std::size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '{') ++depth;
        else if (c == '}' && --depth == 0) return i;
    }
    return std::string_view::npos;
}

std::optional<std::string> Interpolator::sole_expression(std::string_view text)
{
    auto trimmed = support::str::trim(text);
    if (trimmed.size() < 3 || trimmed.front() != '{' || trimmed.back() != '}') return std::nullopt;
    if (find_close(trimmed, 0) != trimmed.size() - 1) return std::nullopt;
    auto inner = support::str::trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
    if (inner.empty()) return std::nullopt;
    return inner;
}

bool Interpolator::has_bindings(std::string_view text)
{
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == '{') {
            ++i;
            continue;
        }
        if (text[i] == '{') {
            auto close = find_close(text, i);
            if (close != std::string_view::npos && close > i + 1) return true;
        }
    }
    return false;
}

Value Interpolator::evaluate(std::string_view text, ExpressionEnvironment& env) const
{
    // the cache strips the enclosing braces, exactly once
    if (sole_expression(text)) {
        return cache_.evaluate(text, env);
    }
    return interpolate(text, env);
}

std::string Interpolator::interpolate(std::string_view text, ExpressionEnvironment& env) const
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '{' || text[i + 1] == '}')) {
            out += text[i + 1];
            i += 2;
            continue;
        }
        if (c == '{') {
            auto close = find_close(text, i);
            // unbalanced or empty braces are ordinary text
            if (close == std::string_view::npos || close == i + 1) {
                out += c;
                ++i;
                continue;
            }
            auto binding = text.substr(i, close - i + 1);
            if (support::str::is_blank(binding.substr(1, binding.size() - 2))) {
                out.append(binding);
            } else {
                out += to_display(cache_.evaluate(binding, env));
            }
            i = close + 1;
            continue;
        }
        out += c;
        ++i;
    }
    return out;
}

} // namespace quantum::runtime
