#include <quantum/support/str.hpp>

#include <algorithm>
#include <cctype>

namespace quantum::support::str {

std::string trim(std::string_view s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }

    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }

    return std::string{s.substr(start, end - start)};
}

std::string to_lower(std::string_view s)
{
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view s)
{
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string replace_all(std::string_view s, std::string_view from, std::string_view to)
{
    if (from.empty()) {
        return std::string{s};
    }

    std::string out;
    out.reserve(s.size());

    std::size_t i = 0;
    while (i < s.size()) {
        if (i + from.size() <= s.size() && s.substr(i, from.size()) == from) {
            out.append(to);
            i += from.size();
        } else {
            out.push_back(s[i]);
            ++i;
        }
    }

    return out;
}

std::vector<std::string> split(std::string_view s, std::string_view delimiter)
{
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.emplace_back(s);
        return parts;
    }

    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(separator);
        out.append(parts[i]);
    }
    return out;
}

bool is_blank(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string to_snake_case(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 4);
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isupper(c)) {
            if (i > 0 && s[i - 1] != '_' && s[i - 1] != '/') out.push_back('_');
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string html_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

} // namespace quantum::support::str
