#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace quantum::support::str {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
std::string replace_all(std::string_view s, std::string_view from, std::string_view to);

// Splits on every occurrence of `delimiter`; keeps empty pieces.
std::vector<std::string> split(std::string_view s, std::string_view delimiter);
std::string join(const std::vector<std::string>& parts, std::string_view separator);

bool is_blank(std::string_view s);

// "UserCard" -> "user_card"
std::string to_snake_case(std::string_view s);

std::string html_escape(std::string_view s);

} // namespace quantum::support::str
