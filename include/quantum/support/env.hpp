#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <quantum/support/str.hpp>

namespace quantum::support {

class Env {
public:
    // Loads KEY=value lines into the process environment. Existing variables
    // are overwritten, matching what a deployment's .env is expected to do.
    static bool load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            auto comment_pos = line.find('#');
            if (comment_pos != std::string::npos) {
                line = line.substr(0, comment_pos);
            }

            line = str::trim(line);
            if (line.empty()) continue;

            if (line.rfind("export ", 0) == 0) {
                line = str::trim(line.substr(7));
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = str::trim(line.substr(0, eq_pos));
            std::string value = str::trim(line.substr(eq_pos + 1));

            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            } else if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }

            setenv(key.c_str(), value.c_str(), 1);
        }

        return true;
    }

    static std::string get(const std::string& key, const std::string& fallback = "") {
        const char* val = std::getenv(key.c_str());
        return val ? std::string(val) : fallback;
    }

    // "1", "true", "yes", "on" -> true; "0", "false", "no", "off" -> false.
    static bool flag(const std::string& key, bool fallback) {
        const char* val = std::getenv(key.c_str());
        if (!val) return fallback;
        auto lower = str::to_lower(str::trim(val));
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
        return fallback;
    }
};

} // namespace quantum::support
