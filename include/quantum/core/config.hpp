// include/quantum/core/config.hpp
#pragma once
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <quantum/core/logger.hpp>

namespace quantum::core {

// Flat key/value configuration. Every *.json file in a directory is loaded and
// flattened to "<file>.<key>.<sub>" keys, so config/runtime.json's
// {"cache": {"ast": {"max_items": 64}}} becomes "runtime.cache.ast.max_items".
class Config {
public:
    Config() = default;

    explicit Config(const std::filesystem::path& config_path) {
        load_from_path(config_path);
    }

    void load_from_path(const std::filesystem::path& config_path) {
        if (!std::filesystem::exists(config_path)) {
            return;
        }

        for (const auto& entry : std::filesystem::directory_iterator(config_path)) {
            if (entry.path().extension() == ".json") {
                load_json_file(entry.path());
            }
        }
    }

    // Merge a JSON document under `prefix` (used by tests and embedders that
    // build configuration in memory).
    void merge(const std::string& prefix, const nlohmann::json& json) {
        flatten_json(json, prefix);
    }

    std::string get(const std::string& key, const std::string& fallback = {}) const {
        auto it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }

    template<typename T>
    T get_as(const std::string& key, T fallback = T()) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return fallback;
        }

        try {
            if constexpr (std::is_same_v<T, std::string>) {
                return it->second;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string lower = it->second;
                std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
                if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
                if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
                return fallback;
            } else if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::stoll(it->second));
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(it->second));
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                return split_array(it->second);
            }
        } catch (const std::logic_error&) {
            // stoll/stod reject the value: keep the fallback
            return fallback;
        }

        return fallback;
    }

    void set(std::string key, std::string value) {
        values_[std::move(key)] = std::move(value);
    }

    template<typename T>
    void set(const std::string& key, T value) {
        if constexpr (std::is_convertible_v<T, std::string>) {
            set(key, std::string(value));
        } else if constexpr (std::is_same_v<T, bool>) {
            set(key, std::string(value ? "true" : "false"));
        } else {
            set(key, std::to_string(value));
        }
    }

    bool has(const std::string& key) const {
        return values_.contains(key);
    }

    static std::string env(const std::string& key, std::string fallback = {}) {
        if (const char* val = std::getenv(key.c_str())) {
            return std::string(val);
        }
        return fallback;
    }

private:
    void load_json_file(const std::filesystem::path& file_path) {
        std::ifstream file(file_path);
        if (!file.is_open()) return;

        try {
            nlohmann::json json;
            file >> json;
            flatten_json(json, file_path.stem().string());
        } catch (const nlohmann::json::exception& e) {
            logger().warning("config", "Ignoring " + file_path.string() + ": " + e.what());
        }
    }

    void flatten_json(const nlohmann::json& json, const std::string& current_key) {
        if (json.is_object()) {
            for (auto it = json.begin(); it != json.end(); ++it) {
                std::string new_key = current_key.empty() ? it.key() : current_key + "." + it.key();
                flatten_json(it.value(), new_key);
            }
        } else if (json.is_array()) {
            std::string array_str;
            for (const auto& item : json) {
                if (!array_str.empty()) array_str += ",";
                array_str += item.is_string() ? item.get<std::string>() : item.dump();
            }
            values_[current_key] = array_str;
        } else if (json.is_string()) {
            values_[current_key] = json.get<std::string>();
        } else {
            values_[current_key] = json.dump();
        }
    }

    std::vector<std::string> split_array(const std::string& str) const {
        std::vector<std::string> result;
        std::string item;
        std::istringstream stream(str);

        while (std::getline(stream, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t\n\r"));
            item.erase(item.find_last_not_of(" \t\n\r") + 1);
            if (!item.empty()) result.push_back(item);
        }

        return result;
    }

    std::unordered_map<std::string, std::string> values_;
};

} // namespace quantum::core
