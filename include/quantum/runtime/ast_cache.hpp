#pragma once

#include <quantum/ast/source_unit.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace quantum::runtime {

struct SourceFingerprint {
    std::string sha1;   // hex digest of the content
    std::uintmax_t size = 0;
    std::filesystem::file_time_type modified{};

    bool operator==(const SourceFingerprint& other) const
    {
        return sha1 == other.sha1 && size == other.size && modified == other.modified;
    }
    bool operator!=(const SourceFingerprint& other) const { return !(*this == other); }
};

struct AstCacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t parses = 0;
    std::size_t evictions = 0;
    std::size_t invalidations = 0;
    std::size_t entries = 0;
};

// Parsed source units keyed by path. An entry is reused while the file's
// fingerprint (SHA-1 of the content, size, mtime) is unchanged and its TTL has
// not expired. A disabled cache parses on every load.
class AstCache {
public:
    using ParseFunction = std::function<ast::SourceUnitPtr(std::string_view source, const std::filesystem::path& origin)>;

    explicit AstCache(ParseFunction parse,
                      std::size_t max_items = 128,
                      std::chrono::seconds ttl = std::chrono::seconds(300),
                      bool enabled = true);

    // Throws core::ParseError when the file cannot be read or parsed.
    ast::SourceUnitPtr load(const std::filesystem::path& path);

    void invalidate(const std::filesystem::path& path);
    void clear();

    void set_enabled(bool enabled);
    bool enabled() const;

    [[nodiscard]] AstCacheStats stats() const;

    static std::string sha1_hex(std::string_view content);

private:
    struct Entry {
        ast::SourceUnitPtr unit;
        SourceFingerprint fingerprint;
        std::chrono::steady_clock::time_point created;
        std::list<std::string>::iterator position;
    };

    static std::string read_source(const std::filesystem::path& path);
    static std::string cache_key(const std::filesystem::path& path);
    static SourceFingerprint fingerprint(const std::filesystem::path& path, std::string_view content);

    ast::SourceUnitPtr parse(std::string_view content, const std::filesystem::path& path);
    void store(const std::string& key, ast::SourceUnitPtr unit, SourceFingerprint fingerprint);

    ParseFunction parse_;
    mutable std::mutex mutex_;
    std::list<std::string> lru_; // front = most recently used
    std::unordered_map<std::string, Entry> entries_;
    std::size_t max_items_;
    std::chrono::seconds ttl_;
    bool enabled_;
    AstCacheStats stats_;
};

} // namespace quantum::runtime
