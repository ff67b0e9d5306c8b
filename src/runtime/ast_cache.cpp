#include <quantum/runtime/ast_cache.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/core/logger.hpp>

#include <openssl/sha.h>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace quantum::runtime {

AstCache::AstCache(ParseFunction parse, std::size_t max_items, std::chrono::seconds ttl, bool enabled)
    : parse_(std::move(parse)), max_items_(max_items == 0 ? 1 : max_items), ttl_(ttl), enabled_(enabled)
{
}

std::string AstCache::sha1_hex(std::string_view content)
{
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(content.data()), content.size(), digest);
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA_DIGEST_LENGTH * 2);
    for (int i = 0; i < SHA_DIGEST_LENGTH; ++i) {
        out.push_back(hex[(digest[i] >> 4) & 0xF]);
        out.push_back(hex[digest[i] & 0xF]);
    }
    return out;
}

std::string AstCache::read_source(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::ParseError("Cannot read component file '" + path.string() + "'", core::SourceLocation{path.string(), 0, 0});
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::string AstCache::cache_key(const std::filesystem::path& path)
{
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal().string() : canonical.string();
}

SourceFingerprint AstCache::fingerprint(const std::filesystem::path& path, std::string_view content)
{
    std::error_code ec;
    SourceFingerprint out;
    out.sha1 = sha1_hex(content);
    out.size = content.size();
    out.modified = std::filesystem::last_write_time(path, ec);
    if (ec) throw core::CacheError("Cannot stat '" + path.string() + "': " + ec.message());
    return out;
}

ast::SourceUnitPtr AstCache::parse(std::string_view content, const std::filesystem::path& path)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.parses;
    }
    return parse_(content, path);
}

ast::SourceUnitPtr AstCache::load(const std::filesystem::path& path)
{
    auto content = read_source(path);
    if (!enabled()) {
        return parse(content, path);
    }

    auto key = cache_key(path);
    SourceFingerprint current;
    try {
        current = fingerprint(path, content);
    } catch (const core::CacheError& e) {
        core::logger().debug("ast-cache", std::string(e.what()) + ", parsing uncached");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.misses;
        }
        return parse(content, path);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            bool expired = ttl_.count() > 0 && std::chrono::steady_clock::now() - it->second.created > ttl_;
            if (!expired && it->second.fingerprint == current) {
                ++stats_.hits;
                lru_.splice(lru_.begin(), lru_, it->second.position);
                return it->second.unit;
            }
            ++stats_.invalidations;
            lru_.erase(it->second.position);
            entries_.erase(it);
        }
        ++stats_.misses;
    }

    // parse errors propagate; nothing partial is stored
    auto unit = parse(content, path);
    store(key, unit, std::move(current));
    return unit;
}

void AstCache::store(const std::string& key, ast::SourceUnitPtr unit, SourceFingerprint fingerprint)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        lru_.erase(it->second.position);
        entries_.erase(it);
    }
    lru_.push_front(key);
    entries_.emplace(key, Entry{std::move(unit), std::move(fingerprint), std::chrono::steady_clock::now(), lru_.begin()});
    while (entries_.size() > max_items_) {
        entries_.erase(lru_.back());
        lru_.pop_back();
        ++stats_.evictions;
    }
    stats_.entries = entries_.size();
}

void AstCache::invalidate(const std::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(cache_key(path));
    if (it == entries_.end()) return;
    lru_.erase(it->second.position);
    entries_.erase(it);
    ++stats_.invalidations;
    stats_.entries = entries_.size();
}

void AstCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_.entries = 0;
}

void AstCache::set_enabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
    if (!enabled_) {
        entries_.clear();
        lru_.clear();
        stats_.entries = 0;
    }
}

bool AstCache::enabled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

AstCacheStats AstCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto out = stats_;
    out.entries = entries_.size();
    return out;
}

} // namespace quantum::runtime
