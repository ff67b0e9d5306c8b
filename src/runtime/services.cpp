#include <quantum/runtime/services.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/core/logger.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace quantum::runtime {

LocalFileService::LocalFileService(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal())
{
}

std::filesystem::path LocalFileService::resolve(const std::string& path) const
{
    auto full = (root_ / std::filesystem::path(path).relative_path()).lexically_normal();
    auto relative = full.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..") {
        throw core::ExecutionError("Path '" + path + "' is outside " + root_.string());
    }
    return full;
}

std::string LocalFileService::read(const std::string& path)
{
    auto full = resolve(path);
    std::ifstream in(full, std::ios::binary);
    if (!in) throw core::ExecutionError("Cannot read file '" + path + "'");
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void LocalFileService::write(const std::string& path, const std::string& content)
{
    auto full = resolve(path);
    std::error_code ec;
    std::filesystem::create_directories(full.parent_path(), ec);
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    if (!out) throw core::ExecutionError("Cannot write file '" + path + "'");
    out << content;
}

void LocalFileService::append(const std::string& path, const std::string& content)
{
    auto full = resolve(path);
    std::error_code ec;
    std::filesystem::create_directories(full.parent_path(), ec);
    std::ofstream out(full, std::ios::binary | std::ios::app);
    if (!out) throw core::ExecutionError("Cannot append to file '" + path + "'");
    out << content;
}

bool LocalFileService::remove(const std::string& path)
{
    std::error_code ec;
    bool removed = std::filesystem::remove(resolve(path), ec);
    if (ec) throw core::ExecutionError("Cannot delete file '" + path + "': " + ec.message());
    return removed;
}

bool LocalFileService::exists(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::exists(resolve(path), ec);
}

void ConsoleLogService::log(const std::string& level, const std::string& message, const Value& context,
                            const std::string& correlation_id)
{
    std::string line = message;
    if (!correlation_id.empty()) line = "[" + correlation_id + "] " + line;
    if (!context.is_null() && !(context.is_object() && context.empty())) line += " " + context.dump();
    core::logger().log(core::Logger::parse_level(level), "app", line);
}

} // namespace quantum::runtime
