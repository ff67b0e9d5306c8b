#include <quantum/runtime/component_resolver.hpp>
#include <quantum/support/str.hpp>

#include <algorithm>
#include <system_error>
#include <utility>

namespace quantum::runtime {

ComponentResolver::ComponentResolver(AstCache& cache, std::vector<std::filesystem::path> search_paths)
    : cache_(cache), search_paths_(std::move(search_paths))
{
}

ast::SourceUnitPtr ComponentResolver::load(const std::filesystem::path& path)
{
    return cache_.load(path);
}

std::vector<std::string> ComponentResolver::candidate_names(const std::string& name)
{
    // "ui.Button" lives in ui/Button.q
    auto as_path = support::str::replace_all(name, ".", "/");
    std::vector<std::string> out{as_path};
    for (auto candidate : {support::str::to_lower(as_path), support::str::to_snake_case(as_path)}) {
        if (std::find(out.begin(), out.end(), candidate) == out.end()) out.push_back(candidate);
    }
    return out;
}

std::optional<std::filesystem::path> ComponentResolver::locate(const std::string& name,
                                                               const std::filesystem::path& caller_dir) const
{
    std::vector<std::filesystem::path> roots;
    if (!caller_dir.empty()) roots.push_back(caller_dir);
    roots.insert(roots.end(), search_paths_.begin(), search_paths_.end());

    auto names = candidate_names(name);
    for (const auto& root : roots) {
        for (const auto& candidate : names) {
            auto path = root / (candidate + extension);
            std::error_code ec;
            if (std::filesystem::is_regular_file(path, ec)) return path;
        }
    }
    return std::nullopt;
}

ast::SourceUnitPtr ComponentResolver::resolve(const std::string& name, const std::filesystem::path& caller_dir)
{
    auto path = locate(name, caller_dir);
    if (!path) return nullptr;
    return load(*path);
}

} // namespace quantum::runtime
