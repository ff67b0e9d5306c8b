#pragma once

#include <quantum/runtime/ast_cache.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quantum::runtime {

// Finds the file behind a component name used as <UserCard/>. Each name is
// tried as written, lowercased and snake_cased ("user_card"), first next to
// the caller and then in every configured search path.
class ComponentResolver {
public:
    static constexpr const char* extension = ".q";

    ComponentResolver(AstCache& cache, std::vector<std::filesystem::path> search_paths = {});

    // Through the AST cache. Throws core::ParseError.
    ast::SourceUnitPtr load(const std::filesystem::path& path);

    // nullptr when no candidate file exists.
    ast::SourceUnitPtr resolve(const std::string& name, const std::filesystem::path& caller_dir);

    std::optional<std::filesystem::path> locate(const std::string& name, const std::filesystem::path& caller_dir) const;

    void add_search_path(std::filesystem::path path) { search_paths_.push_back(std::move(path)); }
    const std::vector<std::filesystem::path>& search_paths() const { return search_paths_; }

    static std::vector<std::string> candidate_names(const std::string& name);

private:
    AstCache& cache_;
    std::vector<std::filesystem::path> search_paths_;
};

} // namespace quantum::runtime
