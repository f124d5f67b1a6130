#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/expected.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gradebox {

/// Registry of the shared objects loaded into the runner, keyed by logical name
///
/// Modules stay loaded for the lifetime of the process.
class ModuleLoader : NonCopyable
{
public:
    enum class Visibility {
        Global, ///< Symbols are used to resolve undefined symbols of subsequently loaded modules
        Local,  ///< Symbols are only reachable through the module's own handle
    };

    /// Loads ``path`` with every symbol bound immediately, registering it as ``name``.
    /// On failure, returns the dynamic loader's diagnostic.
    Expected<void, std::string> load(const std::string& name, const std::filesystem::path& path, Visibility visibility);

    /// Address of ``symbol`` within the module registered as ``name``.
    /// On failure, returns the dynamic loader's diagnostic.
    Expected<void*, std::string> find_symbol(const std::string& name, const char* symbol) const;

    bool is_loaded(const std::string& name) const { return modules_.contains(name); }

    std::optional<std::filesystem::path> path_of(const std::string& name) const;

    /// Finds a support module ``name`` within ``search_paths``, in priority order.
    /// Within each directory, tries ``name``, ``name.so`` and then ``libname.so``.
    static std::optional<std::filesystem::path> resolve_support(std::string_view name,
                                                                std::span<const std::filesystem::path> search_paths);

private:
    struct LoadedModule
    {
        std::filesystem::path path;
        void* handle;
    };

    std::map<std::string, LoadedModule, std::less<>> modules_;
};

} // namespace gradebox
