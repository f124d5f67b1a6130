#include "runner/module_loader.hpp"

#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <array>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <dlfcn.h>

namespace gradebox {

namespace {

std::string last_dl_error(std::string_view fallback) {
    const char* err = dlerror();
    return err == nullptr ? std::string{fallback} : std::string{err};
}

} // namespace

Expected<void, std::string> ModuleLoader::load(const std::string& name, const std::filesystem::path& path,
                                               Visibility visibility) {
    if (is_loaded(name)) {
        return fmt::format("a module is already registered as {:?}", name);
    }

    const int flags = RTLD_NOW | (visibility == Visibility::Global ? RTLD_GLOBAL : RTLD_LOCAL);

    LOG_DEBUG("Loading {:?} as {:?}", path.string(), name);

    // Clear any stale error state
    dlerror();

    void* handle = dlopen(path.c_str(), flags);

    if (handle == nullptr) {
        return last_dl_error(fmt::format("dlopen failed for {}", path.string()));
    }

    modules_.emplace(name, LoadedModule{.path = path, .handle = handle});

    return {};
}

Expected<void*, std::string> ModuleLoader::find_symbol(const std::string& name, const char* symbol) const {
    auto iter = modules_.find(name);

    if (iter == modules_.end()) {
        return fmt::format("no module is registered as {:?}", name);
    }

    dlerror();

    void* addr = dlsym(iter->second.handle, symbol);

    if (addr == nullptr) {
        return last_dl_error(fmt::format("{}: undefined symbol: {}", iter->second.path.string(), symbol));
    }

    return addr;
}

std::optional<std::filesystem::path> ModuleLoader::path_of(const std::string& name) const {
    auto iter = modules_.find(name);

    if (iter == modules_.end()) {
        return std::nullopt;
    }

    return iter->second.path;
}

std::optional<std::filesystem::path>
ModuleLoader::resolve_support(std::string_view name, std::span<const std::filesystem::path> search_paths) {
    const std::array candidates = {
        std::string{name},
        fmt::format("{}.so", name),
        fmt::format("lib{}.so", name),
    };

    for (const auto& dir : search_paths) {
        for (const auto& candidate : candidates) {
            std::error_code err;
            auto path = dir / candidate;

            if (std::filesystem::is_regular_file(path, err)) {
                return path;
            }
        }
    }

    return std::nullopt;
}

} // namespace gradebox
