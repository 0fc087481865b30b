module;
#include <filesystem>
#include <string>
#include <system_error>

module Core:Filesystem.Impl;
import :Filesystem;

namespace Core::Filesystem
{
    std::filesystem::path GetRoot()
    {
        std::error_code ec;

        // Release layout: binary next to assets/
        if (std::filesystem::exists("assets", ec))
            return std::filesystem::current_path();

        // Running from bin/
        if (std::filesystem::exists("../assets", ec))
            return std::filesystem::current_path().parent_path();

#ifdef SLIME_ROOT_DIR
        return std::filesystem::path(SLIME_ROOT_DIR);
#else
        return std::filesystem::current_path();
#endif
    }

    std::string GetAssetPath(const std::string& relativePath)
    {
        return (GetRoot() / "assets" / relativePath).string();
    }

    std::string GetShaderPath(const std::string& relativePath)
    {
        std::error_code ec;
        const auto local = std::filesystem::current_path() / relativePath;
        if (std::filesystem::exists(local, ec))
            return local.string();

#ifdef SLIME_BINARY_DIR
        return (std::filesystem::path(SLIME_BINARY_DIR) / relativePath).string();
#else
        return local.string();
#endif
    }
}
