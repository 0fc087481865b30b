module;
#include <filesystem>
#include <string>

export module Core:Filesystem;

export namespace Core::Filesystem
{
    // Directory containing "assets/". Falls back to the source tree the
    // build was configured from.
    [[nodiscard]] std::filesystem::path GetRoot();

    [[nodiscard]] std::string GetAssetPath(const std::string& relativePath);

    // Compiled shader artifacts, e.g. GetShaderPath("shaders/slime.comp.spv").
    // Looks next to the working directory first, then in the build tree.
    [[nodiscard]] std::string GetShaderPath(const std::string& relativePath);
}
