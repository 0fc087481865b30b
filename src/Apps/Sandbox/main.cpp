#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

import Runtime.Engine;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;
import Core;
import Graphics;

using namespace Core;
using namespace Runtime;

// --- The Application Class ---
class SandboxApp : public Engine
{
public:
    explicit SandboxApp(const EngineConfig& config) : Engine(config)
    {
    }

    void OnStart() override
    {
        Log::Info("Sandbox Started!");

        std::string path = GetConfig().SlimeAssetPath;
        if (path.empty())
            path = Filesystem::GetAssetPath("slime/default.slime");

        Log::Info("Loading slime parameters from '{}'", path);
        const Assets::AssetHandle slime = GetAssetPipeline().Load<Graphics::SlimeParams>(path);
        GetMainWorld().Slime = Graphics::SlimeHandle{slime};
    }
};

namespace
{
    bool ParseFrames(std::string_view text, uint64_t& out)
    {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }
}

int main(int argc, char** argv)
{
    EngineConfig config;
    config.AppName = "Slime Simulation";

    // Usage: Sandbox [path/to/params.slime] [--headless] [--frames N]
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--frames" && i + 1 < argc)
        {
            if (!ParseFrames(argv[++i], config.MaxFrames))
            {
                Log::Error("Invalid --frames value '{}'", argv[i]);
                return 2;
            }
        }
        else if (arg == "--headless")
        {
            config.Headless = true;
        }
        else if (!arg.starts_with("--"))
        {
            config.SlimeAssetPath = std::string(arg);
        }
        else
        {
            Log::Warn("Ignoring unknown option '{}'", arg);
        }
    }

    if (config.Headless && config.MaxFrames == 0)
        config.MaxFrames = 60;

    SandboxApp app(config);
    if (!app.IsValid())
        return 1;

    if (auto result = app.Run(); !result)
    {
        Log::Error("Simulation stopped: {}", ErrorCodeToString(result.error()));
        return 1;
    }
    return 0;
}
