module;
#include <cstdint>
#include <memory>
#include <string>

export module Runtime.Engine;

import Core;
import RHI;
import Graphics;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;
import Runtime.SlimeModule;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "Slime Simulation";
        int Width = 1280;
        int Height = 720;
        bool VSync = true;                // Windowed only: caps frames at the monitor's refresh rate.
#ifdef NDEBUG
        bool EnableValidation = false;
#else
        bool EnableValidation = true;
#endif
        bool Headless = false;            // No window; runs until MaxFrames.
        std::string SlimeAssetPath;       // Empty: the app supplies the slime asset.
        uint64_t MaxFrames = 0;           // 0 = until the window closes.
        unsigned WorkerThreads = 0;       // 0 = hardware concurrency - 1.
        Graphics::SlimeConfig Slime;
    };

    class Engine
    {
    public:
        explicit Engine(const EngineConfig& config);
        virtual ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // False when the window or the Vulkan device could not be created.
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        // Blocks until the window closes, MaxFrames is reached or a frame fails.
        [[nodiscard]] Core::Result Run();
        void RequestExit() { m_Running = false; }

        // To be implemented by the Client (Sandbox)
        virtual void OnStart() {}
        virtual void OnUpdate(uint64_t frameIndex) { (void)frameIndex; }

        [[nodiscard]] const EngineConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] AssetPipeline& GetAssetPipeline() { return *m_AssetPipeline; }
        [[nodiscard]] MainWorld& GetMainWorld() { return m_MainWorld; }
        [[nodiscard]] Graphics::RenderWorld& GetRenderWorld() { return *m_RenderWorld; }
        [[nodiscard]] Graphics::RenderGraph& GetRenderGraph() { return *m_RenderGraph; }
        [[nodiscard]] FrameDriver& GetFrameDriver() { return *m_FrameDriver; }
        [[nodiscard]] const SlimeModule& GetSlimeModule() const { return *m_SlimeModule; }

    protected:
        EngineConfig m_Config;

        std::unique_ptr<Core::Windowing::Window> m_Window;
        Core::Windowing::FramePacer m_FramePacer; // Disabled when headless or VSync is off.
        std::unique_ptr<RHI::VulkanContext> m_Context;
        std::unique_ptr<RHI::VulkanDevice> m_Device;
        std::unique_ptr<RHI::VulkanBackend> m_Backend;
        std::unique_ptr<RHI::ComputeRenderer> m_Renderer;

        std::unique_ptr<AssetPipeline> m_AssetPipeline;
        MainWorld m_MainWorld;
        std::unique_ptr<Graphics::RenderWorld> m_RenderWorld;
        std::unique_ptr<Graphics::RenderGraph> m_RenderGraph;
        std::unique_ptr<FrameDriver> m_FrameDriver;
        std::unique_ptr<SlimeModule> m_SlimeModule;

        bool m_IsValid = false;
        bool m_Running = true;

    private:
        [[nodiscard]] Core::Result Init();
        [[nodiscard]] Core::Result RunOneFrame();
    };
}
