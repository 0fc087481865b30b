module;
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

module Runtime.Engine;

import Core;
import RHI;
import Graphics;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;
import Runtime.SlimeModule;

namespace Runtime
{
    Engine::Engine(const EngineConfig& config) : m_Config(config)
    {
        Core::Tasks::Scheduler::Initialize(config.WorkerThreads);
        Core::Log::Info("Initializing Engine...");

        if (auto result = Init(); !result)
        {
            Core::Log::Error("FATAL: Engine initialization failed ({})", Core::ErrorCodeToString(result.error()));
            return;
        }
        m_IsValid = true;
    }

    Core::Result Engine::Init()
    {
        // 1. Window
        if (!m_Config.Headless)
        {
            Core::Windowing::WindowProps props;
            props.Title = m_Config.AppName;
            props.WindowWidth = m_Config.Width;
            props.WindowHeight = m_Config.Height;
            props.VSync = m_Config.VSync;
            m_Window = std::make_unique<Core::Windowing::Window>(props);

            if (!m_Window->IsValid())
            {
                Core::Log::Error("Window initialization failed");
                return Core::Err(Core::ErrorCode::DeviceNotAvailable);
            }

            if (m_Config.VSync)
            {
                int refreshRate = m_Window->GetRefreshRate();
                if (refreshRate <= 0)
                {
                    Core::Log::Warn("Monitor refresh rate unknown, pacing at 60 Hz");
                    refreshRate = 60;
                }
                m_FramePacer.SetRefreshRate(refreshRate);
                Core::Log::Info("VSync: frames paced at {} Hz", refreshRate);
            }

            m_Window->SetEventCallback([this](const Core::Windowing::Event& e)
            {
                std::visit([this](auto&& event)
                {
                    using T = std::decay_t<decltype(event)>;
                    if constexpr (std::is_same_v<T, Core::Windowing::WindowCloseEvent>)
                    {
                        m_Running = false;
                    }
                }, e);
            });
        }

        // 2. Vulkan context & compute device. Nothing is presented, so no surface.
        RHI::ContextConfig ctxConfig;
        ctxConfig.AppName = m_Config.AppName;
        ctxConfig.EnableValidation = m_Config.EnableValidation;
        ctxConfig.Headless = true;
        m_Context = std::make_unique<RHI::VulkanContext>(ctxConfig);
        if (!m_Context->IsValid())
            return Core::Err(Core::ErrorCode::DeviceNotAvailable);

        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context);
        if (!m_Device->IsValid())
            return Core::Err(Core::ErrorCode::DeviceNotAvailable);

        m_Backend = std::make_unique<RHI::VulkanBackend>(*m_Device);
        m_Renderer = std::make_unique<RHI::ComputeRenderer>(*m_Device, *m_Backend);
        if (!m_Renderer->IsValid())
            return Core::Err(Core::ErrorCode::DeviceNotAvailable);

        // 3. Assets, render world, graph
        m_AssetPipeline = std::make_unique<AssetPipeline>();
        m_RenderWorld = std::make_unique<Graphics::RenderWorld>(*m_Backend, m_AssetPipeline->GetAssetManager());
        m_RenderGraph = std::make_unique<Graphics::RenderGraph>();
        m_FrameDriver = std::make_unique<FrameDriver>(m_MainWorld, *m_RenderWorld, *m_RenderGraph);

        // 4. Features
        Graphics::SlimeConfig slimeConfig = m_Config.Slime;
        slimeConfig.ShaderPath = Core::Filesystem::GetShaderPath(slimeConfig.ShaderPath);
        m_SlimeModule = std::make_unique<SlimeModule>(slimeConfig);
        return m_SlimeModule->Build(*m_AssetPipeline, *m_RenderWorld, *m_RenderGraph, *m_FrameDriver);
    }

    Engine::~Engine()
    {
        Core::Tasks::Scheduler::WaitForAll();
        if (m_Renderer)
            m_Renderer->WaitForGpu();

        // Order matters!
        m_SlimeModule.reset();
        m_FrameDriver.reset();
        m_RenderGraph.reset();
        m_RenderWorld.reset();
        m_AssetPipeline.reset();
        m_Renderer.reset();
        m_Backend.reset();
        m_Device.reset();
        m_Context.reset();
        m_Window.reset();

        Core::Tasks::Scheduler::Shutdown();
        Core::Log::Info("Engine shut down.");
    }

    Core::Result Engine::Run()
    {
        if (!m_IsValid)
            return Core::Err(Core::ErrorCode::DeviceNotAvailable);

        OnStart();

        Core::Result status = Core::Ok();
        while (m_Running)
        {
            if (m_Window)
            {
                m_Window->OnUpdate();
                if (m_Window->ShouldClose()) break;
            }

            if (m_Config.MaxFrames != 0 && m_FrameDriver->GetFrameIndex() >= m_Config.MaxFrames)
                break;

            OnUpdate(m_FrameDriver->GetFrameIndex());

            m_FramePacer.Wait();
            status = RunOneFrame();
            if (!status) break;
        }

        Core::Tasks::Scheduler::WaitForAll();
        m_Renderer->WaitForGpu();
        Core::Log::Info("Engine stopped after {} frames.", m_FrameDriver->GetFrameIndex());
        return status;
    }

    Core::Result Engine::RunOneFrame()
    {
        if (auto begin = m_Renderer->BeginFrame(); !begin)
            return begin;

        RHI::VulkanCommandStream commands(*m_Backend, m_Renderer->GetCommandBuffer());
        auto frame = m_FrameDriver->RunFrame(commands);

        // Submit whatever was recorded, even when the graph aborted.
        if (auto end = m_Renderer->EndFrame(); !end)
            return end;
        return frame;
    }
}
