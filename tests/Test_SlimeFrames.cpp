#include <gtest/gtest.h>
#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

import Core;
import RHI;
import Graphics;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;
import Runtime.SlimeModule;

#include "SlimeTestDevice.h"

using namespace Runtime;
using Core::Assets::AssetHandle;

namespace
{
    // Everything an Engine wires up, minus the window and the Vulkan device.
    struct SlimeApp
    {
        RecordingDevice Device;
        Core::IO::MemoryIOBackend* Files = nullptr;
        std::unique_ptr<AssetPipeline> Assets;
        MainWorld Main;
        std::unique_ptr<Graphics::RenderWorld> World;
        Graphics::RenderGraph Graph;
        std::unique_ptr<FrameDriver> Driver;
        SlimeModule Module;
        RecordingCommandStream Commands;

        SlimeApp()
        {
            auto backend = std::make_unique<Core::IO::MemoryIOBackend>();
            Files = backend.get();
            Files->Put(Module.GetConfig().ShaderPath, ToBytes(MakeSpirvWords()));

            Assets = std::make_unique<AssetPipeline>(std::move(backend));
            World = std::make_unique<Graphics::RenderWorld>(Device, Assets->GetAssetManager());
            Driver = std::make_unique<FrameDriver>(Main, *World, Graph);
        }

        ~SlimeApp()
        {
            Core::Tasks::Scheduler::WaitForAll();
            Driver.reset();
            World.reset();
            Assets.reset();
        }

        Core::Result Build() { return Module.Build(*Assets, *World, Graph, *Driver); }

        Core::Result Frame()
        {
            Commands.Reset();
            return Driver->RunFrame(Commands);
        }

        Graphics::CachedPipelineState PipelineState() const
        {
            return World->Pipelines.GetComputePipelineState(World->SlimePipe.GetPipelineId());
        }
    };
}

TEST(SlimeModule, BuildWiresGraphAndFormats)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    EXPECT_NE(app.Module.GetNode(), nullptr);
    EXPECT_EQ(app.Graph.GetNodeCount(), 2u);
    EXPECT_NE(app.Graph.GetNode(Graphics::kNode_Slime), nullptr);
    EXPECT_NE(app.Graph.GetNode(Graphics::kNode_CameraDriver), nullptr);

    auto order = app.Graph.GetExecutionOrder();
    ASSERT_TRUE(order.has_value());
    ASSERT_EQ(order->size(), 2u);
    EXPECT_EQ((*order)[0], Graphics::kNode_Slime);
    EXPECT_EQ((*order)[1], Graphics::kNode_CameraDriver);

    EXPECT_TRUE(app.Assets->GetRegistry().CanImport(".slime"));
    EXPECT_NE(app.Assets->GetRegistry().FindExporter(".slime"), nullptr);
    EXPECT_TRUE(app.World->SlimePipe.IsInitialized());
}

TEST(SlimeModule, BuildTwiceIsInvalidState)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    auto again = app.Build();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
}

TEST(FrameDriver, PhasesRunInFixedOrder)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    app.Main.Slime = Graphics::SlimeHandle{app.Assets->GetAssetManager().Add("slime", Graphics::SlimeParams{})};

    std::vector<FramePhase> phases;
    app.Driver->SetPhaseObserver([&phases](FramePhase phase) { phases.push_back(phase); });

    ASSERT_TRUE(app.Frame().has_value());
    EXPECT_EQ(phases, (std::vector<FramePhase>{
        FramePhase::Extract, FramePhase::Prepare, FramePhase::Queue,
        FramePhase::GraphUpdate, FramePhase::GraphExecute}));
    EXPECT_EQ(app.Driver->GetFrameIndex(), 1u);
}

TEST(FrameDriver, SystemsSeeEarlierPhasesOutput)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    std::vector<std::string> trace;
    app.Driver->AddExtractSystem([&trace](MainWorld&, Graphics::RenderWorld&) { trace.push_back("extract"); });
    app.Driver->AddPrepareSystem([&trace](Graphics::RenderWorld&) { trace.push_back("prepare"); });
    app.Driver->AddQueueSystem([&trace](Graphics::RenderWorld& world)
    {
        // The module's prepare system already ran this frame.
        trace.push_back(world.ActiveSlime && world.Slimes.Contains(world.ActiveSlime->Asset) ? "queue+buffer"
                                                                                              : "queue");
    });

    const AssetHandle slime = app.Assets->GetAssetManager().Add("slime", Graphics::SlimeParams{0.5f});
    app.Main.Slime = Graphics::SlimeHandle{slime};

    ASSERT_TRUE(app.Frame().has_value());
    EXPECT_EQ(trace, (std::vector<std::string>{"extract", "prepare", "queue+buffer"}));
}

TEST(SlimeFrames, LoadedAssetReachesGpuBuffer)
{
    SlimeApp app;
    app.Files->Put("params/test.slime", std::string_view("Slime(value: 0.5)"));
    ASSERT_TRUE(app.Build().has_value());

    const AssetHandle slime = app.Assets->Load<Graphics::SlimeParams>("params/test.slime");
    ASSERT_EQ(app.Assets->GetAssetManager().GetState(slime), Core::Assets::LoadState::Ready);
    app.Main.Slime = Graphics::SlimeHandle{slime};

    ASSERT_TRUE(app.Frame().has_value());

    const Graphics::GpuSlime* gpu = app.World->Slimes.Get(slime);
    ASSERT_NE(gpu, nullptr);
    EXPECT_FLOAT_EQ(app.Device.ReadFloat(gpu->Buffer), 0.5f);
    ASSERT_TRUE(app.World->SlimeGroup.has_value());
    EXPECT_EQ(app.World->SlimeGroup->Source, gpu->Buffer);
}

// Without a slime buffer there is nothing to bind: the node keeps waiting
// while the pipeline (compiled inline on the first frame) sits ready.
TEST(SlimeFrames, MalformedAssetNeverDispatches)
{
    SlimeApp app;
    app.Files->Put("params/bad.slime", std::string_view("Slime(value: )"));
    ASSERT_TRUE(app.Build().has_value());

    const AssetHandle slime = app.Assets->Load<Graphics::SlimeParams>("params/bad.slime");
    EXPECT_EQ(app.Assets->GetAssetManager().GetState(slime), Core::Assets::LoadState::Failed);
    app.Main.Slime = Graphics::SlimeHandle{slime};

    for (int frame = 0; frame < 3; ++frame)
    {
        ASSERT_TRUE(app.Frame().has_value()) << "frame " << frame;
        EXPECT_EQ(app.Commands.DispatchCount(), 0u);
    }
    EXPECT_TRUE(std::holds_alternative<Graphics::PipelineOk>(app.PipelineState()));
    EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Loading);
    EXPECT_TRUE(app.Device.Buffers.empty());
    EXPECT_FALSE(app.World->SlimeGroup.has_value());
}

// The pipeline is ready long before the slime file finishes decoding.
TEST(SlimeFrames, SlowSlimeLoadAfterPipelineReady)
{
    Core::Tasks::Scheduler::Initialize(1);
    {
        SlimeApp app;
        app.Files->Put("params/slow.slime", std::string_view("Slime(value: 0.5)"));
        ASSERT_TRUE(app.Build().has_value());
        Core::Tasks::Scheduler::WaitForAll(); // shader asset decoded

        ASSERT_TRUE(app.Frame().has_value()); // queues the compile
        Core::Tasks::Scheduler::WaitForAll();
        ASSERT_TRUE(std::holds_alternative<Graphics::PipelineOk>(app.PipelineState()));

        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        Graphics::IORegistry* registry = &app.Assets->GetRegistry();
        Core::IO::IIOBackend* files = app.Files;
        const AssetHandle slime = app.Assets->GetAssetManager().Load<Graphics::SlimeParams>(
            "params/slow.slime",
            [gate, registry, files](const std::string& path) -> std::shared_ptr<Graphics::SlimeParams>
            {
                gate.wait();
                auto imported = registry->Import(path, *files);
                if (!imported) return nullptr;
                auto* params = std::get_if<Graphics::SlimeParams>(&*imported);
                return params ? std::make_shared<Graphics::SlimeParams>(*params) : nullptr;
            });
        app.Main.Slime = Graphics::SlimeHandle{slime};

        for (int frame = 0; frame < 5; ++frame)
        {
            ASSERT_TRUE(app.Frame().has_value()) << "frame " << frame;
            EXPECT_EQ(app.Assets->GetAssetManager().GetState(slime), Core::Assets::LoadState::Loading);
            EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Loading);
            EXPECT_EQ(app.Commands.DispatchCount(), 0u) << "frame " << frame;
        }

        release.set_value();
        Core::Tasks::Scheduler::WaitForAll();
        ASSERT_EQ(app.Assets->GetAssetManager().GetState(slime), Core::Assets::LoadState::Ready);

        ASSERT_TRUE(app.Frame().has_value());
        EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Update);
        EXPECT_EQ(app.Commands.DispatchCount(), 1u);

        const Graphics::GpuSlime* gpu = app.World->Slimes.Get(slime);
        ASSERT_NE(gpu, nullptr);
        EXPECT_FLOAT_EQ(app.Device.ReadFloat(gpu->Buffer), 0.5f);
    }
    Core::Tasks::Scheduler::Shutdown();
}

// Ten frames while the pipeline compiles, then one dispatch per frame.
TEST(SlimeFrames, DispatchStartsWhenPipelineIsReady)
{
    Core::Tasks::Scheduler::Initialize(1);
    {
        SlimeApp app;
        std::promise<void> release;
        app.Device.PipelineGate = release.get_future().share();

        ASSERT_TRUE(app.Build().has_value());
        Core::Tasks::Scheduler::WaitForAll(); // shader asset decoded

        const AssetHandle slime = app.Assets->GetAssetManager().Add("slime", Graphics::SlimeParams{0.5f});
        app.Main.Slime = Graphics::SlimeHandle{slime};

        for (int frame = 0; frame < 10; ++frame)
        {
            EXPECT_TRUE(app.Frame().has_value()) << "frame " << frame;
            EXPECT_TRUE(std::holds_alternative<Graphics::PipelineCompiling>(app.PipelineState())) << frame;
            EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Loading);
            EXPECT_EQ(app.Commands.DispatchCount(), 0u) << "frame " << frame;
        }

        release.set_value();
        Core::Tasks::Scheduler::WaitForAll();
        ASSERT_TRUE(std::holds_alternative<Graphics::PipelineOk>(app.PipelineState()));

        ASSERT_TRUE(app.Frame().has_value());
        EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Update);
        EXPECT_EQ(app.Commands.DispatchCount(), 1u);
        EXPECT_NE(std::find(app.Commands.Calls.begin(), app.Commands.Calls.end(), "dispatch 1 1 1"),
                  app.Commands.Calls.end());

        for (int frame = 0; frame < 5; ++frame)
        {
            ASSERT_TRUE(app.Frame().has_value());
            EXPECT_EQ(app.Commands.DispatchCount(), 1u);
        }

        EXPECT_EQ(app.Device.PipelineCreateCount(), 1u);
        EXPECT_EQ(app.Device.BindGroupDescs.size(), 1u);
    }
    Core::Tasks::Scheduler::Shutdown();
}

// Two slimes selected before anything was prepared: only the last one is bound.
TEST(SlimeFrames, LastSelectedSlimeWins)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    auto& manager = app.Assets->GetAssetManager();
    const AssetHandle first = manager.Add("first", Graphics::SlimeParams{0.25f});
    app.Main.Slime = Graphics::SlimeHandle{first};
    const AssetHandle second = manager.Add("second", Graphics::SlimeParams{0.75f});
    app.Main.Slime = Graphics::SlimeHandle{second};

    for (int frame = 0; frame < 3; ++frame)
        ASSERT_TRUE(app.Frame().has_value());

    ASSERT_EQ(app.Device.BindGroupDescs.size(), 1u);
    const Graphics::GpuSlime* gpu = app.World->Slimes.Get(second);
    ASSERT_NE(gpu, nullptr);
    EXPECT_EQ(app.Device.BindGroupDescs[0].Entries[0].Buffer, gpu->Buffer);
    EXPECT_FLOAT_EQ(app.Device.ReadFloat(gpu->Buffer), 0.75f);
}

TEST(SlimeFrames, ModifiedAssetRebuildsBindGroup)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    auto& manager = app.Assets->GetAssetManager();
    const AssetHandle slime = manager.Add("slime", Graphics::SlimeParams{0.25f});
    app.Main.Slime = Graphics::SlimeHandle{slime};
    ASSERT_TRUE(app.Frame().has_value());
    const RHI::BufferHandle before = app.World->Slimes.Get(slime)->Buffer;

    ASSERT_TRUE(manager.Replace(slime, Graphics::SlimeParams{0.9f}));
    ASSERT_TRUE(app.Frame().has_value());

    const RHI::BufferHandle after = app.World->Slimes.Get(slime)->Buffer;
    EXPECT_NE(after, before);
    EXPECT_FLOAT_EQ(app.Device.ReadFloat(after), 0.9f);
    EXPECT_EQ(app.World->SlimeGroup->Source, after);
    EXPECT_EQ(app.Device.BindGroupDescs.size(), 2u);
}

TEST(SlimeFrames, RemovedAssetReleasesBuffer)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    auto& manager = app.Assets->GetAssetManager();
    const AssetHandle slime = manager.Add("slime", Graphics::SlimeParams{0.25f});
    app.Main.Slime = Graphics::SlimeHandle{slime};
    ASSERT_TRUE(app.Frame().has_value());
    ASSERT_TRUE(app.World->Slimes.Contains(slime));

    manager.Remove<Graphics::SlimeParams>(slime);
    app.Main.Slime.reset();

    // The group goes with its buffer; the node skips the dispatch from then on.
    ASSERT_TRUE(app.Frame().has_value());
    EXPECT_EQ(app.Module.GetNode()->GetState(), Graphics::SlimeState::Update);
    EXPECT_EQ(app.Commands.DispatchCount(), 0u);

    EXPECT_FALSE(app.World->Slimes.Contains(slime));
    EXPECT_FALSE(app.World->SlimeGroup.has_value());
    EXPECT_EQ(app.Device.BuffersDestroyed, 1u);
    EXPECT_EQ(app.Device.BindGroupsDestroyed, 1u);
}

TEST(AssetPipeline, SaveWritesThroughBackend)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    ASSERT_TRUE(app.Assets->Save("out/saved.slime", Graphics::SlimeParams{1.25f}).has_value());

    const AssetHandle loaded = app.Assets->Load<Graphics::SlimeParams>("out/saved.slime");
    auto params = app.Assets->GetAssetManager().Get<Graphics::SlimeParams>(loaded);
    ASSERT_NE(params, nullptr);
    EXPECT_FLOAT_EQ(params->Value, 1.25f);
}

TEST(AssetPipeline, LoadWithWrongTypeFails)
{
    SlimeApp app;
    ASSERT_TRUE(app.Build().has_value());

    // The shader file decodes to a ShaderSource, not SlimeParams.
    app.Files->Put("other/shader.spv", ToBytes(MakeSpirvWords()));
    const AssetHandle wrong = app.Assets->Load<Graphics::SlimeParams>("other/shader.spv");
    EXPECT_EQ(app.Assets->GetAssetManager().GetState(wrong), Core::Assets::LoadState::Failed);
}
