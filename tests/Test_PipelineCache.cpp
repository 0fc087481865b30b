#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

import Core;
import RHI;
import Graphics;

#include "SlimeTestDevice.h"

using namespace Graphics;
using Core::Assets::AssetHandle;
using Core::Assets::AssetManager;

namespace
{
    ShaderSource MakeShader()
    {
        return ShaderSource{MakeSpirvWords(), "test.spv"};
    }

    ComputePipelineRequest MakeRequest(AssetHandle shader)
    {
        ComputePipelineRequest request;
        request.Label = "test_pipeline";
        request.Shader = shader;
        request.EntryPoint = "update";
        return request;
    }
}

TEST(PipelineCache, QueuedUntilProcessed)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const AssetHandle shader = assets.Add("shader", MakeShader());
    const auto id = cache.QueueComputePipeline(MakeRequest(shader));

    EXPECT_TRUE(id.IsValid());
    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PipelineQueued>(cache.GetComputePipelineState(id)));
    EXPECT_FALSE(cache.GetComputePipeline(id).has_value());
}

TEST(PipelineCache, ReadyShaderCompilesInline)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const AssetHandle shader = assets.Add("shader", MakeShader());
    const auto id = cache.QueueComputePipeline(MakeRequest(shader));

    // No scheduler: the compile task runs on this thread.
    cache.ProcessQueue();

    ASSERT_TRUE(std::holds_alternative<PipelineOk>(cache.GetComputePipelineState(id)));
    EXPECT_TRUE(cache.GetComputePipeline(id).has_value());
    EXPECT_EQ(cache.GetInFlightCount(), 0u);

    ASSERT_EQ(device.PipelineDescs.size(), 1u);
    EXPECT_EQ(device.PipelineDescs[0].EntryPoint, "update");
    EXPECT_EQ(device.PipelineDescs[0].SpirV, MakeSpirvWords());
}

TEST(PipelineCache, WaitsForLoadingShader)
{
    Core::Tasks::Scheduler::Initialize(1);
    {
        RecordingDevice device;
        AssetManager assets;
        PipelineCache cache(device, assets);

        std::promise<void> release;
        std::shared_future<void> gate = release.get_future().share();
        const AssetHandle shader = assets.Load<ShaderSource>("slow.spv", [gate](const std::string&)
        {
            gate.wait();
            return std::make_shared<ShaderSource>(MakeShader());
        });

        const auto id = cache.QueueComputePipeline(MakeRequest(shader));
        cache.ProcessQueue();
        EXPECT_TRUE(std::holds_alternative<PipelineQueued>(cache.GetComputePipelineState(id)));
        EXPECT_EQ(device.PipelineCreateCount(), 0u);

        release.set_value();
        Core::Tasks::Scheduler::WaitForAll();

        cache.ProcessQueue();
        Core::Tasks::Scheduler::WaitForAll();
        EXPECT_TRUE(std::holds_alternative<PipelineOk>(cache.GetComputePipelineState(id)));
    }
    Core::Tasks::Scheduler::Shutdown();
}

TEST(PipelineCache, FailedShaderIsErr)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const AssetHandle shader = assets.Load<ShaderSource>("broken.spv", [](const std::string&)
    {
        return std::shared_ptr<ShaderSource>{};
    });
    ASSERT_EQ(assets.GetState(shader), Core::Assets::LoadState::Failed);

    const auto id = cache.QueueComputePipeline(MakeRequest(shader));
    cache.ProcessQueue();

    const auto state = cache.GetComputePipelineState(id);
    ASSERT_TRUE(std::holds_alternative<PipelineErr>(state));
    EXPECT_EQ(std::get<PipelineErr>(state).Error, RHI::PipelineError::ShaderLoadFailed);
    EXPECT_EQ(device.PipelineCreateCount(), 0u);

    // Terminal: later frames leave it alone.
    cache.ProcessQueue();
    EXPECT_TRUE(std::holds_alternative<PipelineErr>(cache.GetComputePipelineState(id)));
}

TEST(PipelineCache, UnknownShaderHandleIsErr)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const auto id = cache.QueueComputePipeline(MakeRequest(AssetHandle{}));
    cache.ProcessQueue();

    EXPECT_TRUE(std::holds_alternative<PipelineErr>(cache.GetComputePipelineState(id)));
}

TEST(PipelineCache, WrongAssetTypeIsErr)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const AssetHandle notAShader = assets.Add("params", SlimeParams{});
    const auto id = cache.QueueComputePipeline(MakeRequest(notAShader));
    cache.ProcessQueue();

    const auto state = cache.GetComputePipelineState(id);
    ASSERT_TRUE(std::holds_alternative<PipelineErr>(state));
    EXPECT_EQ(std::get<PipelineErr>(state).Error, RHI::PipelineError::ShaderLoadFailed);
}

TEST(PipelineCache, DeviceFailureIsReported)
{
    RecordingDevice device;
    device.PipelineFailure = RHI::PipelineError::InvalidShaderCode;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const auto id = cache.QueueComputePipeline(MakeRequest(assets.Add("shader", MakeShader())));
    cache.ProcessQueue();

    const auto state = cache.GetComputePipelineState(id);
    ASSERT_TRUE(std::holds_alternative<PipelineErr>(state));
    EXPECT_EQ(std::get<PipelineErr>(state).Error, RHI::PipelineError::InvalidShaderCode);
}

TEST(PipelineCache, InvalidIdIsErr)
{
    RecordingDevice device;
    AssetManager assets;
    PipelineCache cache(device, assets);

    const auto state = cache.GetComputePipelineState(CachedComputePipelineId{});
    ASSERT_TRUE(std::holds_alternative<PipelineErr>(state));
    EXPECT_EQ(std::get<PipelineErr>(state).Error, RHI::PipelineError::PipelineCreationFailed);
    EXPECT_TRUE(std::holds_alternative<PipelineErr>(cache.GetComputePipelineState(CachedComputePipelineId{7})));
}

TEST(PipelineCache, CompilingWhileWorkerBusy)
{
    Core::Tasks::Scheduler::Initialize(1);
    {
        RecordingDevice device;
        std::promise<void> release;
        device.PipelineGate = release.get_future().share();

        AssetManager assets;
        PipelineCache cache(device, assets);
        const auto id = cache.QueueComputePipeline(MakeRequest(assets.Add("shader", MakeShader())));

        cache.ProcessQueue();
        EXPECT_TRUE(std::holds_alternative<PipelineCompiling>(cache.GetComputePipelineState(id)));
        EXPECT_EQ(cache.GetInFlightCount(), 1u);

        // A second pass must not start another compile.
        cache.ProcessQueue();

        release.set_value();
        Core::Tasks::Scheduler::WaitForAll();

        EXPECT_TRUE(std::holds_alternative<PipelineOk>(cache.GetComputePipelineState(id)));
        EXPECT_EQ(device.PipelineCreateCount(), 1u);
        EXPECT_EQ(cache.GetInFlightCount(), 0u);
    }
    Core::Tasks::Scheduler::Shutdown();
}

TEST(PipelineCache, DestructionWaitsForInFlightCompile)
{
    Core::Tasks::Scheduler::Initialize(1);
    {
        RecordingDevice device;
        std::promise<void> release;
        device.PipelineGate = release.get_future().share();
        AssetManager assets;

        {
            PipelineCache cache(device, assets);
            (void)cache.QueueComputePipeline(MakeRequest(assets.Add("shader", MakeShader())));
            cache.ProcessQueue();
            ASSERT_EQ(cache.GetInFlightCount(), 1u);

            std::thread releaser([&release]
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                release.set_value();
            });

            // Joined before the cache goes out of scope; the destructor then
            // blocks until the compile has reported back.
            releaser.join();
        }

        // The compiled pipeline was owned by the cache and destroyed with it.
        EXPECT_EQ(device.PipelineCreateCount(), 1u);
        EXPECT_EQ(device.PipelinesDestroyed, 1u);
    }
    Core::Tasks::Scheduler::Shutdown();
}
