#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

import Core;
import RHI;
import Graphics;

#include "SlimeTestDevice.h"

using namespace Graphics;
using Core::Assets::AssetHandle;

namespace
{
    // Render world with the slime layout created and its pipeline queued.
    // No scheduler is running, so ProcessQueue compiles inline.
    struct SlimeWorldFixture
    {
        RecordingDevice Device;
        Core::Assets::AssetManager Assets;
        RenderWorld World{Device, Assets};
        RecordingCommandStream Commands;
        SlimeNode Node;
        AssetHandle Shader;

        SlimeWorldFixture()
        {
            Shader = Assets.Add("slime.comp.spv", ShaderSource{MakeSpirvWords(), "slime.comp.spv"});
            auto init = World.SlimePipe.Init(Device, World.Pipelines, Shader, SlimeConfig{});
            EXPECT_TRUE(init.has_value());
        }

        AssetHandle AddSlime(float value)
        {
            SlimeParams params;
            params.Value = value;
            AssetHandle handle = Assets.Add("slime", params);
            World.Slimes.Extract(handle, params);
            (void)World.Slimes.Prepare(Device);
            return handle;
        }

        Core::Result Frame()
        {
            Node.Update(World);
            RenderGraphContext ctx;
            ctx.FrameIndex = World.GetFrameIndex();
            auto result = Node.Run(ctx, Commands, World);
            World.SetFrameIndex(World.GetFrameIndex() + 1);
            return result;
        }
    };
}

TEST(SlimePipeline, LayoutIsSingleComputeStorageBinding)
{
    SlimeWorldFixture f;

    ASSERT_TRUE(f.World.SlimePipe.IsInitialized());
    ASSERT_EQ(f.Device.LayoutDescs.size(), 1u);
    const auto& layout = f.Device.LayoutDescs[0];
    ASSERT_EQ(layout.Entries.size(), 1u);
    EXPECT_EQ(layout.Entries[0].Binding, 0u);
    EXPECT_EQ(layout.Entries[0].Type, RHI::BindingType::StorageBuffer);
    EXPECT_TRUE(RHI::HasStage(layout.Entries[0].Visibility, RHI::ShaderStage::Compute));
    EXPECT_FALSE(RHI::HasStage(layout.Entries[0].Visibility, RHI::ShaderStage::Fragment));
    EXPECT_FALSE(layout.Entries[0].HasDynamicOffset);
    EXPECT_EQ(layout.Entries[0].MinBindingSize, sizeof(SlimeParams));

    EXPECT_EQ(f.World.SlimePipe.GetShader(), f.Shader);
    EXPECT_TRUE(std::holds_alternative<PipelineQueued>(
        f.World.Pipelines.GetComputePipelineState(f.World.SlimePipe.GetPipelineId())));
}

TEST(SlimePipeline, InitTwiceIsInvalidState)
{
    SlimeWorldFixture f;
    auto again = f.World.SlimePipe.Init(f.Device, f.World.Pipelines, f.Shader);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
}

TEST(SlimePipeline, CompiledWithUpdateEntryPoint)
{
    SlimeWorldFixture f;
    f.World.Pipelines.ProcessQueue();

    ASSERT_EQ(f.Device.PipelineDescs.size(), 1u);
    EXPECT_EQ(f.Device.PipelineDescs[0].EntryPoint, "update");
    EXPECT_EQ(f.Device.PipelineDescs[0].Label, "slime_pipeline");
    ASSERT_EQ(f.Device.PipelineDescs[0].Layouts.size(), 1u);
    EXPECT_EQ(f.Device.PipelineDescs[0].Layouts[0], f.World.SlimePipe.GetLayout());
}

// =============================================================================
// Bind group queueing
// =============================================================================

TEST(QueueSlimeBindGroup, NoActiveSlimeIsNoop)
{
    SlimeWorldFixture f;
    QueueSlimeBindGroup(f.World);
    EXPECT_FALSE(f.World.SlimeGroup.has_value());
    EXPECT_TRUE(f.Device.BindGroupDescs.empty());
}

TEST(QueueSlimeBindGroup, UnpreparedSlimeIsNoop)
{
    SlimeWorldFixture f;
    AssetHandle handle = f.Assets.Add("slime", SlimeParams{});
    f.World.ActiveSlime = SlimeHandle{handle};

    QueueSlimeBindGroup(f.World);
    EXPECT_FALSE(f.World.SlimeGroup.has_value());
}

TEST(QueueSlimeBindGroup, BuildsOnceForSameBuffer)
{
    SlimeWorldFixture f;
    AssetHandle handle = f.AddSlime(0.5f);
    f.World.ActiveSlime = SlimeHandle{handle};

    QueueSlimeBindGroup(f.World);
    QueueSlimeBindGroup(f.World);

    ASSERT_TRUE(f.World.SlimeGroup.has_value());
    ASSERT_EQ(f.Device.BindGroupDescs.size(), 1u);

    const auto& desc = f.Device.BindGroupDescs[0];
    EXPECT_EQ(desc.Layout, f.World.SlimePipe.GetLayout());
    ASSERT_EQ(desc.Entries.size(), 1u);
    EXPECT_EQ(desc.Entries[0].Binding, 0u);
    EXPECT_EQ(desc.Entries[0].Offset, 0u);
    EXPECT_EQ(desc.Entries[0].Size, RHI::kWholeSize);
    EXPECT_EQ(desc.Entries[0].Buffer, f.World.Slimes.Get(handle)->Buffer);
    EXPECT_EQ(f.World.SlimeGroup->Source, f.World.Slimes.Get(handle)->Buffer);
}

TEST(QueueSlimeBindGroup, RebuildsWhenBufferChanges)
{
    SlimeWorldFixture f;
    AssetHandle first = f.AddSlime(0.5f);
    AssetHandle second = f.AddSlime(1.5f);

    f.World.ActiveSlime = SlimeHandle{first};
    QueueSlimeBindGroup(f.World);
    const RHI::BindGroupHandle firstGroup = f.World.SlimeGroup->Group;

    f.World.ActiveSlime = SlimeHandle{second};
    QueueSlimeBindGroup(f.World);

    ASSERT_EQ(f.Device.BindGroupDescs.size(), 2u);
    EXPECT_NE(f.World.SlimeGroup->Group, firstGroup);
    EXPECT_EQ(f.World.SlimeGroup->Source, f.World.Slimes.Get(second)->Buffer);
    EXPECT_EQ(f.Device.BindGroupsDestroyed, 1u);
}

TEST(QueueSlimeBindGroup, CreationFailureKeepsPreviousGroup)
{
    SlimeWorldFixture f;
    AssetHandle first = f.AddSlime(0.5f);
    AssetHandle second = f.AddSlime(1.5f);

    f.World.ActiveSlime = SlimeHandle{first};
    QueueSlimeBindGroup(f.World);
    const auto previous = *f.World.SlimeGroup;

    f.Device.FailBindGroupCreation = true;
    f.World.ActiveSlime = SlimeHandle{second};
    QueueSlimeBindGroup(f.World);

    ASSERT_TRUE(f.World.SlimeGroup.has_value());
    EXPECT_EQ(f.World.SlimeGroup->Group, previous.Group);
    EXPECT_EQ(f.Device.BindGroupsDestroyed, 0u);
}

// =============================================================================
// SlimeNode state machine
// =============================================================================

TEST(SlimeNode, StartsLoading)
{
    SlimeNode node;
    EXPECT_EQ(node.GetState(), SlimeState::Loading);
    EXPECT_EQ(SlimeStateToString(SlimeState::Update), "Update");
}

TEST(SlimeNode, LoadingWithoutBindGroupIsQuietNoop)
{
    SlimeWorldFixture f;
    auto result = f.Frame();

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(f.Commands.Calls.empty());
    EXPECT_EQ(f.Node.GetState(), SlimeState::Loading);
}

TEST(SlimeNode, LoadingOpensAndClosesPassWithoutDispatch)
{
    SlimeWorldFixture f;
    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);

    ASSERT_TRUE(f.Frame().has_value());
    EXPECT_EQ(f.Commands.Calls, (std::vector<std::string>{"begin slime", "bind 0", "end"}));
    EXPECT_EQ(f.Commands.DispatchCount(), 0u);
    ASSERT_EQ(f.Commands.BindGroups.size(), 1u);
    EXPECT_EQ(f.Commands.BindGroups[0], f.World.SlimeGroup->Group);
}

TEST(SlimeNode, ReadyPipelineDispatchesSingleWorkgroup)
{
    SlimeWorldFixture f;
    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);
    f.World.Pipelines.ProcessQueue();

    ASSERT_TRUE(f.Frame().has_value());
    EXPECT_EQ(f.Node.GetState(), SlimeState::Update);
    EXPECT_EQ(f.Commands.Calls,
              (std::vector<std::string>{"begin slime", "bind 0", "pipeline", "dispatch 1 1 1", "end"}));

    const auto pipeline = f.World.Pipelines.GetComputePipeline(f.World.SlimePipe.GetPipelineId());
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_EQ(f.Commands.Pipelines.size(), 1u);
    EXPECT_EQ(f.Commands.Pipelines[0], *pipeline);
}

TEST(SlimeNode, StateNeverRegresses)
{
    SlimeWorldFixture f;
    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);
    f.World.Pipelines.ProcessQueue();

    for (int frame = 0; frame < 5; ++frame)
    {
        f.Commands.Reset();
        ASSERT_TRUE(f.Frame().has_value());
        EXPECT_EQ(f.Node.GetState(), SlimeState::Update);
        EXPECT_EQ(f.Commands.DispatchCount(), 1u);
    }
}

TEST(SlimeNode, FailedPipelineStaysLoading)
{
    SlimeWorldFixture f;
    f.Device.PipelineFailure = RHI::PipelineError::PipelineCreationFailed;
    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);
    f.World.Pipelines.ProcessQueue();

    for (int frame = 0; frame < 3; ++frame)
    {
        ASSERT_TRUE(f.Frame().has_value());
        EXPECT_EQ(f.Node.GetState(), SlimeState::Loading);
    }
    EXPECT_EQ(f.Commands.DispatchCount(), 0u);
}

TEST(SlimeNode, ReadyPipelineWaitsForBindGroup)
{
    SlimeWorldFixture f;
    f.World.Pipelines.ProcessQueue();

    for (int frame = 0; frame < 3; ++frame)
    {
        ASSERT_TRUE(f.Frame().has_value());
        EXPECT_EQ(f.Node.GetState(), SlimeState::Loading);
    }
    EXPECT_TRUE(f.Commands.Calls.empty());

    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);

    ASSERT_TRUE(f.Frame().has_value());
    EXPECT_EQ(f.Node.GetState(), SlimeState::Update);
    EXPECT_EQ(f.Commands.DispatchCount(), 1u);
}

TEST(SlimeNode, LostBindGroupSkipsDispatch)
{
    SlimeWorldFixture f;
    f.World.ActiveSlime = SlimeHandle{f.AddSlime(0.5f)};
    QueueSlimeBindGroup(f.World);
    f.World.Pipelines.ProcessQueue();
    ASSERT_TRUE(f.Frame().has_value());
    ASSERT_EQ(f.Node.GetState(), SlimeState::Update);

    f.Device.DestroyBindGroup(f.World.SlimeGroup->Group);
    f.World.SlimeGroup.reset();

    for (int frame = 0; frame < 3; ++frame)
    {
        f.Commands.Reset();
        ASSERT_TRUE(f.Frame().has_value());
        EXPECT_EQ(f.Node.GetState(), SlimeState::Update);
        EXPECT_TRUE(f.Commands.Calls.empty());
    }

    // A new group resumes the dispatch.
    QueueSlimeBindGroup(f.World);
    f.Commands.Reset();
    ASSERT_TRUE(f.Frame().has_value());
    EXPECT_EQ(f.Commands.DispatchCount(), 1u);
}
