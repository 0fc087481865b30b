module;
#include <optional>
#include <variant>

module Graphics:Passes.Slime.Impl;
import :Passes.Slime;
import :RenderGraph;
import :RenderWorld;
import :PipelineCache;
import :Slime;
import Core;
import RHI;

namespace Graphics
{
    void SlimeNode::Update(RenderWorld& world)
    {
        if (m_State != SlimeState::Loading)
            return;

        // Both the pipeline and something to bind it to are needed.
        if (!world.SlimeGroup)
            return;

        const CachedPipelineState state = world.Pipelines.GetComputePipelineState(world.SlimePipe.GetPipelineId());
        if (std::holds_alternative<PipelineOk>(state))
        {
            Core::Log::Info("SlimeNode: pipeline ready, dispatching from frame {}", world.GetFrameIndex());
            m_State = SlimeState::Update;
        }
    }

    Core::Result SlimeNode::Run(RenderGraphContext&, RHI::ICommandStream& commands, const RenderWorld& world)
    {
        if (!world.SlimeGroup)
        {
            if (m_State == SlimeState::Update && !m_WarnedMissingGroup)
            {
                Core::Log::Warn("SlimeNode: slime bind group is gone, skipping dispatch");
                m_WarnedMissingGroup = true;
            }
            return Core::Ok();
        }
        m_WarnedMissingGroup = false;

        std::optional<RHI::PipelineHandle> pipeline;
        if (m_State == SlimeState::Update)
        {
            pipeline = world.Pipelines.GetComputePipeline(world.SlimePipe.GetPipelineId());
            if (!pipeline)
                return Core::Err(Core::ErrorCode::InvalidState);
        }

        commands.BeginComputePass("slime");
        commands.SetBindGroup(0, world.SlimeGroup->Group);
        if (pipeline)
        {
            commands.SetPipeline(*pipeline);
            commands.Dispatch(1, 1, 1);
        }
        commands.EndComputePass();
        return Core::Ok();
    }

    void QueueSlimeBindGroup(RenderWorld& world)
    {
        if (!world.ActiveSlime)
        {
            Core::Log::Debug("QueueSlimeBindGroup: no active slime");
            return;
        }

        const GpuSlime* gpu = world.Slimes.Get(world.ActiveSlime->Asset);
        if (!gpu)
        {
            Core::Log::Debug("QueueSlimeBindGroup: slime buffer not prepared yet");
            return;
        }

        if (world.SlimeGroup && world.SlimeGroup->Source == gpu->Buffer)
            return;

        if (!world.SlimePipe.IsInitialized())
        {
            Core::Log::Warn("QueueSlimeBindGroup: slime pipeline layout missing");
            return;
        }

        RHI::BindGroupDesc desc;
        desc.Label = "slime_bind_group";
        desc.Layout = world.SlimePipe.GetLayout();
        desc.Entries.push_back(RHI::BindGroupEntry{
            .Binding = 0,
            .Buffer = gpu->Buffer,
            .Offset = 0,
            .Size = RHI::kWholeSize,
        });

        auto group = world.GetDevice().CreateBindGroup(desc);
        if (!group)
        {
            Core::Log::Error("QueueSlimeBindGroup: bind group creation failed ({})",
                             Core::ErrorCodeToString(group.error()));
            return;
        }

        if (world.SlimeGroup)
            world.GetDevice().DestroyBindGroup(world.SlimeGroup->Group);
        world.SlimeGroup = SlimeBindGroup{*group, gpu->Buffer};
    }
}
