module;
#include <cstddef>
#include <expected>
#include <span>

module Graphics:Slime.Impl;
import :Slime;
import :SlimeAsset;
import :RenderAssets;
import :PipelineCache;
import Core;
import RHI;

namespace Graphics
{
    std::expected<GpuSlime, PrepareError> PrepareSlime(const SlimeParams& params, RHI::IDevice& device)
    {
        RHI::BufferDesc desc;
        desc.Label = "slime_buffer";
        desc.Size = sizeof(SlimeParams);
        desc.Usage = RHI::BufferUsage::Storage | RHI::BufferUsage::CopyDst;

        auto buffer = device.CreateBuffer(desc);
        if (!buffer)
        {
            Core::Log::Error("PrepareSlime: buffer allocation failed ({})", Core::ErrorCodeToString(buffer.error()));
            return std::unexpected(PrepareError::Failed);
        }

        auto bytes = std::as_bytes(std::span<const SlimeParams, 1>(&params, 1));
        if (auto written = device.WriteBuffer(*buffer, 0, bytes); !written)
        {
            Core::Log::Error("PrepareSlime: upload failed ({})", Core::ErrorCodeToString(written.error()));
            device.DestroyBuffer(*buffer);
            return std::unexpected(PrepareError::Failed);
        }

        return GpuSlime{*buffer};
    }

    void ReleaseSlime(const GpuSlime& slime, RHI::IDevice& device)
    {
        device.DestroyBuffer(slime.Buffer);
    }

    Core::Result SlimePipeline::Init(RHI::IDevice& device,
                                     PipelineCache& cache,
                                     Core::Assets::AssetHandle shader,
                                     const SlimeConfig& config)
    {
        if (IsInitialized())
            return Core::Err(Core::ErrorCode::InvalidState);

        RHI::BindGroupLayoutDesc layoutDesc;
        layoutDesc.Label = "slime_bind_group_layout";
        layoutDesc.Entries.push_back(RHI::BindGroupLayoutEntry{
            .Binding = 0,
            .Visibility = RHI::ShaderStage::Compute,
            .Type = RHI::BindingType::StorageBuffer,
            .HasDynamicOffset = false,
            .MinBindingSize = sizeof(SlimeParams),
        });

        auto layout = device.CreateBindGroupLayout(layoutDesc);
        if (!layout)
        {
            Core::Log::Error("SlimePipeline: layout creation failed ({})", Core::ErrorCodeToString(layout.error()));
            return Core::Err(layout.error());
        }

        m_Layout = *layout;
        m_Shader = shader;
        m_PipelineId = cache.QueueComputePipeline(ComputePipelineRequest{
            .Label = "slime_pipeline",
            .Layouts = {m_Layout},
            .Shader = shader,
            .EntryPoint = config.EntryPoint,
        });
        return Core::Ok();
    }

    void SlimePipeline::Shutdown(RHI::IDevice& device)
    {
        if (!IsInitialized()) return;
        device.DestroyBindGroupLayout(m_Layout);
        m_Layout = {};
    }
}
