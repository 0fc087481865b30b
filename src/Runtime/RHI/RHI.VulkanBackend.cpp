module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:VulkanBackend.Impl;
import :VulkanBackend;
import :Types;
import :VulkanDevice;
import :Buffer;
import :Descriptors;
import :Shader;
import :ComputePipeline;
import Core;

namespace RHI
{
    namespace
    {
        constexpr uint32_t kSpirVMagic = 0x07230203u;

        VkBufferUsageFlags ToVkBufferUsage(BufferUsage usage)
        {
            VkBufferUsageFlags flags = 0;
            if (HasUsage(usage, BufferUsage::Storage)) flags |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
            if (HasUsage(usage, BufferUsage::Uniform)) flags |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            if (HasUsage(usage, BufferUsage::CopySrc)) flags |= VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
            if (HasUsage(usage, BufferUsage::CopyDst)) flags |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;
            return flags;
        }
    }

    VulkanBackend::VulkanBackend(VulkanDevice& device)
        : m_Device(device), m_DescriptorPool(device, kMaxBindGroups)
    {
        const uint32_t framesInFlight = device.GetFramesInFlight();
        m_Buffers.Initialize(framesInFlight);
        m_Layouts.Initialize(framesInFlight);
        m_BindGroups.Initialize(framesInFlight);
        m_Pipelines.Initialize(framesInFlight);
    }

    VulkanBackend::~VulkanBackend()
    {
        m_Device.WaitIdle();

        // Bind groups reference layouts and buffers; release them first.
        m_BindGroups.Clear();
        m_Pipelines.Clear();
        m_Layouts.Clear();
        m_Buffers.Clear();
    }

    void VulkanBackend::BeginFrame(uint64_t frameNumber)
    {
        m_FrameNumber.store(frameNumber, std::memory_order_relaxed);
        m_BindGroups.ProcessDeletions(frameNumber);
        m_Pipelines.ProcessDeletions(frameNumber);
        m_Layouts.ProcessDeletions(frameNumber);
        m_Buffers.ProcessDeletions(frameNumber);
    }

    // --- Buffers ---

    Core::Expected<BufferHandle> VulkanBackend::CreateBuffer(const BufferDesc& desc)
    {
        if (desc.Size == 0)
            return Core::Err<BufferHandle>(Core::ErrorCode::InvalidArgument);

        // Written from the host through WriteBuffer, so keep CopyDst buffers mapped.
        const bool hostWritable = HasUsage(desc.Usage, BufferUsage::CopyDst);
        auto buffer = std::make_unique<VulkanBuffer>(m_Device, static_cast<size_t>(desc.Size),
                                                     ToVkBufferUsage(desc.Usage), hostWritable);
        if (!buffer->IsValid())
        {
            Core::Log::Error("CreateBuffer '{}' failed ({} bytes).", desc.Label, desc.Size);
            return Core::Err<BufferHandle>(Core::ErrorCode::OutOfDeviceMemory);
        }

        return m_Buffers.Add(std::move(buffer));
    }

    Core::Result VulkanBackend::WriteBuffer(BufferHandle buffer, uint64_t offset, std::span<const std::byte> data)
    {
        auto target = m_Buffers.Get(buffer);
        if (!target)
            return Core::Err(target.error());

        if (offset + data.size() > (*target)->GetSizeBytes())
            return Core::Err(Core::ErrorCode::OutOfRange);

        if (!(*target)->Write(data.data(), data.size(), static_cast<size_t>(offset)))
            return Core::Err(Core::ErrorCode::InvalidState);

        return Core::Ok();
    }

    void VulkanBackend::DestroyBuffer(BufferHandle buffer)
    {
        m_Buffers.Remove(buffer, m_FrameNumber.load(std::memory_order_relaxed));
    }

    VulkanBuffer* VulkanBackend::GetBuffer(BufferHandle buffer) const
    {
        auto result = m_Buffers.Get(buffer);
        return result ? *result : nullptr;
    }

    // --- Bind groups ---

    Core::Expected<BindGroupLayoutHandle> VulkanBackend::CreateBindGroupLayout(const BindGroupLayoutDesc& desc)
    {
        auto layout = std::make_unique<DescriptorLayout>(m_Device, desc);
        if (!layout->IsValid())
            return Core::Err<BindGroupLayoutHandle>(Core::ErrorCode::InvalidArgument);

        return m_Layouts.Add(std::move(layout));
    }

    void VulkanBackend::DestroyBindGroupLayout(BindGroupLayoutHandle layout)
    {
        m_Layouts.Remove(layout, m_FrameNumber.load(std::memory_order_relaxed));
    }

    Core::Expected<BindGroupHandle> VulkanBackend::CreateBindGroup(const BindGroupDesc& desc)
    {
        auto layout = m_Layouts.Get(desc.Layout);
        if (!layout)
        {
            Core::Log::Error("CreateBindGroup '{}': unknown layout.", desc.Label);
            return Core::Err<BindGroupHandle>(Core::ErrorCode::ResourceNotFound);
        }

        std::vector<VkDescriptorBufferInfo> bufferInfos;
        bufferInfos.reserve(desc.Entries.size());
        std::vector<VkWriteDescriptorSet> writes;
        writes.reserve(desc.Entries.size());

        for (const auto& entry : desc.Entries)
        {
            const BindGroupLayoutEntry* layoutEntry = (*layout)->FindEntry(entry.Binding);
            if (!layoutEntry)
            {
                Core::Log::Error("CreateBindGroup '{}': binding {} not in layout.", desc.Label, entry.Binding);
                return Core::Err<BindGroupHandle>(Core::ErrorCode::InvalidArgument);
            }

            VulkanBuffer* buffer = GetBuffer(entry.Buffer);
            if (!buffer)
            {
                Core::Log::Error("CreateBindGroup '{}': binding {} references a dead buffer.", desc.Label,
                                 entry.Binding);
                return Core::Err<BindGroupHandle>(Core::ErrorCode::ResourceNotFound);
            }

            const uint64_t bufferSize = buffer->GetSizeBytes();
            if (entry.Offset >= bufferSize)
                return Core::Err<BindGroupHandle>(Core::ErrorCode::OutOfRange);

            const uint64_t boundSize = (entry.Size == kWholeSize) ? bufferSize - entry.Offset : entry.Size;
            if (entry.Offset + boundSize > bufferSize || boundSize < layoutEntry->MinBindingSize)
            {
                Core::Log::Error("CreateBindGroup '{}': binding {} range {} is below the minimum {}.",
                                 desc.Label, entry.Binding, boundSize, layoutEntry->MinBindingSize);
                return Core::Err<BindGroupHandle>(Core::ErrorCode::OutOfRange);
            }

            bufferInfos.push_back({buffer->GetHandle(), entry.Offset,
                                   entry.Size == kWholeSize ? VK_WHOLE_SIZE : entry.Size});

            VkWriteDescriptorSet write{};
            write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            write.dstBinding = entry.Binding;
            write.descriptorCount = 1;
            write.descriptorType = ToVkDescriptorType(layoutEntry->Type, layoutEntry->HasDynamicOffset);
            write.pBufferInfo = &bufferInfos.back();
            writes.push_back(write);
        }

        VkDescriptorSet set = m_DescriptorPool.Allocate((*layout)->GetHandle());
        if (set == VK_NULL_HANDLE)
            return Core::Err<BindGroupHandle>(Core::ErrorCode::OutOfMemory);

        for (auto& write : writes) write.dstSet = set;
        vkUpdateDescriptorSets(m_Device.GetLogicalDevice(), static_cast<uint32_t>(writes.size()), writes.data(), 0,
                               nullptr);

        return m_BindGroups.Add(std::make_unique<VulkanBindGroup>(m_DescriptorPool, set, desc.Layout));
    }

    void VulkanBackend::DestroyBindGroup(BindGroupHandle group)
    {
        m_BindGroups.Remove(group, m_FrameNumber.load(std::memory_order_relaxed));
    }

    VkDescriptorSet VulkanBackend::GetDescriptorSet(BindGroupHandle group) const
    {
        auto result = m_BindGroups.Get(group);
        return result ? (*result)->GetHandle() : VK_NULL_HANDLE;
    }

    // --- Pipelines ---

    std::expected<PipelineHandle, PipelineError> VulkanBackend::CreateComputePipeline(const ComputePipelineDesc& desc)
    {
        if (desc.SpirV.empty() || desc.SpirV.front() != kSpirVMagic)
        {
            Core::Log::Error("Pipeline '{}': shader is not SPIR-V.", desc.Label);
            return std::unexpected(PipelineError::InvalidShaderCode);
        }

        ComputePipelineBuilder builder(m_Device);
        for (const auto layoutHandle : desc.Layouts)
        {
            auto layout = m_Layouts.Get(layoutHandle);
            if (!layout)
                return std::unexpected(PipelineError::LayoutCreationFailed);
            builder.AddDescriptorSetLayout((*layout)->GetHandle());
        }

        ShaderModule shader(m_Device, desc.SpirV, VK_SHADER_STAGE_COMPUTE_BIT, desc.EntryPoint);
        if (!shader.IsValid())
            return std::unexpected(PipelineError::ShaderModuleCreationFailed);

        builder.SetShader(shader);
        auto pipeline = builder.Build();
        if (!pipeline)
        {
            Core::Log::Error("Pipeline '{}': vkCreateComputePipelines failed ({}).", desc.Label,
                             static_cast<int>(pipeline.error()));
            return std::unexpected(PipelineError::PipelineCreationFailed);
        }

        return m_Pipelines.Add(std::move(*pipeline));
    }

    void VulkanBackend::DestroyComputePipeline(PipelineHandle pipeline)
    {
        m_Pipelines.Remove(pipeline, m_FrameNumber.load(std::memory_order_relaxed));
    }

    ComputePipeline* VulkanBackend::GetComputePipeline(PipelineHandle pipeline) const
    {
        auto result = m_Pipelines.Get(pipeline);
        return result ? *result : nullptr;
    }
}
