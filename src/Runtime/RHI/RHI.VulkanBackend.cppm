module;
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include "RHI.Vulkan.hpp"

export module RHI:VulkanBackend;

import Core;
import :Types;
import :Device;
import :VulkanDevice;
import :Buffer;
import :Descriptors;
import :ComputePipeline;

export namespace RHI
{
    class VulkanBindGroup
    {
    public:
        VulkanBindGroup(DescriptorPool& pool, VkDescriptorSet set, BindGroupLayoutHandle layout)
            : m_Pool(pool), m_Set(set), m_Layout(layout)
        {
        }

        ~VulkanBindGroup() { m_Pool.Free(m_Set); }

        VulkanBindGroup(const VulkanBindGroup&) = delete;
        VulkanBindGroup& operator=(const VulkanBindGroup&) = delete;

        [[nodiscard]] VkDescriptorSet GetHandle() const { return m_Set; }
        [[nodiscard]] BindGroupLayoutHandle GetLayout() const { return m_Layout; }

    private:
        DescriptorPool& m_Pool;
        VkDescriptorSet m_Set = VK_NULL_HANDLE;
        BindGroupLayoutHandle m_Layout;
    };

    // IDevice over Vulkan. Objects live in handle pools; destruction is
    // deferred until every frame that could reference them has retired.
    class VulkanBackend final : public IDevice
    {
    public:
        static constexpr uint32_t kMaxBindGroups = 256;

        explicit VulkanBackend(VulkanDevice& device);
        ~VulkanBackend() override;

        [[nodiscard]] Core::Expected<BufferHandle> CreateBuffer(const BufferDesc& desc) override;
        [[nodiscard]] Core::Result WriteBuffer(BufferHandle buffer, uint64_t offset,
                                               std::span<const std::byte> data) override;
        void DestroyBuffer(BufferHandle buffer) override;

        [[nodiscard]] Core::Expected<BindGroupLayoutHandle> CreateBindGroupLayout(
            const BindGroupLayoutDesc& desc) override;
        void DestroyBindGroupLayout(BindGroupLayoutHandle layout) override;

        [[nodiscard]] Core::Expected<BindGroupHandle> CreateBindGroup(const BindGroupDesc& desc) override;
        void DestroyBindGroup(BindGroupHandle group) override;

        [[nodiscard]] std::expected<PipelineHandle, PipelineError> CreateComputePipeline(
            const ComputePipelineDesc& desc) override;
        void DestroyComputePipeline(PipelineHandle pipeline) override;

        // Call once per frame, after the fence of the frame being reused.
        void BeginFrame(uint64_t frameNumber);

        [[nodiscard]] VulkanDevice& GetDevice() const { return m_Device; }
        [[nodiscard]] VulkanBuffer* GetBuffer(BufferHandle buffer) const;
        [[nodiscard]] VkDescriptorSet GetDescriptorSet(BindGroupHandle group) const;
        [[nodiscard]] ComputePipeline* GetComputePipeline(PipelineHandle pipeline) const;

    private:
        VulkanDevice& m_Device;
        DescriptorPool m_DescriptorPool;

        Core::ResourcePool<VulkanBuffer, BufferHandle> m_Buffers;
        Core::ResourcePool<DescriptorLayout, BindGroupLayoutHandle> m_Layouts;
        Core::ResourcePool<VulkanBindGroup, BindGroupHandle> m_BindGroups;
        Core::ResourcePool<ComputePipeline, PipelineHandle> m_Pipelines;

        std::atomic<uint64_t> m_FrameNumber{0};
    };
}
