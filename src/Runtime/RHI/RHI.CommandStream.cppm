module;
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:CommandStream;

import :Types;
import :Device;
import :VulkanBackend;
import :ComputePipeline;

export namespace RHI
{
    // ICommandStream recording into a VkCommandBuffer. Descriptor sets need a
    // pipeline layout, so SetBindGroup is deferred until a pipeline is bound.
    class VulkanCommandStream final : public ICommandStream
    {
    public:
        VulkanCommandStream(VulkanBackend& backend, VkCommandBuffer cmd);

        void BeginComputePass(std::string_view label) override;
        void SetPipeline(PipelineHandle pipeline) override;
        void SetBindGroup(uint32_t index, BindGroupHandle group) override;
        void Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) override;
        void EndComputePass() override;

        [[nodiscard]] uint32_t GetDispatchCount() const { return m_DispatchCount; }

    private:
        VulkanBackend& m_Backend;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;

        bool m_InPass = false;
        bool m_PassWroteStorage = false;
        const ComputePipeline* m_BoundPipeline = nullptr;
        std::vector<std::pair<uint32_t, VkDescriptorSet>> m_PendingSets;
        uint32_t m_DispatchCount = 0;

        void FlushBindGroups();
    };
}
