module;
#include <cstdint>
#include <string_view>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:CommandStream.Impl;
import :CommandStream;
import :VulkanBackend;
import :ComputePipeline;
import Core;

namespace RHI
{
    VulkanCommandStream::VulkanCommandStream(VulkanBackend& backend, VkCommandBuffer cmd)
        : m_Backend(backend), m_Cmd(cmd)
    {
    }

    void VulkanCommandStream::BeginComputePass(std::string_view label)
    {
        if (m_InPass)
        {
            Core::Log::Warn("BeginComputePass('{}') while a pass is open; closing the previous one.", label);
            EndComputePass();
        }
        m_InPass = true;
        m_PassWroteStorage = false;
        m_BoundPipeline = nullptr;
        m_PendingSets.clear();
    }

    void VulkanCommandStream::SetPipeline(PipelineHandle pipeline)
    {
        const ComputePipeline* resolved = m_Backend.GetComputePipeline(pipeline);
        if (!resolved)
        {
            Core::Log::Error("SetPipeline: pipeline handle is not alive.");
            return;
        }

        vkCmdBindPipeline(m_Cmd, VK_PIPELINE_BIND_POINT_COMPUTE, resolved->GetHandle());
        m_BoundPipeline = resolved;
        FlushBindGroups();
    }

    void VulkanCommandStream::SetBindGroup(uint32_t index, BindGroupHandle group)
    {
        VkDescriptorSet set = m_Backend.GetDescriptorSet(group);
        if (set == VK_NULL_HANDLE)
        {
            Core::Log::Error("SetBindGroup({}): bind group handle is not alive.", index);
            return;
        }

        std::erase_if(m_PendingSets, [index](const auto& pending) { return pending.first == index; });
        m_PendingSets.emplace_back(index, set);
        if (m_BoundPipeline) FlushBindGroups();
    }

    void VulkanCommandStream::Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ)
    {
        if (!m_BoundPipeline)
        {
            Core::Log::Error("Dispatch({}, {}, {}) without a pipeline; skipped.", groupsX, groupsY, groupsZ);
            return;
        }

        vkCmdDispatch(m_Cmd, groupsX, groupsY, groupsZ);
        m_PassWroteStorage = true;
        ++m_DispatchCount;
    }

    void VulkanCommandStream::EndComputePass()
    {
        if (!m_InPass) return;

        // Make this pass's storage writes visible to the next compute pass.
        if (m_PassWroteStorage)
        {
            VkMemoryBarrier barrier{};
            barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
            barrier.srcAccessMask = VK_ACCESS_SHADER_WRITE_BIT;
            barrier.dstAccessMask = VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT;

            vkCmdPipelineBarrier(m_Cmd, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT,
                                 0, 1, &barrier, 0, nullptr, 0, nullptr);
        }

        m_InPass = false;
        m_BoundPipeline = nullptr;
        m_PendingSets.clear();
    }

    void VulkanCommandStream::FlushBindGroups()
    {
        for (const auto& [index, set] : m_PendingSets)
        {
            vkCmdBindDescriptorSets(m_Cmd, VK_PIPELINE_BIND_POINT_COMPUTE, m_BoundPipeline->GetLayout(), index, 1,
                                    &set, 0, nullptr);
        }
    }
}
