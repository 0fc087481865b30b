module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

module RHI:Renderer.Impl;
import :Renderer;
import :VulkanDevice;
import :VulkanBackend;
import Core;

namespace RHI
{
    ComputeRenderer::ComputeRenderer(VulkanDevice& device, VulkanBackend& backend)
        : m_Device(device), m_Backend(backend)
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = m_Device.GetQueueIndices().ComputeFamily.value();

        if (vkCreateCommandPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_CommandPool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create frame command pool!");
            m_CommandPool = VK_NULL_HANDLE;
            return;
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_CommandPool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = kFrames;
        VK_CHECK(vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, m_CommandBuffers.data()));

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;
        for (auto& fence : m_InFlightFences)
        {
            VK_CHECK(vkCreateFence(m_Device.GetLogicalDevice(), &fenceInfo, nullptr, &fence));
        }
    }

    ComputeRenderer::~ComputeRenderer()
    {
        if (!m_CommandPool) return;

        WaitForGpu();
        for (auto fence : m_InFlightFences)
        {
            if (fence) vkDestroyFence(m_Device.GetLogicalDevice(), fence, nullptr);
        }
        vkDestroyCommandPool(m_Device.GetLogicalDevice(), m_CommandPool, nullptr);
    }

    Core::Result ComputeRenderer::BeginFrame()
    {
        if (!IsValid())
            return Core::Err(Core::ErrorCode::DeviceNotAvailable);

        VkFence fence = m_InFlightFences[m_CurrentFrame];
        if (VkResult res = vkWaitForFences(m_Device.GetLogicalDevice(), 1, &fence, VK_TRUE, UINT64_MAX);
            res != VK_SUCCESS)
        {
            Core::Log::Error("Frame fence wait failed ({}).", static_cast<int>(res));
            return Core::Err(res == VK_ERROR_DEVICE_LOST ? Core::ErrorCode::DeviceLost : Core::ErrorCode::Unknown);
        }

        // Everything queued for deletion the last time this slot was used is now unreferenced.
        m_Device.FlushDeletionQueue(m_CurrentFrame);
        m_Backend.BeginFrame(m_FrameNumber);

        VK_CHECK(vkResetFences(m_Device.GetLogicalDevice(), 1, &fence));

        VkCommandBuffer cmd = m_CommandBuffers[m_CurrentFrame];
        VK_CHECK(vkResetCommandBuffer(cmd, 0));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_CHECK(vkBeginCommandBuffer(cmd, &beginInfo));

        m_IsFrameStarted = true;
        return Core::Ok();
    }

    Core::Result ComputeRenderer::EndFrame()
    {
        if (!m_IsFrameStarted)
            return Core::Err(Core::ErrorCode::InvalidState);

        VkCommandBuffer cmd = m_CommandBuffers[m_CurrentFrame];
        VK_CHECK(vkEndCommandBuffer(cmd));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        m_IsFrameStarted = false;
        const VkResult res = m_Device.SubmitToComputeQueue(submitInfo, m_InFlightFences[m_CurrentFrame]);

        m_CurrentFrame = (m_CurrentFrame + 1) % kFrames;
        ++m_FrameNumber;

        if (res != VK_SUCCESS)
        {
            Core::Log::Error("Compute submit failed ({}).", static_cast<int>(res));
            return Core::Err(res == VK_ERROR_DEVICE_LOST ? Core::ErrorCode::DeviceLost : Core::ErrorCode::Unknown);
        }
        return Core::Ok();
    }

    void ComputeRenderer::WaitForGpu() const
    {
        m_Device.WaitIdle();
    }
}
