module;
#include <array>
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Renderer;

import Core;
import :VulkanDevice;
import :VulkanBackend;

export namespace RHI
{
    // Per-frame compute submission with MAX_FRAMES_IN_FLIGHT command buffers
    // and fences. Presentation is not handled here.
    class ComputeRenderer
    {
    public:
        ComputeRenderer(VulkanDevice& device, VulkanBackend& backend);
        ~ComputeRenderer();

        ComputeRenderer(const ComputeRenderer&) = delete;
        ComputeRenderer& operator=(const ComputeRenderer&) = delete;

        // Waits for the slot's previous submission, retires deferred
        // deletions and begins recording.
        [[nodiscard]] Core::Result BeginFrame();
        [[nodiscard]] Core::Result EndFrame();

        [[nodiscard]] bool IsValid() const { return m_CommandPool != VK_NULL_HANDLE; }
        [[nodiscard]] bool IsFrameInProgress() const { return m_IsFrameStarted; }
        [[nodiscard]] VkCommandBuffer GetCommandBuffer() const { return m_CommandBuffers[m_CurrentFrame]; }
        [[nodiscard]] uint32_t GetCurrentFrameIndex() const { return m_CurrentFrame; }
        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }

        // Blocks until every submitted frame finished.
        void WaitForGpu() const;

    private:
        static constexpr uint32_t kFrames = VulkanDevice::MAX_FRAMES_IN_FLIGHT;

        VulkanDevice& m_Device;
        VulkanBackend& m_Backend;
        VkCommandPool m_CommandPool = VK_NULL_HANDLE;
        std::array<VkCommandBuffer, kFrames> m_CommandBuffers{};
        std::array<VkFence, kFrames> m_InFlightFences{};

        uint32_t m_CurrentFrame = 0;
        uint64_t m_FrameNumber = 0;
        bool m_IsFrameStarted = false;
    };
}
