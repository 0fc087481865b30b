module;
#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:VulkanDevice;

import :Context;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> ComputeFamily;

        [[nodiscard]] bool IsComplete() const { return ComputeFamily.has_value(); }
    };

    // Logical device, compute queue and VMA allocator. Owns the per-frame
    // deletion queues that keep GPU objects alive until their frame retires.
    class VulkanDevice
    {
    public:
        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

        explicit VulkanDevice(VulkanContext& context);
        ~VulkanDevice();

        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetComputeQueue() const { return m_ComputeQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] constexpr uint32_t GetFramesInFlight() const { return MAX_FRAMES_IN_FLIGHT; }

        [[nodiscard]] VkResult SubmitToComputeQueue(const VkSubmitInfo& submitInfo, VkFence fence);
        void WaitIdle() const;

        // Runs every callback queued for frameIndex; call after that frame's fence signalled.
        void FlushDeletionQueue(uint32_t frameIndex);
        void SafeDestroy(std::function<void()>&& deleteFn);

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VkQueue m_ComputeQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;
        VmaAllocator m_Allocator = VK_NULL_HANDLE;

        std::mutex m_QueueMutex;
        bool m_IsValid = true;

        std::array<std::vector<std::function<void()>>, MAX_FRAMES_IN_FLIGHT> m_DeletionQueue;
        uint32_t m_CurrentFrameIndex = 0;
        std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);

        [[nodiscard]] static QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
    };
}
