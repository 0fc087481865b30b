module;
#include <functional>
#include <mutex>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:VulkanDevice.Impl;
import :VulkanDevice;
import :Context;
import Core;

namespace RHI
{
    VulkanDevice::VulkanDevice(VulkanContext& context)
    {
        if (!context.IsValid())
        {
            m_IsValid = false;
            return;
        }

        PickPhysicalDevice(context.GetInstance());
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);

        {
            std::lock_guard lock(m_DeletionMutex);
            for (auto& queue : m_DeletionQueue)
            {
                for (auto& fn : queue) fn();
                queue.clear();
            }
        }

        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkResult VulkanDevice::SubmitToComputeQueue(const VkSubmitInfo& submitInfo, VkFence fence)
    {
        std::scoped_lock lock(m_QueueMutex);
        return vkQueueSubmit(m_ComputeQueue, 1, &submitInfo, fence);
    }

    void VulkanDevice::WaitIdle() const
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameIndex)
    {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard lock(m_DeletionMutex);
            m_CurrentFrameIndex = frameIndex % MAX_FRAMES_IN_FLIGHT;
            pending.swap(m_DeletionQueue[m_CurrentFrameIndex]);
        }
        for (auto& fn : pending) fn();
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_DeletionQueue[m_CurrentFrameIndex].push_back(std::move(deleteFn));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);
        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        // Prefer a discrete GPU, otherwise take the first compute-capable one.
        VkPhysicalDevice fallback = VK_NULL_HANDLE;
        for (const auto& device : devices)
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(device, &props);

            if (!FindQueueFamilies(device).IsComplete())
            {
                Core::Log::Warn("GPU '{}' rejected: No Compute Queue.", props.deviceName);
                continue;
            }
            if (props.apiVersion < VK_API_VERSION_1_3)
            {
                Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 not supported.", props.deviceName);
                continue;
            }

            if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
            {
                m_PhysicalDevice = device;
                break;
            }
            if (fallback == VK_NULL_HANDLE) fallback = device;
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE) m_PhysicalDevice = fallback;

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            return;
        }

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(m_PhysicalDevice, &props);
        Core::Log::Info("Selected GPU: {}", props.deviceName);
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        const float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.ComputeFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features13;
        vkGetPhysicalDeviceFeatures2(m_PhysicalDevice, &features2);

        if (!features13.synchronization2)
            Core::Log::Warn("Vulkan 1.3 Sync2 not supported; using legacy barriers.");

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_Device = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_Allocator = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.ComputeFamily.value(), 0, &m_ComputeQueue);
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;

        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);
        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        // The universal graphics+compute family first; a dedicated compute family otherwise.
        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            const VkQueueFlags flags = queueFamilies[i].queueFlags;
            if ((flags & VK_QUEUE_COMPUTE_BIT) && (flags & VK_QUEUE_GRAPHICS_BIT))
            {
                indices.ComputeFamily = i;
                return indices;
            }
        }
        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if (queueFamilies[i].queueFlags & VK_QUEUE_COMPUTE_BIT)
            {
                indices.ComputeFamily = i;
                break;
            }
        }
        return indices;
    }
}
