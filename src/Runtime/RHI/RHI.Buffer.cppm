module;
#include <cstddef>
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :VulkanDevice;

export namespace RHI
{
    // Device buffer allocated through VMA. Host-writable buffers are
    // persistently mapped at creation.
    class VulkanBuffer
    {
    public:
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, bool hostWritable);
        ~VulkanBuffer();

        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        // memcpy into the mapping and flush. False when out of range or not mapped.
        [[nodiscard]] bool Write(const void* data, size_t size, size_t offset = 0);

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        void* m_MappedData = nullptr;
        size_t m_SizeBytes = 0;
    };
}
