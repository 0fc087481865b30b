module;
#include <cstring>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import :VulkanDevice;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, bool hostWritable)
        : m_Device(device), m_SizeBytes(size)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = size;
        bufferInfo.usage = usage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
        if (hostWritable)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                              VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        VmaAllocationInfo resultInfo{};
        if (vmaCreateBuffer(m_Device.GetAllocator(), &bufferInfo, &allocInfo, &m_Buffer, &m_Allocation,
                            &resultInfo) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer ({} bytes)!", size);
            m_Buffer = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            return;
        }

        m_MappedData = resultInfo.pMappedData;
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device.GetAllocator();
        m_Device.SafeDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    bool VulkanBuffer::Write(const void* data, size_t size, size_t offset)
    {
        if (!data || size == 0) return true;

        if (offset + size > m_SizeBytes)
        {
            Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}", size, offset,
                             m_SizeBytes);
            return false;
        }

        if (!m_MappedData)
        {
            Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible.");
            return false;
        }

        std::memcpy(static_cast<std::byte*>(m_MappedData) + offset, data, size);

        // No-op for coherent memory
        return vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, size) == VK_SUCCESS;
    }
}
