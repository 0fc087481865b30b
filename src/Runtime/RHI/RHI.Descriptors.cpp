module;
#include <array>
#include <mutex>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Descriptors.Impl;
import :Descriptors;
import :Types;
import :VulkanDevice;
import Core;

namespace RHI
{
    VkDescriptorType ToVkDescriptorType(BindingType type, bool dynamicOffset)
    {
        switch (type)
        {
        case BindingType::StorageBuffer:
        case BindingType::ReadOnlyStorageBuffer:
            return dynamicOffset ? VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC : VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        case BindingType::UniformBuffer:
            return dynamicOffset ? VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC : VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        }
        return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    }

    VkShaderStageFlags ToVkShaderStages(ShaderStage stages)
    {
        VkShaderStageFlags flags = 0;
        if (HasStage(stages, ShaderStage::Vertex)) flags |= VK_SHADER_STAGE_VERTEX_BIT;
        if (HasStage(stages, ShaderStage::Fragment)) flags |= VK_SHADER_STAGE_FRAGMENT_BIT;
        if (HasStage(stages, ShaderStage::Compute)) flags |= VK_SHADER_STAGE_COMPUTE_BIT;
        return flags;
    }

    // --- Descriptor Layout ---

    DescriptorLayout::DescriptorLayout(VulkanDevice& device, const BindGroupLayoutDesc& desc)
        : m_Device(device), m_Entries(desc.Entries)
    {
        std::vector<VkDescriptorSetLayoutBinding> bindings;
        bindings.reserve(desc.Entries.size());
        for (const auto& entry : desc.Entries)
        {
            VkDescriptorSetLayoutBinding binding{};
            binding.binding = entry.Binding;
            binding.descriptorType = ToVkDescriptorType(entry.Type, entry.HasDynamicOffset);
            binding.descriptorCount = 1;
            binding.stageFlags = ToVkShaderStages(entry.Visibility);
            bindings.push_back(binding);
        }

        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
        layoutInfo.pBindings = bindings.data();

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout '{}'!", desc.Label);
            m_Layout = VK_NULL_HANDLE;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (!m_Layout) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorSetLayout layout = m_Layout;
        m_Device.SafeDestroy([logicalDevice, layout]()
        {
            vkDestroyDescriptorSetLayout(logicalDevice, layout, nullptr);
        });
    }

    const BindGroupLayoutEntry* DescriptorLayout::FindEntry(uint32_t binding) const
    {
        for (const auto& entry : m_Entries)
        {
            if (entry.Binding == binding) return &entry;
        }
        return nullptr;
    }

    // --- Descriptor Pool ---

    DescriptorPool::DescriptorPool(VulkanDevice& device, uint32_t maxSets) : m_Device(device)
    {
        const std::array<VkDescriptorPoolSize, 4> poolSizes = {{
            {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, maxSets * 4},
            {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC, maxSets},
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, maxSets},
            {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, maxSets},
        }};

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();
        poolInfo.maxSets = maxSets;

        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_Pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool!");
            m_Pool = VK_NULL_HANDLE;
        }
    }

    DescriptorPool::~DescriptorPool()
    {
        if (m_Pool) vkDestroyDescriptorPool(m_Device.GetLogicalDevice(), m_Pool, nullptr);
    }

    VkDescriptorSet DescriptorPool::Allocate(VkDescriptorSetLayout layout)
    {
        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_Pool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        VkDescriptorSet set = VK_NULL_HANDLE;
        std::lock_guard lock(m_Mutex);
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set!");
            return VK_NULL_HANDLE;
        }
        return set;
    }

    void DescriptorPool::Free(VkDescriptorSet set)
    {
        if (!set) return;
        std::lock_guard lock(m_Mutex);
        VK_CHECK(vkFreeDescriptorSets(m_Device.GetLogicalDevice(), m_Pool, 1, &set));
    }
}
