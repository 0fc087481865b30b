module;
#include <cstdint>
#include <mutex>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Descriptors;

import :Types;
import :VulkanDevice;

export namespace RHI
{
    [[nodiscard]] VkDescriptorType ToVkDescriptorType(BindingType type, bool dynamicOffset);
    [[nodiscard]] VkShaderStageFlags ToVkShaderStages(ShaderStage stages);

    class DescriptorLayout
    {
    public:
        DescriptorLayout(VulkanDevice& device, const BindGroupLayoutDesc& desc);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_Layout != VK_NULL_HANDLE; }
        [[nodiscard]] const std::vector<BindGroupLayoutEntry>& GetEntries() const { return m_Entries; }
        [[nodiscard]] const BindGroupLayoutEntry* FindEntry(uint32_t binding) const;

    private:
        VulkanDevice& m_Device;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
        std::vector<BindGroupLayoutEntry> m_Entries;
    };

    // Storage/uniform buffer descriptors; sets can be freed individually.
    class DescriptorPool
    {
    public:
        DescriptorPool(VulkanDevice& device, uint32_t maxSets);
        ~DescriptorPool();

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        [[nodiscard]] VkDescriptorSet Allocate(VkDescriptorSetLayout layout);
        void Free(VkDescriptorSet set);
        [[nodiscard]] bool IsValid() const { return m_Pool != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkDescriptorPool m_Pool = VK_NULL_HANDLE;
        std::mutex m_Mutex;
    };
}
