module;
#include <cstdint>
#include <span>
#include <string>
#include "RHI.Vulkan.hpp"

export module RHI:Shader;

import :VulkanDevice;

export namespace RHI
{
    // VkShaderModule built from in-memory SPIR-V. Short-lived: it only has to
    // outlive the pipeline creation call.
    class ShaderModule
    {
    public:
        ShaderModule(VulkanDevice& device, std::span<const uint32_t> spirv, VkShaderStageFlagBits stage,
                     std::string entryPoint);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        VkShaderStageFlagBits m_Stage;
        std::string m_EntryPoint;
    };
}
