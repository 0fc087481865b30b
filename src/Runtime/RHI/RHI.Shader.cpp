module;
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "RHI.Vulkan.hpp"

module RHI:Shader.Impl;
import :Shader;
import :VulkanDevice;
import Core;

namespace RHI
{
    ShaderModule::ShaderModule(VulkanDevice& device, std::span<const uint32_t> spirv, VkShaderStageFlagBits stage,
                               std::string entryPoint)
        : m_Device(device), m_Stage(stage), m_EntryPoint(std::move(entryPoint))
    {
        if (spirv.empty()) return;

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = spirv.size_bytes();
        createInfo.pCode = spirv.data();

        if (vkCreateShaderModule(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module (entry '{}').", m_EntryPoint);
            m_Module = VK_NULL_HANDLE;
        }
    }

    ShaderModule::~ShaderModule()
    {
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = m_Stage;
        info.module = m_Module;
        info.pName = m_EntryPoint.c_str();
        return info;
    }
}
