module;
#include <expected>
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:ComputePipeline.Impl;

import :ComputePipeline;
import :VulkanDevice;
import :Shader;

namespace RHI
{
    ComputePipeline::~ComputePipeline()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkPipeline pipeline = m_Pipeline;
        VkPipelineLayout layout = m_Layout;
        m_Device.SafeDestroy([logicalDevice, pipeline, layout]()
        {
            if (pipeline) vkDestroyPipeline(logicalDevice, pipeline, nullptr);
            if (layout) vkDestroyPipelineLayout(logicalDevice, layout, nullptr);
        });
    }

    ComputePipelineBuilder::ComputePipelineBuilder(VulkanDevice& device)
        : m_Device(device)
    {
        m_ShaderStage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        m_ShaderStage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::SetShader(const ShaderModule& comp)
    {
        m_ShaderStage = comp.GetStageInfo();
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::AddDescriptorSetLayout(VkDescriptorSetLayout layout)
    {
        m_DescriptorSetLayouts.push_back(layout);
        return *this;
    }

    std::expected<std::unique_ptr<ComputePipeline>, VkResult> ComputePipelineBuilder::Build()
    {
        if (m_ShaderStage.module == VK_NULL_HANDLE)
            return std::unexpected(VK_ERROR_INITIALIZATION_FAILED);

        VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
        pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(m_DescriptorSetLayouts.size());
        pipelineLayoutInfo.pSetLayouts = m_DescriptorSetLayouts.data();

        VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;
        VkResult res = vkCreatePipelineLayout(m_Device.GetLogicalDevice(), &pipelineLayoutInfo, nullptr,
                                              &pipelineLayout);
        if (res != VK_SUCCESS) return std::unexpected(res);

        VkComputePipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
        pipelineInfo.stage = m_ShaderStage;
        pipelineInfo.layout = pipelineLayout;

        VkPipeline pipeline = VK_NULL_HANDLE;
        res = vkCreateComputePipelines(m_Device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr,
                                       &pipeline);
        if (res != VK_SUCCESS)
        {
            vkDestroyPipelineLayout(m_Device.GetLogicalDevice(), pipelineLayout, nullptr);
            return std::unexpected(res);
        }

        return std::make_unique<ComputePipeline>(m_Device, pipeline, pipelineLayout);
    }
}
