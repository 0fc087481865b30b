module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <memory>
#include <vector>

export module RHI:ComputePipeline;

import :VulkanDevice;
import :Shader;

export namespace RHI
{
    class ComputePipeline
    {
    public:
        ComputePipeline(VulkanDevice& device, VkPipeline pipeline, VkPipelineLayout layout)
            : m_Device(device), m_Pipeline(pipeline), m_Layout(layout)
        {
        }

        ~ComputePipeline();

        ComputePipeline(const ComputePipeline&) = delete;
        ComputePipeline& operator=(const ComputePipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }

    private:
        VulkanDevice& m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };

    class ComputePipelineBuilder
    {
    public:
        explicit ComputePipelineBuilder(VulkanDevice& device);

        ComputePipelineBuilder& SetShader(const ShaderModule& comp);
        ComputePipelineBuilder& AddDescriptorSetLayout(VkDescriptorSetLayout layout);

        [[nodiscard]] std::expected<std::unique_ptr<ComputePipeline>, VkResult> Build();

    private:
        VulkanDevice& m_Device;
        VkPipelineShaderStageCreateInfo m_ShaderStage{};
        std::vector<VkDescriptorSetLayout> m_DescriptorSetLayouts;
    };
}
