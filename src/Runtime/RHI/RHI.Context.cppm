module;

#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

namespace RHI
{
    export struct ContextConfig
    {
        std::string_view AppName = "Slime Simulation";
        bool EnableValidation = true;
        bool Headless = false;
    };

    export class VulkanContext
    {
    public:
        explicit VulkanContext(const ContextConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
        bool m_ValidationEnabled = false;

        void CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
