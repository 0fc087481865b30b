module;

#include <cstring>
#include <string>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Context.Impl;
import :Context;
import Core;

namespace RHI
{
    namespace
    {
        const std::vector<const char*> VALIDATION_LAYERS = {
            "VK_LAYER_KHRONOS_validation"
        };

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            [[maybe_unused]] VkDebugUtilsMessageTypeFlagsEXT type,
            const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
            [[maybe_unused]] void* pUserData)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
                Core::Log::Error("[Vulkan Validation]: {}", pCallbackData->pMessage);
            else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
                Core::Log::Warn("[Vulkan Validation]: {}", pCallbackData->pMessage);
            return VK_FALSE;
        }

        bool IsLayerAvailable(const char* name)
        {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());
            for (const auto& layer : layers)
            {
                if (std::strcmp(layer.layerName, name) == 0) return true;
            }
            return false;
        }

        VkDebugUtilsMessengerCreateInfoEXT MakeMessengerInfo()
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                   VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            info.pfnUserCallback = DebugCallback;
            return info;
        }
    }

    VulkanContext::VulkanContext(const ContextConfig& config)
    {
        if (volkInitialize() != VK_SUCCESS)
        {
            Core::Log::Error("Failed to initialize Volk! Is a Vulkan loader installed?");
            return;
        }

        CreateInstance(config);
        if (m_Instance == VK_NULL_HANDLE) return;

        volkLoadInstance(m_Instance);

        if (config.EnableValidation)
            SetupDebugMessenger();

        Core::Log::Info("Vulkan Instance Initialized ({}).", config.Headless ? "headless" : "windowed");
    }

    VulkanContext::~VulkanContext()
    {
        if (m_Instance == VK_NULL_HANDLE) return;

        if (m_DebugMessenger != VK_NULL_HANDLE)
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        vkDestroyInstance(m_Instance, nullptr);
    }

    void VulkanContext::CreateInstance(const ContextConfig& config)
    {
        const std::string appName(config.AppName);

        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = appName.c_str();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "SlimeSim";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_3;

        // Compute only: presentation is owned by the host, so no surface extensions.
        std::vector<const char*> extensions;
        std::vector<const char*> layers;

        const bool validation = config.EnableValidation && IsLayerAvailable(VALIDATION_LAYERS[0]);
        if (config.EnableValidation && !validation)
            Core::Log::Warn("Validation requested but VK_LAYER_KHRONOS_validation is not installed.");

        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = MakeMessengerInfo();

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;

        if (validation)
        {
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            layers = VALIDATION_LAYERS;
            createInfo.pNext = &debugCreateInfo;
        }

        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();
        createInfo.enabledLayerCount = static_cast<uint32_t>(layers.size());
        createInfo.ppEnabledLayerNames = layers.data();

        if (VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create Vulkan Instance! Error Code: {}", static_cast<int>(result));
            m_Instance = VK_NULL_HANDLE;
            return;
        }

        m_ValidationEnabled = validation;
    }

    void VulkanContext::SetupDebugMessenger()
    {
        if (!m_ValidationEnabled) return;

        VkDebugUtilsMessengerCreateInfoEXT createInfo = MakeMessengerInfo();
        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to set up debug messenger!");
        }
    }
}
