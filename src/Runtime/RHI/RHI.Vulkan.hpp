#pragma once

// Every TU that touches Vulkan goes through volk; no loader prototypes.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>
#include <cstdio>

// VMA declarations only. VMA_IMPLEMENTATION lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>

// Logs failing Vulkan calls without throwing
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult vkCheckResult_ = x;                                             \
            if (vkCheckResult_ != VK_SUCCESS) {                                      \
                std::fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, static_cast<int>(vkCheckResult_), __FILE__, __LINE__);    \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif
