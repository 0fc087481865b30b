// Plain TU (not a module unit): hosts the VulkanMemoryAllocator implementation.

#include <cstdlib>
#include <cstdio>

#define VK_NO_PROTOTYPES
#include <volk.h>

// Must match every other inclusion of vk_mem_alloc.h
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#define VMA_USE_NULLABILITY_ANNOTATIONS 0

#define VMA_SYSTEM_MALLOC(size) std::malloc(size)
#define VMA_SYSTEM_FREE(ptr) std::free(ptr)

#include <vk_mem_alloc.h>
