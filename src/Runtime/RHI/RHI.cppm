export module RHI;

export import :Types;
export import :Device;
export import :Context;
export import :VulkanDevice;
export import :Buffer;
export import :Shader;
export import :Descriptors;
export import :ComputePipeline;
export import :VulkanBackend;
export import :CommandStream;
export import :Renderer;
