module;
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

export module RHI:Types;

import Core;

export namespace RHI
{
    // --- Handles (generational; a recycled slot is a new identity) ---

    struct BufferTag {};
    struct BindGroupLayoutTag {};
    struct BindGroupTag {};
    struct PipelineTag {};

    using BufferHandle = Core::StrongHandle<BufferTag>;
    using BindGroupLayoutHandle = Core::StrongHandle<BindGroupLayoutTag>;
    using BindGroupHandle = Core::StrongHandle<BindGroupTag>;
    using PipelineHandle = Core::StrongHandle<PipelineTag>;

    // --- Buffers ---

    enum class BufferUsage : uint32_t
    {
        None = 0,
        Storage = 1u << 0,
        Uniform = 1u << 1,
        CopySrc = 1u << 2,
        CopyDst = 1u << 3,
    };

    constexpr BufferUsage operator|(BufferUsage a, BufferUsage b)
    {
        return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    constexpr bool HasUsage(BufferUsage set, BufferUsage bit)
    {
        return (static_cast<uint32_t>(set) & static_cast<uint32_t>(bit)) != 0;
    }

    struct BufferDesc
    {
        std::string Label;
        uint64_t Size = 0;
        BufferUsage Usage = BufferUsage::None;
    };

    // --- Bind groups ---

    enum class ShaderStage : uint32_t
    {
        None = 0,
        Vertex = 1u << 0,
        Fragment = 1u << 1,
        Compute = 1u << 2,
    };

    constexpr ShaderStage operator|(ShaderStage a, ShaderStage b)
    {
        return static_cast<ShaderStage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    constexpr bool HasStage(ShaderStage set, ShaderStage bit)
    {
        return (static_cast<uint32_t>(set) & static_cast<uint32_t>(bit)) != 0;
    }

    enum class BindingType : uint8_t
    {
        StorageBuffer,         // read-write
        ReadOnlyStorageBuffer,
        UniformBuffer,
    };

    struct BindGroupLayoutEntry
    {
        uint32_t Binding = 0;
        ShaderStage Visibility = ShaderStage::Compute;
        BindingType Type = BindingType::StorageBuffer;
        bool HasDynamicOffset = false;
        uint64_t MinBindingSize = 0; // 0 = unchecked
    };

    struct BindGroupLayoutDesc
    {
        std::string Label;
        std::vector<BindGroupLayoutEntry> Entries;
    };

    inline constexpr uint64_t kWholeSize = ~0ull;

    struct BindGroupEntry
    {
        uint32_t Binding = 0;
        BufferHandle Buffer;
        uint64_t Offset = 0;
        uint64_t Size = kWholeSize;
    };

    struct BindGroupDesc
    {
        std::string Label;
        BindGroupLayoutHandle Layout;
        std::vector<BindGroupEntry> Entries;
    };

    // --- Compute pipelines ---

    struct ComputePipelineDesc
    {
        std::string Label;
        std::vector<BindGroupLayoutHandle> Layouts;
        std::vector<uint32_t> SpirV;
        std::string EntryPoint = "main";
    };

    enum class PipelineError : uint8_t
    {
        ShaderLoadFailed,
        InvalidShaderCode,
        ShaderModuleCreationFailed,
        LayoutCreationFailed,
        PipelineCreationFailed,
    };

    constexpr std::string_view PipelineErrorToString(PipelineError error)
    {
        switch (error)
        {
        case PipelineError::ShaderLoadFailed:           return "ShaderLoadFailed";
        case PipelineError::InvalidShaderCode:          return "InvalidShaderCode";
        case PipelineError::ShaderModuleCreationFailed: return "ShaderModuleCreationFailed";
        case PipelineError::LayoutCreationFailed:       return "LayoutCreationFailed";
        case PipelineError::PipelineCreationFailed:     return "PipelineCreationFailed";
        }
        return "Unknown";
    }
}
