module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

export module RHI:Device;

import Core;
import :Types;

export namespace RHI
{
    // Records compute work for one frame. Handles are resolved by the backend.
    class ICommandStream
    {
    public:
        virtual ~ICommandStream() = default;
        ICommandStream(const ICommandStream&) = delete;
        ICommandStream& operator=(const ICommandStream&) = delete;

        virtual void BeginComputePass(std::string_view label) = 0;
        virtual void SetPipeline(PipelineHandle pipeline) = 0;
        virtual void SetBindGroup(uint32_t index, BindGroupHandle group) = 0;
        virtual void Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) = 0;
        virtual void EndComputePass() = 0;

    protected:
        ICommandStream() = default;
    };

    // Device seam used by everything above the RHI. The Vulkan backend
    // implements it; tests substitute a recording implementation.
    class IDevice
    {
    public:
        virtual ~IDevice() = default;
        IDevice(const IDevice&) = delete;
        IDevice& operator=(const IDevice&) = delete;

        [[nodiscard]] virtual Core::Expected<BufferHandle> CreateBuffer(const BufferDesc& desc) = 0;

        // Host -> device write, visible to work submitted after this call.
        [[nodiscard]] virtual Core::Result WriteBuffer(BufferHandle buffer, uint64_t offset,
                                                       std::span<const std::byte> data) = 0;
        virtual void DestroyBuffer(BufferHandle buffer) = 0;

        [[nodiscard]] virtual Core::Expected<BindGroupLayoutHandle> CreateBindGroupLayout(
            const BindGroupLayoutDesc& desc) = 0;
        virtual void DestroyBindGroupLayout(BindGroupLayoutHandle layout) = 0;

        [[nodiscard]] virtual Core::Expected<BindGroupHandle> CreateBindGroup(const BindGroupDesc& desc) = 0;
        virtual void DestroyBindGroup(BindGroupHandle group) = 0;

        // Thread-safe: pipeline compilation runs on worker threads.
        [[nodiscard]] virtual std::expected<PipelineHandle, PipelineError> CreateComputePipeline(
            const ComputePipelineDesc& desc) = 0;
        virtual void DestroyComputePipeline(PipelineHandle pipeline) = 0;

    protected:
        IDevice() = default;
    };
}
