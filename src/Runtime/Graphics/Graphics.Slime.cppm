module;
#include <cstdint>
#include <expected>
#include <string>

export module Graphics:Slime;

import Core;
import RHI;
import :SlimeAsset;
import :RenderAssets;
import :PipelineCache;

export namespace Graphics
{
    inline constexpr uint32_t kSlimeCount = 100;
    inline constexpr uint32_t kWorkgroupSize = 8; // [numthreads(8, 1, 1)] in slime.comp.hlsl

    struct SlimeConfig
    {
        std::string ShaderPath = "shaders/slime.comp.spv";
        std::string EntryPoint = "update";
        uint32_t WorkgroupSize = kWorkgroupSize;
        uint32_t SlimeCount = kSlimeCount;
    };

    // Main-world reference to the slime asset driving the simulation.
    struct SlimeHandle
    {
        Core::Assets::AssetHandle Asset;
    };

    // Device copy of a SlimeParams asset.
    struct GpuSlime
    {
        RHI::BufferHandle Buffer;
    };

    using SlimeRenderAssets = RenderAssets<SlimeParams, GpuSlime>;

    // Creates a Storage | CopyDst buffer sized to SlimeParams and uploads it.
    [[nodiscard]] std::expected<GpuSlime, PrepareError> PrepareSlime(const SlimeParams& params, RHI::IDevice& device);
    void ReleaseSlime(const GpuSlime& slime, RHI::IDevice& device);

    struct SlimeBindGroup
    {
        RHI::BindGroupHandle Group;
        RHI::BufferHandle Source; // Buffer the group was built from.
    };

    // Bind group layout and cached compute pipeline for the slime update pass.
    class SlimePipeline
    {
    public:
        SlimePipeline() = default;

        SlimePipeline(const SlimePipeline&) = delete;
        SlimePipeline& operator=(const SlimePipeline&) = delete;

        // Creates the layout (binding 0, read-write storage, compute only) and
        // queues the pipeline against the already requested shader asset.
        [[nodiscard]] Core::Result Init(RHI::IDevice& device,
                                        PipelineCache& cache,
                                        Core::Assets::AssetHandle shader,
                                        const SlimeConfig& config = {});
        void Shutdown(RHI::IDevice& device);

        [[nodiscard]] bool IsInitialized() const { return m_Layout.IsValid(); }
        [[nodiscard]] RHI::BindGroupLayoutHandle GetLayout() const { return m_Layout; }
        [[nodiscard]] CachedComputePipelineId GetPipelineId() const { return m_PipelineId; }
        [[nodiscard]] Core::Assets::AssetHandle GetShader() const { return m_Shader; }

    private:
        RHI::BindGroupLayoutHandle m_Layout;
        CachedComputePipelineId m_PipelineId;
        Core::Assets::AssetHandle m_Shader;
    };
}
