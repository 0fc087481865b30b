module;
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

export module Graphics:PipelineCache;

import Core;
import RHI;

export namespace Graphics
{
    struct CachedComputePipelineId
    {
        uint32_t Index = ~0u;

        [[nodiscard]] bool IsValid() const { return Index != ~0u; }
        bool operator==(const CachedComputePipelineId&) const = default;
    };

    struct PipelineQueued {};
    struct PipelineCompiling {};
    struct PipelineOk { RHI::PipelineHandle Handle; };
    struct PipelineErr { RHI::PipelineError Error; };

    // Snapshot of a cached pipeline. Moves Queued -> Compiling -> Ok | Err and
    // never leaves Ok or Err.
    using CachedPipelineState = std::variant<PipelineQueued, PipelineCompiling, PipelineOk, PipelineErr>;

    struct ComputePipelineRequest
    {
        std::string Label;
        std::vector<RHI::BindGroupLayoutHandle> Layouts;
        Core::Assets::AssetHandle Shader;
        std::string EntryPoint = "main";
    };

    // Asynchronous compute pipeline compilation. Requests wait for their shader
    // asset, then compile on a scheduler worker; the frame only polls state.
    class PipelineCache
    {
    public:
        PipelineCache(RHI::IDevice& device, Core::Assets::AssetManager& assets);
        ~PipelineCache();

        PipelineCache(const PipelineCache&) = delete;
        PipelineCache& operator=(const PipelineCache&) = delete;

        [[nodiscard]] CachedComputePipelineId QueueComputePipeline(ComputePipelineRequest request);

        // Once per frame. Starts compiles whose shader is Ready and fails the
        // ones whose shader failed to load.
        void ProcessQueue();

        // Unknown ids report Err(PipelineCreationFailed).
        [[nodiscard]] CachedPipelineState GetComputePipelineState(CachedComputePipelineId id) const;
        [[nodiscard]] std::optional<RHI::PipelineHandle> GetComputePipeline(CachedComputePipelineId id) const;

        [[nodiscard]] uint32_t GetInFlightCount() const { return m_InFlight.load(std::memory_order_acquire); }
        [[nodiscard]] std::size_t Size() const;

    private:
        struct Entry
        {
            ComputePipelineRequest Request;
            CachedPipelineState State = PipelineQueued{};
        };

        RHI::IDevice& m_Device;
        Core::Assets::AssetManager& m_Assets;

        mutable std::mutex m_Mutex;
        std::vector<Entry> m_Entries;
        std::atomic<uint32_t> m_InFlight{0};
        std::condition_variable m_InFlightCv;

        void CompleteCompile(uint32_t index, CachedPipelineState state);
    };
}
