module;
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

module Graphics:PipelineCache.Impl;
import :PipelineCache;
import :ShaderAsset;
import Core;
import RHI;

namespace Graphics
{
    PipelineCache::PipelineCache(RHI::IDevice& device, Core::Assets::AssetManager& assets)
        : m_Device(device), m_Assets(assets)
    {
    }

    PipelineCache::~PipelineCache()
    {
        // Workers reference this cache until they report back.
        {
            std::unique_lock lock(m_Mutex);
            m_InFlightCv.wait(lock, [this] { return m_InFlight.load(std::memory_order_acquire) == 0; });
        }

        for (const Entry& entry : m_Entries)
        {
            if (const auto* ok = std::get_if<PipelineOk>(&entry.State))
                m_Device.DestroyComputePipeline(ok->Handle);
        }
    }

    CachedComputePipelineId PipelineCache::QueueComputePipeline(ComputePipelineRequest request)
    {
        std::lock_guard lock(m_Mutex);
        const auto index = static_cast<uint32_t>(m_Entries.size());
        Core::Log::Debug("PipelineCache: queued '{}' (#{})", request.Label, index);
        m_Entries.push_back(Entry{std::move(request), PipelineQueued{}});
        return CachedComputePipelineId{index};
    }

    void PipelineCache::ProcessQueue()
    {
        struct CompileJob
        {
            uint32_t Index;
            std::shared_ptr<RHI::ComputePipelineDesc> Desc;
        };
        std::vector<CompileJob> jobs;

        {
            std::lock_guard lock(m_Mutex);
            for (uint32_t i = 0; i < m_Entries.size(); ++i)
            {
                Entry& entry = m_Entries[i];
                if (!std::holds_alternative<PipelineQueued>(entry.State))
                    continue;

                const Core::Assets::LoadState shaderState = m_Assets.GetState(entry.Request.Shader);
                switch (shaderState)
                {
                case Core::Assets::LoadState::Loading:
                    break;

                case Core::Assets::LoadState::Ready:
                {
                    auto shader = m_Assets.Get<ShaderSource>(entry.Request.Shader);
                    if (!shader)
                    {
                        Core::Log::Error("PipelineCache: '{}' shader asset is not a SPIR-V module",
                                         entry.Request.Label);
                        entry.State = PipelineErr{RHI::PipelineError::ShaderLoadFailed};
                        break;
                    }

                    auto desc = std::make_shared<RHI::ComputePipelineDesc>();
                    desc->Label = entry.Request.Label;
                    desc->Layouts = entry.Request.Layouts;
                    desc->SpirV = shader->SpirV;
                    desc->EntryPoint = entry.Request.EntryPoint;

                    entry.State = PipelineCompiling{};
                    jobs.push_back(CompileJob{i, std::move(desc)});
                    break;
                }

                case Core::Assets::LoadState::Failed:
                case Core::Assets::LoadState::Unloaded:
                    Core::Log::Error("PipelineCache: '{}' cannot compile, shader asset {}",
                                     entry.Request.Label,
                                     Core::Assets::LoadStateToString(shaderState));
                    entry.State = PipelineErr{RHI::PipelineError::ShaderLoadFailed};
                    break;
                }
            }
        }

        // Dispatch outside the lock: without a worker pool the task runs inline.
        m_InFlight.fetch_add(static_cast<uint32_t>(jobs.size()), std::memory_order_acq_rel);
        for (auto& job : jobs)
        {
            Core::Tasks::Scheduler::Dispatch([this, index = job.Index, desc = std::move(job.Desc)]()
            {
                auto result = m_Device.CreateComputePipeline(*desc);
                if (result)
                    CompleteCompile(index, PipelineOk{*result});
                else
                    CompleteCompile(index, PipelineErr{result.error()});
            });
        }
    }

    void PipelineCache::CompleteCompile(uint32_t index, CachedPipelineState state)
    {
        std::lock_guard lock(m_Mutex);
        Entry& entry = m_Entries[index];
        if (const auto* err = std::get_if<PipelineErr>(&state))
        {
            Core::Log::Error("PipelineCache: '{}' failed to compile ({})", entry.Request.Label,
                             RHI::PipelineErrorToString(err->Error));
        }
        else
        {
            Core::Log::Info("PipelineCache: '{}' ready", entry.Request.Label);
        }
        entry.State = std::move(state);

        // Notify under the lock: the destructor may run as soon as it can take it.
        m_InFlight.fetch_sub(1, std::memory_order_acq_rel);
        m_InFlightCv.notify_all();
    }

    CachedPipelineState PipelineCache::GetComputePipelineState(CachedComputePipelineId id) const
    {
        std::lock_guard lock(m_Mutex);
        if (!id.IsValid() || id.Index >= m_Entries.size())
            return PipelineErr{RHI::PipelineError::PipelineCreationFailed};
        return m_Entries[id.Index].State;
    }

    std::optional<RHI::PipelineHandle> PipelineCache::GetComputePipeline(CachedComputePipelineId id) const
    {
        const CachedPipelineState state = GetComputePipelineState(id);
        if (const auto* ok = std::get_if<PipelineOk>(&state))
            return ok->Handle;
        return std::nullopt;
    }

    std::size_t PipelineCache::Size() const
    {
        std::lock_guard lock(m_Mutex);
        return m_Entries.size();
    }
}
