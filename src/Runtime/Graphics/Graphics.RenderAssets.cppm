module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

export module Graphics:RenderAssets;

import Core;
import RHI;

export namespace Graphics
{
    enum class PrepareError : uint8_t
    {
        RetryNextFrame, // Keep the extracted value queued and try again next frame.
        Failed          // Drop the extracted value.
    };

    // Render-side cache of GPU resources built from CPU assets.
    //
    // Extract() stores a by-value copy of the asset, Prepare() turns every
    // pending copy into a TPrepared. A handle extracted twice before Prepare()
    // is prepared once, from the last value. Re-preparing a handle replaces
    // (and releases) the previous GPU resource.
    template <typename TAsset, typename TPrepared>
    class RenderAssets
    {
    public:
        using Handle = Core::Assets::AssetHandle;
        using PrepareFn = std::function<std::expected<TPrepared, PrepareError>(const TAsset&, RHI::IDevice&)>;
        using ReleaseFn = std::function<void(const TPrepared&, RHI::IDevice&)>;

        explicit RenderAssets(PrepareFn prepare, ReleaseFn release = {})
            : m_Prepare(std::move(prepare)), m_Release(std::move(release))
        {
        }

        RenderAssets(const RenderAssets&) = delete;
        RenderAssets& operator=(const RenderAssets&) = delete;

        void Extract(Handle handle, TAsset value)
        {
            std::erase(m_PendingRemovals, handle);

            auto it = std::find_if(m_Pending.begin(), m_Pending.end(),
                                   [&](const auto& pending) { return pending.first == handle; });
            if (it != m_Pending.end())
                it->second = std::move(value);
            else
                m_Pending.emplace_back(handle, std::move(value));
        }

        void Remove(Handle handle)
        {
            std::erase_if(m_Pending, [&](const auto& pending) { return pending.first == handle; });
            if (std::find(m_PendingRemovals.begin(), m_PendingRemovals.end(), handle) == m_PendingRemovals.end())
                m_PendingRemovals.push_back(handle);
        }

        // Returns the number of assets prepared this call.
        std::size_t Prepare(RHI::IDevice& device)
        {
            for (Handle handle : m_PendingRemovals)
            {
                if (auto it = m_Prepared.find(handle); it != m_Prepared.end())
                {
                    Release(it->second, device);
                    m_Prepared.erase(it);
                }
            }
            m_PendingRemovals.clear();

            std::size_t prepared = 0;
            std::vector<std::pair<Handle, TAsset>> retry;
            for (auto& [handle, value] : m_Pending)
            {
                auto result = m_Prepare(value, device);
                if (!result)
                {
                    if (result.error() == PrepareError::RetryNextFrame)
                        retry.emplace_back(handle, std::move(value));
                    continue;
                }

                if (auto it = m_Prepared.find(handle); it != m_Prepared.end())
                {
                    Release(it->second, device);
                    it->second = std::move(*result);
                }
                else
                {
                    m_Prepared.emplace(handle, std::move(*result));
                }
                ++prepared;
            }
            m_Pending = std::move(retry);
            return prepared;
        }

        [[nodiscard]] const TPrepared* Get(Handle handle) const
        {
            auto it = m_Prepared.find(handle);
            return it != m_Prepared.end() ? &it->second : nullptr;
        }

        [[nodiscard]] bool Contains(Handle handle) const { return m_Prepared.contains(handle); }
        [[nodiscard]] std::size_t PendingCount() const { return m_Pending.size(); }
        [[nodiscard]] std::size_t PreparedCount() const { return m_Prepared.size(); }

        // Releases every prepared resource and drops pending work.
        void Clear(RHI::IDevice& device)
        {
            for (auto& [handle, prepared] : m_Prepared)
                Release(prepared, device);
            m_Prepared.clear();
            m_Pending.clear();
            m_PendingRemovals.clear();
        }

    private:
        PrepareFn m_Prepare;
        ReleaseFn m_Release;

        std::vector<std::pair<Handle, TAsset>> m_Pending;
        std::vector<Handle> m_PendingRemovals;
        std::unordered_map<Handle, TPrepared, Handle::Hash> m_Prepared;

        void Release(const TPrepared& prepared, RHI::IDevice& device)
        {
            if (m_Release) m_Release(prepared, device);
        }
    };
}
