module;
#include <entt/entt.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

export module Core:Assets;

import :Logging;
import :Tasks;

export namespace Core::Assets
{
    struct AssetHandle
    {
        entt::entity ID = entt::null;

        [[nodiscard]] bool IsValid() const { return ID != entt::null; }
        bool operator==(const AssetHandle& other) const { return ID == other.ID; }

        struct Hash
        {
            std::size_t operator()(const AssetHandle& h) const { return static_cast<size_t>(h.ID); }
        };
    };

    enum class LoadState : uint8_t { Unloaded, Loading, Ready, Failed };

    constexpr std::string_view LoadStateToString(LoadState state)
    {
        switch (state)
        {
        case LoadState::Unloaded: return "Unloaded";
        case LoadState::Loading:  return "Loading";
        case LoadState::Ready:    return "Ready";
        case LoadState::Failed:   return "Failed";
        }
        return "Unknown";
    }

    // --- Components ---

    struct AssetInfo
    {
        std::string Name;
        LoadState State = LoadState::Unloaded;
    };

    struct AssetSource
    {
        std::filesystem::path FilePath;
    };

    // Published asset values are immutable; a replacement swaps the pointer.
    template <typename T>
    struct AssetPayload
    {
        std::shared_ptr<const T> Resource;
    };

    // --- Change events (consumed by the render-world extraction) ---

    enum class AssetEventKind : uint8_t { Added, Modified, Removed };

    struct AssetEvent
    {
        AssetHandle Handle;
        AssetEventKind Kind = AssetEventKind::Added;
    };

    // --- Asset Manager ---

    class AssetManager
    {
    public:
        AssetManager() = default;
        AssetManager(const AssetManager&) = delete;
        AssetManager& operator=(const AssetManager&) = delete;

        // Returns a handle immediately and decodes on a worker. Loading the same
        // path twice returns the same handle while the first load is pending or
        // Ready; a Failed path loads again. The loader returns nullptr on failure.
        template <typename T, typename LoaderFunc>
        AssetHandle Load(const std::string& path, LoaderFunc&& loader);

        // Publishes an in-memory value. The asset is Ready on return.
        template <typename T>
        AssetHandle Add(std::string name, T value);

        // Swaps the value of a Ready asset; emits a Modified event.
        template <typename T>
        bool Replace(AssetHandle handle, T value);

        // Drops the asset; emits a Removed event when it carried a T payload.
        template <typename T>
        void Remove(AssetHandle handle);

        // nullptr unless the asset is Ready and holds a T.
        template <typename T>
        [[nodiscard]] std::shared_ptr<const T> Get(AssetHandle handle) const;

        [[nodiscard]] LoadState GetState(AssetHandle handle) const;

        // Starts recording change events for T. Types nobody tracks record none.
        template <typename T>
        void TrackEvents();

        // Returns and forgets the change events recorded for T since the last drain.
        template <typename T>
        [[nodiscard]] std::vector<AssetEvent> DrainEvents();

        void Clear();

    private:
        entt::registry m_Registry;
        std::unordered_map<size_t, AssetHandle> m_Lookup;

        struct PendingEvent
        {
            entt::id_type Type;
            AssetEvent Event;
        };
        std::vector<PendingEvent> m_Events;
        std::unordered_set<entt::id_type> m_TrackedEvents;

        mutable std::shared_mutex m_Mutex;

        // Caller holds m_Mutex exclusively.
        void PushEvent(entt::id_type type, AssetHandle handle, AssetEventKind kind);
    };

    template <typename T, typename LoaderFunc>
    AssetHandle AssetManager::Load(const std::string& path, LoaderFunc&& loader)
    {
        AssetHandle handle;
        {
            std::unique_lock lock(m_Mutex);

            const size_t pathHash = std::hash<std::string>{}(path);
            if (auto it = m_Lookup.find(pathHash); it != m_Lookup.end())
            {
                return it->second;
            }

            const auto entity = m_Registry.create();
            handle = AssetHandle{entity};

            m_Registry.emplace<AssetInfo>(entity, path, LoadState::Loading);
            m_Registry.emplace<AssetSource>(entity, path);
            m_Lookup[pathHash] = handle;
        }

        // Runs inline when no worker pool is up, so the lock above must be released.
        Tasks::Scheduler::Dispatch([this, handle, path, loader = std::forward<LoaderFunc>(loader)]()
        {
            std::shared_ptr<T> result = loader(path);

            bool published = false;
            {
                std::unique_lock lock(m_Mutex);
                if (!m_Registry.valid(handle.ID)) return;

                auto& info = m_Registry.get<AssetInfo>(handle.ID);
                if (result)
                {
                    m_Registry.emplace_or_replace<AssetPayload<T>>(handle.ID, std::move(result));
                    info.State = LoadState::Ready;
                    PushEvent(entt::type_hash<T>::value(), handle, AssetEventKind::Added);
                    published = true;
                }
                else
                {
                    info.State = LoadState::Failed;
                    // The Failed handle stays queryable; the path itself is free to retry.
                    if (auto it = m_Lookup.find(std::hash<std::string>{}(path));
                        it != m_Lookup.end() && it->second == handle)
                    {
                        m_Lookup.erase(it);
                    }
                }
            }

            if (published)
            {
                Log::Info("Asset Loaded: {}", path);
            }
            else
            {
                Log::Error("Asset Failed: {}", path);
            }
        });

        return handle;
    }

    template <typename T>
    AssetHandle AssetManager::Add(std::string name, T value)
    {
        AssetHandle handle;
        {
            std::unique_lock lock(m_Mutex);
            const auto entity = m_Registry.create();
            handle = AssetHandle{entity};

            m_Registry.emplace<AssetInfo>(entity, std::move(name), LoadState::Ready);
            m_Registry.emplace<AssetPayload<T>>(entity, std::make_shared<const T>(std::move(value)));
            PushEvent(entt::type_hash<T>::value(), handle, AssetEventKind::Added);
        }
        return handle;
    }

    template <typename T>
    bool AssetManager::Replace(AssetHandle handle, T value)
    {
        std::unique_lock lock(m_Mutex);
        if (!m_Registry.valid(handle.ID)) return false;

        auto& info = m_Registry.get<AssetInfo>(handle.ID);
        if (info.State != LoadState::Ready) return false;

        auto* payload = m_Registry.try_get<AssetPayload<T>>(handle.ID);
        if (!payload) return false;

        payload->Resource = std::make_shared<const T>(std::move(value));
        PushEvent(entt::type_hash<T>::value(), handle, AssetEventKind::Modified);
        return true;
    }

    template <typename T>
    void AssetManager::Remove(AssetHandle handle)
    {
        std::unique_lock lock(m_Mutex);
        if (!m_Registry.valid(handle.ID)) return;

        if (m_Registry.all_of<AssetPayload<T>>(handle.ID))
        {
            PushEvent(entt::type_hash<T>::value(), handle, AssetEventKind::Removed);
        }

        if (const auto* source = m_Registry.try_get<AssetSource>(handle.ID))
        {
            // A Failed handle may have been superseded by a newer load of the path.
            if (auto it = m_Lookup.find(std::hash<std::string>{}(source->FilePath.string()));
                it != m_Lookup.end() && it->second == handle)
            {
                m_Lookup.erase(it);
            }
        }
        m_Registry.destroy(handle.ID);
    }

    template <typename T>
    std::shared_ptr<const T> AssetManager::Get(AssetHandle handle) const
    {
        std::shared_lock lock(m_Mutex);
        if (!m_Registry.valid(handle.ID)) return nullptr;

        const auto& info = m_Registry.get<AssetInfo>(handle.ID);
        if (info.State != LoadState::Ready) return nullptr;

        if (const auto* payload = m_Registry.try_get<AssetPayload<T>>(handle.ID))
        {
            return payload->Resource;
        }
        return nullptr;
    }

    template <typename T>
    void AssetManager::TrackEvents()
    {
        std::unique_lock lock(m_Mutex);
        m_TrackedEvents.insert(entt::type_hash<T>::value());
    }

    template <typename T>
    std::vector<AssetEvent> AssetManager::DrainEvents()
    {
        const entt::id_type type = entt::type_hash<T>::value();
        std::vector<AssetEvent> drained;

        std::unique_lock lock(m_Mutex);
        std::erase_if(m_Events, [&](const PendingEvent& pending)
        {
            if (pending.Type != type) return false;
            drained.push_back(pending.Event);
            return true;
        });
        return drained;
    }
}
