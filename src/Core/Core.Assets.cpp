module;
#include <entt/entt.hpp>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

module Core:Assets.Impl;
import :Assets;

namespace Core::Assets
{
    void AssetManager::PushEvent(entt::id_type type, AssetHandle handle, AssetEventKind kind)
    {
        if (!m_TrackedEvents.contains(type)) return;
        m_Events.push_back({type, {handle, kind}});
    }

    LoadState AssetManager::GetState(AssetHandle handle) const
    {
        std::shared_lock lock(m_Mutex);
        if (!m_Registry.valid(handle.ID)) return LoadState::Unloaded;
        return m_Registry.get<AssetInfo>(handle.ID).State;
    }

    void AssetManager::Clear()
    {
        std::unique_lock lock(m_Mutex);
        m_Registry.clear();
        m_Lookup.clear();
        m_Events.clear();
        m_TrackedEvents.clear();
    }
}
