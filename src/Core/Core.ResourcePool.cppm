module;

#include <concepts>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Handle-addressed storage for device objects. Removal is deferred by
    // FramesInFlight so a resource recorded into a command buffer that is
    // still executing stays alive until that frame has retired.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;

        void Initialize(uint32_t framesInFlight)
        {
            m_FramesInFlight = framesInFlight;
        }

        Handle Add(std::unique_ptr<T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            // The resource lives behind a unique_ptr, so its address survives m_Slots growth.
            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        void Remove(Handle handle, uint64_t currentFrame)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size()) return;

            Slot& slot = m_Slots[handle.Index];
            if (slot.IsActive && slot.Generation == handle.Generation)
            {
                slot.IsActive = false;
                --m_ActiveCount;
                m_PendingKill.push_back({handle.Index, handle.Generation, currentFrame});
            }
        }

        void ProcessDeletions(uint64_t currentFrame)
        {
            std::unique_lock lock(m_Mutex);
            if (m_PendingKill.empty()) return;

            std::erase_if(m_PendingKill, [&](const PendingKill& item)
            {
                if (currentFrame <= item.KillFrame + m_FramesInFlight)
                    return false;

                Slot& slot = m_Slots[item.SlotIndex];
                if (!slot.IsActive && slot.Generation == item.Generation)
                {
                    slot.Data.reset();
                    m_FreeIndices.push_back(item.SlotIndex);
                }
                return true;
            });
        }

        [[nodiscard]] Core::Expected<T*> Get(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size())
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation)
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            return slot.Data.get();
        }

        // Drops everything, including resources waiting on deferred deletion.
        // Only call once the device is idle.
        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_PendingKill.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t ActiveCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_ActiveCount;
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrame;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKill;
        size_t m_ActiveCount = 0;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_FramesInFlight = 2;
    };
}
