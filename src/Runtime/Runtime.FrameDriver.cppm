module;
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

export module Runtime.FrameDriver;

import Core;
import RHI;
import Graphics;

export namespace Runtime
{
    // Main-world state the render world extracts from each frame.
    struct MainWorld
    {
        std::optional<Graphics::SlimeHandle> Slime;
    };

    enum class FramePhase : uint8_t
    {
        Extract,
        Prepare,
        Queue,
        GraphUpdate,
        GraphExecute
    };

    // Runs one frame in a fixed phase order:
    //   extract -> prepare -> queue -> graph update -> graph run.
    // Each phase's systems run in registration order.
    class FrameDriver
    {
    public:
        using ExtractSystem = std::function<void(MainWorld&, Graphics::RenderWorld&)>;
        using RenderSystem = std::function<void(Graphics::RenderWorld&)>;
        using PhaseObserver = std::function<void(FramePhase)>;

        FrameDriver(MainWorld& mainWorld, Graphics::RenderWorld& renderWorld, Graphics::RenderGraph& graph);

        FrameDriver(const FrameDriver&) = delete;
        FrameDriver& operator=(const FrameDriver&) = delete;

        void AddExtractSystem(ExtractSystem system) { m_ExtractSystems.push_back(std::move(system)); }
        void AddPrepareSystem(RenderSystem system) { m_PrepareSystems.push_back(std::move(system)); }
        void AddQueueSystem(RenderSystem system) { m_QueueSystems.push_back(std::move(system)); }

        // Called at the start of every phase. Used by tools and tests.
        void SetPhaseObserver(PhaseObserver observer) { m_Observer = std::move(observer); }

        // Err only when the graph failed; the frame's commands are then incomplete.
        [[nodiscard]] Core::Result RunFrame(RHI::ICommandStream& commands);

        [[nodiscard]] uint64_t GetFrameIndex() const { return m_FrameIndex; }

    private:
        MainWorld& m_MainWorld;
        Graphics::RenderWorld& m_RenderWorld;
        Graphics::RenderGraph& m_Graph;

        std::vector<ExtractSystem> m_ExtractSystems;
        std::vector<RenderSystem> m_PrepareSystems;
        std::vector<RenderSystem> m_QueueSystems;
        PhaseObserver m_Observer;

        uint64_t m_FrameIndex = 0;

        void Enter(FramePhase phase) const;
    };
}
