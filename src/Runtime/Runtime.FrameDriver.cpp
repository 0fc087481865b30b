module;
#include <cstdint>
#include <functional>
#include <vector>

module Runtime.FrameDriver;

import Core;
import RHI;
import Graphics;

namespace Runtime
{
    FrameDriver::FrameDriver(MainWorld& mainWorld, Graphics::RenderWorld& renderWorld, Graphics::RenderGraph& graph)
        : m_MainWorld(mainWorld), m_RenderWorld(renderWorld), m_Graph(graph)
    {
    }

    Core::Result FrameDriver::RunFrame(RHI::ICommandStream& commands)
    {
        m_RenderWorld.SetFrameIndex(m_FrameIndex);

        Enter(FramePhase::Extract);
        for (auto& system : m_ExtractSystems)
            system(m_MainWorld, m_RenderWorld);

        Enter(FramePhase::Prepare);
        for (auto& system : m_PrepareSystems)
            system(m_RenderWorld);
        m_RenderWorld.Pipelines.ProcessQueue();

        Enter(FramePhase::Queue);
        for (auto& system : m_QueueSystems)
            system(m_RenderWorld);

        Enter(FramePhase::GraphUpdate);
        m_Graph.Update(m_RenderWorld);

        Enter(FramePhase::GraphExecute);
        Graphics::RenderGraphContext ctx;
        ctx.FrameIndex = m_FrameIndex;
        auto result = m_Graph.Run(ctx, commands, m_RenderWorld);

        ++m_FrameIndex;
        return result;
    }

    void FrameDriver::Enter(FramePhase phase) const
    {
        if (m_Observer) m_Observer(phase);
    }
}
