module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

module Graphics:RenderGraph.Impl;
import :RenderGraph;
import :RenderWorld;
import Core;
import RHI;

namespace Graphics
{
    Core::Result RenderGraph::AddNode(Core::Hash::StringID name, std::unique_ptr<IRenderGraphNode> node)
    {
        if (!node)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        if (m_Lookup.contains(name))
        {
            Core::Log::Error("RenderGraph: node '{}' already exists", name.Name());
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_Lookup.emplace(name, static_cast<uint32_t>(m_Nodes.size()));
        m_Nodes.push_back(NodeData{name, std::move(node), {}, 0});
        m_CompiledOrder.reset();
        return Core::Ok();
    }

    Core::Result RenderGraph::AddNodeEdge(Core::Hash::StringID from, Core::Hash::StringID to)
    {
        auto fromIt = m_Lookup.find(from);
        auto toIt = m_Lookup.find(to);
        if (fromIt == m_Lookup.end() || toIt == m_Lookup.end())
        {
            Core::Log::Error("RenderGraph: edge '{}' -> '{}' references a missing node", from.Name(), to.Name());
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        auto& dependents = m_Nodes[fromIt->second].Dependents;
        if (std::find(dependents.begin(), dependents.end(), toIt->second) != dependents.end())
            return Core::Ok();

        dependents.push_back(toIt->second);
        m_Nodes[toIt->second].Indegree++;
        m_CompiledOrder.reset();
        return Core::Ok();
    }

    IRenderGraphNode* RenderGraph::GetNode(Core::Hash::StringID name) const
    {
        auto it = m_Lookup.find(name);
        return it != m_Lookup.end() ? m_Nodes[it->second].Node.get() : nullptr;
    }

    void RenderGraph::Update(RenderWorld& world)
    {
        for (auto& node : m_Nodes)
            node.Node->Update(world);
    }

    Core::Result RenderGraph::Run(RenderGraphContext& ctx, RHI::ICommandStream& commands, const RenderWorld& world)
    {
        if (!m_CompiledOrder)
        {
            auto order = Compile();
            if (!order)
                return Core::Err(order.error());
            m_CompiledOrder = std::move(*order);
        }

        for (uint32_t index : *m_CompiledOrder)
        {
            NodeData& node = m_Nodes[index];
            ctx.CurrentNode = node.Name;

            if (auto result = node.Node->Run(ctx, commands, world); !result)
            {
                Core::Log::Error("RenderGraph: node '{}' failed ({}); aborting frame {}",
                                 node.Name.Name(), Core::ErrorCodeToString(result.error()), ctx.FrameIndex);
                return result;
            }
        }
        return Core::Ok();
    }

    Core::Expected<std::vector<Core::Hash::StringID>> RenderGraph::GetExecutionOrder() const
    {
        auto order = Compile();
        if (!order)
            return std::unexpected(order.error());

        std::vector<Core::Hash::StringID> names;
        names.reserve(order->size());
        for (uint32_t index : *order)
            names.push_back(m_Nodes[index].Name);
        return names;
    }

    // Kahn's algorithm. The ready set is kept sorted by insertion index so the
    // order is stable across frames.
    Core::Expected<std::vector<uint32_t>> RenderGraph::Compile() const
    {
        const auto count = static_cast<uint32_t>(m_Nodes.size());

        std::vector<uint32_t> indeg(count);
        for (uint32_t i = 0; i < count; ++i)
            indeg[i] = m_Nodes[i].Indegree;

        std::vector<uint32_t> ready;
        for (uint32_t i = 0; i < count; ++i)
        {
            if (indeg[i] == 0) ready.push_back(i);
        }

        std::vector<uint32_t> order;
        order.reserve(count);

        while (!ready.empty())
        {
            const uint32_t nodeIdx = ready.front();
            ready.erase(ready.begin());
            order.push_back(nodeIdx);

            for (uint32_t depIdx : m_Nodes[nodeIdx].Dependents)
            {
                if (--indeg[depIdx] == 0)
                    ready.insert(std::upper_bound(ready.begin(), ready.end(), depIdx), depIdx);
            }
        }

        if (order.size() != count)
        {
            Core::Log::Error("RenderGraph: dependency cycle detected (ordered {} / {})", order.size(), count);
            return std::unexpected(Core::ErrorCode::InvalidState);
        }
        return order;
    }
}
