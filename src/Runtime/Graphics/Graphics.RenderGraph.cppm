module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

export module Graphics:RenderGraph;

import Core;
import RHI;
import :RenderWorld;

export namespace Graphics
{
    inline constexpr Core::Hash::StringID kNode_Slime = "slime";
    inline constexpr Core::Hash::StringID kNode_CameraDriver = "camera_driver";

    struct RenderGraphContext
    {
        uint64_t FrameIndex = 0;
        Core::Hash::StringID CurrentNode;
    };

    // A unit of per-frame GPU work. Update may mutate node state from the
    // render world; Run only records commands.
    class IRenderGraphNode
    {
    public:
        virtual ~IRenderGraphNode() = default;

        virtual void Update(RenderWorld& world) { (void)world; }

        [[nodiscard]] virtual Core::Result Run(RenderGraphContext& ctx,
                                               RHI::ICommandStream& commands,
                                               const RenderWorld& world) = 0;
    };

    // Presentation boundary. Swapchain work lives outside the compute graph,
    // so the node records nothing; it anchors ordering edges.
    class CameraDriverNode final : public IRenderGraphNode
    {
    public:
        [[nodiscard]] Core::Result Run(RenderGraphContext&, RHI::ICommandStream&, const RenderWorld&) override
        {
            return Core::Ok();
        }
    };

    // Named nodes plus ordering edges. Run() executes in topological order;
    // nodes without an ordering constraint keep insertion order.
    class RenderGraph
    {
    public:
        RenderGraph() = default;

        RenderGraph(const RenderGraph&) = delete;
        RenderGraph& operator=(const RenderGraph&) = delete;

        [[nodiscard]] Core::Result AddNode(Core::Hash::StringID name, std::unique_ptr<IRenderGraphNode> node);

        // `from` runs before `to`.
        [[nodiscard]] Core::Result AddNodeEdge(Core::Hash::StringID from, Core::Hash::StringID to);

        [[nodiscard]] IRenderGraphNode* GetNode(Core::Hash::StringID name) const;
        [[nodiscard]] std::size_t GetNodeCount() const { return m_Nodes.size(); }

        void Update(RenderWorld& world);

        // Stops at the first failing node; later nodes are skipped this frame.
        [[nodiscard]] Core::Result Run(RenderGraphContext& ctx,
                                       RHI::ICommandStream& commands,
                                       const RenderWorld& world);

        [[nodiscard]] Core::Expected<std::vector<Core::Hash::StringID>> GetExecutionOrder() const;

    private:
        struct NodeData
        {
            Core::Hash::StringID Name;
            std::unique_ptr<IRenderGraphNode> Node;
            std::vector<uint32_t> Dependents;
            uint32_t Indegree = 0;
        };

        std::vector<NodeData> m_Nodes;
        std::unordered_map<Core::Hash::StringID, uint32_t> m_Lookup;

        mutable std::optional<std::vector<uint32_t>> m_CompiledOrder;

        [[nodiscard]] Core::Expected<std::vector<uint32_t>> Compile() const;
    };
}
