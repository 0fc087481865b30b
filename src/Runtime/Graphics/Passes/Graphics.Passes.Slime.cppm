module;
#include <cstdint>
#include <string_view>

export module Graphics:Passes.Slime;

import Core;
import RHI;
import :RenderGraph;
import :RenderWorld;
import :PipelineCache;
import :Slime;

export namespace Graphics
{
    enum class SlimeState : uint8_t
    {
        Loading, // Pipeline not compiled or no slime bound yet.
        Update   // Pipeline ready; dispatches every frame.
    };

    [[nodiscard]] constexpr std::string_view SlimeStateToString(SlimeState state)
    {
        switch (state)
        {
        case SlimeState::Loading: return "Loading";
        case SlimeState::Update:  return "Update";
        }
        return "Unknown";
    }

    // Drives the slime update shader. Leaves Loading the first frame the
    // pipeline reports Ok with a slime bind group in place, and never goes
    // back. A group that disappears later only skips the dispatch.
    class SlimeNode final : public IRenderGraphNode
    {
    public:
        void Update(RenderWorld& world) override;

        [[nodiscard]] Core::Result Run(RenderGraphContext& ctx,
                                       RHI::ICommandStream& commands,
                                       const RenderWorld& world) override;

        [[nodiscard]] SlimeState GetState() const { return m_State; }

    private:
        SlimeState m_State = SlimeState::Loading;
        bool m_WarnedMissingGroup = false;
    };

    // Queue phase: (re)builds the slime bind group for the active slime's
    // prepared buffer. Keeps the current group when the buffer is unchanged
    // or not prepared yet.
    void QueueSlimeBindGroup(RenderWorld& world);
}
