module;
#include <cstdint>

export module Runtime.SlimeModule;

import Core;
import Graphics;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;

export namespace Runtime
{
    // Wires the slime simulation into an engine instance:
    //  - .slime import/export formats
    //  - extract: active slime handle, changed slime assets
    //  - prepare: slime GPU buffers
    //  - queue: slime bind group
    //  - graph: "slime" node ordered before "camera_driver"
    class SlimeModule
    {
    public:
        explicit SlimeModule(const Graphics::SlimeConfig& config = {});

        SlimeModule(const SlimeModule&) = delete;
        SlimeModule& operator=(const SlimeModule&) = delete;

        // Call once, before the first frame. ShaderPath in the config is
        // handed to the asset pipeline as is.
        [[nodiscard]] Core::Result Build(AssetPipeline& assets,
                                         Graphics::RenderWorld& renderWorld,
                                         Graphics::RenderGraph& graph,
                                         FrameDriver& driver);

        [[nodiscard]] const Graphics::SlimeConfig& GetConfig() const { return m_Config; }

        // Owned by the render graph; null before Build().
        [[nodiscard]] const Graphics::SlimeNode* GetNode() const { return m_Node; }

    private:
        Graphics::SlimeConfig m_Config;
        Graphics::SlimeNode* m_Node = nullptr;
    };
}
