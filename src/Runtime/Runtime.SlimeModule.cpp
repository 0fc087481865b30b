module;
#include <memory>
#include <utility>

module Runtime.SlimeModule;

import Core;
import Graphics;
import Runtime.AssetPipeline;
import Runtime.FrameDriver;

namespace Runtime
{
    namespace
    {
        void ExtractSlimeHandle(MainWorld& main, Graphics::RenderWorld& world)
        {
            world.ActiveSlime = main.Slime;
        }

        void ExtractSlimeAssets(Graphics::RenderWorld& world)
        {
            auto& assets = world.GetAssets();
            for (const auto& event : assets.DrainEvents<Graphics::SlimeParams>())
            {
                switch (event.Kind)
                {
                case Core::Assets::AssetEventKind::Added:
                case Core::Assets::AssetEventKind::Modified:
                    if (auto params = assets.Get<Graphics::SlimeParams>(event.Handle))
                        world.Slimes.Extract(event.Handle, *params);
                    break;
                case Core::Assets::AssetEventKind::Removed:
                    world.Slimes.Remove(event.Handle);
                    break;
                }
            }
        }
    }

    SlimeModule::SlimeModule(const Graphics::SlimeConfig& config)
        : m_Config(config)
    {
    }

    Core::Result SlimeModule::Build(AssetPipeline& assets,
                                    Graphics::RenderWorld& renderWorld,
                                    Graphics::RenderGraph& graph,
                                    FrameDriver& driver)
    {
        if (m_Node)
            return Core::Err(Core::ErrorCode::InvalidState);

        // Slime changes from here on reach ExtractSlimeAssets.
        assets.GetAssetManager().TrackEvents<Graphics::SlimeParams>();

        auto& registry = assets.GetRegistry();
        if (!registry.FindLoader(".slime"))
            registry.RegisterLoader(std::make_unique<Graphics::SlimeLoader>());
        if (!registry.FindExporter(".slime"))
            registry.RegisterExporter(std::make_unique<Graphics::SlimeExporter>());

        const auto shader = assets.Load<Graphics::ShaderSource>(m_Config.ShaderPath);
        if (auto init = renderWorld.SlimePipe.Init(renderWorld.GetDevice(), renderWorld.Pipelines, shader, m_Config);
            !init)
        {
            return init;
        }

        auto node = std::make_unique<Graphics::SlimeNode>();
        Graphics::SlimeNode* nodePtr = node.get();
        if (auto added = graph.AddNode(Graphics::kNode_Slime, std::move(node)); !added)
            return added;

        if (!graph.GetNode(Graphics::kNode_CameraDriver))
        {
            if (auto added = graph.AddNode(Graphics::kNode_CameraDriver, std::make_unique<Graphics::CameraDriverNode>());
                !added)
            {
                return added;
            }
        }

        if (auto edge = graph.AddNodeEdge(Graphics::kNode_Slime, Graphics::kNode_CameraDriver); !edge)
            return edge;

        driver.AddExtractSystem([](MainWorld& main, Graphics::RenderWorld& world)
        {
            ExtractSlimeHandle(main, world);
        });
        driver.AddExtractSystem([](MainWorld&, Graphics::RenderWorld& world)
        {
            ExtractSlimeAssets(world);
        });
        driver.AddPrepareSystem([](Graphics::RenderWorld& world)
        {
            world.Slimes.Prepare(world.GetDevice());
        });
        driver.AddQueueSystem([](Graphics::RenderWorld& world)
        {
            Graphics::QueueSlimeBindGroup(world);
        });

        m_Node = nodePtr;
        Core::Log::Info("SlimeModule: built (shader '{}', entry '{}')", m_Config.ShaderPath, m_Config.EntryPoint);
        return Core::Ok();
    }
}
