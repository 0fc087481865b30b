module;
#include <optional>

module Graphics:RenderWorld.Impl;
import :RenderWorld;
import :PipelineCache;
import :Slime;
import Core;
import RHI;

namespace Graphics
{
    RenderWorld::RenderWorld(RHI::IDevice& device, Core::Assets::AssetManager& assets)
        : m_Device(device),
          m_Assets(assets),
          Pipelines(device, assets),
          Slimes(&PrepareSlime, [this](const GpuSlime& slime, RHI::IDevice& device) { OnSlimeReleased(slime, device); })
    {
    }

    RenderWorld::~RenderWorld()
    {
        ReleaseGpuResources();
    }

    void RenderWorld::ReleaseGpuResources()
    {
        if (SlimeGroup)
        {
            m_Device.DestroyBindGroup(SlimeGroup->Group);
            SlimeGroup.reset();
        }
        Slimes.Clear(m_Device);
        SlimePipe.Shutdown(m_Device);
    }

    void RenderWorld::OnSlimeReleased(const GpuSlime& slime, RHI::IDevice& device)
    {
        if (SlimeGroup && SlimeGroup->Source == slime.Buffer)
        {
            device.DestroyBindGroup(SlimeGroup->Group);
            SlimeGroup.reset();
        }
        ReleaseSlime(slime, device);
    }
}
