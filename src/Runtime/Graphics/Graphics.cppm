export module Graphics;

export import :AssetErrors;
export import :SlimeAsset;
export import :ShaderAsset;
export import :IORegistry;
export import :Importers.Slime;
export import :Importers.SPIRV;
export import :Exporters.Slime;
export import :RenderAssets;
export import :PipelineCache;
export import :Slime;
export import :RenderWorld;
export import :RenderGraph;
export import :Passes.Slime;
