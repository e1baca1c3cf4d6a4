export module Graphics;

export import :DrawEncoder;
export import :FrameResources;
export import :GpuTypes;
export import :ModelResidency;
export import :MorphBufferPool;
export import :MorphComputeDispatcher;
export import :PipelineLibrary;
export import :ShaderRegistry;
