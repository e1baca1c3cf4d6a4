export module RHI;

export import :Buffer;
export import :CommandUtils;
export import :ComputePipeline;
export import :Context;
export import :Device;
export import :FrameContext;
export import :Pipeline;
export import :Shader;
export import :SubmissionTracker;
