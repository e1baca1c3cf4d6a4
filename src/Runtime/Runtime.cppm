export module Runtime;

export import :AvatarRenderer;
export import :GraphicsBackend;
export import :RendererConfig;
