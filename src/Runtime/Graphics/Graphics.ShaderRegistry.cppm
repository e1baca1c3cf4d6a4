module;

#include <string>
#include <unordered_map>
#include <optional>

export module Graphics:ShaderRegistry;

import Core;

export namespace Graphics
{
    using namespace Core::Hash;

    inline constexpr StringID kShader_AvatarVert = "Avatar.Vert"_id;
    inline constexpr StringID kShader_AvatarVertSkinned = "Avatar.Vert.Skinned"_id;
    inline constexpr StringID kShader_AvatarFrag = "Avatar.Frag"_id;
    inline constexpr StringID kShader_MorphComp = "Morph.Comp"_id;

    // Lightweight, data-driven shader path registry.
    // Contract: populated during renderer init (single-threaded), read-only afterwards.
    class ShaderRegistry
    {
    public:
        void Register(StringID name, const std::string& path)
        {
            m_Paths[name] = path;
        }

        // SPIR-V file names produced by the shader build step, resolved against directory.
        void RegisterDefaults(const std::string& directory)
        {
            const std::string prefix = directory.empty() || directory.back() == '/' ? directory : directory + "/";
            Register(kShader_AvatarVert, prefix + "avatar.vert.spv");
            Register(kShader_AvatarVertSkinned, prefix + "avatar_skinned.vert.spv");
            Register(kShader_AvatarFrag, prefix + "avatar.frag.spv");
            Register(kShader_MorphComp, prefix + "morph_accumulate.comp.spv");
        }

        [[nodiscard]] std::optional<std::string> Get(StringID name) const
        {
            auto it = m_Paths.find(name);
            if (it != m_Paths.end())
                return it->second;
            return std::nullopt;
        }

        [[nodiscard]] bool Contains(StringID name) const
        {
            return m_Paths.contains(name);
        }

        [[nodiscard]] size_t Size() const { return m_Paths.size(); }

    private:
        std::unordered_map<StringID, std::string> m_Paths;
    };
}
