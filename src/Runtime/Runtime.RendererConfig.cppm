module;
#include <cstdint>
#include <optional>
#include <string>

// Set by the build to the SPIR-V output directory
#ifndef MARIONETTE_SHADER_DIR
    #define MARIONETTE_SHADER_DIR "shaders"
#endif

export module Runtime:RendererConfig;

import Avatar;

export namespace Runtime
{
    struct RendererConfig
    {
        std::string AppName = "Marionette";
        bool EnableValidation = false;

        uint32_t MaxFramesInFlight = Avatar::kDefaultFramesInFlight;
        std::string ShaderDirectory = MARIONETTE_SHADER_DIR;

        Avatar::StrictLevel Strict = Avatar::StrictLevel::Off;

        // Debug toggles
        bool Wireframe = false;
        bool DisableCulling = false;
        bool DisableSkinning = false;
        bool DisableMorphs = false;
        bool DebugSingleMesh = false;
        std::optional<Avatar::RenderFilter> Filter;
        std::optional<uint32_t> DrawUntil;
        std::optional<uint32_t> DrawOnlyIndex;

        [[nodiscard]] Avatar::SelectorToggles GetSelectorToggles() const
        {
            return {Wireframe, DisableCulling, DisableSkinning};
        }

        [[nodiscard]] Avatar::SelectionOptions GetSelectionOptions() const
        {
            return {DebugSingleMesh, Filter};
        }

        [[nodiscard]] Avatar::StrictValidator::Config GetValidatorConfig() const
        {
            return {Strict, DrawUntil, DrawOnlyIndex};
        }

        static RendererConfig Production()
        {
            return {};
        }

        static RendererConfig Development()
        {
            RendererConfig config;
            config.EnableValidation = true;
            config.Strict = Avatar::StrictLevel::Warn;
            return config;
        }

        static RendererConfig Debug()
        {
            RendererConfig config = Development();
            config.Strict = Avatar::StrictLevel::Fail;
            return config;
        }
    };
}
