module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where the caller MUST
    //                          handle failure (GPU allocation, pipeline builds,
    //                          strict validation).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome
    //                          (pipeline variant lookup, morph buffer lookup).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects
    //                          where nullptr means "no reference".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated
    //                          (joint indices inside the palette in dev builds).
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,
        StrictValidationFailed = 305,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        PipelineUnavailable = 405,
        SubmissionFailed = 406,

        // Asset errors (500-599)
        AssetNotLoaded = 500,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::OutOfMemory:             return "OutOfMemory";
            case ErrorCode::ResourceNotFound:        return "ResourceNotFound";
            case ErrorCode::ResourceBusy:            return "ResourceBusy";
            case ErrorCode::FileNotFound:            return "FileNotFound";
            case ErrorCode::FileReadError:           return "FileReadError";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::OutOfRange:              return "OutOfRange";
            case ErrorCode::StrictValidationFailed:  return "StrictValidationFailed";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:       return "OutOfDeviceMemory";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::PipelineUnavailable:     return "PipelineUnavailable";
            case ErrorCode::SubmissionFailed:        return "SubmissionFailed";
            case ErrorCode::AssetNotLoaded:          return "AssetNotLoaded";
            default:                                 return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
