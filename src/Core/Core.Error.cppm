module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E> - fallible operations the caller must handle
    //                          (file I/O, decoding, device allocation).
    // 2. std::optional<T>    - lookups where "not there yet" is a normal answer
    //                          (prepared GPU resources, compiled pipelines).
    // 3. Raw pointers (T*)   - non-owning observation only; nullptr means absent.
    //
    // Engine code does not throw.
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
        FileWriteError = 202,
        InvalidPath = 203,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        DeviceNotAvailable = 404,

        // Asset errors (500-599)
        AssetNotLoaded = 500,
        AssetLoadFailed = 501,
        AssetTypeMismatch = 502,

        Unknown = 999
    };

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
            case ErrorCode::FileWriteError:          return "FileWriteError";
            case ErrorCode::InvalidPath:             return "InvalidPath";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::InvalidFormat:           return "InvalidFormat";
            case ErrorCode::OutOfRange:              return "OutOfRange";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:       return "OutOfDeviceMemory";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::DeviceNotAvailable:      return "DeviceNotAvailable";
            case ErrorCode::AssetNotLoaded:          return "AssetNotLoaded";
            case ErrorCode::AssetLoadFailed:         return "AssetLoadFailed";
            case ErrorCode::AssetTypeMismatch:       return "AssetTypeMismatch";
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
