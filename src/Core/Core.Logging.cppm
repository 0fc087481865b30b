module;
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level : uint8_t
    {
        Debug = 0,
        Info,
        Warning,
        Error,
        Off
    };

    // Messages below the minimum level are dropped before formatting.
    void SetLevel(Level level);
    [[nodiscard]] Level GetLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    void PrintColored(Level level, std::string_view msg);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Info)) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Warning)) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Error)) return;
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug)) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
