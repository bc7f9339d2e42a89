module;
#include <format>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Messages below the threshold are dropped. Defaults to Info.
    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();

    void PrintColored(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Info) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Warning) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (GetMinLevel() > Level::Debug) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
