module;
#include <format>
#include <string>
#include <string_view>
#include <vector>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct CapturedMessage
    {
        Level Severity;
        std::string Text;
    };

    // Internal helper, writes ANSI colored output and feeds the active capture.
    void PrintColored(Level level, std::string_view msg);

    // Messages below this level are dropped. Debug messages additionally
    // compile out under NDEBUG.
    void SetLevel(Level minimum);
    [[nodiscard]] Level GetLevel();

    // Collects every message emitted while alive (console output still happens).
    // Captures do not nest; the newest one wins until it is destroyed.
    class ScopedCapture
    {
    public:
        ScopedCapture();
        ~ScopedCapture();

        ScopedCapture(const ScopedCapture&) = delete;
        ScopedCapture& operator=(const ScopedCapture&) = delete;

        [[nodiscard]] std::vector<CapturedMessage> Messages() const;
        [[nodiscard]] size_t Count(Level level) const;
        [[nodiscard]] bool Contains(std::string_view fragment) const;

    private:
        ScopedCapture* m_Previous = nullptr;
        std::vector<CapturedMessage> m_Messages;

        friend void PrintColored(Level level, std::string_view msg);
    };

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        ((void)args, ...);
        (void)fmt;
#endif
    }
}
