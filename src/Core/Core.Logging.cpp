module;

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;
        std::atomic<Level> s_MinimumLevel{Level::Debug};
        ScopedCapture* s_ActiveCapture = nullptr;
    }

    void SetLevel(Level minimum)
    {
        s_MinimumLevel.store(minimum, std::memory_order_relaxed);
    }

    Level GetLevel()
    {
        return s_MinimumLevel.load(std::memory_order_relaxed);
    }

    void PrintColored(Level level, std::string_view msg)
    {
        if (level < s_MinimumLevel.load(std::memory_order_relaxed))
            return;

        std::lock_guard lock(s_LogMutex);

        // ANSI Color Codes
        const char* color = "\033[0m";
        const char* label = "[INFO] ";

        switch (level)
        {
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        }

        std::cout << color << label << msg << "\033[0m" << std::endl;

        if (s_ActiveCapture)
            s_ActiveCapture->m_Messages.push_back({level, std::string(msg)});
    }

    ScopedCapture::ScopedCapture()
    {
        std::lock_guard lock(s_LogMutex);
        m_Previous = s_ActiveCapture;
        s_ActiveCapture = this;
    }

    ScopedCapture::~ScopedCapture()
    {
        std::lock_guard lock(s_LogMutex);
        if (s_ActiveCapture == this)
            s_ActiveCapture = m_Previous;
    }

    std::vector<CapturedMessage> ScopedCapture::Messages() const
    {
        std::lock_guard lock(s_LogMutex);
        return m_Messages;
    }

    size_t ScopedCapture::Count(Level level) const
    {
        std::lock_guard lock(s_LogMutex);
        return static_cast<size_t>(std::ranges::count_if(m_Messages, [level](const CapturedMessage& m)
        {
            return m.Severity == level;
        }));
    }

    bool ScopedCapture::Contains(std::string_view fragment) const
    {
        std::lock_guard lock(s_LogMutex);
        return std::ranges::any_of(m_Messages, [fragment](const CapturedMessage& m)
        {
            return m.Text.find(fragment) != std::string::npos;
        });
    }
}
