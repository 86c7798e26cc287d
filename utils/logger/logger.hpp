#ifndef TRELLIS_UTILS_LOGGER_HPP
#define TRELLIS_UTILS_LOGGER_HPP

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <atomic>
#include <string>
#include <string_view>
#include <type_traits>

#define TRELLIS_LOG_ALL      Logger::ALL_MASK
#define TRELLIS_LOG_WARNINGS Logger::WARN_MASK | Logger::ERROR_MASK | Logger::FATAL_MASK
#define TRELLIS_LOG_INFO     Logger::INFO_MASK | TRELLIS_LOG_WARNINGS
#define TRELLIS_LOG_NONE     Logger::NONE_MASK

namespace Trellis::Utils {

class Logger {
public:
    using LevelMask = uint32_t;

    enum class Level : uint8_t {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERR,
        FATAL,
        NONE
    };

    enum : LevelMask {
        TRACE_MASK = 1 << static_cast<int>(Level::TRACE),
        DEBUG_MASK = 1 << static_cast<int>(Level::DEBUG),
        INFO_MASK  = 1 << static_cast<int>(Level::INFO),
        WARN_MASK  = 1 << static_cast<int>(Level::WARN),
        ERROR_MASK = 1 << static_cast<int>(Level::ERR),
        FATAL_MASK = 1 << static_cast<int>(Level::FATAL),
        ALL_MASK   = TRACE_MASK | DEBUG_MASK | INFO_MASK | WARN_MASK | ERROR_MASK | FATAL_MASK,
        NONE_MASK  = 0
    };

public:
    static Logger& GetInstance();

    // "all", "info", "warnings" or "none", anything else yields 'fallback'
    static LevelMask ParseLevelMask(std::string_view name, LevelMask fallback);

    void      SetLevelMask(LevelMask mask)  { levelMask_ = mask; }
    LevelMask GetLevelMask() const          { return levelMask_.load(); }
    void      EnableTimestamps(bool enabled) { useTimestamps_ = enabled; }

    // Public variadic logging APIs
    template <typename... Args> void Print(Args&&... args) { Log<false>(Level::INFO, std::forward<Args>(args)...); }
    template <typename... Args> void Trace(Args&&... args) { Log(Level::TRACE,       std::forward<Args>(args)...); }
    template <typename... Args> void Debug(Args&&... args) { Log(Level::DEBUG,       std::forward<Args>(args)...); }
    template <typename... Args> void Info (Args&&... args) { Log(Level::INFO,        std::forward<Args>(args)...); }
    template <typename... Args> void Warn (Args&&... args) { Log(Level::WARN,        std::forward<Args>(args)...); }
    template <typename... Args> void Error(Args&&... args) { Log(Level::ERR,         std::forward<Args>(args)...); }
    template <typename... Args> void Fatal(Args&&... args) { Log(Level::FATAL,       std::forward<Args>(args)...);
                                                                                     std::fflush(stderr);
                                                                                     std::exit(EXIT_FAILURE); }

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    const char* LevelToString(Level level) const;
    void CurrentTimestamp(char* buf, size_t len) const;

    template <bool PureLog = true, typename... Args>
    void Log(Level level, Args&&... args);

    template <typename T>
    void PrintArg(FILE* out, T&& arg);

private:
    std::atomic<LevelMask> levelMask_     = ALL_MASK;
    std::atomic<bool>      useTimestamps_ = true;
    std::mutex             logMutex_;
};

} // namespace Trellis::Utils

// Template method definitions must go in the header
namespace Trellis::Utils {

template <typename T>
void Logger::PrintArg(FILE* out, T&& arg) {
    using U = std::decay_t<T>;

    if constexpr(std::is_same_v<U, const char*> || std::is_same_v<U, char*>)
        std::fprintf(out, "%s", arg ? arg : "(null)");

    else if constexpr(std::is_same_v<U, std::string>)
        std::fprintf(out, "%s", arg.c_str());

    else if constexpr(std::is_same_v<U, std::string_view>)
        std::fprintf(out, "%.*s", static_cast<int>(arg.size()), arg.data());

    else if constexpr(std::is_same_v<U, bool>)
        std::fputs(arg ? "true" : "false", out);

    else if constexpr(std::is_same_v<U, char>)
        std::fputc(arg, out);

    else if constexpr(std::is_enum_v<U>)
        std::fprintf(out, "%lld", static_cast<long long>(arg));

    else if constexpr(std::is_integral_v<U>) {
        if constexpr(std::is_signed_v<U>)
            std::fprintf(out, "%lld", static_cast<long long>(arg));
        else
            std::fprintf(out, "%llu", static_cast<unsigned long long>(arg));
    }

    else if constexpr(std::is_floating_point_v<U>)
        std::fprintf(out, "%f", static_cast<double>(arg));

    // fallback: print pointer
    else
        std::fprintf(out, "%p", (const void*)&arg);
}

template <bool PureLog, typename... Args>
void Logger::Log(Level level, Args&&... args)
{
    LevelMask mask = 1 << static_cast<int>(level);
    if((levelMask_.load() & mask) == 0)
        return;

    std::lock_guard<std::mutex> lock(logMutex_);
    FILE* out = (level >= Level::WARN) ? stderr : stdout;

    if(useTimestamps_ && PureLog) {
        char ts[32];
        CurrentTimestamp(ts, sizeof(ts));
        std::fprintf(out, "[%s] ", ts);
    }

    if constexpr(PureLog)
        std::fprintf(out, "[%s] ", LevelToString(level));

    (PrintArg(out, std::forward<Args>(args)), ...);

    std::fputc('\n', out);
}

} // namespace Trellis::Utils

#endif // TRELLIS_UTILS_LOGGER_HPP
