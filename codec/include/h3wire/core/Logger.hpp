#pragma once

#include <h3wire/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace h3wire::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

/// "TRACE" ... "FATAL"
const char *toString(LogLevel level) noexcept;

/// 대소문자 무시("warning"도 Warn). 모르는 이름이면 false, out은 그대로.
bool tryParseLogLevel(std::string_view name, LogLevel &out) noexcept;

namespace detail
{
// 전역 fast filter (Logger.cpp에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

class ILogger : private h3wire::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // message는 이미 "comp | evt | key=value..." 형태
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 비동기 stream logger. 호출 스레드는 큐에 넣기만 하고, 백그라운드 스레드가 기록한다.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 잔여 로그를 모두 flush 하고 writer 스레드를 join
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | main tid=123 | INFO  | comp | evt | k=v ..."
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, std::format(fmt, std::forward<Args>(args)...)));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Trace, (comp),                            \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Debug, (comp),                            \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Info, (comp),                             \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Warn, (comp),                             \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Error, (comp),                            \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::h3wire::core::slog::emit(::h3wire::core::LogLevel::Fatal, (comp),                            \
                               (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace h3wire::core
