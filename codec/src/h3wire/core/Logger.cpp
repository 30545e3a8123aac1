#include <h3wire/core/Logger.hpp>
#include <h3wire/core/ThreadContext.hpp>

#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <iterator>
#include <mutex>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace h3wire::core
{

namespace
{
constexpr std::array<const char *, 6> kLevelNames = {"TRACE", "DEBUG", "INFO",
                                                     "WARN",  "ERROR", "FATAL"};

// gray, cyan, green, yellow, red, red
constexpr std::array<const char *, 6> kLevelColors = {"\x1b[90m", "\x1b[36m", "\x1b[32m",
                                                      "\x1b[33m", "\x1b[31m", "\x1b[31m"};
constexpr const char *kColorReset = "\x1b[0m";

std::size_t levelIndex(LogLevel lvl) noexcept
{
    const auto i = static_cast<std::size_t>(lvl);
    return (i < kLevelNames.size()) ? i : static_cast<std::size_t>(LogLevel::Info);
}

struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag;
    long threadId{};
};
} // namespace

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

const char *toString(LogLevel level) noexcept
{
    return kLevelNames[levelIndex(level)];
}

bool tryParseLogLevel(std::string_view name, LogLevel &out) noexcept
{
    const auto iequals = [](std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (std::toupper(static_cast<unsigned char>(a[i])) !=
                std::toupper(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    };

    if (iequals(name, "warning"))
    {
        out = LogLevel::Warn;
        return true;
    }
    for (std::size_t i = 0; i < kLevelNames.size(); ++i)
    {
        if (iequals(name, kLevelNames[i]))
        {
            out = static_cast<LogLevel>(i);
            return true;
        }
    }
    return false;
}

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
        {
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        }
        writer_ = std::thread([this]() { run(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return;
            stopped_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
        {
            writer_.join();
        }
    }

    void push(LogLevel level, std::string_view msg)
    {
        LogEvent ev{level, std::string(msg), std::chrono::system_clock::now(), std::string(ttag()),
                    tid()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return; // shutdown 이후 로그는 버린다
            pending_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(static_cast<int>(level), std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept
    {
        return static_cast<LogLevel>(minLevel_.load(std::memory_order_relaxed));
    }

  private:
    void run()
    {
        std::vector<LogEvent> batch;
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopped_ || !pending_.empty(); });
                if (pending_.empty())
                    return; // stopped_ && drained

                batch.assign(std::make_move_iterator(pending_.begin()),
                             std::make_move_iterator(pending_.end()));
                pending_.clear();
            }

            for (const auto &ev : batch)
            {
                if (ev.level >= minLevel())
                    write(ev);
            }
            os_.flush();
            batch.clear();
        }
    }

    void write(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const std::size_t li = levelIndex(ev.level);
        const char *c1 = useColor_ ? kLevelColors[li] : "";
        const char *c2 = useColor_ ? kColorReset : "";

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), ev.threadTag,
                           ev.threadId, c1, kLevelNames[li], c2, ev.message);
    }

    std::ostream &os_;
    std::thread writer_;
    std::deque<LogEvent> pending_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    std::atomic<int> minLevel_{static_cast<int>(LogLevel::Info)};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->push(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global Instance =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);
    globalLoggerStorage() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;
    instance->shutdown();
    instance.reset();
}

} // namespace h3wire::core
