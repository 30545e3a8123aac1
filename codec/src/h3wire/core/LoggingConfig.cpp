#include <h3wire/core/LoggingConfig.hpp>
#include <h3wire/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace h3wire::core
{
namespace
{

// 출력 stream 수명을 소유하는 Logger 래퍼. 선언 순서상 os_ 가 logger_ 보다 오래 산다.
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const h3wire::ToolConfig &cfg)
{
    std::shared_ptr<std::ostream> os;
    if (cfg.logFilePath.empty())
    {
        os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
    }
    else
    {
        auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
        if (!file->is_open())
        {
            throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
        }
        os = std::move(file);
    }

    // 이전 전역 logger는 잔여 로그를 flush 한 뒤 교체한다.
    shutdownLogger();
    setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.logLevel));
}

} // namespace h3wire::core
