#include <h3wire/ToolConfig.hpp>

#include <stdexcept>
#include <string>

namespace h3wire
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[ToolConfig] " + detail;
    SLOG_ERROR("ToolConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}
} // namespace

void validateToolConfig(const ToolConfig &config)
{
    if (config.maxDatagramSize == 0)
    {
        throwConfigError("maxDatagramSize must be >= 1");
    }
    if (config.maxDatagramSize > core::defaults::kMaxDatagramSizeLimit)
    {
        throwConfigError("maxDatagramSize must be <= " +
                         std::to_string(core::defaults::kMaxDatagramSizeLimit));
    }
}

} // namespace h3wire
