#include <h3wire/core/ConfigLoader.hpp>
#include <h3wire/core/Logger.hpp>
#include <h3wire/core/LoggingConfig.hpp>
#include <h3wire/ToolConfig.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
int g_fail = 0;

#define CHECK(expr)                                                                                \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
        {                                                                                          \
            ++g_fail;                                                                              \
            std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " :: " #expr << "\n";     \
        }                                                                                          \
    } while (0)

using h3wire::ToolConfig;
using h3wire::core::ConfigLoader;
using h3wire::core::LogLevel;

// 테스트마다 임시 TOML 파일을 만들고 경로를 돌려준다.
static std::string writeTemp(std::string_view name, std::string_view body)
{
    const auto path = std::filesystem::temp_directory_path() / std::string(name);
    std::ofstream f(path, std::ios::trunc);
    f << body;
    return path.string();
}

template <typename Ex> static bool throwsOn(const std::string &path)
{
    try
    {
        (void)ConfigLoader::loadFile(path);
    }
    catch (const Ex &)
    {
        return true;
    }
    catch (const std::exception &e)
    {
        std::cerr << "  unexpected exception: " << e.what() << "\n";
    }
    return false;
}

static void test_defaults_when_datagram_section_missing()
{
    const auto path = writeTemp("h3wire_cfg_defaults.toml", "[tool]\n");
    const ToolConfig cfg = ConfigLoader::loadFile(path);

    CHECK(cfg.logLevel == LogLevel::Info);
    CHECK(cfg.logFilePath.empty());
    CHECK(cfg.maxDatagramSize == h3wire::core::defaults::kMaxDatagramSize);
}

static void test_overrides()
{
    const auto path = writeTemp("h3wire_cfg_overrides.toml", "[tool]\n"
                                                             "log_level = \"WARNING\"\n"
                                                             "log_file_path = \"/tmp/h3.log\"\n"
                                                             "[datagram]\n"
                                                             "max_datagram_size = 1350\n");
    const ToolConfig cfg = ConfigLoader::loadFile(path);

    CHECK(cfg.logLevel == LogLevel::Warn);
    CHECK(cfg.logFilePath == "/tmp/h3.log");
    CHECK(cfg.maxDatagramSize == 1350);
}

static void test_missing_tool_section_is_rejected()
{
    const auto path = writeTemp("h3wire_cfg_no_tool.toml", "[datagram]\nmax_datagram_size = 10\n");
    CHECK(throwsOn<std::runtime_error>(path));
}

static void test_invalid_values_are_rejected()
{
    CHECK(throwsOn<std::invalid_argument>(
        writeTemp("h3wire_cfg_bad_level.toml", "[tool]\nlog_level = \"loud\"\n")));
    CHECK(throwsOn<std::invalid_argument>(writeTemp(
        "h3wire_cfg_negative.toml", "[tool]\n[datagram]\nmax_datagram_size = -1\n")));
    CHECK(throwsOn<std::invalid_argument>(
        writeTemp("h3wire_cfg_zero.toml", "[tool]\n[datagram]\nmax_datagram_size = 0\n")));
    CHECK(throwsOn<std::invalid_argument>(
        writeTemp("h3wire_cfg_huge.toml", "[tool]\n[datagram]\nmax_datagram_size = 70000\n")));
}

static void test_parse_error_and_missing_file()
{
    CHECK(throwsOn<std::runtime_error>(writeTemp("h3wire_cfg_broken.toml", "[tool\nlog_level=")));
    CHECK(throwsOn<std::runtime_error>(
        (std::filesystem::temp_directory_path() / "h3wire_cfg_does_not_exist.toml").string()));
}

static void test_load_requires_config_argument()
{
    char arg0[] = "h3dgram";
    char arg1[] = "decode";
    char arg2[] = "00";
    char *argv[] = {arg0, arg1, arg2, nullptr};

    bool threw = false;
    try
    {
        (void)ConfigLoader::load(3, argv);
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    CHECK(threw);
}

static void test_load_from_argv()
{
    const auto path = writeTemp("h3wire_cfg_argv.toml", "[tool]\nlog_level = \"debug\"\n");
    std::string pathArg = path;

    char arg0[] = "h3dgram";
    char arg1[] = "--config";
    char arg3[] = "decode";
    char *argv[] = {arg0, arg1, pathArg.data(), arg3, nullptr};

    const ToolConfig cfg = ConfigLoader::load(4, argv);
    CHECK(cfg.logLevel == LogLevel::Debug);
}

static void test_log_level_names()
{
    LogLevel lvl = LogLevel::Info;
    CHECK(h3wire::core::tryParseLogLevel("trace", lvl) && lvl == LogLevel::Trace);
    CHECK(h3wire::core::tryParseLogLevel("Error", lvl) && lvl == LogLevel::Error);
    CHECK(h3wire::core::tryParseLogLevel("FATAL", lvl) && lvl == LogLevel::Fatal);
    CHECK(!h3wire::core::tryParseLogLevel("", lvl));
    CHECK(!h3wire::core::tryParseLogLevel("verbose", lvl));
    CHECK(lvl == LogLevel::Fatal);
    CHECK(std::string_view(h3wire::core::toString(LogLevel::Warn)) == "WARN");
}

// 파일 logger로 교체 후 구조화 라인("comp | evt | k=v") 확인
static void test_logging_config_writes_file()
{
    const auto path = std::filesystem::temp_directory_path() / "h3wire_logging_test.log";
    std::filesystem::remove(path);

    ToolConfig cfg;
    cfg.logFilePath = path.string();
    cfg.logLevel = LogLevel::Info;
    h3wire::core::applyLoggingConfig(cfg);

    SLOG_DEBUG("LoggingTest", "Filtered", "k={}", 1);
    SLOG_INFO("LoggingTest", "Hello", "k={}", 42);
    h3wire::core::shutdownLogger(); // flush + join

    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    const std::string text = ss.str();

    CHECK(text.find("| INFO  | LoggingTest | Hello | k=42") != std::string::npos);
    CHECK(text.find("Filtered") == std::string::npos);
    CHECK(text.find("main tid=") != std::string::npos);
}

static void test_logging_config_bad_path_throws()
{
    ToolConfig cfg;
    cfg.logFilePath = "/nonexistent-dir-h3wire/x.log";

    bool threw = false;
    try
    {
        h3wire::core::applyLoggingConfig(cfg);
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    CHECK(threw);
}
} // namespace

int main()
{
    test_defaults_when_datagram_section_missing();
    test_overrides();
    test_missing_tool_section_is_rejected();
    test_invalid_values_are_rejected();
    test_parse_error_and_missing_file();
    test_load_requires_config_argument();
    test_load_from_argv();
    test_log_level_names();
    test_logging_config_writes_file();
    test_logging_config_bad_path_throws();

    h3wire::core::shutdownLogger();

    if (g_fail == 0)
    {
        std::cout << "[OK] h3wire.core.config (ConfigLoader/ToolConfig)\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
