#include <h3wire/core/ConfigLoader.hpp>

#include <h3wire/core/Logger.hpp>
#include <h3wire/ToolConfig.hpp>

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace h3wire;
using namespace h3wire::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

static void printUsage(const char *argv0)
{
    std::string exe = "h3dgram";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
    std::cout << "Usage: " << exe << " --config <path.toml> decode <hex>\n"
              << "       " << exe << " --config <path.toml> encode <qstream-id> <hex-payload>\n";
}

static std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static LogLevel parseLogLevel(std::string_view s)
{
    LogLevel lvl{};
    if (!tryParseLogLevel(s, lvl))
        throw std::invalid_argument("Invalid log_level: " + std::string(s));
    return lvl;
}

// [Strict Mode] 음수/범위 초과는 조용히 자르지 않고 실패
static std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " + std::to_string(v));
    return static_cast<std::size_t>(v);
}

static const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

// -----------------------------------------------------------------------------
// Main Parsing Logic
// -----------------------------------------------------------------------------

static void applyToolToml(ToolConfig &cfg, const toml::table &root)
{
    // [Strict] [tool] 섹션은 필수
    const toml::table &tool = requireTable(root, "tool");

    if (auto s = tool["log_level"].value<std::string>())
        cfg.logLevel = parseLogLevel(*s);

    if (auto s = tool["log_file_path"].value<std::string>())
        cfg.logFilePath = *s;
}

static void applyDatagramToml(ToolConfig &cfg, const toml::table &root)
{
    const auto *dgram = root["datagram"].as_table();
    if (!dgram)
        return; // 기본값 유지

    if (auto v = (*dgram)["max_datagram_size"].value<std::int64_t>())
        cfg.maxDatagramSize = checkedSizeFromI64(*v, "max_datagram_size");
}

} // namespace

namespace h3wire::core
{

ToolConfig ConfigLoader::load(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }
    return loadFile(*configOpt);
}

ToolConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    ToolConfig cfg{};
    applyToolToml(cfg, root);
    applyDatagramToml(cfg, root);

    validateToolConfig(cfg);

    SLOG_DEBUG("ConfigLoader", "Loaded", "path={} max_datagram_size={} log_level={}", path,
               cfg.maxDatagramSize, toString(cfg.logLevel));
    return cfg;
}

} // namespace h3wire::core
