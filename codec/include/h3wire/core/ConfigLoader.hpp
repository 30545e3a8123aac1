#pragma once

#include <h3wire/ToolConfig.hpp>

#include <string>

namespace h3wire::core
{

class ConfigLoader
{
  public:
    // argv 에서 --config <path.toml> 을 찾아 loadFile() 한다.
    // --help / -h 는 usage 출력 후 exit(0).
    static ToolConfig load(int argc, char **argv);

    // [tool] 필수, [datagram] 선택. 실패 시 std::runtime_error / std::invalid_argument.
    static ToolConfig loadFile(const std::string &path);
};

} // namespace h3wire::core
