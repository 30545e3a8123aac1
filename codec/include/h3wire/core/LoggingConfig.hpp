#pragma once

#include <h3wire/ToolConfig.hpp>

namespace h3wire::core
{

/// ToolConfig의 logLevel/logFilePath를 프로세스 전역 Logger에 반영합니다.
/// - 파일을 열 수 없으면 std::runtime_error.
void applyLoggingConfig(const h3wire::ToolConfig &cfg);

} // namespace h3wire::core
