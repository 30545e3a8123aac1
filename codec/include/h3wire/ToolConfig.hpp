#pragma once

#include <cstddef>
#include <string>

#include <h3wire/core/Defaults.hpp>
#include <h3wire/core/Logger.hpp>

namespace h3wire
{

/// h3dgram 도구 설정입니다. ([tool], [datagram] 섹션)
struct ToolConfig
{
    /// 로그를 기록할 파일 경로입니다.
    /// - 빈 문자열("")이면 std::clog 로 출력합니다.
    std::string logFilePath;

    /// 기본 로그 레벨입니다.
    core::LogLevel logLevel = core::LogLevel::Info;

    /// encode 결과(헤더 + payload)가 넘으면 안 되는 QUIC datagram 최대 크기(bytes)
    std::size_t maxDatagramSize = core::defaults::kMaxDatagramSize;
};

/// 필드 값 검증. 실패 시 std::invalid_argument.
void validateToolConfig(const ToolConfig &config);

} // namespace h3wire
