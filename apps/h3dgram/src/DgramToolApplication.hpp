#pragma once

#include <h3wire/ToolConfig.hpp>

#include <ostream>
#include <span>
#include <string_view>

namespace h3dgram
{

/// HTTP/3 datagram 검사/생성 도구.
///
/// - decode <hex>                 : qstream id / session id / payload 를 출력
/// - encode <qstream-id> <hex>    : datagram hex 를 출력
///
/// 반환값은 프로세스 exit code(0 성공, 1 실패).
/// 명령/인자 형식 오류는 std::invalid_argument 로 던진다(main에서 처리).
class DgramToolApplication
{
  public:
    explicit DgramToolApplication(h3wire::ToolConfig cfg);

    int run(std::span<const std::string_view> args, std::ostream &out);

  private:
    int decode(std::string_view hex, std::ostream &out);
    int encode(std::string_view qstreamIdText, std::string_view payloadHex, std::ostream &out);

    h3wire::ToolConfig cfg_;
};

} // namespace h3dgram
