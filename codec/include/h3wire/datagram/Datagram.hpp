#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <h3wire/ids/StreamId.hpp>

namespace h3wire::datagram
{

/// Datagram::read 결과 상태입니다.
/// - Ok:               out에 (qstream id, payload view)를 채움
/// - TooShort:         varint 1개를 완성할 바이트가 없음(빈 입력 포함)
/// - InvalidQStreamId: varint는 읽었지만 Quarter Stream ID 범위 밖
///
/// 실패 시 out은 건드리지 않는다. 이 외의 실패 경로는 없다.
enum class DatagramReadResult : std::uint8_t
{
    Ok = 0,
    TooShort = 1,
    InvalidQStreamId = 2,
};

/// 로그용 문자열("ok", "too_short", "invalid_qstream_id")
const char *toString(DatagramReadResult r) noexcept;

/**
 * @brief QUIC DATAGRAM 프레임에 실려 오는 HTTP/3 Datagram (RFC 9297) 입니다.
 *
 * [Wire Format]
 * - [varint] : Quarter Stream ID
 * - [rest]   : Payload (0바이트 이상, 변환 없이 그대로)
 *
 * ===== 수명(lifetime) 규약 (필수) =====
 * - payload()는 소유권이 없는 view 입니다.
 *   read()로 얻은 경우 입력 버퍼를, 생성자로 만든 경우 호출자가 넘긴 슬라이스를 그대로 가리킵니다.
 * - view를 쓰는 동안 원본 버퍼는 살아 있어야 하고 수정되면 안 됩니다.
 * - 더 오래 보관해야 하면 "명시적으로 복사"하세요(비용을 코드로 드러낼 것).
 *
 * 스레딩:
 * - 내부 상태가 없는 순수 값 변환입니다. 할당/로그/예외 없음.
 * - 같은 view를 여러 스레드가 동시에 읽는 것은 안전합니다.
 */
class Datagram
{
  public:
    Datagram() noexcept = default;

    /// 검증 없이 값만 묶는다(QStreamId 타입 자체가 유효성을 보장).
    Datagram(ids::QStreamId qstreamId, std::span<const std::byte> payload) noexcept
        : qstreamId_(qstreamId), payload_(payload)
    {
    }

    /// QUIC datagram 바이트에서 Datagram을 디코드한다(zero-copy).
    /// - id 직후 입력이 끝나면 빈 payload로 Ok (에러 아님).
    static DatagramReadResult read(std::span<const std::byte> quicDatagram, Datagram &out) noexcept;

    /// buffer 앞부분에 정확히 writeSize() 바이트를 기록한다.
    /// - buffer.size() < writeSize() 이면 false(end of buffer)를 돌려주고 buffer는 한 바이트도 쓰지 않는다.
    /// - 그 이후 바이트는 건드리지 않는다.
    [[nodiscard]] bool write(std::span<std::byte> buffer) const noexcept;

    /// write()가 사용할 정확한 바이트 수: 최소 varint 길이 + payload 길이.
    /// 버퍼를 잡기 전에 반드시 이 값으로 크기를 정할 것.
    [[nodiscard]] std::size_t writeSize() const noexcept;

    [[nodiscard]] ids::QStreamId qstreamId() const noexcept { return qstreamId_; }
    [[nodiscard]] std::span<const std::byte> payload() const noexcept { return payload_; }

    /// payload를 제외한 헤더(=Quarter Stream ID varint) 길이
    [[nodiscard]] static std::size_t headerSize(ids::QStreamId qstreamId) noexcept;

    /// datagramCapacity 바이트짜리 QUIC datagram에 넣을 수 있는 최대 payload 길이.
    /// 헤더조차 들어가지 않으면 0.
    [[nodiscard]] static std::size_t maxPayloadSize(std::size_t datagramCapacity,
                                                    ids::QStreamId qstreamId) noexcept;

  private:
    ids::QStreamId qstreamId_{};
    std::span<const std::byte> payload_{};
};

} // namespace h3wire::datagram
