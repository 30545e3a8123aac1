#pragma once

#include <compare>
#include <cstdint>

#include <h3wire/bytes/VarInt.hpp>

namespace h3wire::ids
{

/// QUIC stream id (RFC 9000 §2.1).
/// - bit0: initiator (0 = client, 1 = server)
/// - bit1: direction (0 = bidirectional, 1 = unidirectional)
class StreamId
{
  public:
    static constexpr std::uint64_t kInitiatorBit = 0x1;
    static constexpr std::uint64_t kDirectionBit = 0x2;

    constexpr StreamId() noexcept = default;
    explicit constexpr StreamId(bytes::VarInt v) noexcept : value_(v) {}

    [[nodiscard]] constexpr bytes::VarInt intoVarInt() const noexcept { return value_; }
    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return value_.value(); }

    [[nodiscard]] constexpr bool isClientInitiated() const noexcept
    {
        return (value() & kInitiatorBit) == 0;
    }
    [[nodiscard]] constexpr bool isServerInitiated() const noexcept { return !isClientInitiated(); }

    [[nodiscard]] constexpr bool isBidirectional() const noexcept
    {
        return (value() & kDirectionBit) == 0;
    }
    [[nodiscard]] constexpr bool isUnidirectional() const noexcept { return !isBidirectional(); }

    /// 같은 종류(initiator, direction) 스트림 안에서의 순번
    [[nodiscard]] constexpr std::uint64_t index() const noexcept { return value() >> 2; }

    friend constexpr bool operator==(const StreamId &, const StreamId &) noexcept = default;
    friend constexpr auto operator<=>(const StreamId &, const StreamId &) noexcept = default;

  private:
    bytes::VarInt value_{};
};

class QStreamId;

/// WebTransport/HTTP3 세션 id.
/// - 세션을 연 request stream id 이며, 반드시 client-initiated bidirectional 이다.
class SessionId
{
  public:
    constexpr SessionId() noexcept = default;

    /// client-initiated bidirectional 이 아니면 false, out은 그대로.
    static bool tryFromSessionStream(StreamId stream, SessionId &out) noexcept;

    [[nodiscard]] constexpr StreamId sessionStream() const noexcept { return stream_; }
    [[nodiscard]] constexpr bytes::VarInt intoVarInt() const noexcept { return stream_.intoVarInt(); }
    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return stream_.value(); }

    friend constexpr bool operator==(const SessionId &, const SessionId &) noexcept = default;
    friend constexpr auto operator<=>(const SessionId &, const SessionId &) noexcept = default;

  private:
    friend class QStreamId;

    explicit constexpr SessionId(StreamId s) noexcept : stream_(s) {}

    StreamId stream_{};
};

/// HTTP Datagram의 Quarter Stream ID (RFC 9297 §2.1).
///
/// - 값 = 세션 request stream id / 4
/// - 최댓값은 (2^62 - 1) / 4 = 2^60 - 1. 이보다 큰 값은 대응되는 stream id가 없으므로 거부한다.
class QStreamId
{
  public:
    static constexpr std::uint64_t kMaxValue = (std::uint64_t{1} << 60) - 1;
    static constexpr std::uint64_t kStreamsPerQuarter = 4;

    constexpr QStreamId() noexcept = default;

    /// datagram 디코드 시 사용하는 유효성 규칙: varint <= kMaxValue 이면 통과.
    static bool tryFromVarInt(bytes::VarInt v, QStreamId &out) noexcept;

    /// u64 편의 버전(CLI 입력 등). 범위 밖이면 false.
    static bool tryFromU64(std::uint64_t v, QStreamId &out) noexcept;

    [[nodiscard]] static QStreamId fromSessionId(SessionId session) noexcept;

    /// value * 4 는 항상 client-initiated bidirectional stream id 이다.
    [[nodiscard]] SessionId intoSessionId() const noexcept;

    [[nodiscard]] constexpr bytes::VarInt intoVarInt() const noexcept { return value_; }
    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return value_.value(); }

    friend constexpr bool operator==(const QStreamId &, const QStreamId &) noexcept = default;
    friend constexpr auto operator<=>(const QStreamId &, const QStreamId &) noexcept = default;

  private:
    explicit constexpr QStreamId(bytes::VarInt v) noexcept : value_(v) {}

    bytes::VarInt value_{};
};

} // namespace h3wire::ids
