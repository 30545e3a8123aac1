#pragma once

#include <compare>
#include <cstddef> // std::byte, std::to_integer
#include <cstdint>

namespace h3wire::bytes
{

/// QUIC variable-length integer (RFC 9000 §16).
///
/// ===== Wire Format =====
/// - 첫 바이트 상위 2비트가 전체 길이를 결정한다.
///   00 -> 1 byte (6-bit), 01 -> 2 bytes (14-bit), 10 -> 4 bytes (30-bit), 11 -> 8 bytes (62-bit)
/// - 나머지 비트는 network byte order(big-endian) 값이다.
///
/// ===== 규약 =====
/// - 값 범위는 [0, 2^62 - 1]. 범위 밖 값으로는 VarInt를 만들 수 없다(타입 불변식).
/// - size()는 항상 "최소 인코딩 길이"를 돌려준다(encode도 항상 최소 길이로 쓴다).
/// - decode는 non-minimal 인코딩도 허용한다(QUIC 규약). 선언된 길이만큼 정확히 소비.
class VarInt
{
  public:
    static constexpr std::uint64_t kMaxValue = (std::uint64_t{1} << 62) - 1;

    static constexpr std::uint64_t kMax1Byte = 63;
    static constexpr std::uint64_t kMax2Bytes = 16'383;
    static constexpr std::uint64_t kMax4Bytes = 1'073'741'823;

    /// 인코딩 최대 길이(bytes)
    static constexpr std::size_t kMaxSize = 8;

    constexpr VarInt() noexcept = default;

    /// u32는 항상 62-bit 범위 안이므로 실패하지 않는다.
    [[nodiscard]] static constexpr VarInt fromU32(std::uint32_t v) noexcept
    {
        return VarInt{static_cast<std::uint64_t>(v)};
    }

    /// 범위 밖(> kMaxValue)이면 false, out은 건드리지 않는다.
    [[nodiscard]] static constexpr bool tryFromU64(std::uint64_t v, VarInt &out) noexcept
    {
        if (v > kMaxValue)
        {
            return false;
        }
        out = VarInt{v};
        return true;
    }

    /// 상수 정의용. 호출자가 v <= kMaxValue 를 보장해야 한다.
    [[nodiscard]] static constexpr VarInt fromU64Unchecked(std::uint64_t v) noexcept
    {
        return VarInt{v};
    }

    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return value_; }

    /// 최소 인코딩 길이(1, 2, 4, 8)
    [[nodiscard]] constexpr std::size_t size() const noexcept
    {
        if (value_ <= kMax1Byte)
            return 1;
        if (value_ <= kMax2Bytes)
            return 2;
        if (value_ <= kMax4Bytes)
            return 4;
        return 8;
    }

    /// 첫 바이트만 보고 인코딩 전체 길이를 계산한다.
    [[nodiscard]] static constexpr std::size_t encodedSizeFromFirstByte(std::byte first) noexcept
    {
        return std::size_t{1} << (std::to_integer<std::uint8_t>(first) >> 6);
    }

    /// out[0..size()) 에 최소 길이로 기록하고 기록한 바이트 수를 돌려준다.
    /// - 용량 검사는 호출자(BufferWriter) 책임이다.
    std::size_t encodeUnchecked(std::byte *out) const noexcept;

    /// in[0..len) 에서 한 개를 디코드한다.
    /// - 입력이 비었거나 선언된 길이보다 짧으면 0을 돌려주고 out은 그대로 둔다.
    /// - 성공 시 소비한 바이트 수(1, 2, 4, 8)를 돌려준다.
    static std::size_t decode(const std::byte *in, std::size_t len, VarInt &out) noexcept;

    friend constexpr bool operator==(const VarInt &, const VarInt &) noexcept = default;
    friend constexpr auto operator<=>(const VarInt &, const VarInt &) noexcept = default;

  private:
    explicit constexpr VarInt(std::uint64_t v) noexcept : value_(v) {}

    std::uint64_t value_{0};
};

} // namespace h3wire::bytes
