#include <h3wire/bytes/VarInt.hpp>

namespace h3wire::bytes
{

namespace
{
// 길이 prefix(상위 2비트) 태그
constexpr std::uint8_t kTag2Bytes = 0x40;
constexpr std::uint8_t kTag4Bytes = 0x80;
constexpr std::uint8_t kTag8Bytes = 0xC0;
constexpr std::uint8_t kValueMask = 0x3F;
} // namespace

std::size_t VarInt::encodeUnchecked(std::byte *out) const noexcept
{
    const std::size_t n = size();
    std::uint64_t v = value_;

    // 하위 바이트부터 채운 뒤 첫 바이트에 길이 태그를 OR 한다.
    for (std::size_t i = n; i > 0; --i)
    {
        out[i - 1] = static_cast<std::byte>(v & 0xFF);
        v >>= 8;
    }

    switch (n)
    {
    case 1:
        break;
    case 2:
        out[0] |= static_cast<std::byte>(kTag2Bytes);
        break;
    case 4:
        out[0] |= static_cast<std::byte>(kTag4Bytes);
        break;
    default:
        out[0] |= static_cast<std::byte>(kTag8Bytes);
        break;
    }
    return n;
}

std::size_t VarInt::decode(const std::byte *in, std::size_t len, VarInt &out) noexcept
{
    if (len == 0 || in == nullptr)
    {
        return 0;
    }

    const std::size_t n = encodedSizeFromFirstByte(in[0]);
    if (len < n)
    {
        return 0;
    }

    std::uint64_t v = std::to_integer<std::uint8_t>(in[0]) & kValueMask;
    for (std::size_t i = 1; i < n; ++i)
    {
        v = (v << 8) | std::to_integer<std::uint8_t>(in[i]);
    }

    // 62-bit 이하가 구조적으로 보장된다(첫 바이트 6-bit + 7 bytes).
    out = VarInt{v};
    return n;
}

} // namespace h3wire::bytes
