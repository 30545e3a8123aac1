#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace h3dgram
{

/// 소문자 hex ("00aabb")
inline std::string toHex(std::span<const std::byte> bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const std::byte b : bytes)
    {
        const auto v = std::to_integer<std::uint8_t>(b);
        out.push_back(kDigits[v >> 4]);
        out.push_back(kDigits[v & 0x0F]);
    }
    return out;
}

namespace detail
{
inline int hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace detail

/// hex 문자열을 바이트로 바꾼다. 대소문자 무시, 선택적 "0x" prefix 허용.
/// - 홀수 길이 / hex 아닌 문자가 있으면 false, out은 그대로.
inline bool tryParseHex(std::string_view text, std::vector<std::byte> &out)
{
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        text.remove_prefix(2);
    }
    if (text.size() % 2 != 0)
    {
        return false;
    }

    std::vector<std::byte> bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2)
    {
        const int hi = detail::hexNibble(text[i]);
        const int lo = detail::hexNibble(text[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return false;
        }
        bytes.push_back(static_cast<std::byte>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

} // namespace h3dgram
