#pragma once
#include <cstddef>

namespace h3wire::core::defaults
{

// ===== QUIC datagram sizing =====
// QUIC 최소 보장 UDP payload(1200)를 datagram 상한 기본값으로 쓴다.
inline constexpr std::size_t kMaxDatagramSize = 1200;

// max_datagram_frame_size 는 varint지만 UDP payload 상한을 넘을 수 없다.
inline constexpr std::size_t kMaxDatagramSizeLimit = 65535;

} // namespace h3wire::core::defaults
