#pragma once

#include <cstddef> // std::byte
#include <cstdint>
#include <cstring> // std::memcpy
#include <span>

#include <h3wire/bytes/VarInt.hpp>

namespace h3wire::bytes {

/// 호출자가 소유한 가변 바이트 슬라이스 위의 순차 커서(writer)입니다.
///
/// - 엔진의 ByteWriter와 달리 버퍼를 늘리지 않는다. 용량은 생성 시점에 고정.
/// - put* 는 남은 용량이 부족하면 false(end of buffer)를 돌려주며,
///   이때 해당 필드는 한 바이트도 쓰지 않는다(부분 기록 없음).
class BufferWriter {
  public:
    explicit BufferWriter(std::span<std::byte> buffer) noexcept : buffer_(buffer) {}

    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return off_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - off_; }

    /// 지금까지 기록한 영역 [0, offset())
    [[nodiscard]] std::span<const std::byte> written() const noexcept {
        return std::span<const std::byte>(buffer_.data(), off_);
    }

    bool putVarint(VarInt v) noexcept {
        if (!ensure_(v.size())) {
            return false;
        }
        off_ += v.encodeUnchecked(buffer_.data() + off_);
        return true;
    }

    bool putU8(std::uint8_t v) noexcept {
        if (!ensure_(1)) {
            return false;
        }
        buffer_[off_] = static_cast<std::byte>(v);
        off_ += 1;
        return true;
    }

    /// 바이트를 그대로 복사한다. 빈 입력은 항상 성공.
    bool putBytes(std::span<const std::byte> bytes) noexcept {
        if (bytes.empty()) {
            return true;
        }
        if (!ensure_(bytes.size())) {
            return false;
        }
        std::memcpy(buffer_.data() + off_, bytes.data(), bytes.size());
        off_ += bytes.size();
        return true;
    }

  private:
    std::span<std::byte> buffer_{};
    std::size_t off_{0};

    [[nodiscard]] bool ensure_(std::size_t n) const noexcept { return n <= remaining(); }
};

} // namespace h3wire::bytes
