#pragma once

#include <cstddef> // std::byte
#include <cstdint>
#include <span>

#include <h3wire/bytes/VarInt.hpp>

namespace h3wire::bytes {

/// 불변 바이트 슬라이스 위의 순차 커서(reader)입니다.
///
/// 규약:
/// - 모든 get* 는 실패 시 false 를 돌려주고 커서(offset)를 움직이지 않는다.
/// - 반환되는 view(span)는 원본 버퍼를 그대로 가리킨다(zero-copy). 수명은 호출자가 관리.
///
/// 스레딩:
/// - 인스턴스 자체는 thread-safe가 아니다(일반 값 객체로 취급).
class BufferReader {
  public:
    explicit BufferReader(std::span<const std::byte> buffer) noexcept : buffer_(buffer) {}

    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return off_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - off_; }
    [[nodiscard]] bool atEnd() const noexcept { return off_ == buffer_.size(); }

    /// varint 1개를 읽는다. 입력이 비었거나 선언된 길이보다 짧으면 false.
    bool getVarint(VarInt &out) noexcept {
        const std::size_t consumed = VarInt::decode(buffer_.data() + off_, remaining(), out);
        if (consumed == 0) {
            return false;
        }
        off_ += consumed;
        return true;
    }

    /// 복사 없이 len 바이트 view를 얻는다.
    bool getBytes(std::size_t len, std::span<const std::byte> &out) noexcept {
        if (!ensure_(len)) {
            return false;
        }
        out = buffer_.subspan(off_, len);
        off_ += len;
        return true;
    }

    bool getU8(std::uint8_t &out) noexcept {
        if (!ensure_(1)) {
            return false;
        }
        out = std::to_integer<std::uint8_t>(buffer_[off_]);
        off_ += 1;
        return true;
    }

    bool skip(std::size_t len) noexcept {
        if (!ensure_(len)) {
            return false;
        }
        off_ += len;
        return true;
    }

    /// 남은 바이트 전부를 view로 돌려주고 커서를 끝으로 옮긴다(빈 span 가능).
    [[nodiscard]] std::span<const std::byte> bufferRemaining() noexcept {
        const auto rest = buffer_.subspan(off_);
        off_ = buffer_.size();
        return rest;
    }

  private:
    std::span<const std::byte> buffer_{};
    std::size_t off_{0};

    [[nodiscard]] bool ensure_(std::size_t n) const noexcept { return n <= remaining(); }
};

} // namespace h3wire::bytes
