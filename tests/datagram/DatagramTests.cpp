#include <h3wire/bytes/BufferWriter.hpp>
#include <h3wire/datagram/Datagram.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <span>
#include <vector>

namespace
{
int g_fail = 0;

#define CHECK(expr)                                                                                \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
        {                                                                                          \
            ++g_fail;                                                                              \
            std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " :: " #expr << "\n";     \
        }                                                                                          \
    } while (0)

using h3wire::bytes::VarInt;
using h3wire::datagram::Datagram;
using h3wire::datagram::DatagramReadResult;
using h3wire::ids::QStreamId;

static QStreamId qid(std::uint64_t v)
{
    QStreamId q;
    if (!QStreamId::tryFromU64(v, q))
    {
        ++g_fail;
        std::cerr << "[FAIL] invalid test qstream id " << v << "\n";
    }
    return q;
}

static bool sameBytes(std::span<const std::byte> a, std::span<const std::byte> b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

static std::vector<std::byte> encode(const Datagram &d)
{
    std::vector<std::byte> out(d.writeSize());
    if (!d.write(out))
    {
        ++g_fail;
        std::cerr << "[FAIL] encode() write failed\n";
    }
    return out;
}

// 1-byte varint id + payload AA BB -> [id, AA, BB]
static void test_example_layout()
{
    const std::array<std::byte, 2> payload = {std::byte{0xAA}, std::byte{0xBB}};
    const Datagram d{qid(0), payload};

    CHECK(d.writeSize() == 3);

    const auto wire = encode(d);
    CHECK(wire.size() == 3);
    CHECK(wire[0] == std::byte{0x00});
    CHECK(wire[1] == std::byte{0xAA});
    CHECK(wire[2] == std::byte{0xBB});
}

static void test_roundtrip_across_varint_lengths()
{
    const std::uint64_t ids[] = {0, 1, 63, 64, 16'383, 16'384, 1'073'741'823, 1'073'741'824,
                                 QStreamId::kMaxValue};
    const std::array<std::byte, 3> payload = {std::byte{0x01}, std::byte{0x02}, std::byte{0x03}};

    for (const std::uint64_t raw : ids)
    {
        for (std::size_t plen = 0; plen <= payload.size(); ++plen)
        {
            const auto p = std::span<const std::byte>(payload).first(plen);
            const Datagram d{qid(raw), p};

            const auto wire = encode(d);
            CHECK(wire.size() == d.writeSize());
            CHECK(wire.size() == VarInt::fromU64Unchecked(raw).size() + plen);

            Datagram back;
            CHECK(Datagram::read(wire, back) == DatagramReadResult::Ok);
            CHECK(back.qstreamId() == d.qstreamId());
            CHECK(sameBytes(back.payload(), p));
        }
    }
}

// payload view는 입력 버퍼를 그대로 가리킨다.
static void test_read_is_zero_copy()
{
    const std::array<std::byte, 4> in = {std::byte{0x40}, std::byte{0x41}, std::byte{0x10},
                                         std::byte{0x20}};
    Datagram d;
    CHECK(Datagram::read(in, d) == DatagramReadResult::Ok);
    CHECK(d.qstreamId().value() == 0x41);
    CHECK(d.payload().size() == in.size() - 2);
    CHECK(d.payload().data() == in.data() + 2);
}

static void test_empty_input_is_too_short()
{
    Datagram d;
    CHECK(Datagram::read(std::span<const std::byte>{}, d) == DatagramReadResult::TooShort);
}

// 다중 바이트 id 인코딩의 모든 strict prefix -> TooShort, out 무변경
static void test_truncated_id_is_too_short()
{
    const std::array<std::byte, 1> payload = {std::byte{0x99}};
    const std::uint64_t ids[] = {64, 16'384, 1'073'741'824};

    for (const std::uint64_t raw : ids)
    {
        const auto wire = encode(Datagram{qid(raw), payload});
        const std::size_t idLen = VarInt::fromU64Unchecked(raw).size();

        for (std::size_t len = 0; len < idLen; ++len)
        {
            const std::array<std::byte, 1> sentinelPayload = {std::byte{0x55}};
            Datagram out{qid(7), sentinelPayload};

            const auto prefix = std::span<const std::byte>(wire).first(len);
            CHECK(Datagram::read(prefix, out) == DatagramReadResult::TooShort);
            CHECK(out.qstreamId().value() == 7);
            CHECK(out.payload().data() == sentinelPayload.data());
        }
    }
}

// id만 있고 payload가 없으면 에러가 아니라 빈 payload
static void test_id_only_is_empty_payload()
{
    const std::array<std::byte, 2> in = {std::byte{0x7b}, std::byte{0xbd}};
    Datagram d;
    CHECK(Datagram::read(in, d) == DatagramReadResult::Ok);
    CHECK(d.qstreamId().value() == 15'293);
    CHECK(d.payload().empty());

    const std::array<std::byte, 1> one = {std::byte{0x05}};
    CHECK(Datagram::read(one, d) == DatagramReadResult::Ok);
    CHECK(d.qstreamId().value() == 5);
    CHECK(d.payload().empty());
}

// varint > 2^60-1 -> InvalidQStreamId (뒤에 무엇이 오든)
static void test_invalid_qstream_id()
{
    std::array<std::byte, 12> in{};
    h3wire::bytes::BufferWriter w(in);
    CHECK(w.putVarint(VarInt::fromU64Unchecked(QStreamId::kMaxValue + 1)));
    CHECK(w.putU8(0xAA));

    const std::array<std::byte, 1> sentinelPayload = {std::byte{0x55}};
    Datagram out{qid(9), sentinelPayload};

    CHECK(Datagram::read(std::span<const std::byte>(in).first(8), out) ==
          DatagramReadResult::InvalidQStreamId);
    CHECK(Datagram::read(std::span<const std::byte>(in).first(9), out) ==
          DatagramReadResult::InvalidQStreamId);
    CHECK(Datagram::read(in, out) == DatagramReadResult::InvalidQStreamId);
    CHECK(out.qstreamId().value() == 9);

    // 62-bit 최댓값(0xFF..FF)도 거부
    std::array<std::byte, 8> allOnes{};
    allOnes.fill(std::byte{0xFF});
    CHECK(Datagram::read(allOnes, out) == DatagramReadResult::InvalidQStreamId);
}

// non-minimal id 인코딩은 decode 허용, 다시 쓰면 최소 길이
static void test_non_minimal_id_decodes()
{
    const std::array<std::byte, 3> in = {std::byte{0x40}, std::byte{0x02}, std::byte{0xCC}};
    Datagram d;
    CHECK(Datagram::read(in, d) == DatagramReadResult::Ok);
    CHECK(d.qstreamId().value() == 2);
    CHECK(d.payload().size() == 1);
    CHECK(d.writeSize() == 2);
}

// 한 바이트 부족 -> false, 버퍼 무변경
static void test_insufficient_capacity_leaves_buffer_untouched()
{
    const std::array<std::byte, 4> payload = {std::byte{1}, std::byte{2}, std::byte{3},
                                              std::byte{4}};
    const std::uint64_t ids[] = {0, 64, 16'384, 1'073'741'824};

    for (const std::uint64_t raw : ids)
    {
        const Datagram d{qid(raw), payload};
        std::vector<std::byte> buf(d.writeSize() - 1, std::byte{0xEE});
        const auto before = buf;

        CHECK(!d.write(buf));
        CHECK(buf == before);
    }

    // 빈 목적지
    const Datagram d{qid(0), std::span<const std::byte>{}};
    CHECK(d.writeSize() == 1);
    CHECK(!d.write(std::span<std::byte>{}));
}

// 큰 버퍼: 정확히 writeSize() 바이트만 쓴다.
static void test_write_touches_exactly_write_size()
{
    const std::array<std::byte, 2> payload = {std::byte{0xAA}, std::byte{0xBB}};
    const Datagram d{qid(300), payload};

    std::vector<std::byte> buf(d.writeSize() + 5, std::byte{0xEE});
    CHECK(d.write(buf));

    CHECK(buf[0] == std::byte{0x41});
    CHECK(buf[1] == std::byte{0x2C});
    CHECK(buf[2] == std::byte{0xAA});
    CHECK(buf[3] == std::byte{0xBB});
    for (std::size_t i = d.writeSize(); i < buf.size(); ++i)
    {
        CHECK(buf[i] == std::byte{0xEE});
    }
}

static void test_header_and_max_payload_size()
{
    CHECK(Datagram::headerSize(qid(0)) == 1);
    CHECK(Datagram::headerSize(qid(64)) == 2);
    CHECK(Datagram::headerSize(qid(QStreamId::kMaxValue)) == 8);

    CHECK(Datagram::maxPayloadSize(1200, qid(0)) == 1199);
    CHECK(Datagram::maxPayloadSize(1200, qid(64)) == 1198);
    CHECK(Datagram::maxPayloadSize(2, qid(64)) == 0);
    CHECK(Datagram::maxPayloadSize(0, qid(0)) == 0);

    // maxPayloadSize 만큼 채운 datagram은 capacity에 정확히 맞는다.
    const std::vector<std::byte> payload(Datagram::maxPayloadSize(1200, qid(16'384)));
    const Datagram d{qid(16'384), payload};
    CHECK(d.writeSize() == 1200);
}

static void test_result_strings()
{
    CHECK(std::strcmp(toString(DatagramReadResult::Ok), "ok") == 0);
    CHECK(std::strcmp(toString(DatagramReadResult::TooShort), "too_short") == 0);
    CHECK(std::strcmp(toString(DatagramReadResult::InvalidQStreamId), "invalid_qstream_id") == 0);
}
} // namespace

int main()
{
    test_example_layout();
    test_roundtrip_across_varint_lengths();
    test_read_is_zero_copy();
    test_empty_input_is_too_short();
    test_truncated_id_is_too_short();
    test_id_only_is_empty_payload();
    test_invalid_qstream_id();
    test_non_minimal_id_decodes();
    test_insufficient_capacity_leaves_buffer_untouched();
    test_write_touches_exactly_write_size();
    test_header_and_max_payload_size();
    test_result_strings();

    if (g_fail == 0)
    {
        std::cout << "[OK] h3wire.datagram\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
