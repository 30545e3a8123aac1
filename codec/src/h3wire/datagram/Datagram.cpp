#include <h3wire/datagram/Datagram.hpp>

#include <h3wire/bytes/BufferReader.hpp>
#include <h3wire/bytes/BufferWriter.hpp>

namespace h3wire::datagram
{

const char *toString(DatagramReadResult r) noexcept
{
    switch (r)
    {
    case DatagramReadResult::Ok:
        return "ok";
    case DatagramReadResult::TooShort:
        return "too_short";
    case DatagramReadResult::InvalidQStreamId:
        return "invalid_qstream_id";
    }
    return "unknown";
}

DatagramReadResult Datagram::read(std::span<const std::byte> quicDatagram, Datagram &out) noexcept
{
    bytes::BufferReader reader(quicDatagram);

    // 1. Quarter Stream ID (varint)
    bytes::VarInt varint;
    if (!reader.getVarint(varint))
    {
        return DatagramReadResult::TooShort;
    }

    // 2. 유효성 검사
    ids::QStreamId qstreamId;
    if (!ids::QStreamId::tryFromVarInt(varint, qstreamId))
    {
        return DatagramReadResult::InvalidQStreamId;
    }

    // 3. 나머지 전부가 payload (빈 view 가능)
    out = Datagram{qstreamId, reader.bufferRemaining()};
    return DatagramReadResult::Ok;
}

bool Datagram::write(std::span<std::byte> buffer) const noexcept
{
    // 용량 확인을 먼저 끝내야 "실패 시 무변경"이 성립한다.
    if (buffer.size() < writeSize())
    {
        return false;
    }

    bytes::BufferWriter writer(buffer);

    // 용량이 확인된 뒤이므로 두 put 모두 실패할 수 없다.
    return writer.putVarint(qstreamId_.intoVarInt()) && writer.putBytes(payload_);
}

std::size_t Datagram::writeSize() const noexcept
{
    return headerSize(qstreamId_) + payload_.size();
}

std::size_t Datagram::headerSize(ids::QStreamId qstreamId) noexcept
{
    return qstreamId.intoVarInt().size();
}

std::size_t Datagram::maxPayloadSize(std::size_t datagramCapacity, ids::QStreamId qstreamId) noexcept
{
    const std::size_t header = headerSize(qstreamId);
    if (datagramCapacity <= header)
    {
        return 0;
    }
    return datagramCapacity - header;
}

} // namespace h3wire::datagram
