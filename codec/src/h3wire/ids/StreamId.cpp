#include <h3wire/ids/StreamId.hpp>

namespace h3wire::ids
{

bool SessionId::tryFromSessionStream(StreamId stream, SessionId &out) noexcept
{
    if (!stream.isClientInitiated() || !stream.isBidirectional())
    {
        return false;
    }
    out = SessionId{stream};
    return true;
}

bool QStreamId::tryFromVarInt(bytes::VarInt v, QStreamId &out) noexcept
{
    if (v.value() > kMaxValue)
    {
        return false;
    }
    out = QStreamId{v};
    return true;
}

bool QStreamId::tryFromU64(std::uint64_t v, QStreamId &out) noexcept
{
    bytes::VarInt varint;
    if (!bytes::VarInt::tryFromU64(v, varint))
    {
        return false;
    }
    return tryFromVarInt(varint, out);
}

QStreamId QStreamId::fromSessionId(SessionId session) noexcept
{
    // session stream id <= 2^62-1 이므로 /4 결과는 항상 kMaxValue 이하
    return QStreamId{bytes::VarInt::fromU64Unchecked(session.value() / kStreamsPerQuarter)};
}

SessionId QStreamId::intoSessionId() const noexcept
{
    // value <= 2^60-1 => value*4 <= 2^62-4, 하위 2비트 0 (client, bidi)
    return SessionId{StreamId{bytes::VarInt::fromU64Unchecked(value() * kStreamsPerQuarter)}};
}

} // namespace h3wire::ids
