#include "DgramToolApplication.hpp"
#include "Hex.hpp"

#include <h3wire/core/Logger.hpp>
#include <h3wire/datagram/Datagram.hpp>
#include <h3wire/ids/StreamId.hpp>

#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <system_error>
#include <string>
#include <utility>
#include <vector>

namespace h3dgram
{

using h3wire::datagram::Datagram;
using h3wire::datagram::DatagramReadResult;
using h3wire::ids::QStreamId;

namespace
{
std::vector<std::byte> parseHexArg(std::string_view text, const char *what)
{
    std::vector<std::byte> bytes;
    if (!tryParseHex(text, bytes))
    {
        throw std::invalid_argument(std::string(what) + " is not valid hex: " + std::string(text));
    }
    return bytes;
}

std::uint64_t parseU64Arg(std::string_view text, const char *what)
{
    const auto fail = [&]() {
        return std::invalid_argument(std::string(what) + " is not an unsigned integer: " +
                                     std::string(text));
    };
    if (text.empty())
    {
        throw fail();
    }

    std::uint64_t v = 0;
    const auto *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, v);
    if (ec != std::errc{} || ptr != last)
    {
        throw fail();
    }
    return v;
}
} // namespace

DgramToolApplication::DgramToolApplication(h3wire::ToolConfig cfg) : cfg_(std::move(cfg)) {}

int DgramToolApplication::run(std::span<const std::string_view> args, std::ostream &out)
{
    if (args.empty())
    {
        throw std::invalid_argument("missing command (decode | encode)");
    }

    const std::string_view cmd = args[0];
    if (cmd == "decode" && args.size() == 2)
    {
        return decode(args[1], out);
    }
    if (cmd == "encode" && args.size() == 3)
    {
        return encode(args[1], args[2], out);
    }
    throw std::invalid_argument("invalid command line for '" + std::string(cmd) + "'");
}

int DgramToolApplication::decode(std::string_view hex, std::ostream &out)
{
    const auto raw = parseHexArg(hex, "datagram");

    if (raw.size() > cfg_.maxDatagramSize)
    {
        SLOG_WARN("h3dgram", "Oversize", "len={} max_datagram_size={}", raw.size(),
                  cfg_.maxDatagramSize);
    }

    Datagram dgram;
    const DatagramReadResult r = Datagram::read(raw, dgram);
    if (r != DatagramReadResult::Ok)
    {
        SLOG_ERROR("h3dgram", "DecodeFailed", "reason={} len={}", h3wire::datagram::toString(r),
                   raw.size());
        return 1;
    }

    const QStreamId qid = dgram.qstreamId();
    out << std::format("qstream_id={} session_id={} header_len={} payload_len={} payload={}\n",
                       qid.value(), qid.intoSessionId().value(), Datagram::headerSize(qid),
                       dgram.payload().size(), toHex(dgram.payload()));

    SLOG_DEBUG("h3dgram", "Decoded", "qstream_id={} payload_len={}", qid.value(),
               dgram.payload().size());
    return 0;
}

int DgramToolApplication::encode(std::string_view qstreamIdText, std::string_view payloadHex,
                                 std::ostream &out)
{
    const std::uint64_t rawId = parseU64Arg(qstreamIdText, "qstream-id");
    const auto payload = parseHexArg(payloadHex, "payload");

    QStreamId qid;
    if (!QStreamId::tryFromU64(rawId, qid))
    {
        SLOG_ERROR("h3dgram", "InvalidQStreamId", "value={} max={}", rawId, QStreamId::kMaxValue);
        return 1;
    }

    const Datagram dgram{qid, payload};
    const std::size_t size = dgram.writeSize();
    if (size > cfg_.maxDatagramSize)
    {
        SLOG_ERROR("h3dgram", "TooLarge", "size={} max_datagram_size={} max_payload={}", size,
                   cfg_.maxDatagramSize, Datagram::maxPayloadSize(cfg_.maxDatagramSize, qid));
        return 1;
    }

    std::vector<std::byte> wire(size);
    if (!dgram.write(wire))
    {
        SLOG_ERROR("h3dgram", "WriteFailed", "size={}", size);
        return 1;
    }

    out << toHex(wire) << "\n";
    SLOG_DEBUG("h3dgram", "Encoded", "qstream_id={} size={}", qid.value(), size);
    return 0;
}

} // namespace h3dgram
