#pragma once

#include "packets/f1_2019.hpp"
#include "packets/f1_2020.hpp"
#include "packets/types.hpp"

#include <cstdint>
#include <map>
#include <variant>
#include <vector>

namespace pitwall::packets {

/**
 * Every body record the dispatcher can produce, one alternative per
 * registered (format, packet type) pair.
 */
using PacketBody = std::variant<
    f1_2019::MotionBody,
    f1_2019::SessionBody,
    f1_2019::LapDataBody,
    f1_2019::EventBody,
    f1_2019::ParticipantsBody,
    f1_2019::CarSetupsBody,
    f1_2019::CarTelemetryBody,
    f1_2019::CarStatusBody,
    f1_2020::MotionBody,
    f1_2020::SessionBody,
    f1_2020::LapDataBody,
    f1_2020::EventBody,
    f1_2020::ParticipantsBody,
    f1_2020::CarSetupsBody,
    f1_2020::CarTelemetryBody,
    f1_2020::CarStatusBody,
    f1_2020::FinalClassificationBody,
    f1_2020::LobbyInfoBody>;

/**
 * A fully decoded datagram. bytesConsumed covers header and body;
 * trailingBytes counts whatever the datagram carried beyond that.
 */
struct DecodedPacket {
    PacketHeader header;
    PacketBody body;
    size_t bytesConsumed{};
    size_t trailingBytes{};
};

/**
 * Decoder registry
 *
 * Maps (packetFormat, packetVersion, packetId) to the body decoder for that
 * layout. Built once on first use and never modified afterwards, so it can
 * be shared between threads without locking.
 */
class DecoderRegistry {
public:
    using Key = uint32_t;
    using DecodeFn = Decoded<PacketBody> (*)(const uint8_t* data, size_t size, size_t offset);

    struct Entry {
        uint16_t packetFormat;
        uint8_t packetVersion;
        PacketType packetType;
        size_t bodySize;
        DecodeFn decode;
    };

    static const DecoderRegistry& instance();

    static Key makeKey(uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId) {
        return (static_cast<uint32_t>(packetFormat) << 16) |
               (static_cast<uint32_t>(packetVersion) << 8) | packetId;
    }

    // nullptr if the combination is not supported
    const Entry* find(uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId) const;

    const std::map<Key, Entry>& entries() const { return m_entries; }

private:
    DecoderRegistry();

    template <typename Body, Decoded<Body> (*Decode)(const uint8_t*, size_t, size_t)>
    void add(uint16_t packetFormat, uint8_t packetVersion, PacketType type);

    std::map<Key, Entry> m_entries;
};

/**
 * Decode one datagram: header, registry lookup, body.
 *
 * @throws utils::TruncatedBufferError if header or body run past the buffer
 * @throws utils::MalformedHeaderError if the header is not valid
 * @throws utils::UnsupportedVariantError if no decoder is registered
 */
DecodedPacket decodePacket(const uint8_t* data, size_t size);

inline DecodedPacket decodePacket(const std::vector<uint8_t>& data) {
    return decodePacket(data.data(), data.size());
}

} // namespace pitwall::packets
