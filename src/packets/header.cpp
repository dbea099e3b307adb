#include "packets/header.hpp"
#include "packets/fields.hpp"

namespace pitwall::packets {

size_t headerSizeForFormat(uint16_t packetFormat) {
    switch (packetFormat) {
        case kFormat2019: return kHeaderSize2019;
        case kFormat2020: return kHeaderSize2020;
        default:          return 0;
    }
}

Decoded<PacketHeader> decodeHeader(const uint8_t* data, size_t size) {
    if (size < kMinHeaderSize) {
        throw utils::TruncatedBufferError(0, kMinHeaderSize, size);
    }

    utils::BufferReader reader(data, size);

    // packetFormat decides the rest of the layout
    uint16_t packetFormat = utils::BufferReader(data, size).readU16();
    size_t headerSize = headerSizeForFormat(packetFormat);
    if (headerSize == 0) {
        throw utils::MalformedHeaderError("unknown packet format " + std::to_string(packetFormat));
    }
    if (size < headerSize) {
        throw utils::TruncatedBufferError(0, headerSize, size);
    }

    PacketHeader header;
    if (packetFormat >= kFormat2020) {
        header.secondaryPlayerCarIndex = 0;
    }

    FieldReader fields(reader);
    PacketHeader::fields(header, fields);

    if (header.packetId >= kPacketTypeCount) {
        throw utils::MalformedHeaderError("packet id " + std::to_string(header.packetId) +
                                          " out of range");
    }

    return {header, reader.position()};
}

} // namespace pitwall::packets
