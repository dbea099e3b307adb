#pragma once

#include "packets/types.hpp"

#include <cstdint>
#include <vector>

namespace pitwall::packets {

/**
 * Decode the common packet header at offset 0.
 *
 * The header length depends on the declared packetFormat (23 bytes for
 * 2019, 24 bytes for 2020).
 *
 * @throws utils::TruncatedBufferError if the buffer is shorter than the header
 * @throws utils::MalformedHeaderError on unknown packetFormat or packetId
 */
Decoded<PacketHeader> decodeHeader(const uint8_t* data, size_t size);

inline Decoded<PacketHeader> decodeHeader(const std::vector<uint8_t>& data) {
    return decodeHeader(data.data(), data.size());
}

// Header length for a packet format, 0 if the format is not known
size_t headerSizeForFormat(uint16_t packetFormat);

} // namespace pitwall::packets
