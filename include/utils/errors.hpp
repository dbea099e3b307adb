#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pitwall::utils {

/**
 * Base class for every failure raised while decoding a telemetry datagram.
 *
 * Decode errors are always local to one packet: the caller discards the
 * datagram and carries on with the next one.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * A field or record needed more bytes than the buffer holds.
 */
class TruncatedBufferError : public DecodeError {
public:
    TruncatedBufferError(size_t offset, size_t width, size_t available)
        : DecodeError("Truncated buffer: need " + std::to_string(width) +
                      " bytes at offset " + std::to_string(offset) +
                      ", buffer holds " + std::to_string(available))
        , m_offset(offset)
        , m_width(width)
        , m_available(available)
    {}

    size_t offset() const { return m_offset; }
    size_t width() const { return m_width; }
    size_t available() const { return m_available; }

private:
    size_t m_offset;
    size_t m_width;
    size_t m_available;
};

/**
 * The common header is structurally invalid (unknown packet format or
 * packet id outside the protocol's closed set).
 */
class MalformedHeaderError : public DecodeError {
public:
    explicit MalformedHeaderError(const std::string& what)
        : DecodeError("Malformed header: " + what) {}
};

/**
 * The header is valid but no body decoder is registered for its
 * (format, packet version, packet id) combination.
 */
class UnsupportedVariantError : public DecodeError {
public:
    UnsupportedVariantError(uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId)
        : DecodeError("No decoder for packet id " + std::to_string(packetId) +
                      " (format " + std::to_string(packetFormat) +
                      ", packet version " + std::to_string(packetVersion) + ")")
        , m_packetFormat(packetFormat)
        , m_packetVersion(packetVersion)
        , m_packetId(packetId)
    {}

    uint16_t packetFormat() const { return m_packetFormat; }
    uint8_t packetVersion() const { return m_packetVersion; }
    uint8_t packetId() const { return m_packetId; }

private:
    uint16_t m_packetFormat;
    uint8_t m_packetVersion;
    uint8_t m_packetId;
};

} // namespace pitwall::utils
