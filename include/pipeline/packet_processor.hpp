#pragma once

#include "packets/dispatcher.hpp"
#include "sink/event_sink.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace pitwall::pipeline {

/**
 * Counters since the processor was created.
 */
struct ProcessorStats {
    uint64_t received = 0;      // datagrams handed to process()
    uint64_t emitted = 0;       // documents written to the sink
    uint64_t truncated = 0;
    uint64_t malformed = 0;
    uint64_t unsupported = 0;
    uint64_t trailing = 0;      // decoded packets that carried extra bytes
};

/**
 * Packet processor
 *
 * Turns one datagram into one JSON document: decode, build the tree, write
 * it to the sink. Decode failures are logged and counted; the datagram is
 * dropped and processing continues with the next one.
 *
 * Safe to call from several io_context threads at once.
 */
class PacketProcessor {
public:
    explicit PacketProcessor(std::shared_ptr<sink::EventSink> sink);

    // true if a document was written
    bool process(const uint8_t* data, size_t size);

    bool process(const std::vector<uint8_t>& data) {
        return process(data.data(), data.size());
    }

    ProcessorStats stats() const;

private:
    void trackSession(const packets::DecodedPacket& packet);
    void logParticipants(const packets::DecodedPacket& packet);
    void logEvent(const packets::DecodedPacket& packet);
    void logTelemetry(const packets::DecodedPacket& packet);
    void reportUnsupported(uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId);

    std::shared_ptr<sink::EventSink> m_sink;

    std::atomic<uint64_t> m_received{0};
    std::atomic<uint64_t> m_emitted{0};
    std::atomic<uint64_t> m_truncated{0};
    std::atomic<uint64_t> m_malformed{0};
    std::atomic<uint64_t> m_unsupported{0};
    std::atomic<uint64_t> m_trailing{0};

    std::mutex m_mutex;
    std::set<packets::DecoderRegistry::Key> m_unsupportedSeen;
    std::optional<uint64_t> m_sessionUID;
    bool m_trackLogged = false;
    bool m_playerLogged = false;
};

} // namespace pitwall::pipeline
