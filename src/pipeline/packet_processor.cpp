#include "pipeline/packet_processor.hpp"
#include "packets/appendix.hpp"
#include "serialize/tree.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace pitwall::pipeline {

namespace {

std::optional<int> sessionTrackId(const packets::PacketBody& body) {
    if (const auto* session = std::get_if<packets::f1_2019::SessionBody>(&body)) {
        return session->trackId;
    }
    if (const auto* session = std::get_if<packets::f1_2020::SessionBody>(&body)) {
        return session->trackId;
    }
    return std::nullopt;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

template <typename Body>
void logPlayerTelemetry(const Body& body, uint8_t playerCarIndex) {
    // Sent every frame; only build the line when trace is enabled
    if (!utils::Logger::get()->should_log(spdlog::level::trace) ||
        playerCarIndex >= body.carTelemetryData.size()) {
        return;
    }
    const auto& car = body.carTelemetryData[playerCarIndex];
    LOG_TRACE("Player car gear {}, surfaces {}/{}/{}/{}, buttons [{}]", car.gear,
              packets::surfaceTypeName(car.surfaceType[0]), packets::surfaceTypeName(car.surfaceType[1]),
              packets::surfaceTypeName(car.surfaceType[2]), packets::surfaceTypeName(car.surfaceType[3]),
              joinNames(packets::pressedButtons(body.buttonStatus)));
}

} // namespace

PacketProcessor::PacketProcessor(std::shared_ptr<sink::EventSink> sink)
    : m_sink(std::move(sink))
{
}

bool PacketProcessor::process(const uint8_t* data, size_t size) {
    m_received++;

    packets::DecodedPacket packet;
    try {
        packet = packets::decodePacket(data, size);
    }
    catch (const utils::TruncatedBufferError& e) {
        m_truncated++;
        LOG_DEBUG("Dropping datagram ({} bytes): {}", size, e.what());
        return false;
    }
    catch (const utils::MalformedHeaderError& e) {
        m_malformed++;
        LOG_DEBUG("Dropping datagram ({} bytes): {}", size, e.what());
        return false;
    }
    catch (const utils::UnsupportedVariantError& e) {
        m_unsupported++;
        reportUnsupported(e.packetFormat(), e.packetVersion(), e.packetId());
        return false;
    }

    if (packet.trailingBytes > 0) {
        m_trailing++;
        LOG_TRACE("{} packet carried {} trailing bytes",
                  packets::packetTypeName(packet.header.packetId), packet.trailingBytes);
    }

    trackSession(packet);
    logParticipants(packet);
    logEvent(packet);
    logTelemetry(packet);

    m_sink->write(serialize::toTree(packet));
    m_emitted++;
    return true;
}

ProcessorStats PacketProcessor::stats() const {
    ProcessorStats stats;
    stats.received = m_received.load();
    stats.emitted = m_emitted.load();
    stats.truncated = m_truncated.load();
    stats.malformed = m_malformed.load();
    stats.unsupported = m_unsupported.load();
    stats.trailing = m_trailing.load();
    return stats;
}

void PacketProcessor::trackSession(const packets::DecodedPacket& packet) {
    const auto& header = packet.header;
    auto trackId = sessionTrackId(packet.body);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_sessionUID != header.sessionUID) {
        m_sessionUID = header.sessionUID;
        m_trackLogged = false;
        m_playerLogged = false;
        LOG_INFO("New session {:016X} (format {}, game {}.{:02})",
                 header.sessionUID, header.packetFormat,
                 header.gameMajorVersion, header.gameMinorVersion);
    }

    if (trackId && !m_trackLogged) {
        m_trackLogged = true;
        LOG_INFO("Session {:016X} is at {}", header.sessionUID, packets::trackName(*trackId));
    }
}

void PacketProcessor::logParticipants(const packets::DecodedPacket& packet) {
    const packets::ParticipantData* player = nullptr;
    const auto index = packet.header.playerCarIndex;
    if (const auto* body = std::get_if<packets::f1_2019::ParticipantsBody>(&packet.body)) {
        if (index < body->participants.size()) player = &body->participants[index];
    }
    else if (const auto* body = std::get_if<packets::f1_2020::ParticipantsBody>(&packet.body)) {
        if (index < body->participants.size()) player = &body->participants[index];
    }
    if (!player) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_playerLogged) {
        return;
    }
    m_playerLogged = true;

    LOG_INFO("Player car {}: {} #{} ({}, {})", index, packets::driverName(player->driverId),
             player->raceNumber, packets::teamName(player->teamId),
             packets::nationalityName(player->nationality));
}

void PacketProcessor::logTelemetry(const packets::DecodedPacket& packet) {
    if (const auto* body = std::get_if<packets::f1_2019::CarTelemetryBody>(&packet.body)) {
        logPlayerTelemetry(*body, packet.header.playerCarIndex);
    }
    else if (const auto* body = std::get_if<packets::f1_2020::CarTelemetryBody>(&packet.body)) {
        logPlayerTelemetry(*body, packet.header.playerCarIndex);
    }
}

void PacketProcessor::logEvent(const packets::DecodedPacket& packet) {
    if (packet.header.packetType() != packets::PacketType::Event) {
        return;
    }

    const std::string* code = nullptr;
    if (const auto* event = std::get_if<packets::f1_2019::EventBody>(&packet.body)) {
        code = &event->eventStringCode.text;
    }
    else if (const auto* event = std::get_if<packets::f1_2020::EventBody>(&packet.body)) {
        code = &event->eventStringCode.text;
        if (const auto* penalty = std::get_if<packets::f1_2020::PenaltyData>(&event->eventDetails.value)) {
            LOG_DEBUG("Penalty for car {}: {} ({})", penalty->vehicleIdx,
                      packets::penaltyTypeName(penalty->penaltyType),
                      packets::infringementTypeName(penalty->infringementType));
        }
    }

    if (code) {
        LOG_DEBUG("Event {} ({})", *code, packets::eventCodeDescription(*code));
    }
}

void PacketProcessor::reportUnsupported(uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId) {
    auto key = packets::DecoderRegistry::makeKey(packetFormat, packetVersion, packetId);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_unsupportedSeen.insert(key).second) {
        LOG_WARN("Unsupported packet: {} (id {}), format {}, packet version {}",
                 packets::packetTypeName(packetId), packetId, packetFormat, packetVersion);
    }
}

} // namespace pitwall::pipeline
