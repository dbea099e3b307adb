#include "packets/dispatcher.hpp"
#include "packets/header.hpp"
#include "utils/errors.hpp"

#include <utility>

namespace pitwall::packets {

namespace {

template <typename Body, Decoded<Body> (*Decode)(const uint8_t*, size_t, size_t)>
Decoded<PacketBody> decodeAs(const uint8_t* data, size_t size, size_t offset) {
    auto decoded = Decode(data, size, offset);
    return {PacketBody(std::in_place_type<Body>, std::move(decoded.value)), decoded.bytesConsumed};
}

} // namespace

// =============================================================================
// Decoder Registry
// =============================================================================

const DecoderRegistry& DecoderRegistry::instance() {
    static const DecoderRegistry registry;
    return registry;
}

template <typename Body, Decoded<Body> (*Decode)(const uint8_t*, size_t, size_t)>
void DecoderRegistry::add(uint16_t packetFormat, uint8_t packetVersion, PacketType type) {
    Key key = makeKey(packetFormat, packetVersion, static_cast<uint8_t>(type));
    m_entries[key] = Entry{packetFormat, packetVersion, type, Body::kWireSize, &decodeAs<Body, Decode>};
}

DecoderRegistry::DecoderRegistry() {
    constexpr uint8_t kVersion1 = 1;

    // F1 2019
    add<f1_2019::MotionBody, &f1_2019::decodeMotion>(kFormat2019, kVersion1, PacketType::Motion);
    add<f1_2019::SessionBody, &f1_2019::decodeSession>(kFormat2019, kVersion1, PacketType::Session);
    add<f1_2019::LapDataBody, &f1_2019::decodeLapData>(kFormat2019, kVersion1, PacketType::LapData);
    add<f1_2019::EventBody, &f1_2019::decodeEvent>(kFormat2019, kVersion1, PacketType::Event);
    add<f1_2019::ParticipantsBody, &f1_2019::decodeParticipants>(kFormat2019, kVersion1, PacketType::Participants);
    add<f1_2019::CarSetupsBody, &f1_2019::decodeCarSetups>(kFormat2019, kVersion1, PacketType::CarSetups);
    add<f1_2019::CarTelemetryBody, &f1_2019::decodeCarTelemetry>(kFormat2019, kVersion1, PacketType::CarTelemetry);
    add<f1_2019::CarStatusBody, &f1_2019::decodeCarStatus>(kFormat2019, kVersion1, PacketType::CarStatus);

    // F1 2020
    add<f1_2020::MotionBody, &f1_2020::decodeMotion>(kFormat2020, kVersion1, PacketType::Motion);
    add<f1_2020::SessionBody, &f1_2020::decodeSession>(kFormat2020, kVersion1, PacketType::Session);
    add<f1_2020::LapDataBody, &f1_2020::decodeLapData>(kFormat2020, kVersion1, PacketType::LapData);
    add<f1_2020::EventBody, &f1_2020::decodeEvent>(kFormat2020, kVersion1, PacketType::Event);
    add<f1_2020::ParticipantsBody, &f1_2020::decodeParticipants>(kFormat2020, kVersion1, PacketType::Participants);
    add<f1_2020::CarSetupsBody, &f1_2020::decodeCarSetups>(kFormat2020, kVersion1, PacketType::CarSetups);
    add<f1_2020::CarTelemetryBody, &f1_2020::decodeCarTelemetry>(kFormat2020, kVersion1, PacketType::CarTelemetry);
    add<f1_2020::CarStatusBody, &f1_2020::decodeCarStatus>(kFormat2020, kVersion1, PacketType::CarStatus);
    add<f1_2020::FinalClassificationBody, &f1_2020::decodeFinalClassification>(
        kFormat2020, kVersion1, PacketType::FinalClassification);
    add<f1_2020::LobbyInfoBody, &f1_2020::decodeLobbyInfo>(kFormat2020, kVersion1, PacketType::LobbyInfo);
}

const DecoderRegistry::Entry* DecoderRegistry::find(
    uint16_t packetFormat, uint8_t packetVersion, uint8_t packetId
) const {
    auto it = m_entries.find(makeKey(packetFormat, packetVersion, packetId));
    if (it != m_entries.end()) {
        return &it->second;
    }
    return nullptr;
}

// =============================================================================
// Dispatch
// =============================================================================

DecodedPacket decodePacket(const uint8_t* data, size_t size) {
    auto [header, headerSize] = decodeHeader(data, size);

    const auto* entry = DecoderRegistry::instance().find(
        header.packetFormat, header.packetVersion, header.packetId);
    if (!entry) {
        throw utils::UnsupportedVariantError(header.packetFormat, header.packetVersion, header.packetId);
    }

    auto [body, bodySize] = entry->decode(data, size, headerSize);

    size_t consumed = headerSize + bodySize;
    return DecodedPacket{header, std::move(body), consumed, size - consumed};
}

} // namespace pitwall::packets
