#pragma once

#include "packets/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pitwall::packets {

/**
 * Appendix lookups
 *
 * Human readable names for the numeric ids used throughout the protocol.
 * Every lookup returns "Unknown" for ids the game does not document.
 */

// Short packet type name ("Lap Data", "Car Telemetry", ...)
std::string packetTypeName(uint8_t packetId);

inline std::string packetTypeName(PacketType type) {
    return packetTypeName(static_cast<uint8_t>(type));
}

// Four letter event code ("FTLP") to description ("Fastest Lap")
std::string eventCodeDescription(const std::string& eventCode);

std::string trackName(int trackId);
std::string teamName(int teamId);
std::string penaltyTypeName(int penaltyType);
std::string surfaceTypeName(int surfaceType);
std::string driverName(int driverId);
std::string nationalityName(int nationality);
std::string infringementTypeName(int infringementType);

// Single bit of the telemetry buttonStatus mask ("Cross or A")
std::string buttonFlagDescription(uint32_t flag);

// Descriptions of every documented button held in a buttonStatus mask, lowest bit first
std::vector<std::string> pressedButtons(uint32_t buttonStatus);

} // namespace pitwall::packets
