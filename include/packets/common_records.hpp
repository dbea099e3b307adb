#pragma once

#include "packets/types.hpp"

#include <array>
#include <cstdint>

namespace pitwall::packets {

// Records whose byte layout is identical in format 2019 and 2020. Anything
// that differs between the two lives in f1_2019.hpp / f1_2020.hpp.

// =============================================================================
// Motion
// =============================================================================
struct CarMotionData {
    static constexpr size_t kWireSize = 60;

    float worldPositionX{};
    float worldPositionY{};
    float worldPositionZ{};
    float worldVelocityX{};
    float worldVelocityY{};
    float worldVelocityZ{};
    int16_t worldForwardDirX{};     // normalised, divide by 32767
    int16_t worldForwardDirY{};
    int16_t worldForwardDirZ{};
    int16_t worldRightDirX{};
    int16_t worldRightDirY{};
    int16_t worldRightDirZ{};
    float gForceLateral{};
    float gForceLongitudinal{};
    float gForceVertical{};
    float yaw{};
    float pitch{};
    float roll{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("worldPositionX", self.worldPositionX);
        v("worldPositionY", self.worldPositionY);
        v("worldPositionZ", self.worldPositionZ);
        v("worldVelocityX", self.worldVelocityX);
        v("worldVelocityY", self.worldVelocityY);
        v("worldVelocityZ", self.worldVelocityZ);
        v("worldForwardDirX", self.worldForwardDirX);
        v("worldForwardDirY", self.worldForwardDirY);
        v("worldForwardDirZ", self.worldForwardDirZ);
        v("worldRightDirX", self.worldRightDirX);
        v("worldRightDirY", self.worldRightDirY);
        v("worldRightDirZ", self.worldRightDirZ);
        v("gForceLateral", self.gForceLateral);
        v("gForceLongitudinal", self.gForceLongitudinal);
        v("gForceVertical", self.gForceVertical);
        v("yaw", self.yaw);
        v("pitch", self.pitch);
        v("roll", self.roll);
    }
};

/**
 * Motion packet body. Car array size differs per format; the player-only
 * block that follows is the same in both.
 *
 * Wheel arrays are ordered RL, RR, FL, FR.
 */
template <size_t NumCars>
struct MotionBody {
    static constexpr size_t kWireSize = NumCars * CarMotionData::kWireSize + 30 * 4;

    std::array<CarMotionData, NumCars> carMotionData{};
    std::array<float, 4> suspensionPosition{};
    std::array<float, 4> suspensionVelocity{};
    std::array<float, 4> suspensionAcceleration{};
    std::array<float, 4> wheelSpeed{};
    std::array<float, 4> wheelSlip{};
    float localVelocityX{};
    float localVelocityY{};
    float localVelocityZ{};
    float angularVelocityX{};
    float angularVelocityY{};
    float angularVelocityZ{};
    float angularAccelerationX{};
    float angularAccelerationY{};
    float angularAccelerationZ{};
    float frontWheelsAngle{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("carMotionData", self.carMotionData);
        v("suspensionPosition", self.suspensionPosition);
        v("suspensionVelocity", self.suspensionVelocity);
        v("suspensionAcceleration", self.suspensionAcceleration);
        v("wheelSpeed", self.wheelSpeed);
        v("wheelSlip", self.wheelSlip);
        v("localVelocityX", self.localVelocityX);
        v("localVelocityY", self.localVelocityY);
        v("localVelocityZ", self.localVelocityZ);
        v("angularVelocityX", self.angularVelocityX);
        v("angularVelocityY", self.angularVelocityY);
        v("angularVelocityZ", self.angularVelocityZ);
        v("angularAccelerationX", self.angularAccelerationX);
        v("angularAccelerationY", self.angularAccelerationY);
        v("angularAccelerationZ", self.angularAccelerationZ);
        v("frontWheelsAngle", self.frontWheelsAngle);
    }
};

// =============================================================================
// Session
// =============================================================================
struct MarshalZone {
    static constexpr size_t kWireSize = 5;

    float zoneStart{};      // fraction of the lap where the zone starts
    int8_t zoneFlag{};      // -1 unknown, 0 none, 1 green, 2 blue, 3 yellow, 4 red

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("zoneStart", self.zoneStart);
        v("zoneFlag", self.zoneFlag);
    }
};

// =============================================================================
// Event details shared by both formats
// =============================================================================
struct FastestLapData {
    static constexpr size_t kWireSize = 5;

    uint8_t vehicleIdx{};
    float lapTime{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("vehicleIdx", self.vehicleIdx);
        v("lapTime", self.lapTime);
    }
};

struct RetirementData {
    static constexpr size_t kWireSize = 1;

    uint8_t vehicleIdx{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("vehicleIdx", self.vehicleIdx);
    }
};

struct TeamMateInPitsData {
    static constexpr size_t kWireSize = 1;

    uint8_t vehicleIdx{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("vehicleIdx", self.vehicleIdx);
    }
};

struct RaceWinnerData {
    static constexpr size_t kWireSize = 1;

    uint8_t vehicleIdx{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("vehicleIdx", self.vehicleIdx);
    }
};

// =============================================================================
// Participants
// =============================================================================
struct ParticipantData {
    static constexpr size_t kWireSize = 54;

    uint8_t aiControlled{};
    uint8_t driverId{};
    uint8_t teamId{};
    uint8_t raceNumber{};
    uint8_t nationality{};
    FixedString<kNameLength> name;      // UTF-8, NUL terminated
    uint8_t yourTelemetry{};            // 0 = restricted, 1 = public

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("aiControlled", self.aiControlled);
        v("driverId", self.driverId);
        v("teamId", self.teamId);
        v("raceNumber", self.raceNumber);
        v("nationality", self.nationality);
        v("name", self.name);
        v("yourTelemetry", self.yourTelemetry);
    }
};

template <size_t NumCars>
struct ParticipantsBody {
    static constexpr size_t kWireSize = 1 + NumCars * ParticipantData::kWireSize;

    uint8_t numActiveCars{};
    std::array<ParticipantData, NumCars> participants{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("numActiveCars", self.numActiveCars);
        v("participants", self.participants);
    }
};

} // namespace pitwall::packets
