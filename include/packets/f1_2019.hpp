#pragma once

#include "packets/common_records.hpp"
#include "packets/types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace pitwall::packets::f1_2019 {

/**
 * F1 2019 UDP format (packetFormat 2019, packetVersion 1).
 *
 * 20 cars per array, 23 byte header. Final classification and lobby info
 * packets do not exist in this format.
 */
constexpr size_t kNumCars = kNumCars2019;

using MotionBody = packets::MotionBody<kNumCars>;
using ParticipantsBody = packets::ParticipantsBody<kNumCars>;

// =============================================================================
// Session (149 bytes)
// =============================================================================
struct SessionBody {
    static constexpr size_t kWireSize = 19 + kMaxMarshalZones * MarshalZone::kWireSize + 2;

    uint8_t weather{};
    int8_t trackTemperature{};
    int8_t airTemperature{};
    uint8_t totalLaps{};
    uint16_t trackLength{};
    uint8_t sessionType{};
    int8_t trackId{};
    uint8_t formula{};
    uint16_t sessionTimeLeft{};
    uint16_t sessionDuration{};
    uint8_t pitSpeedLimit{};
    uint8_t gamePaused{};
    uint8_t isSpectating{};
    uint8_t spectatorCarIndex{};
    uint8_t sliProNativeSupport{};
    uint8_t numMarshalZones{};
    std::array<MarshalZone, kMaxMarshalZones> marshalZones{};
    uint8_t safetyCarStatus{};
    uint8_t networkGame{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("weather", self.weather);
        v("trackTemperature", self.trackTemperature);
        v("airTemperature", self.airTemperature);
        v("totalLaps", self.totalLaps);
        v("trackLength", self.trackLength);
        v("sessionType", self.sessionType);
        v("trackId", self.trackId);
        v("formula", self.formula);
        v("sessionTimeLeft", self.sessionTimeLeft);
        v("sessionDuration", self.sessionDuration);
        v("pitSpeedLimit", self.pitSpeedLimit);
        v("gamePaused", self.gamePaused);
        v("isSpectating", self.isSpectating);
        v("spectatorCarIndex", self.spectatorCarIndex);
        v("sliProNativeSupport", self.sliProNativeSupport);
        v("numMarshalZones", self.numMarshalZones);
        v("marshalZones", self.marshalZones);
        v("safetyCarStatus", self.safetyCarStatus);
        v("networkGame", self.networkGame);
    }
};

// =============================================================================
// Lap data (843 bytes)
// =============================================================================
struct LapData {
    static constexpr size_t kWireSize = 41;

    float lastLapTime{};
    float currentLapTime{};
    float bestLapTime{};
    float sector1Time{};
    float sector2Time{};
    float lapDistance{};
    float totalDistance{};
    float safetyCarDelta{};
    uint8_t carPosition{};
    uint8_t currentLapNum{};
    uint8_t pitStatus{};
    uint8_t sector{};
    uint8_t currentLapInvalid{};
    uint8_t penalties{};
    uint8_t gridPosition{};
    uint8_t driverStatus{};
    uint8_t resultStatus{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("lastLapTime", self.lastLapTime);
        v("currentLapTime", self.currentLapTime);
        v("bestLapTime", self.bestLapTime);
        v("sector1Time", self.sector1Time);
        v("sector2Time", self.sector2Time);
        v("lapDistance", self.lapDistance);
        v("totalDistance", self.totalDistance);
        v("safetyCarDelta", self.safetyCarDelta);
        v("carPosition", self.carPosition);
        v("currentLapNum", self.currentLapNum);
        v("pitStatus", self.pitStatus);
        v("sector", self.sector);
        v("currentLapInvalid", self.currentLapInvalid);
        v("penalties", self.penalties);
        v("gridPosition", self.gridPosition);
        v("driverStatus", self.driverStatus);
        v("resultStatus", self.resultStatus);
    }
};

struct LapDataBody {
    static constexpr size_t kWireSize = kNumCars * LapData::kWireSize;

    std::array<LapData, kNumCars> lapData{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("lapData", self.lapData);
    }
};

// =============================================================================
// Event (32 bytes)
// =============================================================================
using EventDetails = PaddedUnion<5, FastestLapData, RetirementData, TeamMateInPitsData, RaceWinnerData>;

struct EventBody {
    static constexpr size_t kWireSize = kEventCodeLength + EventDetails::kSize;

    FixedString<kEventCodeLength> eventStringCode;
    EventDetails eventDetails;

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("eventStringCode", self.eventStringCode);
        v("eventDetails", self.eventDetails);
    }
};

// =============================================================================
// Car setups (843 bytes)
// =============================================================================
struct CarSetupData {
    static constexpr size_t kWireSize = 41;

    uint8_t frontWing{};
    uint8_t rearWing{};
    uint8_t onThrottle{};
    uint8_t offThrottle{};
    float frontCamber{};
    float rearCamber{};
    float frontToe{};
    float rearToe{};
    uint8_t frontSuspension{};
    uint8_t rearSuspension{};
    uint8_t frontAntiRollBar{};
    uint8_t rearAntiRollBar{};
    uint8_t frontSuspensionHeight{};
    uint8_t rearSuspensionHeight{};
    uint8_t brakePressure{};
    uint8_t brakeBias{};
    float frontTyrePressure{};
    float rearTyrePressure{};
    uint8_t ballast{};
    float fuelLoad{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("frontWing", self.frontWing);
        v("rearWing", self.rearWing);
        v("onThrottle", self.onThrottle);
        v("offThrottle", self.offThrottle);
        v("frontCamber", self.frontCamber);
        v("rearCamber", self.rearCamber);
        v("frontToe", self.frontToe);
        v("rearToe", self.rearToe);
        v("frontSuspension", self.frontSuspension);
        v("rearSuspension", self.rearSuspension);
        v("frontAntiRollBar", self.frontAntiRollBar);
        v("rearAntiRollBar", self.rearAntiRollBar);
        v("frontSuspensionHeight", self.frontSuspensionHeight);
        v("rearSuspensionHeight", self.rearSuspensionHeight);
        v("brakePressure", self.brakePressure);
        v("brakeBias", self.brakeBias);
        v("frontTyrePressure", self.frontTyrePressure);
        v("rearTyrePressure", self.rearTyrePressure);
        v("ballast", self.ballast);
        v("fuelLoad", self.fuelLoad);
    }
};

struct CarSetupsBody {
    static constexpr size_t kWireSize = kNumCars * CarSetupData::kWireSize;

    std::array<CarSetupData, kNumCars> carSetups{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("carSetups", self.carSetups);
    }
};

// =============================================================================
// Car telemetry (1347 bytes)
// =============================================================================
struct CarTelemetryData {
    static constexpr size_t kWireSize = 66;

    uint16_t speed{};
    float throttle{};
    float steer{};
    float brake{};
    uint8_t clutch{};
    int8_t gear{};
    uint16_t engineRPM{};
    uint8_t drs{};
    uint8_t revLightsPercent{};
    std::array<uint16_t, 4> brakesTemperature{};
    std::array<uint16_t, 4> tyresSurfaceTemperature{};
    std::array<uint16_t, 4> tyresInnerTemperature{};
    uint16_t engineTemperature{};
    std::array<float, 4> tyresPressure{};
    std::array<uint8_t, 4> surfaceType{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("speed", self.speed);
        v("throttle", self.throttle);
        v("steer", self.steer);
        v("brake", self.brake);
        v("clutch", self.clutch);
        v("gear", self.gear);
        v("engineRPM", self.engineRPM);
        v("drs", self.drs);
        v("revLightsPercent", self.revLightsPercent);
        v("brakesTemperature", self.brakesTemperature);
        v("tyresSurfaceTemperature", self.tyresSurfaceTemperature);
        v("tyresInnerTemperature", self.tyresInnerTemperature);
        v("engineTemperature", self.engineTemperature);
        v("tyresPressure", self.tyresPressure);
        v("surfaceType", self.surfaceType);
    }
};

struct CarTelemetryBody {
    static constexpr size_t kWireSize = kNumCars * CarTelemetryData::kWireSize + 4;

    std::array<CarTelemetryData, kNumCars> carTelemetryData{};
    uint32_t buttonStatus{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("carTelemetryData", self.carTelemetryData);
        v("buttonStatus", self.buttonStatus);
    }
};

// =============================================================================
// Car status (1143 bytes)
// =============================================================================
struct CarStatusData {
    static constexpr size_t kWireSize = 56;

    uint8_t tractionControl{};
    uint8_t antiLockBrakes{};
    uint8_t fuelMix{};
    uint8_t frontBrakeBias{};
    uint8_t pitLimiterStatus{};
    float fuelInTank{};
    float fuelCapacity{};
    float fuelRemainingLaps{};
    uint16_t maxRPM{};
    uint16_t idleRPM{};
    uint8_t maxGears{};
    int8_t drsAllowed{};            // 0 not allowed, 1 allowed, -1 unknown
    std::array<uint8_t, 4> tyresWear{};
    uint8_t actualTyreCompound{};
    uint8_t tyreVisualCompound{};
    std::array<uint8_t, 4> tyresDamage{};
    uint8_t frontLeftWingDamage{};
    uint8_t frontRightWingDamage{};
    uint8_t rearWingDamage{};
    uint8_t engineDamage{};
    uint8_t gearBoxDamage{};
    int8_t vehicleFiaFlags{};
    float ersStoreEnergy{};
    uint8_t ersDeployMode{};
    float ersHarvestedThisLapMGUK{};
    float ersHarvestedThisLapMGUH{};
    float ersDeployedThisLap{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("tractionControl", self.tractionControl);
        v("antiLockBrakes", self.antiLockBrakes);
        v("fuelMix", self.fuelMix);
        v("frontBrakeBias", self.frontBrakeBias);
        v("pitLimiterStatus", self.pitLimiterStatus);
        v("fuelInTank", self.fuelInTank);
        v("fuelCapacity", self.fuelCapacity);
        v("fuelRemainingLaps", self.fuelRemainingLaps);
        v("maxRPM", self.maxRPM);
        v("idleRPM", self.idleRPM);
        v("maxGears", self.maxGears);
        v("drsAllowed", self.drsAllowed);
        v("tyresWear", self.tyresWear);
        v("actualTyreCompound", self.actualTyreCompound);
        v("tyreVisualCompound", self.tyreVisualCompound);
        v("tyresDamage", self.tyresDamage);
        v("frontLeftWingDamage", self.frontLeftWingDamage);
        v("frontRightWingDamage", self.frontRightWingDamage);
        v("rearWingDamage", self.rearWingDamage);
        v("engineDamage", self.engineDamage);
        v("gearBoxDamage", self.gearBoxDamage);
        v("vehicleFiaFlags", self.vehicleFiaFlags);
        v("ersStoreEnergy", self.ersStoreEnergy);
        v("ersDeployMode", self.ersDeployMode);
        v("ersHarvestedThisLapMGUK", self.ersHarvestedThisLapMGUK);
        v("ersHarvestedThisLapMGUH", self.ersHarvestedThisLapMGUH);
        v("ersDeployedThisLap", self.ersDeployedThisLap);
    }
};

struct CarStatusBody {
    static constexpr size_t kWireSize = kNumCars * CarStatusData::kWireSize;

    std::array<CarStatusData, kNumCars> carStatusData{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("carStatusData", self.carStatusData);
    }
};

// =============================================================================
// Body decoders
// =============================================================================
Decoded<MotionBody> decodeMotion(const uint8_t* data, size_t size, size_t offset);
Decoded<SessionBody> decodeSession(const uint8_t* data, size_t size, size_t offset);
Decoded<LapDataBody> decodeLapData(const uint8_t* data, size_t size, size_t offset);
Decoded<EventBody> decodeEvent(const uint8_t* data, size_t size, size_t offset);
Decoded<ParticipantsBody> decodeParticipants(const uint8_t* data, size_t size, size_t offset);
Decoded<CarSetupsBody> decodeCarSetups(const uint8_t* data, size_t size, size_t offset);
Decoded<CarTelemetryBody> decodeCarTelemetry(const uint8_t* data, size_t size, size_t offset);
Decoded<CarStatusBody> decodeCarStatus(const uint8_t* data, size_t size, size_t offset);

// Pick the details layout for an event code; unknown codes carry none
void selectEventDetails(const std::string& eventCode, EventDetails& details);

} // namespace pitwall::packets::f1_2019
