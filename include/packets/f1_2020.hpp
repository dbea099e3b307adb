#pragma once

#include "packets/common_records.hpp"
#include "packets/types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace pitwall::packets::f1_2020 {

/**
 * F1 2020 UDP format (packetFormat 2020, packetVersion 1).
 *
 * 22 cars per array, 24 byte header (adds secondaryPlayerCarIndex).
 */
constexpr size_t kNumCars = kNumCars2020;

using MotionBody = packets::MotionBody<kNumCars>;
using ParticipantsBody = packets::ParticipantsBody<kNumCars>;

// =============================================================================
// Session (251 bytes)
// =============================================================================
struct WeatherForecastSample {
    static constexpr size_t kWireSize = 5;

    uint8_t sessionType{};
    uint8_t timeOffset{};       // minutes
    uint8_t weather{};
    int8_t trackTemperature{};
    int8_t airTemperature{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("sessionType", self.sessionType);
        v("timeOffset", self.timeOffset);
        v("weather", self.weather);
        v("trackTemperature", self.trackTemperature);
        v("airTemperature", self.airTemperature);
    }
};

struct SessionBody {
    static constexpr size_t kWireSize = 19 + kMaxMarshalZones * MarshalZone::kWireSize + 3 +
                                        kMaxWeatherForecastSamples * WeatherForecastSample::kWireSize;

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
    uint8_t numWeatherForecastSamples{};
    std::array<WeatherForecastSample, kMaxWeatherForecastSamples> weatherForecastSamples{};

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
        v("numWeatherForecastSamples", self.numWeatherForecastSamples);
        v("weatherForecastSamples", self.weatherForecastSamples);
    }
};

// =============================================================================
// Lap data (1190 bytes)
// =============================================================================
struct LapData {
    static constexpr size_t kWireSize = 53;

    float lastLapTime{};
    float currentLapTime{};
    uint16_t sector1TimeInMS{};
    uint16_t sector2TimeInMS{};
    float bestLapTime{};
    uint8_t bestLapNum{};
    uint16_t bestLapSector1TimeInMS{};
    uint16_t bestLapSector2TimeInMS{};
    uint16_t bestLapSector3TimeInMS{};
    uint16_t bestOverallSector1TimeInMS{};
    uint8_t bestOverallSector1LapNum{};
    uint16_t bestOverallSector2TimeInMS{};
    uint8_t bestOverallSector2LapNum{};
    uint16_t bestOverallSector3TimeInMS{};
    uint8_t bestOverallSector3LapNum{};
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
        v("sector1TimeInMS", self.sector1TimeInMS);
        v("sector2TimeInMS", self.sector2TimeInMS);
        v("bestLapTime", self.bestLapTime);
        v("bestLapNum", self.bestLapNum);
        v("bestLapSector1TimeInMS", self.bestLapSector1TimeInMS);
        v("bestLapSector2TimeInMS", self.bestLapSector2TimeInMS);
        v("bestLapSector3TimeInMS", self.bestLapSector3TimeInMS);
        v("bestOverallSector1TimeInMS", self.bestOverallSector1TimeInMS);
        v("bestOverallSector1LapNum", self.bestOverallSector1LapNum);
        v("bestOverallSector2TimeInMS", self.bestOverallSector2TimeInMS);
        v("bestOverallSector2LapNum", self.bestOverallSector2LapNum);
        v("bestOverallSector3TimeInMS", self.bestOverallSector3TimeInMS);
        v("bestOverallSector3LapNum", self.bestOverallSector3LapNum);
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
// Event (35 bytes)
// =============================================================================
struct PenaltyData {
    static constexpr size_t kWireSize = 7;

    uint8_t penaltyType{};
    uint8_t infringementType{};
    uint8_t vehicleIdx{};
    uint8_t otherVehicleIdx{};
    uint8_t time{};
    uint8_t lapNum{};
    uint8_t placesGained{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("penaltyType", self.penaltyType);
        v("infringementType", self.infringementType);
        v("vehicleIdx", self.vehicleIdx);
        v("otherVehicleIdx", self.otherVehicleIdx);
        v("time", self.time);
        v("lapNum", self.lapNum);
        v("placesGained", self.placesGained);
    }
};

struct SpeedTrapData {
    static constexpr size_t kWireSize = 5;

    uint8_t vehicleIdx{};
    float speed{};          // km/h

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("vehicleIdx", self.vehicleIdx);
        v("speed", self.speed);
    }
};

using EventDetails = PaddedUnion<7, FastestLapData, RetirementData, TeamMateInPitsData,
                                 RaceWinnerData, PenaltyData, SpeedTrapData>;

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
// Car setups (1102 bytes)
// =============================================================================
struct CarSetupData {
    static constexpr size_t kWireSize = 49;

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
    float rearLeftTyrePressure{};
    float rearRightTyrePressure{};
    float frontLeftTyrePressure{};
    float frontRightTyrePressure{};
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
        v("rearLeftTyrePressure", self.rearLeftTyrePressure);
        v("rearRightTyrePressure", self.rearRightTyrePressure);
        v("frontLeftTyrePressure", self.frontLeftTyrePressure);
        v("frontRightTyrePressure", self.frontRightTyrePressure);
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
// Car telemetry (1307 bytes)
// =============================================================================
struct CarTelemetryData {
    static constexpr size_t kWireSize = 58;

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
    std::array<uint8_t, 4> tyresSurfaceTemperature{};
    std::array<uint8_t, 4> tyresInnerTemperature{};
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
    static constexpr size_t kWireSize = kNumCars * CarTelemetryData::kWireSize + 7;

    std::array<CarTelemetryData, kNumCars> carTelemetryData{};
    uint32_t buttonStatus{};
    uint8_t mfdPanelIndex{};                    // 255 = MFD closed
    uint8_t mfdPanelIndexSecondaryPlayer{};
    int8_t suggestedGear{};                     // 0 if no gear suggested

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("carTelemetryData", self.carTelemetryData);
        v("buttonStatus", self.buttonStatus);
        v("mfdPanelIndex", self.mfdPanelIndex);
        v("mfdPanelIndexSecondaryPlayer", self.mfdPanelIndexSecondaryPlayer);
        v("suggestedGear", self.suggestedGear);
    }
};

// =============================================================================
// Car status (1344 bytes)
// =============================================================================
struct CarStatusData {
    static constexpr size_t kWireSize = 60;

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
    uint8_t drsAllowed{};
    uint16_t drsActivationDistance{};   // metres, 0 = DRS not available
    std::array<uint8_t, 4> tyresWear{};
    uint8_t actualTyreCompound{};
    uint8_t visualTyreCompound{};
    uint8_t tyresAgeLaps{};
    std::array<uint8_t, 4> tyresDamage{};
    uint8_t frontLeftWingDamage{};
    uint8_t frontRightWingDamage{};
    uint8_t rearWingDamage{};
    uint8_t drsFault{};
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
        v("drsActivationDistance", self.drsActivationDistance);
        v("tyresWear", self.tyresWear);
        v("actualTyreCompound", self.actualTyreCompound);
        v("visualTyreCompound", self.visualTyreCompound);
        v("tyresAgeLaps", self.tyresAgeLaps);
        v("tyresDamage", self.tyresDamage);
        v("frontLeftWingDamage", self.frontLeftWingDamage);
        v("frontRightWingDamage", self.frontRightWingDamage);
        v("rearWingDamage", self.rearWingDamage);
        v("drsFault", self.drsFault);
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
// Final classification (839 bytes)
// =============================================================================
struct FinalClassificationData {
    static constexpr size_t kWireSize = 37;

    uint8_t position{};
    uint8_t numLaps{};
    uint8_t gridPosition{};
    uint8_t points{};
    uint8_t numPitStops{};
    uint8_t resultStatus{};
    float bestLapTime{};
    double totalRaceTime{};             // seconds, without penalties
    uint8_t penaltiesTime{};
    uint8_t numPenalties{};
    uint8_t numTyreStints{};
    std::array<uint8_t, kMaxTyreStints> tyreStintsActual{};
    std::array<uint8_t, kMaxTyreStints> tyreStintsVisual{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("position", self.position);
        v("numLaps", self.numLaps);
        v("gridPosition", self.gridPosition);
        v("points", self.points);
        v("numPitStops", self.numPitStops);
        v("resultStatus", self.resultStatus);
        v("bestLapTime", self.bestLapTime);
        v("totalRaceTime", self.totalRaceTime);
        v("penaltiesTime", self.penaltiesTime);
        v("numPenalties", self.numPenalties);
        v("numTyreStints", self.numTyreStints);
        v("tyreStintsActual", self.tyreStintsActual);
        v("tyreStintsVisual", self.tyreStintsVisual);
    }
};

struct FinalClassificationBody {
    static constexpr size_t kWireSize = 1 + kNumCars * FinalClassificationData::kWireSize;

    uint8_t numCars{};
    std::array<FinalClassificationData, kNumCars> classificationData{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("numCars", self.numCars);
        v("classificationData", self.classificationData);
    }
};

// =============================================================================
// Lobby info (1169 bytes)
// =============================================================================
struct LobbyInfoData {
    static constexpr size_t kWireSize = 52;

    uint8_t aiControlled{};
    uint8_t teamId{};                   // 255 if no team selected
    uint8_t nationality{};
    FixedString<kNameLength> name;
    uint8_t readyStatus{};              // 0 not ready, 1 ready, 2 spectating

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("aiControlled", self.aiControlled);
        v("teamId", self.teamId);
        v("nationality", self.nationality);
        v("name", self.name);
        v("readyStatus", self.readyStatus);
    }
};

struct LobbyInfoBody {
    static constexpr size_t kWireSize = 1 + kNumCars * LobbyInfoData::kWireSize;

    uint8_t numPlayers{};
    std::array<LobbyInfoData, kNumCars> lobbyPlayers{};

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("numPlayers", self.numPlayers);
        v("lobbyPlayers", self.lobbyPlayers);
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
Decoded<FinalClassificationBody> decodeFinalClassification(const uint8_t* data, size_t size, size_t offset);
Decoded<LobbyInfoBody> decodeLobbyInfo(const uint8_t* data, size_t size, size_t offset);

// Pick the details layout for an event code; unknown codes carry none
void selectEventDetails(const std::string& eventCode, EventDetails& details);

} // namespace pitwall::packets::f1_2020
