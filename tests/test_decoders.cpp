#include "test_framework.hpp"
#include "packet_builder.hpp"
#include "packets/dispatcher.hpp"
#include "serialize/tree.hpp"

#include <cstring>

using namespace pitwall::packets;
using namespace pitwall::serialize;
using namespace pitwall::utils;
using namespace pitwall::test;

namespace {

using Keys = std::vector<std::string>;

struct VariantCase {
    uint16_t packetFormat;
    PacketType type;
    size_t totalSize;
    Keys bodyKeys;
};

const Keys kMotionKeys = {
    "carMotionData", "suspensionPosition", "suspensionVelocity", "suspensionAcceleration",
    "wheelSpeed", "wheelSlip", "localVelocityX", "localVelocityY", "localVelocityZ",
    "angularVelocityX", "angularVelocityY", "angularVelocityZ", "angularAccelerationX",
    "angularAccelerationY", "angularAccelerationZ", "frontWheelsAngle"};

const Keys kSession2019Keys = {
    "weather", "trackTemperature", "airTemperature", "totalLaps", "trackLength", "sessionType",
    "trackId", "formula", "sessionTimeLeft", "sessionDuration", "pitSpeedLimit", "gamePaused",
    "isSpectating", "spectatorCarIndex", "sliProNativeSupport", "numMarshalZones", "marshalZones",
    "safetyCarStatus", "networkGame"};

Keys session2020Keys() {
    Keys keys = kSession2019Keys;
    keys.push_back("numWeatherForecastSamples");
    keys.push_back("weatherForecastSamples");
    return keys;
}

std::vector<VariantCase> allVariants() {
    return {
        {kFormat2019, PacketType::Motion, 1343, kMotionKeys},
        {kFormat2019, PacketType::Session, 149, kSession2019Keys},
        {kFormat2019, PacketType::LapData, 843, {"lapData"}},
        {kFormat2019, PacketType::Event, 32, {"eventStringCode"}},
        {kFormat2019, PacketType::Participants, 1104, {"numActiveCars", "participants"}},
        {kFormat2019, PacketType::CarSetups, 843, {"carSetups"}},
        {kFormat2019, PacketType::CarTelemetry, 1347, {"carTelemetryData", "buttonStatus"}},
        {kFormat2019, PacketType::CarStatus, 1143, {"carStatusData"}},
        {kFormat2020, PacketType::Motion, 1464, kMotionKeys},
        {kFormat2020, PacketType::Session, 251, session2020Keys()},
        {kFormat2020, PacketType::LapData, 1190, {"lapData"}},
        {kFormat2020, PacketType::Event, 35, {"eventStringCode"}},
        {kFormat2020, PacketType::Participants, 1213, {"numActiveCars", "participants"}},
        {kFormat2020, PacketType::CarSetups, 1102, {"carSetups"}},
        {kFormat2020, PacketType::CarTelemetry, 1307,
            {"carTelemetryData", "buttonStatus", "mfdPanelIndex", "mfdPanelIndexSecondaryPlayer",
             "suggestedGear"}},
        {kFormat2020, PacketType::CarStatus, 1344, {"carStatusData"}},
        {kFormat2020, PacketType::FinalClassification, 839, {"numCars", "classificationData"}},
        {kFormat2020, PacketType::LobbyInfo, 1169, {"numPlayers", "lobbyPlayers"}},
    };
}

// Zero-filled packet of exactly the protocol length, decoded and serialized
Tree decodeZeroPacket(uint16_t packetFormat, PacketType type, size_t totalSize) {
    auto header = makeHeader(packetFormat, type);
    auto data = buildZeroPacket(header, totalSize - header.wireSize());
    return toTree(decodePacket(data));
}

} // namespace

// =============================================================================
// Wire Sizes
// =============================================================================

TEST(Decoders_RecordSizes2019) {
    ASSERT_EQ(f1_2019::MotionBody::kWireSize, 1320u);
    ASSERT_EQ(f1_2019::SessionBody::kWireSize, 126u);
    ASSERT_EQ(f1_2019::LapDataBody::kWireSize, 820u);
    ASSERT_EQ(f1_2019::EventBody::kWireSize, 9u);
    ASSERT_EQ(f1_2019::ParticipantsBody::kWireSize, 1081u);
    ASSERT_EQ(f1_2019::CarSetupsBody::kWireSize, 820u);
    ASSERT_EQ(f1_2019::CarTelemetryBody::kWireSize, 1324u);
    ASSERT_EQ(f1_2019::CarStatusBody::kWireSize, 1120u);
    PASS();
}

TEST(Decoders_RecordSizes2020) {
    ASSERT_EQ(f1_2020::MotionBody::kWireSize, 1440u);
    ASSERT_EQ(f1_2020::SessionBody::kWireSize, 227u);
    ASSERT_EQ(f1_2020::LapDataBody::kWireSize, 1166u);
    ASSERT_EQ(f1_2020::EventBody::kWireSize, 11u);
    ASSERT_EQ(f1_2020::ParticipantsBody::kWireSize, 1189u);
    ASSERT_EQ(f1_2020::CarSetupsBody::kWireSize, 1078u);
    ASSERT_EQ(f1_2020::CarTelemetryBody::kWireSize, 1283u);
    ASSERT_EQ(f1_2020::CarStatusBody::kWireSize, 1320u);
    ASSERT_EQ(f1_2020::FinalClassificationBody::kWireSize, 815u);
    ASSERT_EQ(f1_2020::LobbyInfoBody::kWireSize, 1145u);
    PASS();
}

TEST(Decoders_EncodedSizeMatchesDeclared) {
    // The field lists, not just the constants, must add up
    BufferWriter writer;
    encodeRecord(f1_2019::CarStatusBody{}, writer);
    ASSERT_EQ(writer.size(), f1_2019::CarStatusBody::kWireSize);

    writer.clear();
    encodeRecord(f1_2020::LapDataBody{}, writer);
    ASSERT_EQ(writer.size(), f1_2020::LapDataBody::kWireSize);

    writer.clear();
    encodeRecord(f1_2020::SessionBody{}, writer);
    ASSERT_EQ(writer.size(), f1_2020::SessionBody::kWireSize);

    writer.clear();
    encodeRecord(f1_2020::EventBody{}, writer);
    ASSERT_EQ(writer.size(), f1_2020::EventBody::kWireSize);
    PASS();
}

// =============================================================================
// Every registered variant
// =============================================================================

TEST(Decoders_RegistryCoversAllVariants) {
    const auto& registry = DecoderRegistry::instance();
    auto variants = allVariants();

    ASSERT_EQ(registry.entries().size(), variants.size());
    for (const auto& variant : variants) {
        const auto* entry = registry.find(variant.packetFormat, 1, static_cast<uint8_t>(variant.type));
        if (!entry) {
            _msg = "Missing decoder for " + std::to_string(variant.packetFormat) + "/" +
                   std::to_string(static_cast<int>(variant.type));
            return false;
        }
        size_t headerSize = variant.packetFormat == kFormat2019 ? kHeaderSize2019 : kHeaderSize2020;
        ASSERT_EQ(entry->bodySize + headerSize, variant.totalSize);
    }
    PASS();
}

TEST(Decoders_MinimumLengthPacketsDecode) {
    for (const auto& variant : allVariants()) {
        auto header = makeHeader(variant.packetFormat, variant.type);
        auto data = buildZeroPacket(header, variant.totalSize - header.wireSize());

        auto packet = decodePacket(data);
        if (packet.bytesConsumed != variant.totalSize || packet.trailingBytes != 0) {
            _msg = "Wrong length for " + std::to_string(variant.packetFormat) + "/" +
                   std::to_string(static_cast<int>(variant.type)) + ": consumed " +
                   std::to_string(packet.bytesConsumed);
            return false;
        }
    }
    PASS();
}

TEST(Decoders_FieldNamesInProtocolOrder) {
    for (const auto& variant : allVariants()) {
        auto tree = decodeZeroPacket(variant.packetFormat, variant.type, variant.totalSize);
        auto keys = bodyKeysOf(tree);
        if (keys != variant.bodyKeys) {
            _msg = "Unexpected fields for " + std::to_string(variant.packetFormat) + "/" +
                   std::to_string(static_cast<int>(variant.type)) + ": " + tree.dump();
            return false;
        }
    }
    PASS();
}

TEST(Decoders_HeaderFieldNames) {
    auto tree2019 = decodeZeroPacket(kFormat2019, PacketType::Event, 32);
    Keys header2019 = {"packetFormat", "gameMajorVersion", "gameMinorVersion", "packetVersion",
                       "packetId", "sessionUID", "sessionTime", "frameIdentifier", "playerCarIndex"};
    ASSERT_TRUE(keysOf(tree2019["header"]) == header2019);

    auto tree2020 = decodeZeroPacket(kFormat2020, PacketType::Event, 35);
    Keys header2020 = header2019;
    header2020.push_back("secondaryPlayerCarIndex");
    ASSERT_TRUE(keysOf(tree2020["header"]) == header2020);
    PASS();
}

// =============================================================================
// Sub-record field lists
// =============================================================================

TEST(Decoders_SharedRecordFields) {
    auto motion = decodeZeroPacket(kFormat2020, PacketType::Motion, 1464);
    Keys carMotion = {"worldPositionX", "worldPositionY", "worldPositionZ", "worldVelocityX",
                      "worldVelocityY", "worldVelocityZ", "worldForwardDirX", "worldForwardDirY",
                      "worldForwardDirZ", "worldRightDirX", "worldRightDirY", "worldRightDirZ",
                      "gForceLateral", "gForceLongitudinal", "gForceVertical", "yaw", "pitch", "roll"};
    ASSERT_TRUE(keysOf(motion["carMotionData"][0]) == carMotion);

    auto session = decodeZeroPacket(kFormat2019, PacketType::Session, 149);
    Keys marshalZone = {"zoneStart", "zoneFlag"};
    ASSERT_TRUE(keysOf(session["marshalZones"][20]) == marshalZone);

    auto participants = decodeZeroPacket(kFormat2019, PacketType::Participants, 1104);
    Keys participant = {"aiControlled", "driverId", "teamId", "raceNumber", "nationality",
                        "name", "yourTelemetry"};
    ASSERT_TRUE(keysOf(participants["participants"][0]) == participant);
    PASS();
}

TEST(Decoders_LapDataFields) {
    auto lap2019 = decodeZeroPacket(kFormat2019, PacketType::LapData, 843);
    Keys fields2019 = {"lastLapTime", "currentLapTime", "bestLapTime", "sector1Time", "sector2Time",
                       "lapDistance", "totalDistance", "safetyCarDelta", "carPosition", "currentLapNum",
                       "pitStatus", "sector", "currentLapInvalid", "penalties", "gridPosition",
                       "driverStatus", "resultStatus"};
    ASSERT_TRUE(keysOf(lap2019["lapData"][0]) == fields2019);

    auto lap2020 = decodeZeroPacket(kFormat2020, PacketType::LapData, 1190);
    Keys fields2020 = {"lastLapTime", "currentLapTime", "sector1TimeInMS", "sector2TimeInMS",
                       "bestLapTime", "bestLapNum", "bestLapSector1TimeInMS", "bestLapSector2TimeInMS",
                       "bestLapSector3TimeInMS", "bestOverallSector1TimeInMS", "bestOverallSector1LapNum",
                       "bestOverallSector2TimeInMS", "bestOverallSector2LapNum",
                       "bestOverallSector3TimeInMS", "bestOverallSector3LapNum", "lapDistance",
                       "totalDistance", "safetyCarDelta", "carPosition", "currentLapNum", "pitStatus",
                       "sector", "currentLapInvalid", "penalties", "gridPosition", "driverStatus",
                       "resultStatus"};
    ASSERT_TRUE(keysOf(lap2020["lapData"][21]) == fields2020);
    PASS();
}

TEST(Decoders_CarSetupFields) {
    auto setups2019 = decodeZeroPacket(kFormat2019, PacketType::CarSetups, 843);
    Keys fields2019 = {"frontWing", "rearWing", "onThrottle", "offThrottle", "frontCamber",
                       "rearCamber", "frontToe", "rearToe", "frontSuspension", "rearSuspension",
                       "frontAntiRollBar", "rearAntiRollBar", "frontSuspensionHeight",
                       "rearSuspensionHeight", "brakePressure", "brakeBias", "frontTyrePressure",
                       "rearTyrePressure", "ballast", "fuelLoad"};
    ASSERT_TRUE(keysOf(setups2019["carSetups"][0]) == fields2019);

    auto setups2020 = decodeZeroPacket(kFormat2020, PacketType::CarSetups, 1102);
    Keys fields2020 = {"frontWing", "rearWing", "onThrottle", "offThrottle", "frontCamber",
                       "rearCamber", "frontToe", "rearToe", "frontSuspension", "rearSuspension",
                       "frontAntiRollBar", "rearAntiRollBar", "frontSuspensionHeight",
                       "rearSuspensionHeight", "brakePressure", "brakeBias", "rearLeftTyrePressure",
                       "rearRightTyrePressure", "frontLeftTyrePressure", "frontRightTyrePressure",
                       "ballast", "fuelLoad"};
    ASSERT_TRUE(keysOf(setups2020["carSetups"][0]) == fields2020);
    PASS();
}

TEST(Decoders_CarTelemetryFields) {
    Keys fields = {"speed", "throttle", "steer", "brake", "clutch", "gear", "engineRPM", "drs",
                   "revLightsPercent", "brakesTemperature", "tyresSurfaceTemperature",
                   "tyresInnerTemperature", "engineTemperature", "tyresPressure", "surfaceType"};

    auto telemetry2019 = decodeZeroPacket(kFormat2019, PacketType::CarTelemetry, 1347);
    ASSERT_TRUE(keysOf(telemetry2019["carTelemetryData"][0]) == fields);

    auto telemetry2020 = decodeZeroPacket(kFormat2020, PacketType::CarTelemetry, 1307);
    ASSERT_TRUE(keysOf(telemetry2020["carTelemetryData"][0]) == fields);
    PASS();
}

TEST(Decoders_CarStatusFields) {
    auto status2019 = decodeZeroPacket(kFormat2019, PacketType::CarStatus, 1143);
    Keys fields2019 = {"tractionControl", "antiLockBrakes", "fuelMix", "frontBrakeBias",
                       "pitLimiterStatus", "fuelInTank", "fuelCapacity", "fuelRemainingLaps",
                       "maxRPM", "idleRPM", "maxGears", "drsAllowed", "tyresWear",
                       "actualTyreCompound", "tyreVisualCompound", "tyresDamage",
                       "frontLeftWingDamage", "frontRightWingDamage", "rearWingDamage",
                       "engineDamage", "gearBoxDamage", "vehicleFiaFlags", "ersStoreEnergy",
                       "ersDeployMode", "ersHarvestedThisLapMGUK", "ersHarvestedThisLapMGUH",
                       "ersDeployedThisLap"};
    ASSERT_TRUE(keysOf(status2019["carStatusData"][0]) == fields2019);

    auto status2020 = decodeZeroPacket(kFormat2020, PacketType::CarStatus, 1344);
    Keys fields2020 = {"tractionControl", "antiLockBrakes", "fuelMix", "frontBrakeBias",
                       "pitLimiterStatus", "fuelInTank", "fuelCapacity", "fuelRemainingLaps",
                       "maxRPM", "idleRPM", "maxGears", "drsAllowed", "drsActivationDistance",
                       "tyresWear", "actualTyreCompound", "visualTyreCompound", "tyresAgeLaps",
                       "tyresDamage", "frontLeftWingDamage", "frontRightWingDamage",
                       "rearWingDamage", "drsFault", "engineDamage", "gearBoxDamage",
                       "vehicleFiaFlags", "ersStoreEnergy", "ersDeployMode",
                       "ersHarvestedThisLapMGUK", "ersHarvestedThisLapMGUH", "ersDeployedThisLap"};
    ASSERT_TRUE(keysOf(status2020["carStatusData"][0]) == fields2020);
    PASS();
}

TEST(Decoders_2020OnlyRecordFields) {
    auto session = decodeZeroPacket(kFormat2020, PacketType::Session, 251);
    Keys forecast = {"sessionType", "timeOffset", "weather", "trackTemperature", "airTemperature"};
    ASSERT_TRUE(keysOf(session["weatherForecastSamples"][19]) == forecast);

    auto classification = decodeZeroPacket(kFormat2020, PacketType::FinalClassification, 839);
    Keys result = {"position", "numLaps", "gridPosition", "points", "numPitStops", "resultStatus",
                   "bestLapTime", "totalRaceTime", "penaltiesTime", "numPenalties", "numTyreStints",
                   "tyreStintsActual", "tyreStintsVisual"};
    ASSERT_TRUE(keysOf(classification["classificationData"][0]) == result);

    auto lobby = decodeZeroPacket(kFormat2020, PacketType::LobbyInfo, 1169);
    Keys player = {"aiControlled", "teamId", "nationality", "name", "readyStatus"};
    ASSERT_TRUE(keysOf(lobby["lobbyPlayers"][0]) == player);
    PASS();
}

// =============================================================================
// Array lengths
// =============================================================================

TEST(Decoders_CarArraysHaveProtocolLength) {
    auto lap2019 = decodeZeroPacket(kFormat2019, PacketType::LapData, 843);
    ASSERT_EQ(lap2019["lapData"].size(), 20u);

    auto lap2020 = decodeZeroPacket(kFormat2020, PacketType::LapData, 1190);
    ASSERT_EQ(lap2020["lapData"].size(), 22u);

    auto motion2019 = decodeZeroPacket(kFormat2019, PacketType::Motion, 1343);
    ASSERT_EQ(motion2019["carMotionData"].size(), 20u);
    ASSERT_EQ(motion2019["wheelSlip"].size(), 4u);

    auto session2020 = decodeZeroPacket(kFormat2020, PacketType::Session, 251);
    ASSERT_EQ(session2020["marshalZones"].size(), 21u);
    ASSERT_EQ(session2020["weatherForecastSamples"].size(), 20u);

    auto classification = decodeZeroPacket(kFormat2020, PacketType::FinalClassification, 839);
    ASSERT_EQ(classification["classificationData"].size(), 22u);
    ASSERT_EQ(classification["classificationData"][0]["tyreStintsVisual"].size(), 8u);
    PASS();
}

// =============================================================================
// Documented Offset Tests
//
// Bytes are placed by hand at the offsets of the published layouts rather
// than through encodeRecord, so a field out of order fails here.
// =============================================================================

namespace {

void placeU16(std::vector<uint8_t>& data, size_t at, uint16_t value) {
    data[at] = static_cast<uint8_t>(value & 0xFF);
    data[at + 1] = static_cast<uint8_t>(value >> 8);
}

void placeFloat(std::vector<uint8_t>& data, size_t at, float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (size_t i = 0; i < 4; i++) {
        data[at + i] = static_cast<uint8_t>(bits >> (8 * i));
    }
}

void placeText(std::vector<uint8_t>& data, size_t at, const char* text) {
    for (size_t i = 0; text[i] != '\0'; i++) {
        data[at + i] = static_cast<uint8_t>(text[i]);
    }
}

} // namespace

TEST(Offsets_CarStatus2019) {
    auto data = buildZeroPacket(makeHeader(kFormat2019, PacketType::CarStatus), 20 * 56);
    const size_t car = kHeaderSize2019 + 56;       // second car
    data[car + 2] = 3;                              // fuelMix
    placeFloat(data, car + 5, 42.5f);               // fuelInTank
    placeU16(data, car + 17, 12000);                // maxRPM
    data[car + 22] = 0xFF;                          // drsAllowed = -1
    data[car + 28] = 16;                            // tyreVisualCompound
    data[car + 38] = 0xFE;                          // vehicleFiaFlags = -2
    placeFloat(data, car + 39, 4000000.0f);         // ersStoreEnergy
    data[car + 43] = 2;                             // ersDeployMode
    placeFloat(data, car + 52, 1250.5f);            // ersDeployedThisLap

    auto body = std::get<f1_2019::CarStatusBody>(decodePacket(data).body);
    const auto& status = body.carStatusData[1];
    ASSERT_EQ(status.fuelMix, 3);
    ASSERT_EQ(status.fuelInTank, 42.5f);
    ASSERT_EQ(status.maxRPM, 12000);
    ASSERT_EQ(status.drsAllowed, -1);
    ASSERT_EQ(status.tyreVisualCompound, 16);
    ASSERT_EQ(status.vehicleFiaFlags, -2);
    ASSERT_EQ(status.ersStoreEnergy, 4000000.0f);
    ASSERT_EQ(status.ersDeployMode, 2);
    ASSERT_EQ(status.ersDeployedThisLap, 1250.5f);
    ASSERT_EQ(body.carStatusData[0].ersStoreEnergy, 0.0f);
    PASS();
}

TEST(Offsets_CarStatus2020) {
    auto data = buildZeroPacket(makeHeader(kFormat2020, PacketType::CarStatus), 22 * 60);
    const size_t car = kHeaderSize2020 + 60;
    placeU16(data, car + 23, 350);                  // drsActivationDistance
    data[car + 30] = 17;                            // visualTyreCompound
    data[car + 31] = 5;                             // tyresAgeLaps
    data[car + 39] = 1;                             // drsFault
    placeFloat(data, car + 43, 3500000.0f);         // ersStoreEnergy
    data[car + 47] = 1;                             // ersDeployMode
    placeFloat(data, car + 56, 900.25f);            // ersDeployedThisLap

    auto body = std::get<f1_2020::CarStatusBody>(decodePacket(data).body);
    const auto& status = body.carStatusData[1];
    ASSERT_EQ(status.drsActivationDistance, 350);
    ASSERT_EQ(status.visualTyreCompound, 17);
    ASSERT_EQ(status.tyresAgeLaps, 5);
    ASSERT_EQ(status.drsFault, 1);
    ASSERT_EQ(status.ersStoreEnergy, 3500000.0f);
    ASSERT_EQ(status.ersDeployMode, 1);
    ASSERT_EQ(status.ersDeployedThisLap, 900.25f);
    PASS();
}

TEST(Offsets_LapData2019) {
    auto data = buildZeroPacket(makeHeader(kFormat2019, PacketType::LapData), 20 * 41);
    const size_t car = kHeaderSize2019 + 41;
    placeFloat(data, car + 0, 91.25f);              // lastLapTime
    placeFloat(data, car + 8, 89.5f);               // bestLapTime
    placeFloat(data, car + 28, -1.5f);              // safetyCarDelta
    data[car + 32] = 4;                             // carPosition
    data[car + 37] = 5;                             // penalties
    data[car + 38] = 12;                            // gridPosition
    data[car + 40] = 3;                             // resultStatus

    auto body = std::get<f1_2019::LapDataBody>(decodePacket(data).body);
    const auto& lap = body.lapData[1];
    ASSERT_EQ(lap.lastLapTime, 91.25f);
    ASSERT_EQ(lap.bestLapTime, 89.5f);
    ASSERT_EQ(lap.safetyCarDelta, -1.5f);
    ASSERT_EQ(lap.carPosition, 4);
    ASSERT_EQ(lap.penalties, 5);
    ASSERT_EQ(lap.gridPosition, 12);
    ASSERT_EQ(lap.resultStatus, 3);
    PASS();
}

TEST(Offsets_LapData2020) {
    auto data = buildZeroPacket(makeHeader(kFormat2020, PacketType::LapData), 22 * 53);
    const size_t car = kHeaderSize2020 + 53;
    placeU16(data, car + 8, 28123);                 // sector1TimeInMS
    placeFloat(data, car + 12, 88.75f);             // bestLapTime
    data[car + 16] = 7;                             // bestLapNum
    placeU16(data, car + 21, 31999);                // bestLapSector3TimeInMS
    data[car + 31] = 9;                             // bestOverallSector3LapNum
    placeFloat(data, car + 32, 1234.5f);            // lapDistance
    data[car + 44] = 2;                             // carPosition
    data[car + 50] = 20;                            // gridPosition
    data[car + 52] = 6;                             // resultStatus

    auto body = std::get<f1_2020::LapDataBody>(decodePacket(data).body);
    const auto& lap = body.lapData[1];
    ASSERT_EQ(lap.sector1TimeInMS, 28123);
    ASSERT_EQ(lap.bestLapTime, 88.75f);
    ASSERT_EQ(lap.bestLapNum, 7);
    ASSERT_EQ(lap.bestLapSector3TimeInMS, 31999);
    ASSERT_EQ(lap.bestOverallSector3LapNum, 9);
    ASSERT_EQ(lap.lapDistance, 1234.5f);
    ASSERT_EQ(lap.carPosition, 2);
    ASSERT_EQ(lap.gridPosition, 20);
    ASSERT_EQ(lap.resultStatus, 6);
    PASS();
}

TEST(Offsets_Event2019) {
    auto data = buildZeroPacket(makeHeader(kFormat2019, PacketType::Event), 9);
    placeText(data, kHeaderSize2019, "FTLP");
    data[kHeaderSize2019 + 4] = 11;                 // vehicleIdx
    placeFloat(data, kHeaderSize2019 + 5, 78.5f);   // lapTime

    auto body = std::get<f1_2019::EventBody>(decodePacket(data).body);
    ASSERT_STREQ(body.eventStringCode.text, "FTLP");
    const auto& fastest = std::get<FastestLapData>(body.eventDetails.value);
    ASSERT_EQ(fastest.vehicleIdx, 11);
    ASSERT_EQ(fastest.lapTime, 78.5f);
    PASS();
}

TEST(Offsets_Event2020) {
    auto data = buildZeroPacket(makeHeader(kFormat2020, PacketType::Event), 11);
    placeText(data, kHeaderSize2020, "SPTP");
    data[kHeaderSize2020 + 4] = 19;                 // vehicleIdx
    placeFloat(data, kHeaderSize2020 + 5, 321.75f); // speed

    auto packet = decodePacket(data);
    ASSERT_EQ(packet.bytesConsumed, data.size());
    auto body = std::get<f1_2020::EventBody>(packet.body);
    ASSERT_STREQ(body.eventStringCode.text, "SPTP");
    const auto& trap = std::get<f1_2020::SpeedTrapData>(body.eventDetails.value);
    ASSERT_EQ(trap.vehicleIdx, 19);
    ASSERT_EQ(trap.speed, 321.75f);
    PASS();
}
