#include "packets/f1_2019.hpp"
#include "packets/fields.hpp"

namespace pitwall::packets::f1_2019 {

Decoded<MotionBody> decodeMotion(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<MotionBody>(data, size, offset);
}

Decoded<SessionBody> decodeSession(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<SessionBody>(data, size, offset);
}

Decoded<LapDataBody> decodeLapData(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<LapDataBody>(data, size, offset);
}

Decoded<EventBody> decodeEvent(const uint8_t* data, size_t size, size_t offset) {
    if (offset > size || size - offset < EventBody::kWireSize) {
        throw utils::TruncatedBufferError(offset, EventBody::kWireSize, size);
    }

    utils::BufferReader reader(data, size, offset);
    FieldReader fields(reader);

    // The code decides which layout the details union holds
    EventBody body;
    fields("eventStringCode", body.eventStringCode);
    selectEventDetails(body.eventStringCode.text, body.eventDetails);
    fields("eventDetails", body.eventDetails);

    return {std::move(body), reader.position() - offset};
}

Decoded<ParticipantsBody> decodeParticipants(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<ParticipantsBody>(data, size, offset);
}

Decoded<CarSetupsBody> decodeCarSetups(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<CarSetupsBody>(data, size, offset);
}

Decoded<CarTelemetryBody> decodeCarTelemetry(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<CarTelemetryBody>(data, size, offset);
}

Decoded<CarStatusBody> decodeCarStatus(const uint8_t* data, size_t size, size_t offset) {
    return decodeRecord<CarStatusBody>(data, size, offset);
}

void selectEventDetails(const std::string& eventCode, EventDetails& details) {
    if (eventCode == "FTLP") {
        details.value.emplace<FastestLapData>();
    }
    else if (eventCode == "RTMT") {
        details.value.emplace<RetirementData>();
    }
    else if (eventCode == "TMPT") {
        details.value.emplace<TeamMateInPitsData>();
    }
    else if (eventCode == "RCWN") {
        details.value.emplace<RaceWinnerData>();
    }
    else {
        // SSTA, SEND, DRSE, DRSD, CHQF and unknown codes
        details.value.emplace<std::monostate>();
    }
}

} // namespace pitwall::packets::f1_2019
