#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace pitwall::packets {

// =============================================================================
// Packet identifiers (header field packetId)
// =============================================================================
enum class PacketType : uint8_t {
    Motion              = 0,
    Session             = 1,
    LapData             = 2,
    Event               = 3,
    Participants        = 4,
    CarSetups           = 5,
    CarTelemetry        = 6,
    CarStatus           = 7,
    FinalClassification = 8,
    LobbyInfo           = 9,
};

constexpr uint8_t kPacketTypeCount = 10;

// =============================================================================
// Protocol constants
// =============================================================================
constexpr uint16_t kFormat2019 = 2019;
constexpr uint16_t kFormat2020 = 2020;

constexpr size_t kHeaderSize2019 = 23;
constexpr size_t kHeaderSize2020 = 24;
constexpr size_t kMinHeaderSize = kHeaderSize2019;

constexpr size_t kNumCars2019 = 20;
constexpr size_t kNumCars2020 = 22;

constexpr size_t kMaxMarshalZones = 21;
constexpr size_t kMaxWeatherForecastSamples = 20;
constexpr size_t kNameLength = 48;
constexpr size_t kEventCodeLength = 4;
constexpr size_t kMaxTyreStints = 8;

// =============================================================================
// Field value types
// =============================================================================

/**
 * Fixed-width character field. Occupies exactly N bytes on the wire; the
 * decoded text stops at the first NUL.
 */
template <size_t N>
struct FixedString {
    static constexpr size_t kLength = N;
    std::string text;
};

/**
 * Union of record layouts sharing Size bytes on the wire. The active
 * alternative is chosen by the decoder from a preceding discriminator;
 * bytes the alternative does not use are protocol padding.
 */
template <size_t Size, typename... Alternatives>
struct PaddedUnion {
    static constexpr size_t kSize = Size;
    std::variant<std::monostate, Alternatives...> value;
};

/**
 * Result of a decode step: the value and the exact number of bytes it used.
 */
template <typename T>
struct Decoded {
    T value;
    size_t bytesConsumed;
};

// A record is any struct with a declared wire size and a static
// fields(self, visitor) list.
template <typename T, typename = void>
struct IsRecord : std::false_type {};

template <typename T>
struct IsRecord<T, std::void_t<decltype(T::kWireSize)>> : std::true_type {};

// =============================================================================
// Packet Header
// =============================================================================

/**
 * Common header present at offset 0 of every packet.
 *
 * secondaryPlayerCarIndex exists from format 2020 onwards; it is empty for
 * 2019 packets and is then neither read nor serialized.
 */
struct PacketHeader {
    uint16_t packetFormat{};
    uint8_t gameMajorVersion{};
    uint8_t gameMinorVersion{};
    uint8_t packetVersion{};
    uint8_t packetId{};
    uint64_t sessionUID{};
    float sessionTime{};
    uint32_t frameIdentifier{};
    uint8_t playerCarIndex{};
    std::optional<uint8_t> secondaryPlayerCarIndex;

    PacketType packetType() const { return static_cast<PacketType>(packetId); }

    size_t wireSize() const {
        return secondaryPlayerCarIndex ? kHeaderSize2020 : kHeaderSize2019;
    }

    template <typename Self, typename Visitor>
    static void fields(Self& self, Visitor& v) {
        v("packetFormat", self.packetFormat);
        v("gameMajorVersion", self.gameMajorVersion);
        v("gameMinorVersion", self.gameMinorVersion);
        v("packetVersion", self.packetVersion);
        v("packetId", self.packetId);
        v("sessionUID", self.sessionUID);
        v("sessionTime", self.sessionTime);
        v("frameIdentifier", self.frameIdentifier);
        v("playerCarIndex", self.playerCarIndex);
        v("secondaryPlayerCarIndex", self.secondaryPlayerCarIndex);
    }
};

} // namespace pitwall::packets
