#pragma once

#include "packets/types.hpp"
#include "utils/buffer.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pitwall::packets {

/**
 * Field visitor that fills a record from a BufferReader, in the order the
 * record's fields() list declares.
 *
 * Nested records are checked against their declared wire size; a mismatch
 * means the field list itself is wrong and is reported as std::logic_error.
 */
class FieldReader {
public:
    explicit FieldReader(utils::BufferReader& reader)
        : m_reader(reader) {}

    template <typename T>
    void operator()(const char* /*name*/, T& value) {
        read(value);
    }

private:
    void read(uint8_t& value) { value = m_reader.readU8(); }
    void read(int8_t& value) { value = m_reader.readI8(); }
    void read(uint16_t& value) { value = m_reader.readU16(); }
    void read(int16_t& value) { value = m_reader.readI16(); }
    void read(uint32_t& value) { value = m_reader.readU32(); }
    void read(int32_t& value) { value = m_reader.readI32(); }
    void read(uint64_t& value) { value = m_reader.readU64(); }
    void read(int64_t& value) { value = m_reader.readI64(); }
    void read(float& value) { value = m_reader.readFloat(); }
    void read(double& value) { value = m_reader.readDouble(); }

    template <size_t N>
    void read(FixedString<N>& value) {
        value.text = m_reader.readString(N);
    }

    template <typename T, size_t N>
    void read(std::array<T, N>& values) {
        for (auto& element : values) {
            read(element);
        }
    }

    // Optional fields are read only when the header decoder engaged them
    template <typename T>
    void read(std::optional<T>& value) {
        if (value) {
            read(*value);
        }
    }

    template <size_t Size, typename... Alternatives>
    void read(PaddedUnion<Size, Alternatives...>& field) {
        size_t start = m_reader.position();
        std::visit([this](auto& alternative) { readAlternative(alternative); }, field.value);
        size_t used = m_reader.position() - start;
        if (used > Size) {
            throw std::logic_error("Union alternative larger than its union");
        }
        m_reader.skip(Size - used);
    }

    template <typename T>
    std::enable_if_t<IsRecord<T>::value> read(T& record) {
        size_t start = m_reader.position();
        T::fields(record, *this);
        if (m_reader.position() - start != T::kWireSize) {
            throw std::logic_error("Record consumed " + std::to_string(m_reader.position() - start) +
                                   " bytes, declared " + std::to_string(T::kWireSize));
        }
    }

    void readAlternative(std::monostate&) {}

    template <typename T>
    void readAlternative(T& record) {
        read(record);
    }

    utils::BufferReader& m_reader;
};

/**
 * Field visitor that encodes a record into a BufferWriter. Mirror image of
 * FieldReader; used to build datagrams for tests and replay tooling.
 */
class FieldWriter {
public:
    explicit FieldWriter(utils::BufferWriter& writer)
        : m_writer(writer) {}

    template <typename T>
    void operator()(const char* /*name*/, const T& value) {
        write(value);
    }

private:
    void write(uint8_t value) { m_writer.writeU8(value); }
    void write(int8_t value) { m_writer.writeI8(value); }
    void write(uint16_t value) { m_writer.writeU16(value); }
    void write(int16_t value) { m_writer.writeI16(value); }
    void write(uint32_t value) { m_writer.writeU32(value); }
    void write(int32_t value) { m_writer.writeI32(value); }
    void write(uint64_t value) { m_writer.writeU64(value); }
    void write(int64_t value) { m_writer.writeI64(value); }
    void write(float value) { m_writer.writeFloat(value); }
    void write(double value) { m_writer.writeDouble(value); }

    template <size_t N>
    void write(const FixedString<N>& value) {
        m_writer.writeString(value.text, N);
    }

    template <typename T, size_t N>
    void write(const std::array<T, N>& values) {
        for (const auto& element : values) {
            write(element);
        }
    }

    template <typename T>
    void write(const std::optional<T>& value) {
        if (value) {
            write(*value);
        }
    }

    template <size_t Size, typename... Alternatives>
    void write(const PaddedUnion<Size, Alternatives...>& field) {
        size_t start = m_writer.size();
        std::visit([this](const auto& alternative) { writeAlternative(alternative); }, field.value);
        m_writer.pad(Size - (m_writer.size() - start));
    }

    template <typename T>
    std::enable_if_t<IsRecord<T>::value> write(const T& record) {
        T::fields(record, *this);
    }

    void writeAlternative(const std::monostate&) {}

    template <typename T>
    void writeAlternative(const T& record) {
        write(record);
    }

    utils::BufferWriter& m_writer;
};

/**
 * Decode one record of type T starting at offset.
 *
 * @throws utils::TruncatedBufferError if fewer than T::kWireSize bytes remain
 */
template <typename T>
Decoded<T> decodeRecord(const uint8_t* data, size_t size, size_t offset) {
    if (offset > size || size - offset < T::kWireSize) {
        throw utils::TruncatedBufferError(offset, T::kWireSize, size);
    }

    utils::BufferReader reader(data, size, offset);
    FieldReader fields(reader);

    T record{};
    T::fields(record, fields);

    size_t consumed = reader.position() - offset;
    if (consumed != T::kWireSize) {
        throw std::logic_error("Record consumed " + std::to_string(consumed) +
                               " bytes, declared " + std::to_string(T::kWireSize));
    }
    return {std::move(record), consumed};
}

// Append the wire encoding of a record to writer
template <typename T>
void encodeRecord(const T& record, utils::BufferWriter& writer) {
    FieldWriter fields(writer);
    T::fields(record, fields);
}

} // namespace pitwall::packets
