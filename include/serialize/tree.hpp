#pragma once

#include "packets/dispatcher.hpp"
#include "packets/types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace pitwall::serialize {

// Object keys keep the order fields were added in, which is protocol order
using Tree = nlohmann::ordered_json;

/**
 * Widen an f32 to the double nearest its shortest decimal form, so that
 * 78.456f serializes as 78.456 rather than 78.45600128173828.
 */
double widenFloat(float value);

/**
 * Structure-to-tree visitor
 *
 * Driven by a record's fields() list; each call adds one member to the
 * target object. Optional fields that are empty and unions without an
 * active layout are left out entirely.
 */
class TreeBuilder {
public:
    explicit TreeBuilder(Tree& object)
        : m_object(object) {}

    template <typename T>
    void operator()(const char* name, const T& value) {
        m_object[name] = node(value);
    }

    template <typename T>
    void operator()(const char* name, const std::optional<T>& value) {
        if (value) {
            m_object[name] = node(*value);
        }
    }

    template <size_t Size, typename... Alternatives>
    void operator()(const char* name, const packets::PaddedUnion<Size, Alternatives...>& field) {
        if (!std::holds_alternative<std::monostate>(field.value)) {
            m_object[name] = node(field);
        }
    }

    // Object holding every field of a record
    template <typename T>
    static Tree record(const T& value) {
        Tree object = Tree::object();
        TreeBuilder builder(object);
        T::fields(value, builder);
        return object;
    }

private:
    static Tree node(uint8_t value) { return static_cast<uint64_t>(value); }
    static Tree node(uint16_t value) { return static_cast<uint64_t>(value); }
    static Tree node(uint32_t value) { return static_cast<uint64_t>(value); }
    static Tree node(uint64_t value) { return value; }
    static Tree node(int8_t value) { return static_cast<int64_t>(value); }
    static Tree node(int16_t value) { return static_cast<int64_t>(value); }
    static Tree node(int32_t value) { return static_cast<int64_t>(value); }
    static Tree node(int64_t value) { return value; }
    static Tree node(float value) { return widenFloat(value); }
    static Tree node(double value) { return value; }

    template <size_t N>
    static Tree node(const packets::FixedString<N>& value) {
        return value.text;
    }

    template <typename T, size_t N>
    static Tree node(const std::array<T, N>& values) {
        Tree array = Tree::array();
        for (const auto& element : values) {
            array.push_back(node(element));
        }
        return array;
    }

    template <size_t Size, typename... Alternatives>
    static Tree node(const packets::PaddedUnion<Size, Alternatives...>& field) {
        return std::visit([](const auto& alternative) -> Tree {
            if constexpr (std::is_same_v<std::decay_t<decltype(alternative)>, std::monostate>) {
                return nullptr;
            }
            else {
                return record(alternative);
            }
        }, field.value);
    }

    template <typename T>
    static std::enable_if_t<packets::IsRecord<T>::value, Tree> node(const T& value) {
        return record(value);
    }

    Tree& m_object;
};

// Header fields as an object
Tree toTree(const packets::PacketHeader& header);

// {"header": {...}, <body fields in protocol order>}
Tree toTree(const packets::DecodedPacket& packet);

// Compact single-line JSON; invalid UTF-8 in text fields is replaced
std::string renderJson(const Tree& tree);

} // namespace pitwall::serialize
