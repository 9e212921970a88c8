#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"

namespace ogmo::values {

enum class ValueKind {
    Boolean,
    Color,
    Enum,
    Integer,
    Float,
    String,
    ArrayString,
    ArrayEnum
};

const char* ValueKindName(ValueKind kind);

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    [[nodiscard]] bool operator==(const Color&) const = default;

    // "#rrggbbaa", lower case.
    [[nodiscard]] std::string ToHex() const;
    // Accepts "#rrggbb" (opaque) and "#rrggbbaa".
    static std::optional<Color> FromHex(std::string_view text);
};

struct EnumValue {
    std::string choice;
    [[nodiscard]] bool operator==(const EnumValue&) const = default;
};

struct EnumArray {
    std::vector<std::string> choices;
    [[nodiscard]] bool operator==(const EnumArray&) const = default;
};

/**
 * @brief A custom field value attached to a level, entity, decal or layer.
 *
 * Alternatives are stored in ValueKind order.
 */
class Value {
public:
    using Storage = std::variant<bool,
                                 Color,
                                 EnumValue,
                                 std::int64_t,
                                 core::Scalar,
                                 std::string,
                                 std::vector<std::string>,
                                 EnumArray>;

    Value() = default;
    explicit Value(Storage storage) : m_storage(std::move(storage)) {}

    static Value Boolean(bool value) { return Value(Storage(std::in_place_index<0>, value)); }
    static Value FromColor(Color value) { return Value(Storage(std::in_place_index<1>, value)); }
    static Value Enum(std::string choice) { return Value(Storage(std::in_place_index<2>, EnumValue{std::move(choice)})); }
    static Value Integer(std::int64_t value) { return Value(Storage(std::in_place_index<3>, value)); }
    // A Float read from an integer literal keeps that form when written.
    static Value Float(core::Scalar value) { return Value(Storage(std::in_place_index<4>, value)); }
    static Value String(std::string value) { return Value(Storage(std::in_place_index<5>, std::move(value))); }
    static Value ArrayString(std::vector<std::string> value) { return Value(Storage(std::in_place_index<6>, std::move(value))); }
    static Value ArrayEnum(std::vector<std::string> value) { return Value(Storage(std::in_place_index<7>, EnumArray{std::move(value)})); }

    ValueKind Kind() const noexcept { return static_cast<ValueKind>(m_storage.index()); }
    const Storage& Data() const noexcept { return m_storage; }

    std::optional<bool> AsBoolean() const;
    std::optional<Color> AsColor() const;
    std::optional<std::string> AsEnum() const;
    std::optional<std::int64_t> AsInteger() const;
    std::optional<double> AsFloat() const;
    std::optional<std::string> AsString() const;
    std::optional<std::vector<std::string>> AsArrayString() const;
    std::optional<std::vector<std::string>> AsArrayEnum() const;

    // Returns a copy when the kind matches, UnpackMismatch otherwise.
    core::Result<Value> UnpackAs(ValueKind expected) const;

    [[nodiscard]] bool operator==(const Value&) const = default;

private:
    Storage m_storage{std::in_place_index<0>, false};
};

struct ValueEntry {
    std::string name;
    Value value;
    [[nodiscard]] bool operator==(const ValueEntry&) const = default;
};

/**
 * @brief Named values in document order. Serialized as a JSON object.
 */
class ValueMap {
public:
    using Entries = std::vector<ValueEntry>;

    ValueMap() = default;
    explicit ValueMap(Entries entries) : m_entries(std::move(entries)) {}

    const Value* Find(std::string_view name) const;
    Value* Find(std::string_view name);

    // Replaces an existing entry in place or appends a new one.
    void Set(std::string name, Value value);

    bool Empty() const noexcept { return m_entries.empty(); }
    std::size_t Size() const noexcept { return m_entries.size(); }

    Entries::const_iterator begin() const noexcept { return m_entries.begin(); }
    Entries::const_iterator end() const noexcept { return m_entries.end(); }
    Entries::iterator begin() noexcept { return m_entries.begin(); }
    Entries::iterator end() noexcept { return m_entries.end(); }

    [[nodiscard]] bool operator==(const ValueMap&) const = default;

private:
    Entries m_entries;
};

// Picks the alternative from the JSON shape alone: bool, integer literal,
// float literal, string, or array of strings.
Value DecodeValue(const core::JsonReader& reader);

// Picks the alternative from an editor type name ("Color", "Integer", ...)
// and checks the JSON shape against it.
Value DecodeTypedValue(std::string_view typeName, const core::JsonReader& reader);

ValueMap DecodeValueMap(const core::JsonReader& reader);

core::Json EncodeValue(const Value& value, std::string_view path);
core::Json EncodeValueMap(const ValueMap& values, std::string_view path);

} // namespace ogmo::values
