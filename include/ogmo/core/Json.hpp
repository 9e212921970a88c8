#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/vec2.hpp>
#include <nlohmann/json.hpp>

#include "ogmo/core/Error.hpp"

namespace ogmo::core {

// Objects keep their key order while being walked and re-emitted.
using Json = nlohmann::ordered_json;

using Vec2i = glm::ivec2;
using Vec2f = glm::dvec2;

/**
 * @brief A JSON number that remembers whether it was written as an integer
 * literal, so `5` and `5.0` are written back the way they were read.
 *
 * Reads as a double everywhere else. Comparing two Scalars compares the form
 * too; comparing with a plain double compares the number only.
 */
class Scalar {
public:
    constexpr Scalar() = default;
    constexpr Scalar(int value) : m_value(value), m_integer(true) {}
    constexpr Scalar(double value) : m_value(value), m_integer(false) {}

    static constexpr Scalar Integer(std::int64_t value) {
        Scalar scalar;
        scalar.m_value = static_cast<double>(value);
        return scalar;
    }

    constexpr double Value() const noexcept { return m_value; }
    constexpr bool IsInteger() const noexcept { return m_integer; }
    constexpr operator double() const noexcept { return m_value; }

    [[nodiscard]] bool operator==(const Scalar&) const = default;
    [[nodiscard]] friend constexpr bool operator==(const Scalar& lhs, double rhs) noexcept {
        return lhs.m_value == rhs;
    }

private:
    double m_value = 0.0;
    bool m_integer = true;
};

// An {"x", "y"} pair of Scalars.
struct Point {
    Scalar x;
    Scalar y;

    Vec2f ToVec2f() const { return Vec2f(x.Value(), y.Value()); }

    [[nodiscard]] bool operator==(const Point&) const = default;
};

std::string JoinPath(std::string_view parent, std::string_view key);
std::string JoinPath(std::string_view parent, std::size_t index);

// Short name of a node's JSON type for error messages ("integer", "float", "string", ...).
std::string DescribeJsonType(const Json& node);

/**
 * @brief Read-only cursor over a JSON node that knows its field path.
 *
 * Every accessor throws SchemaError on failure: MissingField for absent
 * required keys, TypeMismatch for wrong JSON types and NumericRange for
 * integers that do not fit the model's type.
 */
class JsonReader {
public:
    JsonReader(const Json& node, std::string path);

    const Json& Node() const noexcept { return *m_node; }
    const std::string& Path() const noexcept { return m_path; }

    bool Has(std::string_view key) const;

    JsonReader Child(std::string_view key) const;
    std::optional<JsonReader> OptionalChild(std::string_view key) const;
    JsonReader Element(std::size_t index) const;
    std::size_t Size() const;

    const JsonReader& ExpectObject() const;
    const JsonReader& ExpectArray() const;

    // Conversions of this node.
    std::string AsString() const;
    bool AsBool() const;
    int AsInt() const;
    std::int64_t AsInt64() const;
    Scalar AsNumber() const;
    Vec2i AsVec2i() const;
    Point AsPoint() const;
    std::vector<std::string> AsStringArray() const;

    // Required members.
    std::string String(std::string_view key) const { return Child(key).AsString(); }
    bool Bool(std::string_view key) const { return Child(key).AsBool(); }
    int Int(std::string_view key) const { return Child(key).AsInt(); }
    Scalar Number(std::string_view key) const { return Child(key).AsNumber(); }
    Vec2i Vec2Int(std::string_view key) const { return Child(key).AsVec2i(); }
    Point Vec2Number(std::string_view key) const { return Child(key).AsPoint(); }
    std::vector<std::string> StringArray(std::string_view key) const { return Child(key).AsStringArray(); }

    // Optional members: absent or null keys yield std::nullopt.
    std::optional<std::string> OptionalString(std::string_view key) const;
    std::optional<bool> OptionalBool(std::string_view key) const;
    std::optional<int> OptionalInt(std::string_view key) const;
    std::optional<Scalar> OptionalNumber(std::string_view key) const;

    template <typename Fn>
    auto Map(Fn&& fn) const -> std::vector<decltype(fn(std::declval<const JsonReader&>()))> {
        ExpectArray();
        std::vector<decltype(fn(std::declval<const JsonReader&>()))> out;
        out.reserve(Size());
        for (std::size_t i = 0; i < Size(); ++i) {
            out.push_back(fn(Element(i)));
        }
        return out;
    }

private:
    const Json* m_node;
    std::string m_path;
};

// Writes an integer literal or a float literal following the Scalar's form.
// Non-finite values throw NumericRange.
Json EncodeNumber(Scalar value, std::string_view path);
Json EncodeVec2(const Vec2i& value);
Json EncodeVec2(const Point& value, std::string_view path);

// Parses text, mapping parser failures to MalformedInput.
Json ParseJson(std::string_view text);

} // namespace ogmo::core
