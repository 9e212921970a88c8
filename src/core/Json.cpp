#include "ogmo/core/Json.hpp"

#include <cmath>
#include <limits>

#include <fmt/format.h>

namespace ogmo::core {

std::string JoinPath(std::string_view parent, std::string_view key) {
    if (parent.empty()) {
        return std::string(key);
    }
    return fmt::format("{}.{}", parent, key);
}

std::string JoinPath(std::string_view parent, std::size_t index) {
    return fmt::format("{}[{}]", parent, index);
}

std::string DescribeJsonType(const Json& node) {
    switch (node.type()) {
        case Json::value_t::null:            return "null";
        case Json::value_t::object:          return "object";
        case Json::value_t::array:           return "array";
        case Json::value_t::string:          return "string";
        case Json::value_t::boolean:         return "boolean";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned: return "integer";
        case Json::value_t::number_float:    return "float";
        case Json::value_t::binary:          return "binary";
        case Json::value_t::discarded:       return "discarded";
    }
    return "unknown";
}

JsonReader::JsonReader(const Json& node, std::string path)
    : m_node(&node), m_path(std::move(path)) {}

bool JsonReader::Has(std::string_view key) const {
    return m_node->is_object() && m_node->contains(std::string(key));
}

JsonReader JsonReader::Child(std::string_view key) const {
    ExpectObject();
    auto it = m_node->find(std::string(key));
    if (it == m_node->end()) {
        throw SchemaError::MissingField(JoinPath(m_path, key));
    }
    return JsonReader(*it, JoinPath(m_path, key));
}

std::optional<JsonReader> JsonReader::OptionalChild(std::string_view key) const {
    ExpectObject();
    auto it = m_node->find(std::string(key));
    if (it == m_node->end() || it->is_null()) {
        return std::nullopt;
    }
    return JsonReader(*it, JoinPath(m_path, key));
}

JsonReader JsonReader::Element(std::size_t index) const {
    ExpectArray();
    if (index >= m_node->size()) {
        throw SchemaError::MissingField(JoinPath(m_path, index));
    }
    return JsonReader((*m_node)[index], JoinPath(m_path, index));
}

std::size_t JsonReader::Size() const {
    return m_node->size();
}

const JsonReader& JsonReader::ExpectObject() const {
    if (!m_node->is_object()) {
        throw SchemaError::TypeMismatch(m_path, "object", DescribeJsonType(*m_node));
    }
    return *this;
}

const JsonReader& JsonReader::ExpectArray() const {
    if (!m_node->is_array()) {
        throw SchemaError::TypeMismatch(m_path, "array", DescribeJsonType(*m_node));
    }
    return *this;
}

std::string JsonReader::AsString() const {
    if (!m_node->is_string()) {
        throw SchemaError::TypeMismatch(m_path, "string", DescribeJsonType(*m_node));
    }
    return m_node->get<std::string>();
}

bool JsonReader::AsBool() const {
    if (!m_node->is_boolean()) {
        throw SchemaError::TypeMismatch(m_path, "boolean", DescribeJsonType(*m_node));
    }
    return m_node->get<bool>();
}

std::int64_t JsonReader::AsInt64() const {
    if (m_node->is_number_unsigned()) {
        const auto value = m_node->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw SchemaError(ErrorKind::NumericRange, m_path,
                              fmt::format("{} does not fit a 64-bit integer", value));
        }
        return static_cast<std::int64_t>(value);
    }
    if (m_node->is_number_integer()) {
        return m_node->get<std::int64_t>();
    }
    throw SchemaError::TypeMismatch(m_path, "integer", DescribeJsonType(*m_node));
}

int JsonReader::AsInt() const {
    const std::int64_t value = AsInt64();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw SchemaError(ErrorKind::NumericRange, m_path,
                          fmt::format("{} does not fit a 32-bit integer", value));
    }
    return static_cast<int>(value);
}

Scalar JsonReader::AsNumber() const {
    constexpr std::int64_t kMaxExactInteger = std::int64_t{1} << 53;
    if (m_node->is_number_integer()) {
        const std::int64_t value = AsInt64();
        if (value > kMaxExactInteger || value < -kMaxExactInteger) {
            throw SchemaError(ErrorKind::NumericRange, m_path,
                              fmt::format("{} is not exactly representable as a double", value));
        }
        return Scalar::Integer(value);
    }
    if (!m_node->is_number()) {
        throw SchemaError::TypeMismatch(m_path, "number", DescribeJsonType(*m_node));
    }
    return Scalar(m_node->get<double>());
}

Vec2i JsonReader::AsVec2i() const {
    ExpectObject();
    return Vec2i(Int("x"), Int("y"));
}

Point JsonReader::AsPoint() const {
    ExpectObject();
    return Point{Number("x"), Number("y")};
}

std::vector<std::string> JsonReader::AsStringArray() const {
    return Map([](const JsonReader& element) { return element.AsString(); });
}

std::optional<std::string> JsonReader::OptionalString(std::string_view key) const {
    if (auto child = OptionalChild(key)) {
        return child->AsString();
    }
    return std::nullopt;
}

std::optional<bool> JsonReader::OptionalBool(std::string_view key) const {
    if (auto child = OptionalChild(key)) {
        return child->AsBool();
    }
    return std::nullopt;
}

std::optional<int> JsonReader::OptionalInt(std::string_view key) const {
    if (auto child = OptionalChild(key)) {
        return child->AsInt();
    }
    return std::nullopt;
}

std::optional<Scalar> JsonReader::OptionalNumber(std::string_view key) const {
    if (auto child = OptionalChild(key)) {
        return child->AsNumber();
    }
    return std::nullopt;
}

Json EncodeNumber(Scalar value, std::string_view path) {
    if (!std::isfinite(value.Value())) {
        throw SchemaError(ErrorKind::NumericRange, std::string(path),
                          "non-finite numbers cannot be written as JSON");
    }
    if (value.IsInteger()) {
        return Json(static_cast<std::int64_t>(value.Value()));
    }
    return Json(value.Value());
}

Json EncodeVec2(const Vec2i& value) {
    return Json{{"x", value.x}, {"y", value.y}};
}

Json EncodeVec2(const Point& value, std::string_view path) {
    return Json{{"x", EncodeNumber(value.x, JoinPath(path, "x"))},
                {"y", EncodeNumber(value.y, JoinPath(path, "y"))}};
}

Json ParseJson(std::string_view text) {
    try {
        return Json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaError(ErrorKind::MalformedInput, {}, e.what());
    }
}

} // namespace ogmo::core
