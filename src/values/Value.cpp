#include "ogmo/values/Value.hpp"

#include <charconv>

#include <fmt/format.h>

namespace ogmo::values {

namespace {

template <std::size_t Index, typename Storage>
auto GetIf(const Storage& storage) -> std::optional<std::variant_alternative_t<Index, Storage>> {
    if (storage.index() != Index) {
        return std::nullopt;
    }
    return std::get<Index>(storage);
}

bool ParseHexByte(std::string_view text, std::uint8_t& out) {
    unsigned value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = static_cast<std::uint8_t>(value);
    return true;
}

Value DecodeColor(const core::JsonReader& reader) {
    const std::string text = reader.AsString();
    auto color = Color::FromHex(text);
    if (!color) {
        throw core::SchemaError::TypeMismatch(reader.Path(), "hex color", fmt::format("'{}'", text));
    }
    return Value::FromColor(*color);
}

} // namespace

const char* ValueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Boolean:     return "Boolean";
        case ValueKind::Color:       return "Color";
        case ValueKind::Enum:        return "Enum";
        case ValueKind::Integer:     return "Integer";
        case ValueKind::Float:       return "Float";
        case ValueKind::String:      return "String";
        case ValueKind::ArrayString: return "ArrayString";
        case ValueKind::ArrayEnum:   return "ArrayEnum";
    }
    return "Unknown";
}

std::string Color::ToHex() const {
    return fmt::format("#{:02x}{:02x}{:02x}{:02x}", r, g, b, a);
}

std::optional<Color> Color::FromHex(std::string_view text) {
    if (text.empty() || text.front() != '#') {
        return std::nullopt;
    }
    text.remove_prefix(1);
    if (text.size() != 6 && text.size() != 8) {
        return std::nullopt;
    }
    Color color;
    if (!ParseHexByte(text.substr(0, 2), color.r) ||
        !ParseHexByte(text.substr(2, 2), color.g) ||
        !ParseHexByte(text.substr(4, 2), color.b)) {
        return std::nullopt;
    }
    if (text.size() == 8 && !ParseHexByte(text.substr(6, 2), color.a)) {
        return std::nullopt;
    }
    return color;
}

std::optional<bool> Value::AsBoolean() const { return GetIf<0>(m_storage); }
std::optional<Color> Value::AsColor() const { return GetIf<1>(m_storage); }
std::optional<std::int64_t> Value::AsInteger() const { return GetIf<3>(m_storage); }
std::optional<double> Value::AsFloat() const {
    if (auto value = GetIf<4>(m_storage)) {
        return value->Value();
    }
    return std::nullopt;
}
std::optional<std::string> Value::AsString() const { return GetIf<5>(m_storage); }
std::optional<std::vector<std::string>> Value::AsArrayString() const { return GetIf<6>(m_storage); }

std::optional<std::string> Value::AsEnum() const {
    if (auto value = GetIf<2>(m_storage)) {
        return value->choice;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> Value::AsArrayEnum() const {
    if (auto value = GetIf<7>(m_storage)) {
        return value->choices;
    }
    return std::nullopt;
}

core::Result<Value> Value::UnpackAs(ValueKind expected) const {
    if (Kind() != expected) {
        return core::SchemaError::UnpackMismatch(ValueKindName(expected), ValueKindName(Kind()));
    }
    return *this;
}

const Value* ValueMap::Find(std::string_view name) const {
    for (const auto& entry : m_entries) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

Value* ValueMap::Find(std::string_view name) {
    for (auto& entry : m_entries) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

void ValueMap::Set(std::string name, Value value) {
    if (Value* existing = Find(name)) {
        *existing = std::move(value);
        return;
    }
    m_entries.push_back(ValueEntry{std::move(name), std::move(value)});
}

Value DecodeValue(const core::JsonReader& reader) {
    const core::Json& node = reader.Node();
    if (node.is_boolean()) {
        return Value::Boolean(node.get<bool>());
    }
    if (node.is_number_integer() || node.is_number_unsigned()) {
        return Value::Integer(reader.AsInt64());
    }
    if (node.is_number_float()) {
        return Value::Float(node.get<double>());
    }
    if (node.is_string()) {
        return Value::String(node.get<std::string>());
    }
    if (node.is_array()) {
        return Value::ArrayString(reader.AsStringArray());
    }
    throw core::SchemaError::TypeMismatch(reader.Path(),
                                          "boolean, number, string or array of strings",
                                          core::DescribeJsonType(node));
}

Value DecodeTypedValue(std::string_view typeName, const core::JsonReader& reader) {
    if (typeName == "Boolean") {
        return Value::Boolean(reader.AsBool());
    }
    if (typeName == "Color") {
        return DecodeColor(reader);
    }
    if (typeName == "Enum") {
        return Value::Enum(reader.AsString());
    }
    if (typeName == "Integer") {
        return Value::Integer(reader.AsInt64());
    }
    if (typeName == "Float") {
        return Value::Float(reader.AsNumber());
    }
    if (typeName == "String" || typeName == "Text" || typeName == "Filepath") {
        return Value::String(reader.AsString());
    }
    if (typeName == "ArrayString") {
        return Value::ArrayString(reader.AsStringArray());
    }
    if (typeName == "ArrayEnum") {
        return Value::ArrayEnum(reader.AsStringArray());
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(),
                            fmt::format("unknown value type '{}'", typeName));
}

ValueMap DecodeValueMap(const core::JsonReader& reader) {
    reader.ExpectObject();
    ValueMap values;
    for (auto it = reader.Node().begin(); it != reader.Node().end(); ++it) {
        const core::JsonReader entry(it.value(), core::JoinPath(reader.Path(), it.key()));
        values.Set(it.key(), DecodeValue(entry));
    }
    return values;
}

core::Json EncodeValue(const Value& value, std::string_view path) {
    switch (value.Kind()) {
        case ValueKind::Boolean:
            return core::Json(*value.AsBoolean());
        case ValueKind::Color:
            return core::Json(value.AsColor()->ToHex());
        case ValueKind::Enum:
            return core::Json(*value.AsEnum());
        case ValueKind::Integer:
            return core::Json(*value.AsInteger());
        case ValueKind::Float:
            return core::EncodeNumber(std::get<4>(value.Data()), path);
        case ValueKind::String:
            return core::Json(*value.AsString());
        case ValueKind::ArrayString:
            return core::Json(*value.AsArrayString());
        case ValueKind::ArrayEnum:
            return core::Json(*value.AsArrayEnum());
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant, std::string(path), "unknown value kind");
}

core::Json EncodeValueMap(const ValueMap& values, std::string_view path) {
    core::Json out = core::Json::object();
    for (const auto& entry : values) {
        out[entry.name] = EncodeValue(entry.value, core::JoinPath(path, entry.name));
    }
    return out;
}

} // namespace ogmo::values
