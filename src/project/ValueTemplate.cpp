#include "ogmo/project/ValueTemplate.hpp"

#include <fmt/format.h>

#include "ogmo/core/Logger.hpp"
#include "ogmo/core/Overloaded.hpp"

namespace ogmo::project {

namespace {

using core::Json;
using core::JsonReader;
using values::Value;
using values::ValueKind;

using core::Overloaded;

ValueTemplate::Data DecodeData(const std::string& definition, const JsonReader& reader) {
    const JsonReader defaults = reader.Child("defaults");
    if (definition == "Boolean") {
        return BooleanTemplate{values::DecodeTypedValue(definition, defaults).AsBoolean().value()};
    }
    if (definition == "Color") {
        return ColorTemplate{values::DecodeTypedValue(definition, defaults).AsColor().value(),
                             reader.Bool("includeAlpha")};
    }
    if (definition == "Enum") {
        return EnumTemplate{defaults.AsInt(), reader.StringArray("choices")};
    }
    if (definition == "Integer") {
        return IntegerTemplate{defaults.AsInt(),
                               reader.Bool("bounded"),
                               reader.Int("min"),
                               reader.Int("max")};
    }
    if (definition == "Float") {
        return FloatTemplate{defaults.AsNumber(),
                             reader.Bool("bounded"),
                             reader.Number("min"),
                             reader.Number("max")};
    }
    if (definition == "String") {
        return StringTemplate{defaults.AsString(),
                              reader.Int("maxLength"),
                              reader.Bool("trimWhitespace")};
    }
    if (definition == "Text") {
        return TextTemplate{defaults.AsString()};
    }
    if (definition == "Filepath") {
        FilepathTemplate data;
        data.defaults = defaults.AsString();
        if (auto roots = reader.OptionalChild("roots")) {
            data.roots = roots->AsStringArray();
        }
        if (auto extensions = reader.OptionalChild("extensions")) {
            data.extensions = extensions->AsStringArray();
        }
        return data;
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant,
                            core::JoinPath(reader.Path(), "definition"),
                            fmt::format("unknown value template definition '{}'", definition));
}

[[noreturn]] void ThrowResolveMismatch(const std::string& path, const ValueTemplate& tmpl, const Value& value) {
    throw core::SchemaError::TypeMismatch(path,
                                          tmpl.Definition(),
                                          values::ValueKindName(value.Kind()));
}

Value ResolveOne(const std::string& path, const ValueTemplate& tmpl, const Value& value) {
    switch (tmpl.Kind()) {
        case ValueKind::Color:
            if (auto text = value.AsString()) {
                auto color = values::Color::FromHex(*text);
                if (!color) {
                    throw core::SchemaError::TypeMismatch(path, "hex color", fmt::format("'{}'", *text));
                }
                return Value::FromColor(*color);
            }
            break;
        case ValueKind::Enum:
            if (auto text = value.AsString()) {
                return Value::Enum(*text);
            }
            break;
        case ValueKind::Float:
            if (auto whole = value.AsInteger()) {
                return Value::Float(core::Scalar::Integer(*whole));
            }
            break;
        default:
            break;
    }
    if (value.Kind() != tmpl.Kind()) {
        ThrowResolveMismatch(path, tmpl, value);
    }
    return value;
}

} // namespace

const char* ValueTemplate::Definition() const {
    return std::visit([](const auto& payload) { return DefinitionTag(payload); }, data);
}

values::ValueKind ValueTemplate::Kind() const {
    return std::visit(Overloaded{
        [](const BooleanTemplate&) { return ValueKind::Boolean; },
        [](const ColorTemplate&) { return ValueKind::Color; },
        [](const EnumTemplate&) { return ValueKind::Enum; },
        [](const IntegerTemplate&) { return ValueKind::Integer; },
        [](const FloatTemplate&) { return ValueKind::Float; },
        [](const StringTemplate&) { return ValueKind::String; },
        [](const TextTemplate&) { return ValueKind::String; },
        [](const FilepathTemplate&) { return ValueKind::String; },
    }, data);
}

values::Value ValueTemplate::DefaultValue() const {
    return std::visit(Overloaded{
        [](const BooleanTemplate& t) { return Value::Boolean(t.defaults); },
        [](const ColorTemplate& t) { return Value::FromColor(t.defaults); },
        [this](const EnumTemplate& t) {
            if (t.defaults < 0 || static_cast<std::size_t>(t.defaults) >= t.choices.size()) {
                core::Logger::Warning("[ValueTemplate] Enum '{}' default index {} is outside its {} choices",
                                      name, t.defaults, t.choices.size());
                return Value::Enum(t.choices.empty() ? std::string() : t.choices.front());
            }
            return Value::Enum(t.choices[static_cast<std::size_t>(t.defaults)]);
        },
        [](const IntegerTemplate& t) { return Value::Integer(t.defaults); },
        [](const FloatTemplate& t) { return Value::Float(t.defaults); },
        [](const StringTemplate& t) { return Value::String(t.defaults); },
        [](const TextTemplate& t) { return Value::String(t.defaults); },
        [](const FilepathTemplate& t) { return Value::String(t.defaults); },
    }, data);
}

ValueTemplate DecodeValueTemplate(const JsonReader& reader) {
    reader.ExpectObject();
    std::string name = reader.String("name");
    const std::string definition = reader.String("definition");
    const std::optional<int> display = reader.OptionalInt("display");
    return ValueTemplate(std::move(name), DecodeData(definition, reader), display);
}

std::vector<ValueTemplate> DecodeValueTemplates(const JsonReader& reader) {
    return reader.Map([](const JsonReader& element) { return DecodeValueTemplate(element); });
}

Json EncodeValueTemplate(const ValueTemplate& value, std::string_view path) {
    Json out = Json::object();
    out["name"] = value.name;
    out["definition"] = value.Definition();
    if (value.display) {
        out["display"] = *value.display;
    }
    std::visit(Overloaded{
        [&](const BooleanTemplate& t) { out["defaults"] = t.defaults; },
        [&](const ColorTemplate& t) {
            out["defaults"] = t.defaults.ToHex();
            out["includeAlpha"] = t.includeAlpha;
        },
        [&](const EnumTemplate& t) {
            out["choices"] = t.choices;
            out["defaults"] = t.defaults;
        },
        [&](const IntegerTemplate& t) {
            out["defaults"] = t.defaults;
            out["bounded"] = t.bounded;
            out["min"] = t.min;
            out["max"] = t.max;
        },
        [&](const FloatTemplate& t) {
            out["defaults"] = core::EncodeNumber(t.defaults, core::JoinPath(path, "defaults"));
            out["bounded"] = t.bounded;
            out["min"] = core::EncodeNumber(t.min, core::JoinPath(path, "min"));
            out["max"] = core::EncodeNumber(t.max, core::JoinPath(path, "max"));
        },
        [&](const StringTemplate& t) {
            out["defaults"] = t.defaults;
            out["maxLength"] = t.maxLength;
            out["trimWhitespace"] = t.trimWhitespace;
        },
        [&](const TextTemplate& t) { out["defaults"] = t.defaults; },
        [&](const FilepathTemplate& t) {
            out["defaults"] = t.defaults;
            out["roots"] = t.roots;
            out["extensions"] = t.extensions;
        },
    }, value.data);
    return out;
}

Json EncodeValueTemplates(const std::vector<ValueTemplate>& values, std::string_view path) {
    Json out = Json::array();
    for (std::size_t i = 0; i < values.size(); ++i) {
        out.push_back(EncodeValueTemplate(values[i], core::JoinPath(path, i)));
    }
    return out;
}

core::Result<values::ValueMap> ResolveValues(const std::vector<ValueTemplate>& templates,
                                             const values::ValueMap& input) {
    return core::Capture([&]() {
        values::ValueMap resolved;
        for (const auto& entry : input) {
            const std::string path = core::JoinPath("values", entry.name);
            const ValueTemplate* match = nullptr;
            for (const auto& tmpl : templates) {
                if (tmpl.name == entry.name) {
                    match = &tmpl;
                    break;
                }
            }
            if (!match) {
                core::Logger::Debug("[ValueTemplate] No template for value '{}', keeping it untyped", entry.name);
                resolved.Set(entry.name, entry.value);
                continue;
            }
            resolved.Set(entry.name, ResolveOne(path, *match, entry.value));
        }
        return resolved;
    });
}

} // namespace ogmo::project
