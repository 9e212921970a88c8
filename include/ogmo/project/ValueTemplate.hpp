#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"
#include "ogmo/values/Value.hpp"

namespace ogmo::project {

struct BooleanTemplate {
    bool defaults = false;
    [[nodiscard]] bool operator==(const BooleanTemplate&) const = default;
};

struct ColorTemplate {
    values::Color defaults;
    bool includeAlpha = true;
    [[nodiscard]] bool operator==(const ColorTemplate&) const = default;
};

struct EnumTemplate {
    // Index into `choices`.
    int defaults = 0;
    std::vector<std::string> choices;
    [[nodiscard]] bool operator==(const EnumTemplate&) const = default;
};

struct IntegerTemplate {
    int defaults = 0;
    bool bounded = false;
    int min = 0;
    int max = 100;
    [[nodiscard]] bool operator==(const IntegerTemplate&) const = default;
};

struct FloatTemplate {
    core::Scalar defaults;
    bool bounded = false;
    core::Scalar min;
    core::Scalar max = 100;
    [[nodiscard]] bool operator==(const FloatTemplate&) const = default;
};

struct StringTemplate {
    std::string defaults;
    int maxLength = 0;
    bool trimWhitespace = true;
    [[nodiscard]] bool operator==(const StringTemplate&) const = default;
};

struct TextTemplate {
    std::string defaults;
    [[nodiscard]] bool operator==(const TextTemplate&) const = default;
};

struct FilepathTemplate {
    std::string defaults;
    std::vector<std::string> roots;
    std::vector<std::string> extensions;
    [[nodiscard]] bool operator==(const FilepathTemplate&) const = default;
};

constexpr const char* DefinitionTag(const BooleanTemplate&) { return "Boolean"; }
constexpr const char* DefinitionTag(const ColorTemplate&) { return "Color"; }
constexpr const char* DefinitionTag(const EnumTemplate&) { return "Enum"; }
constexpr const char* DefinitionTag(const IntegerTemplate&) { return "Integer"; }
constexpr const char* DefinitionTag(const FloatTemplate&) { return "Float"; }
constexpr const char* DefinitionTag(const StringTemplate&) { return "String"; }
constexpr const char* DefinitionTag(const TextTemplate&) { return "Text"; }
constexpr const char* DefinitionTag(const FilepathTemplate&) { return "Filepath"; }

/**
 * @brief Declaration of a custom field, tagged by its `definition` string.
 */
class ValueTemplate {
public:
    using Data = std::variant<BooleanTemplate,
                              ColorTemplate,
                              EnumTemplate,
                              IntegerTemplate,
                              FloatTemplate,
                              StringTemplate,
                              TextTemplate,
                              FilepathTemplate>;

    ValueTemplate() = default;
    ValueTemplate(std::string name, Data data, std::optional<int> display = std::nullopt)
        : name(std::move(name)), display(display), data(std::move(data)) {}

    std::string name;
    // Editor display mode; written by Ogmo 3.3 and later.
    std::optional<int> display;
    Data data;

    // The tag written to `definition`.
    const char* Definition() const;
    values::ValueKind Kind() const;
    values::Value DefaultValue() const;

    template <typename T>
    core::RefResult<T> UnpackAs() const {
        if (const T* payload = std::get_if<T>(&data)) {
            return std::cref(*payload);
        }
        return core::SchemaError::UnpackMismatch(DefinitionTag(T{}), Definition());
    }

    [[nodiscard]] bool operator==(const ValueTemplate&) const = default;
};

ValueTemplate DecodeValueTemplate(const core::JsonReader& reader);
std::vector<ValueTemplate> DecodeValueTemplates(const core::JsonReader& reader);
core::Json EncodeValueTemplate(const ValueTemplate& value, std::string_view path);
core::Json EncodeValueTemplates(const std::vector<ValueTemplate>& values, std::string_view path);

/**
 * @brief Re-types shape-decoded values against their templates.
 *
 * Level, entity and decal files store values without a type tag, so a
 * Color reads back as a String and a whole Float as an Integer. Entries
 * with a matching template are converted to the template's kind; entries
 * without one are kept as they are.
 */
core::Result<values::ValueMap> ResolveValues(const std::vector<ValueTemplate>& templates,
                                             const values::ValueMap& values);

} // namespace ogmo::project
