#pragma once

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"
#include "ogmo/project/ValueTemplate.hpp"

namespace ogmo::project {

// Whether tile layers store tileset indices or tileset cell coordinates.
enum class ExportMode : int {
    Ids = 0,
    Coords = 1
};

// Whether layer data is one flat row-major array or an array of rows.
enum class ArrayMode : int {
    One = 0,
    Two = 1
};

enum class LayerTemplateKind {
    Tile,
    Grid,
    Entity,
    Decal
};

const char* LayerTemplateKindName(LayerTemplateKind kind);

// Each variant repeats name, gridSize and exportId so that a single
// std::visit or UnpackAs reaches every field.

struct TileLayerTemplate {
    std::string name;
    core::Vec2i gridSize{8, 8};
    std::string exportId;
    ExportMode exportMode = ExportMode::Ids;
    ArrayMode arrayMode = ArrayMode::One;
    // Label of the tileset new layers start with.
    std::string defaultTileset;
    [[nodiscard]] bool operator==(const TileLayerTemplate&) const = default;
};

struct GridLayerTemplate {
    std::string name;
    core::Vec2i gridSize{8, 8};
    std::string exportId;
    ArrayMode arrayMode = ArrayMode::One;
    // Cell value -> display colour, in editor order.
    std::vector<std::pair<std::string, std::string>> legend;
    [[nodiscard]] bool operator==(const GridLayerTemplate&) const = default;
};

struct EntityLayerTemplate {
    std::string name;
    core::Vec2i gridSize{8, 8};
    std::string exportId;
    std::vector<std::string> requiredTags;
    std::vector<std::string> excludedTags;
    [[nodiscard]] bool operator==(const EntityLayerTemplate&) const = default;
};

struct DecalLayerTemplate {
    std::string name;
    core::Vec2i gridSize{8, 8};
    std::string exportId;
    // Relative to the project file.
    std::string folder;
    bool includeImageSequence = true;
    bool scaleable = false;
    bool rotatable = false;
    std::vector<ValueTemplate> values;
    [[nodiscard]] bool operator==(const DecalLayerTemplate&) const = default;
};

constexpr LayerTemplateKind KindOf(const TileLayerTemplate&) { return LayerTemplateKind::Tile; }
constexpr LayerTemplateKind KindOf(const GridLayerTemplate&) { return LayerTemplateKind::Grid; }
constexpr LayerTemplateKind KindOf(const EntityLayerTemplate&) { return LayerTemplateKind::Entity; }
constexpr LayerTemplateKind KindOf(const DecalLayerTemplate&) { return LayerTemplateKind::Decal; }

class LayerTemplate {
public:
    using Data = std::variant<TileLayerTemplate,
                              GridLayerTemplate,
                              EntityLayerTemplate,
                              DecalLayerTemplate>;

    LayerTemplate() = default;
    LayerTemplate(Data data) : m_data(std::move(data)) {}

    LayerTemplateKind Kind() const;
    const std::string& Name() const;
    const std::string& ExportId() const;
    core::Vec2i GridSize() const;

    const Data& Get() const noexcept { return m_data; }
    Data& Get() noexcept { return m_data; }

    template <typename T>
    core::RefResult<T> UnpackAs() const {
        if (const T* payload = std::get_if<T>(&m_data)) {
            return std::cref(*payload);
        }
        return core::SchemaError::UnpackMismatch(LayerTemplateKindName(KindOf(T{})),
                                                 LayerTemplateKindName(Kind()));
    }

    [[nodiscard]] bool operator==(const LayerTemplate&) const = default;

private:
    Data m_data;
};

/**
 * @brief Decodes one entry of a project's `layers` array.
 *
 * The `definition` tag picks the variant when present. Without it the
 * variant is inferred from the fields only one kind writes; no match is
 * UnknownVariant and several matches are AmbiguousVariant.
 */
LayerTemplate DecodeLayerTemplate(const core::JsonReader& reader);
core::Json EncodeLayerTemplate(const LayerTemplate& layer, std::string_view path);

} // namespace ogmo::project
