#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"
#include "ogmo/project/LayerTemplate.hpp"
#include "ogmo/values/Value.hpp"

namespace ogmo::level {

enum class LayerKind {
    Tile,
    TileCoords,
    Grid,
    Entity,
    Decal
};

const char* LayerKindName(LayerKind kind);

// One cell of a TileLayer. `id` is empty for blank cells.
struct Tile {
    std::optional<int> id;
    core::Vec2i gridPosition{0, 0};
    core::Vec2i pixelPosition{0, 0};
    [[nodiscard]] bool operator==(const Tile&) const = default;
};

// One cell of a TileCoordsLayer. Coordinates are empty for blank cells.
struct TileCoord {
    // Tileset cell, and the same cell in tileset pixels.
    std::optional<core::Vec2i> gridCoords;
    std::optional<core::Vec2i> pixelCoords;
    core::Vec2i gridPosition{0, 0};
    core::Vec2i pixelPosition{0, 0};
    [[nodiscard]] bool operator==(const TileCoord&) const = default;
};

// One cell of a GridLayer.
struct GridCell {
    std::string value;
    core::Vec2i gridPosition{0, 0};
    core::Vec2i pixelPosition{0, 0};
};

struct TileLayer {
    using Ids = std::vector<int>;
    using Ids2D = std::vector<std::vector<int>>;

    std::string name;
    std::string exportId;
    core::Point offset;
    core::Vec2i gridCellSize{0, 0};
    core::Vec2i gridCells{0, 0};
    std::optional<values::ValueMap> values;
    std::string tileset;
    std::optional<project::ExportMode> exportMode;
    std::optional<project::ArrayMode> arrayMode;
    // `data` or `data2D`; -1 marks an empty cell.
    std::variant<Ids, Ids2D> data;

    std::vector<Tile> Unpack() const;

    [[nodiscard]] bool operator==(const TileLayer&) const = default;
};

struct TileCoordsLayer {
    // [x, y] in tileset cells; written as [-1] when empty.
    using Coord = std::optional<core::Vec2i>;
    using Coords = std::vector<Coord>;
    using Coords2D = std::vector<std::vector<Coord>>;

    std::string name;
    std::string exportId;
    core::Point offset;
    core::Vec2i gridCellSize{0, 0};
    core::Vec2i gridCells{0, 0};
    std::optional<values::ValueMap> values;
    std::string tileset;
    std::optional<project::ExportMode> exportMode;
    std::optional<project::ArrayMode> arrayMode;
    std::variant<Coords, Coords2D> data;

    std::vector<TileCoord> Unpack() const;

    [[nodiscard]] bool operator==(const TileCoordsLayer&) const = default;
};

struct GridLayer {
    using Cells = std::vector<std::string>;
    using Cells2D = std::vector<std::vector<std::string>>;

    std::string name;
    std::string exportId;
    core::Point offset;
    core::Vec2i gridCellSize{0, 0};
    core::Vec2i gridCells{0, 0};
    std::optional<values::ValueMap> values;
    std::optional<project::ArrayMode> arrayMode;
    // `grid` or `grid2D`; "0" is empty unless the legend says otherwise.
    std::variant<Cells, Cells2D> data;

    std::vector<GridCell> Unpack() const;

    [[nodiscard]] bool operator==(const GridLayer&) const = default;
};

struct Entity {
    std::string name;
    int id = 0;
    std::string exportId;
    core::Scalar x;
    core::Scalar y;
    // The editor writes these only when the template enables the feature.
    std::optional<core::Scalar> width;
    std::optional<core::Scalar> height;
    std::optional<core::Scalar> originX;
    std::optional<core::Scalar> originY;
    std::optional<core::Scalar> rotation;
    std::optional<bool> flippedX;
    std::optional<bool> flippedY;
    std::optional<std::vector<core::Point>> nodes;
    std::optional<values::ValueMap> values;

    [[nodiscard]] bool operator==(const Entity&) const = default;
};

struct EntityLayer {
    std::string name;
    std::string exportId;
    core::Point offset;
    core::Vec2i gridCellSize{0, 0};
    core::Vec2i gridCells{0, 0};
    std::optional<values::ValueMap> values;
    std::vector<Entity> entities;

    [[nodiscard]] bool operator==(const EntityLayer&) const = default;
};

struct Decal {
    core::Scalar x;
    core::Scalar y;
    std::string texture;
    std::optional<core::Scalar> rotation;
    std::optional<core::Scalar> scaleX;
    std::optional<core::Scalar> scaleY;
    std::optional<values::ValueMap> values;

    [[nodiscard]] bool operator==(const Decal&) const = default;
};

struct DecalLayer {
    std::string name;
    std::string exportId;
    core::Point offset;
    core::Vec2i gridCellSize{0, 0};
    core::Vec2i gridCells{0, 0};
    std::optional<values::ValueMap> values;
    // Image folder relative to the project file.
    std::string folder;
    std::vector<Decal> decals;

    [[nodiscard]] bool operator==(const DecalLayer&) const = default;
};

constexpr LayerKind KindOf(const TileLayer&) { return LayerKind::Tile; }
constexpr LayerKind KindOf(const TileCoordsLayer&) { return LayerKind::TileCoords; }
constexpr LayerKind KindOf(const GridLayer&) { return LayerKind::Grid; }
constexpr LayerKind KindOf(const EntityLayer&) { return LayerKind::Entity; }
constexpr LayerKind KindOf(const DecalLayer&) { return LayerKind::Decal; }

/**
 * @brief Instance data of one layer inside a level.
 *
 * The JSON has no type tag; the variant comes from the one data key the
 * object carries (see DecodeLayer).
 */
class Layer {
public:
    using Data = std::variant<TileLayer,
                              TileCoordsLayer,
                              GridLayer,
                              EntityLayer,
                              DecalLayer>;

    Layer() = default;
    Layer(Data data) : m_data(std::move(data)) {}

    LayerKind Kind() const;
    const std::string& Name() const;
    const std::string& ExportId() const;
    core::Vec2f Offset() const;
    core::Vec2i GridCellSize() const;
    core::Vec2i GridCells() const;
    const std::optional<values::ValueMap>& Values() const;

    const Data& Get() const noexcept { return m_data; }
    Data& Get() noexcept { return m_data; }

    template <typename T>
    core::RefResult<T> UnpackAs() const {
        if (const T* payload = std::get_if<T>(&m_data)) {
            return std::cref(*payload);
        }
        return core::SchemaError::UnpackMismatch(LayerKindName(KindOf(T{})), LayerKindName(Kind()));
    }

    [[nodiscard]] bool operator==(const Layer&) const = default;

private:
    Data m_data;
};

/**
 * @brief Decodes one entry of a level's `layers` array.
 *
 * Exactly one of `data`, `data2D`, `dataCoords`, `dataCoords2D`, `grid`,
 * `grid2D`, `entities` or `decals` must be present. None is UnknownVariant,
 * more than one is AmbiguousVariant.
 */
Layer DecodeLayer(const core::JsonReader& reader);
core::Json EncodeLayer(const Layer& layer, std::string_view path);

} // namespace ogmo::level
