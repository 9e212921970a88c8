#include "ogmo/level/Layer.hpp"

#include <array>

#include <fmt/format.h>

#include "ogmo/core/Logger.hpp"
#include "ogmo/core/Overloaded.hpp"

namespace ogmo::level {

using core::Json;
using core::JsonReader;

namespace {

struct DataKey {
    const char* key;
    LayerKind kind;
    bool twoDimensional;
};

constexpr std::array<DataKey, 8> kDataKeys{{
    {"data", LayerKind::Tile, false},
    {"data2D", LayerKind::Tile, true},
    {"dataCoords", LayerKind::TileCoords, false},
    {"dataCoords2D", LayerKind::TileCoords, true},
    {"grid", LayerKind::Grid, false},
    {"grid2D", LayerKind::Grid, true},
    {"entities", LayerKind::Entity, false},
    {"decals", LayerKind::Decal, false},
}};

const DataKey& FindDataKey(const JsonReader& reader) {
    std::vector<const DataKey*> present;
    for (const auto& entry : kDataKeys) {
        if (reader.Has(entry.key)) {
            present.push_back(&entry);
        }
    }
    if (present.empty()) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(),
                                "layer has none of the keys data, data2D, dataCoords, dataCoords2D, "
                                "grid, grid2D, entities, decals");
    }
    if (present.size() > 1) {
        std::string keys;
        for (const DataKey* entry : present) {
            if (!keys.empty()) {
                keys += ", ";
            }
            keys += entry->key;
        }
        throw core::SchemaError(core::ErrorKind::AmbiguousVariant, reader.Path(),
                                fmt::format("layer carries more than one data key: {}", keys));
    }
    return *present.front();
}

template <typename T>
T DecodeCommon(const JsonReader& reader) {
    T layer;
    layer.name = reader.String("name");
    layer.exportId = reader.String("_eid");
    layer.offset = core::Point{reader.Number("offsetX"), reader.Number("offsetY")};
    layer.gridCellSize = core::Vec2i(reader.Int("gridCellWidth"), reader.Int("gridCellHeight"));
    layer.gridCells = core::Vec2i(reader.Int("gridCellsX"), reader.Int("gridCellsY"));
    if (auto values = reader.OptionalChild("values")) {
        layer.values = values::DecodeValueMap(*values);
    }
    return layer;
}

std::optional<project::ArrayMode> DecodeArrayMode(const JsonReader& reader) {
    const auto value = reader.OptionalInt("arrayMode");
    if (!value) {
        return std::nullopt;
    }
    if (*value != 0 && *value != 1) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, core::JoinPath(reader.Path(), "arrayMode"),
                                fmt::format("array mode must be 0 or 1, got {}", *value));
    }
    return static_cast<project::ArrayMode>(*value);
}

std::optional<project::ExportMode> DecodeExportMode(const JsonReader& reader) {
    const auto value = reader.OptionalInt("exportMode");
    if (!value) {
        return std::nullopt;
    }
    if (*value != 0 && *value != 1) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, core::JoinPath(reader.Path(), "exportMode"),
                                fmt::format("export mode must be 0 or 1, got {}", *value));
    }
    return static_cast<project::ExportMode>(*value);
}

TileCoordsLayer::Coord DecodeCoord(const JsonReader& reader) {
    reader.ExpectArray();
    if (reader.Size() >= 1 && reader.Element(0).AsInt() == -1) {
        return std::nullopt;
    }
    if (reader.Size() != 2) {
        throw core::SchemaError::TypeMismatch(reader.Path(), "[x, y] or [-1]",
                                              fmt::format("array of {} elements", reader.Size()));
    }
    return core::Vec2i(reader.Element(0).AsInt(), reader.Element(1).AsInt());
}

Json EncodeCoord(const TileCoordsLayer::Coord& coord) {
    if (!coord) {
        return Json::array({-1});
    }
    return Json::array({coord->x, coord->y});
}

template <typename Fn>
auto DecodeRows(const JsonReader& reader, Fn&& fn) {
    return reader.Map([&fn](const JsonReader& row) { return row.Map(fn); });
}

Entity DecodeEntity(const JsonReader& reader) {
    reader.ExpectObject();
    Entity entity;
    entity.name = reader.String("name");
    entity.id = reader.Int("id");
    entity.exportId = reader.String("_eid");
    entity.x = reader.Number("x");
    entity.y = reader.Number("y");
    entity.width = reader.OptionalNumber("width");
    entity.height = reader.OptionalNumber("height");
    entity.originX = reader.OptionalNumber("originX");
    entity.originY = reader.OptionalNumber("originY");
    entity.rotation = reader.OptionalNumber("rotation");
    entity.flippedX = reader.OptionalBool("flippedX");
    entity.flippedY = reader.OptionalBool("flippedY");
    if (auto nodes = reader.OptionalChild("nodes")) {
        entity.nodes = nodes->Map([](const JsonReader& node) { return node.AsPoint(); });
    }
    if (auto values = reader.OptionalChild("values")) {
        entity.values = values::DecodeValueMap(*values);
    }
    return entity;
}

Decal DecodeDecal(const JsonReader& reader) {
    reader.ExpectObject();
    Decal decal;
    decal.x = reader.Number("x");
    decal.y = reader.Number("y");
    decal.texture = reader.String("texture");
    decal.rotation = reader.OptionalNumber("rotation");
    decal.scaleX = reader.OptionalNumber("scaleX");
    decal.scaleY = reader.OptionalNumber("scaleY");
    if (auto values = reader.OptionalChild("values")) {
        decal.values = values::DecodeValueMap(*values);
    }
    return decal;
}

void WriteOptionalNumber(Json& out, const char* key, const std::optional<core::Scalar>& value, std::string_view path) {
    if (value) {
        out[key] = core::EncodeNumber(*value, core::JoinPath(path, key));
    }
}

Json EncodeEntity(const Entity& entity, std::string_view path) {
    Json out = Json::object();
    out["name"] = entity.name;
    out["id"] = entity.id;
    out["_eid"] = entity.exportId;
    out["x"] = core::EncodeNumber(entity.x, core::JoinPath(path, "x"));
    out["y"] = core::EncodeNumber(entity.y, core::JoinPath(path, "y"));
    WriteOptionalNumber(out, "width", entity.width, path);
    WriteOptionalNumber(out, "height", entity.height, path);
    WriteOptionalNumber(out, "originX", entity.originX, path);
    WriteOptionalNumber(out, "originY", entity.originY, path);
    WriteOptionalNumber(out, "rotation", entity.rotation, path);
    if (entity.flippedX) {
        out["flippedX"] = *entity.flippedX;
    }
    if (entity.flippedY) {
        out["flippedY"] = *entity.flippedY;
    }
    if (entity.nodes) {
        const std::string nodesPath = core::JoinPath(path, "nodes");
        Json nodes = Json::array();
        for (std::size_t i = 0; i < entity.nodes->size(); ++i) {
            nodes.push_back(core::EncodeVec2((*entity.nodes)[i], core::JoinPath(nodesPath, i)));
        }
        out["nodes"] = std::move(nodes);
    }
    if (entity.values) {
        out["values"] = values::EncodeValueMap(*entity.values, core::JoinPath(path, "values"));
    }
    return out;
}

Json EncodeDecal(const Decal& decal, std::string_view path) {
    Json out = Json::object();
    out["x"] = core::EncodeNumber(decal.x, core::JoinPath(path, "x"));
    out["y"] = core::EncodeNumber(decal.y, core::JoinPath(path, "y"));
    out["texture"] = decal.texture;
    WriteOptionalNumber(out, "rotation", decal.rotation, path);
    WriteOptionalNumber(out, "scaleX", decal.scaleX, path);
    WriteOptionalNumber(out, "scaleY", decal.scaleY, path);
    if (decal.values) {
        out["values"] = values::EncodeValueMap(*decal.values, core::JoinPath(path, "values"));
    }
    return out;
}

template <typename Cell, typename Fn>
std::vector<Cell> UnpackCells(const char* layerName,
                              core::Vec2i gridCells,
                              core::Vec2i cellSize,
                              std::size_t flatCount,
                              Fn&& emit) {
    std::vector<Cell> cells;
    if (flatCount > 0 && gridCells.x <= 0) {
        core::Logger::Warning("[Layer] '{}' has {} cells but gridCellsX is {}", layerName, flatCount, gridCells.x);
        return cells;
    }
    cells.reserve(flatCount);
    for (std::size_t i = 0; i < flatCount; ++i) {
        const core::Vec2i grid(static_cast<int>(i) % gridCells.x, static_cast<int>(i) / gridCells.x);
        cells.push_back(emit(i, grid, grid * cellSize));
    }
    return cells;
}

template <typename Cell, typename Row, typename Fn>
std::vector<Cell> UnpackRows(const std::vector<Row>& rows, core::Vec2i cellSize, Fn&& emit) {
    std::vector<Cell> cells;
    for (std::size_t y = 0; y < rows.size(); ++y) {
        for (std::size_t x = 0; x < rows[y].size(); ++x) {
            const core::Vec2i grid(static_cast<int>(x), static_cast<int>(y));
            cells.push_back(emit(rows[y][x], grid, grid * cellSize));
        }
    }
    return cells;
}

} // namespace

const char* LayerKindName(LayerKind kind) {
    switch (kind) {
        case LayerKind::Tile:       return "Tile";
        case LayerKind::TileCoords: return "TileCoords";
        case LayerKind::Grid:       return "Grid";
        case LayerKind::Entity:     return "Entity";
        case LayerKind::Decal:      return "Decal";
    }
    return "Unknown";
}

std::vector<Tile> TileLayer::Unpack() const {
    auto makeTile = [](int id, core::Vec2i grid, core::Vec2i pixel) {
        return Tile{id == -1 ? std::nullopt : std::optional<int>(id), grid, pixel};
    };
    return std::visit(core::Overloaded{
        [&](const Ids& ids) {
            return UnpackCells<Tile>(name.c_str(), gridCells, gridCellSize, ids.size(),
                                     [&](std::size_t i, core::Vec2i grid, core::Vec2i pixel) {
                                         return makeTile(ids[i], grid, pixel);
                                     });
        },
        [&](const Ids2D& rows) {
            return UnpackRows<Tile>(rows, gridCellSize, makeTile);
        },
    }, data);
}

std::vector<TileCoord> TileCoordsLayer::Unpack() const {
    auto makeCoord = [this](const Coord& coord, core::Vec2i grid, core::Vec2i pixel) {
        TileCoord cell{std::nullopt, std::nullopt, grid, pixel};
        if (coord) {
            cell.gridCoords = *coord;
            cell.pixelCoords = *coord * gridCellSize;
        }
        return cell;
    };
    return std::visit(core::Overloaded{
        [&](const Coords& coords) {
            return UnpackCells<TileCoord>(name.c_str(), gridCells, gridCellSize, coords.size(),
                                          [&](std::size_t i, core::Vec2i grid, core::Vec2i pixel) {
                                              return makeCoord(coords[i], grid, pixel);
                                          });
        },
        [&](const Coords2D& rows) {
            return UnpackRows<TileCoord>(rows, gridCellSize, makeCoord);
        },
    }, data);
}

std::vector<GridCell> GridLayer::Unpack() const {
    auto makeCell = [](const std::string& value, core::Vec2i grid, core::Vec2i pixel) {
        return GridCell{value, grid, pixel};
    };
    return std::visit(core::Overloaded{
        [&](const Cells& cells) {
            return UnpackCells<GridCell>(name.c_str(), gridCells, gridCellSize, cells.size(),
                                         [&](std::size_t i, core::Vec2i grid, core::Vec2i pixel) {
                                             return makeCell(cells[i], grid, pixel);
                                         });
        },
        [&](const Cells2D& rows) {
            return UnpackRows<GridCell>(rows, gridCellSize, makeCell);
        },
    }, data);
}

LayerKind Layer::Kind() const {
    return std::visit([](const auto& layer) { return KindOf(layer); }, m_data);
}

const std::string& Layer::Name() const {
    return std::visit([](const auto& layer) -> const std::string& { return layer.name; }, m_data);
}

const std::string& Layer::ExportId() const {
    return std::visit([](const auto& layer) -> const std::string& { return layer.exportId; }, m_data);
}

core::Vec2f Layer::Offset() const {
    return std::visit([](const auto& layer) { return layer.offset.ToVec2f(); }, m_data);
}

core::Vec2i Layer::GridCellSize() const {
    return std::visit([](const auto& layer) { return layer.gridCellSize; }, m_data);
}

core::Vec2i Layer::GridCells() const {
    return std::visit([](const auto& layer) { return layer.gridCells; }, m_data);
}

const std::optional<values::ValueMap>& Layer::Values() const {
    return std::visit([](const auto& layer) -> const std::optional<values::ValueMap>& { return layer.values; },
                      m_data);
}

Layer DecodeLayer(const JsonReader& reader) {
    reader.ExpectObject();
    const DataKey& key = FindDataKey(reader);
    const JsonReader data = reader.Child(key.key);
    auto asInt = [](const JsonReader& cell) { return cell.AsInt(); };
    auto asString = [](const JsonReader& cell) { return cell.AsString(); };

    switch (key.kind) {
        case LayerKind::Tile: {
            auto layer = DecodeCommon<TileLayer>(reader);
            layer.tileset = reader.String("tileset");
            layer.exportMode = DecodeExportMode(reader);
            layer.arrayMode = DecodeArrayMode(reader);
            if (key.twoDimensional) {
                layer.data = DecodeRows(data, asInt);
            } else {
                layer.data = data.Map(asInt);
            }
            return Layer(std::move(layer));
        }
        case LayerKind::TileCoords: {
            auto layer = DecodeCommon<TileCoordsLayer>(reader);
            layer.tileset = reader.String("tileset");
            layer.exportMode = DecodeExportMode(reader);
            layer.arrayMode = DecodeArrayMode(reader);
            if (key.twoDimensional) {
                layer.data = DecodeRows(data, DecodeCoord);
            } else {
                layer.data = data.Map(DecodeCoord);
            }
            return Layer(std::move(layer));
        }
        case LayerKind::Grid: {
            auto layer = DecodeCommon<GridLayer>(reader);
            layer.arrayMode = DecodeArrayMode(reader);
            if (key.twoDimensional) {
                layer.data = DecodeRows(data, asString);
            } else {
                layer.data = data.Map(asString);
            }
            return Layer(std::move(layer));
        }
        case LayerKind::Entity: {
            auto layer = DecodeCommon<EntityLayer>(reader);
            layer.entities = data.Map(DecodeEntity);
            return Layer(std::move(layer));
        }
        case LayerKind::Decal: {
            auto layer = DecodeCommon<DecalLayer>(reader);
            layer.folder = reader.String("folder");
            layer.decals = data.Map(DecodeDecal);
            return Layer(std::move(layer));
        }
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(), "unhandled layer kind");
}

Json EncodeLayer(const Layer& layer, std::string_view path) {
    Json out = Json::object();
    auto writeCommon = [&out, path](const auto& data) {
        out["name"] = data.name;
        out["_eid"] = data.exportId;
        out["offsetX"] = core::EncodeNumber(data.offset.x, core::JoinPath(path, "offsetX"));
        out["offsetY"] = core::EncodeNumber(data.offset.y, core::JoinPath(path, "offsetY"));
        out["gridCellWidth"] = data.gridCellSize.x;
        out["gridCellHeight"] = data.gridCellSize.y;
        out["gridCellsX"] = data.gridCells.x;
        out["gridCellsY"] = data.gridCells.y;
        if (data.values) {
            out["values"] = values::EncodeValueMap(*data.values, core::JoinPath(path, "values"));
        }
    };
    auto writeModes = [&out](const auto& data) {
        if (data.exportMode) {
            out["exportMode"] = static_cast<int>(*data.exportMode);
        }
        if (data.arrayMode) {
            out["arrayMode"] = static_cast<int>(*data.arrayMode);
        }
    };

    std::visit(core::Overloaded{
        [&](const TileLayer& data) {
            writeCommon(data);
            out["tileset"] = data.tileset;
            writeModes(data);
            std::visit(core::Overloaded{
                [&](const TileLayer::Ids& ids) { out["data"] = ids; },
                [&](const TileLayer::Ids2D& rows) { out["data2D"] = rows; },
            }, data.data);
        },
        [&](const TileCoordsLayer& data) {
            writeCommon(data);
            out["tileset"] = data.tileset;
            writeModes(data);
            std::visit(core::Overloaded{
                [&](const TileCoordsLayer::Coords& coords) {
                    Json cells = Json::array();
                    for (const auto& coord : coords) {
                        cells.push_back(EncodeCoord(coord));
                    }
                    out["dataCoords"] = std::move(cells);
                },
                [&](const TileCoordsLayer::Coords2D& rows) {
                    Json grid = Json::array();
                    for (const auto& row : rows) {
                        Json cells = Json::array();
                        for (const auto& coord : row) {
                            cells.push_back(EncodeCoord(coord));
                        }
                        grid.push_back(std::move(cells));
                    }
                    out["dataCoords2D"] = std::move(grid);
                },
            }, data.data);
        },
        [&](const GridLayer& data) {
            writeCommon(data);
            if (data.arrayMode) {
                out["arrayMode"] = static_cast<int>(*data.arrayMode);
            }
            std::visit(core::Overloaded{
                [&](const GridLayer::Cells& cells) { out["grid"] = cells; },
                [&](const GridLayer::Cells2D& rows) { out["grid2D"] = rows; },
            }, data.data);
        },
        [&](const EntityLayer& data) {
            writeCommon(data);
            const std::string entitiesPath = core::JoinPath(path, "entities");
            Json entities = Json::array();
            for (std::size_t i = 0; i < data.entities.size(); ++i) {
                entities.push_back(EncodeEntity(data.entities[i], core::JoinPath(entitiesPath, i)));
            }
            out["entities"] = std::move(entities);
        },
        [&](const DecalLayer& data) {
            writeCommon(data);
            out["folder"] = data.folder;
            const std::string decalsPath = core::JoinPath(path, "decals");
            Json decals = Json::array();
            for (std::size_t i = 0; i < data.decals.size(); ++i) {
                decals.push_back(EncodeDecal(data.decals[i], core::JoinPath(decalsPath, i)));
            }
            out["decals"] = std::move(decals);
        },
    }, layer.Get());
    return out;
}

} // namespace ogmo::level
