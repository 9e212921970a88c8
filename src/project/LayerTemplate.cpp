#include "ogmo/project/LayerTemplate.hpp"

#include <array>

#include <fmt/format.h>

#include "ogmo/core/Logger.hpp"
#include "ogmo/core/Overloaded.hpp"

namespace ogmo::project {

namespace {

using core::Json;
using core::JsonReader;

struct KindSignature {
    LayerTemplateKind kind;
    const char* definition;
    std::array<const char*, 2> keys;
};

// Fields that only one layer definition writes.
constexpr std::array<KindSignature, 4> kSignatures{{
    {LayerTemplateKind::Tile, "tile", {"defaultTileset", "exportMode"}},
    {LayerTemplateKind::Grid, "grid", {"legend", nullptr}},
    {LayerTemplateKind::Entity, "entity", {"requiredTags", "excludedTags"}},
    {LayerTemplateKind::Decal, "decal", {"folder", nullptr}},
}};

LayerTemplateKind KindFromDefinition(const JsonReader& reader) {
    const JsonReader tag = reader.Child("definition");
    const std::string definition = tag.AsString();
    for (const auto& signature : kSignatures) {
        if (definition == signature.definition) {
            return signature.kind;
        }
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant, tag.Path(),
                            fmt::format("unknown layer definition '{}'", definition));
}

LayerTemplateKind KindFromFields(const JsonReader& reader) {
    std::vector<const KindSignature*> matches;
    for (const auto& signature : kSignatures) {
        for (const char* key : signature.keys) {
            if (key && reader.Has(key)) {
                matches.push_back(&signature);
                break;
            }
        }
    }
    if (matches.empty()) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(),
                                "layer template has no 'definition' and no kind-specific fields");
    }
    if (matches.size() > 1) {
        throw core::SchemaError(core::ErrorKind::AmbiguousVariant, reader.Path(),
                                fmt::format("layer template fields match both '{}' and '{}'",
                                            matches[0]->definition, matches[1]->definition));
    }
    core::Logger::Debug("[LayerTemplate] '{}' has no definition tag, inferred '{}' from its fields",
                        reader.Path(), matches.front()->definition);
    return matches.front()->kind;
}

ArrayMode DecodeArrayMode(const JsonReader& reader) {
    const int value = reader.AsInt();
    if (value != 0 && value != 1) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(),
                                fmt::format("array mode must be 0 or 1, got {}", value));
    }
    return static_cast<ArrayMode>(value);
}

ExportMode DecodeExportMode(const JsonReader& reader) {
    const int value = reader.AsInt();
    if (value != 0 && value != 1) {
        throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(),
                                fmt::format("export mode must be 0 or 1, got {}", value));
    }
    return static_cast<ExportMode>(value);
}

std::vector<std::pair<std::string, std::string>> DecodeLegend(const JsonReader& reader) {
    reader.ExpectObject();
    std::vector<std::pair<std::string, std::string>> legend;
    for (auto it = reader.Node().begin(); it != reader.Node().end(); ++it) {
        const JsonReader colour(it.value(), core::JoinPath(reader.Path(), it.key()));
        legend.emplace_back(it.key(), colour.AsString());
    }
    return legend;
}

template <typename T>
T DecodeCommon(const JsonReader& reader) {
    T layer;
    layer.name = reader.String("name");
    layer.gridSize = reader.Vec2Int("gridSize");
    layer.exportId = reader.String("exportID");
    return layer;
}

} // namespace

const char* LayerTemplateKindName(LayerTemplateKind kind) {
    switch (kind) {
        case LayerTemplateKind::Tile:   return "Tile";
        case LayerTemplateKind::Grid:   return "Grid";
        case LayerTemplateKind::Entity: return "Entity";
        case LayerTemplateKind::Decal:  return "Decal";
    }
    return "Unknown";
}

LayerTemplateKind LayerTemplate::Kind() const {
    return std::visit([](const auto& layer) { return KindOf(layer); }, m_data);
}

const std::string& LayerTemplate::Name() const {
    return std::visit([](const auto& layer) -> const std::string& { return layer.name; }, m_data);
}

const std::string& LayerTemplate::ExportId() const {
    return std::visit([](const auto& layer) -> const std::string& { return layer.exportId; }, m_data);
}

core::Vec2i LayerTemplate::GridSize() const {
    return std::visit([](const auto& layer) { return layer.gridSize; }, m_data);
}

LayerTemplate DecodeLayerTemplate(const JsonReader& reader) {
    reader.ExpectObject();
    const LayerTemplateKind kind = reader.Has("definition") ? KindFromDefinition(reader)
                                                            : KindFromFields(reader);
    switch (kind) {
        case LayerTemplateKind::Tile: {
            auto layer = DecodeCommon<TileLayerTemplate>(reader);
            layer.exportMode = DecodeExportMode(reader.Child("exportMode"));
            layer.arrayMode = DecodeArrayMode(reader.Child("arrayMode"));
            layer.defaultTileset = reader.String("defaultTileset");
            return LayerTemplate(std::move(layer));
        }
        case LayerTemplateKind::Grid: {
            auto layer = DecodeCommon<GridLayerTemplate>(reader);
            layer.arrayMode = DecodeArrayMode(reader.Child("arrayMode"));
            layer.legend = DecodeLegend(reader.Child("legend"));
            return LayerTemplate(std::move(layer));
        }
        case LayerTemplateKind::Entity: {
            auto layer = DecodeCommon<EntityLayerTemplate>(reader);
            layer.requiredTags = reader.StringArray("requiredTags");
            layer.excludedTags = reader.StringArray("excludedTags");
            return LayerTemplate(std::move(layer));
        }
        case LayerTemplateKind::Decal: {
            auto layer = DecodeCommon<DecalLayerTemplate>(reader);
            layer.folder = reader.String("folder");
            layer.includeImageSequence = reader.Bool("includeImageSequence");
            layer.scaleable = reader.Bool("scaleable");
            layer.rotatable = reader.Bool("rotatable");
            if (auto values = reader.OptionalChild("values")) {
                layer.values = DecodeValueTemplates(*values);
            }
            return LayerTemplate(std::move(layer));
        }
    }
    throw core::SchemaError(core::ErrorKind::UnknownVariant, reader.Path(), "unhandled layer kind");
}

Json EncodeLayerTemplate(const LayerTemplate& layer, std::string_view path) {
    Json out = Json::object();
    auto writeCommon = [&out](const char* definition, const auto& data) {
        out["definition"] = definition;
        out["name"] = data.name;
        out["gridSize"] = core::EncodeVec2(data.gridSize);
        out["exportID"] = data.exportId;
    };
    std::visit(core::Overloaded{
        [&](const TileLayerTemplate& data) {
            writeCommon("tile", data);
            out["exportMode"] = static_cast<int>(data.exportMode);
            out["arrayMode"] = static_cast<int>(data.arrayMode);
            out["defaultTileset"] = data.defaultTileset;
        },
        [&](const GridLayerTemplate& data) {
            writeCommon("grid", data);
            out["arrayMode"] = static_cast<int>(data.arrayMode);
            Json legend = Json::object();
            for (const auto& [cell, colour] : data.legend) {
                legend[cell] = colour;
            }
            out["legend"] = std::move(legend);
        },
        [&](const EntityLayerTemplate& data) {
            writeCommon("entity", data);
            out["requiredTags"] = data.requiredTags;
            out["excludedTags"] = data.excludedTags;
        },
        [&](const DecalLayerTemplate& data) {
            writeCommon("decal", data);
            out["folder"] = data.folder;
            out["includeImageSequence"] = data.includeImageSequence;
            out["scaleable"] = data.scaleable;
            out["rotatable"] = data.rotatable;
            out["values"] = EncodeValueTemplates(data.values, core::JoinPath(path, "values"));
        },
    }, layer.Get());
    return out;
}

} // namespace ogmo::project
