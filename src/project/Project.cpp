#include "ogmo/project/Project.hpp"

#include <algorithm>

#include "ogmo/core/EditorVersion.hpp"
#include "ogmo/core/Logger.hpp"

namespace ogmo::project {

using core::Json;
using core::JsonReader;

namespace {

template <typename T, typename Key>
const T* FindBy(const std::vector<T>& items, std::string_view wanted, Key key) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& item) { return key(item) == wanted; });
    return it == items.end() ? nullptr : &*it;
}

Project DecodeProjectTree(const Json& tree, const utils::DecodeConfig& config) {
    const JsonReader reader(tree, "");
    reader.ExpectObject();

    Project project;
    project.name = reader.String("name");
    project.ogmoVersion = reader.OptionalString("ogmoVersion");
    if (project.ogmoVersion && config.warnOnVersionMismatch) {
        core::CheckEditorVersion(*project.ogmoVersion, project.name);
    }

    project.levelPaths = reader.StringArray("levelPaths");
    project.backgroundColor = reader.String("backgroundColor");
    project.gridColor = reader.String("gridColor");
    project.anglesRadians = reader.Bool("anglesRadians");
    project.directoryDepth = reader.Int("directoryDepth");
    project.layerGridDefaultSize = reader.Vec2Int("layerGridDefaultSize");
    project.levelDefaultSize = reader.Vec2Int("levelDefaultSize");
    project.levelMinSize = reader.Vec2Int("levelMinSize");
    project.levelMaxSize = reader.Vec2Int("levelMaxSize");
    project.levelValues = DecodeValueTemplates(reader.Child("levelValues"));
    project.defaultExportMode = reader.String("defaultExportMode");
    project.compactExport = reader.OptionalBool("compactExport");
    project.externalScript = reader.OptionalString("externalScript");
    project.playCommand = reader.OptionalString("playCommand");
    project.entityTags = reader.StringArray("entityTags");
    project.layers = reader.Child("layers").Map(DecodeLayerTemplate);
    project.entities = reader.Child("entities").Map(DecodeEntityTemplate);
    project.tilesets = reader.Child("tilesets").Map(DecodeTileset);

    core::Logger::Debug("[ProjectCodec] Decoded '{}': {} layers, {} entities, {} tilesets",
                        project.name, project.layers.size(), project.entities.size(),
                        project.tilesets.size());
    return project;
}

Json EncodeProjectTree(const Project& project) {
    Json out = Json::object();
    out["name"] = project.name;
    if (project.ogmoVersion) {
        out["ogmoVersion"] = *project.ogmoVersion;
    }
    out["levelPaths"] = project.levelPaths;
    out["backgroundColor"] = project.backgroundColor;
    out["gridColor"] = project.gridColor;
    out["anglesRadians"] = project.anglesRadians;
    out["directoryDepth"] = project.directoryDepth;
    out["layerGridDefaultSize"] = core::EncodeVec2(project.layerGridDefaultSize);
    out["levelDefaultSize"] = core::EncodeVec2(project.levelDefaultSize);
    out["levelMinSize"] = core::EncodeVec2(project.levelMinSize);
    out["levelMaxSize"] = core::EncodeVec2(project.levelMaxSize);
    out["levelValues"] = EncodeValueTemplates(project.levelValues, "levelValues");
    out["defaultExportMode"] = project.defaultExportMode;
    if (project.compactExport) {
        out["compactExport"] = *project.compactExport;
    }
    if (project.externalScript) {
        out["externalScript"] = *project.externalScript;
    }
    if (project.playCommand) {
        out["playCommand"] = *project.playCommand;
    }
    out["entityTags"] = project.entityTags;

    Json layers = Json::array();
    for (std::size_t i = 0; i < project.layers.size(); ++i) {
        layers.push_back(EncodeLayerTemplate(project.layers[i], core::JoinPath("layers", i)));
    }
    out["layers"] = std::move(layers);

    Json entities = Json::array();
    for (std::size_t i = 0; i < project.entities.size(); ++i) {
        entities.push_back(EncodeEntityTemplate(project.entities[i], core::JoinPath("entities", i)));
    }
    out["entities"] = std::move(entities);

    Json tilesets = Json::array();
    for (const auto& tileset : project.tilesets) {
        tilesets.push_back(EncodeTileset(tileset));
    }
    out["tilesets"] = std::move(tilesets);
    return out;
}

} // namespace

const LayerTemplate* Project::FindLayerTemplate(std::string_view layerName) const {
    return FindBy(layers, layerName, [](const LayerTemplate& layer) -> const std::string& { return layer.Name(); });
}

const EntityTemplate* Project::FindEntityTemplate(std::string_view entityName) const {
    return FindBy(entities, entityName, [](const EntityTemplate& entity) -> const std::string& { return entity.name; });
}

const Tileset* Project::FindTileset(std::string_view label) const {
    return FindBy(tilesets, label, [](const Tileset& tileset) -> const std::string& { return tileset.label; });
}

core::Result<Project> DecodeProject(std::string_view text, const utils::DecodeConfig& config) {
    return core::Capture([&] { return DecodeProjectTree(core::ParseJson(text), config); });
}

core::Result<Project> DecodeProjectJson(const Json& tree, const utils::DecodeConfig& config) {
    return core::Capture([&] { return DecodeProjectTree(tree, config); });
}

core::Result<Json> EncodeProject(const Project& project) {
    return core::Capture([&] { return EncodeProjectTree(project); });
}

core::Result<std::string> EncodeProjectText(const Project& project, int indent) {
    return core::Capture([&] { return EncodeProjectTree(project).dump(indent); });
}

} // namespace ogmo::project
