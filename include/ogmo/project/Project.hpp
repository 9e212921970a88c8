#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"
#include "ogmo/project/EntityTemplate.hpp"
#include "ogmo/project/LayerTemplate.hpp"
#include "ogmo/project/Tileset.hpp"
#include "ogmo/project/ValueTemplate.hpp"
#include "ogmo/utils/Config.hpp"

namespace ogmo::project {

/**
 * @brief Contents of an `.ogmo` project file.
 *
 * Layers, entities and tilesets keep the order the editor lists them in;
 * layer order is paint order.
 */
struct Project {
    std::string name;
    std::optional<std::string> ogmoVersion;
    // Folders searched for levels, relative to the project file.
    std::vector<std::string> levelPaths;
    std::string backgroundColor;
    std::string gridColor;
    bool anglesRadians = true;
    int directoryDepth = 5;
    core::Vec2i layerGridDefaultSize{8, 8};
    core::Vec2i levelDefaultSize{320, 240};
    core::Vec2i levelMinSize{128, 128};
    core::Vec2i levelMaxSize{4096, 4096};
    std::vector<ValueTemplate> levelValues;
    // File extension new levels are saved with, e.g. ".json".
    std::string defaultExportMode = ".json";
    std::optional<bool> compactExport;
    std::optional<std::string> externalScript;
    std::optional<std::string> playCommand;
    std::vector<std::string> entityTags;
    std::vector<LayerTemplate> layers;
    std::vector<EntityTemplate> entities;
    std::vector<Tileset> tilesets;

    const LayerTemplate* FindLayerTemplate(std::string_view layerName) const;
    const EntityTemplate* FindEntityTemplate(std::string_view entityName) const;
    const Tileset* FindTileset(std::string_view label) const;

    [[nodiscard]] bool operator==(const Project&) const = default;
};

core::Result<Project> DecodeProject(std::string_view text, const utils::DecodeConfig& config = {});
core::Result<Project> DecodeProjectJson(const core::Json& tree, const utils::DecodeConfig& config = {});

core::Result<core::Json> EncodeProject(const Project& project);
// indent < 0 writes everything on one line.
core::Result<std::string> EncodeProjectText(const Project& project, int indent = 2);

} // namespace ogmo::project
