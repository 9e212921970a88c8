#include "ogmo/project/LayerTemplate.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using ogmo::core::ErrorKind;
using ogmo::core::Json;
using ogmo::core::JsonReader;
using ogmo::project::LayerTemplate;
using ogmo::project::LayerTemplateKind;

namespace {

ogmo::core::Result<LayerTemplate> Decode(const std::string& text) {
    const Json node = Json::parse(text);
    return ogmo::core::Capture([&] { return ogmo::project::DecodeLayerTemplate(JsonReader(node, "layers[0]")); });
}

} // namespace

TEST_CASE("Layer templates follow their definition tag", "[project][layers]") {
    auto tile = Decode(R"({"definition": "tile", "name": "ground", "gridSize": {"x": 16, "y": 8},
        "exportID": "01", "exportMode": 1, "arrayMode": 1, "defaultTileset": "terrain"})");
    REQUIRE(tile.Ok());
    REQUIRE(tile->Kind() == LayerTemplateKind::Tile);
    REQUIRE(tile->Name() == "ground");
    REQUIRE(tile->GridSize() == ogmo::core::Vec2i(16, 8));

    auto data = tile->UnpackAs<ogmo::project::TileLayerTemplate>();
    REQUIRE(data.Ok());
    REQUIRE(data->get().exportMode == ogmo::project::ExportMode::Coords);
    REQUIRE(data->get().arrayMode == ogmo::project::ArrayMode::Two);
    REQUIRE(data->get().defaultTileset == "terrain");

    auto grid = Decode(R"({"definition": "grid", "name": "solids", "gridSize": {"x": 8, "y": 8},
        "exportID": "02", "arrayMode": 0, "legend": {"0": "#00000000", "1": "#ff0000ff"}})");
    REQUIRE(grid.Ok());
    const auto& legend = grid->UnpackAs<ogmo::project::GridLayerTemplate>()->get().legend;
    REQUIRE(legend.size() == 2);
    REQUIRE(legend[1].first == "1");
    REQUIRE(legend[1].second == "#ff0000ff");
}

TEST_CASE("Layer templates without a definition are inferred from their fields", "[project][layers]") {
    auto entity = Decode(R"({"name": "actors", "gridSize": {"x": 8, "y": 8}, "exportID": "03",
        "requiredTags": ["enemy"], "excludedTags": []})");
    REQUIRE(entity.Ok());
    REQUIRE(entity->Kind() == LayerTemplateKind::Entity);

    auto decal = Decode(R"({"name": "props", "gridSize": {"x": 8, "y": 8}, "exportID": "04",
        "folder": "decals", "includeImageSequence": false, "scaleable": true, "rotatable": false})");
    REQUIRE(decal.Ok());
    REQUIRE(decal->Kind() == LayerTemplateKind::Decal);
    REQUIRE(decal->UnpackAs<ogmo::project::DecalLayerTemplate>()->get().values.empty());
}

TEST_CASE("Layer templates with fields of two kinds are ambiguous", "[project][layers][errors]") {
    auto result = Decode(R"({"name": "mixed", "gridSize": {"x": 8, "y": 8}, "exportID": "05",
        "legend": {}, "folder": "decals"})");
    REQUIRE_FALSE(result.Ok());
    REQUIRE(result.Error().kind() == ErrorKind::AmbiguousVariant);
    REQUIRE(result.Error().path() == "layers[0]");
}

TEST_CASE("Layer templates with no kind information are unknown", "[project][layers][errors]") {
    auto untagged = Decode(R"({"name": "bare", "gridSize": {"x": 8, "y": 8}, "exportID": "06"})");
    REQUIRE_FALSE(untagged.Ok());
    REQUIRE(untagged.Error().kind() == ErrorKind::UnknownVariant);

    auto badTag = Decode(R"({"definition": "sprite", "name": "bare", "gridSize": {"x": 8, "y": 8}, "exportID": "06"})");
    REQUIRE_FALSE(badTag.Ok());
    REQUIRE(badTag.Error().kind() == ErrorKind::UnknownVariant);
    REQUIRE(badTag.Error().path() == "layers[0].definition");

    auto badMode = Decode(R"({"definition": "grid", "name": "g", "gridSize": {"x": 8, "y": 8},
        "exportID": "07", "arrayMode": 3, "legend": {}})");
    REQUIRE_FALSE(badMode.Ok());
    REQUIRE(badMode.Error().kind() == ErrorKind::UnknownVariant);
    REQUIRE(badMode.Error().path() == "layers[0].arrayMode");
}

TEST_CASE("Layer template UnpackAs reports the actual kind", "[project][layers][unpack]") {
    auto entity = Decode(R"({"definition": "entity", "name": "actors", "gridSize": {"x": 8, "y": 8},
        "exportID": "03", "requiredTags": [], "excludedTags": []})");
    REQUIRE(entity.Ok());

    auto asTile = entity->UnpackAs<ogmo::project::TileLayerTemplate>();
    REQUIRE_FALSE(asTile.Ok());
    REQUIRE(asTile.Error().kind() == ErrorKind::UnpackMismatch);
    REQUIRE(asTile.Error().expected() == "Tile");
    REQUIRE(asTile.Error().actual() == "Entity");
}

TEST_CASE("Layer templates encode their definition tag", "[project][layers][encode]") {
    ogmo::project::DecalLayerTemplate decal;
    decal.name = "props";
    decal.exportId = "08";
    decal.folder = "art/decals";

    const LayerTemplate layer(decal);
    const Json encoded = ogmo::project::EncodeLayerTemplate(layer, "layers[0]");
    REQUIRE(encoded["definition"].get<std::string>() == "decal");
    REQUIRE(encoded["values"].is_array());

    auto decoded = ogmo::core::Capture([&] {
        return ogmo::project::DecodeLayerTemplate(JsonReader(encoded, "layers[0]"));
    });
    REQUIRE(decoded.Ok());
    REQUIRE(*decoded == layer);
}
