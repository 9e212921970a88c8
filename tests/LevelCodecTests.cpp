#include "ogmo/level/Level.hpp"
#include "ogmo/project/Project.hpp"

#include "TestDataHelpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using ogmo::core::ErrorKind;
using ogmo::core::Json;
using ogmo::core::Vec2f;
using ogmo::level::LayerKind;
using ogmo::level::Level;
using ogmo::values::ValueKind;

namespace {

Level LoadSampleLevel() {
    auto level = ogmo::level::DecodeLevel(LoadTestData("sample_project/levels/uno.json"));
    REQUIRE(level.Ok());
    return std::move(*level);
}

std::string LayerEntry(const std::string& name) {
    return R"({"name": ")" + name + R"(", "_eid": "0", "offsetX": 0, "offsetY": 0,
        "gridCellWidth": 8, "gridCellHeight": 8, "gridCellsX": 1, "gridCellsY": 1, "entities": []})";
}

} // namespace

TEST_CASE("Sample level decodes every layer kind in order", "[level][decode]") {
    const Level level = LoadSampleLevel();

    REQUIRE(level.width == Catch::Approx(320.0));
    REQUIRE(level.height == Catch::Approx(240.0));
    REQUIRE(level.layers.size() == 5);
    REQUIRE(level.layers[0].Kind() == LayerKind::Entity);
    REQUIRE(level.layers[1].Kind() == LayerKind::Tile);
    REQUIRE(level.layers[2].Kind() == LayerKind::TileCoords);
    REQUIRE(level.layers[3].Kind() == LayerKind::Grid);
    REQUIRE(level.layers[4].Kind() == LayerKind::Decal);

    const auto& entities = level.layers[0].UnpackAs<ogmo::level::EntityLayer>()->get();
    REQUIRE(entities.entities.size() == 1);
    const auto& player = entities.entities[0];
    REQUIRE(player.name == "player");
    REQUIRE(player.exportId == "00000010");
    REQUIRE(player.nodes.has_value());
    REQUIRE(player.nodes->at(1).ToVec2f() == Vec2f(96.5, 48.0));
    REQUIRE_FALSE(player.flippedY.has_value());
    REQUIRE(player.values->Find("health")->AsInteger() == 3);

    const auto& decals = level.layers[4].UnpackAs<ogmo::level::DecalLayer>()->get();
    REQUIRE(decals.folder == "decals");
    REQUIRE(decals.decals[0].texture == "bush.png");
    REQUIRE(*decals.decals[0].rotation == Catch::Approx(0.5));
}

TEST_CASE("Layer order survives re-encoding", "[level][encode]") {
    const std::string text = R"({"width": 8, "height": 8, "offsetX": 0, "offsetY": 0, "layers": [)" +
                             LayerEntry("A") + "," + LayerEntry("B") + "," + LayerEntry("C") + "]}";
    auto level = ogmo::level::DecodeLevel(text);
    REQUIRE(level.Ok());

    auto encoded = ogmo::level::EncodeLevel(*level);
    REQUIRE(encoded.Ok());

    std::vector<std::string> names;
    for (const auto& layer : (*encoded)["layers"]) {
        names.push_back(layer["name"].get<std::string>());
    }
    REQUIRE(names == std::vector<std::string>{"A", "B", "C"});
}

TEST_CASE("Levels without values decode to an empty map and encode one", "[level][decode]") {
    auto level = ogmo::level::DecodeLevel(R"({"width": 8, "height": 8, "offsetX": 0, "offsetY": 0, "layers": []})");
    REQUIRE(level.Ok());
    REQUIRE(level->values.Empty());
    REQUIRE_FALSE(level->ogmoVersion.has_value());

    auto encoded = ogmo::level::EncodeLevel(*level);
    REQUIRE(encoded.Ok());
    REQUIRE((*encoded)["values"].is_object());
    REQUIRE_FALSE(encoded->contains("ogmoVersion"));
}

TEST_CASE("Sample level survives an encode and decode cycle", "[level][encode]") {
    const Level level = LoadSampleLevel();

    auto encoded = ogmo::level::EncodeLevel(level);
    REQUIRE(encoded.Ok());
    auto decoded = ogmo::level::DecodeLevelJson(*encoded);
    REQUIRE(decoded.Ok());
    REQUIRE(*decoded == level);
}

TEST_CASE("Level numbers keep their integer or float form", "[level][encode]") {
    const Level level = LoadSampleLevel();
    auto encoded = ogmo::level::EncodeLevel(level);
    REQUIRE(encoded.Ok());

    const Json& tree = *encoded;
    REQUIRE(tree["width"].dump() == "320");
    REQUIRE(tree["values"]["par"].dump() == "120");
    REQUIRE(tree["values"]["gravity"].dump() == "9.8");
    REQUIRE(tree["layers"][0]["entities"][0]["nodes"][1]["x"].dump() == "96.5");
    REQUIRE(tree["layers"][4]["decals"][0]["scaleX"].dump() == "1");
}

TEST_CASE("Float literals with a zero fraction stay floats", "[level][encode]") {
    auto level = ogmo::level::DecodeLevel(R"({
        "width": 320.0, "height": 240, "offsetX": 5.0, "offsetY": 0,
        "layers": [
            {"name": "actors", "_eid": "1", "offsetX": 0.0, "offsetY": 0,
             "gridCellWidth": 8, "gridCellHeight": 8, "gridCellsX": 4, "gridCellsY": 4,
             "entities": [{"name": "e", "id": 0, "_eid": "2", "x": 5.0, "y": 5, "rotation": 0.0,
                           "nodes": [{"x": 1.0, "y": 2}]}]}
        ],
        "values": {"f": 5.0, "i": 5}
    })");
    REQUIRE(level.Ok());
    REQUIRE(level->width == 320.0);
    REQUIRE_FALSE(level->width.IsInteger());
    REQUIRE(level->height.IsInteger());

    auto encoded = ogmo::level::EncodeLevel(*level);
    REQUIRE(encoded.Ok());
    const Json& tree = *encoded;
    REQUIRE(tree["width"].dump() == "320.0");
    REQUIRE(tree["height"].dump() == "240");
    REQUIRE(tree["offsetX"].dump() == "5.0");
    REQUIRE(tree["offsetY"].dump() == "0");

    const Json& layer = tree["layers"][0];
    REQUIRE(layer["offsetX"].dump() == "0.0");
    REQUIRE(layer["entities"][0]["x"].dump() == "5.0");
    REQUIRE(layer["entities"][0]["y"].dump() == "5");
    REQUIRE(layer["entities"][0]["rotation"].dump() == "0.0");
    REQUIRE(layer["entities"][0]["nodes"][0].dump() == R"({"x":1.0,"y":2})");

    REQUIRE(tree["values"]["f"].dump() == "5.0");
    REQUIRE(tree["values"]["i"].dump() == "5");
}

TEST_CASE("Malformed level text reports MalformedInput", "[level][errors]") {
    auto level = ogmo::level::DecodeLevel(R"({"width": 8, "height": )");
    REQUIRE_FALSE(level.Ok());
    REQUIRE(level.Error().kind() == ErrorKind::MalformedInput);

    auto notObject = ogmo::level::DecodeLevel("[1, 2]");
    REQUIRE_FALSE(notObject.Ok());
    REQUIRE(notObject.Error().kind() == ErrorKind::TypeMismatch);
}

TEST_CASE("Missing entity fields report their full path", "[level][errors]") {
    Json tree = Json::parse(LoadTestData("sample_project/levels/uno.json"));
    tree["layers"][0]["entities"][0].erase("x");

    auto level = ogmo::level::DecodeLevelJson(tree);
    REQUIRE_FALSE(level.Ok());
    REQUIRE(level.Error().kind() == ErrorKind::MissingField);
    REQUIRE(level.Error().path() == "layers[0].entities[0].x");
}

TEST_CASE("Level values resolve against the project's level value templates", "[level][values]") {
    auto project = ogmo::project::DecodeProject(LoadTestData("sample_project/test.ogmo"));
    REQUIRE(project.Ok());
    const Level level = LoadSampleLevel();

    REQUIRE(level.values.Find("tint")->Kind() == ValueKind::String);

    auto resolved = ogmo::project::ResolveValues(project->levelValues, level.values);
    REQUIRE(resolved.Ok());
    REQUIRE(resolved->Find("title")->AsString() == std::string("Uno"));
    REQUIRE(resolved->Find("tint")->AsColor() == ogmo::values::Color{0xff, 0x80, 0x00, 0xff});
    REQUIRE(resolved->Find("difficulty")->Kind() == ValueKind::Enum);
    REQUIRE(*resolved->Find("gravity")->AsFloat() == Catch::Approx(9.8));
    REQUIRE(resolved->Find("par")->AsInteger() == 120);
}
