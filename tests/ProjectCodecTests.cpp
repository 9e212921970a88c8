#include "ogmo/core/Logger.hpp"
#include "ogmo/project/Project.hpp"

#include "TestDataHelpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <vector>

using ogmo::core::ErrorKind;
using ogmo::core::Json;
using ogmo::project::LayerTemplateKind;
using ogmo::project::Project;

namespace {

struct WarningCapture {
    std::vector<std::string> lines;
    ogmo::core::ScopedLogListener listener{[this](ogmo::core::LogLevel level, const std::string& line) {
        if (level == ogmo::core::LogLevel::Warning) {
            lines.push_back(line);
        }
    }};
};

Project LoadSampleProject() {
    auto project = ogmo::project::DecodeProject(LoadTestData("sample_project/test.ogmo"));
    REQUIRE(project.Ok());
    return std::move(*project);
}

} // namespace

TEST_CASE("Sample project decodes with every section", "[project][decode]") {
    const Project project = LoadSampleProject();

    REQUIRE(project.name == "test");
    REQUIRE(project.ogmoVersion == "3.4.0");
    REQUIRE(project.levelValues.size() == 5);
    REQUIRE(project.compactExport == false);
    REQUIRE(project.entityTags == std::vector<std::string>{"actor"});

    REQUIRE(project.layers.size() == 5);
    REQUIRE(project.layers[0].Kind() == LayerTemplateKind::Entity);
    REQUIRE(project.layers[1].Kind() == LayerTemplateKind::Tile);
    REQUIRE(project.layers[3].Kind() == LayerTemplateKind::Grid);
    REQUIRE(project.layers[4].Kind() == LayerTemplateKind::Decal);

    REQUIRE(project.entities.size() == 1);
    REQUIRE(project.entities[0].rotationDegrees == Catch::Approx(22.5));
    REQUIRE(project.tilesets.size() == 1);
}

TEST_CASE("Project lookups find templates by name", "[project]") {
    const Project project = LoadSampleProject();

    const auto* solids = project.FindLayerTemplate("solids");
    REQUIRE(solids != nullptr);
    REQUIRE(solids->ExportId() == "00000004");
    REQUIRE(project.FindLayerTemplate("missing") == nullptr);

    REQUIRE(project.FindEntityTemplate("player") != nullptr);
    REQUIRE(project.FindEntityTemplate("enemy") == nullptr);

    const auto* tiles = project.FindTileset("tiles");
    REQUIRE(tiles != nullptr);
    REQUIRE(tiles->tileWidth == 16);
}

TEST_CASE("Project survives an encode and decode cycle", "[project][encode]") {
    const Project project = LoadSampleProject();

    auto encoded = ogmo::project::EncodeProject(project);
    REQUIRE(encoded.Ok());
    REQUIRE((*encoded)["layerGridDefaultSize"]["x"].is_number_integer());

    auto decoded = ogmo::project::DecodeProjectJson(*encoded);
    REQUIRE(decoded.Ok());
    REQUIRE(*decoded == project);
}

TEST_CASE("Minimal project decodes and leaves optional fields empty", "[project][decode]") {
    auto project = ogmo::project::DecodeProject(MinimalProjectJson());
    REQUIRE(project.Ok());
    REQUIRE_FALSE(project->compactExport.has_value());
    REQUIRE_FALSE(project->playCommand.has_value());

    auto encoded = ogmo::project::EncodeProject(*project);
    REQUIRE(encoded.Ok());
    REQUIRE_FALSE(encoded->contains("compactExport"));
    REQUIRE_FALSE(encoded->contains("externalScript"));
}

TEST_CASE("Projects without a name fail with MissingField", "[project][errors]") {
    Json tree = Json::parse(MinimalProjectJson());
    tree.erase("name");

    auto project = ogmo::project::DecodeProjectJson(tree);
    REQUIRE_FALSE(project.Ok());
    REQUIRE(project.Error().kind() == ErrorKind::MissingField);
    REQUIRE(project.Error().path() == "name");
}

TEST_CASE("Errors inside nested templates carry their path", "[project][errors]") {
    Json tree = Json::parse(MinimalProjectJson());
    tree["tilesets"][0]["tileWidth"] = "sixteen";

    auto project = ogmo::project::DecodeProjectJson(tree);
    REQUIRE_FALSE(project.Ok());
    REQUIRE(project.Error().kind() == ErrorKind::TypeMismatch);
    REQUIRE(project.Error().path() == "tilesets[0].tileWidth");
}

TEST_CASE("Projects from another major editor version log a warning", "[project][version]") {
    Json tree = Json::parse(MinimalProjectJson());
    tree["ogmoVersion"] = "2.1.0";

    {
        WarningCapture capture;
        auto project = ogmo::project::DecodeProjectJson(tree);
        REQUIRE(project.Ok());
        REQUIRE(capture.lines.size() == 1);
        REQUIRE(capture.lines.front().find("[EditorVersion] minimal") != std::string::npos);
    }

    {
        WarningCapture capture;
        ogmo::utils::DecodeConfig quiet;
        quiet.warnOnVersionMismatch = false;
        REQUIRE(ogmo::project::DecodeProjectJson(tree, quiet).Ok());
        REQUIRE(capture.lines.empty());
    }
}

TEST_CASE("Non-finite numbers make project encoding fail", "[project][encode][errors]") {
    Project project = LoadSampleProject();
    project.entities[0].rotationDegrees = std::numeric_limits<double>::quiet_NaN();

    auto encoded = ogmo::project::EncodeProject(project);
    REQUIRE_FALSE(encoded.Ok());
    REQUIRE(encoded.Error().kind() == ErrorKind::NumericRange);
    REQUIRE(encoded.Error().path() == "entities[0].rotationDegrees");
}

TEST_CASE("Project text output honours the indent argument", "[project][encode]") {
    auto project = ogmo::project::DecodeProject(MinimalProjectJson());
    REQUIRE(project.Ok());

    auto pretty = ogmo::project::EncodeProjectText(*project, 4);
    REQUIRE(pretty.Ok());
    REQUIRE(pretty->find("\n    \"name\"") != std::string::npos);

    auto compact = ogmo::project::EncodeProjectText(*project, -1);
    REQUIRE(compact.Ok());
    REQUIRE(compact->find('\n') == std::string::npos);
}
