#include "ogmo/io/FileIO.hpp"

#include "TestDataHelpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using ogmo::core::ErrorKind;

TEST_CASE("Sample files load from disk", "[io]") {
    auto project = ogmo::io::LoadProjectFile(TestDataPath("sample_project/test.ogmo"));
    REQUIRE(project.Ok());
    REQUIRE(project->name == "test");

    auto level = ogmo::io::LoadLevelFile(TestDataPath("sample_project/levels/uno.json"));
    REQUIRE(level.Ok());
    REQUIRE(level->layers.size() == 5);
}

TEST_CASE("Missing files report an Io error with their path", "[io][errors]") {
    TempDirectory temp;
    const auto missing = temp.root / "nope.ogmo";

    auto project = ogmo::io::LoadProjectFile(missing);
    REQUIRE_FALSE(project.Ok());
    REQUIRE(project.Error().kind() == ErrorKind::Io);
    REQUIRE(project.Error().path() == missing.string());

    auto text = ogmo::io::ReadTextFile(missing);
    REQUIRE_FALSE(text.Ok());
    REQUIRE(text.Error().kind() == ErrorKind::Io);
}

TEST_CASE("Decode errors from files keep their field path", "[io][errors]") {
    TempDirectory temp;
    const auto path = temp.root / "bad.json";
    WriteTextFile(path, R"({"width": "wide", "height": 8, "offsetX": 0, "offsetY": 0, "layers": []})");

    auto level = ogmo::io::LoadLevelFile(path);
    REQUIRE_FALSE(level.Ok());
    REQUIRE(level.Error().kind() == ErrorKind::TypeMismatch);
    REQUIRE(level.Error().path() == "width");
}

TEST_CASE("Saved files load back unchanged", "[io][encode]") {
    TempDirectory temp;
    auto project = ogmo::io::LoadProjectFile(TestDataPath("sample_project/test.ogmo"));
    auto level = ogmo::io::LoadLevelFile(TestDataPath("sample_project/levels/uno.json"));
    REQUIRE(project.Ok());
    REQUIRE(level.Ok());

    auto projectPath = ogmo::io::SaveProjectFile(*project, temp.root / "copy.ogmo");
    REQUIRE(projectPath.Ok());
    auto levelPath = ogmo::io::SaveLevelFile(*level, temp.root / "levels" / "nested" / "uno.json");
    REQUIRE(levelPath.Ok());
    REQUIRE(std::filesystem::exists(*levelPath));

    auto projectAgain = ogmo::io::LoadProjectFile(*projectPath);
    auto levelAgain = ogmo::io::LoadLevelFile(*levelPath);
    REQUIRE(projectAgain.Ok());
    REQUIRE(levelAgain.Ok());
    REQUIRE(*projectAgain == *project);
    REQUIRE(*levelAgain == *level);

    REQUIRE(ReadTextFile(*levelPath).find('\n') != std::string::npos);
}

TEST_CASE("Compact output follows the project and the encode config", "[io][encode]") {
    TempDirectory temp;
    auto project = ogmo::io::LoadProjectFile(TestDataPath("sample_project/test.ogmo"));
    auto level = ogmo::io::LoadLevelFile(TestDataPath("sample_project/levels/uno.json"));
    REQUIRE(project.Ok());
    REQUIRE(level.Ok());

    project->compactExport = true;
    auto owned = ogmo::io::SaveLevelFile(*level, temp.root / "owned.json", {}, &*project);
    REQUIRE(owned.Ok());
    REQUIRE(ReadTextFile(*owned).find('\n') == std::string::npos);

    ogmo::utils::EncodeConfig ignoreProject;
    ignoreProject.honorCompactExport = false;
    auto pretty = ogmo::io::SaveLevelFile(*level, temp.root / "pretty.json", ignoreProject, &*project);
    REQUIRE(pretty.Ok());
    REQUIRE(ReadTextFile(*pretty).find('\n') != std::string::npos);

    ogmo::utils::EncodeConfig compact;
    compact.compact = true;
    auto forced = ogmo::io::SaveLevelFile(*level, temp.root / "forced.json", compact);
    REQUIRE(forced.Ok());
    REQUIRE(ReadTextFile(*forced).find('\n') == std::string::npos);
}
