#include "ogmo/project/Tileset.hpp"

#include <catch2/catch_test_macros.hpp>

using ogmo::core::Vec2i;
using ogmo::project::Tileset;

TEST_CASE("Tileset tile coordinates walk the image row by row", "[project][tileset]") {
    Tileset tileset;
    tileset.label = "terrain";
    tileset.tileWidth = 16;
    tileset.tileHeight = 16;

    const auto coords = tileset.TileCoords(48, 32);
    REQUIRE(coords.size() == 6);
    REQUIRE(coords[0] == Vec2i(0, 0));
    REQUIRE(coords[2] == Vec2i(32, 0));
    REQUIRE(coords[3] == Vec2i(0, 16));
    REQUIRE(coords[5] == Vec2i(32, 16));
}

TEST_CASE("Tileset tile coordinates honour separation and margin", "[project][tileset]") {
    Tileset tileset;
    tileset.tileWidth = 16;
    tileset.tileHeight = 8;
    tileset.tileSeparationX = 2;
    tileset.tileSeparationY = 1;
    tileset.tileMarginX = 1;
    tileset.tileMarginY = 3;

    // 1 + 16 + 2 + 16 + 2 + 16 + 1 = 54 wide, 3 + 8 + 1 + 8 + 3 = 23 tall.
    const auto coords = tileset.TileCoords(54, 23);
    REQUIRE(coords.size() == 6);
    REQUIRE(coords[0] == Vec2i(1, 3));
    REQUIRE(coords[1] == Vec2i(19, 3));
    REQUIRE(coords[2] == Vec2i(37, 3));
    REQUIRE(coords[3] == Vec2i(1, 12));
}

TEST_CASE("Tileset with no tile size yields no coordinates", "[project][tileset]") {
    Tileset tileset;
    REQUIRE(tileset.TileCoords(64, 64).empty());
}

TEST_CASE("Tileset margins are written only when present", "[project][tileset][encode]") {
    Tileset tileset;
    tileset.label = "old";
    tileset.tileWidth = 8;
    tileset.tileHeight = 8;

    const auto encoded = ogmo::project::EncodeTileset(tileset);
    REQUIRE_FALSE(encoded.contains("tileMarginX"));

    const auto decoded = ogmo::project::DecodeTileset(ogmo::core::JsonReader(encoded, "tilesets[0]"));
    REQUIRE(decoded == tileset);
}
