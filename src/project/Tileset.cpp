#include "ogmo/project/Tileset.hpp"

#include <algorithm>

#include "ogmo/core/Logger.hpp"

namespace ogmo::project {

std::vector<core::Vec2i> Tileset::TileCoords(int textureWidth, int textureHeight) const {
    const int stepX = tileWidth + tileSeparationX;
    const int stepY = tileHeight + tileSeparationY;
    if (tileWidth <= 0 || tileHeight <= 0 || stepX <= 0 || stepY <= 0) {
        core::Logger::Warning("[Tileset] '{}' has a non-positive tile size {}x{}", label, tileWidth, tileHeight);
        return {};
    }

    const int marginX = tileMarginX.value_or(0);
    const int marginY = tileMarginY.value_or(0);
    // The last column and row have no trailing separation.
    const int tilesX = std::max(0, (textureWidth - 2 * marginX + tileSeparationX) / stepX);
    const int tilesY = std::max(0, (textureHeight - 2 * marginY + tileSeparationY) / stepY);

    std::vector<core::Vec2i> coords;
    coords.reserve(static_cast<std::size_t>(tilesX) * static_cast<std::size_t>(tilesY));
    for (int y = 0; y < tilesY; ++y) {
        for (int x = 0; x < tilesX; ++x) {
            coords.emplace_back(marginX + x * stepX, marginY + y * stepY);
        }
    }
    return coords;
}

Tileset DecodeTileset(const core::JsonReader& reader) {
    reader.ExpectObject();
    Tileset tileset;
    tileset.label = reader.String("label");
    tileset.path = reader.String("path");
    tileset.image = reader.String("image");
    tileset.tileWidth = reader.Int("tileWidth");
    tileset.tileHeight = reader.Int("tileHeight");
    tileset.tileSeparationX = reader.Int("tileSeparationX");
    tileset.tileSeparationY = reader.Int("tileSeparationY");
    tileset.tileMarginX = reader.OptionalInt("tileMarginX");
    tileset.tileMarginY = reader.OptionalInt("tileMarginY");
    return tileset;
}

core::Json EncodeTileset(const Tileset& tileset) {
    core::Json out = core::Json::object();
    out["label"] = tileset.label;
    out["path"] = tileset.path;
    out["image"] = tileset.image;
    out["tileWidth"] = tileset.tileWidth;
    out["tileHeight"] = tileset.tileHeight;
    out["tileSeparationX"] = tileset.tileSeparationX;
    out["tileSeparationY"] = tileset.tileSeparationY;
    if (tileset.tileMarginX) {
        out["tileMarginX"] = *tileset.tileMarginX;
    }
    if (tileset.tileMarginY) {
        out["tileMarginY"] = *tileset.tileMarginY;
    }
    return out;
}

} // namespace ogmo::project
