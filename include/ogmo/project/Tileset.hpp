#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ogmo/core/Json.hpp"

namespace ogmo::project {

struct Tileset {
    std::string label;
    // Image path relative to the project file.
    std::string path;
    // Base64 data URI of the image as embedded by the editor.
    std::string image;
    int tileWidth = 0;
    int tileHeight = 0;
    int tileSeparationX = 0;
    int tileSeparationY = 0;
    // Written by Ogmo 3.3 and later.
    std::optional<int> tileMarginX;
    std::optional<int> tileMarginY;

    /**
     * @brief Pixel origin of every tile in the image, row by row.
     *
     * The project does not store the image size, so the caller passes the
     * dimensions of the loaded texture. Index i of the result is tile id i.
     */
    [[nodiscard]] std::vector<core::Vec2i> TileCoords(int textureWidth, int textureHeight) const;

    [[nodiscard]] bool operator==(const Tileset&) const = default;
};

Tileset DecodeTileset(const core::JsonReader& reader);
core::Json EncodeTileset(const Tileset& tileset);

} // namespace ogmo::project
