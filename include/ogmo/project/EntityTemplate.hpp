#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/project/ValueTemplate.hpp"

namespace ogmo::project {

// Outline the editor draws for entities without a texture.
struct Shape {
    std::string label;
    std::vector<core::Point> points;
    [[nodiscard]] bool operator==(const Shape&) const = default;
};

struct EntityTemplate {
    std::string exportId;
    std::string name;
    // Maximum instances per level, 0 for no limit.
    int limit = 0;
    core::Point size{16, 16};
    core::Point origin;
    bool originAnchored = true;
    Shape shape;
    std::string color;
    bool tileX = false;
    bool tileY = false;
    core::Point tileSize{16, 16};
    bool resizeableX = false;
    bool resizeableY = false;
    bool rotatable = false;
    // Snap interval for rotation.
    core::Scalar rotationDegrees = 360;
    bool canFlipX = false;
    bool canFlipY = false;
    bool canSetColor = false;
    bool hasNodes = false;
    int nodeLimit = 0;
    int nodeDisplay = 0;
    bool nodeGhost = true;
    std::vector<std::string> tags;
    std::vector<ValueTemplate> values;
    std::optional<std::string> texture;
    // Base64 data URI of the texture.
    std::optional<std::string> textureImage;

    [[nodiscard]] bool operator==(const EntityTemplate&) const = default;
};

EntityTemplate DecodeEntityTemplate(const core::JsonReader& reader);
core::Json EncodeEntityTemplate(const EntityTemplate& entity, std::string_view path);

} // namespace ogmo::project
