#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ogmo/core/Json.hpp"
#include "ogmo/core/Result.hpp"
#include "ogmo/level/Layer.hpp"
#include "ogmo/utils/Config.hpp"
#include "ogmo/values/Value.hpp"

namespace ogmo::level {

struct Level {
    core::Scalar width;
    core::Scalar height;
    // Position of this level when several chunks make up one world.
    core::Scalar offsetX;
    core::Scalar offsetY;
    std::optional<std::string> ogmoVersion;
    // Render order, first layer on top as listed by the editor.
    std::vector<Layer> layers;
    values::ValueMap values;

    const Layer* FindLayer(std::string_view name) const;

    [[nodiscard]] bool operator==(const Level&) const = default;
};

core::Result<Level> DecodeLevel(std::string_view text, const utils::DecodeConfig& config = {});
core::Result<Level> DecodeLevelJson(const core::Json& tree, const utils::DecodeConfig& config = {});

core::Result<core::Json> EncodeLevel(const Level& level);
// indent < 0 writes everything on one line.
core::Result<std::string> EncodeLevelText(const Level& level, int indent = 2);

} // namespace ogmo::level
