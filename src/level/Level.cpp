#include "ogmo/level/Level.hpp"

#include <algorithm>

#include "ogmo/core/EditorVersion.hpp"
#include "ogmo/core/Logger.hpp"

namespace ogmo::level {

using core::Json;
using core::JsonReader;

namespace {

Level DecodeLevelTree(const Json& tree, const utils::DecodeConfig& config) {
    const JsonReader reader(tree, "");
    reader.ExpectObject();

    Level level;
    level.ogmoVersion = reader.OptionalString("ogmoVersion");
    if (level.ogmoVersion && config.warnOnVersionMismatch) {
        core::CheckEditorVersion(*level.ogmoVersion, "level");
    }
    level.width = reader.Number("width");
    level.height = reader.Number("height");
    level.offsetX = reader.Number("offsetX");
    level.offsetY = reader.Number("offsetY");
    level.layers = reader.Child("layers").Map(DecodeLayer);
    // Levels saved before any level value was declared have no `values` key.
    if (auto values = reader.OptionalChild("values")) {
        level.values = values::DecodeValueMap(*values);
    }

    core::Logger::Debug("[LevelCodec] Decoded {}x{} level with {} layers", level.width.Value(), level.height.Value(),
                        level.layers.size());
    return level;
}

Json EncodeLevelTree(const Level& level) {
    Json out = Json::object();
    if (level.ogmoVersion) {
        out["ogmoVersion"] = *level.ogmoVersion;
    }
    out["width"] = core::EncodeNumber(level.width, "width");
    out["height"] = core::EncodeNumber(level.height, "height");
    out["offsetX"] = core::EncodeNumber(level.offsetX, "offsetX");
    out["offsetY"] = core::EncodeNumber(level.offsetY, "offsetY");

    Json layers = Json::array();
    for (std::size_t i = 0; i < level.layers.size(); ++i) {
        layers.push_back(EncodeLayer(level.layers[i], core::JoinPath("layers", i)));
    }
    out["layers"] = std::move(layers);
    out["values"] = values::EncodeValueMap(level.values, "values");
    return out;
}

} // namespace

const Layer* Level::FindLayer(std::string_view name) const {
    auto it = std::find_if(layers.begin(), layers.end(),
                           [name](const Layer& layer) { return layer.Name() == name; });
    return it == layers.end() ? nullptr : &*it;
}

core::Result<Level> DecodeLevel(std::string_view text, const utils::DecodeConfig& config) {
    return core::Capture([&] { return DecodeLevelTree(core::ParseJson(text), config); });
}

core::Result<Level> DecodeLevelJson(const Json& tree, const utils::DecodeConfig& config) {
    return core::Capture([&] { return DecodeLevelTree(tree, config); });
}

core::Result<Json> EncodeLevel(const Level& level) {
    return core::Capture([&] { return EncodeLevelTree(level); });
}

core::Result<std::string> EncodeLevelText(const Level& level, int indent) {
    return core::Capture([&] { return EncodeLevelTree(level).dump(indent); });
}

} // namespace ogmo::level
