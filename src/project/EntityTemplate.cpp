#include "ogmo/project/EntityTemplate.hpp"

namespace ogmo::project {

using core::Json;
using core::JsonReader;

namespace {

Shape DecodeShape(const JsonReader& reader) {
    reader.ExpectObject();
    Shape shape;
    shape.label = reader.String("label");
    shape.points = reader.Child("points").Map([](const JsonReader& point) { return point.AsPoint(); });
    return shape;
}

Json EncodeShape(const Shape& shape, std::string_view path) {
    Json points = Json::array();
    for (std::size_t i = 0; i < shape.points.size(); ++i) {
        points.push_back(core::EncodeVec2(shape.points[i], core::JoinPath(core::JoinPath(path, "points"), i)));
    }
    return Json{{"label", shape.label}, {"points", std::move(points)}};
}

} // namespace

EntityTemplate DecodeEntityTemplate(const JsonReader& reader) {
    reader.ExpectObject();
    EntityTemplate entity;
    entity.exportId = reader.String("exportID");
    entity.name = reader.String("name");
    entity.limit = reader.Int("limit");
    entity.size = reader.Vec2Number("size");
    entity.origin = reader.Vec2Number("origin");
    entity.originAnchored = reader.Bool("originAnchored");
    entity.shape = DecodeShape(reader.Child("shape"));
    entity.color = reader.String("color");
    entity.tileX = reader.Bool("tileX");
    entity.tileY = reader.Bool("tileY");
    entity.tileSize = reader.Vec2Number("tileSize");
    entity.resizeableX = reader.Bool("resizeableX");
    entity.resizeableY = reader.Bool("resizeableY");
    entity.rotatable = reader.Bool("rotatable");
    entity.rotationDegrees = reader.Number("rotationDegrees");
    entity.canFlipX = reader.Bool("canFlipX");
    entity.canFlipY = reader.Bool("canFlipY");
    entity.canSetColor = reader.Bool("canSetColor");
    entity.hasNodes = reader.Bool("hasNodes");
    entity.nodeLimit = reader.Int("nodeLimit");
    entity.nodeDisplay = reader.Int("nodeDisplay");
    entity.nodeGhost = reader.Bool("nodeGhost");
    entity.tags = reader.StringArray("tags");
    entity.values = DecodeValueTemplates(reader.Child("values"));
    entity.texture = reader.OptionalString("texture");
    entity.textureImage = reader.OptionalString("textureImage");
    return entity;
}

Json EncodeEntityTemplate(const EntityTemplate& entity, std::string_view path) {
    Json out = Json::object();
    out["exportID"] = entity.exportId;
    out["name"] = entity.name;
    out["limit"] = entity.limit;
    out["size"] = core::EncodeVec2(entity.size, core::JoinPath(path, "size"));
    out["origin"] = core::EncodeVec2(entity.origin, core::JoinPath(path, "origin"));
    out["originAnchored"] = entity.originAnchored;
    out["shape"] = EncodeShape(entity.shape, core::JoinPath(path, "shape"));
    out["color"] = entity.color;
    out["tileX"] = entity.tileX;
    out["tileY"] = entity.tileY;
    out["tileSize"] = core::EncodeVec2(entity.tileSize, core::JoinPath(path, "tileSize"));
    out["resizeableX"] = entity.resizeableX;
    out["resizeableY"] = entity.resizeableY;
    out["rotatable"] = entity.rotatable;
    out["rotationDegrees"] = core::EncodeNumber(entity.rotationDegrees, core::JoinPath(path, "rotationDegrees"));
    out["canFlipX"] = entity.canFlipX;
    out["canFlipY"] = entity.canFlipY;
    out["canSetColor"] = entity.canSetColor;
    out["hasNodes"] = entity.hasNodes;
    out["nodeLimit"] = entity.nodeLimit;
    out["nodeDisplay"] = entity.nodeDisplay;
    out["nodeGhost"] = entity.nodeGhost;
    out["tags"] = entity.tags;
    out["values"] = EncodeValueTemplates(entity.values, core::JoinPath(path, "values"));
    if (entity.texture) {
        out["texture"] = *entity.texture;
    }
    if (entity.textureImage) {
        out["textureImage"] = *entity.textureImage;
    }
    return out;
}

} // namespace ogmo::project
