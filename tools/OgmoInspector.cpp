#include "ogmo/core/Logger.hpp"
#include "ogmo/io/FileIO.hpp"
#include "ogmo/level/Level.hpp"
#include "ogmo/project/Project.hpp"
#include "ogmo/utils/Config.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Options {
    std::filesystem::path configPath;
    bool roundTrip = false;
    std::filesystem::path projectPath;
    std::vector<std::filesystem::path> levelPaths;
};

void PrintUsage() {
    fmt::print("Usage: OgmoInspector [--config file] [--roundtrip] <project.ogmo> [level.json ...]\n");
}

bool ParseArguments(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --config needs a file argument.\n");
                return false;
            }
            options.configPath = argv[++i];
        } else if (arg == "--roundtrip") {
            options.roundTrip = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            fmt::print(stderr, "Error: unknown option '{}'.\n", arg);
            return false;
        } else if (options.projectPath.empty()) {
            options.projectPath = argv[i];
        } else {
            options.levelPaths.emplace_back(argv[i]);
        }
    }
    return !options.projectPath.empty();
}

void PrintProject(const ogmo::project::Project& project) {
    fmt::print("Project '{}' (ogmo {})\n", project.name, project.ogmoVersion.value_or("unknown"));
    fmt::print("  Level paths:   {}\n", project.levelPaths.size());
    fmt::print("  Level values:  {}\n", project.levelValues.size());
    fmt::print("  Tilesets:      {}\n", project.tilesets.size());
    fmt::print("  Entities:      {}\n", project.entities.size());

    if (!project.layers.empty()) {
        fmt::print("\nLayers:\n");
        for (std::size_t i = 0; i < project.layers.size(); ++i) {
            const auto& layer = project.layers[i];
            fmt::print("  [{}] '{}': kind={}, grid={}x{}\n",
                       i,
                       layer.Name(),
                       ogmo::project::LayerTemplateKindName(layer.Kind()),
                       layer.GridSize().x,
                       layer.GridSize().y);
        }
    }

    if (!project.tilesets.empty()) {
        fmt::print("\nTilesets:\n");
        for (const auto& tileset : project.tilesets) {
            fmt::print("  '{}': {} tile={}x{}\n", tileset.label, tileset.path, tileset.tileWidth, tileset.tileHeight);
        }
    }
}

void PrintLevel(const std::filesystem::path& path,
                const ogmo::level::Level& level,
                const ogmo::project::Project& project) {
    fmt::print("\nLevel '{}': {}x{} at ({}, {})\n", path.string(), level.width.Value(), level.height.Value(),
               level.offsetX.Value(), level.offsetY.Value());
    for (const auto& layer : level.layers) {
        std::size_t items = 0;
        if (auto tiles = layer.UnpackAs<ogmo::level::TileLayer>()) {
            items = tiles->get().Unpack().size();
        } else if (auto coords = layer.UnpackAs<ogmo::level::TileCoordsLayer>()) {
            items = coords->get().Unpack().size();
        } else if (auto grid = layer.UnpackAs<ogmo::level::GridLayer>()) {
            items = grid->get().Unpack().size();
        } else if (auto entities = layer.UnpackAs<ogmo::level::EntityLayer>()) {
            items = entities->get().entities.size();
        } else if (auto decals = layer.UnpackAs<ogmo::level::DecalLayer>()) {
            items = decals->get().decals.size();
        }
        const bool declared = project.FindLayerTemplate(layer.Name()) != nullptr;
        fmt::print("  '{}': kind={}, items={}{}\n", layer.Name(), ogmo::level::LayerKindName(layer.Kind()),
                   items, declared ? "" : " (not declared in project)");
    }

    auto resolved = ogmo::project::ResolveValues(project.levelValues, level.values);
    if (!resolved) {
        fmt::print("  Values: {}\n", resolved.Error().what());
        return;
    }
    for (const auto& entry : *resolved) {
        fmt::print("  value '{}': {}\n", entry.name, ogmo::values::ValueKindName(entry.value.Kind()));
    }
}

template <typename Model, typename Encode, typename Decode>
bool CheckRoundTrip(const std::filesystem::path& path, const Model& model, Encode encode, Decode decode) {
    auto tree = encode(model);
    if (!tree) {
        fmt::print(stderr, "  round trip of '{}' failed to encode: {}\n", path.string(), tree.Error().what());
        return false;
    }
    auto decoded = decode(*tree);
    if (!decoded) {
        fmt::print(stderr, "  round trip of '{}' failed to decode: {}\n", path.string(), decoded.Error().what());
        return false;
    }
    const bool equal = *decoded == model;
    fmt::print("  round trip of '{}': {}\n", path.string(), equal ? "equal" : "DIFFERENT");
    return equal;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!ParseArguments(argc, argv, options)) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    ogmo::utils::AppConfig config;
    if (!options.configPath.empty()) {
        const auto loaded = ogmo::utils::ConfigLoader::Load(options.configPath);
        config = loaded.config;
    }
    ogmo::utils::ConfigLoader::ApplyLogging(config);

    const auto project = ogmo::io::LoadProjectFile(options.projectPath, config.decode);
    if (!project) {
        fmt::print(stderr, "Error: {}\n", project.Error().what());
        return EXIT_FAILURE;
    }
    PrintProject(*project);

    bool ok = true;
    if (options.roundTrip) {
        ok &= CheckRoundTrip(options.projectPath, *project,
                             [](const auto& model) { return ogmo::project::EncodeProject(model); },
                             [&config](const auto& tree) { return ogmo::project::DecodeProjectJson(tree, config.decode); });
    }

    for (const auto& levelPath : options.levelPaths) {
        const auto level = ogmo::io::LoadLevelFile(levelPath, config.decode);
        if (!level) {
            fmt::print(stderr, "Error: {}\n", level.Error().what());
            ok = false;
            continue;
        }
        PrintLevel(levelPath, *level, *project);
        if (options.roundTrip) {
            ok &= CheckRoundTrip(levelPath, *level,
                                 [](const auto& model) { return ogmo::level::EncodeLevel(model); },
                                 [&config](const auto& tree) { return ogmo::level::DecodeLevelJson(tree, config.decode); });
        }
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
