#include "TestDataHelpers.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

namespace {

std::filesystem::path MakeTempDirectory() {
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 0xFFFFFF);
    std::filesystem::path dir;
    do {
        dir = base / ("OgmoCpp_" + std::to_string(dist(rd)));
    } while (std::filesystem::exists(dir));
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

std::filesystem::path TestDataPath(const std::string& relative) {
    return std::filesystem::path(OGMO_TEST_DATA_DIR) / relative;
}

std::string LoadTestData(const std::string& relative) {
    return ReadTextFile(TestDataPath(relative));
}

TempDirectory::TempDirectory() : root(MakeTempDirectory()) {}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

void WriteTextFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
    out << contents;
}

std::string ReadTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string MinimalProjectJson() {
    return R"({
        "name": "minimal",
        "ogmoVersion": "3.4.0",
        "levelPaths": ["."],
        "backgroundColor": "#000000ff",
        "gridColor": "#ffffff33",
        "anglesRadians": true,
        "directoryDepth": 5,
        "layerGridDefaultSize": {"x": 16, "y": 16},
        "levelDefaultSize": {"x": 320, "y": 240},
        "levelMinSize": {"x": 128, "y": 128},
        "levelMaxSize": {"x": 4096, "y": 4096},
        "levelValues": [],
        "defaultExportMode": ".json",
        "entityTags": [],
        "layers": [
            {"definition": "tile", "name": "ground", "gridSize": {"x": 16, "y": 16}, "exportID": "1",
             "exportMode": 0, "arrayMode": 0, "defaultTileset": "1"}
        ],
        "entities": [],
        "tilesets": [
            {"label": "1", "path": "ground.png", "image": "", "tileWidth": 16, "tileHeight": 16,
             "tileSeparationX": 0, "tileSeparationY": 0}
        ]
    })";
}
