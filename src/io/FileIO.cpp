#include "ogmo/io/FileIO.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include "ogmo/core/Logger.hpp"

namespace ogmo::io {

namespace {

core::SchemaError IoError(const std::filesystem::path& path, std::string details) {
    return core::SchemaError(core::ErrorKind::Io, path.string(), std::move(details));
}

int ResolveIndent(const utils::EncodeConfig& config, const project::Project* owner) {
    if (config.compact) {
        return -1;
    }
    if (config.honorCompactExport && owner && owner->compactExport.value_or(false)) {
        return -1;
    }
    return config.indent;
}

core::Result<std::filesystem::path> WriteTextFile(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        if (!std::filesystem::create_directories(parent, ec)) {
            core::Logger::Error("[FileIO] Failed to create directory: {} ({})", parent.string(), ec.message());
            return IoError(path, fmt::format("unable to create directory: {}", ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        core::Logger::Error("[FileIO] Failed to open '{}' for writing", path.string());
        return IoError(path, "failed to open file for writing");
    }
    out << text;
    if (!out.good()) {
        core::Logger::Error("[FileIO] Failed while writing '{}'", path.string());
        return IoError(path, "failed while writing file");
    }
    return path;
}

} // namespace

core::Result<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        core::Logger::Error("[FileIO] File not found or unreadable: {}", path.string());
        return IoError(path, "file not found or unreadable");
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        core::Logger::Error("[FileIO] Failed while reading '{}'", path.string());
        return IoError(path, "failed while reading file");
    }
    return text;
}

core::Result<project::Project> LoadProjectFile(const std::filesystem::path& path,
                                               const utils::DecodeConfig& config) {
    auto text = ReadTextFile(path);
    if (!text) {
        return text.Error();
    }
    auto project = project::DecodeProject(*text, config);
    if (!project) {
        core::Logger::Error("[FileIO] Failed to decode project '{}': {}", path.string(), project.Error().what());
        return project;
    }
    core::Logger::Info("[FileIO] Loaded project '{}' from {}", project->name, path.string());
    return project;
}

core::Result<level::Level> LoadLevelFile(const std::filesystem::path& path,
                                         const utils::DecodeConfig& config) {
    auto text = ReadTextFile(path);
    if (!text) {
        return text.Error();
    }
    auto level = level::DecodeLevel(*text, config);
    if (!level) {
        core::Logger::Error("[FileIO] Failed to decode level '{}': {}", path.string(), level.Error().what());
        return level;
    }
    core::Logger::Info("[FileIO] Loaded level {} ({} layers)", path.string(), level->layers.size());
    return level;
}

core::Result<std::filesystem::path> SaveProjectFile(const project::Project& project,
                                                    const std::filesystem::path& path,
                                                    const utils::EncodeConfig& config) {
    auto text = project::EncodeProjectText(project, ResolveIndent(config, &project));
    if (!text) {
        core::Logger::Error("[FileIO] Failed to encode project '{}': {}", project.name, text.Error().what());
        return text.Error();
    }
    auto written = WriteTextFile(path, *text);
    if (written) {
        core::Logger::Info("[FileIO] Saved project '{}' to {}", project.name, path.string());
    }
    return written;
}

core::Result<std::filesystem::path> SaveLevelFile(const level::Level& level,
                                                  const std::filesystem::path& path,
                                                  const utils::EncodeConfig& config,
                                                  const project::Project* owner) {
    auto text = level::EncodeLevelText(level, ResolveIndent(config, owner));
    if (!text) {
        core::Logger::Error("[FileIO] Failed to encode level {}: {}", path.string(), text.Error().what());
        return text.Error();
    }
    auto written = WriteTextFile(path, *text);
    if (written) {
        core::Logger::Info("[FileIO] Saved level to {}", path.string());
    }
    return written;
}

} // namespace ogmo::io
