#pragma once

#include <filesystem>
#include <string>

#include "ogmo/core/Result.hpp"
#include "ogmo/level/Level.hpp"
#include "ogmo/project/Project.hpp"
#include "ogmo/utils/Config.hpp"

namespace ogmo::io {

// Reads a whole file; failures are ErrorKind::Io.
core::Result<std::string> ReadTextFile(const std::filesystem::path& path);

core::Result<project::Project> LoadProjectFile(const std::filesystem::path& path,
                                               const utils::DecodeConfig& config = {});
core::Result<level::Level> LoadLevelFile(const std::filesystem::path& path,
                                         const utils::DecodeConfig& config = {});

/**
 * @brief Encodes and writes a project, creating missing parent directories.
 *
 * The file is written without indentation when `config.compact` is set, or
 * when `config.honorCompactExport` is set and the project asks for compact
 * export. Returns the path that was written.
 */
core::Result<std::filesystem::path> SaveProjectFile(const project::Project& project,
                                                    const std::filesystem::path& path,
                                                    const utils::EncodeConfig& config = {});

// `owner` supplies the project's compactExport setting when given.
core::Result<std::filesystem::path> SaveLevelFile(const level::Level& level,
                                                  const std::filesystem::path& path,
                                                  const utils::EncodeConfig& config = {},
                                                  const project::Project* owner = nullptr);

} // namespace ogmo::io
