#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ogmo::utils {

struct EncodeConfig {
    int indent = 2;
    // Always write files without indentation.
    bool compact = false;
    // Projects with `compactExport` set have their files written compact.
    bool honorCompactExport = true;
};

struct DecodeConfig {
    bool warnOnVersionMismatch = true;
};

struct LoggingConfig {
    std::filesystem::path file;
    bool debug = false;
};

struct AppConfig {
    EncodeConfig encode;
    DecodeConfig decode;
    LoggingConfig logging;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Values that were rejected and replaced
    std::vector<std::string> warnings;    // Values that were clamped or ignored

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    // Points the logger at the configured file and debug switch.
    static void ApplyLogging(const AppConfig& config);

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateEncodeConfig(EncodeConfig& encode, ConfigLoadResult& result);
};

} // namespace ogmo::utils
