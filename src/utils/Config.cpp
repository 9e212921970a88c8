#include "ogmo/utils/Config.hpp"

#include <fstream>
#include <system_error>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include "ogmo/core/Logger.hpp"

namespace ogmo::utils {

namespace {

constexpr int kMinIndent = 0;
constexpr int kMaxIndent = 8;

static std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

static std::filesystem::path ResolvePath(const std::filesystem::path& baseDir,
                                         const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
static T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        ogmo::core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

} // namespace

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        ogmo::core::Logger::Warning(
            "[ConfigLoader] Config file '{}' not found, using defaults",
            path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        ogmo::core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        ogmo::core::Logger::Error("[ConfigLoader] Failed to parse JSON '{}': {}",
                                  path.string(), e.what());
        return result;
    }

    const auto encodeObj = json.contains("encode") ? json["encode"] : nlohmann::json::object();
    result.config.encode.indent = GetOrDefault<int>(encodeObj, "indent", result.config.encode.indent);
    result.config.encode.compact = GetOrDefault<bool>(encodeObj, "compact", result.config.encode.compact);
    result.config.encode.honorCompactExport =
        GetOrDefault<bool>(encodeObj, "honorCompactExport", result.config.encode.honorCompactExport);

    const auto decodeObj = json.contains("decode") ? json["decode"] : nlohmann::json::object();
    result.config.decode.warnOnVersionMismatch =
        GetOrDefault<bool>(decodeObj, "warnOnVersionMismatch", result.config.decode.warnOnVersionMismatch);

    const auto loggingObj = json.contains("logging") ? json["logging"] : nlohmann::json::object();
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        const auto value = loggingObj["file"].get<std::string>();
        if (!value.empty()) {
            result.config.logging.file = ResolvePath(baseDir, value);
        }
    }
    result.config.logging.debug = GetOrDefault<bool>(loggingObj, "debug", result.config.logging.debug);

    result.config.configDirectory = baseDir;
    result.loadedFromFile = true;

    ValidateConfig(result.config, result);

    for (const auto& warning : result.warnings) {
        ogmo::core::Logger::Warning("[ConfigLoader] {}", warning);
    }

    for (const auto& error : result.errors) {
        ogmo::core::Logger::Error("[ConfigLoader] {}", error);
    }

    ogmo::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ApplyLogging(const AppConfig& config) {
    ogmo::core::Logger::SetDebugEnabled(config.logging.debug);
    if (!config.logging.file.empty()) {
        ogmo::core::Logger::SetLogFile(config.logging.file);
    }
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    ValidateEncodeConfig(config.encode, result);

    if (!config.logging.file.empty()) {
        std::error_code ec;
        const auto parent = config.logging.file.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            result.warnings.push_back(
                fmt::format("Log directory does not exist yet and will be created: {}", parent.string()));
        }
    }
}

void ConfigLoader::ValidateEncodeConfig(EncodeConfig& encode, ConfigLoadResult& result) {
    if (encode.indent < kMinIndent || encode.indent > kMaxIndent) {
        result.errors.push_back(
            fmt::format("encode.indent ({}) must be between {} and {}",
                        encode.indent, kMinIndent, kMaxIndent));
        encode.indent = std::clamp(encode.indent, kMinIndent, kMaxIndent);
    }

    if (encode.compact && encode.indent != EncodeConfig{}.indent) {
        result.warnings.push_back("encode.indent is ignored while encode.compact is set");
    }
}

} // namespace ogmo::utils
