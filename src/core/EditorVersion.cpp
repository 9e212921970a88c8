#include "ogmo/core/EditorVersion.hpp"

#include <array>
#include <charconv>
#include <sstream>

#include "ogmo/core/Logger.hpp"

namespace ogmo::core {

namespace {

int ParseComponent(std::string_view str, const char* label) {
    int value = 0;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec != std::errc{} || result.ptr != str.data() + str.size()) {
        Logger::Warning("[EditorVersion] Failed to parse {} component '{}'", label, str);
        return 0;
    }
    return value;
}

} // namespace

std::string EditorVersion::ToString() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    if (!prerelease.empty()) {
        oss << '-' << prerelease;
    }
    return oss.str();
}

bool EditorVersion::IsCompatibleWith(const EditorVersion& supported) const {
    // Ogmo 3 kept the file layout stable across minor releases; fields added
    // later are modelled as optional.
    return major == supported.major;
}

EditorVersion ParseEditorVersion(std::string_view versionString) {
    EditorVersion version;
    if (versionString.empty()) {
        return version;
    }

    std::string_view core = versionString;
    auto dashPos = versionString.find('-');
    if (dashPos != std::string_view::npos) {
        core = versionString.substr(0, dashPos);
        version.prerelease = std::string(versionString.substr(dashPos + 1));
    }

    std::array<std::string_view, 3> components{};
    size_t start = 0;
    size_t index = 0;
    while (start <= core.size() && index < components.size()) {
        size_t dotPos = core.find('.', start);
        if (dotPos == std::string_view::npos) {
            components[index++] = core.substr(start);
            break;
        }
        components[index++] = core.substr(start, dotPos - start);
        start = dotPos + 1;
    }

    if (index >= 1) {
        version.major = ParseComponent(components[0], "major");
    }
    if (index >= 2) {
        version.minor = ParseComponent(components[1], "minor");
    }
    if (index >= 3) {
        version.patch = ParseComponent(components[2], "patch");
    }

    return version;
}

void CheckEditorVersion(std::string_view versionString, std::string_view source) {
    const EditorVersion version = ParseEditorVersion(versionString);
    const EditorVersion supported = EditorVersion::Supported();
    if (!version.IsCompatibleWith(supported)) {
        Logger::Warning("[EditorVersion] {} was written by Ogmo {}, this library reads Ogmo {}.x files",
                        source, version.ToString(), supported.major);
    }
}

} // namespace ogmo::core
