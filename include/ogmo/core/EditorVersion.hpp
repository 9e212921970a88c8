#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace ogmo::core {

/**
 * @brief Version of the editor that wrote a project or level file.
 *
 * Ogmo stores it as an `ogmoVersion` string such as "3.4.0". Only the
 * major version affects the file layout this library reads.
 */
struct EditorVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;

    constexpr EditorVersion() = default;
    constexpr EditorVersion(int maj, int min, int pat, std::string pre = {})
        : major(maj), minor(min), patch(pat), prerelease(std::move(pre)) {}

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool operator==(const EditorVersion&) const = default;
    [[nodiscard]] bool operator!=(const EditorVersion&) const = default;

    [[nodiscard]] bool IsCompatibleWith(const EditorVersion& supported) const;

    static constexpr EditorVersion Supported() {
        return EditorVersion(3, 4, 0);
    }
};

EditorVersion ParseEditorVersion(std::string_view versionString);

// Logs a warning when `versionString` is not readable by this library.
void CheckEditorVersion(std::string_view versionString, std::string_view source);

} // namespace ogmo::core
