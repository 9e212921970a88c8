#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ogmo::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

enum class ErrorKind {
    MalformedInput,
    MissingField,
    TypeMismatch,
    AmbiguousVariant,
    UnknownVariant,
    NumericRange,
    UnpackMismatch,
    Io
};

constexpr const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:   return "MalformedInput";
        case ErrorKind::MissingField:     return "MissingField";
        case ErrorKind::TypeMismatch:     return "TypeMismatch";
        case ErrorKind::AmbiguousVariant: return "AmbiguousVariant";
        case ErrorKind::UnknownVariant:   return "UnknownVariant";
        case ErrorKind::NumericRange:     return "NumericRange";
        case ErrorKind::UnpackMismatch:   return "UnpackMismatch";
        case ErrorKind::Io:               return "Io";
    }
    return "Unknown";
}

/**
 * @brief Failure while decoding, encoding or unpacking Ogmo data.
 *
 * `path` is the field path inside the document (for example
 * `layers[1].entities[0].x`); it is empty for errors that are not tied to a
 * field, such as unpack mismatches or I/O failures.
 */
class SchemaError : public Error {
public:
    SchemaError(ErrorKind kind,
                std::string path,
                std::string details,
                std::string expected = {},
                std::string actual = {});

    ErrorKind kind() const noexcept { return m_kind; }
    std::string_view path() const noexcept { return m_path; }
    std::string_view details() const noexcept { return m_details; }
    std::string_view expected() const noexcept { return m_expected; }
    std::string_view actual() const noexcept { return m_actual; }

    static SchemaError MissingField(std::string path);
    static SchemaError TypeMismatch(std::string path, std::string expected, std::string actual);
    static SchemaError UnpackMismatch(std::string expected, std::string actual);

private:
    static std::string BuildMessage(ErrorKind kind,
                                    std::string_view path,
                                    const std::string& details,
                                    std::string_view expected,
                                    std::string_view actual);

    ErrorKind m_kind;
    std::string m_path;
    std::string m_details;
    std::string m_expected;
    std::string m_actual;
};

inline std::string SchemaError::BuildMessage(ErrorKind kind,
                                             std::string_view path,
                                             const std::string& details,
                                             std::string_view expected,
                                             std::string_view actual) {
    std::string message;
    message.reserve(path.size() + details.size() + expected.size() + actual.size() + 48);
    message.append("Schema error [");
    message.append(ErrorKindName(kind));
    message.append("]");
    if (!path.empty()) {
        message.append(" ");
        message.append(path);
    }
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    if (!expected.empty() || !actual.empty()) {
        message.append(" (expected ");
        message.append(expected.empty() ? "?" : expected);
        message.append(", found ");
        message.append(actual.empty() ? "?" : actual);
        message.append(")");
    }
    return message;
}

inline SchemaError::SchemaError(ErrorKind kind,
                                std::string path,
                                std::string details,
                                std::string expected,
                                std::string actual)
    : Error(BuildMessage(kind, path, details, expected, actual)),
      m_kind(kind),
      m_path(std::move(path)),
      m_details(std::move(details)),
      m_expected(std::move(expected)),
      m_actual(std::move(actual)) {}

inline SchemaError SchemaError::MissingField(std::string path) {
    return SchemaError(ErrorKind::MissingField, std::move(path), "required field is missing");
}

inline SchemaError SchemaError::TypeMismatch(std::string path, std::string expected, std::string actual) {
    return SchemaError(ErrorKind::TypeMismatch, std::move(path), "unexpected JSON type",
                       std::move(expected), std::move(actual));
}

inline SchemaError SchemaError::UnpackMismatch(std::string expected, std::string actual) {
    return SchemaError(ErrorKind::UnpackMismatch, {}, "wrong variant",
                       std::move(expected), std::move(actual));
}

} // namespace ogmo::core
