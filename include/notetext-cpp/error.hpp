/// @file error.hpp
/// @brief Error types for the notetext-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace notetext_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    decompression_error,  ///< The gzip envelope is malformed or truncated.
    schema_error,         ///< A required field is absent or the wire format is invalid.
    lookup_failure,       ///< The attachment lookup threw for one reference.
    invalid_utf8,         ///< Note text is not well-formed UTF-8.
    store_error,          ///< The note store database could not be read.
    config_error,         ///< A heuristic configuration value is invalid.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::decompression_error: return "decompression_error";
        case ErrorKind::schema_error:        return "schema_error";
        case ErrorKind::lookup_failure:      return "lookup_failure";
        case ErrorKind::invalid_utf8:        return "invalid_utf8";
        case ErrorKind::store_error:         return "store_error";
        case ErrorKind::config_error:        return "config_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown by the note store reader when SQLite reports a failure.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what)
        : std::runtime_error{what} {}
};

}  // namespace notetext_cpp
