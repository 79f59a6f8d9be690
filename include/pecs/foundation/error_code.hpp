#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the ECS runtime.

#include <cstdint>
#include <string_view>

namespace pecs::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,
    SystemError = 0x0302,

    // Spatial (0x0400 - 0x04FF)
    InvalidCellSize = 0x0400,
    InvalidWorldBounds = 0x0401,

    // Template (0x0500 - 0x05FF)
    TemplateAlreadyExists = 0x0500,
    TemplateNotFound = 0x0501,

    // Serialization (0x0600 - 0x06FF)
    SnapshotMalformed = 0x0600,
    SnapshotReadFailed = 0x0601,
    SnapshotWriteFailed = 0x0602,
    DuplicateEntityId = 0x0603,

    // Config (0x0700 - 0x07FF)
    ConfigLoadFailed = 0x0700,
    ConfigKeyNotFound = 0x0701,
    ConfigTypeMismatch = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0400: return "Spatial";
        case 0x0500: return "Template";
        case 0x0600: return "Serialization";
        case 0x0700: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for errors raised while configuring a world (grid, templates,
/// config files).  These abort setup instead of degrading gracefully.
constexpr bool isConfigurationError(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    return category == 0x0400 || category == 0x0500 || category == 0x0700;
}

} // namespace pecs::foundation
