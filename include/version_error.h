// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vnav {

/**
 * @brief Error types for version navigation operations
 */
enum class VersionErrorType {
    NONE,                ///< No error
    NO_VERSION_TOKEN,    ///< Path has no "vNNN" marker (per-candidate, non-fatal)
    NO_DISPLAYABLE_NODE, ///< No selected node yields a parseable path (session-fatal)
    IO_ERROR,            ///< Directory could not be listed
    INVALID_STATE        ///< Command issued in a state that does not accept it
};

/**
 * @brief Error information for version navigation operations
 */
struct VersionError {
    VersionErrorType type = VersionErrorType::NONE;
    std::string message; ///< Human-readable error message
    std::string path;    ///< Path that caused the error (may be empty)

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != VersionErrorType::NONE;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        switch (type) {
        case VersionErrorType::NONE:
            return "NONE";
        case VersionErrorType::NO_VERSION_TOKEN:
            return "NO_VERSION_TOKEN";
        case VersionErrorType::NO_DISPLAYABLE_NODE:
            return "NO_DISPLAYABLE_NODE";
        case VersionErrorType::IO_ERROR:
            return "IO_ERROR";
        case VersionErrorType::INVALID_STATE:
            return "INVALID_STATE";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        if (type == VersionErrorType::NO_DISPLAYABLE_NODE) {
            return "None of the selected nodes reference a versioned file.";
        } else if (type == VersionErrorType::NO_VERSION_TOKEN) {
            return "No version found in path: " + path;
        } else if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static VersionError no_version_token(const std::string& path) {
        VersionError err;
        err.type = VersionErrorType::NO_VERSION_TOKEN;
        err.path = path;
        err.message = "No version token in '" + path + "'";
        return err;
    }

    static VersionError no_displayable_node(size_t node_count) {
        VersionError err;
        err.type = VersionErrorType::NO_DISPLAYABLE_NODE;
        err.message = "None of " + std::to_string(node_count) +
                      " selected node(s) has a parseable versioned path";
        return err;
    }

    static VersionError io_error(const std::string& path, const std::string& what) {
        VersionError err;
        err.type = VersionErrorType::IO_ERROR;
        err.path = path;
        err.message = "Cannot list '" + path + "': " + what;
        return err;
    }

    static VersionError invalid_state(const std::string& what) {
        VersionError err;
        err.type = VersionErrorType::INVALID_STATE;
        err.message = what;
        return err;
    }
};

} // namespace vnav
