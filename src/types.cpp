/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/types.hpp"
#include <cctype>

namespace projcache {

std::string toString(ProjectType type) {
    switch (type) {
        case ProjectType::Static: return "STATIC";
        case ProjectType::Live:   return "LIVE";
    }
    return "UNKNOWN(" + std::to_string(static_cast<unsigned>(type)) + ")";
}

const char* toString(TaskKind kind) noexcept {
    switch (kind) {
        case TaskKind::Statistics:     return "statistics";
        case TaskKind::ProjectDetails: return "project-details";
        case TaskKind::LastUpdateTime: return "last-update-time";
        case TaskKind::Status:         return "status";
    }
    return "unknown";
}

std::optional<ProjectType> parseProjectType(const std::string& text) noexcept {
    try {
        std::string upper(text);
        for (char& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (upper == "STATIC") return ProjectType::Static;
        if (upper == "LIVE") return ProjectType::Live;
    } catch (...) {
        // Fall through to nullopt
    }
    return std::nullopt;
}

}
