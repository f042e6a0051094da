/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace projcache {

// Closed set of project classifications; decides which loaders apply.
enum class ProjectType : std::uint8_t { Static, Live };

// Identity of a refresh task variant.
enum class TaskKind : std::uint8_t { Statistics, ProjectDetails, LastUpdateTime, Status };

// Position of a task inside its scheduler's schedule.
using TaskId = std::size_t;

[[nodiscard]] std::string toString(ProjectType type);
[[nodiscard]] const char* toString(TaskKind kind) noexcept;
[[nodiscard]] std::optional<ProjectType> parseProjectType(const std::string& text) noexcept;

} // namespace projcache
