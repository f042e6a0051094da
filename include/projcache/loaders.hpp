/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <iosfwd>
#include <memory>

#include "projcache/task.hpp"

namespace projcache {

class Project;
class DataSource;

// Refreshes login statistics (login server).
class StatisticsLoader final : public RefreshTask {
public:
    StatisticsLoader(Project& project, std::shared_ptr<DataSource> source);

    void run() override;
    [[nodiscard]] TaskKind kind() const noexcept override { return TaskKind::Statistics; }

private:
    Project& project_;
    std::shared_ptr<DataSource> source_;
};

// Refreshes description, owner and membership (persistence store).
class ProjectDetailsLoader final : public RefreshTask {
public:
    ProjectDetailsLoader(Project& project, std::shared_ptr<DataSource> source);

    void run() override;
    [[nodiscard]] TaskKind kind() const noexcept override { return TaskKind::ProjectDetails; }

private:
    Project& project_;
    std::shared_ptr<DataSource> source_;
};

// Refreshes the time the project was last modified upstream.
class LastUpdateTimeLoader final : public RefreshTask {
public:
    LastUpdateTimeLoader(Project& project, std::shared_ptr<DataSource> source);

    void run() override;
    [[nodiscard]] TaskKind kind() const noexcept override { return TaskKind::LastUpdateTime; }

private:
    Project& project_;
    std::shared_ptr<DataSource> source_;
};

// Writes a snapshot of the project to a stream every cycle.
class StatusReporter final : public RefreshTask {
public:
    StatusReporter(const Project& project, std::ostream& out);

    void run() override;
    [[nodiscard]] TaskKind kind() const noexcept override { return TaskKind::Status; }

private:
    const Project& project_;
    std::ostream& out_;
};

}
