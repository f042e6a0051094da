/*
 * projcache - Reloader daemon (projcached)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "projcache/factory.hpp"
#include "projcache/logger.hpp"
#include "projcache/project.hpp"
#include "projcache/source.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace projcache;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

// Stand-in for the login server and persistence store: every fetch drifts the
// previous values a little so the status output visibly changes.
class SyntheticSource final : public DataSource {
public:
    LoginStatistics fetchLoginStatistics(const Project& project) override {
        LoginStatistics stats = project.statistics();
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<std::uint64_t> logins(0, 25);
        std::uniform_int_distribution<std::uint64_t> failures(0, 2);
        std::uniform_int_distribution<std::uint64_t> active(1, 40);
        stats.totalLogins += logins(rng_);
        stats.failedLogins += failures(rng_);
        stats.activeUsers = active(rng_);
        return stats;
    }

    ProjectDetails fetchProjectDetails(const Project& project) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<std::uint32_t> members(3, 12);
        ProjectDetails details;
        details.owner = "ops";
        details.description = "Live project " + project.name();
        details.memberCount = members(rng_);
        return details;
    }

    std::chrono::system_clock::time_point fetchLastUpdateTime(const Project&) override {
        return std::chrono::system_clock::now();
    }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_{std::random_device{}()};
};

void printUsage(const char* progName) {
    std::cout << "projcache Reloader Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Keeps the cached data of demo projects fresh. Without --project it runs\n";
    std::cout << "project1 (STATIC) and project2 (LIVE), started one second apart.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -P, --project <name>=<type>  Add a project, type STATIC or LIVE (repeatable)\n";
    std::cout << "  -d, --duration <s>   Run time before stopping (default 180)\n";
    std::cout << "  -p, --period <s>     Reload period (default 15)\n";
    std::cout << "  -g, --grace <s>      Shutdown grace window (default 60)\n";
    std::cout << "  -w, --workers <n>    Workers per project, 0 = auto (default 0)\n";
    std::cout << "  --allow-overlap      Let a slow task overlap its next run\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  PROJCACHE_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  PROJCACHE_RELOAD_PERIOD  Reload period in seconds\n";
    std::cout << "  PROJCACHE_STATUS_DELAY   Delay before the first status print in seconds\n";
    std::cout << "  PROJCACHE_GRACE_WINDOW   Shutdown grace window in seconds\n";
    std::cout << "  PROJCACHE_WORKERS        Workers per project\n";
    std::cout << "  PROJCACHE_OVERLAP        skip | allow\n";
}

bool parseNumber(const std::string& text, bool allowZero, long max, long& out) {
    try {
        std::size_t used = 0;
        long value = std::stol(text, &used);
        if (used != text.size() || value < 0 || (value == 0 && !allowZero) || value > max) {
            return false;
        }
        out = value;
        return true;
    } catch (...) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();
    SchedulerConfig config = SchedulerConfig::fromEnv();
    long durationSeconds = 180;

    // Declared ahead of the schedulers so every Project outlives the workers
    // running its refreshes, including any abandoned after the grace window
    std::vector<std::unique_ptr<Project>> projects;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        long value = 0;
        if ((arg == "-P" || arg == "--project") && i + 1 < argc) {
            std::string entry = argv[++i];
            auto eq = entry.find('=');
            std::optional<ProjectType> type;
            if (eq != std::string::npos && eq > 0) {
                type = parseProjectType(entry.substr(eq + 1));
            }
            if (!type) {
                std::cerr << "Error: Invalid project '" << entry << "', expected <name>=STATIC|LIVE\n";
                return 1;
            }
            projects.push_back(std::make_unique<Project>(entry.substr(0, eq), *type));
        } else if ((arg == "-d" || arg == "--duration") && i + 1 < argc) {
            if (!parseNumber(argv[++i], true, SchedulerConfig::kMaxSeconds, value)) {
                std::cerr << "Error: Invalid duration\n";
                return 1;
            }
            durationSeconds = value;
        } else if ((arg == "-p" || arg == "--period") && i + 1 < argc) {
            if (!parseNumber(argv[++i], false, SchedulerConfig::kMaxSeconds, value)) {
                std::cerr << "Error: Invalid reload period\n";
                return 1;
            }
            config.reloadPeriod = std::chrono::seconds(value);
        } else if ((arg == "-g" || arg == "--grace") && i + 1 < argc) {
            if (!parseNumber(argv[++i], true, SchedulerConfig::kMaxSeconds, value)) {
                std::cerr << "Error: Invalid grace window\n";
                return 1;
            }
            config.graceWindow = std::chrono::seconds(value);
        } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            if (!parseNumber(argv[++i], true, SchedulerConfig::kMaxWorkers, value)) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
            config.workers = static_cast<int>(value);
        } else if (arg == "--allow-overlap") {
            config.overlap = OverlapPolicy::Allow;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (projects.empty()) {
        projects.push_back(std::make_unique<Project>("project1", ProjectType::Static));
        projects.push_back(std::make_unique<Project>("project2", ProjectType::Live));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    auto sleepUntil = [](std::chrono::steady_clock::time_point deadline) {
        while (std::chrono::steady_clock::now() < deadline && !g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    };

    try {
        auto source = std::make_shared<SyntheticSource>();
        std::vector<std::unique_ptr<Scheduler>> reloaders;

        for (auto& project : projects) {
            CreateResult result = createScheduler(*project, source, config);
            if (!result) {
                std::cerr << "Error: " << result.message << "\n";
                return 1;
            }
            reloaders.push_back(std::move(result.scheduler));
        }

        for (std::size_t i = 0; i < reloaders.size() && !g_shutdown_requested; ++i) {
            if (i > 0) {
                sleepUntil(std::chrono::steady_clock::now() + std::chrono::seconds(1));
                if (g_shutdown_requested) {
                    break;
                }
            }
            if (!reloaders[i]->start()) {
                std::cerr << "Error: Failed to start reloader for " << reloaders[i]->project().name() << "\n";
                for (auto& reloader : reloaders) {
                    reloader->stop();
                }
                return 1;
            }
        }

        sleepUntil(std::chrono::steady_clock::now() + std::chrono::seconds(durationSeconds));
        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, stopping reloaders...");
        }

        for (auto& reloader : reloaders) {
            reloader->stop();
        }

        for (const auto& reloader : reloaders) {
            for (const auto& stats : reloader->stats()) {
                LOG_INFO(reloader->project().name() + " " + stats.name + ": " +
                         std::to_string(stats.runs) + " runs, " + std::to_string(stats.failures) +
                         " failures, " + std::to_string(stats.skipped) + " skipped");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("projcached stopped");
    return 0;
}
