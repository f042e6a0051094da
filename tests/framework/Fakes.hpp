#pragma once

#include "projcache/pool.hpp"
#include "projcache/project.hpp"
#include "projcache/source.hpp"
#include "projcache/task.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace projcache::test {

// Answers with values derived from the project name and counts calls per project.
class CountingSource final : public DataSource {
public:
    LoginStatistics fetchLoginStatistics(const Project& project) override {
        LoginStatistics stats;
        stats.totalLogins = bump(project.name() + "/statistics");
        stats.activeUsers = project.name().size();
        return stats;
    }

    ProjectDetails fetchProjectDetails(const Project& project) override {
        bump(project.name() + "/details");
        ProjectDetails details;
        details.owner = "owner-of-" + project.name();
        details.description = "details for " + project.name();
        details.memberCount = 7;
        return details;
    }

    std::chrono::system_clock::time_point fetchLastUpdateTime(const Project& project) override {
        bump(project.name() + "/last-update");
        return std::chrono::system_clock::time_point(std::chrono::hours(24));
    }

    std::uint64_t calls(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        return it == calls_.end() ? 0 : it->second;
    }

private:
    std::uint64_t bump(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return ++calls_[key];
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> calls_;
};

// Source whose every call fails.
class FailingSource final : public DataSource {
public:
    LoginStatistics fetchLoginStatistics(const Project&) override {
        throw std::runtime_error("login server unreachable");
    }
    ProjectDetails fetchProjectDetails(const Project&) override {
        throw std::runtime_error("store unreachable");
    }
    std::chrono::system_clock::time_point fetchLastUpdateTime(const Project&) override {
        throw std::runtime_error("store unreachable");
    }
};

struct Counters {
    std::atomic<int> runs{0};
    std::atomic<int> current{0};
    std::atomic<int> maxConcurrent{0};
};

// Counts its executions, optionally sleeping and/or throwing in each.
class CountingTask final : public RefreshTask {
public:
    explicit CountingTask(std::shared_ptr<Counters> counters,
                       std::chrono::milliseconds work = std::chrono::milliseconds(0),
                       bool fail = false, TaskKind kind = TaskKind::Statistics)
        : counters_(std::move(counters)), work_(work), fail_(fail), kind_(kind) {}

    void run() override {
        int now = ++counters_->current;
        int seen = counters_->maxConcurrent.load();
        while (now > seen && !counters_->maxConcurrent.compare_exchange_weak(seen, now)) {
        }
        if (work_.count() > 0) {
            std::this_thread::sleep_for(work_);
        }
        ++counters_->runs;
        --counters_->current;
        if (fail_) {
            throw std::runtime_error("task failure");
        }
    }

    TaskKind kind() const noexcept override { return kind_; }
    std::string name() const override { return fail_ ? "failing-counter" : "counter"; }

private:
    std::shared_ptr<Counters> counters_;
    std::chrono::milliseconds work_;
    bool fail_;
    TaskKind kind_;
};

struct Gate {
    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};
    std::atomic<bool> finished{false};
    std::atomic<bool> sawInterrupt{false};
};

// Blocks until released by the test. With honourInterrupt it also returns once
// the pool raises the interrupt flag.
class GateTask final : public RefreshTask {
public:
    GateTask(std::shared_ptr<Gate> gate, bool honourInterrupt)
        : gate_(std::move(gate)), honourInterrupt_(honourInterrupt) {}

    void run() override {
        gate_->entered = true;
        while (!gate_->released) {
            if (interruptRequested()) {
                gate_->sawInterrupt = true;
                if (honourInterrupt_) {
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        gate_->finished = true;
    }

    TaskKind kind() const noexcept override { return TaskKind::ProjectDetails; }
    std::string name() const override { return "gate"; }

private:
    std::shared_ptr<Gate> gate_;
    bool honourInterrupt_;
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace projcache::test
