/*
 * projcache - Project Data Reloader
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "projcache/types.hpp"

namespace projcache {

// One periodic unit of work bound to a single Project.
//
// run() performs one refresh cycle. It is invoked repeatedly from pool
// workers and may throw; the scheduler contains the failure to that cycle.
// Long-running implementations may poll interruptRequested() (pool.hpp).
class RefreshTask {
public:
    virtual ~RefreshTask() = default;

    virtual void run() = 0;
    [[nodiscard]] virtual TaskKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::string name() const { return toString(kind()); }
};

}
