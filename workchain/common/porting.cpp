/*******************************************************************************
 * workchain/common/porting.cpp
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <workchain/common/porting.hpp>

#include <tlx/unused.hpp>

#include <cerrno>
#include <cstring>

#if __linux__
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace workchain {
namespace common {

std::ostream& operator << (std::ostream& os, const ThreadPriority& p) {
    switch (p) {
    case ThreadPriority::Lowest:
        return os << "Lowest";
    case ThreadPriority::BelowNormal:
        return os << "BelowNormal";
    case ThreadPriority::Normal:
        return os << "Normal";
    case ThreadPriority::AboveNormal:
        return os << "AboveNormal";
    case ThreadPriority::Highest:
        return os << "Highest";
    }
    return os << "Invalid";
}

void SetThreadPriority(ThreadPriority priority) {
#if __linux__
    int nice_value = 0;
    switch (priority) {
    case ThreadPriority::Lowest:
        nice_value = 10;
        break;
    case ThreadPriority::BelowNormal:
        nice_value = 5;
        break;
    case ThreadPriority::Normal:
        return;
    case ThreadPriority::AboveNormal:
        nice_value = -5;
        break;
    case ThreadPriority::Highest:
        nice_value = -10;
        break;
    }

    // on Linux the nice value is a per-thread attribute addressed by tid.
    pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));
    if (setpriority(PRIO_PROCESS, static_cast<id_t>(tid), nice_value) != 0) {
        LOG1 << "Error calling setpriority(" << priority << "): "
             << errno << ": " << strerror(errno);
    }
#else
    tlx::unused(priority);
#endif
}

} // namespace common
} // namespace workchain

/******************************************************************************/
