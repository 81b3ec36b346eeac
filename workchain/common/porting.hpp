/*******************************************************************************
 * workchain/common/porting.hpp
 *
 * Thread creation and scheduling helpers.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_COMMON_PORTING_HEADER
#define WORKCHAIN_COMMON_PORTING_HEADER

#include <workchain/common/logger.hpp>

#include <chrono>
#include <ostream>
#include <system_error>
#include <thread>
#include <utility>

namespace workchain {
namespace common {

//! Scheduling hint for worker threads. Mapped to nice values on Linux, raising
//! the priority above Normal usually requires CAP_SYS_NICE.
enum class ThreadPriority {
    Lowest, BelowNormal, Normal, AboveNormal, Highest
};

std::ostream& operator << (std::ostream& os, const ThreadPriority& p);

//! create a std::thread and repeat creation if it fails
template <typename... Args>
std::thread CreateThread(Args&& ... args) {
    // try for 10 seconds
    size_t r = 100;
    while (1) {
        try {
            return std::thread(std::forward<Args>(args) ...);
        }
        catch (std::system_error&) {
            if (--r == 0) throw;
            LOG1 << "Thread creation failed, retrying.";
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

//! set the scheduling priority of the current thread. Failures are logged and
//! otherwise ignored, the priority is only a hint.
void SetThreadPriority(ThreadPriority priority);

} // namespace common
} // namespace workchain

#endif // !WORKCHAIN_COMMON_PORTING_HEADER

/******************************************************************************/
