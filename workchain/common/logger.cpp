/*******************************************************************************
 * workchain/common/logger.cpp
 *
 * Thread naming for the tlx logger.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <workchain/common/logger.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>

namespace workchain {
namespace common {

//! thread name
static thread_local std::string s_thread_name;

//! thread message counter
static thread_local size_t s_message_counter = 0;

void NameThisThread(const std::string& name) {
    s_thread_name = name;
    s_message_counter = 0;
}

std::string GetNameForThisThread() {
    if (!s_thread_name.empty())
        return s_thread_name;

    std::ostringstream oss;
    oss << "unknown " << std::this_thread::get_id();
    return oss.str();
}

/******************************************************************************/

class ThreadLoggerPrefixHook final : public tlx::LoggerPrefixHook
{
public:
    ThreadLoggerPrefixHook();

    ~ThreadLoggerPrefixHook();

    //! method to add prefix to log lines
    void add_log_prefix(std::ostream& os) final;

private:
    tlx::LoggerPrefixHook* prev_;
};

//! installed when the library is loaded
static ThreadLoggerPrefixHook s_default_logger;

ThreadLoggerPrefixHook::ThreadLoggerPrefixHook() {
    prev_ = tlx::set_logger_prefix_hook(this);
}

ThreadLoggerPrefixHook::~ThreadLoggerPrefixHook() {
    tlx::set_logger_prefix_hook(prev_);
}

void ThreadLoggerPrefixHook::add_log_prefix(std::ostream& os) {
    os << '[' << GetNameForThisThread() << ' ';

    std::ios::fmtflags flags(os.flags());
    os << std::setfill('0') << std::setw(6) << s_message_counter++;
    os.flags(flags);

    os << ']' << ' ';
}

} // namespace common
} // namespace workchain

/******************************************************************************/
