/*******************************************************************************
 * workchain/common/logger.hpp
 *
 * Thread naming for the tlx logger.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_COMMON_LOGGER_HEADER
#define WORKCHAIN_COMMON_LOGGER_HEADER

#include <tlx/logger.hpp>

#include <string>

namespace workchain {
namespace common {

//! Defines a name for the current thread, used as prefix of every log line.
void NameThisThread(const std::string& name);

//! Returns the name of the current thread or 'unknown [id]'
std::string GetNameForThisThread();

/******************************************************************************/

/*!

\brief LOG and sLOG in Workchain

All Workchain modules log through the tlx logger macros \ref LOG and \ref sLOG:
\code
LOG << "This will be printed with a newline";
sLOG << "Print variables a" << a << "b" << b << "c" << c;
\endcode

The lines are only printed if the boolean variable **debug** in the enclosing
scope is true. Drain loops and worker threads keep it false and use LOG1 for
the few events that must always be visible: failing jobs, rejected submissions
and shutdown trouble.

Every line is prefixed with the name of the thread and a per-thread message
counter, e.g. "[job engine OQR 000012] ". Threads started by JobEngine and
ActionChain name themselves, other threads print as "unknown <thread id>".

 */

} // namespace common
} // namespace workchain

#endif // !WORKCHAIN_COMMON_LOGGER_HEADER

/******************************************************************************/
