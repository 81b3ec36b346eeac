/*******************************************************************************
 * tests/common/logger_test.cpp
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <gtest/gtest.h>
#include <workchain/common/logger.hpp>

#include <string>
#include <thread>

using namespace workchain::common;

TEST(Logger, ThreadNames) {
    static constexpr bool debug = false;

    std::string other_name;
    std::thread thread([&other_name]() {
                           ASSERT_EQ(0u, GetNameForThisThread().find("unknown "));
                           NameThisThread("worker 3");
                           LOG << "named";
                           other_name = GetNameForThisThread();
                       });
    thread.join();
    ASSERT_EQ("worker 3", other_name);

    NameThisThread("main");
    sLOG << "thread name" << GetNameForThisThread();
    ASSERT_EQ("main", GetNameForThisThread());
}

/******************************************************************************/
