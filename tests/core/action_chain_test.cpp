/*******************************************************************************
 * tests/core/action_chain_test.cpp
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <gtest/gtest.h>
#include <workchain/common/logger.hpp>
#include <workchain/core/action_chain.hpp>

#include <tlx/semaphore.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace workchain;
using namespace workchain::core;

template <typename Condition>
static bool WaitUntil(Condition cond, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

TEST(ActionChain, RunsEachActionExactlyOnce) {
    static constexpr size_t num_producers = 8;
    static constexpr size_t num_actions = 10000;

    ActionChain chain(4, true, common::ThreadPriority::Normal, "test chain");
    ASSERT_EQ(4u, chain.size());

    std::vector<std::atomic<size_t> > hits(num_actions);
    for (size_t i = 0; i != num_actions; ++i) hits[i] = 0;

    std::vector<std::thread> producers;
    for (size_t p = 0; p != num_producers; ++p) {
        producers.emplace_back(
            [&chain, &hits, p]() {
                for (size_t i = p; i < num_actions; i += num_producers)
                    chain.Enqueue([&hits, i]() { ++hits[i]; });
            });
    }
    for (std::thread& t : producers) t.join();

    ASSERT_TRUE(WaitUntil([&]() { return chain.done() == num_actions; },
                          std::chrono::seconds(30)));

    for (size_t i = 0; i != num_actions; ++i)
        ASSERT_EQ(1u, hits[i]) << "action " << i;
    ASSERT_EQ(0u, chain.failed());
}

TEST(ActionChain, SingleWorkerKeepsOrder) {
    ActionChain chain(1, false);

    std::vector<size_t> order;
    for (size_t i = 0; i != 100; ++i)
        chain.Enqueue([&order, i]() { order.push_back(i); });

    ASSERT_TRUE(WaitUntil([&]() { return chain.done() == 100; },
                          std::chrono::seconds(30)));
    for (size_t i = 0; i != 100; ++i)
        ASSERT_EQ(i, order[i]);
}

TEST(ActionChain, FailingActionDoesNotStopWorker) {
    ActionChain chain(1, false);

    std::atomic<size_t> handled(0);
    chain.set_failure_handler(
        [&handled](std::exception_ptr error) {
            ASSERT_TRUE(static_cast<bool>(error));
            ++handled;
        });

    std::atomic<size_t> ran(0);
    chain.Enqueue([]() { throw std::runtime_error("boom"); });
    chain.Enqueue([&ran]() { ++ran; });
    chain.Enqueue([]() { throw std::logic_error("bang"); });
    chain.Enqueue([&ran]() { ++ran; });

    ASSERT_TRUE(WaitUntil([&]() { return chain.done() == 4; },
                          std::chrono::seconds(30)));
    ASSERT_EQ(2u, ran);
    ASSERT_EQ(2u, chain.failed());
    ASSERT_EQ(2u, handled);
}

TEST(ActionChain, DestroyDropsPendingActions) {
    std::shared_ptr<std::atomic<size_t> > ran =
        std::make_shared<std::atomic<size_t> >(0);
    tlx::Semaphore started(0), gate(0);

    ActionChain chain(1, false);
    chain.Enqueue([&, ran]() {
                      started.signal();
                      gate.wait();
                      ++*ran;
                  });
    started.wait();

    for (size_t i = 0; i != 100; ++i)
        ASSERT_TRUE(chain.Enqueue([ran]() { ++*ran; }));

    std::thread opener([&gate]() {
                           std::this_thread::sleep_for(
                               std::chrono::milliseconds(20));
                           gate.signal();
                       });

    // a foreground chain joins the worker, which finishes its action.
    chain.Destroy();
    opener.join();

    ASSERT_FALSE(chain.running());
    ASSERT_EQ(0u, chain.size());
    ASSERT_EQ(1u, *ran);
    ASSERT_EQ(1u, chain.done());

    ASSERT_FALSE(chain.Enqueue([ran]() { ++*ran; }));
    chain.Destroy();
    ASSERT_EQ(1u, *ran);
}

TEST(ActionChain, ActionDestroysItsOwnForegroundChain) {
    std::atomic<size_t> slow_done(0);
    tlx::Semaphore slow_started(0), destroyed(0);
    {
        ActionChain chain(2, false);

        // keeps one worker busy while the other destroys the chain.
        chain.Enqueue([&]() {
                          slow_started.signal();
                          std::this_thread::sleep_for(
                              std::chrono::milliseconds(300));
                          ++slow_done;
                      });
        slow_started.wait();

        chain.Enqueue([&]() {
                          chain.Destroy();
                          chain.Destroy();
                          destroyed.signal();
                      });
        destroyed.wait();

        ASSERT_FALSE(chain.running());
        ASSERT_FALSE(chain.Enqueue([]() { }));

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT_EQ(0u, slow_done);
        // the destructor joins both workers, the slow one included.
    }
    ASSERT_EQ(1u, slow_done);
}

TEST(ActionChain, ActionDestroysItsOwnChainThenOwnerDestroys) {
    std::atomic<size_t> slow_done(0);
    tlx::Semaphore slow_started(0), destroyed(0);

    ActionChain chain(2, false);
    chain.Enqueue([&]() {
                      slow_started.signal();
                      std::this_thread::sleep_for(
                          std::chrono::milliseconds(300));
                      ++slow_done;
                  });
    slow_started.wait();

    chain.Enqueue([&]() {
                      chain.Destroy();
                      destroyed.signal();
                  });
    destroyed.wait();

    // workers are released by the owner only.
    ASSERT_EQ(2u, chain.size());
    chain.Destroy();
    ASSERT_EQ(0u, chain.size());
    ASSERT_EQ(1u, slow_done);
}

TEST(ActionChain, BackgroundWorkersOutliveChain) {
    std::shared_ptr<std::atomic<size_t> > ran =
        std::make_shared<std::atomic<size_t> >(0);
    std::shared_ptr<tlx::Semaphore> gate = std::make_shared<tlx::Semaphore>(0);
    tlx::Semaphore started(0), finished(0);

    {
        ActionChain chain(2, true, common::ThreadPriority::BelowNormal);
        ASSERT_TRUE(chain.background());
        chain.Enqueue([ran, gate, &started, &finished]() {
                          started.signal();
                          gate->wait();
                          ++*ran;
                          finished.signal();
                      });
        started.wait();
    }

    // the chain is gone, the detached worker still runs its action.
    ASSERT_EQ(0u, *ran);
    gate->signal();
    finished.wait();
    ASSERT_EQ(1u, *ran);
}

/******************************************************************************/
