/*******************************************************************************
 * benchmarks/queue/queue_benchmark.cpp
 *
 * Throughput of the ChainQueue variants against a mutex-protected deque, and
 * of JobEngine and ActionChain.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <workchain/common/logger.hpp>
#include <workchain/core/action_chain.hpp>
#include <workchain/core/chain_queue.hpp>
#include <workchain/core/job_engine.hpp>

#include <tlx/cmdline_parser.hpp>
#include <tlx/die.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace workchain;

using steady_clock = std::chrono::steady_clock;

static double Microseconds(const steady_clock::time_point& start) {
    return static_cast<double>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            steady_clock::now() - start).count());
}

//! Baseline: std::deque behind one mutex.
template <typename T>
class LockedDeque
{
public:
    bool Enqueue(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        deque_.push_back(value);
        return true;
    }

    bool TryDequeue(T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deque_.empty()) return false;
        value = std::move(deque_.front());
        deque_.pop_front();
        return true;
    }

private:
    std::mutex mutex_;
    std::deque<T> deque_;
};

/******************************************************************************/
//! Producers push items, consumers pop them with TryDequeue().

class QueueThroughput
{
public:
    int Run(int argc, char* argv[]) {

        tlx::CmdlineParser clp;

        clp.add_param_string("queue", queue_,
                             "queue to test: deque, concurrent, countless, "
                             "single_reader");

        clp.add_size_t('p', "producers", producers_,
                       "number of producer threads, default: 4");

        clp.add_size_t('c', "consumers", consumers_,
                       "number of consumer threads, default: 4");

        clp.add_size_t('n', "items", items_,
                       "number of items per producer, default: 1000000");

        clp.add_unsigned('R', "outer_repeats", outer_repeats_,
                         "Repeat whole experiment a number of times.");

        if (!clp.process(argc, argv)) return -1;

        clp.print_result();

        for (unsigned r = 0; r < outer_repeats_; ++r) {
            if (queue_ == "deque") {
                LockedDeque<size_t> queue;
                Test(queue, queue);
            }
            else if (queue_ == "concurrent") {
                core::ConcurrentQueue<size_t> queue;
                Test(queue, queue);
            }
            else if (queue_ == "countless") {
                core::CountlessConcurrentQueue<size_t> queue;
                Test(queue, queue);
            }
            else if (queue_ == "single_reader") {
                core::SingleReaderConcurrentQueue<size_t> queue;
                auto reader = queue.reader();
                consumers_ = 1;
                Test(queue, reader);
            }
            else {
                die("Unknown queue " + queue_);
            }
        }
        return 0;
    }

    template <typename Queue, typename Consumer>
    void Test(Queue& queue, Consumer& consumer) {
        std::atomic<size_t> count(0);
        std::atomic<size_t> sum(0);
        size_t total = producers_ * items_;

        steady_clock::time_point start = steady_clock::now();

        std::vector<std::thread> threads;
        for (size_t p = 0; p < producers_; ++p) {
            threads.emplace_back(
                [this, &queue]() {
                    for (size_t i = 0; i < items_; ++i)
                        queue.Enqueue(i);
                });
        }
        for (size_t c = 0; c < consumers_; ++c) {
            threads.emplace_back(
                [&]() {
                    size_t local_sum = 0;
                    while (count < total) {
                        size_t item;
                        if (consumer.TryDequeue(item)) {
                            local_sum += item;
                            ++count;
                        }
                    }
                    sum += local_sum;
                });
        }
        for (std::thread& t : threads) t.join();

        double time = Microseconds(start);

        die_unequal(sum.load(), producers_ * (items_ * (items_ - 1) / 2));

        LOG1 << "RESULT"
             << " benchmark=queue"
             << " queue=" << queue_
             << " producers=" << producers_
             << " consumers=" << consumers_
             << " items=" << total
             << " time[us]=" << time
             << " items_per_sec=" << static_cast<double>(total) / time * 1e6;
    }

private:
    std::string queue_;
    size_t producers_ = 4;
    size_t consumers_ = 4;
    size_t items_ = 1000000;
    unsigned outer_repeats_ = 1;
};

/******************************************************************************/
//! Time to run a number of small actions on a JobEngine or an ActionChain.

class ActionThroughput
{
public:
    int Run(int argc, char* argv[]) {

        tlx::CmdlineParser clp;

        clp.add_param_string("runner", runner_,
                             "runner to test: engine, chain");

        clp.add_size_t('t', "threads", threads_,
                       "number of ActionChain workers, default: 4");

        clp.add_size_t('n', "actions", actions_,
                       "number of actions, default: 1000000");

        if (!clp.process(argc, argv)) return -1;

        clp.print_result();

        std::atomic<size_t> ran(0);
        steady_clock::time_point start = steady_clock::now();

        if (runner_ == "engine") {
            core::JobEngineConfig config;
            config.bounded_capacity = actions_;
            core::JobEngine engine("Benchmark Engine", "BE", config);
            for (size_t i = 0; i < actions_; ++i)
                engine.QueueJob("job", [&ran]() { ++ran; });
            while (engine.jobs_done() < actions_)
                std::this_thread::yield();
        }
        else if (runner_ == "chain") {
            core::ActionChain chain(threads_, false);
            for (size_t i = 0; i < actions_; ++i)
                chain.Enqueue([&ran]() { ++ran; });
            while (chain.done() < actions_)
                std::this_thread::yield();
        }
        else {
            die("Unknown runner " + runner_);
        }

        double time = Microseconds(start);
        die_unequal(ran.load(), actions_);

        LOG1 << "RESULT"
             << " benchmark=actions"
             << " runner=" << runner_
             << " threads=" << threads_
             << " actions=" << actions_
             << " time[us]=" << time
             << " actions_per_sec=" << static_cast<double>(actions_) / time * 1e6;
        return 0;
    }

private:
    std::string runner_;
    size_t threads_ = 4;
    size_t actions_ = 1000000;
};

/******************************************************************************/

static void Usage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " <benchmark>" << std::endl
        << std::endl
        << "    queue    - producer/consumer throughput of the queues" << std::endl
        << "    actions  - throughput of JobEngine and ActionChain" << std::endl
        << std::endl;
}

int main(int argc, char** argv) {

    common::NameThisThread("benchmark");

    if (argc <= 1) {
        Usage(argv[0]);
        return 0;
    }

    std::string benchmark = argv[1];

    if (benchmark == "queue") {
        return QueueThroughput().Run(argc - 1, argv + 1);
    }
    else if (benchmark == "actions") {
        return ActionThroughput().Run(argc - 1, argv + 1);
    }
    else {
        Usage(argv[0]);
        return -1;
    }
}

/******************************************************************************/
