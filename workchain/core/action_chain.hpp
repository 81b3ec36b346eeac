/*******************************************************************************
 * workchain/core/action_chain.hpp
 *
 * A fixed set of worker threads which run actions from one shared queue.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_CORE_ACTION_CHAIN_HEADER
#define WORKCHAIN_CORE_ACTION_CHAIN_HEADER

#include <workchain/common/porting.hpp>
#include <workchain/core/chain_queue.hpp>

#include <tlx/delegate.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace workchain {
namespace core {

/*!
 * ActionChain starts a fixed number of threads which all wait on one shared
 * queue of actions and run them as they arrive. Each action runs exactly once.
 * Actions leave the queue in FIFO order, but with more than one thread they
 * may complete in any order: use a JobEngine, or one thread, where the order
 * of a stream of work matters.
 *
 * Exceptions thrown by actions are logged and passed to the failure handler,
 * the worker continues with the next action.
 *
 * Destroy() stops the workers and drops all actions not yet started. A
 * background chain detaches workers which are still in an action, a foreground
 * chain joins them. Workers share ownership of the queue, so a detached worker
 * may outlive the ActionChain object. An action may call Destroy() on its own
 * chain: that only stops the chain, the threads are released by the next
 * Destroy() or the destructor on another thread.

\code
ActionChain chain(8, true, common::ThreadPriority::AboveNormal, "fetch");

chain.Enqueue([request]() { request->Process(); });
\endcode
 */
class ActionChain
{
    static constexpr bool debug = false;

public:
    //! Signature of actions.
    using Action = tlx::delegate<void()>;

    //! Called on a worker thread with the exception of each failing action.
    using FailureHandler = tlx::delegate<void(std::exception_ptr)>;

    //! Start num_threads workers with the given scheduling hint.
    explicit ActionChain(
        size_t num_threads, bool background = true,
        common::ThreadPriority priority = common::ThreadPriority::Normal,
        const std::string& name = "action chain");

    //! non-copyable: delete copy-constructor
    ActionChain(const ActionChain&) = delete;
    //! non-copyable: delete assignment operator
    ActionChain& operator = (const ActionChain&) = delete;

    //! Destroy()s the chain.
    ~ActionChain();

    //! Queue the action for one of the workers. Returns false if the chain was
    //! destroyed, or no worker could be started.
    bool Enqueue(Action&& action);

    //! Stop all workers and drop waiting actions. Idempotent.
    void Destroy();

    //! Install handler for failing actions. Not synchronized with the workers:
    //! set it before enqueuing actions.
    void set_failure_handler(FailureHandler&& handler);

    //! Return number of worker threads not yet released
    size_t size() const;

    //! Whether the chain accepts actions.
    bool running() const;

    //! Return number of actions completed, including failed ones.
    size_t done() const;

    //! Return number of actions which threw.
    size_t failed() const;

    const std::string& name() const { return name_; }

    bool background() const { return background_; }

private:
    struct State;

    //! queue and counters, shared with the workers.
    std::shared_ptr<State> state_;

    //! threads in the chain
    std::vector<std::thread> threads_;
    //! protects threads_, never locked by the workers.
    mutable std::mutex threads_mutex_;

    bool background_;

    std::string name_;

    //! join or detach all threads, not called on a worker.
    void ReleaseThreads();

    //! Worker function, one per thread is started.
    static void Worker(std::shared_ptr<State> state, std::string thread_name,
                       common::ThreadPriority priority);
};

} // namespace core
} // namespace workchain

#endif // !WORKCHAIN_CORE_ACTION_CHAIN_HEADER

/******************************************************************************/
