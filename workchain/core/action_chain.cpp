/*******************************************************************************
 * workchain/core/action_chain.cpp
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <workchain/common/logger.hpp>
#include <workchain/core/action_chain.hpp>

#include <tlx/die.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace workchain {
namespace core {

//! state of the chain whose worker runs on this thread, if any.
static thread_local const void* s_worker_state = nullptr;

struct ActionChain::State {
    //! shared queue of all workers
    CountlessConcurrentQueue<Action> queue;

    //! cleared by Destroy()
    std::atomic<bool> running { true };

    std::atomic<size_t> done { 0 };
    std::atomic<size_t> failed { 0 };

    FailureHandler failure_handler;

    std::string name;
};

ActionChain::ActionChain(
    size_t num_threads, bool background,
    common::ThreadPriority priority, const std::string& name)
    : state_(std::make_shared<State>()),
      background_(background), name_(name) {

    die_unless(num_threads > 0);
    state_->name = name;

    threads_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        try {
            threads_.emplace_back(
                common::CreateThread(
                    &ActionChain::Worker, state_,
                    name + ' ' + std::to_string(i), priority));
        }
        catch (std::system_error& e) {
            LOG1 << "ActionChain " << name << ": could not start worker "
                 << i << " of " << num_threads << ": " << e.what();
        }
    }

    if (threads_.empty()) {
        LOG1 << "ActionChain " << name << ": no worker started,"
             << " rejecting all actions.";
        state_->running = false;
        state_->queue.Destroy();
    }
}

ActionChain::~ActionChain() {
    Destroy();

    if (s_worker_state == state_.get()) {
        // destroyed by an action on one of its own workers: they run out
        // on their own.
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (std::thread& t : threads_) t.detach();
        threads_.clear();
    }
}

bool ActionChain::Enqueue(Action&& action) {
    die_unless(action);
    if (!state_->running) return false;
    return state_->queue.Enqueue(std::move(action));
}

void ActionChain::Destroy() {
    if (state_->running.exchange(false)) {
        // wakes all blocked workers and drops the waiting actions.
        state_->queue.Destroy();

        LOG << "ActionChain " << name_ << " destroyed"
            << " done=" << done() << " failed=" << failed();
    }

    // a worker would join itself, or the other workers while the owner
    // releases them.
    if (s_worker_state == state_.get())
        return;

    ReleaseThreads();
}

void ActionChain::ReleaseThreads() {
    std::lock_guard<std::mutex> lock(threads_mutex_);

    for (std::thread& t : threads_) {
        if (background_)
            t.detach();
        else
            t.join();
    }
    threads_.clear();
}

size_t ActionChain::size() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return threads_.size();
}

void ActionChain::set_failure_handler(FailureHandler&& handler) {
    state_->failure_handler = std::move(handler);
}

bool ActionChain::running() const {
    return state_->running;
}

size_t ActionChain::done() const {
    return state_->done;
}

size_t ActionChain::failed() const {
    return state_->failed;
}

void ActionChain::Worker(std::shared_ptr<State> state,
                         std::string thread_name,
                         common::ThreadPriority priority) {
    common::NameThisThread(thread_name);
    common::SetThreadPriority(priority);
    s_worker_state = state.get();

    while (state->running) {
        Action action;
        // returns false only once the queue is destroyed.
        if (!state->queue.Dequeue(action) || !state->running)
            continue;

        std::exception_ptr error;
        try {
            action();
        }
        catch (std::exception& e) {
            LOG1 << "ActionChain " << state->name
                 << ": action threw: " << e.what();
            error = std::current_exception();
        }
        catch (...) {
            LOG1 << "ActionChain " << state->name
                 << ": action threw an unknown exception";
            error = std::current_exception();
        }

        if (error) {
            ++state->failed;
            if (state->failure_handler) {
                try {
                    state->failure_handler(error);
                }
                catch (std::exception& e) {
                    LOG1 << "ActionChain " << state->name
                         << ": failure handler threw: " << e.what();
                }
            }
        }
        ++state->done;
    }

    LOG << "worker finished";
}

} // namespace core
} // namespace workchain

/******************************************************************************/
