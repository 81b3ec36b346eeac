/*******************************************************************************
 * workchain/core/job_engine.cpp
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <workchain/common/logger.hpp>
#include <workchain/common/porting.hpp>
#include <workchain/core/job_engine.hpp>

#include <tlx/string/parse_si_iec_units.hpp>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace workchain {
namespace core {

/******************************************************************************/
// JobEngineConfig

static inline bool ParseMilliseconds(
    const char* env_name, std::chrono::milliseconds* out) {

    const char* env_value = getenv(env_name);
    if (!env_value || !*env_value) return true;

    char* endptr;
    errno = 0;
    long value = std::strtol(env_value, &endptr, 10);

    if (!endptr || *endptr != 0 || errno == ERANGE) {
        std::cerr << "Workchain: environment variable"
                  << ' ' << env_name << '=' << env_value
                  << " is not a valid number of milliseconds."
                  << std::endl;
        return false;
    }

    *out = std::chrono::milliseconds(value);
    return true;
}

bool JobEngineConfig::SetupFromEnvironment() {

    const char* env_capacity = getenv("WORKCHAIN_JOB_CAPACITY");

    if (env_capacity && *env_capacity) {
        uint64_t capacity;
        if (!tlx::parse_si_iec_units(env_capacity, &capacity) ||
            capacity == 0) {
            std::cerr << "Workchain: environment variable"
                      << " WORKCHAIN_JOB_CAPACITY=" << env_capacity
                      << " is not a valid job capacity."
                      << std::endl;
            return false;
        }
        bounded_capacity = static_cast<size_t>(capacity);
    }

    if (!ParseMilliseconds("WORKCHAIN_JOB_TIMEOUT", &timeout))
        return false;

    std::chrono::milliseconds grace = stop_grace;
    if (!ParseMilliseconds("WORKCHAIN_JOB_STOP_GRACE", &grace))
        return false;
    if (grace.count() < 0) {
        std::cerr << "Workchain: environment variable"
                  << " WORKCHAIN_JOB_STOP_GRACE must not be negative."
                  << std::endl;
        return false;
    }
    stop_grace = grace;

    return true;
}

/******************************************************************************/
// JobEngine

JobEngine::JobEngine(const std::string& name, const std::string& logging_name,
                     const JobEngineConfig& config)
    : name_(name), logging_name_(logging_name), config_(config) { }

JobEngine::~JobEngine() {
    Stop();

    if (!WaitIdle(config_.stop_grace)) {
        LOG1 << "JobEngine " << logging_name_
             << ": job \"" << current_job() << "\" still running after "
             << config_.stop_grace.count() << " ms, waiting for it.";
    }

    // drops the waiting jobs
    queue_.Destroy();

    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable())
        thread_.join();

    LOG << "JobEngine " << logging_name_ << " destroyed"
        << " done=" << done_ << " failed=" << failed_
        << " rejected=" << rejected_;
}

void JobEngine::Start() {
    running_ = true;
    StartWorker();
}

void JobEngine::Stop() {
    running_ = false;
    // the drain thread releases the worker flag when it leaves.
    queue_.CancelWait();
}

bool JobEngine::QueueJob(
    const std::string& name, Action&& action, const std::string& common_id) {
    return QueueJob(MakeJob(name, std::move(action), common_id));
}

bool JobEngine::QueueJob(Job&& job) {
    if (!running_) {
        ++rejected_;
        LOG << "JobEngine " << logging_name_
            << ": not running, rejected job " << job.name();
        return false;
    }

    if (queue_.size() >= config_.bounded_capacity) {
        ++rejected_;
        if (!over_capacity_.exchange(true)) {
            LOG1 << "JobEngine " << logging_name_
                 << ": " << config_.bounded_capacity
                 << " jobs waiting, rejecting job \"" << job.name() << "\"";
        }
        StartWorker();
        return false;
    }
    over_capacity_ = false;

    // enqueue before looking for a drain thread: a drain which is just
    // leaving checks the queue after releasing the worker flag.
    queue_.Enqueue(std::move(job));
    StartWorker();
    return true;
}

bool JobEngine::RemoveNextJob(Job& job) {
    return queue_.TryDequeue(job);
}

size_t JobEngine::RemoveJobs(const std::string& common_id) {
    if (common_id.empty()) return 0;

    size_t removed = queue_.RemoveIf(
        [&common_id](const Job& job) {
            return job.common_id() == common_id;
        });

    LOG << "JobEngine " << logging_name_ << ": removed " << removed
        << " jobs with common id " << common_id;
    return removed;
}

bool JobEngine::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    auto idle = [this]() { return !worker_active_; };
    if (timeout >= ConcurrentQueue<Job>::max_timeout) {
        cv_idle_.wait(lock, idle);
        return true;
    }
    return cv_idle_.wait_for(lock, timeout, idle);
}

std::string JobEngine::current_job() const {
    std::lock_guard<std::mutex> lock(current_mutex_);
    return current_job_;
}

void JobEngine::StartWorker() {
    // grab the flag.
    bool expected = false;
    if (!worker_active_.compare_exchange_strong(expected, true))
        return;

    std::lock_guard<std::mutex> lock(thread_mutex_);
    // the previous drain thread released the flag as its last step.
    if (thread_.joinable())
        thread_.join();

    try {
        thread_ = common::CreateThread(&JobEngine::DrainLoop, this);
    }
    catch (std::system_error& e) {
        LOG1 << "JobEngine " << logging_name_
             << ": could not start drain thread: " << e.what()
             << ", " << queue_.size() << " jobs waiting.";
        ReleaseWorker();
    }
}

void JobEngine::ReleaseWorker() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        worker_active_ = false;
    }
    cv_idle_.notify_all();
}

void JobEngine::DrainLoop() {
    common::NameThisThread("job engine " + logging_name_);
    ++drains_started_;

    LOG << "drain thread started";

    while (true) {
        while (true) {
            // read the generation before checking running_, such that a
            // Stop() in between cancels the wait.
            uint64_t generation = queue_.wait_generation();
            if (!running_) break;

            Job job;
            if (!queue_.Dequeue(job, config_.timeout, generation))
                break;

            RunJob(job);
        }

        ReleaseWorker();

        // a job may have been queued after the last dequeue attempt, but
        // before the flag was released. Then QueueJob() saw the flag taken.
        if (!running_ || queue_.empty())
            break;

        bool expected = false;
        if (!worker_active_.compare_exchange_strong(expected, true))
            break;

        LOG << "drain thread resumed";
    }

    LOG << "drain thread finished";
}

void JobEngine::RunJob(const Job& job) {
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        current_job_ = job.name();
    }

    std::exception_ptr error;
    try {
        job.Run();
    }
    catch (std::exception& e) {
        LOG1 << "JobEngine " << logging_name_ << ": job \"" << job.name()
             << "\" common id \"" << job.common_id()
             << "\" threw: " << e.what();
        error = std::current_exception();
    }
    catch (...) {
        LOG1 << "JobEngine " << logging_name_ << ": job \"" << job.name()
             << "\" common id \"" << job.common_id()
             << "\" threw an unknown exception";
        error = std::current_exception();
    }

    ++done_;

    if (error) {
        ++failed_;
        if (failure_handler_) {
            try {
                failure_handler_(job, error);
            }
            catch (std::exception& e) {
                LOG1 << "JobEngine " << logging_name_
                     << ": failure handler threw: " << e.what();
            }
        }
    }

    std::lock_guard<std::mutex> lock(current_mutex_);
    current_job_.clear();
}

} // namespace core
} // namespace workchain

/******************************************************************************/
