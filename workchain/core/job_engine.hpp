/*******************************************************************************
 * workchain/core/job_engine.hpp
 *
 * Processes a stream of jobs in submission order on one worker thread, which
 * is started on demand.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_CORE_JOB_ENGINE_HEADER
#define WORKCHAIN_CORE_JOB_ENGINE_HEADER

#include <workchain/core/chain_queue.hpp>
#include <workchain/core/job.hpp>

#include <tlx/delegate.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace workchain {
namespace core {

//! Tuning knobs of a JobEngine.
class JobEngineConfig
{
public:
    //! maximum number of waiting jobs, further submissions are rejected.
    size_t bounded_capacity = 5000;

    //! how long an idle drain thread waits for the next job before it exits.
    //! Negative, or a century or more: wait until Stop().
    std::chrono::milliseconds timeout { -1 };

    //! how long the destructor waits for a running job before it logs a
    //! warning and keeps waiting.
    std::chrono::milliseconds stop_grace { 5000 };

    //! Override the defaults with the environment variables
    //! WORKCHAIN_JOB_CAPACITY, WORKCHAIN_JOB_TIMEOUT (ms), and
    //! WORKCHAIN_JOB_STOP_GRACE (ms). Returns false on invalid values.
    bool SetupFromEnvironment();
};

/*!
 * JobEngine runs queued Jobs strictly in submission order. At most one drain
 * thread exists at any time. It is started by the first QueueJob() or Start()
 * which finds no drain thread active, and, if a timeout is configured, exits
 * after being idle for that long.
 *
 * Submissions never block: QueueJob() returns false if the engine is stopped
 * or bounded_capacity jobs are already waiting. A job which throws is logged
 * and passed to the failure handler, and the next job runs regardless.

\code
JobEngine engine("Outgoing Queue Refill Engine (region 1)", "OQR");

engine.QueueJob("refill", [&client]() { client.RefillQueue(); },
                client.id());

engine.Stop();
\endcode
 */
class JobEngine
{
    static constexpr bool debug = false;

public:
    using Action = Job::Action;

    //! Called on the drain thread with each job which threw, and the
    //! exception.
    using FailureHandler = tlx::delegate<void(const Job&, std::exception_ptr)>;

    //! Construct engine, it is running but has no drain thread yet.
    JobEngine(const std::string& name, const std::string& logging_name,
              const JobEngineConfig& config = JobEngineConfig());

    //! non-copyable: delete copy-constructor
    JobEngine(const JobEngine&) = delete;
    //! non-copyable: delete assignment operator
    JobEngine& operator = (const JobEngine&) = delete;

    //! Stop, wait for the running job, and drop all waiting jobs.
    ~JobEngine();

    //! Mark the engine running and start a drain thread if none is active.
    void Start();

    //! Mark the engine stopped and wake the drain thread. A running job is not
    //! interrupted, the drain thread exits after it finishes. Waiting jobs
    //! stay queued until Start() or destruction.
    void Stop();

    //! Make a job. Same as Job::Make().
    static Job MakeJob(const std::string& name, Action&& action,
                       const std::string& common_id = std::string()) {
        return Job::Make(name, std::move(action), common_id);
    }

    //! Queue a job built from the arguments, see QueueJob(Job&&).
    bool QueueJob(const std::string& name, Action&& action,
                  const std::string& common_id = std::string());

    //! Queue the job for processing. Returns false if the engine is stopped or
    //! the queue is full, then the job is dropped.
    bool QueueJob(Job&& job);

    //! Remove the next waiting job without running it. Returns false if no job
    //! is waiting. Does not affect the running job.
    bool RemoveNextJob(Job& job);

    //! Remove all waiting jobs whose common id equals common_id. Returns their
    //! number.
    size_t RemoveJobs(const std::string& common_id);

    //! Wait until no drain thread is active, up to timeout. With an unbounded
    //! drain timeout this happens only after Stop().
    bool WaitIdle(std::chrono::milliseconds timeout);

    //! Install handler for failing jobs. Not synchronized with the drain
    //! thread: set it before queuing jobs.
    void set_failure_handler(FailureHandler&& handler) {
        failure_handler_ = std::move(handler);
    }

    //! \name Accessors
    //! \{

    const std::string& name() const { return name_; }

    const std::string& logging_name() const { return logging_name_; }

    const JobEngineConfig& config() const { return config_; }

    //! Is this engine running?
    bool running() const { return running_; }

    //! Name of the job currently running, empty if none.
    std::string current_job() const;

    //! Number of jobs waiting to be processed.
    size_t jobs_waiting() const { return queue_.size(); }

    //! Number of jobs run, including failed ones.
    size_t jobs_done() const { return done_; }

    //! Number of jobs which threw.
    size_t jobs_failed() const { return failed_; }

    //! Number of rejected QueueJob() calls.
    size_t jobs_rejected() const { return rejected_; }

    //! Number of drain threads started so far.
    size_t drains_started() const { return drains_started_; }

    //! \}

private:
    std::string name_;
    std::string logging_name_;
    JobEngineConfig config_;

    //! waiting jobs
    ConcurrentQueue<Job> queue_;

    //! flag whether jobs are accepted and processed
    std::atomic<bool> running_ { true };

    //! held by the one active drain thread, from the CAS which started it to
    //! its exit.
    std::atomic<bool> worker_active_ { false };

    //! handle of the last drain thread, joined before the next starts.
    std::thread thread_;
    //! protects thread_
    std::mutex thread_mutex_;

    //! signaled when the drain thread releases worker_active_
    std::mutex idle_mutex_;
    std::condition_variable cv_idle_;

    //! name of the running job
    std::string current_job_;
    mutable std::mutex current_mutex_;

    //! whether the last QueueJob() hit the capacity, to warn only once
    std::atomic<bool> over_capacity_ { false };

    std::atomic<size_t> done_ { 0 };
    std::atomic<size_t> failed_ { 0 };
    std::atomic<size_t> rejected_ { 0 };
    std::atomic<size_t> drains_started_ { 0 };

    FailureHandler failure_handler_;

    //! start a drain thread unless one is active.
    void StartWorker();

    //! body of the drain thread.
    void DrainLoop();

    //! run one job, containing its exceptions.
    void RunJob(const Job& job);

    //! release worker_active_ and wake WaitIdle().
    void ReleaseWorker();
};

} // namespace core
} // namespace workchain

#endif // !WORKCHAIN_CORE_JOB_ENGINE_HEADER

/******************************************************************************/
