/*******************************************************************************
 * workchain/core/job.hpp
 *
 * Named unit of work processed by a JobEngine.
 *
 * Part of Project Workchain
 *
 * Copyright (C) 2026 Workchain Contributors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef WORKCHAIN_CORE_JOB_HEADER
#define WORKCHAIN_CORE_JOB_HEADER

#include <tlx/delegate.hpp>
#include <tlx/die.hpp>

#include <string>
#include <utility>

namespace workchain {
namespace core {

/*!
 * A Job is a named action. The name appears in log lines and in
 * JobEngine::current_job(). The optional common id tags a set of jobs (e.g.
 * all jobs for one client) such that they can be removed together by
 * JobEngine::RemoveJobs().
 *
 * Jobs are only created via Make(), which leaves room to pool them later. A
 * default-constructed Job is empty and serves as destination of dequeue
 * operations.
 */
class Job
{
public:
    //! Signature of the action.
    using Action = tlx::delegate<void()>;

    //! construct empty job
    Job() = default;

    //! non-copyable: delete copy-constructor
    Job(const Job&) = delete;
    //! non-copyable: delete assignment operator
    Job& operator = (const Job&) = delete;
    //! move-constructor: default
    Job(Job&&) = default;
    //! move-assignment operator: default
    Job& operator = (Job&&) = default;

    //! Make a job, it needs to be queued separately. An empty common_id means
    //! the job belongs to no set.
    static Job Make(const std::string& name, Action&& action,
                    const std::string& common_id = std::string()) {
        die_unless(action);
        return Job(name, common_id, std::move(action));
    }

    //! name of the job
    const std::string& name() const { return name_; }

    //! common id of the job, empty if none.
    const std::string& common_id() const { return common_id_; }

    //! whether the job carries an action, false for empty jobs.
    bool valid() const { return static_cast<bool>(action_); }

    //! run the action, exceptions pass through.
    void Run() const { action_(); }

private:
    Job(const std::string& name, const std::string& common_id,
        Action&& action)
        : name_(name), common_id_(common_id), action_(std::move(action)) { }

    std::string name_;
    std::string common_id_;
    Action action_;
};

} // namespace core
} // namespace workchain

#endif // !WORKCHAIN_CORE_JOB_HEADER

/******************************************************************************/
