#pragma once

#include "TaskBridge.hh"

/*
configure JobSpec objects in the "builder pattern" style before dispatching them
*/

class JobBuilder
{
private:
    JobSpec spec;

public:
    explicit JobBuilder(JobKind kind)
    {
        spec.kind = kind;
    }

    // main work unit, runs on the runtime thread
    JobBuilder &withWork(WorkUnit work)
    {
        spec.work = std::move(work);
        return *this;
    }

    JobBuilder &withLabel(const string &label)
    {
        spec.label = label;
        return *this;
    }

    JobBuilder &withSession(const string &session)
    {
        spec.session = session;
        return *this;
    }

    // Override the bridge's retry policy for this job
    JobBuilder &withRetry(RetryPolicy retry)
    {
        spec.retry = retry;
        return *this;
    }

    // Returns the configured spec
    JobSpec build()
    {
        return std::move(spec);
    }

    JobHandle dispatchTo(TaskBridge &bridge)
    {
        return bridge.dispatch(build());
    }
};
