#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "Job.hh"

using namespace std;
using json = nlohmann::json;

// Outcome of one item of a bulk operation (one child job)
struct ItemOutcome
{
    size_t index = 0;
    string item;
    JobId jobId = 0;
    JobState outcome = JobState::Pending; // Completed, Failed or Cancelled

    optional<ErrorKind> errorKind; // Only available if failed
    string message;
    json value; // per-item result, e.g. whether a phone is registered

    json toJSON() const
    {
        json j = {
            {"index", index},
            {"item", item},
            {"job_id", jobId},
            {"outcome", jobStateToString(outcome)}};

        if (errorKind.has_value())
            j["error_kind"] = errorKindToString(*errorKind);

        if (!message.empty())
            j["message"] = message;

        if (!value.is_null())
            j["value"] = value;

        return j;
    }
};

// Aggregated per-item breakdown; partial success stays visible
struct BulkSummary
{
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t cancelled = 0;

    vector<ItemOutcome> items;

    void add(ItemOutcome outcome)
    {
        if (outcome.outcome == JobState::Completed)
            ++succeeded;
        else if (outcome.outcome == JobState::Failed)
            ++failed;
        else
            ++cancelled;

        items.push_back(std::move(outcome));
    }

    json toJSON() const
    {
        json list = json::array();
        for (const auto &item : items)
            list.push_back(item.toJSON());

        return {
            {"total", total},
            {"succeeded", succeeded},
            {"failed", failed},
            {"cancelled", cancelled},
            {"items", list}};
    }
};
