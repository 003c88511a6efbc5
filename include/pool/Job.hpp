#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace wh::pool {

struct JobPayload {
    std::string job_id;
    std::string type;
    nlohmann::json params = nlohmann::json::object();
    unsigned int retry_count = 0;
    unsigned int max_retries = 0;
    bool one_time = false;   // scheduler drops it after the first submission
    bool run_now = false;    // scheduler submits it as soon as it starts
};

// Job handlers report failure by throwing.
using JobHandler = std::function<void(const nlohmann::json& params)>;

std::string newJobId();

void to_json(nlohmann::json& j, const JobPayload& job);
void from_json(const nlohmann::json& j, JobPayload& job);

}
