#include "pool/Job.hpp"

#include <mutex>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace wh::pool {

std::string newJobId() {
    // random_generator is not thread-safe
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::scoped_lock lock(mutex);
    return boost::uuids::to_string(generator());
}

void to_json(nlohmann::json& j, const JobPayload& job) {
    j = {
        {"job_id", job.job_id},
        {"type", job.type},
        {"params", job.params},
        {"retry_count", job.retry_count},
        {"max_retries", job.max_retries},
        {"one_time", job.one_time},
        {"run_now", job.run_now}
    };
}

void from_json(const nlohmann::json& j, JobPayload& job) {
    job.type = j.at("type").get<std::string>();
    job.job_id = j.value("job_id", std::string{});
    job.params = j.value("params", nlohmann::json::object());
    job.retry_count = j.value("retry_count", 0u);
    job.max_retries = j.value("max_retries", 0u);
    job.one_time = j.value("one_time", false);
    job.run_now = j.value("run_now", false);
}

}
