#pragma once

#include "pool/Job.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace wh::pool {

class Scheduler;
class WorkingPool;

struct ScheduleRecord {
    std::string name;
    std::string interval;   // e.g. "24h", "5m"
    std::string pool_name;
    std::vector<JobPayload> jobs;
};

void to_json(nlohmann::json& j, const ScheduleRecord& r);
void from_json(const nlohmann::json& j, ScheduleRecord& r);

// Scheduler definitions kept as a JSON array on disk.
class ScheduleStore {
public:
    explicit ScheduleStore(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::vector<ScheduleRecord> load() const;

    // Writes an empty list if the file does not exist yet.
    void ensureExists() const;

    void save(const std::vector<ScheduleRecord>& records) const;

    // Replaces a record with the same name, or appends.
    void add(const ScheduleRecord& record) const;

    void remove(const std::string& name) const;

private:
    std::filesystem::path path_;
};

std::shared_ptr<Scheduler> makeScheduler(const ScheduleRecord& record, std::shared_ptr<WorkingPool> target);

}
