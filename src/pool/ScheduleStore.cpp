#include "pool/ScheduleStore.hpp"
#include "pool/Scheduler.hpp"
#include "pool/WorkingPool.hpp"
#include "log/Registry.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace wh::pool {

void to_json(nlohmann::json& j, const ScheduleRecord& r) {
    j = {
        {"name", r.name},
        {"interval", r.interval},
        {"pool_name", r.pool_name},
        {"jobs", r.jobs}
    };
}

void from_json(const nlohmann::json& j, ScheduleRecord& r) {
    r.name = j.at("name").get<std::string>();
    r.interval = j.at("interval").get<std::string>();
    r.pool_name = j.at("pool_name").get<std::string>();
    r.jobs = j.value("jobs", std::vector<JobPayload>{});
}

ScheduleStore::ScheduleStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<ScheduleRecord> ScheduleStore::load() const {
    std::ifstream in(path_);
    if (!in.is_open()) throw std::runtime_error("could not read schedules file: " + path_.string());

    try {
        return nlohmann::json::parse(in).get<std::vector<ScheduleRecord>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("could not parse " + path_.string() + ": " + e.what());
    }
}

void ScheduleStore::ensureExists() const {
    if (std::filesystem::exists(path_)) return;
    save({});
    log::Registry::scheduler()->info("[ScheduleStore] Created empty schedules file {}", path_.string());
}

void ScheduleStore::save(const std::vector<ScheduleRecord>& records) const {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("failed to write schedules file: " + path_.string());

    out << nlohmann::json(records).dump(2) << '\n';
    log::Registry::scheduler()->debug("[ScheduleStore] Wrote {} scheduler record(s) to {}", records.size(), path_.string());
}

void ScheduleStore::add(const ScheduleRecord& record) const {
    auto records = std::filesystem::exists(path_) ? load() : std::vector<ScheduleRecord>{};

    const auto it = std::ranges::find(records, record.name, &ScheduleRecord::name);
    if (it != records.end()) {
        log::Registry::scheduler()->info("[ScheduleStore] Scheduler {} already exists, updating", record.name);
        *it = record;
    } else {
        records.push_back(record);
    }

    save(records);
}

void ScheduleStore::remove(const std::string& name) const {
    auto records = load();
    const auto removed = std::erase_if(records, [&](const ScheduleRecord& r) { return r.name == name; });
    if (removed == 0) throw std::runtime_error("scheduler not found: " + name);
    save(records);
}

std::shared_ptr<Scheduler> makeScheduler(const ScheduleRecord& record, std::shared_ptr<WorkingPool> target) {
    auto sched = std::make_shared<Scheduler>(record.name, util::parseDuration(record.interval), std::move(target));
    for (const auto& job : record.jobs) sched->addJob(job);
    return sched;
}

}
