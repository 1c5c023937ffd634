#include "persistence/redemption_queue.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace tarb {

void to_json(nlohmann::json& j, const RedemptionTarget& t) {
    j = nlohmann::json{
        {"condition_id", t.condition_id},
        {"outcome", t.outcome}
    };
}

void from_json(const nlohmann::json& j, RedemptionTarget& t) {
    t.condition_id = j.value("condition_id", "");
    t.outcome = j.value("outcome", "");
}

RedemptionQueue::RedemptionQueue(const std::string& path)
    : path_(path)
{
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    load_existing();

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open redemption queue: " + path_);
    }
    spdlog::info("Redemption queue opened: {} ({} already queued)", path_, queued_.size());
}

RedemptionQueue::~RedemptionQueue() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void RedemptionQueue::load_existing() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            queued_.insert(nlohmann::json::parse(line).get<RedemptionTarget>());
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed redemption line {} in {}: {}", line_no, path_, e.what());
        }
    }
}

bool RedemptionQueue::redeem(const RedemptionTarget& target) {
    if (target.condition_id.empty() || target.outcome.empty()) {
        spdlog::error("Refusing redemption with empty condition id or outcome");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (queued_.count(target) > 0) {
        spdlog::info("Redemption for {} ({}) already queued", target.condition_id, target.outcome);
        return true;
    }

    nlohmann::json j = target;
    j["queued_at"] = time_utils::to_iso8601(wall_now());
    file_ << j.dump() << "\n";
    file_.flush();
    if (!file_.good()) {
        spdlog::error("Failed to write redemption for {} to {}", target.condition_id, path_);
        file_.clear();
        return false;
    }

    queued_.insert(target);
    spdlog::info("Queued redemption for {} ({})", target.condition_id, target.outcome);
    return true;
}

std::vector<RedemptionTarget> RedemptionQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RedemptionTarget> out;

    std::ifstream in(path_);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            out.push_back(nlohmann::json::parse(line).get<RedemptionTarget>());
        } catch (const nlohmann::json::exception&) {
            // Reported once at load time
            continue;
        }
    }
    return out;
}

} // namespace tarb
