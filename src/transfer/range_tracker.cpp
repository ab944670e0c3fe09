#include "nodemesh/transfer/range_tracker.h"
#include "nodemesh/base/logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <vector>
#include <algorithm>

using json = nlohmann::json;

namespace nodemesh {

RangeTracker::RangeTracker(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path RangeTracker::parts_path(const std::string& file_id) const {
    return directory_ / (file_id + ".parts");
}

std::filesystem::path RangeTracker::hash_path(const std::string& file_id) const {
    return directory_ / (file_id + ".hash");
}

bool RangeTracker::begin_range(const TransferHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = entries_.try_emplace(header.file_id);
    Entry& entry = it->second;
    if (inserted) {
        entry.file_size = header.file_size;
        entry.file_hash = header.file_hash;

        std::ofstream hash_file(hash_path(header.file_id), std::ios::trunc);
        if (hash_file) {
            hash_file << header.file_hash;
        } else {
            Logger::instance().warning("Failed to write hash record for " + header.file_id);
        }
    }

    auto key = header.range_key();
    // A duplicate of a finished range keeps its completed flag
    if (!entry.ranges.count(key)) {
        entry.ranges[key] = false;
    }
    persist(header.file_id, entry);
    return inserted;
}

bool RangeTracker::complete_range(const std::string& file_id, uint64_t start, uint64_t end) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        Logger::instance().warning("Completed range for unknown transfer " + file_id);
        return false;
    }

    Entry& entry = it->second;
    entry.ranges[make_range_key(start, end)] = true;
    persist(file_id, entry);

    if (entry.verifying) {
        return false;
    }

    for (const auto& [key, done] : entry.ranges) {
        if (!done) {
            return false;
        }
    }
    if (!covers_file(entry.ranges, entry.file_size)) {
        return false;
    }

    entry.verifying = true;
    return true;
}

std::optional<RangeMap> RangeTracker::ranges(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.ranges;
}

std::optional<std::string> RangeTracker::expected_hash(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.file_hash;
}

bool RangeTracker::is_tracked(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(file_id) > 0;
}

bool RangeTracker::is_finished(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_.count(file_id) > 0;
}

void RangeTracker::forget(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(file_id);

    if (finished_.insert(file_id).second) {
        finished_order_.push_back(file_id);
        if (finished_order_.size() > FINISHED_HISTORY_SIZE) {
            finished_.erase(finished_order_.front());
            finished_order_.pop_front();
        }
    }

    std::error_code ec;
    std::filesystem::remove(parts_path(file_id), ec);
    if (ec) {
        Logger::instance().warning("Failed to remove " + parts_path(file_id).string() + ": " + ec.message());
    }
    std::filesystem::remove(hash_path(file_id), ec);
    if (ec) {
        Logger::instance().warning("Failed to remove " + hash_path(file_id).string() + ": " + ec.message());
    }
}

void RangeTracker::persist(const std::string& file_id, const Entry& entry) const {
    json record = json::object();
    for (const auto& [key, done] : entry.ranges) {
        record[key] = done;
    }

    auto target = parts_path(file_id);
    auto tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            Logger::instance().warning("Failed to open range record " + tmp.string());
            return;
        }
        out << record.dump();
        if (!out) {
            Logger::instance().warning("Failed to write range record " + tmp.string());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        Logger::instance().warning("Failed to replace range record " + target.string() + ": " + ec.message());
    }
}

std::optional<RangeMap> RangeTracker::load_record(const std::filesystem::path& parts_file) {
    std::ifstream in(parts_file);
    if (!in) {
        return std::nullopt;
    }

    try {
        json record = json::parse(in);
        if (!record.is_object()) {
            return std::nullopt;
        }
        RangeMap result;
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (!it.value().is_boolean()) {
                return std::nullopt;
            }
            result[it.key()] = it.value().get<bool>();
        }
        return result;
    } catch (const json::exception& e) {
        Logger::instance().warning("Failed to parse range record " + parts_file.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool RangeTracker::covers_file(const RangeMap& ranges, uint64_t file_size) {
    std::vector<std::pair<uint64_t, uint64_t>> done;
    for (const auto& [key, completed] : ranges) {
        uint64_t start = 0;
        uint64_t end = 0;
        if (completed && parse_range_key(key, start, end)) {
            done.emplace_back(start, end);
        }
    }
    std::sort(done.begin(), done.end());

    uint64_t covered = 0;
    for (const auto& [start, end] : done) {
        if (start > covered) {
            return false;
        }
        covered = std::max(covered, end);
    }
    return covered >= file_size;
}

} // namespace nodemesh
