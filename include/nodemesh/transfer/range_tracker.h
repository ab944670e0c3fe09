#ifndef NODEMESH_TRANSFER_RANGE_TRACKER_H
#define NODEMESH_TRANSFER_RANGE_TRACKER_H

#include "nodemesh/transfer/protocol.h"
#include <string>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <deque>
#include <optional>
#include <mutex>
#include <filesystem>

namespace nodemesh {

using RangeMap = std::map<std::string, bool>;  // "{start}-{end}" -> completed

// Verified files remembered to absorb late duplicate ranges
constexpr size_t FINISHED_HISTORY_SIZE = 256;

// Per-file range completion state on the receiving side.
//
// State lives in memory behind one mutex. Every change is also written to
// "{file_id}.parts" (JSON object of range key to bool) in the receive
// directory through a temp file and rename, and the expected whole-file hash
// to "{file_id}.hash". Both records are removed by forget().
class RangeTracker {
public:
    explicit RangeTracker(std::filesystem::path directory);

    // Record a range as in flight. Returns true if it is the first range
    // seen for this file_id.
    bool begin_range(const TransferHeader& header);

    // Mark a range complete. Returns true exactly once per file: when every
    // recorded range is complete and together they cover [0, file_size).
    bool complete_range(const std::string& file_id, uint64_t start, uint64_t end);

    // Copy of the current range map
    std::optional<RangeMap> ranges(const std::string& file_id) const;

    std::optional<std::string> expected_hash(const std::string& file_id) const;

    bool is_tracked(const std::string& file_id) const;

    // True for a file verified and forgotten recently. Late duplicate ranges of
    // such a file are acknowledged without being tracked again.
    bool is_finished(const std::string& file_id) const;

    // Drop in-memory state, delete both side records and remember the file as finished
    void forget(const std::string& file_id);

    std::filesystem::path parts_path(const std::string& file_id) const;
    std::filesystem::path hash_path(const std::string& file_id) const;

    // Read a persisted side record back
    static std::optional<RangeMap> load_record(const std::filesystem::path& parts_file);

    // True when the completed ranges cover [0, file_size) with no gap
    static bool covers_file(const RangeMap& ranges, uint64_t file_size);

private:
    struct Entry {
        uint64_t file_size = 0;
        std::string file_hash;
        RangeMap ranges;
        bool verifying = false;
    };

    void persist(const std::string& file_id, const Entry& entry) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    // Bounded, oldest evicted first
    std::deque<std::string> finished_order_;
    std::unordered_set<std::string> finished_;
};

} // namespace nodemesh

#endif // NODEMESH_TRANSFER_RANGE_TRACKER_H
