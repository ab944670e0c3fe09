#include <catch2/catch_test_macros.hpp>
#include <string>
#include <filesystem>
#include <fstream>
#include "nodemesh/transfer/range_tracker.h"
#include "nodemesh/base/uuid.h"

using namespace nodemesh;

namespace {

struct TempDir {
    std::filesystem::path path;

    TempDir() : path(std::filesystem::temp_directory_path() / ("nodemesh_ranges_" + generate_uuid())) {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

TransferHeader range_header(const std::string& id, uint64_t size, uint64_t start, uint64_t end) {
    TransferHeader header;
    header.file_id = id;
    header.file_name = "data.bin";
    header.file_size = size;
    header.range_start = start;
    header.range_end = end;
    header.file_hash = "feedface";
    return header;
}

} // anonymous namespace

TEST_CASE("First range of a file is reported once", "[range_tracker][begin]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    REQUIRE(tracker.begin_range(range_header("f1", 100, 0, 50)));
    REQUIRE_FALSE(tracker.begin_range(range_header("f1", 100, 50, 100)));
    REQUIRE(tracker.is_tracked("f1"));
    REQUIRE(tracker.expected_hash("f1") == std::optional<std::string>("feedface"));

    std::ifstream hash(tracker.hash_path("f1"));
    std::string stored;
    hash >> stored;
    REQUIRE(stored == "feedface");
}

TEST_CASE("Side record mirrors the in-memory map", "[range_tracker][persist]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    tracker.begin_range(range_header("f2", 100, 0, 50));
    tracker.begin_range(range_header("f2", 100, 50, 100));
    tracker.complete_range("f2", 0, 50);

    auto record = RangeTracker::load_record(tracker.parts_path("f2"));
    REQUIRE(record.has_value());
    REQUIRE(record->size() == 2);
    REQUIRE(record->at("0-50") == true);
    REQUIRE(record->at("50-100") == false);
    REQUIRE(*record == *tracker.ranges("f2"));
}

TEST_CASE("Completion requires every range and full coverage", "[range_tracker][complete]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    tracker.begin_range(range_header("f3", 100, 0, 40));
    REQUIRE_FALSE(tracker.complete_range("f3", 0, 40));

    tracker.begin_range(range_header("f3", 100, 40, 70));
    tracker.begin_range(range_header("f3", 100, 70, 100));
    REQUIRE_FALSE(tracker.complete_range("f3", 70, 100));
    REQUIRE(tracker.complete_range("f3", 40, 70));

    // A late duplicate does not trigger a second verification
    REQUIRE_FALSE(tracker.complete_range("f3", 40, 70));
}

TEST_CASE("Completing a range twice is idempotent", "[range_tracker][complete]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    tracker.begin_range(range_header("f4", 100, 0, 50));
    tracker.begin_range(range_header("f4", 100, 50, 100));
    tracker.complete_range("f4", 0, 50);
    tracker.complete_range("f4", 0, 50);

    auto ranges = tracker.ranges("f4");
    REQUIRE(ranges->size() == 2);
    REQUIRE(ranges->at("0-50"));

    // Re-announcing a finished range keeps it finished
    tracker.begin_range(range_header("f4", 100, 0, 50));
    REQUIRE(tracker.ranges("f4")->at("0-50"));
}

TEST_CASE("Unknown transfers are not completed", "[range_tracker][complete]") {
    TempDir dir;
    RangeTracker tracker(dir.path);
    REQUIRE_FALSE(tracker.complete_range("missing", 0, 10));
    REQUIRE_FALSE(tracker.ranges("missing").has_value());
}

TEST_CASE("Forget removes both side records", "[range_tracker][forget]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    tracker.begin_range(range_header("f5", 10, 0, 10));
    REQUIRE(std::filesystem::exists(tracker.parts_path("f5")));
    REQUIRE(std::filesystem::exists(tracker.hash_path("f5")));

    tracker.forget("f5");
    REQUIRE_FALSE(tracker.is_tracked("f5"));
    REQUIRE_FALSE(std::filesystem::exists(tracker.parts_path("f5")));
    REQUIRE_FALSE(std::filesystem::exists(tracker.hash_path("f5")));
}

TEST_CASE("Coverage check", "[range_tracker][coverage]") {
    RangeMap ranges = {{"0-10", true}, {"10-20", true}};
    REQUIRE(RangeTracker::covers_file(ranges, 20));
    REQUIRE_FALSE(RangeTracker::covers_file(ranges, 21));

    ranges["20-30"] = false;
    REQUIRE_FALSE(RangeTracker::covers_file(ranges, 30));

    RangeMap gap = {{"0-10", true}, {"15-20", true}};
    REQUIRE_FALSE(RangeTracker::covers_file(gap, 20));
}

TEST_CASE("Corrupt side records are rejected", "[range_tracker][persist]") {
    TempDir dir;
    auto path = dir.path / "bad.parts";
    {
        std::ofstream out(path);
        out << "{not json";
    }
    REQUIRE_FALSE(RangeTracker::load_record(path).has_value());
    REQUIRE_FALSE(RangeTracker::load_record(dir.path / "absent.parts").has_value());
}

TEST_CASE("Forgotten files are remembered as finished", "[range_tracker][finished]") {
    TempDir dir;
    RangeTracker tracker(dir.path);

    tracker.begin_range(range_header("f9", 100, 0, 100));
    REQUIRE(tracker.complete_range("f9", 0, 100));
    REQUIRE_FALSE(tracker.is_finished("f9"));

    tracker.forget("f9");
    REQUIRE(tracker.is_finished("f9"));
    REQUIRE_FALSE(tracker.is_tracked("f9"));
    REQUIRE_FALSE(tracker.is_finished("other"));

    SECTION("History is bounded") {
        for (size_t i = 0; i < FINISHED_HISTORY_SIZE; ++i) {
            tracker.forget("g" + std::to_string(i));
        }
        REQUIRE_FALSE(tracker.is_finished("f9"));
        REQUIRE(tracker.is_finished("g0"));
        REQUIRE(tracker.is_finished("g" + std::to_string(FINISHED_HISTORY_SIZE - 1)));
    }
}
