#include <catch2/catch_test_macros.hpp>
#include <vector>
#include <string>
#include <mutex>
#include <thread>
#include <chrono>
#include <random>
#include <fstream>
#include <filesystem>
#include <elio/elio.hpp>
#include "nodemesh/transfer/file_transfer.h"
#include "nodemesh/transfer/protocol.h"
#include "nodemesh/base/uuid.h"

using namespace nodemesh;

namespace {

struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& prefix)
        : path(std::filesystem::temp_directory_path() / (prefix + "_" + generate_uuid())) {
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

std::filesystem::path write_random_file(const std::filesystem::path& dir, const std::string& name, size_t size) {
    std::mt19937 rng(static_cast<uint32_t>(size));
    std::vector<char> data(size);
    for (auto& c : data) {
        c = static_cast<char>(rng() & 0xff);
    }
    auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

// Collects observer events from any thread
struct EventLog {
    std::mutex mutex;
    std::vector<TransferEvent> events;

    TransferObserver observer() {
        return [this](const TransferEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::vector<TransferEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

TransferConfig make_config(const std::filesystem::path& receive_dir, uint64_t chunk_size, uint32_t streams) {
    TransferConfig config;
    config.port = 0;
    config.receive_dir = receive_dir.string();
    config.chunk_size = chunk_size;
    config.concurrent_streams = streams;
    return config;
}

SendResult run_send(FileTransferManager& sender, const std::filesystem::path& path, uint16_t port) {
    SendResult result;
    elio::run([&]() -> elio::coro::task<void> {
        result = co_await sender.send_file(path.string(), "127.0.0.1", port);
    }());
    return result;
}

// Writes a raw range over a plain socket and returns the acknowledgment byte
elio::coro::task<int> send_raw_range(uint16_t port, const TransferHeader& header,
                                     const std::vector<uint8_t>& payload) {
    elio::net::tcp_options opts;
    opts.no_delay = true;
    auto conn = co_await elio::net::tcp_connect("127.0.0.1", port, opts);
    if (!conn) {
        co_return -1;
    }
    auto& stream = *conn;

    auto bytes = encode_header(header);
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    size_t written = 0;
    while (written < bytes.size()) {
        auto r = co_await stream.write(bytes.data() + written, bytes.size() - written);
        if (r.result <= 0) {
            co_await stream.close();
            co_return -1;
        }
        written += static_cast<size_t>(r.result);
    }

    uint8_t ack = 0;
    auto r = co_await stream.read(&ack, 1);
    co_await stream.close();
    co_return r.result == 1 ? static_cast<int>(ack) : -1;
}

} // anonymous namespace

TEST_CASE("Ranges partition the file into whole chunks", "[file_transfer][partition]") {
    auto ranges = partition_ranges(10 * 1024 * 1024, 1024 * 1024, 4);
    REQUIRE(ranges.size() == 4);
    REQUIRE(ranges[0] == ByteRange{0, 3 * 1024 * 1024});
    REQUIRE(ranges[3] == ByteRange{9 * 1024 * 1024, 10 * 1024 * 1024});

    SECTION("Streams beyond the chunk count are skipped") {
        auto few = partition_ranges(100, 64, 8);
        REQUIRE(few.size() == 2);
        REQUIRE(few[0] == ByteRange{0, 64});
        REQUIRE(few[1] == ByteRange{64, 100});
    }

    SECTION("Ranges are contiguous") {
        auto parts = partition_ranges(5 * 1024 * 1024 + 17, 65536, 3);
        uint64_t next = 0;
        for (const auto& r : parts) {
            REQUIRE(r.start == next);
            REQUIRE(r.start % 65536 == 0);
            next = r.end;
        }
        REQUIRE(next == 5 * 1024 * 1024 + 17);
    }

    REQUIRE(partition_ranges(0, 1024, 4).empty());
}

TEST_CASE("SHA-256 of a file", "[file_transfer][hash]") {
    TempDir dir("nodemesh_hash");
    auto path = dir.path / "abc.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    REQUIRE(sha256_file(path) ==
            std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    REQUIRE_FALSE(sha256_file(dir.path / "missing").has_value());
}

TEST_CASE("Throughput is reported in MiB per second", "[file_transfer][event]") {
    auto event = TransferEvent::completed("id", 4 * 1024 * 1024, 2.0);
    REQUIRE(event.throughput_mbps == 2.0);
    REQUIRE(event.percent == 100.0);

    auto progress = TransferEvent::progress("id", 25, 100);
    REQUIRE(progress.percent == 25.0);
}

TEST_CASE("Send reports started, increasing progress and one completion", "[file_transfer][events]") {
    TempDir src("nodemesh_src");
    TempDir dst("nodemesh_dst");
    const size_t size = 5 * 1024 * 1024;
    auto path = write_random_file(src.path, "payload.bin", size);

    FileTransferManager receiver(make_config(dst.path, 64 * 1024, 2));
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());
    REQUIRE(bound->port != 0);

    EventLog log;
    FileTransferManager sender(make_config(src.path / "unused", 64 * 1024, 2), log.observer());
    auto result = run_send(sender, path, bound->port);
    REQUIRE(result.ok());

    auto events = log.snapshot();
    REQUIRE(events.size() >= 3);
    REQUIRE(events.front().type == TransferEventType::Started);
    REQUIRE(events.front().file_id == result.file_id);
    REQUIRE(events.front().file_size == size);
    REQUIRE(events.front().file_name == "payload.bin");

    size_t completed = 0;
    size_t progress = 0;
    uint64_t last = 0;
    for (size_t i = 1; i < events.size(); ++i) {
        const auto& e = events[i];
        REQUIRE(e.file_id == result.file_id);
        if (e.type == TransferEventType::Progress) {
            REQUIRE(completed == 0);
            if (progress > 0) {
                REQUIRE(e.bytes_transferred > last);
            }
            last = e.bytes_transferred;
            ++progress;
        } else if (e.type == TransferEventType::Completed) {
            REQUIRE(e.bytes_transferred == size);
            ++completed;
        } else {
            FAIL("Unexpected event type");
        }
    }
    REQUIRE(progress >= 1);
    REQUIRE(last == size);
    REQUIRE(completed == 1);
    REQUIRE(events.back().type == TransferEventType::Completed);
}

TEST_CASE("Received file matches for any stream count", "[file_transfer][roundtrip]") {
    for (uint32_t streams : {1u, 2u, 4u, 8u}) {
        TempDir src("nodemesh_src");
        TempDir dst("nodemesh_dst");
        auto path = write_random_file(src.path, "blob.dat", 3 * 1024 * 1024 + 123);

        FileTransferManager receiver(make_config(dst.path, 256 * 1024, streams));
        auto bound = receiver.start_server();
        REQUIRE(bound.has_value());

        FileTransferManager sender(make_config(src.path / "unused", 256 * 1024, streams));
        auto result = run_send(sender, path, bound->port);
        REQUIRE(result.ok());

        auto received = dst.path / "blob.dat";
        REQUIRE(std::filesystem::file_size(received) == std::filesystem::file_size(path));
        REQUIRE(sha256_file(received) == sha256_file(path));

        // Side records are gone once the hash was checked
        REQUIRE_FALSE(std::filesystem::exists(dst.path / (result.file_id + ".parts")));
        REQUIRE_FALSE(std::filesystem::exists(dst.path / (result.file_id + ".hash")));
        REQUIRE_FALSE(receiver.pending_ranges(result.file_id).has_value());
    }
}

TEST_CASE("Receiver events describe each connection", "[file_transfer][receiver]") {
    TempDir src("nodemesh_src");
    TempDir dst("nodemesh_dst");
    auto path = write_random_file(src.path, "two.bin", 2 * 65536);

    EventLog log;
    FileTransferManager receiver(make_config(dst.path, 65536, 2), log.observer());
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    FileTransferManager sender(make_config(src.path / "unused", 65536, 2));
    auto result = run_send(sender, path, bound->port);
    REQUIRE(result.ok());

    size_t started = 0;
    size_t completed = 0;
    uint64_t completed_bytes = 0;
    for (const auto& e : log.snapshot()) {
        if (e.type == TransferEventType::Started) ++started;
        if (e.type == TransferEventType::Completed) {
            ++completed;
            completed_bytes += e.bytes_transferred;
        }
    }
    REQUIRE(started == 1);
    REQUIRE(completed == 2);
    REQUIRE(completed_bytes == 2 * 65536);
}

TEST_CASE("Partial transfers keep a side record", "[file_transfer][partial]") {
    TempDir dst("nodemesh_dst");
    FileTransferManager receiver(make_config(dst.path, 1024, 2));
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    std::vector<uint8_t> payload(1024, 0x5a);
    TransferHeader header;
    header.file_id = generate_uuid();
    header.file_name = "half.bin";
    header.file_size = 2048;
    header.range_start = 0;
    header.range_end = 1024;
    header.file_hash = std::string(64, '0');

    int ack = -1;
    elio::run([&]() -> elio::coro::task<void> {
        ack = co_await send_raw_range(bound->port, header, payload);
    }());
    REQUIRE(ack == static_cast<int>(RangeAck::Ok));

    auto pending = receiver.pending_ranges(header.file_id);
    REQUIRE(pending.has_value());
    REQUIRE(pending->at("0-1024") == true);

    auto record = RangeTracker::load_record(dst.path / (header.file_id + ".parts"));
    REQUIRE(record.has_value());
    REQUIRE(*record == *pending);
    REQUIRE(std::filesystem::exists(dst.path / (header.file_id + ".hash")));
    REQUIRE(std::filesystem::file_size(dst.path / "half.bin") == 2048);
}

TEST_CASE("Hash mismatch is reported and the file kept", "[file_transfer][hash]") {
    TempDir dst("nodemesh_dst");
    FileTransferManager receiver(make_config(dst.path, 1024, 1));
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    std::vector<uint8_t> payload(100, 0x11);
    TransferHeader header;
    header.file_id = generate_uuid();
    header.file_name = "wrong.bin";
    header.file_size = 100;
    header.range_start = 0;
    header.range_end = 100;
    header.file_hash = std::string(64, 'f');

    int ack = -1;
    elio::run([&]() -> elio::coro::task<void> {
        ack = co_await send_raw_range(bound->port, header, payload);
    }());

    REQUIRE(ack == static_cast<int>(RangeAck::HashMismatch));
    REQUIRE(std::filesystem::exists(dst.path / "wrong.bin"));
    REQUIRE_FALSE(std::filesystem::exists(dst.path / (header.file_id + ".parts")));
}

TEST_CASE("Invalid ranges are rejected", "[file_transfer][validate]") {
    TempDir dst("nodemesh_dst");
    FileTransferManager receiver(make_config(dst.path, 1024, 1));
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    TransferHeader header;
    header.file_id = generate_uuid();
    header.file_name = "bad.bin";
    header.file_size = 10;
    header.range_start = 0;
    header.range_end = 20;

    int ack = -1;
    elio::run([&]() -> elio::coro::task<void> {
        ack = co_await send_raw_range(bound->port, header, {});
    }());
    REQUIRE(ack == static_cast<int>(RangeAck::Failed));
    REQUIRE_FALSE(std::filesystem::exists(dst.path / "bad.bin"));
}

TEST_CASE("File names are reduced to their last component", "[file_transfer][sanitize]") {
    TempDir dst("nodemesh_dst");
    FileTransferManager receiver(make_config(dst.path, 1024, 1));
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    std::vector<uint8_t> payload(4, 0x01);
    TransferHeader header;
    header.file_id = generate_uuid();
    header.file_name = "../../escape.bin";
    header.file_size = 4;
    header.range_start = 0;
    header.range_end = 4;
    header.file_hash = std::string(64, '0');

    int ack = -1;
    elio::run([&]() -> elio::coro::task<void> {
        ack = co_await send_raw_range(bound->port, header, payload);
    }());
    REQUIRE(ack >= 0);
    REQUIRE(std::filesystem::exists(dst.path / "escape.bin"));
    REQUIRE_FALSE(std::filesystem::exists(dst.path.parent_path().parent_path() / "escape.bin"));
}

TEST_CASE("Unreachable receiver fails every stream", "[file_transfer][failure]") {
    TempDir src("nodemesh_src");
    auto path = write_random_file(src.path, "lost.bin", 4096);

    // Bind and release a port so nothing listens on it
    uint16_t port = 0;
    {
        TempDir dst("nodemesh_dst");
        FileTransferManager placeholder(make_config(dst.path, 1024, 1));
        auto bound = placeholder.start_server();
        REQUIRE(bound.has_value());
        port = bound->port;
        placeholder.stop_server();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EventLog log;
    FileTransferManager sender(make_config(src.path / "unused", 1024, 2), log.observer());
    auto result = run_send(sender, path, port);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.code == ErrorCode::TransferFailed);
    REQUIRE(result.error.find("Stream 0 failed") != std::string::npos);
    REQUIRE(result.error.find("Stream 1 failed") != std::string::npos);

    auto events = log.snapshot();
    REQUIRE(events.back().type == TransferEventType::Failed);
    REQUIRE(events.back().error == result.error);
}

TEST_CASE("Missing source file", "[file_transfer][failure]") {
    TempDir src("nodemesh_src");
    FileTransferManager sender(make_config(src.path, 1024, 1));
    auto result = run_send(sender, src.path / "nope.bin", 1);
    REQUIRE(result.code == ErrorCode::NotFound);
}

TEST_CASE("Server restarts cleanly and keeps receiving", "[file_transfer][server]") {
    TempDir src("nodemesh_src");
    TempDir dst("nodemesh_dst");
    auto path = write_random_file(src.path, "again.bin", 300 * 1024);

    FileTransferManager receiver(make_config(dst.path, 64 * 1024, 2));
    FileTransferManager sender(make_config(src.path / "unused", 64 * 1024, 2));

    for (int round = 0; round < 3; ++round) {
        auto bound = receiver.start_server();
        REQUIRE(bound.has_value());
        REQUIRE(receiver.is_server_running());

        auto result = run_send(sender, path, bound->port);
        REQUIRE(result.ok());
        REQUIRE(sha256_file(dst.path / "again.bin") == sha256_file(path));

        // Restart right away, while the old accept is still pending
        receiver.stop_server();
        REQUIRE_FALSE(receiver.is_server_running());
    }

    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());
    receiver.stop_server();
    bound = receiver.start_server();
    REQUIRE(bound.has_value());

    auto result = run_send(sender, path, bound->port);
    REQUIRE(result.ok());
}

TEST_CASE("Late duplicate of a verified file is acknowledged once", "[file_transfer][duplicate]") {
    TempDir src("nodemesh_src");
    TempDir dst("nodemesh_dst");
    auto source = write_random_file(src.path, "dup.bin", 4096);
    auto hash = sha256_file(source);
    REQUIRE(hash.has_value());

    std::vector<uint8_t> payload(4096);
    {
        std::ifstream in(source, std::ios::binary);
        in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }

    EventLog log;
    FileTransferManager receiver(make_config(dst.path, 4096, 1), log.observer());
    auto bound = receiver.start_server();
    REQUIRE(bound.has_value());

    TransferHeader header;
    header.file_id = generate_uuid();
    header.file_name = "dup.bin";
    header.file_size = 4096;
    header.range_start = 0;
    header.range_end = 4096;
    header.file_hash = *hash;

    int first = -1;
    int second = -1;
    elio::run([&]() -> elio::coro::task<void> {
        first = co_await send_raw_range(bound->port, header, payload);
        second = co_await send_raw_range(bound->port, header, payload);
    }());

    REQUIRE(first == static_cast<int>(RangeAck::Ok));
    REQUIRE(second == static_cast<int>(RangeAck::Ok));
    REQUIRE_FALSE(receiver.pending_ranges(header.file_id).has_value());
    REQUIRE_FALSE(std::filesystem::exists(dst.path / (header.file_id + ".parts")));
    REQUIRE_FALSE(std::filesystem::exists(dst.path / (header.file_id + ".hash")));
    REQUIRE(sha256_file(dst.path / "dup.bin") == hash);

    size_t started = 0;
    for (const auto& e : log.snapshot()) {
        if (e.type == TransferEventType::Started) ++started;
    }
    REQUIRE(started == 1);
}
