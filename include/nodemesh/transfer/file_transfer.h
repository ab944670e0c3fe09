#ifndef NODEMESH_TRANSFER_FILE_TRANSFER_H
#define NODEMESH_TRANSFER_FILE_TRANSFER_H

#include "nodemesh/base/config.h"
#include "nodemesh/base/error_code.h"
#include "nodemesh/transfer/range_tracker.h"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <elio/elio.hpp>

namespace nodemesh {

enum class TransferEventType {
    Started,
    Progress,
    Completed,
    Failed
};

// Event reported to a TransferObserver. Which fields are set depends on type.
struct TransferEvent {
    TransferEventType type = TransferEventType::Started;
    std::string file_id;

    // Started
    std::string file_name;
    uint64_t file_size = 0;

    // Progress and Completed
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double percent = 0.0;

    // Completed
    double elapsed_sec = 0.0;
    double throughput_mbps = 0.0;   // MiB per second

    // Failed
    std::string error;

    static TransferEvent started(const std::string& file_id, const std::string& file_name, uint64_t file_size);
    static TransferEvent progress(const std::string& file_id, uint64_t bytes, uint64_t total);
    static TransferEvent completed(const std::string& file_id, uint64_t bytes, double elapsed_sec);
    static TransferEvent failed(const std::string& file_id, const std::string& error);
};

// Called from whichever task produced the event. Calls are serialized per manager.
using TransferObserver = std::function<void(const TransferEvent&)>;

struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    bool operator==(const ByteRange& other) const = default;
};

// Split [0, file_size) into at most `streams` contiguous ranges of whole chunks
std::vector<ByteRange> partition_ranges(uint64_t file_size, uint64_t chunk_size, uint32_t streams);

// Hex SHA-256 of a file in one pass
std::optional<std::string> sha256_file(const std::filesystem::path& path);

struct SendResult {
    std::string file_id;
    ErrorCode code = ErrorCode::Success;
    std::string error;

    bool ok() const { return code == ErrorCode::Success; }
};

struct ServerAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

class FileTransferManager {
public:
    explicit FileTransferManager(const TransferConfig& config, TransferObserver observer = {});
    ~FileTransferManager();

    FileTransferManager(const FileTransferManager&) = delete;
    FileTransferManager& operator=(const FileTransferManager&) = delete;

    // Bind the listener (port 0 picks an ephemeral port) and accept in the background
    std::optional<ServerAddress> start_server();

    // Stop accepting. In-flight connections run to completion.
    void stop_server();

    bool is_server_running() const;

    // Send a file as parallel byte ranges to host:port
    elio::coro::task<SendResult> send_file(const std::string& path, const std::string& host, uint16_t port);

    // Range map of a file still being received
    std::optional<RangeMap> pending_ranges(const std::string& file_id) const;

    std::filesystem::path receive_dir() const;
    const TransferConfig& config() const;
    size_t active_transfers() const;

    void set_observer(TransferObserver observer);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nodemesh

#endif // NODEMESH_TRANSFER_FILE_TRANSFER_H
