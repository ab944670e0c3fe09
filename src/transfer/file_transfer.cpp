#include "nodemesh/transfer/file_transfer.h"
#include "nodemesh/transfer/protocol.h"
#include "nodemesh/transfer/buffer_pool.h"
#include "nodemesh/base/logger.h"
#include "nodemesh/base/uuid.h"
#include <openssl/evp.h>
#include <fstream>
#include <thread>
#include <atomic>
#include <mutex>
#include <future>
#include <chrono>
#include <algorithm>
#include <cstring>
#include <arpa/inet.h>

namespace nodemesh {

namespace {

constexpr size_t HASH_READ_BUFFER_SIZE = 1024 * 1024;
constexpr auto PROGRESS_SAMPLE_INTERVAL = std::chrono::milliseconds(100);

// Returns a pooled buffer on every exit path
class PooledBuffer {
public:
    explicit PooledBuffer(BufferPool& pool) : pool_(pool), buffer_(pool.acquire()) {}
    ~PooledBuffer() { pool_.release(std::move(buffer_)); }

    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;

    uint8_t* data() { return buffer_.data(); }
    size_t size() const { return buffer_.size(); }

private:
    BufferPool& pool_;
    std::vector<uint8_t> buffer_;
};

elio::coro::task<bool> write_all(elio::net::tcp_stream& stream, const void* data, size_t size) {
    const auto* p = static_cast<const uint8_t*>(data);
    size_t written = 0;
    while (written < size) {
        auto result = co_await stream.write(p + written, size - written);
        if (result.result <= 0) {
            co_return false;
        }
        written += static_cast<size_t>(result.result);
    }
    co_return true;
}

// Reads until `size` bytes arrived or the peer stops sending. Returns the count read.
elio::coro::task<size_t> read_exact(elio::net::tcp_stream& stream, void* data, size_t size) {
    auto* p = static_cast<uint8_t*>(data);
    size_t received = 0;
    while (received < size) {
        auto result = co_await stream.read(p + received, size - received);
        if (result.result <= 0) {
            break;
        }
        received += static_cast<size_t>(result.result);
    }
    co_return received;
}

uint32_t peek_u32(const std::vector<uint8_t>& buf, size_t offset) {
    uint32_t be;
    std::memcpy(&be, buf.data() + offset, sizeof(be));
    return ntohl(be);
}

// Reads the length-prefixed header field by field, then decodes it in one go
elio::coro::task<std::optional<TransferHeader>> read_header(elio::net::tcp_stream& stream) {
    std::vector<uint8_t> buf;

    auto read_more = [&stream, &buf](size_t n) -> elio::coro::task<bool> {
        size_t offset = buf.size();
        buf.resize(offset + n);
        size_t got = co_await read_exact(stream, buf.data() + offset, n);
        co_return got == n;
    };

    // id_len, file_id, name_len
    if (!co_await read_more(4)) co_return std::nullopt;
    uint32_t id_len = peek_u32(buf, 0);
    if (id_len > MAX_HEADER_FIELD_LENGTH) co_return std::nullopt;
    if (!co_await read_more(id_len + 4)) co_return std::nullopt;

    // file_name, file_size, range_start, range_end, hash_len
    uint32_t name_len = peek_u32(buf, buf.size() - 4);
    if (name_len > MAX_HEADER_FIELD_LENGTH) co_return std::nullopt;
    if (!co_await read_more(name_len + 8 * 3 + 4)) co_return std::nullopt;

    // file_hash
    uint32_t hash_len = peek_u32(buf, buf.size() - 4);
    if (hash_len > MAX_HEADER_FIELD_LENGTH) co_return std::nullopt;
    if (hash_len > 0 && !co_await read_more(hash_len)) co_return std::nullopt;

    co_return decode_header(buf);
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

TransferEvent TransferEvent::started(const std::string& file_id, const std::string& file_name, uint64_t file_size) {
    TransferEvent event;
    event.type = TransferEventType::Started;
    event.file_id = file_id;
    event.file_name = file_name;
    event.file_size = file_size;
    event.total_bytes = file_size;
    return event;
}

TransferEvent TransferEvent::progress(const std::string& file_id, uint64_t bytes, uint64_t total) {
    TransferEvent event;
    event.type = TransferEventType::Progress;
    event.file_id = file_id;
    event.bytes_transferred = bytes;
    event.total_bytes = total;
    event.percent = total > 0 ? static_cast<double>(bytes) * 100.0 / static_cast<double>(total) : 100.0;
    return event;
}

TransferEvent TransferEvent::completed(const std::string& file_id, uint64_t bytes, double elapsed_sec) {
    TransferEvent event;
    event.type = TransferEventType::Completed;
    event.file_id = file_id;
    event.bytes_transferred = bytes;
    event.total_bytes = bytes;
    event.percent = 100.0;
    event.elapsed_sec = elapsed_sec;
    event.throughput_mbps = elapsed_sec > 0.0
        ? static_cast<double>(bytes) / elapsed_sec / (1024.0 * 1024.0)
        : 0.0;
    return event;
}

TransferEvent TransferEvent::failed(const std::string& file_id, const std::string& error) {
    TransferEvent event;
    event.type = TransferEventType::Failed;
    event.file_id = file_id;
    event.error = error;
    return event;
}

std::vector<ByteRange> partition_ranges(uint64_t file_size, uint64_t chunk_size, uint32_t streams) {
    std::vector<ByteRange> ranges;
    if (file_size == 0) {
        return ranges;
    }
    chunk_size = std::max<uint64_t>(chunk_size, 1);
    streams = std::max<uint32_t>(streams, 1);

    uint64_t chunk_count = (file_size + chunk_size - 1) / chunk_size;
    uint64_t chunks_per_stream = (chunk_count + streams - 1) / streams;

    for (uint32_t i = 0; i < streams; ++i) {
        uint64_t start_chunk = i * chunks_per_stream;
        uint64_t end_chunk = std::min(start_chunk + chunks_per_stream, chunk_count);
        if (start_chunk >= end_chunk) {
            break;
        }
        ranges.push_back({start_chunk * chunk_size, std::min(end_chunk * chunk_size, file_size)});
    }
    return ranges;
}

std::optional<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(HASH_READ_BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return std::nullopt;
        }
    }
    if (in.bad()) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return std::nullopt;
    }

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0f]);
    }
    return result;
}

// State shared by the range tasks and the sampler of one send
struct SendContext {
    std::string file_id;
    std::string path;
    std::string file_name;
    uint64_t file_size = 0;
    std::string file_hash;
    std::string host;
    uint16_t port = 0;
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<bool> finished{false};
};

// One start_server() to stop_server() cycle. The accept loop owns a reference,
// so the listener outlives any accept still pending on the scheduler.
struct ServerGeneration {
    uint64_t id = 0;
    std::shared_ptr<elio::net::tcp_listener> listener;
    std::atomic<bool> running{true};
    std::promise<void> loop_exited;
};

struct FileTransferManager::Impl {
    TransferConfig config;
    std::filesystem::path receive_dir;
    BufferPool buffer_pool;
    RangeTracker tracker;

    TransferObserver observer;
    std::mutex observer_mutex;

    // Serializes creation and sizing of destination files
    std::mutex files_mutex;

    std::atomic<bool> tcp_server_running{false};
    std::atomic<size_t> active_receives{0};
    uint16_t listen_port = 0;

    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::thread tcp_server_thread;

    std::mutex server_mutex;
    std::shared_ptr<ServerGeneration> generation;
    uint64_t next_generation = 1;

    Impl(const TransferConfig& cfg, TransferObserver obs)
        : config(cfg),
          receive_dir(cfg.receive_dir.empty() ? default_receive_dir() : cfg.receive_dir),
          buffer_pool(static_cast<size_t>(std::max<uint64_t>(cfg.chunk_size, 1)), cfg.buffer_pool_size),
          tracker(receive_dir),
          observer(std::move(obs)) {}

    void emit(const TransferEvent& event) {
        std::lock_guard<std::mutex> lock(observer_mutex);
        if (observer) {
            observer(event);
        }
    }

    // Create the destination if missing and size it to file_size
    bool prepare_destination(const std::filesystem::path& path, uint64_t file_size) {
        std::lock_guard<std::mutex> lock(files_mutex);
        std::error_code ec;

        if (!std::filesystem::exists(path, ec)) {
            std::ofstream create(path, std::ios::binary);
            if (!create) {
                Logger::instance().error("Failed to create " + path.string());
                return false;
            }
        }

        auto current = std::filesystem::file_size(path, ec);
        if (ec || current != file_size) {
            std::filesystem::resize_file(path, file_size, ec);
            if (ec) {
                Logger::instance().error("Failed to size " + path.string() + ": " + ec.message());
                return false;
            }
        }
        return true;
    }

    // Verify the assembled file once every range has landed
    RangeAck verify_file(const TransferHeader& header, const std::filesystem::path& path) {
        auto actual = sha256_file(path);
        RangeAck ack = RangeAck::Ok;

        if (!actual) {
            Logger::instance().error("Failed to hash received file " + path.string());
            ack = RangeAck::Failed;
        } else if (*actual == header.file_hash) {
            Logger::instance().info("File " + header.file_name + " (" + header.file_id +
                                    ") verified, hash " + *actual);
        } else {
            Logger::instance().error(to_string(ErrorCode::HashMismatch) + " for " + path.string() +
                                     ": expected " + header.file_hash + ", got " + *actual);
            ack = RangeAck::HashMismatch;
        }

        tracker.forget(header.file_id);
        return ack;
    }

    elio::coro::task<void> handle_connection(elio::net::tcp_stream stream) {
        active_receives++;
        auto peer = stream.peer_address();
        std::string peer_name = peer ? peer->to_string() : "unknown";
        auto start_time = std::chrono::steady_clock::now();

        auto header = co_await read_header(stream);
        if (!header) {
            Logger::instance().warning(to_string(ErrorCode::IncompleteHeader) + " from " + peer_name);
            co_await stream.close();
            active_receives--;
            co_return;
        }

        RangeAck ack = RangeAck::Failed;
        uint64_t received = 0;

        try {
            if (!validate_header(*header)) {
                Logger::instance().warning("Rejected range " + header->range_key() + " of " +
                                           header->file_id + " from " + peer_name);
            } else if (tracker.is_finished(header->file_id)) {
                // Already verified, read the payload and acknowledge without tracking
                Logger::instance().debug("Duplicate range " + header->range_key() + " of finished " +
                                         header->file_id + " from " + peer_name);
                PooledBuffer buffer(buffer_pool);
                uint64_t remaining = header->range_length();
                while (remaining > 0) {
                    size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
                    auto result = co_await stream.read(buffer.data(), to_read);
                    if (result.result <= 0) {
                        break;
                    }
                    remaining -= static_cast<uint64_t>(result.result);
                }
                ack = remaining == 0 ? RangeAck::Ok : RangeAck::Failed;
            } else {
                // Only the final path component is used on disk
                std::string name = std::filesystem::path(header->file_name).filename().string();
                if (name.empty() || name == "." || name == "..") {
                    name = header->file_id;
                }
                auto dest = receive_dir / name;

                if (tracker.begin_range(*header)) {
                    Logger::instance().info("Receiving " + name + " (" + std::to_string(header->file_size) +
                                            " bytes) from " + peer_name);
                    emit(TransferEvent::started(header->file_id, name, header->file_size));
                }

                Logger::instance().debug("Receiving range " + header->range_key() + " of " + header->file_id);

                bool ok = prepare_destination(dest, header->file_size);
                std::fstream out;
                if (ok) {
                    out.open(dest, std::ios::in | std::ios::out | std::ios::binary);
                    out.seekp(static_cast<std::streamoff>(header->range_start));
                    ok = static_cast<bool>(out);
                    if (!ok) {
                        Logger::instance().error("Failed to open " + dest.string() + " for writing");
                    }
                }

                if (ok) {
                    PooledBuffer buffer(buffer_pool);
                    uint64_t remaining = header->range_length();

                    while (remaining > 0) {
                        size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
                        auto result = co_await stream.read(buffer.data(), to_read);
                        if (result.result <= 0) {
                            Logger::instance().error(to_string(ErrorCode::ConnectionClosedEarly) + ": range " +
                                                     header->range_key() + " of " + header->file_id +
                                                     " got " + std::to_string(received) + " of " +
                                                     std::to_string(header->range_length()) + " bytes");
                            ok = false;
                            break;
                        }

                        auto n = static_cast<size_t>(result.result);
                        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
                        if (!out) {
                            Logger::instance().error("Write failed for " + dest.string());
                            ok = false;
                            break;
                        }

                        received += n;
                        remaining -= n;
                        emit(TransferEvent::progress(header->file_id, header->range_start + received,
                                                     header->file_size));
                    }
                }

                if (ok) {
                    out.flush();
                    out.close();
                    ok = !out.fail();
                }

                if (ok) {
                    ack = RangeAck::Ok;
                    if (tracker.complete_range(header->file_id, header->range_start, header->range_end)) {
                        ack = verify_file(*header, dest);
                    }
                    emit(TransferEvent::completed(header->file_id, received, seconds_since(start_time)));
                }
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Error handling transfer connection from " + peer_name + ": " + e.what());
            ack = RangeAck::Failed;
        }

        auto ack_byte = static_cast<uint8_t>(ack);
        if (!co_await write_all(stream, &ack_byte, 1)) {
            Logger::instance().debug("Sender " + peer_name + " left before acknowledgment");
        }
        co_await stream.close();
        active_receives--;
    }

    elio::coro::task<void> tcp_server_loop(std::shared_ptr<ServerGeneration> gen) {
        Logger::instance().info("File transfer server accepting on port " + std::to_string(listen_port) +
                                " (generation " + std::to_string(gen->id) + ")");

        while (gen->running.load()) {
            auto stream_result = co_await gen->listener->accept();
            if (!stream_result) {
                if (gen->running.load()) {
                    Logger::instance().error("Accept error: " + std::string(strerror(errno)));
                }
                continue;
            }

            auto handler = handle_connection(std::move(*stream_result));
            scheduler->spawn(handler.release());
        }

        Logger::instance().info("File transfer server accept loop " + std::to_string(gen->id) + " stopped");
        gen->loop_exited.set_value();
    }

    elio::coro::task<std::pair<bool, std::string>> send_range(std::shared_ptr<SendContext> ctx, ByteRange range) {
        std::string target = ctx->host + ":" + std::to_string(ctx->port);

        elio::net::tcp_options opts;
        opts.no_delay = true;

        auto connect_result = co_await elio::net::tcp_connect(ctx->host, ctx->port, opts);
        if (!connect_result) {
            co_return std::make_pair(false, to_string(ErrorCode::ConnectionFailure) + " to " + target);
        }
        elio::net::tcp_stream& stream = *connect_result;

        TransferHeader header;
        header.file_id = ctx->file_id;
        header.file_name = ctx->file_name;
        header.file_size = ctx->file_size;
        header.range_start = range.start;
        header.range_end = range.end;
        header.file_hash = ctx->file_hash;

        auto encoded = encode_header(header);
        if (!co_await write_all(stream, encoded.data(), encoded.size())) {
            co_await stream.close();
            co_return std::make_pair(false, "Failed to send header to " + target);
        }

        std::ifstream in(ctx->path, std::ios::binary);
        in.seekg(static_cast<std::streamoff>(range.start));
        if (!in) {
            co_await stream.close();
            co_return std::make_pair(false, "Failed to open " + ctx->path);
        }

        bool ok = true;
        std::string error;
        {
            PooledBuffer buffer(buffer_pool);
            uint64_t remaining = range.end - range.start;

            while (remaining > 0) {
                size_t n = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
                in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(n));
                if (static_cast<size_t>(in.gcount()) != n) {
                    ok = false;
                    error = "Short read from " + ctx->path;
                    break;
                }
                if (!co_await write_all(stream, buffer.data(), n)) {
                    ok = false;
                    error = to_string(ErrorCode::SendFailed) + " to " + target;
                    break;
                }
                ctx->bytes_sent += n;
                remaining -= n;
            }
        }

        if (!ok) {
            co_await stream.close();
            co_return std::make_pair(false, error);
        }

        uint8_t ack = 0;
        size_t got = co_await read_exact(stream, &ack, 1);
        co_await stream.close();

        if (got != 1) {
            co_return std::make_pair(false, to_string(ErrorCode::ConnectionClosedEarly) +
                                     ": no acknowledgment for range " + header.range_key());
        }
        switch (static_cast<RangeAck>(ack)) {
            case RangeAck::Ok:
                co_return std::make_pair(true, std::string());
            case RangeAck::HashMismatch:
                co_return std::make_pair(false, to_string(ErrorCode::HashMismatch) + " reported by receiver");
            default:
                co_return std::make_pair(false, to_string(ErrorCode::RangeRejected) + ": " + header.range_key());
        }
    }

    elio::coro::task<void> sample_progress(std::shared_ptr<SendContext> ctx) {
        std::optional<uint64_t> last;
        while (true) {
            uint64_t sent = ctx->bytes_sent.load();
            if (!last || sent > *last) {
                emit(TransferEvent::progress(ctx->file_id, sent, ctx->file_size));
                last = sent;
            }
            if (sent >= ctx->file_size || ctx->finished.load()) {
                break;
            }
            co_await elio::time::sleep_for(PROGRESS_SAMPLE_INTERVAL);
        }
    }
};

FileTransferManager::FileTransferManager(const TransferConfig& config, TransferObserver observer)
    : impl_(std::make_unique<Impl>(config, std::move(observer))) {}

FileTransferManager::~FileTransferManager() {
    stop_server();
    if (impl_->tcp_server_thread.joinable()) {
        impl_->tcp_server_thread.join();
    }
    if (impl_->scheduler) {
        impl_->scheduler->shutdown();
    }
}

std::optional<ServerAddress> FileTransferManager::start_server() {
    std::lock_guard<std::mutex> lock(impl_->server_mutex);
    if (impl_->tcp_server_running.load()) {
        Logger::instance().warning("File transfer server already running");
        return ServerAddress{"0.0.0.0", impl_->listen_port};
    }

    // The previous server thread returns only after its accept loop has exited
    if (impl_->tcp_server_thread.joinable()) {
        impl_->tcp_server_thread.join();
    }

    std::error_code ec;
    std::filesystem::create_directories(impl_->receive_dir, ec);
    if (ec) {
        Logger::instance().error("Failed to create receive directory " + impl_->receive_dir.string() +
                                 ": " + ec.message());
        return std::nullopt;
    }

    if (!impl_->scheduler) {
        impl_->scheduler = std::make_shared<elio::runtime::scheduler>(4);
        impl_->scheduler->start();
    }

    auto gen = std::make_shared<ServerGeneration>();
    gen->id = impl_->next_generation++;
    impl_->generation = gen;
    impl_->tcp_server_running = true;

    std::promise<std::optional<uint16_t>> bound;
    auto bound_future = bound.get_future();

    impl_->tcp_server_thread = std::thread([this, gen, bound = std::move(bound)]() mutable {
        uint16_t port = impl_->config.port;

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;
        opts.backlog = 64;

        auto bind_addr = elio::net::socket_address(elio::net::ipv4_address(port));
        auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);

        if (!listener_result) {
            Logger::instance().error("Failed to bind file transfer listener on port " + std::to_string(port) +
                                     ": " + std::string(strerror(errno)));
            gen->running = false;
            impl_->tcp_server_running = false;
            bound.set_value(std::nullopt);
            return;
        }

        gen->listener = std::make_shared<elio::net::tcp_listener>(std::move(*listener_result));
        impl_->listen_port = gen->listener->local_address().port();
        bound.set_value(impl_->listen_port);

        auto loop_exited = gen->loop_exited.get_future();
        auto accept_loop = impl_->tcp_server_loop(gen);
        impl_->scheduler->spawn(accept_loop.release());

        // Keep thread alive while running
        while (gen->running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Close listener to interrupt the pending accept, then wait for the loop to leave
        gen->listener->close();
        if (loop_exited.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            Logger::instance().warning("Accept loop " + std::to_string(gen->id) + " still pending after close");
        }
        Logger::instance().info("File transfer server stopped");
    });

    auto port = bound_future.get();
    if (!port) {
        return std::nullopt;
    }

    Logger::instance().info("File transfer server listening on 0.0.0.0:" + std::to_string(*port) +
                            ", receiving into " + impl_->receive_dir.string());
    return ServerAddress{"0.0.0.0", *port};
}

void FileTransferManager::stop_server() {
    std::lock_guard<std::mutex> lock(impl_->server_mutex);
    if (!impl_->tcp_server_running.exchange(false)) {
        return;
    }
    if (impl_->generation) {
        impl_->generation->running = false;
    }
    Logger::instance().info("Stopping file transfer server...");
}

bool FileTransferManager::is_server_running() const {
    return impl_->tcp_server_running.load();
}

elio::coro::task<SendResult> FileTransferManager::send_file(const std::string& path,
                                                            const std::string& host,
                                                            uint16_t port) {
    SendResult result;
    result.file_id = generate_uuid();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.code = ErrorCode::NotFound;
        result.error = "File not found: " + path;
        Logger::instance().error(result.error);
        co_return result;
    }

    auto ctx = std::make_shared<SendContext>();
    ctx->file_id = result.file_id;
    ctx->path = path;
    ctx->file_name = std::filesystem::path(path).filename().string();
    ctx->file_size = std::filesystem::file_size(path, ec);
    ctx->host = host;
    ctx->port = port;
    if (ec) {
        result.code = ErrorCode::IoError;
        result.error = "Cannot stat " + path + ": " + ec.message();
        Logger::instance().error(result.error);
        co_return result;
    }

    auto hash = sha256_file(path);
    if (!hash) {
        result.code = ErrorCode::IoError;
        result.error = "Failed to hash " + path;
        Logger::instance().error(result.error);
        co_return result;
    }
    ctx->file_hash = *hash;

    auto start_time = std::chrono::steady_clock::now();
    impl_->emit(TransferEvent::started(ctx->file_id, ctx->file_name, ctx->file_size));

    auto ranges = partition_ranges(ctx->file_size, impl_->config.chunk_size, impl_->config.concurrent_streams);
    Logger::instance().info("Sending " + ctx->file_name + " (" + std::to_string(ctx->file_size) + " bytes) to " +
                            host + ":" + std::to_string(port) + " as " + std::to_string(ranges.size()) +
                            " stream(s), id " + ctx->file_id);

    std::vector<elio::coro::join_handle<std::pair<bool, std::string>>> range_tasks;
    for (const auto& range : ranges) {
        range_tasks.push_back(impl_->send_range(ctx, range).spawn());
    }

    auto sampler = impl_->sample_progress(ctx).spawn();

    std::vector<std::string> errors;
    for (size_t i = 0; i < range_tasks.size(); ++i) {
        auto [ok, error] = co_await range_tasks[i];
        if (!ok) {
            errors.push_back("Stream " + std::to_string(i) + " failed: " + error);
        }
    }

    ctx->finished = true;
    co_await sampler;

    if (!errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            if (!joined.empty()) joined += "; ";
            joined += e;
        }
        result.code = ErrorCode::TransferFailed;
        result.error = joined;
        Logger::instance().error("Transfer " + ctx->file_id + " failed: " + joined);
        impl_->emit(TransferEvent::failed(ctx->file_id, joined));
        co_return result;
    }

    double elapsed = seconds_since(start_time);
    auto completed = TransferEvent::completed(ctx->file_id, ctx->file_size, elapsed);
    Logger::instance().info("Transfer " + ctx->file_id + " completed in " + std::to_string(elapsed) + "s (" +
                            std::to_string(completed.throughput_mbps) + " MB/s)");
    impl_->emit(completed);
    co_return result;
}

std::optional<RangeMap> FileTransferManager::pending_ranges(const std::string& file_id) const {
    return impl_->tracker.ranges(file_id);
}

std::filesystem::path FileTransferManager::receive_dir() const {
    return impl_->receive_dir;
}

const TransferConfig& FileTransferManager::config() const {
    return impl_->config;
}

size_t FileTransferManager::active_transfers() const {
    return impl_->active_receives.load();
}

void FileTransferManager::set_observer(TransferObserver observer) {
    std::lock_guard<std::mutex> lock(impl_->observer_mutex);
    impl_->observer = std::move(observer);
}

} // namespace nodemesh
