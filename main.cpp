#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <unistd.h>

#include "CLI/CLI.hpp"
#include <elio/elio.hpp>
#include "nodemesh/base/logger.h"
#include "nodemesh/base/config.h"
#include "nodemesh/base/error_code.h"
#include "nodemesh/net/interface_selector.h"
#include "nodemesh/discovery/node_discovery.h"
#include "nodemesh/transfer/file_transfer.h"
#include "nodemesh/rpc/liveness.h"

using namespace nodemesh;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

static std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "node";
    }
    return buf;
}

static void log_transfer_event(const TransferEvent& event) {
    auto& log = Logger::instance();
    switch (event.type) {
        case TransferEventType::Started:
            log.info("Transfer {} started: {} ({} bytes)", event.file_id, event.file_name, event.file_size);
            break;
        case TransferEventType::Progress:
            log.debug("Transfer {}: {}/{} bytes ({:.1f}%)", event.file_id, event.bytes_transferred,
                      event.total_bytes, event.percent);
            break;
        case TransferEventType::Completed:
            log.info("Transfer {} completed: {} bytes in {:.2f}s ({:.2f} MB/s)", event.file_id,
                     event.bytes_transferred, event.elapsed_sec, event.throughput_mbps);
            break;
        case TransferEventType::Failed:
            log.error("Transfer {} failed: {}", event.file_id, event.error);
            break;
    }
}

// Split "host:port" or "[v6]:port"
static std::optional<std::pair<std::string, uint16_t>> parse_host_port(const std::string& target) {
    auto colon = target.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
        return std::nullopt;
    }
    std::string host = target.substr(0, colon);
    if (host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    try {
        unsigned long port = std::stoul(target.substr(colon + 1));
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        return std::make_pair(host, static_cast<uint16_t>(port));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Browse for a while and return the peer matching a name or id prefix
static std::optional<NodeInfo> find_peer(const std::string& target, uint32_t wait_sec) {
    const auto& config = Config::instance().get();
    auto discovery = DiscoveryService::create(config.node.name, config.node.port, config.discovery);
    if (!discovery->start()) {
        return std::nullopt;
    }

    std::optional<NodeInfo> found;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_sec);
    while (g_running && !found && std::chrono::steady_clock::now() < deadline) {
        for (const auto& node : discovery->get_discovered_nodes()) {
            if (node.name == target || node.id.rfind(target, 0) == 0) {
                found = node;
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    discovery->shutdown();

    if (!found) {
        Logger::instance().error("No peer named or with id prefix " + target);
    }
    return found;
}

class NodeMeshApplication {
public:
    NodeMeshApplication() = default;
    ~NodeMeshApplication() {
        stop();
    }

    bool start() {
        auto& config = Config::instance().get();
        Logger::instance().info("Starting NodeMesh " + std::string(NODEMESH_VERSION) + " as " + config.node.name);

        transfer_manager_ = std::make_unique<FileTransferManager>(config.transfer, log_transfer_event);
        auto bound = transfer_manager_->start_server();
        if (!bound) {
            Logger::instance().error("Failed to start file transfer server");
            return false;
        }
        Logger::instance().info("File transfer server listening on " + bound->to_string() +
                                ", receiving into " + transfer_manager_->receive_dir().string());

        if (config.discovery.enable) {
            try {
                discovery_ = DiscoveryService::create(config.node.name, config.node.port, config.discovery);
            } catch (const NodeMeshError& e) {
                Logger::instance().error(std::string("Discovery unavailable: ") + e.what());
                return false;
            }
            discovery_->set_transfer_port(bound->port);
            if (!discovery_->start()) {
                Logger::instance().error("Failed to start discovery");
                return false;
            }
        }

        if (config.liveness.enable) {
            NodeInfo local;
            if (discovery_) {
                local = discovery_->get_local_node();
            } else {
                local.name = config.node.name;
                local.port = config.node.port;
            }
            liveness_server_ = std::make_unique<LivenessServer>(local, config.liveness);
            liveness_server_->set_metrics_provider([this]() {
                std::map<std::string, std::string> metrics;
                metrics["peer_count"] = std::to_string(discovery_ ? discovery_->get_discovered_nodes().size() : 0);
                metrics["active_transfers"] = std::to_string(transfer_manager_->active_transfers());
                return metrics;
            });
            if (!liveness_server_->start()) {
                Logger::instance().error("Failed to start liveness endpoint");
                return false;
            }
        }

        Logger::instance().info("NodeMesh started");
        return true;
    }

    void stop() {
        if (stopped_) {
            return;
        }
        stopped_ = true;

        if (liveness_server_) {
            liveness_server_->stop();
        }
        if (discovery_) {
            discovery_->shutdown();
        }
        if (transfer_manager_) {
            transfer_manager_->stop_server();
        }
        Logger::instance().info("NodeMesh stopped");
    }

    void run() {
        size_t last_peer_count = 0;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (discovery_) {
                size_t count = discovery_->get_discovered_nodes().size();
                if (count != last_peer_count) {
                    Logger::instance().info("Known peers: " + std::to_string(count));
                    last_peer_count = count;
                }
            }
        }
        stop();
    }

private:
    std::unique_ptr<FileTransferManager> transfer_manager_;
    std::unique_ptr<DiscoveryService> discovery_;
    std::unique_ptr<LivenessServer> liveness_server_;
    bool stopped_ = false;
};

static int cmd_interfaces() {
    auto interfaces = discover_interfaces();
    if (interfaces.empty()) {
        std::cout << "No network interfaces with a usable address" << std::endl;
        return 1;
    }

    std::cout << std::left << std::setw(4) << "#" << std::setw(16) << "NAME" << std::setw(14) << "TYPE"
              << std::setw(10) << "PRIORITY" << "ADDRESS" << std::endl;
    for (size_t i = 0; i < interfaces.size(); ++i) {
        const auto& iface = interfaces[i];
        std::cout << std::left << std::setw(4) << (i + 1) << std::setw(16) << iface.name
                  << std::setw(14) << to_string(iface.type) << std::setw(10) << iface.priority
                  << iface.ip << std::endl;
    }

    auto best = select_best_interface(interfaces);
    if (!best) {
        std::cout << to_string(ErrorCode::InterfaceUnavailable) << std::endl;
        return 1;
    }
    std::cout << "Best: " << best->name << " (" << best->ip << ")" << std::endl;
    return 0;
}

static int cmd_peers(uint32_t wait_sec) {
    const auto& config = Config::instance().get();
    auto discovery = DiscoveryService::create(config.node.name, config.node.port, config.discovery);
    if (!discovery->start()) {
        return 1;
    }

    const auto& local = discovery->get_local_node();
    std::cout << "Local node: " << local.name << " " << local.id << " " << local.address()
              << " [" << to_string(local.interface_type) << "]" << std::endl;
    std::cout << "Browsing for " << wait_sec << "s..." << std::endl;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_sec);
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto nodes = discovery->get_discovered_nodes();
    std::cout << nodes.size() << " peer(s)" << std::endl;
    for (const auto& node : nodes) {
        std::cout << "  " << node.name << " " << node.id << " " << node.address()
                  << " [" << to_string(node.interface_type) << "] transfer " << node.transfer_port
                  << " v" << node.version << std::endl;
    }
    discovery->shutdown();
    return 0;
}

static int cmd_send(const std::string& file, const std::string& target, uint32_t wait_sec) {
    const auto& config = Config::instance().get();

    std::string host;
    uint16_t port = config.transfer.port;
    if (auto hp = parse_host_port(target)) {
        host = hp->first;
        port = hp->second;
    } else {
        auto peer = find_peer(target, wait_sec);
        if (!peer) {
            return 1;
        }
        host = peer->ip;
        port = peer->transfer_port;
    }

    FileTransferManager manager(config.transfer, log_transfer_event);
    SendResult result;
    elio::run([&]() -> elio::coro::task<void> {
        result = co_await manager.send_file(file, host, port);
    }());

    if (!result.ok()) {
        std::cerr << "Send failed: " << result.error << std::endl;
        return 1;
    }
    std::cout << "Sent " << file << " as " << result.file_id << std::endl;
    return 0;
}

static std::optional<std::pair<std::string, uint16_t>> resolve_rpc_target(const std::string& target,
                                                                          uint32_t wait_sec) {
    if (auto hp = parse_host_port(target)) {
        return hp;
    }
    auto peer = find_peer(target, wait_sec);
    if (!peer) {
        return std::nullopt;
    }
    return std::make_pair(peer->ip, peer->port);
}

static int cmd_ping(const std::string& target, const std::string& message, uint32_t wait_sec) {
    auto addr = resolve_rpc_target(target, wait_sec);
    if (!addr) {
        return 1;
    }

    const auto& config = Config::instance().get();
    LivenessClient client(config.liveness);
    auto pong = client.ping(addr->first, addr->second, config.node.name, message);
    if (!pong) {
        std::cerr << "Ping failed" << std::endl;
        return 1;
    }

    std::cout << pong->responder_name << " (" << pong->responder_id << "): " << pong->message << std::endl;
    std::cout << "Round trip: " << (unix_time_ms() - pong->request_ts) << " ms" << std::endl;
    return 0;
}

static int cmd_health(const std::string& target, uint32_t wait_sec) {
    auto addr = resolve_rpc_target(target, wait_sec);
    if (!addr) {
        return 1;
    }

    LivenessClient client(Config::instance().get().liveness);
    auto health = client.health_check(addr->first, addr->second);
    if (!health) {
        std::cerr << "Health check failed" << std::endl;
        return 1;
    }

    std::cout << health->responder_name << " (" << health->responder_id << "): "
              << to_string(health->status) << std::endl;
    for (const auto& [key, value] : health->metrics) {
        std::cout << "  " << key << " = " << value << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto& cfg = Config::instance();
    if (!cfg.load_from_env()) {
        return 1;
    }

    CLI::App app{"NodeMesh - local network peer discovery and file transfer"};
    app.set_version_flag("-v,--version", NODEMESH_VERSION);
    app.require_subcommand(1);
    cfg.add_options(app);

    auto* run_cmd = app.add_subcommand("run", "Advertise this node and serve transfers until interrupted");

    app.add_subcommand("interfaces", "List ranked network interfaces");

    uint32_t wait_sec = 5;
    auto* peers_cmd = app.add_subcommand("peers", "Browse the local network for peers");
    peers_cmd->add_option("-w,--wait", wait_sec, "Seconds to browse");

    std::string file;
    std::string target;
    auto* send_cmd = app.add_subcommand("send", "Send a file to a peer");
    send_cmd->add_option("file", file, "File to send")->required()->check(CLI::ExistingFile);
    send_cmd->add_option("target", target, "Peer name, id prefix, or host:port")->required();
    send_cmd->add_option("-w,--wait", wait_sec, "Seconds to browse when resolving a peer");

    std::string message = "ping";
    auto* ping_cmd = app.add_subcommand("ping", "Ping a peer's liveness endpoint");
    ping_cmd->add_option("target", target, "Peer name, id prefix, or host:port")->required();
    ping_cmd->add_option("-m,--message", message, "Message to echo");
    ping_cmd->add_option("-w,--wait", wait_sec, "Seconds to browse when resolving a peer");

    auto* health_cmd = app.add_subcommand("health", "Query a peer's health");
    health_cmd->add_option("target", target, "Peer name, id prefix, or host:port")->required();
    health_cmd->add_option("-w,--wait", wait_sec, "Seconds to browse when resolving a peer");

    CLI11_PARSE(app, argc, argv);

    auto& config = cfg.get();
    if (config.node.name.empty()) {
        config.node.name = local_hostname();
    }
    cfg.apply_logging();
    if (!cfg.validate()) {
        return 1;
    }

    try {
        if (app.got_subcommand(run_cmd)) {
            cfg.print();
            NodeMeshApplication node;
            if (!node.start()) {
                return 1;
            }
            node.run();
            return 0;
        }
        if (app.got_subcommand("interfaces")) {
            return cmd_interfaces();
        }
        if (app.got_subcommand(peers_cmd)) {
            return cmd_peers(wait_sec);
        }
        if (app.got_subcommand(send_cmd)) {
            return cmd_send(file, target, wait_sec);
        }
        if (app.got_subcommand(ping_cmd)) {
            return cmd_ping(target, message, wait_sec);
        }
        if (app.got_subcommand(health_cmd)) {
            return cmd_health(target, wait_sec);
        }
    } catch (const NodeMeshError& e) {
        Logger::instance().fatal(e.what());
        return 1;
    }
    return 0;
}
