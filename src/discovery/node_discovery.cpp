#include "nodemesh/discovery/node_discovery.h"
#include "nodemesh/discovery/dns_message.h"
#include "nodemesh/base/logger.h"
#include "nodemesh/base/error_code.h"
#include "nodemesh/base/uuid.h"
#include <elio/elio.hpp>
#include <thread>
#include <atomic>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <exception>

namespace nodemesh {

namespace {

// DNS labels are limited to 63 bytes and the suffix takes 37
constexpr size_t MAX_INSTANCE_PREFIX = 26;

std::string make_instance_prefix(const std::string& name) {
    std::string prefix = name.empty() ? "node" : name;
    std::replace(prefix.begin(), prefix.end(), '.', '-');
    if (prefix.size() > MAX_INSTANCE_PREFIX) {
        size_t cut = MAX_INSTANCE_PREFIX;
        // Never split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(prefix[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        prefix.resize(cut);
    }
    return prefix.empty() ? "node" : prefix;
}

std::string make_host_name(const std::string& ip) {
    std::string host = ip;
    std::replace(host.begin(), host.end(), ':', '-');
    return host + ".local.";
}

std::vector<std::string> split_capabilities(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

} // anonymous namespace

std::map<std::string, std::string> NodeInfo::to_properties() const {
    std::string caps;
    for (size_t i = 0; i < capabilities.size(); ++i) {
        if (i > 0) caps += ",";
        caps += capabilities[i];
    }
    return {
        {"id", id},
        {"name", name},
        {"interface_type", to_string(interface_type)},
        {"capabilities", caps},
        {"version", version},
        {"transfer_port", std::to_string(transfer_port)},
    };
}

std::optional<NodeInfo> NodeInfo::from_record(const ServiceRecord& record) {
    const auto& props = record.properties;
    for (const char* key : {"id", "name", "interface_type", "capabilities", "version"}) {
        if (props.find(key) == props.end()) {
            return std::nullopt;
        }
    }
    if (props.at("id").empty() || record.address.empty()) {
        return std::nullopt;
    }

    NodeInfo info;
    info.id = props.at("id");
    info.name = props.at("name");
    info.ip = record.address;
    info.port = record.port;
    info.interface_type = interface_type_from_string(props.at("interface_type")).value_or(InterfaceType::Other);
    info.capabilities = split_capabilities(props.at("capabilities"));
    info.version = props.at("version");

    auto tp = props.find("transfer_port");
    if (tp != props.end()) {
        try {
            unsigned long value = std::stoul(tp->second);
            if (value > 0 && value <= 65535) {
                info.transfer_port = static_cast<uint16_t>(value);
            }
        } catch (const std::exception&) {
            // Keep the default port
        }
    }
    return info;
}

std::string NodeInfo::address() const {
    if (ip.find(':') != std::string::npos) {
        return "[" + ip + "]:" + std::to_string(port);
    }
    return ip + ":" + std::to_string(port);
}

std::string to_string(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::Created: return "Created";
        case DiscoveryState::Advertising: return "Advertising";
        case DiscoveryState::Refreshing: return "Refreshing";
    }
    return "Unknown";
}

struct DiscoveryService::Impl {
    DiscoveryConfig config;
    NodeInfo local_node;
    std::string instance_name;
    std::string host_name;
    std::shared_ptr<ServiceDaemon> daemon;
    SteadyClock clock;

    struct Entry {
        NodeInfo node;
        std::chrono::steady_clock::time_point last_seen;
        std::string full_name;
    };
    mutable std::mutex registry_mutex;
    std::map<std::string, Entry> registry;     // keyed by node id

    std::atomic<DiscoveryState> state{DiscoveryState::Created};
    std::atomic<bool> running{false};
    std::thread refresh_thread;

    std::chrono::steady_clock::time_point now() const {
        return clock ? clock() : std::chrono::steady_clock::now();
    }

    void prune() {
        auto limit = std::chrono::seconds(static_cast<int64_t>(config.ttl_sec) * 2);
        auto current = now();
        for (auto it = registry.begin(); it != registry.end();) {
            if (current - it->second.last_seen > limit) {
                Logger::instance().info("Peer expired: " + it->second.node.name + " (" + it->first + ")");
                it = registry.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Refresh loop, sleeping in short slices so shutdown is prompt
    elio::coro::task<void> refresh_loop(DiscoveryService* self) {
        auto interval = std::chrono::seconds(config.refresh_interval_sec);
        auto last = std::chrono::steady_clock::now();

        while (running.load()) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            if (!running.load()) break;
            if (std::chrono::steady_clock::now() - last >= interval) {
                self->refresh();
                last = std::chrono::steady_clock::now();
            }
        }
    }
};

std::unique_ptr<DiscoveryService> DiscoveryService::create(const std::string& name,
                                                           std::optional<uint16_t> port,
                                                           const DiscoveryConfig& config) {
    NetworkInterface iface;
    if (config.interface_name.empty()) {
        iface = get_best_interface();
    } else {
        auto all = discover_interfaces();
        auto it = std::find_if(all.begin(), all.end(), [&config](const NetworkInterface& i) {
            return i.name == config.interface_name && !i.is_ipv6;
        });
        if (it == all.end()) {
            Logger::instance().error("Configured interface " + config.interface_name + " has no usable address");
            throw NodeMeshError(ErrorCode::InterfaceUnavailable,
                                "Interface " + config.interface_name + " not found");
        }
        iface = *it;
    }

    auto daemon = std::make_shared<MdnsDaemon>(iface.ip);
    return std::make_unique<DiscoveryService>(name, port, iface, std::move(daemon), config);
}

DiscoveryService::DiscoveryService(const std::string& name, std::optional<uint16_t> port,
                                   const NetworkInterface& iface, std::shared_ptr<ServiceDaemon> daemon,
                                   const DiscoveryConfig& config, SteadyClock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->daemon = std::move(daemon);
    impl_->clock = std::move(clock);

    impl_->local_node.id = generate_uuid();
    impl_->local_node.name = name;
    impl_->local_node.ip = iface.ip;
    impl_->local_node.port = port.value_or(NodeConfig{}.port);
    impl_->local_node.interface_type = iface.type;

    impl_->instance_name = make_instance_prefix(name) + "_" + impl_->local_node.id;
    impl_->host_name = make_host_name(iface.ip);

    Logger::instance().info("Local node " + name + " (" + impl_->local_node.id + ") on " +
                            iface.name + " [" + to_string(iface.type) + "] " + impl_->local_node.address());
}

DiscoveryService::~DiscoveryService() {
    shutdown();
}

bool DiscoveryService::start() {
    if (impl_->running.load()) {
        return true;
    }

    if (!impl_->daemon->register_service(local_record())) {
        Logger::instance().error(to_string(ErrorCode::AdvertisementFailure) + ": " + impl_->instance_name);
    }
    impl_->state = DiscoveryState::Advertising;

    bool browsing = impl_->daemon->browse(impl_->config.service_type,
                                          [this](const ServiceEvent& event) { handle_event(event); });
    if (!browsing) {
        Logger::instance().error("Failed to browse for " + impl_->config.service_type);
        return false;
    }

    impl_->running = true;
    impl_->refresh_thread = std::thread([this]() {
        elio::run(impl_->refresh_loop(this));
    });

    Logger::instance().info("Discovery started as " + impl_->instance_name + ", TTL " +
                            std::to_string(impl_->config.ttl_sec) + "s, refresh every " +
                            std::to_string(impl_->config.refresh_interval_sec) + "s");
    return true;
}

void DiscoveryService::shutdown() {
    bool was_running = impl_->running.exchange(false);
    if (impl_->refresh_thread.joinable()) {
        impl_->refresh_thread.join();
    }
    if (impl_->state.load() == DiscoveryState::Created && !was_running) {
        return;
    }

    std::string full_name = local_record().full_name();
    if (!impl_->daemon->unregister_service(full_name)) {
        Logger::instance().warning("Failed to withdraw advertisement " + full_name);
    }
    impl_->daemon->shutdown();
    impl_->state = DiscoveryState::Created;
    Logger::instance().info("Discovery stopped");
}

bool DiscoveryService::refresh() {
    impl_->state = DiscoveryState::Refreshing;
    bool ok = impl_->daemon->register_service(local_record());
    if (!ok) {
        Logger::instance().warning(to_string(ErrorCode::AdvertisementFailure) + ", next refresh will retry");
    } else {
        Logger::instance().debug("Re-advertised " + impl_->instance_name);
    }
    impl_->state = DiscoveryState::Advertising;
    return ok;
}

void DiscoveryService::set_transfer_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    impl_->local_node.transfer_port = port;
}

std::vector<NodeInfo> DiscoveryService::get_discovered_nodes() {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    impl_->prune();

    std::vector<NodeInfo> nodes;
    nodes.reserve(impl_->registry.size());
    for (const auto& [id, entry] : impl_->registry) {
        nodes.push_back(entry.node);
    }
    return nodes;
}

const NodeInfo& DiscoveryService::get_local_node() const {
    return impl_->local_node;
}

const std::string& DiscoveryService::instance_name() const {
    return impl_->instance_name;
}

ServiceRecord DiscoveryService::local_record() const {
    ServiceRecord record;
    record.instance_name = impl_->instance_name;
    record.service_type = impl_->config.service_type;
    record.host_name = impl_->host_name;
    record.address = impl_->local_node.ip;
    record.port = impl_->local_node.port;
    {
        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        record.properties = impl_->local_node.to_properties();
    }
    record.ttl_sec = impl_->config.ttl_sec;
    return record;
}

DiscoveryState DiscoveryService::state() const {
    return impl_->state.load();
}

void DiscoveryService::handle_event(const ServiceEvent& event) {
    if (event.type == ServiceEventType::Removed) {
        std::string removed = normalize_dns_name(event.full_name);
        std::lock_guard<std::mutex> lock(impl_->registry_mutex);
        for (auto it = impl_->registry.begin(); it != impl_->registry.end(); ++it) {
            if (normalize_dns_name(it->second.full_name) == removed) {
                Logger::instance().info("Peer removed: " + it->second.node.name + " (" + it->first + ")");
                impl_->registry.erase(it);
                break;
            }
        }
        return;
    }

    auto node = NodeInfo::from_record(event.record);
    if (!node) {
        Logger::instance().debug(to_string(ErrorCode::PeerParseError) + ": " + event.full_name);
        return;
    }
    if (node->id == impl_->local_node.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    auto it = impl_->registry.find(node->id);
    if (it == impl_->registry.end()) {
        Logger::instance().info("Peer discovered: " + node->name + " (" + node->id + ") at " + node->address());
    } else if (it->second.node.ip != node->ip || it->second.node.port != node->port) {
        Logger::instance().info("Peer " + node->id + " moved to " + node->address());
    }
    impl_->registry[node->id] = Impl::Entry{*node, impl_->now(), event.full_name};
}

} // namespace nodemesh
