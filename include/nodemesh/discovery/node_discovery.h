#ifndef NODEMESH_DISCOVERY_NODE_DISCOVERY_H
#define NODEMESH_DISCOVERY_NODE_DISCOVERY_H

#include "nodemesh/base/config.h"
#include "nodemesh/net/interface_selector.h"
#include "nodemesh/discovery/mdns_daemon.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <chrono>
#include <optional>

namespace nodemesh {

// Identity of a node as advertised on the network
struct NodeInfo {
    std::string id;                 // UUID, stable for the process lifetime
    std::string name;
    std::string ip;
    uint16_t port = 0;
    InterfaceType interface_type = InterfaceType::Other;
    std::vector<std::string> capabilities{"discovery"};
    std::string version = NODEMESH_VERSION;
    uint16_t transfer_port = TransferConfig{}.port;

    // TXT properties: id, name, interface_type, capabilities, version, transfer_port
    std::map<std::string, std::string> to_properties() const;

    // Parse a resolved advertisement. Fails if a required key is missing.
    // transfer_port is optional and keeps its default when absent or malformed.
    static std::optional<NodeInfo> from_record(const ServiceRecord& record);

    // "ip:port"
    std::string address() const;
};

enum class DiscoveryState {
    Created,
    Advertising,
    Refreshing
};

std::string to_string(DiscoveryState state);

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

class DiscoveryService {
public:
    // Resolve the best interface and build the local identity.
    // Throws NodeMeshError(InterfaceUnavailable).
    static std::unique_ptr<DiscoveryService> create(const std::string& name,
                                                    std::optional<uint16_t> port,
                                                    const DiscoveryConfig& config);

    DiscoveryService(const std::string& name, std::optional<uint16_t> port,
                     const NetworkInterface& iface, std::shared_ptr<ServiceDaemon> daemon,
                     const DiscoveryConfig& config, SteadyClock clock = {});
    ~DiscoveryService();

    // Advertise, browse, and start the refresh task
    bool start();

    // Withdraw the advertisement and stop background work
    void shutdown();

    // Re-publish the local record once
    bool refresh();

    // Port the file transfer server is bound to, published with the next advertisement
    void set_transfer_port(uint16_t port);

    // Drop stale entries and return a copy of the registry
    std::vector<NodeInfo> get_discovered_nodes();

    const NodeInfo& get_local_node() const;

    // "{name}_{uuid}"
    const std::string& instance_name() const;

    // Record published for the local node
    ServiceRecord local_record() const;

    DiscoveryState state() const;

    // Listener entry point for daemon events
    void handle_event(const ServiceEvent& event);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nodemesh

#endif // NODEMESH_DISCOVERY_NODE_DISCOVERY_H
