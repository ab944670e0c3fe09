#ifndef NODEMESH_DISCOVERY_MDNS_DAEMON_H
#define NODEMESH_DISCOVERY_MDNS_DAEMON_H

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <cstdint>

namespace nodemesh {

constexpr const char* MDNS_MULTICAST_ADDRESS = "224.0.0.251";
constexpr uint16_t MDNS_PORT = 5353;

// One DNS-SD service instance
struct ServiceRecord {
    std::string instance_name;      // First label, e.g. "alpha_<uuid>"
    std::string service_type;       // e.g. "_node-controller._tcp.local."
    std::string host_name;          // e.g. "192.168.1.20.local."
    std::string address;
    uint16_t port = 0;
    std::map<std::string, std::string> properties;
    uint32_t ttl_sec = 60;

    std::string full_name() const;
};

enum class ServiceEventType {
    Resolved,
    Removed
};

struct ServiceEvent {
    ServiceEventType type = ServiceEventType::Resolved;
    std::string full_name;
    ServiceRecord record;           // Complete only for Resolved
};

using ServiceEventCallback = std::function<void(const ServiceEvent&)>;

// Local-network service registration and browsing
class ServiceDaemon {
public:
    virtual ~ServiceDaemon() = default;

    // Publish a record, or publish it again to refresh its TTL at peers
    virtual bool register_service(const ServiceRecord& record) = 0;

    // Withdraw a record by full name
    virtual bool unregister_service(const std::string& full_name) = 0;

    // Report instances of a service type as they resolve or go away
    virtual bool browse(const std::string& service_type, ServiceEventCallback callback) = 0;

    virtual void shutdown() = 0;
};

// Multicast DNS responder and browser on 224.0.0.251:5353
class MdnsDaemon : public ServiceDaemon {
public:
    // interface_ip selects the interface for multicast membership and sends
    explicit MdnsDaemon(const std::string& interface_ip);
    ~MdnsDaemon() override;

    bool register_service(const ServiceRecord& record) override;
    bool unregister_service(const std::string& full_name) override;
    bool browse(const std::string& service_type, ServiceEventCallback callback) override;
    void shutdown() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nodemesh

#endif // NODEMESH_DISCOVERY_MDNS_DAEMON_H
