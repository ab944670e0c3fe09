#ifndef NODEMESH_DISCOVERY_SERVICE_CACHE_H
#define NODEMESH_DISCOVERY_SERVICE_CACHE_H

#include "nodemesh/discovery/dns_message.h"
#include "nodemesh/discovery/mdns_daemon.h"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <chrono>
#include <cstdint>

namespace nodemesh {

// How long an instance may wait for its records after the follow-up query
constexpr std::chrono::seconds FOLLOW_UP_TIMEOUT{5};

// Records learned from mDNS responses, assembled into resolved service instances.
// Every cached record expires after its own TTL. Not thread safe.
class ServiceCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Update {
        std::vector<ServiceEvent> events;
        std::vector<std::string> follow_up;     // Instance names to query with ANY
    };

    // Only PTR records for browsed types start a resolution
    void add_browsed_type(const std::string& service_type);
    bool is_browsed(const std::string& service_type) const;

    Update apply(const DnsMessage& message, Clock::time_point now);

    // Drop expired records and instances whose follow-up went unanswered
    void evict_expired(Clock::time_point now);

    void clear();

    // Cached records plus pending instances
    size_t size() const;
    size_t pending_count() const;

private:
    template<typename T>
    struct Cached {
        T value;
        Clock::time_point expires;
        uint32_t ttl = 0;
    };

    struct SrvData {
        std::string target;
        uint16_t port = 0;
    };

    struct Pending {
        std::string full_name;
        std::string service_type;
        bool queried = false;
        Clock::time_point queried_at;
    };

    std::set<std::string> browsed_;                                      // normalized type
    std::map<std::string, Cached<SrvData>> srv_;                         // normalized owner
    std::map<std::string, Cached<std::vector<std::string>>> txt_;
    std::map<std::string, Cached<std::string>> addr_;
    std::map<std::string, Pending> pending_;
};

} // namespace nodemesh

#endif // NODEMESH_DISCOVERY_SERVICE_CACHE_H
