#include "nodemesh/net/interface_selector.h"
#include "nodemesh/base/error_code.h"
#include "nodemesh/base/logger.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace nodemesh {

namespace {

std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_thunderbolt_name(const std::string& n) {
    if (contains(n, "thunderbolt") || contains(n, "tb") || contains(n, "bridge")) {
        return true;
    }
    // Thunderbolt bridges commonly show up as en5/en6
    return starts_with(n, "en") && (contains(n, "5") || contains(n, "6"));
}

bool is_ethernet_name(const std::string& n) {
    return contains(n, "eth") || contains(n, "en");
}

bool is_wifi_name(const std::string& n) {
    return contains(n, "wlan") || contains(n, "wifi") || contains(n, "wi-fi") || starts_with(n, "wl");
}

} // anonymous namespace

std::string to_string(InterfaceType type) {
    switch (type) {
        case InterfaceType::Thunderbolt: return "Thunderbolt";
        case InterfaceType::Ethernet: return "Ethernet";
        case InterfaceType::Wifi: return "Wifi";
        case InterfaceType::Loopback: return "Loopback";
        case InterfaceType::Other: return "Other";
    }
    return "Other";
}

std::optional<InterfaceType> interface_type_from_string(const std::string& name) {
    if (name == "Thunderbolt") return InterfaceType::Thunderbolt;
    if (name == "Ethernet") return InterfaceType::Ethernet;
    if (name == "Wifi") return InterfaceType::Wifi;
    if (name == "Loopback") return InterfaceType::Loopback;
    if (name == "Other") return InterfaceType::Other;
    return std::nullopt;
}

uint32_t interface_priority(InterfaceType type) {
    switch (type) {
        case InterfaceType::Thunderbolt: return 100;
        case InterfaceType::Ethernet: return 80;
        case InterfaceType::Wifi: return 60;
        case InterfaceType::Loopback: return 10;
        case InterfaceType::Other: return 1;
    }
    return 1;
}

InterfaceType classify_interface(const std::string& name, bool is_loopback_address) {
    std::string n = to_lower(name);

    if (starts_with(n, "lo") || is_loopback_address) {
        return InterfaceType::Loopback;
    }
    if (is_thunderbolt_name(n)) {
        return InterfaceType::Thunderbolt;
    }
    if (is_ethernet_name(n)) {
        return InterfaceType::Ethernet;
    }
    if (is_wifi_name(n)) {
        return InterfaceType::Wifi;
    }
    return InterfaceType::Other;
}

NetworkInterface make_interface(const std::string& name, const std::string& ip,
                                bool is_loopback_address, bool is_ipv6) {
    NetworkInterface iface;
    iface.name = name;
    iface.ip = ip;
    iface.is_ipv6 = is_ipv6;
    iface.type = classify_interface(name, is_loopback_address);
    iface.is_loopback = iface.type == InterfaceType::Loopback;
    iface.priority = interface_priority(iface.type);
    return iface;
}

void rank_interfaces(std::vector<NetworkInterface>& interfaces) {
    std::stable_sort(interfaces.begin(), interfaces.end(),
                     [](const NetworkInterface& a, const NetworkInterface& b) {
                         if (a.priority != b.priority) {
                             return a.priority > b.priority;
                         }
                         // Advertisements carry an A record, so IPv4 wins a tie
                         return !a.is_ipv6 && b.is_ipv6;
                     });
}

std::optional<NetworkInterface> select_best_interface(const std::vector<NetworkInterface>& ranked) {
    for (const auto& iface : ranked) {
        if (!iface.is_loopback) {
            return iface;
        }
    }
    return std::nullopt;
}

std::vector<NetworkInterface> discover_interfaces() {
    std::vector<NetworkInterface> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        Logger::instance().error("getifaddrs failed: " + std::string(strerror(errno)));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr) {
            continue;
        }

        char buf[INET6_ADDRSTRLEN] = {0};
        bool loopback = false;
        bool ipv6 = false;

        if (ifa->ifa_addr->sa_family == AF_INET) {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            uint32_t addr = ntohl(sin->sin_addr.s_addr);
            if (addr == INADDR_ANY || IN_MULTICAST(addr)) {
                continue;
            }
            loopback = (addr >> 24) == 127;
            inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            if (IN6_IS_ADDR_UNSPECIFIED(&sin6->sin6_addr) || IN6_IS_ADDR_MULTICAST(&sin6->sin6_addr)) {
                continue;
            }
            loopback = IN6_IS_ADDR_LOOPBACK(&sin6->sin6_addr);
            ipv6 = true;
            inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        } else {
            continue;
        }

        result.push_back(make_interface(ifa->ifa_name, buf, loopback, ipv6));
    }

    freeifaddrs(ifaddr);

    rank_interfaces(result);
    return result;
}

NetworkInterface get_best_interface() {
    auto interfaces = discover_interfaces();
    auto best = select_best_interface(interfaces);
    if (!best) {
        throw NodeMeshError(ErrorCode::InterfaceUnavailable,
                            "checked " + std::to_string(interfaces.size()) + " interface(s)");
    }
    Logger::instance().info("Selected interface " + best->name + " (" + to_string(best->type) +
                            ") with IP " + best->ip);
    return *best;
}

} // namespace nodemesh
