#ifndef NODEMESH_NET_INTERFACE_SELECTOR_H
#define NODEMESH_NET_INTERFACE_SELECTOR_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace nodemesh {

// Interface classes, ordered by how much bandwidth they usually carry
enum class InterfaceType {
    Thunderbolt,    // High-speed bridge (thunderbolt, usb4, bridged en5/en6)
    Ethernet,
    Wifi,
    Loopback,
    Other
};

std::string to_string(InterfaceType type);
std::optional<InterfaceType> interface_type_from_string(const std::string& name);

// Fixed ranking priority for an interface class
uint32_t interface_priority(InterfaceType type);

struct NetworkInterface {
    std::string name;
    std::string ip;
    bool is_ipv6 = false;
    bool is_loopback = false;
    InterfaceType type = InterfaceType::Other;
    uint32_t priority = 0;
};

// Classify an interface by name, falling back on loopback-ness of its address
InterfaceType classify_interface(const std::string& name, bool is_loopback_address);

// Build a classified entry from a name and address
NetworkInterface make_interface(const std::string& name, const std::string& ip,
                                bool is_loopback_address, bool is_ipv6 = false);

// Sort by descending priority. Stable, so OS order breaks ties.
void rank_interfaces(std::vector<NetworkInterface>& interfaces);

// First non-loopback entry of a ranked list
std::optional<NetworkInterface> select_best_interface(const std::vector<NetworkInterface>& ranked);

// Enumerate OS interfaces with a usable address, ranked
std::vector<NetworkInterface> discover_interfaces();

// Best interface of this host. Throws NodeMeshError(InterfaceUnavailable).
NetworkInterface get_best_interface();

} // namespace nodemesh

#endif // NODEMESH_NET_INTERFACE_SELECTOR_H
