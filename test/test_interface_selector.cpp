#include <catch2/catch_test_macros.hpp>
#include <vector>
#include <string>
#include "nodemesh/net/interface_selector.h"
#include "nodemesh/base/error_code.h"

using namespace nodemesh;

TEST_CASE("Interface classification by name", "[interface][classify]") {
    REQUIRE(classify_interface("lo", false) == InterfaceType::Loopback);
    REQUIRE(classify_interface("lo0", false) == InterfaceType::Loopback);
    REQUIRE(classify_interface("anything", true) == InterfaceType::Loopback);

    REQUIRE(classify_interface("en5", false) == InterfaceType::Thunderbolt);
    REQUIRE(classify_interface("en6", false) == InterfaceType::Thunderbolt);
    REQUIRE(classify_interface("bridge0", false) == InterfaceType::Thunderbolt);
    REQUIRE(classify_interface("thunderbolt0", false) == InterfaceType::Thunderbolt);

    REQUIRE(classify_interface("en0", false) == InterfaceType::Ethernet);
    REQUIRE(classify_interface("eth0", false) == InterfaceType::Ethernet);
    REQUIRE(classify_interface("enp3s0", false) == InterfaceType::Ethernet);

    REQUIRE(classify_interface("wl0", false) == InterfaceType::Wifi);
    REQUIRE(classify_interface("wlan0", false) == InterfaceType::Wifi);
    REQUIRE(classify_interface("wlo1", false) == InterfaceType::Wifi);

    REQUIRE(classify_interface("docker0", false) == InterfaceType::Other);
}

TEST_CASE("Classification ignores case", "[interface][classify]") {
    REQUIRE(classify_interface("ETH0", false) == InterfaceType::Ethernet);
    REQUIRE(classify_interface("Wi-Fi", false) == InterfaceType::Wifi);
}

TEST_CASE("Interface priorities", "[interface][priority]") {
    REQUIRE(interface_priority(InterfaceType::Thunderbolt) == 100);
    REQUIRE(interface_priority(InterfaceType::Ethernet) == 80);
    REQUIRE(interface_priority(InterfaceType::Wifi) == 60);
    REQUIRE(interface_priority(InterfaceType::Loopback) == 10);
    REQUIRE(interface_priority(InterfaceType::Other) == 1);
}

TEST_CASE("Ranking selects the high-speed bridge", "[interface][rank]") {
    std::vector<NetworkInterface> interfaces = {
        make_interface("lo", "127.0.0.1", true),
        make_interface("en0", "192.168.1.10", false),
        make_interface("en5", "169.254.10.2", false),
        make_interface("wl0", "192.168.1.11", false),
    };

    rank_interfaces(interfaces);
    REQUIRE(interfaces[0].name == "en5");
    REQUIRE(interfaces[1].name == "en0");
    REQUIRE(interfaces[2].name == "wl0");
    REQUIRE(interfaces[3].name == "lo");

    auto best = select_best_interface(interfaces);
    REQUIRE(best.has_value());
    REQUIRE(best->name == "en5");
    REQUIRE(best->type == InterfaceType::Thunderbolt);
}

TEST_CASE("Ranking is stable and prefers IPv4 on ties", "[interface][rank]") {
    std::vector<NetworkInterface> interfaces = {
        make_interface("eth0", "fe80::1", false, true),
        make_interface("eth0", "10.0.0.2", false),
        make_interface("eth1", "10.0.1.2", false),
    };

    rank_interfaces(interfaces);
    REQUIRE(interfaces[0].ip == "10.0.0.2");
    REQUIRE(interfaces[1].ip == "10.0.1.2");
    REQUIRE(interfaces[2].ip == "fe80::1");
}

TEST_CASE("Only loopback means no best interface", "[interface][rank]") {
    std::vector<NetworkInterface> interfaces = {make_interface("lo", "127.0.0.1", true)};
    REQUIRE_FALSE(select_best_interface(interfaces).has_value());
    REQUIRE_FALSE(select_best_interface({}).has_value());
}

TEST_CASE("Discovered interfaces are ranked", "[interface][discover]") {
    auto interfaces = discover_interfaces();
    for (size_t i = 1; i < interfaces.size(); ++i) {
        REQUIRE(interfaces[i - 1].priority >= interfaces[i].priority);
    }
    for (const auto& iface : interfaces) {
        REQUIRE_FALSE(iface.ip.empty());
        REQUIRE(iface.priority == interface_priority(iface.type));
    }
}

TEST_CASE("Interface type names", "[interface][type]") {
    for (auto type : {InterfaceType::Thunderbolt, InterfaceType::Ethernet, InterfaceType::Wifi,
                      InterfaceType::Loopback, InterfaceType::Other}) {
        auto parsed = interface_type_from_string(to_string(type));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == type);
    }
    REQUIRE_FALSE(interface_type_from_string("Token Ring").has_value());
    REQUIRE(to_string(ErrorCode::InterfaceUnavailable) == "No suitable network interface found");
}
