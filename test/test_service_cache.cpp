#include <catch2/catch_test_macros.hpp>
#include <string>
#include <chrono>
#include "nodemesh/discovery/service_cache.h"

using namespace nodemesh;

namespace {

const std::string SERVICE_TYPE = "_node-controller._tcp.local.";

DnsMessage announcement(const std::string& instance, const std::string& ip, uint32_t ttl) {
    DnsMessage msg;
    msg.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;
    std::string full = instance + "." + SERVICE_TYPE;
    std::string host = ip + ".local.";

    DnsRecord ptr;
    ptr.name = SERVICE_TYPE;
    ptr.type = dns_type::PTR;
    ptr.ttl = ttl;
    ptr.target = full;
    msg.answers.push_back(ptr);

    DnsRecord srv;
    srv.name = full;
    srv.type = dns_type::SRV;
    srv.ttl = ttl;
    srv.port = 54321;
    srv.target = host;
    msg.answers.push_back(srv);

    DnsRecord txt;
    txt.name = full;
    txt.type = dns_type::TXT;
    txt.ttl = ttl;
    txt.txt = {"id=" + instance, "name=" + instance};
    msg.answers.push_back(txt);

    DnsRecord a;
    a.name = host;
    a.type = dns_type::A;
    a.ttl = ttl;
    a.address = ip;
    msg.additionals.push_back(a);
    return msg;
}

DnsMessage ptr_only(const std::string& instance) {
    DnsMessage msg;
    msg.flags = DNS_FLAG_RESPONSE;
    DnsRecord ptr;
    ptr.name = SERVICE_TYPE;
    ptr.type = dns_type::PTR;
    ptr.ttl = 60;
    ptr.target = instance + "." + SERVICE_TYPE;
    msg.answers.push_back(ptr);
    return msg;
}

} // anonymous namespace

TEST_CASE("Complete announcement resolves at once", "[service_cache][resolve]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    auto update = cache.apply(announcement("beta_1", "192.168.1.20", 60), now);
    REQUIRE(update.follow_up.empty());
    REQUIRE(update.events.size() == 1);

    const auto& event = update.events[0];
    REQUIRE(event.type == ServiceEventType::Resolved);
    REQUIRE(event.record.instance_name == "beta_1");
    REQUIRE(event.record.address == "192.168.1.20");
    REQUIRE(event.record.port == 54321);
    REQUIRE(event.record.ttl_sec == 60);
    REQUIRE(event.record.properties.at("name") == "beta_1");
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Unbrowsed types are ignored", "[service_cache][resolve]") {
    ServiceCache cache;
    auto update = cache.apply(announcement("beta_1", "192.168.1.20", 60), ServiceCache::Clock::now());
    REQUIRE(update.events.empty());
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Resolved instances that fall silent are evicted", "[service_cache][expiry]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    cache.apply(announcement("beta_1", "192.168.1.20", 60), now);
    REQUIRE(cache.size() == 3);

    cache.evict_expired(now + std::chrono::seconds(59));
    REQUIRE(cache.size() == 3);

    cache.evict_expired(now + std::chrono::seconds(60));
    REQUIRE(cache.size() == 0);
}

TEST_CASE("Restarted peers do not accumulate records", "[service_cache][expiry]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    // A new instance name per restart, one every 90 seconds
    for (int i = 0; i < 20; ++i) {
        auto at = now + std::chrono::seconds(90 * i);
        cache.apply(announcement("beta_" + std::to_string(i), "192.168.1.20", 60), at);
        REQUIRE(cache.size() <= 3);
    }
}

TEST_CASE("Re-announcement extends the lifetime", "[service_cache][expiry]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    cache.apply(announcement("beta_1", "192.168.1.20", 60), now);
    auto update = cache.apply(announcement("beta_1", "192.168.1.20", 60), now + std::chrono::seconds(55));
    REQUIRE(update.events.size() == 1);

    cache.evict_expired(now + std::chrono::seconds(100));
    REQUIRE(cache.size() == 3);
}

TEST_CASE("Unanswered follow-up drops the pending instance", "[service_cache][pending]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    auto update = cache.apply(ptr_only("gamma_1"), now);
    REQUIRE(update.events.empty());
    REQUIRE(update.follow_up == std::vector<std::string>{"gamma_1." + SERVICE_TYPE});
    REQUIRE(cache.pending_count() == 1);

    // Only one follow-up per instance
    update = cache.apply(ptr_only("gamma_1"), now + std::chrono::seconds(1));
    REQUIRE(update.follow_up.empty());

    cache.evict_expired(now + FOLLOW_UP_TIMEOUT - std::chrono::seconds(1));
    REQUIRE(cache.pending_count() == 1);

    cache.evict_expired(now + FOLLOW_UP_TIMEOUT);
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Follow-up answer resolves the pending instance", "[service_cache][pending]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    cache.apply(ptr_only("gamma_1"), now);
    auto answer = announcement("gamma_1", "192.168.1.30", 60);
    answer.answers.erase(answer.answers.begin());

    auto update = cache.apply(answer, now + std::chrono::seconds(1));
    REQUIRE(update.events.size() == 1);
    REQUIRE(update.events[0].record.address == "192.168.1.30");
    REQUIRE(cache.pending_count() == 0);
}

TEST_CASE("Goodbye removes the instance records", "[service_cache][goodbye]") {
    ServiceCache cache;
    cache.add_browsed_type(SERVICE_TYPE);
    auto now = ServiceCache::Clock::now();

    cache.apply(announcement("beta_1", "192.168.1.20", 60), now);
    auto update = cache.apply(announcement("beta_1", "192.168.1.20", 0), now);
    REQUIRE(update.events.size() == 1);
    REQUIRE(update.events[0].type == ServiceEventType::Removed);
    REQUIRE(update.events[0].full_name == "beta_1." + SERVICE_TYPE);
    REQUIRE(cache.size() == 0);
}
