#include <catch2/catch_test_macros.hpp>
#include <string>
#include <map>
#include <nlohmann/json.hpp>
#include "nodemesh/rpc/liveness.h"
#include "nodemesh/base/uuid.h"

using namespace nodemesh;

namespace {

NodeInfo local_node(uint16_t port) {
    NodeInfo node;
    node.id = generate_uuid();
    node.name = "responder";
    node.ip = "127.0.0.1";
    node.port = port;
    return node;
}

} // anonymous namespace

TEST_CASE("Ping reply echoes sender and message", "[liveness][ping]") {
    auto node = local_node(54400);
    LivenessServer server(node, LivenessConfig{});

    PingRequest request;
    request.sender = "alpha";
    request.message = "are you there";
    request.timestamp_ms = 1700000000000;

    auto before = unix_time_ms();
    auto pong = server.handle_ping(request);
    REQUIRE(pong.responder_id == node.id);
    REQUIRE(pong.responder_name == "responder");
    REQUIRE(pong.message == "Hello, alpha! Your message was: are you there");
    REQUIRE(pong.request_ts == 1700000000000);
    REQUIRE(pong.response_ts >= before);
}

TEST_CASE("Health merges provider metrics", "[liveness][health]") {
    LivenessServer server(local_node(54401), LivenessConfig{});

    auto health = server.handle_health();
    REQUIRE(health.status == HealthStatus::Healthy);
    REQUIRE(health.metrics.count("uptime_seconds") == 1);

    server.set_metrics_provider([]() {
        return std::map<std::string, std::string>{{"peer_count", "3"}, {"active_transfers", "1"}};
    });
    server.set_health_provider([]() { return HealthStatus::Degraded; });

    health = server.handle_health();
    REQUIRE(health.status == HealthStatus::Degraded);
    REQUIRE(health.metrics.at("peer_count") == "3");
    REQUIRE(health.metrics.at("active_transfers") == "1");
    REQUIRE(health.metrics.count("uptime_seconds") == 1);
}

TEST_CASE("Health status values", "[liveness][health]") {
    REQUIRE(static_cast<int>(HealthStatus::Unknown) == 0);
    REQUIRE(static_cast<int>(HealthStatus::Healthy) == 1);
    REQUIRE(static_cast<int>(HealthStatus::Degraded) == 2);
    REQUIRE(static_cast<int>(HealthStatus::Unhealthy) == 3);
    REQUIRE(to_string(HealthStatus::Unhealthy) == "Unhealthy");
}

TEST_CASE("Liveness JSON bodies", "[liveness][json]") {
    PongResponse pong;
    pong.responder_id = "id-1";
    pong.responder_name = "n";
    pong.message = "m";
    pong.request_ts = 1;
    pong.response_ts = 2;

    auto parsed = parse_pong_response(serialize_pong_response(pong));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->responder_id == "id-1");
    REQUIRE(parsed->request_ts == 1);
    REQUIRE(parsed->response_ts == 2);

    auto body = nlohmann::json::parse(serialize_health_response(HealthCheckResponse{"id-2", "n", HealthStatus::Healthy, {{"k", "v"}}}));
    REQUIRE(body["status"] == 1);
    REQUIRE(body["metrics"]["k"] == "v");

    auto health = parse_health_response(R"({"responder_id":"x","status":9,"metrics":{"a":5}})");
    REQUIRE(health.has_value());
    REQUIRE(health->status == HealthStatus::Unknown);
    REQUIRE(health->metrics.at("a") == "5");

    REQUIRE_FALSE(parse_ping_request("not json").has_value());
    REQUIRE_FALSE(parse_ping_request(R"({"sender":"a"})").has_value());
    REQUIRE_FALSE(parse_pong_response("[]").has_value());
}

TEST_CASE("Client and server talk over HTTP", "[liveness][http]") {
    auto node = local_node(54402);
    LivenessServer server(node, LivenessConfig{});
    server.set_metrics_provider([]() {
        return std::map<std::string, std::string>{{"peer_count", "0"}};
    });
    REQUIRE(server.start());
    REQUIRE(server.is_running());

    LivenessClient client(LivenessConfig{});
    auto pong = client.ping(node, "tester", "hi");
    REQUIRE(pong.has_value());
    REQUIRE(pong->responder_id == node.id);
    REQUIRE(pong->message == "Hello, tester! Your message was: hi");

    auto health = client.health_check("127.0.0.1", node.port);
    REQUIRE(health.has_value());
    REQUIRE(health->status == HealthStatus::Healthy);
    REQUIRE(health->metrics.at("peer_count") == "0");

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("Client reports unreachable peers", "[liveness][http]") {
    LivenessConfig config;
    config.request_timeout_sec = 1;
    LivenessClient client(config);
    REQUIRE_FALSE(client.ping("127.0.0.1", 1, "tester", "hi").has_value());
    REQUIRE_FALSE(client.health_check("127.0.0.1", 1).has_value());
}
