#ifndef NODEMESH_RPC_LIVENESS_H
#define NODEMESH_RPC_LIVENESS_H

#include "nodemesh/base/config.h"
#include "nodemesh/discovery/node_discovery.h"
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <cstdint>

namespace nodemesh {

struct PingRequest {
    std::string sender;
    std::string message;
    int64_t timestamp_ms = 0;
};

struct PongResponse {
    std::string responder_id;
    std::string responder_name;
    std::string message;
    int64_t request_ts = 0;
    int64_t response_ts = 0;
};

enum class HealthStatus {
    Unknown = 0,
    Healthy = 1,
    Degraded = 2,
    Unhealthy = 3
};

std::string to_string(HealthStatus status);

struct HealthCheckResponse {
    std::string responder_id;
    std::string responder_name;
    HealthStatus status = HealthStatus::Unknown;
    std::map<std::string, std::string> metrics;
};

// JSON bodies of the liveness endpoints
std::string serialize_ping_request(const PingRequest& request);
std::optional<PingRequest> parse_ping_request(const std::string& body);
std::string serialize_pong_response(const PongResponse& response);
std::optional<PongResponse> parse_pong_response(const std::string& body);
std::string serialize_health_response(const HealthCheckResponse& response);
std::optional<HealthCheckResponse> parse_health_response(const std::string& body);

// Unix time in milliseconds
int64_t unix_time_ms();

using MetricsProvider = std::function<std::map<std::string, std::string>()>;
using HealthProvider = std::function<HealthStatus()>;

// Serves POST /api/v1/ping and GET /api/v1/health for the local node
class LivenessServer {
public:
    LivenessServer(const NodeInfo& local_node, const LivenessConfig& config);
    ~LivenessServer();

    // Extra metrics merged into every health response
    void set_metrics_provider(MetricsProvider provider);

    // Defaults to Healthy when unset
    void set_health_provider(HealthProvider provider);

    // Listen on the node's advertised port
    bool start();
    void stop();
    bool is_running() const;

    PongResponse handle_ping(const PingRequest& request) const;
    HealthCheckResponse handle_health() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Synchronous client for a peer's liveness endpoint
class LivenessClient {
public:
    explicit LivenessClient(const LivenessConfig& config);

    std::optional<PongResponse> ping(const std::string& host, uint16_t port,
                                     const std::string& sender, const std::string& message) const;
    std::optional<PongResponse> ping(const NodeInfo& peer, const std::string& sender,
                                     const std::string& message) const;

    std::optional<HealthCheckResponse> health_check(const std::string& host, uint16_t port) const;
    std::optional<HealthCheckResponse> health_check(const NodeInfo& peer) const;

private:
    LivenessConfig config_;
};

} // namespace nodemesh

#endif // NODEMESH_RPC_LIVENESS_H
