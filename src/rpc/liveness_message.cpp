#include "nodemesh/rpc/liveness.h"
#include "nodemesh/base/logger.h"
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nodemesh {

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Unknown: return "Unknown";
        case HealthStatus::Healthy: return "Healthy";
        case HealthStatus::Degraded: return "Degraded";
        case HealthStatus::Unhealthy: return "Unhealthy";
    }
    return "Unknown";
}

int64_t unix_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string serialize_ping_request(const PingRequest& request) {
    json j = {
        {"sender", request.sender},
        {"message", request.message},
        {"timestamp", request.timestamp_ms}
    };
    return j.dump();
}

std::optional<PingRequest> parse_ping_request(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("sender") || !j.contains("message")) {
            return std::nullopt;
        }
        PingRequest request;
        request.sender = j.value("sender", "");
        request.message = j.value("message", "");
        request.timestamp_ms = j.value("timestamp", int64_t{0});
        return request;
    } catch (const json::exception& e) {
        Logger::instance().debug("Invalid ping request: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string serialize_pong_response(const PongResponse& response) {
    json j = {
        {"responder_id", response.responder_id},
        {"responder_name", response.responder_name},
        {"message", response.message},
        {"request_timestamp", response.request_ts},
        {"response_timestamp", response.response_ts}
    };
    return j.dump();
}

std::optional<PongResponse> parse_pong_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("responder_id")) {
            return std::nullopt;
        }
        PongResponse response;
        response.responder_id = j.value("responder_id", "");
        response.responder_name = j.value("responder_name", "");
        response.message = j.value("message", "");
        response.request_ts = j.value("request_timestamp", int64_t{0});
        response.response_ts = j.value("response_timestamp", int64_t{0});
        return response;
    } catch (const json::exception& e) {
        Logger::instance().debug("Invalid ping response: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string serialize_health_response(const HealthCheckResponse& response) {
    json j = {
        {"responder_id", response.responder_id},
        {"responder_name", response.responder_name},
        {"status", static_cast<int>(response.status)},
        {"metrics", response.metrics}
    };
    return j.dump();
}

std::optional<HealthCheckResponse> parse_health_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("responder_id") || !j.contains("status")) {
            return std::nullopt;
        }
        HealthCheckResponse response;
        response.responder_id = j.value("responder_id", "");
        response.responder_name = j.value("responder_name", "");

        int status = j.value("status", 0);
        if (status < 0 || status > static_cast<int>(HealthStatus::Unhealthy)) {
            status = 0;
        }
        response.status = static_cast<HealthStatus>(status);

        if (j.contains("metrics") && j["metrics"].is_object()) {
            for (const auto& [key, value] : j["metrics"].items()) {
                response.metrics[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        return response;
    } catch (const json::exception& e) {
        Logger::instance().debug("Invalid health response: " + std::string(e.what()));
        return std::nullopt;
    }
}

} // namespace nodemesh
