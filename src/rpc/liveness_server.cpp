#include "nodemesh/rpc/liveness.h"
#include "nodemesh/base/logger.h"
#include <elio/elio.hpp>
#include <elio/http/http.hpp>
#include <chrono>
#include <thread>
#include <atomic>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nodemesh {

struct LivenessServer::Impl {
    NodeInfo local_node;
    LivenessConfig config;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();

    mutable std::mutex providers_mutex;
    MetricsProvider metrics_provider;
    HealthProvider health_provider;

    std::atomic<bool> running{false};
    std::thread server_thread;
    std::unique_ptr<elio::http::server> http_server;

    Impl(const NodeInfo& node, const LivenessConfig& cfg) : local_node(node), config(cfg) {}
};

LivenessServer::LivenessServer(const NodeInfo& local_node, const LivenessConfig& config)
    : impl_(std::make_unique<Impl>(local_node, config)) {}

LivenessServer::~LivenessServer() {
    stop();
}

void LivenessServer::set_metrics_provider(MetricsProvider provider) {
    std::lock_guard<std::mutex> lock(impl_->providers_mutex);
    impl_->metrics_provider = std::move(provider);
}

void LivenessServer::set_health_provider(HealthProvider provider) {
    std::lock_guard<std::mutex> lock(impl_->providers_mutex);
    impl_->health_provider = std::move(provider);
}

PongResponse LivenessServer::handle_ping(const PingRequest& request) const {
    PongResponse response;
    response.responder_id = impl_->local_node.id;
    response.responder_name = impl_->local_node.name;
    response.message = "Hello, " + request.sender + "! Your message was: " + request.message;
    response.request_ts = request.timestamp_ms;
    response.response_ts = unix_time_ms();
    return response;
}

HealthCheckResponse LivenessServer::handle_health() const {
    HealthCheckResponse response;
    response.responder_id = impl_->local_node.id;
    response.responder_name = impl_->local_node.name;
    response.status = HealthStatus::Healthy;

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - impl_->started_at).count();
    response.metrics["uptime_seconds"] = std::to_string(uptime);
    response.metrics["version"] = impl_->local_node.version;

    std::lock_guard<std::mutex> lock(impl_->providers_mutex);
    if (impl_->health_provider) {
        response.status = impl_->health_provider();
    }
    if (impl_->metrics_provider) {
        for (auto& [key, value] : impl_->metrics_provider()) {
            response.metrics[key] = value;
        }
    }
    return response;
}

bool LivenessServer::start() {
    if (impl_->running.load()) {
        return true;
    }

    uint16_t port = impl_->local_node.port;
    Logger::instance().info("Starting liveness endpoint on " + impl_->config.bind_address + ":" +
                            std::to_string(port));

    impl_->running = true;

    LivenessServer* self = this;
    elio::http::router r;

    r.post("/api/v1/ping", [self](elio::http::context& ctx)
           -> elio::coro::task<elio::http::response> {
        auto body = ctx.req().body();
        auto request = parse_ping_request(std::string(body.begin(), body.end()));
        if (!request) {
            json error = {{"error", "Expected JSON body with sender and message"}};
            co_return elio::http::response(elio::http::status::bad_request, error.dump(),
                                           elio::http::mime::application_json);
        }

        Logger::instance().debug("Ping from " + request->sender);
        co_return elio::http::response(elio::http::status::ok,
                                       serialize_pong_response(self->handle_ping(*request)),
                                       elio::http::mime::application_json);
    });

    r.get("/api/v1/health", [self](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        co_return elio::http::response(elio::http::status::ok,
                                       serialize_health_response(self->handle_health()),
                                       elio::http::mime::application_json);
    });

    impl_->http_server = std::make_unique<elio::http::server>(std::move(r));

    impl_->http_server->set_not_found_handler([](elio::http::context& ctx)
        -> elio::coro::task<elio::http::response> {
        json error = {{"error", "Not Found"}, {"path", std::string(ctx.req().path())}};
        co_return elio::http::response(elio::http::status::not_found, error.dump(),
                                       elio::http::mime::application_json);
    });

    elio::net::socket_address bind_addr;
    if (impl_->config.bind_address == "0.0.0.0") {
        bind_addr = elio::net::socket_address(elio::net::ipv6_address(port));
    } else {
        bind_addr = elio::net::socket_address(impl_->config.bind_address, port);
    }

    elio::net::tcp_options opts;
    opts.reuse_addr = true;
    opts.ipv6_only = (impl_->config.bind_address != "0.0.0.0");

    impl_->server_thread = std::thread([this, bind_addr, opts]() {
        elio::run([this, bind_addr, opts]() -> elio::coro::task<void> {
            auto listen_task = impl_->http_server->listen(bind_addr, opts);
            auto listen_handle = std::move(listen_task).spawn();

            while (impl_->running) {
                co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            }

            impl_->http_server->stop();
            co_await listen_handle;
            co_return;
        }());
        Logger::instance().debug("Liveness server thread exiting");
    });

    // Give the listener time to bind
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return true;
}

void LivenessServer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
    impl_->http_server.reset();
    Logger::instance().info("Liveness endpoint stopped");
}

bool LivenessServer::is_running() const {
    return impl_->running.load();
}

} // namespace nodemesh
