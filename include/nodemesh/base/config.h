#ifndef NODEMESH_BASE_CONFIG_H
#define NODEMESH_BASE_CONFIG_H

#include <string>
#include <cstdint>
#include <cstddef>
#include <map>

namespace CLI {
class App;
}

namespace nodemesh {

inline constexpr const char* NODEMESH_VERSION = "0.2.0";

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Node identity configuration
// Longest node name that still fits the "name=" TXT string
constexpr size_t MAX_NODE_NAME_LENGTH = 200;

struct NodeConfig {
    std::string name;               // Empty means use the hostname
    uint16_t port = 54321;          // Advertised port, also served by the liveness endpoint
};

// Local-network discovery configuration
struct DiscoveryConfig {
    bool enable = true;
    std::string service_type = "_node-controller._tcp.local.";
    uint32_t ttl_sec = 60;
    uint32_t refresh_interval_sec = 55;
    std::string interface_name;     // Empty means pick the best interface
};

// File transfer configuration
struct TransferConfig {
    uint64_t chunk_size = 1024 * 1024;      // Bytes per I/O operation
    uint16_t port = 7879;                   // 0 = ephemeral
    std::string receive_dir;                // Empty means <tmp>/node_controller_files
    uint32_t concurrent_streams = 4;
    uint32_t buffer_pool_size = 8;
};

// Peer liveness endpoint configuration
struct LivenessConfig {
    bool enable = true;
    std::string bind_address = "0.0.0.0";
    uint32_t request_timeout_sec = 5;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    DiscoveryConfig discovery;
    TransferConfig transfer;
    LivenessConfig liveness;
};

// Default receive directory under the system temp path
std::string default_receive_dir();

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Apply INI sections to the current configuration
    bool apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections);

    // Register command line options on a CLI11 app. A --config file is
    // loaded before the remaining options are applied.
    void add_options(CLI::App& app);

    // Apply logging settings after all sources were read
    void apply_logging() const;

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Reset to defaults
    void reset();

    // Check value ranges
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace nodemesh

#endif // NODEMESH_BASE_CONFIG_H
