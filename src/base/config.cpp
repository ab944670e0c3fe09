#include "nodemesh/base/config.h"
#include "nodemesh/base/logger.h"
#include "CLI/CLI.hpp"
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace nodemesh {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

} // anonymous namespace

std::string default_receive_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return (tmp / "node_controller_files").string();
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    std::map<std::string, std::map<std::string, std::string>> sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }

    if (!apply_sections(sections)) {
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections) {
    auto find = [&](const std::string& section, const std::string& key) -> const std::string* {
        auto sit = sections.find(section);
        if (sit == sections.end()) return nullptr;
        auto kit = sit->second.find(key);
        return kit == sit->second.end() ? nullptr : &kit->second;
    };

    try {
        if (auto v = find("log", "level")) config_.log.level = *v;
        if (auto v = find("log", "output")) config_.log.output = *v;
        if (auto v = find("log", "file_path")) config_.log.file_path = *v;

        if (auto v = find("node", "name")) config_.node.name = *v;
        if (auto v = find("node", "port")) config_.node.port = static_cast<uint16_t>(std::stoul(*v));

        if (auto v = find("discovery", "enable")) config_.discovery.enable = parse_bool(*v);
        if (auto v = find("discovery", "service_type")) config_.discovery.service_type = *v;
        if (auto v = find("discovery", "ttl_sec")) config_.discovery.ttl_sec = std::stoul(*v);
        if (auto v = find("discovery", "refresh_interval_sec")) config_.discovery.refresh_interval_sec = std::stoul(*v);
        if (auto v = find("discovery", "interface")) config_.discovery.interface_name = *v;

        if (auto v = find("transfer", "chunk_size")) config_.transfer.chunk_size = std::stoull(*v);
        if (auto v = find("transfer", "port")) config_.transfer.port = static_cast<uint16_t>(std::stoul(*v));
        if (auto v = find("transfer", "receive_dir")) config_.transfer.receive_dir = *v;
        if (auto v = find("transfer", "concurrent_streams")) config_.transfer.concurrent_streams = std::stoul(*v);
        if (auto v = find("transfer", "buffer_pool_size")) config_.transfer.buffer_pool_size = std::stoul(*v);

        if (auto v = find("liveness", "enable")) config_.liveness.enable = parse_bool(*v);
        if (auto v = find("liveness", "bind_address")) config_.liveness.bind_address = *v;
        if (auto v = find("liveness", "request_timeout_sec")) config_.liveness.request_timeout_sec = std::stoul(*v);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid numeric value in config: " + std::string(e.what()));
        return false;
    }
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        if (const char* val = std::getenv("NODEMESH_NODE_NAME")) {
            config_.node.name = val;
        }
        if (const char* val = std::getenv("NODEMESH_NODE_PORT")) {
            config_.node.port = static_cast<uint16_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("NODEMESH_LOG_LEVEL")) {
            config_.log.level = val;
        }
        if (const char* val = std::getenv("NODEMESH_INTERFACE")) {
            config_.discovery.interface_name = val;
        }
        if (const char* val = std::getenv("NODEMESH_TRANSFER_PORT")) {
            config_.transfer.port = static_cast<uint16_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("NODEMESH_RECEIVE_DIR")) {
            config_.transfer.receive_dir = val;
        }
        if (const char* val = std::getenv("NODEMESH_CHUNK_SIZE")) {
            config_.transfer.chunk_size = std::stoull(val);
        }
        if (const char* val = std::getenv("NODEMESH_STREAMS")) {
            config_.transfer.concurrent_streams = std::stoul(val);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid numeric value in environment: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Config::add_options(CLI::App& app) {
    // Declared first so file values are applied before explicit options
    app.add_option_function<std::string>("-c,--config", [this](const std::string& path) {
        if (!load_from_file(path)) {
            throw CLI::ValidationError("--config", "cannot load " + path);
        }
    }, "Path to configuration file");

    // Node options
    app.add_option("--name", config_.node.name, "Node name (default: hostname)");
    app.add_option("--port", config_.node.port, "Advertised node port");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Discovery options
    app.add_option("--interface", config_.discovery.interface_name, "Interface to advertise on");
    app.add_option("--discovery-ttl", config_.discovery.ttl_sec, "Advertisement TTL (seconds)");
    app.add_option("--discovery-refresh", config_.discovery.refresh_interval_sec, "Re-advertisement interval (seconds)");

    // Transfer options
    app.add_option("--transfer-port", config_.transfer.port, "File transfer listen port (0 = ephemeral)");
    app.add_option("--receive-dir", config_.transfer.receive_dir, "Directory for received files");
    app.add_option("--chunk-size", config_.transfer.chunk_size, "Bytes per I/O operation");
    app.add_option("--streams", config_.transfer.concurrent_streams, "Parallel streams per send");
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));
    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        if (!logger.set_file_output(config_.log.file_path)) {
            logger.set_output(LogOutput::Stdout);
            logger.warning("Cannot open log file " + config_.log.file_path + ", logging to stdout");
        }
    } else if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else {
        logger.set_output(LogOutput::Stdout);
    }
}

bool Config::validate() const {
    if (config_.node.name.size() > MAX_NODE_NAME_LENGTH) {
        Logger::instance().error("node.name must be at most " + std::to_string(MAX_NODE_NAME_LENGTH) + " bytes");
        return false;
    }
    if (config_.transfer.chunk_size == 0) {
        Logger::instance().error("transfer.chunk_size must be positive");
        return false;
    }
    if (config_.transfer.concurrent_streams == 0) {
        Logger::instance().error("transfer.concurrent_streams must be positive");
        return false;
    }
    if (config_.discovery.refresh_interval_sec == 0 ||
        config_.discovery.refresh_interval_sec >= config_.discovery.ttl_sec) {
        Logger::instance().error("discovery.refresh_interval_sec must be positive and shorter than ttl_sec");
        return false;
    }
    if (config_.log.output == "file" && config_.log.file_path.empty()) {
        Logger::instance().error("log.file_path is required when log.output is file");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Node: " + config_.node.name + " port " + std::to_string(config_.node.port));
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Discovery: " + config_.discovery.service_type +
                            " ttl " + std::to_string(config_.discovery.ttl_sec) + "s");
    Logger::instance().info("Transfer Port: " + std::to_string(config_.transfer.port));
    Logger::instance().info("Receive Dir: " + config_.transfer.receive_dir);
    Logger::instance().info("Chunk Size: " + std::to_string(config_.transfer.chunk_size) +
                            ", streams: " + std::to_string(config_.transfer.concurrent_streams));
}

} // namespace nodemesh
