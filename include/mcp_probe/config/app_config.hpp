#pragma once

#include <optional>
#include <string>

namespace mcp_probe {

struct ServerConfig {
    std::string path;
    int response_timeout_ms = 30000;  // 0 waits forever
    int shutdown_timeout_ms = 5000;
    int stderr_capture_bytes = 64 * 1024;
};

struct ScenarioConfig {
    std::string query = "rust";
    int search_limit = 3;
    int topics_limit = 5;
    std::string protocol_version = "2024-11-05";
    std::string client_name = "test-client";
    std::string client_version = "1.0.0";
    bool initialized_notification = false;  // send notifications/initialized, no reply
    bool strict = false;                    // functional failures flip the exit code
};

struct AppConfig {
    ServerConfig server;
    ScenarioConfig scenario;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool debug = false;
    bool quiet = false;
    bool force_color = false;
    bool force_no_color = false;
};

} // namespace mcp_probe
