#pragma once

#include <cstdint>
#include <string>

namespace texq {

// Who runs the compile runner: the serving process itself, or a separate
// worker process that proves liveness through heartbeats.
enum class DeploymentMode { Embedded, Dedicated };

enum class RuntimeKind { Docker, Process };

struct RedisConfig {
    std::string host = "localhost";
    int port = 6379;
    std::string password;
    int db = 0;
};

struct Config {
    RedisConfig redis;
    std::string key_prefix = "compile";
    std::string listen_address = "0.0.0.0:50051";

    // Sandbox
    RuntimeKind runtime = RuntimeKind::Docker;
    std::string docker_bin = "docker";
    std::string compiler_image = "texq-compiler";
    int compile_timeout_s = 120;
    std::string compile_memory = "1g";
    double compile_cpus = 1.5;
    int pids_limit = 256;
    int max_concurrent = 5;

    // Storage
    std::string storage_path = "/data";
    std::string projects_root;
    int result_ttl_minutes = 60;
    std::size_t max_source_bytes = 5 * 1024 * 1024;

    int cancel_ttl_s = 900;

    // Worker liveness
    DeploymentMode mode = DeploymentMode::Embedded;
    std::string heartbeat_key = "compile:worker:heartbeat";
    int heartbeat_interval_ms = 5000;
    int heartbeat_max_age_ms = 30000;

    std::string status_channel = "compile:status";
    std::string public_base_url = "/api/v1/compile";

    // Throws ConfigError describing the first inconsistent setting.
    void validate() const;

    std::string async_queue_name() const { return key_prefix + ":async"; }
    std::string project_queue_name() const { return key_prefix + ":jobs"; }
    std::string ephemeral_root() const;
    std::string builds_root() const;
};

// Defaults, then command-line flags, then environment variables.
Config load_config(int argc, char** argv);

// Applies REDIS_URL style "redis://[:password@]host[:port][/db]".
// Throws ConfigError when the URL is not a redis URL.
RedisConfig parse_redis_url(const std::string& url);

// Docker style memory strings: "512m", "1g", "1024k", plain bytes.
int64_t parse_memory_string(const std::string& mem);

const char* to_string(DeploymentMode mode);
const char* to_string(RuntimeKind kind);

} // namespace texq
