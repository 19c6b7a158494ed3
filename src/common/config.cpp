#include "config.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace texq {

namespace {

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer in ") + name + ": " + value);
    }
}

void env_string(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

int parse_int_flag(const std::string& flag, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + flag + ": " + value);
    }
}

} // namespace

void Config::validate() const {
    if (compile_timeout_s < 1) {
        throw ConfigError("COMPILE_TIMEOUT must be at least 1 second");
    }
    if (max_concurrent < 1) {
        throw ConfigError("MAX_CONCURRENT_BUILDS must be at least 1");
    }
    if (cancel_ttl_s <= compile_timeout_s) {
        throw ConfigError("CANCEL_TTL_SECONDS must exceed COMPILE_TIMEOUT so late polls still see the marker");
    }
    if (compile_cpus <= 0.0) {
        throw ConfigError("COMPILE_CPUS must be positive");
    }
    if (pids_limit < 1) {
        throw ConfigError("COMPILE_PIDS_LIMIT must be at least 1");
    }
    if (redis.port <= 0 || redis.port > 65535) {
        throw ConfigError("Redis port out of range");
    }
    if (storage_path.empty()) {
        throw ConfigError("STORAGE_PATH must not be empty");
    }
}

std::string Config::ephemeral_root() const {
    return storage_path + "/async-compiles";
}

std::string Config::builds_root() const {
    return storage_path + "/builds";
}

RedisConfig parse_redis_url(const std::string& url) {
    static const std::regex url_re(
        R"(^rediss?://(?:([^:@/]*)(?::([^@/]*))?@)?([^:/]+)(?::(\d+))?(?:/(\d+))?/?$)");
    std::smatch match;
    if (!std::regex_match(url, match, url_re)) {
        throw ConfigError("Invalid REDIS_URL: " + url);
    }

    RedisConfig config;
    config.host = match[3].str();
    if (match[4].matched) config.port = std::stoi(match[4].str());
    // redis://:secret@host carries the password in the second group
    if (match[2].matched) {
        config.password = match[2].str();
    } else if (match[1].matched) {
        config.password = match[1].str();
    }
    if (match[5].matched) config.db = std::stoi(match[5].str());
    return config;
}

int64_t parse_memory_string(const std::string& mem) {
    static const std::regex mem_re(R"(^(\d+(?:\.\d+)?)\s*([kmgtKMGT])?[bB]?$)");
    constexpr int64_t kDefault = 1024LL * 1024 * 1024;
    std::smatch match;
    if (!std::regex_match(mem, match, mem_re)) {
        return kDefault;
    }

    double value = std::stod(match[1].str());
    char unit = match[2].matched
        ? static_cast<char>(std::tolower(static_cast<unsigned char>(match[2].str()[0])))
        : '\0';
    switch (unit) {
        case 'k': return static_cast<int64_t>(std::floor(value * 1024));
        case 'm': return static_cast<int64_t>(std::floor(value * 1024 * 1024));
        case 'g': return static_cast<int64_t>(std::floor(value * 1024 * 1024 * 1024));
        case 't': return static_cast<int64_t>(std::floor(value * 1024 * 1024 * 1024 * 1024));
        default: return static_cast<int64_t>(std::floor(value));
    }
}

const char* to_string(DeploymentMode mode) {
    return mode == DeploymentMode::Dedicated ? "dedicated" : "embedded";
}

const char* to_string(RuntimeKind kind) {
    return kind == RuntimeKind::Process ? "process" : "docker";
}

Config load_config(int argc, char** argv) {
    Config config;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--redis-host" && i + 1 < argc) {
            config.redis.host = argv[++i];
        } else if (arg == "--redis-port" && i + 1 < argc) {
            config.redis.port = parse_int_flag(arg, argv[++i]);
        } else if (arg == "--listen" && i + 1 < argc) {
            config.listen_address = argv[++i];
        } else if (arg == "--image" && i + 1 < argc) {
            config.compiler_image = argv[++i];
        } else if (arg == "--runtime" && i + 1 < argc) {
            std::string kind = argv[++i];
            if (kind == "docker") {
                config.runtime = RuntimeKind::Docker;
            } else if (kind == "process") {
                config.runtime = RuntimeKind::Process;
            } else {
                throw ConfigError("Unknown runtime: " + kind);
            }
        } else if (arg == "--concurrency" && i + 1 < argc) {
            config.max_concurrent = parse_int_flag(arg, argv[++i]);
        } else if (arg == "--storage" && i + 1 < argc) {
            config.storage_path = argv[++i];
        } else if (arg == "--embedded") {
            config.mode = DeploymentMode::Embedded;
        } else if (arg == "--dedicated") {
            config.mode = DeploymentMode::Dedicated;
        }
    }

    // Override from environment variables
    const char* env_redis_url = std::getenv("REDIS_URL");
    if (env_redis_url && *env_redis_url) {
        config.redis = parse_redis_url(env_redis_url);
    }
    env_string("REDIS_HOST", config.redis.host);
    config.redis.port = env_int("REDIS_PORT", config.redis.port);
    env_string("TEXQ_KEY_PREFIX", config.key_prefix);
    env_string("GATEWAY_ADDRESS", config.listen_address);

    env_string("COMPILER_IMAGE", config.compiler_image);
    env_string("DOCKER_BIN", config.docker_bin);
    const char* env_runtime = std::getenv("COMPILE_RUNTIME");
    if (env_runtime && std::string(env_runtime) == "process") {
        config.runtime = RuntimeKind::Process;
    } else if (env_runtime && std::string(env_runtime) == "docker") {
        config.runtime = RuntimeKind::Docker;
    }
    config.compile_timeout_s = env_int("COMPILE_TIMEOUT", config.compile_timeout_s);
    env_string("COMPILE_MEMORY", config.compile_memory);
    const char* env_cpus = std::getenv("COMPILE_CPUS");
    if (env_cpus && *env_cpus) {
        try {
            config.compile_cpus = std::stod(env_cpus);
        } catch (const std::exception&) {
            throw ConfigError(std::string("Invalid COMPILE_CPUS: ") + env_cpus);
        }
    }
    config.pids_limit = env_int("COMPILE_PIDS_LIMIT", config.pids_limit);
    config.max_concurrent = env_int("MAX_CONCURRENT_BUILDS", config.max_concurrent);

    env_string("STORAGE_PATH", config.storage_path);
    env_string("PROJECTS_ROOT", config.projects_root);
    if (config.projects_root.empty()) {
        config.projects_root = config.storage_path + "/projects";
    }
    config.result_ttl_minutes = std::max(
        env_int("ASYNC_COMPILE_RESULT_TTL_MINUTES", config.result_ttl_minutes), 1);
    config.max_source_bytes = static_cast<std::size_t>(
        env_int("MAX_SOURCE_BYTES", static_cast<int>(config.max_source_bytes)));
    config.cancel_ttl_s = env_int("CANCEL_TTL_SECONDS", config.cancel_ttl_s);

    const char* env_in_web = std::getenv("RUN_COMPILE_RUNNER_IN_WEB");
    if (env_in_web) {
        config.mode = std::string(env_in_web) == "false"
            ? DeploymentMode::Dedicated : DeploymentMode::Embedded;
    }
    env_string("WORKER_HEARTBEAT_KEY", config.heartbeat_key);
    config.heartbeat_interval_ms = std::max(
        env_int("WORKER_HEARTBEAT_INTERVAL_MS", config.heartbeat_interval_ms), 1000);
    config.heartbeat_max_age_ms = std::max(
        env_int("WORKER_HEARTBEAT_MAX_AGE_MS", config.heartbeat_max_age_ms), 5000);

    env_string("STATUS_CHANNEL", config.status_channel);
    env_string("PUBLIC_BASE_URL", config.public_base_url);

    config.validate();
    return config;
}

} // namespace texq
