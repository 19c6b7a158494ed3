#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include "cancellation_registry.h"
#include "compiler.h"
#include "config.h"
#include "errors.h"
#include "hash_utils.h"
#include "job_persistence.h"
#include "job_queue.h"
#include "job_runner.h"
#include "job_store.h"
#include "runner_stats.h"
#include "status_publisher.h"
#include "worker_health.h"

using namespace texq;

namespace {

constexpr int kHealthLogIntervalSeconds = 60;

void print_banner(const Config& config, const std::string& instance_id) {
    std::cout << "========================================" << std::endl;
    std::cout << "  texq compile worker" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Instance:        " << instance_id << std::endl;
    std::cout << "Redis:           " << config.redis.host << ":" << config.redis.port << std::endl;
    std::cout << "Queues:          " << config.async_queue_name() << ", "
              << config.project_queue_name() << std::endl;
    std::cout << "Runtime:         " << to_string(config.runtime) << std::endl;
    std::cout << "Compiler image:  " << config.compiler_image << std::endl;
    std::cout << "Max concurrent:  " << config.max_concurrent << std::endl;
    std::cout << "Compile timeout: " << config.compile_timeout_s << "s" << std::endl;
    std::cout << "Memory limit:    " << config.compile_memory << std::endl;
    std::cout << "CPU limit:       " << config.compile_cpus << std::endl;
    std::cout << "Storage:         " << config.storage_path << std::endl;
    std::cout << "========================================" << std::endl;
}

void log_health(const worker::RunnerStats& stats, RedisClient& redis) {
    auto snapshot = stats.snapshot();
    std::cout << "[Worker] Health: active=" << snapshot.active_jobs << "/"
              << snapshot.max_concurrent << " processed=" << snapshot.total_processed
              << " errors=" << snapshot.total_errors
              << " redis=" << (redis.ping() ? "up" : "down") << std::endl;
}

} // namespace

int run_worker(const Config& config) {
    std::string instance_id = generate_uuid();
    print_banner(config, instance_id);

    RedisClient redis(config.redis);
    worker::CancellationRegistry cancels(redis, config.key_prefix, config.cancel_ttl_s,
                                         config.compile_timeout_s);
    int retention_s = config.result_ttl_minutes * 60;
    worker::JobQueue async_queue(redis, config.async_queue_name(), cancels, retention_s);
    worker::JobQueue project_queue(redis, config.project_queue_name(), cancels, retention_s);
    worker::JobStore store(config.ephemeral_root(), std::chrono::minutes(config.result_ttl_minutes));
    worker::StatusPublisher publisher(redis, config.status_channel);

    auto runtime = worker::make_runtime(config.runtime, config.docker_bin);
    if (!runtime->ping()) {
        std::cerr << "[Worker] Container runtime '" << runtime->name()
                  << "' is not reachable; jobs will fail until it is" << std::endl;
    } else if (!runtime->image_exists(config.compiler_image)) {
        std::cerr << "[Worker] Compiler image " << config.compiler_image << " not found"
                  << std::endl;
    }
    worker::Compiler compiler(*runtime, worker::CompilerLimits::from_config(config));

    worker::StorePersistence store_persistence(store);
    worker::BuildRecordPersistence build_persistence(redis, config.key_prefix);
    worker::RunnerStats stats(config.max_concurrent);

    worker::JobRunner runner(
        worker::RunnerOptions::from_config(config), config.redis, compiler, cancels, store,
        publisher, stats,
        {{&async_queue, &store_persistence, JobMode::Ephemeral},
         {&project_queue, &build_persistence, JobMode::Project}});

    worker::HeartbeatPublisher heartbeat(redis, config.heartbeat_key,
                                         config.heartbeat_interval_ms, instance_id);

    runner.start();
    heartbeat.start();
    std::cout << "[Worker] Ready" << std::endl;

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    struct timespec interval = {kHealthLogIntervalSeconds, 0};

    while (true) {
        int signal_number = sigtimedwait(&signals, nullptr, &interval);
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            std::cout << "[Worker] Received signal " << signal_number
                      << ", shutting down gracefully" << std::endl;
            break;
        }
        log_health(stats, redis);
    }

    heartbeat.stop();
    runner.stop();
    std::cout << "[Worker] Shutdown complete" << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    // Handled synchronously by sigtimedwait; worker threads inherit the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    Config config;
    try {
        config = load_config(argc, argv);
    } catch (const Error& e) {
        std::cerr << "[Worker] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        return run_worker(config);
    } catch (const Error& e) {
        std::cerr << "[Worker] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
