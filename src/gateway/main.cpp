#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "compile_service_impl.h"
#include "compiler.h"
#include "config.h"
#include "errors.h"
#include "job_persistence.h"
#include "job_runner.h"

using namespace texq;

void RunServer(const Config& config) {
    RedisClient redis(config.redis);
    worker::CancellationRegistry cancels(redis, config.key_prefix, config.cancel_ttl_s,
                                         config.compile_timeout_s);
    worker::JobQueue queue(redis, config.async_queue_name(), cancels,
                           config.result_ttl_minutes * 60);
    worker::JobStore store(config.ephemeral_root(), std::chrono::minutes(config.result_ttl_minutes));
    worker::StatusPublisher publisher(redis, config.status_channel);
    auto runtime = worker::make_runtime(config.runtime, config.docker_bin);

    // Embedded deployments run the compile runner inside this process
    worker::RunnerStats stats(config.max_concurrent);
    std::unique_ptr<worker::Compiler> compiler;
    std::unique_ptr<worker::StorePersistence> persistence;
    std::unique_ptr<worker::JobRunner> runner;
    if (config.mode == DeploymentMode::Embedded) {
        compiler = std::make_unique<worker::Compiler>(
            *runtime, worker::CompilerLimits::from_config(config));
        persistence = std::make_unique<worker::StorePersistence>(store);
        runner = std::make_unique<worker::JobRunner>(
            worker::RunnerOptions::from_config(config), config.redis, *compiler, cancels, store,
            publisher, stats,
            std::vector<worker::QueueBinding>{{&queue, persistence.get(), JobMode::Ephemeral}});
        runner->start();
    }

    auto health = worker::select_health_strategy(
        config, runner ? &stats : nullptr, redis);
    gateway::CompileServiceImpl service(config, redis, store, queue, publisher, health,
                                        runtime.get());

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    builder.SetMaxReceiveMessageSize(static_cast<int>(config.max_source_bytes) + 64 * 1024);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        throw InfrastructureUnavailable("Cannot listen on " + config.listen_address);
    }
    std::cout << "[Gateway] Listening on " << config.listen_address
              << " (mode=" << to_string(config.mode) << ")" << std::endl;

    // SIGINT/SIGTERM are blocked in every thread and collected here
    std::thread shutdown_thread([&server] {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        int signal_number = 0;
        sigwait(&signals, &signal_number);
        std::cout << "[Gateway] Received signal " << signal_number << ", shutting down"
                  << std::endl;
        server->Shutdown();
    });

    server->Wait();
    shutdown_thread.join();
    if (runner) {
        runner->stop();
    }
}

int main(int argc, char** argv) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    Config config;
    try {
        config = load_config(argc, argv);
    } catch (const Error& e) {
        std::cerr << "[Gateway] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        RunServer(config);
    } catch (const Error& e) {
        std::cerr << "[Gateway] Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
