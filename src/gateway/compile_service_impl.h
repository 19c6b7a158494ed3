#pragma once

#include <grpcpp/grpcpp.h>
#include <string>

#include "cancellation_registry.h"
#include "compile.grpc.pb.h"
#include "config.h"
#include "container_runtime.h"
#include "errors.h"
#include "job_queue.h"
#include "job_store.h"
#include "redis_client.h"
#include "status_publisher.h"
#include "worker_health.h"

namespace texq::gateway {

api::JobStatus to_proto(JobStatus status);

// Error kinds as gRPC status codes
grpc::Status to_grpc_status(const Error& error);

// CompileService implementation: the one-shot compile API
class CompileServiceImpl final : public api::CompileService::Service {
public:
    CompileServiceImpl(const Config& config, RedisClient& redis, worker::JobStore& store,
                       worker::JobQueue& queue, worker::StatusPublisher& publisher,
                       worker::HealthStrategy health, worker::ContainerRuntime* runtime);

    grpc::Status Submit(grpc::ServerContext* context, const api::SubmitRequest* request,
                        api::SubmitResponse* response) override;

    grpc::Status GetJob(grpc::ServerContext* context, const api::JobRequest* request,
                        api::JobResponse* response) override;

    grpc::Status GetOutput(grpc::ServerContext* context, const api::JobRequest* request,
                           api::OutputResponse* response) override;

    grpc::Status Cancel(grpc::ServerContext* context, const api::JobRequest* request,
                        api::CancelResponse* response) override;

    grpc::Status Health(grpc::ServerContext* context, const api::HealthRequest* request,
                        api::HealthResponse* response) override;

private:
    std::optional<JobRecord> find_job(const std::string& job_id);
    void publish_status(const std::string& job_id, JobStatus status, const std::string& logs = "");

    const Config& config_;
    RedisClient& redis_;
    worker::JobStore& store_;
    worker::JobQueue& queue_;
    worker::StatusPublisher& publisher_;
    worker::HealthStrategy health_;
    worker::ContainerRuntime* runtime_;
};

} // namespace texq::gateway
