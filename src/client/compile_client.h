#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "compile.grpc.pb.h"

namespace texq::client {

// gRPC client wrapper for the compile gateway
class CompileClient {
public:
    explicit CompileClient(std::shared_ptr<grpc::Channel> channel);
    explicit CompileClient(const std::string& address);

    grpc::Status Submit(const api::SubmitRequest& request, api::SubmitResponse& response);
    grpc::Status GetJob(const std::string& job_id, api::JobResponse& response);
    grpc::Status GetOutput(const std::string& job_id, api::OutputResponse& response);
    grpc::Status Cancel(const std::string& job_id, api::CancelResponse& response);
    grpc::Status Health(bool diagnostic, api::HealthResponse& response);

    // Polls GetJob until the job is terminal or the deadline passes
    grpc::Status WaitForCompletion(const std::string& job_id, std::chrono::milliseconds timeout,
                                   api::JobResponse& response,
                                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

    void set_rpc_timeout(std::chrono::milliseconds timeout) { rpc_timeout_ = timeout; }

private:
    void prepare(grpc::ClientContext& context) const;

    std::unique_ptr<api::CompileService::Stub> stub_;
    std::chrono::milliseconds rpc_timeout_{std::chrono::seconds(30)};
};

bool is_terminal(api::JobStatus status);

// "success", "timeout", ... as the rest of the system spells them
std::string status_name(api::JobStatus status);

} // namespace texq::client
