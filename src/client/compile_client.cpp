#include "compile_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <algorithm>
#include <cctype>
#include <thread>

namespace texq::client {

CompileClient::CompileClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(api::CompileService::NewStub(channel)) {}

CompileClient::CompileClient(const std::string& address)
    : CompileClient(grpc::CreateChannel(address, grpc::InsecureChannelCredentials())) {}

void CompileClient::prepare(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
}

grpc::Status CompileClient::Submit(const api::SubmitRequest& request,
                                   api::SubmitResponse& response) {
    grpc::ClientContext context;
    prepare(context);
    return stub_->Submit(&context, request, &response);
}

grpc::Status CompileClient::GetJob(const std::string& job_id, api::JobResponse& response) {
    grpc::ClientContext context;
    prepare(context);
    api::JobRequest request;
    request.set_job_id(job_id);
    return stub_->GetJob(&context, request, &response);
}

grpc::Status CompileClient::GetOutput(const std::string& job_id, api::OutputResponse& response) {
    grpc::ClientContext context;
    prepare(context);
    api::JobRequest request;
    request.set_job_id(job_id);
    return stub_->GetOutput(&context, request, &response);
}

grpc::Status CompileClient::Cancel(const std::string& job_id, api::CancelResponse& response) {
    grpc::ClientContext context;
    prepare(context);
    api::JobRequest request;
    request.set_job_id(job_id);
    return stub_->Cancel(&context, request, &response);
}

grpc::Status CompileClient::Health(bool diagnostic, api::HealthResponse& response) {
    grpc::ClientContext context;
    prepare(context);
    api::HealthRequest request;
    request.set_diagnostic(diagnostic);
    return stub_->Health(&context, request, &response);
}

grpc::Status CompileClient::WaitForCompletion(const std::string& job_id,
                                              std::chrono::milliseconds timeout,
                                              api::JobResponse& response,
                                              std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        response.Clear();
        grpc::Status status = GetJob(job_id, response);
        if (!status.ok() || is_terminal(response.status())) {
            return status;
        }
        if (std::chrono::steady_clock::now() + poll_interval > deadline) {
            return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED,
                                "Job " + job_id + " still " + status_name(response.status()));
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

bool is_terminal(api::JobStatus status) {
    return status == api::JOB_STATUS_SUCCESS || status == api::JOB_STATUS_ERROR ||
           status == api::JOB_STATUS_TIMEOUT || status == api::JOB_STATUS_CANCELED;
}

std::string status_name(api::JobStatus status) {
    std::string name = api::JobStatus_Name(status);
    const std::string prefix = "JOB_STATUS_";
    if (name.compare(0, prefix.size(), prefix) == 0) {
        name = name.substr(prefix.size());
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return name;
}

} // namespace texq::client
