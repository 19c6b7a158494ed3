#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "compile_service_impl.h"
#include "hash_utils.h"
#include "job_persistence.h"
#include "job_runner.h"
#include "log_parser.h"
#include "test_support.h"

using namespace texq;
using namespace texq::worker;
using texq::gateway::CompileServiceImpl;
using texq::testing::FakeRuntime;
using texq::testing::TempDir;

namespace {

const char* kSource = "\\documentclass{article}\n\\begin{document}\nHello\n\\end{document}\n";

// Gateway service over a temp store. Without a reachable Redis every
// broker call fails fast against a closed port.
class CompileServiceTest : public ::testing::Test {
protected:
    CompileServiceTest() : CompileServiceTest(nullptr) {}

    explicit CompileServiceTest(std::unique_ptr<RedisClient> redis)
        : redis_(redis ? std::move(redis)
                       : std::make_unique<RedisClient>(texq::testing::unreachable_redis_config())),
          config_(make_config(root_.str(), prefix_)),
          store_(config_.ephemeral_root(), std::chrono::minutes(config_.result_ttl_minutes)),
          cancels_(*redis_, prefix_, config_.cancel_ttl_s, config_.compile_timeout_s),
          queue_(*redis_, config_.async_queue_name(), cancels_),
          publisher_(*redis_, config_.status_channel),
          stats_(config_.max_concurrent) {
        stats_.mark_started();
    }

    CompileServiceImpl& service() {
        if (!service_) {
            service_ = std::make_unique<CompileServiceImpl>(
                config_, *redis_, store_, queue_, publisher_,
                select_health_strategy(config_, &stats_, *redis_), &runtime_);
        }
        return *service_;
    }

    grpc::Status submit(const std::string& source, api::SubmitResponse* response,
                        const std::string& job_id = "", const std::string& engine = "",
                        const std::string& main_file = "") {
        api::SubmitRequest request;
        request.set_source(source);
        request.set_job_id(job_id);
        request.set_engine(engine);
        request.set_main_file(main_file);
        return service().Submit(nullptr, &request, response);
    }

    api::JobRequest job(const std::string& id) {
        api::JobRequest request;
        request.set_job_id(id);
        return request;
    }

    // Drives a stored job to a terminal state the way the runner would
    void finish(const std::string& id, JobStatus status, const std::string& logs,
                bool with_pdf) {
        StorePersistence persistence(store_);
        JobPatch compiling;
        compiling.engine_used = Engine::Pdflatex;
        persistence.on_status_change(id, JobStatus::Compiling, compiling);

        JobPatch done;
        done.logs = logs;
        done.entries = parse_latex_log(logs);
        done.exit_code = status == JobStatus::Success ? 0 : 1;
        if (with_pdf) {
            texq::testing::write_text(store_.pdf_path(id, "main.tex"), "%PDF-1.5 body");
            done.pdf_file = "main.pdf";
            done.artifact_hash = compute_hash("%PDF-1.5 body");
        }
        persistence.on_status_change(id, status, done);
    }

    static Config make_config(const std::string& root, const std::string& prefix) {
        Config config;
        config.storage_path = root;
        config.key_prefix = prefix;
        config.status_channel = prefix + ":status";
        config.heartbeat_key = prefix + ":worker:heartbeat";
        config.max_source_bytes = 1024;
        return config;
    }

    TempDir root_;
    std::string prefix_ = texq::testing::unique_prefix();
    std::unique_ptr<RedisClient> redis_;
    Config config_;
    JobStore store_;
    CancellationRegistry cancels_;
    JobQueue queue_;
    StatusPublisher publisher_;
    RunnerStats stats_;
    FakeRuntime runtime_;
    std::unique_ptr<CompileServiceImpl> service_;
};

} // namespace

TEST(GrpcStatusTest, ErrorKindsMapToCodes) {
    using texq::gateway::to_grpc_status;
    EXPECT_EQ(to_grpc_status(ValidationError("x")).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(to_grpc_status(InfrastructureUnavailable("x")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(to_grpc_status(BrokerError("x")).error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(to_grpc_status(StateConflict("x")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(texq::gateway::to_proto(JobStatus::Timeout), api::JOB_STATUS_TIMEOUT);
}

TEST_F(CompileServiceTest, SubmitRejectsBadInput) {
    api::SubmitResponse response;
    EXPECT_EQ(submit("", &response).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit(std::string(2048, 'x'), &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit(kSource, &response, "", "troff").error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit(kSource, &response, "", "", "../main.tex").error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit(kSource, &response, "no spaces allowed").error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(store_.list_jobs().empty());
}

TEST_F(CompileServiceTest, SubmitWithoutBrokerLeavesNothingBehind) {
    api::SubmitResponse response;
    grpc::Status status = submit(kSource, &response, "job-1");

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_FALSE(store_.read("job-1").has_value());
    EXPECT_FALSE(std::filesystem::exists(store_.job_dir("job-1")));
}

TEST_F(CompileServiceTest, DedicatedModeRefusesWithoutHeartbeat) {
    config_.mode = DeploymentMode::Dedicated;
    api::SubmitResponse response;
    grpc::Status status = submit(kSource, &response, "job-1");

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(status.error_message(), "Compilation worker unavailable");
    EXPECT_TRUE(store_.list_jobs().empty());
}

TEST_F(CompileServiceTest, MissingCompilerImageRefusesSubmission) {
    runtime_.script.image_present = false;
    api::SubmitResponse response;
    grpc::Status status = submit(kSource, &response, "job-1");

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(status.error_message(), "Compiler image texq-compiler not available");
    EXPECT_TRUE(store_.list_jobs().empty());
}

TEST_F(CompileServiceTest, UnreachableRuntimeRefusesSubmission) {
    runtime_.script.runtime_up = false;
    api::SubmitResponse response;
    grpc::Status status = submit(kSource, &response, "job-1");

    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(status.error_message(), "Compilation runtime unavailable");
    EXPECT_TRUE(store_.list_jobs().empty());
}

TEST_F(CompileServiceTest, GetJobReportsRecord) {
    store_.create("job-1", kSource, Engine::Lualatex);

    api::JobResponse response;
    api::JobRequest request = job("job-1");
    ASSERT_TRUE(service().GetJob(nullptr, &request, &response).ok());
    EXPECT_EQ(response.status(), api::JOB_STATUS_QUEUED);
    EXPECT_EQ(response.requested_engine(), "lualatex");
    EXPECT_EQ(response.main_file(), "main.tex");
    EXPECT_FALSE(response.has_exit_code());
    EXPECT_FALSE(response.has_pdf());
    EXPECT_FALSE(response.expires_at().empty());

    request = job("job-404");
    EXPECT_EQ(service().GetJob(nullptr, &request, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
    request = job("../etc");
    EXPECT_EQ(service().GetJob(nullptr, &request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(CompileServiceTest, OutputOfUnfinishedJob) {
    store_.create("job-1", kSource, Engine::Auto);

    api::OutputResponse response;
    api::JobRequest request = job("job-1");
    grpc::Status status = service().GetOutput(nullptr, &request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(status.error_message(), "Compile job is still queued");
}

TEST_F(CompileServiceTest, OutputOfSuccessfulJob) {
    store_.create("job-1", kSource, Engine::Auto);
    finish("job-1", JobStatus::Success, "Output written on main.pdf (1 page).\n", true);

    api::OutputResponse response;
    api::JobRequest request = job("job-1");
    ASSERT_TRUE(service().GetOutput(nullptr, &request, &response).ok());
    EXPECT_EQ(response.status(), api::JOB_STATUS_SUCCESS);
    EXPECT_EQ(response.pdf(), "%PDF-1.5 body");
    EXPECT_EQ(response.artifact_hash(), compute_hash("%PDF-1.5 body"));
    EXPECT_EQ(response.engine_used(), "pdflatex");
    EXPECT_TRUE(response.error().empty());
    EXPECT_EQ(response.errors_size(), 0);
}

TEST_F(CompileServiceTest, OutputOfFailedJobCarriesErrors) {
    store_.create("job-1", kSource, Engine::Auto);
    finish("job-1", JobStatus::Error,
           "(./main.tex\n! Undefined control sequence.\nl.5 \\foo\n"
           "LaTeX Warning: Label(s) may have changed.\n", false);

    api::OutputResponse response;
    api::JobRequest request = job("job-1");
    ASSERT_TRUE(service().GetOutput(nullptr, &request, &response).ok());
    EXPECT_EQ(response.status(), api::JOB_STATUS_ERROR);
    EXPECT_EQ(response.error(), "Compilation failed");
    EXPECT_TRUE(response.pdf().empty());
    ASSERT_EQ(response.errors_size(), 1);
    EXPECT_EQ(response.errors(0).type(), "error");
    EXPECT_EQ(response.errors(0).line(), 5);
    EXPECT_NE(response.logs().find("Undefined control sequence"), std::string::npos);
}

TEST_F(CompileServiceTest, SuccessWithoutPdfFileIsNotFound) {
    store_.create("job-1", kSource, Engine::Auto);
    finish("job-1", JobStatus::Success, "", true);
    std::filesystem::remove(store_.pdf_path("job-1", "main.tex"));

    api::OutputResponse response;
    api::JobRequest request = job("job-1");
    EXPECT_EQ(service().GetOutput(nullptr, &request, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
}

TEST_F(CompileServiceTest, CancelOfFinishedJobIsANoOp) {
    store_.create("job-1", kSource, Engine::Auto);
    finish("job-1", JobStatus::Success, "", true);

    api::CancelResponse response;
    api::JobRequest request = job("job-1");
    ASSERT_TRUE(service().Cancel(nullptr, &request, &response).ok());
    EXPECT_EQ(response.status(), api::JOB_STATUS_SUCCESS);
    EXPECT_EQ(response.message(), "Compile job already completed");
    EXPECT_EQ(store_.read("job-1")->status, JobStatus::Success);
}

TEST_F(CompileServiceTest, CancelWithoutBrokerIsUnconfirmed) {
    store_.create("job-1", kSource, Engine::Auto);

    api::CancelResponse response;
    api::JobRequest request = job("job-1");
    EXPECT_EQ(service().Cancel(nullptr, &request, &response).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(store_.read("job-1")->status, JobStatus::Queued);
}

TEST_F(CompileServiceTest, HealthReportsRunnerAndDiagnostics) {
    api::HealthRequest request;
    api::HealthResponse response;
    ASSERT_TRUE(service().Health(nullptr, &request, &response).ok());
    EXPECT_TRUE(response.healthy());
    EXPECT_EQ(response.mode(), "embedded");
    EXPECT_EQ(response.max_concurrent(), config_.max_concurrent);
    EXPECT_FALSE(response.redis_connected());

    request.set_diagnostic(true);
    ASSERT_TRUE(service().Health(nullptr, &request, &response).ok());
    EXPECT_FALSE(response.redis_connected());
    EXPECT_TRUE(response.runtime_reachable());
    EXPECT_TRUE(response.image_present());
    EXPECT_TRUE(response.storage_present());
}

namespace {

class CompileServiceRedisTest : public CompileServiceTest {
protected:
    CompileServiceRedisTest() : CompileServiceTest(connect()) {}

    void SetUp() override {
        if (!available_) GTEST_SKIP() << "Redis not reachable";
    }

    void TearDown() override {
        if (!available_) return;
        auto keys = redis_->command({"KEYS", prefix_ + ":*"});
        for (const auto& key : keys.elements) {
            redis_->del(key.str);
        }
    }

    // Worker side of the pipeline over the same store and queue
    void run_next_job() {
        CompilerLimits limits;
        limits.poll_interval = std::chrono::milliseconds(20);
        Compiler compiler(runtime_, limits);
        StorePersistence persistence(store_);
        RunnerOptions options;
        options.public_base_url = config_.public_base_url;
        JobRunner runner(options, texq::testing::test_redis_config(), compiler, cancels_, store_,
                         publisher_, stats_, {});
        RedisClient blocking(texq::testing::test_redis_config());

        auto queued = queue_.dequeue(blocking, 1);
        ASSERT_TRUE(queued.has_value());
        runner.process_job(*queued, {&queue_, &persistence, JobMode::Ephemeral});
    }

private:
    static std::unique_ptr<RedisClient> connect() {
        auto redis = texq::testing::connect_test_redis();
        available_ = redis != nullptr;
        return redis;
    }

    static bool available_;
};

bool CompileServiceRedisTest::available_ = false;

} // namespace

TEST_F(CompileServiceRedisTest, SubmitCompileAndFetchPdf) {
    api::SubmitResponse submitted;
    ASSERT_TRUE(submit(kSource, &submitted).ok());
    const std::string id = submitted.job_id();
    EXPECT_EQ(submitted.status(), api::JOB_STATUS_QUEUED);
    EXPECT_EQ(submitted.poll_url(), "/api/v1/compile/" + id);
    EXPECT_EQ(submitted.output_url(), "/api/v1/compile/" + id + "/output");
    EXPECT_EQ(submitted.cancel_url(), "/api/v1/compile/" + id + "/cancel");

    run_next_job();

    api::JobRequest request = job(id);
    api::JobResponse status;
    ASSERT_TRUE(service().GetJob(nullptr, &request, &status).ok());
    EXPECT_EQ(status.status(), api::JOB_STATUS_SUCCESS);
    EXPECT_EQ(status.engine_used(), "pdflatex");
    EXPECT_TRUE(status.has_pdf());
    EXPECT_EQ(status.exit_code(), 0);

    api::OutputResponse output;
    ASSERT_TRUE(service().GetOutput(nullptr, &request, &output).ok());
    EXPECT_EQ(output.pdf().compare(0, 5, "%PDF-"), 0);
    EXPECT_FALSE(output.artifact_hash().empty());
}

TEST_F(CompileServiceRedisTest, DuplicateJobIdIsRejected) {
    api::SubmitResponse response;
    ASSERT_TRUE(submit(kSource, &response, "job-dup").ok());
    EXPECT_EQ(submit(kSource, &response, "job-dup").error_code(),
              grpc::StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(store_.read("job-dup")->status, JobStatus::Queued);
}

TEST_F(CompileServiceRedisTest, CancelQueuedJobFinishesIt) {
    api::SubmitResponse submitted;
    ASSERT_TRUE(submit(kSource, &submitted, "job-c").ok());

    api::CancelResponse canceled;
    api::JobRequest request = job("job-c");
    ASSERT_TRUE(service().Cancel(nullptr, &request, &canceled).ok());
    EXPECT_EQ(canceled.status(), api::JOB_STATUS_CANCELED);
    EXPECT_TRUE(canceled.was_queued());
    EXPECT_FALSE(canceled.was_running());
    EXPECT_EQ(canceled.message(), "Build canceled before starting.");

    api::OutputResponse output;
    ASSERT_TRUE(service().GetOutput(nullptr, &request, &output).ok());
    EXPECT_EQ(output.status(), api::JOB_STATUS_CANCELED);
    EXPECT_EQ(output.error(), "Build canceled before starting.");
    EXPECT_EQ(queue_.counts().waiting, 0);

    // A second cancel sees the finished record
    ASSERT_TRUE(service().Cancel(nullptr, &request, &canceled).ok());
    EXPECT_EQ(canceled.message(), "Compile job already completed");
}

TEST_F(CompileServiceRedisTest, CancelRunningJobLeavesItToTheWorker) {
    api::SubmitResponse submitted;
    ASSERT_TRUE(submit(kSource, &submitted, "job-r").ok());
    RedisClient blocking(texq::testing::test_redis_config());
    ASSERT_TRUE(queue_.dequeue(blocking, 1).has_value());

    api::CancelResponse canceled;
    api::JobRequest request = job("job-r");
    ASSERT_TRUE(service().Cancel(nullptr, &request, &canceled).ok());
    EXPECT_TRUE(canceled.was_running());
    EXPECT_EQ(canceled.message(), "Cancel requested");
    EXPECT_TRUE(cancels_.is_canceled("job-r"));
    EXPECT_EQ(store_.read("job-r")->status, JobStatus::Queued);
}

TEST_F(CompileServiceRedisTest, HealthDiagnosticsSeeTheQueue) {
    api::SubmitResponse submitted;
    ASSERT_TRUE(submit(kSource, &submitted).ok());

    api::HealthRequest request;
    request.set_diagnostic(true);
    api::HealthResponse response;
    ASSERT_TRUE(service().Health(nullptr, &request, &response).ok());
    EXPECT_TRUE(response.redis_connected());
    EXPECT_EQ(response.queue_waiting(), 1);
}
