#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "job_store.h"
#include "test_support.h"

using namespace texq;
using namespace texq::worker;
using texq::testing::TempDir;

namespace {

const char* kSource = "\\documentclass{article}\n\\begin{document}\nHi\n\\end{document}\n";

class JobStoreTest : public ::testing::Test {
protected:
    JobStoreTest()
        : now_(std::make_shared<TimePoint>(Clock::time_point(std::chrono::hours(24 * 365 * 50)))),
          store_(dir_.str(), std::chrono::minutes(60), [now = now_] { return *now; }) {}

    void advance(std::chrono::minutes by) { *now_ += by; }

    TempDir dir_;
    std::shared_ptr<TimePoint> now_;
    JobStore store_;
};

JobPatch status_patch(JobStatus status) {
    JobPatch patch;
    patch.status = status;
    return patch;
}

} // namespace

TEST_F(JobStoreTest, CreateStagesSourceAndQueuedRecord) {
    JobRecord record = store_.create("job-1", kSource, Engine::Xelatex, "main.tex", "user-1");

    EXPECT_EQ(record.status, JobStatus::Queued);
    EXPECT_EQ(record.expires_at - record.created_at, std::chrono::minutes(60));
    EXPECT_EQ(texq::testing::read_text(std::filesystem::path(store_.job_dir("job-1")) / "main.tex"),
              kSource);

    auto read = store_.read("job-1");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->requested_engine, Engine::Xelatex);
    EXPECT_EQ(read->user_id, "user-1");
    EXPECT_EQ(read->schema_version, kStatusSchemaVersion);
    EXPECT_FALSE(read->engine_used.has_value());
}

TEST_F(JobStoreTest, DuplicateIdConflicts) {
    store_.create("job-1", kSource, Engine::Auto);
    EXPECT_THROW(store_.create("job-1", kSource, Engine::Auto), StateConflict);
}

TEST_F(JobStoreTest, RejectsUnsafeIdsAndPaths) {
    EXPECT_THROW(store_.create("../escape", kSource, Engine::Auto), ValidationError);
    EXPECT_THROW(store_.create("job-2", kSource, Engine::Auto, "../main.tex"), ValidationError);
}

TEST_F(JobStoreTest, PatchEnforcesForwardTransitions) {
    store_.create("job-1", kSource, Engine::Auto);

    JobPatch compiling = status_patch(JobStatus::Compiling);
    compiling.engine_used = Engine::Pdflatex;
    store_.patch("job-1", compiling);

    JobRecord done = store_.patch("job-1", status_patch(JobStatus::Success));
    EXPECT_EQ(done.engine_used, Engine::Pdflatex);
    ASSERT_TRUE(done.completed_at.has_value());

    EXPECT_THROW(store_.patch("job-1", status_patch(JobStatus::Compiling)), StateConflict);
    EXPECT_THROW(store_.patch("job-1", status_patch(JobStatus::Canceled)), StateConflict);
    EXPECT_THROW(store_.patch("missing", status_patch(JobStatus::Compiling)), StateConflict);
    EXPECT_EQ(store_.read("job-1")->status, JobStatus::Success);
}

TEST_F(JobStoreTest, RecordsExpireAfterTtl) {
    store_.create("job-1", kSource, Engine::Auto);

    advance(std::chrono::minutes(59));
    EXPECT_TRUE(store_.read("job-1").has_value());

    advance(std::chrono::minutes(1));
    EXPECT_FALSE(store_.read("job-1").has_value());
    EXPECT_EQ(store_.expired_jobs(), std::vector<std::string>{"job-1"});

    EXPECT_EQ(store_.purge_expired(), 1);
    EXPECT_FALSE(std::filesystem::exists(store_.job_dir("job-1")));
}

TEST_F(JobStoreTest, CompletionRestartsTheTtl) {
    store_.create("job-1", kSource, Engine::Auto);
    store_.patch("job-1", status_patch(JobStatus::Compiling));

    advance(std::chrono::minutes(50));
    store_.patch("job-1", status_patch(JobStatus::Error));

    advance(std::chrono::minutes(30));
    EXPECT_TRUE(store_.read("job-1").has_value());
    EXPECT_EQ(store_.purge_expired(), 0);

    advance(std::chrono::minutes(30));
    EXPECT_FALSE(store_.read("job-1").has_value());
}

TEST_F(JobStoreTest, ArtifactsAreReadThroughTheRecord) {
    store_.create("job-1", kSource, Engine::Auto);
    EXPECT_FALSE(store_.read_logs("job-1").has_value());

    std::vector<ParsedLogEntry> entries = {
        {LogEntryType::Error, "./main.tex", 3, "Undefined control sequence."}};
    JobPatch patch = status_patch(JobStatus::Compiling);
    patch.logs_file = store_.write_logs("job-1", "raw transcript");
    patch.errors_file = store_.write_errors("job-1", entries);
    store_.patch("job-1", patch);

    texq::testing::write_text(store_.pdf_path("job-1", "main.tex"), "%PDF-1.5");
    JobPatch done = status_patch(JobStatus::Success);
    done.pdf_file = pdf_name_for("main.tex");
    store_.patch("job-1", done);

    EXPECT_EQ(store_.read_logs("job-1"), "raw transcript");
    EXPECT_EQ(store_.read_errors("job-1"), entries);
    EXPECT_EQ(store_.read_pdf("job-1"), "%PDF-1.5");

    advance(std::chrono::minutes(61));
    EXPECT_FALSE(store_.read_pdf("job-1").has_value());
    EXPECT_FALSE(store_.read_logs("job-1").has_value());
}

TEST_F(JobStoreTest, LegacyRecordWithUnknownStatusReadsAsAbsent) {
    store_.create("job-1", kSource, Engine::Auto);
    auto metadata = std::filesystem::path(store_.job_dir("job-1")) / "metadata.json";

    std::string text = texq::testing::read_text(metadata);
    nlohmann::json j = nlohmann::json::parse(text);
    j.erase("schemaVersion");
    j["status"] = "canceled";
    texq::testing::write_text(metadata, j.dump());

    EXPECT_FALSE(store_.read("job-1").has_value());
    EXPECT_THROW(store_.patch("job-1", status_patch(JobStatus::Compiling)), StateConflict);
}

TEST_F(JobStoreTest, LegacyRecordIsUpgradedOnWrite) {
    store_.create("job-1", kSource, Engine::Auto);
    auto metadata = std::filesystem::path(store_.job_dir("job-1")) / "metadata.json";

    nlohmann::json j = nlohmann::json::parse(texq::testing::read_text(metadata));
    j.erase("schemaVersion");
    texq::testing::write_text(metadata, j.dump());
    EXPECT_EQ(store_.read("job-1")->schema_version, 1);

    store_.patch("job-1", status_patch(JobStatus::Compiling));
    store_.patch("job-1", status_patch(JobStatus::Timeout));
    EXPECT_EQ(store_.read("job-1")->status, JobStatus::Timeout);
    EXPECT_EQ(store_.read("job-1")->schema_version, kStatusSchemaVersion);
}

TEST_F(JobStoreTest, RemoveAndListJobs) {
    store_.create("job-1", kSource, Engine::Auto);
    store_.create("job-2", kSource, Engine::Auto);
    EXPECT_EQ(store_.list_jobs().size(), 2u);

    store_.remove("job-1");
    store_.remove("job-1");
    EXPECT_EQ(store_.list_jobs(), std::vector<std::string>{"job-2"});
}

TEST_F(JobStoreTest, NoTemporaryFilesAreLeftBehind) {
    store_.create("job-1", kSource, Engine::Auto);
    store_.patch("job-1", status_patch(JobStatus::Compiling));

    for (const auto& entry : std::filesystem::directory_iterator(store_.job_dir("job-1"))) {
        EXPECT_EQ(entry.path().filename().string().find(".tmp-"), std::string::npos);
    }
}
