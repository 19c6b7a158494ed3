#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <iterator>

#include "container_runtime.h"
#include "errors.h"
#include "test_support.h"

using namespace texq;
using namespace texq::worker;
using texq::testing::TempDir;

namespace {

ContainerSpec shell_spec(const std::string& script, const std::string& work_dir) {
    ContainerSpec spec;
    spec.command = {"sh", "-c", script};
    spec.work_dir = work_dir;
    // No rlimits: the test user's process count is unknown
    spec.memory_bytes = 0;
    spec.pids_limit = 0;
    spec.timeout_s = 0;
    return spec;
}

bool contains(const std::vector<std::string>& args, const std::string& flag,
              const std::string& value) {
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && std::next(it) != args.end() && *std::next(it) == value;
}

} // namespace

TEST(ProcessRuntimeTest, ExitCodeAndCombinedOutput) {
    TempDir dir;
    ProcessRuntime runtime;
    std::string id = runtime.create(shell_spec("echo hello; echo oops >&2; exit 3", dir.str()));
    runtime.start(id);

    auto code = runtime.wait(id, std::chrono::seconds(10));
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 3);

    std::string logs = runtime.logs(id);
    EXPECT_NE(logs.find("hello"), std::string::npos);
    EXPECT_NE(logs.find("oops"), std::string::npos);
    runtime.remove(id);
}

TEST(ProcessRuntimeTest, RunsInsideWorkDirectory) {
    TempDir dir;
    texq::testing::write_text(dir.path() / "marker.txt", "inside-work-dir");
    ProcessRuntime runtime;
    std::string id = runtime.create(shell_spec("cat marker.txt", dir.str()));
    runtime.start(id);

    ASSERT_EQ(runtime.wait(id, std::chrono::seconds(10)), 0);
    EXPECT_NE(runtime.logs(id).find("inside-work-dir"), std::string::npos);
    runtime.remove(id);
}

TEST(ProcessRuntimeTest, KillStopsLongRunningProcess) {
    TempDir dir;
    ProcessRuntime runtime;
    std::string id = runtime.create(shell_spec("sleep 30", dir.str()));
    runtime.start(id);

    EXPECT_FALSE(runtime.wait(id, std::chrono::milliseconds(100)).has_value());

    auto start = std::chrono::steady_clock::now();
    runtime.kill(id);
    EXPECT_TRUE(runtime.wait(id, std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    runtime.remove(id);
}

TEST(ProcessRuntimeTest, MissingBinaryExitsWith127) {
    TempDir dir;
    ProcessRuntime runtime;
    ContainerSpec spec = shell_spec("", dir.str());
    spec.command = {"texq-no-such-binary"};
    std::string id = runtime.create(spec);
    runtime.start(id);

    EXPECT_EQ(runtime.wait(id, std::chrono::seconds(10)), 127);
    runtime.remove(id);
}

TEST(ProcessRuntimeTest, UnknownIds) {
    ProcessRuntime runtime;
    EXPECT_NO_THROW(runtime.remove("proc-404"));
    EXPECT_THROW(runtime.wait("proc-404", std::chrono::milliseconds(10)), InfrastructureUnavailable);

    ContainerSpec empty;
    EXPECT_THROW(runtime.create(empty), InfrastructureUnavailable);
}

TEST(DockerRuntimeTest, CreateArgsSandboxTheCompile) {
    ContainerSpec spec;
    spec.image = "texq-compiler";
    spec.command = {"latexmk", "-pdf", "main.tex"};
    spec.work_dir = "/data/builds/job-1";
    spec.memory_bytes = 1024LL * 1024 * 1024;
    spec.cpus = 1.5;
    spec.pids_limit = 128;
    spec.labels["texq.job"] = "job-1";

    DockerRuntime runtime("docker");
    auto args = runtime.create_args(spec);

    EXPECT_EQ(args.front(), "create");
    EXPECT_TRUE(contains(args, "--network", "none"));
    EXPECT_TRUE(contains(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(contains(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(contains(args, "--pids-limit", "128"));
    EXPECT_TRUE(contains(args, "--memory", "1073741824"));
    EXPECT_TRUE(contains(args, "--memory-swap", "1073741824"));
    EXPECT_TRUE(contains(args, "--cpus", "1.5"));
    EXPECT_TRUE(contains(args, "--volume", "/data/builds/job-1:/work"));
    EXPECT_TRUE(contains(args, "--workdir", "/work"));
    EXPECT_TRUE(contains(args, "--label", "texq.job=job-1"));

    // Image, then the command, close the argument list
    std::vector<std::string> tail(args.end() - 4, args.end());
    EXPECT_EQ(tail, (std::vector<std::string>{"texq-compiler", "latexmk", "-pdf", "main.tex"}));
}

TEST(DockerRuntimeTest, UnlimitedResourcesAreOmitted) {
    ContainerSpec spec;
    spec.image = "img";
    spec.command = {"true"};
    spec.work_dir = "/w";

    auto args = DockerRuntime().create_args(spec);
    EXPECT_EQ(std::find(args.begin(), args.end(), "--memory"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--cpus"), args.end());
}

TEST(RuntimeFactoryTest, SelectsByKind) {
    EXPECT_STREQ(make_runtime(RuntimeKind::Docker, "docker")->name(), "docker");
    EXPECT_STREQ(make_runtime(RuntimeKind::Process, "docker")->name(), "process");
}
