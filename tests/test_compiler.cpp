#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "compiler.h"
#include "test_support.h"

using namespace texq;
using namespace texq::worker;
using texq::testing::FakeRuntime;
using texq::testing::TempDir;

namespace {

class CompilerTest : public ::testing::Test {
protected:
    CompilerTest() {
        limits_.timeout = std::chrono::seconds(5);
        limits_.poll_interval = std::chrono::milliseconds(20);
        limits_.max_concurrent = 2;
        texq::testing::write_text(dir_.path() / "main.tex",
                                  "\\documentclass{article}\n\\begin{document}\nHi\n\\end{document}\n");
        request_.job_id = "job-1";
        request_.work_dir = dir_.str();
    }

    RunOutcome run(const CancelCheck& cancel = nullptr) {
        Compiler compiler(runtime_, limits_);
        return compiler.run(request_, Engine::Pdflatex, cancel);
    }

    TempDir dir_;
    FakeRuntime runtime_;
    CompilerLimits limits_;
    CompileRequest request_;
};

} // namespace

TEST(EngineDetectionTest, MagicCommentWins) {
    EXPECT_EQ(Compiler::detect_engine("% !TEX program = xelatex\n\\usepackage{luacode}\n"),
              Engine::Xelatex);
    EXPECT_EQ(Compiler::detect_engine("%!TeX TS-program = LuaLaTeX\n"), Engine::Lualatex);
}

TEST(EngineDetectionTest, PackageHints) {
    EXPECT_EQ(Compiler::detect_engine("\\usepackage{fontspec}\n"), Engine::Xelatex);
    EXPECT_EQ(Compiler::detect_engine("\\usepackage[math-style=ISO]{unicode-math}\n"),
              Engine::Xelatex);
    EXPECT_EQ(Compiler::detect_engine("\\usepackage{amsmath,luacode}\n"), Engine::Lualatex);
    EXPECT_EQ(Compiler::detect_engine("\\directlua{tex.print(1)}\n"), Engine::Lualatex);
    EXPECT_EQ(Compiler::detect_engine("\\usepackage{amsmath}\n"), Engine::Pdflatex);
    EXPECT_EQ(Compiler::detect_engine(""), Engine::Pdflatex);
}

TEST(EngineDetectionTest, MagicCommentOnlyInPreambleHead) {
    std::string source;
    for (int i = 0; i < 25; i++) source += "% filler\n";
    source += "% !TEX program = xelatex\n";
    EXPECT_EQ(Compiler::detect_engine(source), Engine::Pdflatex);
}

TEST(EngineDetectionTest, ExplicitRequestIsKept) {
    CompileRequest request;
    request.engine = Engine::Lualatex;
    request.work_dir = "/nonexistent";
    EXPECT_EQ(Compiler::resolve_engine(request), Engine::Lualatex);

    request.engine = Engine::Auto;
    EXPECT_EQ(Compiler::resolve_engine(request), Engine::Pdflatex);
}

TEST(BuildCommandTest, LatexmkInvocation) {
    auto command = Compiler::build_command(Engine::Xelatex, "thesis/main.tex");
    std::vector<std::string> expected = {
        "latexmk", "-xelatex", "-cd", "-gg", "-interaction=nonstopmode",
        "-halt-on-error", "-file-line-error", "thesis/main.tex"};
    EXPECT_EQ(command, expected);

    EXPECT_EQ(Compiler::build_command(Engine::Auto, "main.tex")[1], "-pdf");
}

TEST_F(CompilerTest, SuccessfulRunFindsPdf) {
    RunOutcome outcome = run();

    EXPECT_TRUE(outcome.exited_normally);
    EXPECT_EQ(outcome.exit_code, 0);
    ASSERT_TRUE(outcome.pdf_path.has_value());
    EXPECT_EQ(*outcome.pdf_path, (dir_.path() / "main.pdf").string());
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(outcome.canceled);
    EXPECT_EQ(outcome.logs, runtime_.script.logs);
    EXPECT_EQ(runtime_.removed.load(), 1);
}

TEST_F(CompilerTest, ContainerGetsLimitsAndCommand) {
    limits_.memory_bytes = 512LL * 1024 * 1024;
    limits_.cpus = 0.5;
    limits_.pids_limit = 64;
    limits_.image = "texlive:test";
    run();

    const ContainerSpec& spec = runtime_.last_spec;
    EXPECT_EQ(spec.image, "texlive:test");
    EXPECT_EQ(spec.memory_bytes, 512LL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(spec.cpus, 0.5);
    EXPECT_EQ(spec.pids_limit, 64);
    EXPECT_EQ(spec.timeout_s, 5);
    EXPECT_EQ(spec.work_dir, dir_.str());
    EXPECT_EQ(spec.command, Compiler::build_command(Engine::Pdflatex, "main.tex"));
    EXPECT_EQ(spec.labels.at("texq.job"), "job-1");
}

TEST_F(CompilerTest, CleanExitWithoutPdf) {
    runtime_.script.write_pdf = false;
    RunOutcome outcome = run();

    EXPECT_TRUE(outcome.exited_normally);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.pdf_path.has_value());
}

TEST_F(CompilerTest, NonzeroExitIsReported) {
    runtime_.script.exit_code = 12;
    RunOutcome outcome = run();
    EXPECT_EQ(outcome.exit_code, 12);
    EXPECT_TRUE(outcome.exited_normally);
}

TEST_F(CompilerTest, TimeoutKillsTheContainer) {
    runtime_.script.never_exits = true;
    limits_.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    RunOutcome outcome = run();
    auto took = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_FALSE(outcome.exited_normally);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_FALSE(outcome.pdf_path.has_value());
    EXPECT_EQ(runtime_.killed.load(), 1);
    EXPECT_EQ(runtime_.removed.load(), 1);
    EXPECT_LT(took, std::chrono::seconds(3));
}

TEST_F(CompilerTest, CancelDuringRunKillsTheContainer) {
    runtime_.script.never_exits = true;
    std::atomic<int> polls{0};
    RunOutcome outcome = run([&] { return ++polls > 3; });

    EXPECT_TRUE(outcome.canceled);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(outcome.pdf_path.has_value());
    EXPECT_EQ(runtime_.killed.load(), 1);
    EXPECT_EQ(runtime_.removed.load(), 1);
}

TEST_F(CompilerTest, CancelBeforeStartNeverCreatesContainer) {
    RunOutcome outcome = run([] { return true; });

    EXPECT_TRUE(outcome.canceled);
    EXPECT_EQ(runtime_.created.load(), 0);
    EXPECT_EQ(runtime_.removed.load(), 0);
}

TEST_F(CompilerTest, RuntimeFailureBecomesOutcome) {
    runtime_.script.fail_create = true;
    RunOutcome outcome;
    EXPECT_NO_THROW(outcome = run());

    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_FALSE(outcome.exited_normally);
    EXPECT_NE(outcome.logs.find("Container error"), std::string::npos);
    ASSERT_TRUE(outcome.infrastructure_error.has_value());
    EXPECT_EQ(*outcome.infrastructure_error, "image texq-compiler not found");
}

TEST_F(CompilerTest, TimeoutKeptWhenLogsCannotBeRead) {
    runtime_.script.never_exits = true;
    runtime_.script.fail_logs = true;
    limits_.timeout = std::chrono::milliseconds(200);
    RunOutcome outcome = run();

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_FALSE(outcome.canceled);
    EXPECT_FALSE(outcome.infrastructure_error.has_value());
    EXPECT_NE(outcome.logs.find("docker logs failed"), std::string::npos);
    EXPECT_EQ(runtime_.removed.load(), 1);
}

TEST_F(CompilerTest, CancelKeptWhenLogsCannotBeRead) {
    runtime_.script.never_exits = true;
    runtime_.script.fail_logs = true;
    std::atomic<int> polls{0};
    RunOutcome outcome = run([&] { return ++polls > 3; });

    EXPECT_TRUE(outcome.canceled);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(runtime_.killed.load(), 1);
}

TEST_F(CompilerTest, LogFailureAfterCleanExitIsInfrastructure) {
    runtime_.script.fail_logs = true;
    RunOutcome outcome = run();

    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(outcome.pdf_path.has_value());
    ASSERT_TRUE(outcome.infrastructure_error.has_value());
    EXPECT_EQ(outcome.exit_code, -1);
}

TEST(FormatTimeoutTest, WholeSecondsAndMilliseconds) {
    EXPECT_EQ(format_timeout(std::chrono::seconds(120)), "120 seconds");
    EXPECT_EQ(format_timeout(std::chrono::milliseconds(1000)), "1 seconds");
    EXPECT_EQ(format_timeout(std::chrono::milliseconds(250)), "250 ms");
}

TEST_F(CompilerTest, ConcurrencyIsCapped) {
    runtime_.script.run_time = std::chrono::milliseconds(150);
    Compiler compiler(runtime_, limits_);

    std::vector<std::thread> threads;
    for (int i = 0; i < 5; i++) {
        threads.emplace_back([&compiler, this] {
            compiler.run(request_, Engine::Pdflatex, nullptr);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(runtime_.created.load(), 5);
    EXPECT_LE(runtime_.max_running.load(), 2);
    EXPECT_EQ(compiler.active_runs(), 0);
}
