#include "privgate/exec/agent_executor.hpp"
#include "privgate/common/error_codes.hpp"
#include "fake_process_runner.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <optional>
#include <stdlib.h>
#include <sys/stat.h>

using namespace privgate::exec;
using privgate::common::AgentProcessError;
using privgate::common::ContentSource;
using privgate::common::ErrorCode;
using privgate::common::HostOs;
using privgate::common::SafetyStrategy;
using privgate::common::SandboxMode;
using privgate::common::ValidationError;
using privgate::common::FinalReadError;
using privgate::process::CancellationToken;
using privgate::process::CommandCancelledError;
using privgate::process::CommandRunner;
using privgate::process::CommandSpec;
using privgate::process::RunnerLimits;
using privgate::testing::FakeProcessRunner;
using privgate::testing::TempDir;
using privgate::testing::exitWith;
using privgate::testing::readText;
using privgate::testing::writeText;

namespace {

// Records its arguments, copies the schema it was given, and writes its
// stdin back as the final message.
const char* kFakeAgent = R"(#!/bin/sh
printf '%s\n' "$@" > "$FAKE_AGENT_RECORD"
printf '%s' "$CODEX_INTERNAL_ORIGINATOR_OVERRIDE" > "$FAKE_AGENT_RECORD.originator"
printf '%s' "$CODEX_HOME" > "$FAKE_AGENT_RECORD.home"
out=""
schema=""
while [ $# -gt 0 ]; do
    case "$1" in
        --output-last-message) out="$2"; shift 2 ;;
        --output-schema) schema="$2"; shift 2 ;;
        *) shift ;;
    esac
done
if [ -n "$schema" ]; then
    cp "$schema" "$FAKE_AGENT_RECORD.schema"
fi
if [ -n "$FAKE_AGENT_SLEEP" ]; then
    exec sleep "$FAKE_AGENT_SLEEP"
fi
if [ -z "$FAKE_AGENT_SKIP_OUTPUT" ]; then
    cat > "$out"
fi
exit "${FAKE_AGENT_EXIT:-0}"
)";

// Stands in for the elevation command: drops everything up to "--" and runs
// the rest as the current user.
const char* kFakeElevation = R"(#!/bin/sh
while [ $# -gt 0 ] && [ "$1" != "--" ]; do
    shift
done
shift
exec "$@"
)";

std::vector<std::string> readLines(const std::string& path) {
    std::istringstream stream(readText(path));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

size_t entryCount(const std::string& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

class AgentExecutorTest : public ::testing::Test {
protected:
    TempDir work;
    TempDir scratch;
    std::string agent;
    std::string elevation;
    std::string record;

    void SetUp() override {
        agent = work.file("fake-agent");
        writeText(agent, kFakeAgent);
        chmod(agent.c_str(), 0755);

        elevation = work.file("fake-sudo");
        writeText(elevation, kFakeElevation);
        chmod(elevation.c_str(), 0755);

        record = work.file("record");
        setenv("FAKE_AGENT_RECORD", record.c_str(), 1);
        unsetenv("FAKE_AGENT_EXIT");
        unsetenv("FAKE_AGENT_SLEEP");
        unsetenv("FAKE_AGENT_SKIP_OUTPUT");
        unsetenv("CODEX_INTERNAL_ORIGINATOR_OVERRIDE");
    }

    void TearDown() override {
        unsetenv("FAKE_AGENT_RECORD");
        unsetenv("FAKE_AGENT_EXIT");
        unsetenv("FAKE_AGENT_SLEEP");
        unsetenv("FAKE_AGENT_SKIP_OUTPUT");
        if (saved_tmpdir_) {
            setenv("TMPDIR", saved_tmpdir_->c_str(), 1);
        } else {
            unsetenv("TMPDIR");
        }
    }

    // Impersonated temporaries are created by "mktemp -t", which honours TMPDIR.
    AgentSettings impersonatedSettings() {
        const char* current = std::getenv("TMPDIR");
        if (current) {
            saved_tmpdir_ = std::string(current);
        }
        setenv("TMPDIR", scratch.path().c_str(), 1);

        AgentSettings s = settings();
        s.elevation_command = elevation;
        return s;
    }

    AgentExecRequest impersonatedRequest() const {
        AgentExecRequest r = request();
        r.safety_strategy = SafetyStrategy::UNPRIVILEGED_USER;
        r.run_as_user = "codex";
        return r;
    }

    AgentSettings settings() const {
        AgentSettings s;
        s.executable = agent;
        s.host_os = HostOs::LINUX;
        s.temp_dir = scratch.path();
        return s;
    }

    AgentExecRequest request() const {
        AgentExecRequest r;
        r.prompt = ContentSource::inlineText("Summarize the diff.");
        r.working_dir = work.path();
        return r;
    }

private:
    std::optional<std::string> saved_tmpdir_;
};

}

TEST_F(AgentExecutorTest, RunsAgentAndReturnsFinalMessage) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto result = executor.run(request());

    EXPECT_EQ(result.final_message, "Summarize the diff.");
    EXPECT_EQ(entryCount(scratch.path()), 0u);
    EXPECT_EQ(readText(record + ".originator"), "privgate");
}

TEST_F(AgentExecutorTest, CommandLineOrder) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.model = "gpt-test";
    req.extra_args = {"--config", "reasoning=high"};
    req.output_file = work.file("final.md");
    req.sandbox = SandboxMode::DANGER_FULL_ACCESS;
    executor.run(req);

    std::vector<std::string> expected = {
        "exec", "--skip-git-repo-check",
        "--cd", work.path(),
        "--output-last-message", work.file("final.md"),
        "--model", "gpt-test",
        "--config", "reasoning=high",
        "--sandbox", "danger-full-access"
    };
    EXPECT_EQ(readLines(record), expected);
}

TEST_F(AgentExecutorTest, ExplicitOutputFileSurvives) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.output_file = work.file("final.md");
    executor.run(req);

    EXPECT_EQ(readText(work.file("final.md")), "Summarize the diff.");
}

TEST_F(AgentExecutorTest, InlineSchemaWrittenVerbatimAndDeleted) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    std::string schema = "{\"type\":\"object\",\"properties\":{\"ok\":{\"type\":\"boolean\"}}}\n";
    auto req = request();
    req.output_schema = ContentSource::inlineText(schema);
    executor.run(req);

    EXPECT_EQ(readText(record + ".schema"), schema);

    auto args = readLines(record);
    auto flag = std::find(args.begin(), args.end(), "--output-schema");
    ASSERT_NE(flag, args.end());
    std::string schema_path = *(flag + 1);
    EXPECT_EQ(std::filesystem::path(schema_path).filename().string(), "schema.json");
    EXPECT_FALSE(std::filesystem::exists(schema_path));
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, SchemaFileIsPassedThroughAndKept) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    writeText(work.file("schema.json"), "{}");
    auto req = request();
    req.output_schema = ContentSource::fromFile(work.file("schema.json"));
    executor.run(req);

    EXPECT_TRUE(std::filesystem::exists(work.file("schema.json")));
    EXPECT_EQ(readText(record + ".schema"), "{}");
}

TEST_F(AgentExecutorTest, PromptFileIsRead) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    writeText(work.file("prompt.md"), "From a file.\n");
    auto req = request();
    req.prompt = ContentSource::fromFile(work.file("prompt.md"));

    EXPECT_EQ(executor.run(req).final_message, "From a file.\n");
}

TEST_F(AgentExecutorTest, UnreadablePromptFileFailsBeforeSpawning) {
    FakeProcessRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.prompt = ContentSource::fromFile(work.file("missing.md"));

    try {
        executor.run(req);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PROMPT_UNREADABLE);
    }
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(AgentExecutorTest, ReadOnlyStrategyForcesReadOnlySandbox) {
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.safety_strategy = SafetyStrategy::READ_ONLY;
    req.sandbox = SandboxMode::DANGER_FULL_ACCESS;
    auto result = executor.run(req);

    EXPECT_EQ(result.sandbox, SandboxMode::READ_ONLY);
    auto args = readLines(record);
    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[args.size() - 2], "--sandbox");
    EXPECT_EQ(args.back(), "read-only");
}

TEST_F(AgentExecutorTest, MissingImpersonationUserFailsWithZeroSpawns) {
    FakeProcessRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.safety_strategy = SafetyStrategy::UNPRIVILEGED_USER;

    try {
        executor.run(req);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MISSING_RUN_AS_USER);
    }
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, UnsupportedStrategyForOsFailsWithZeroSpawns) {
    FakeProcessRunner runner;
    auto s = settings();
    s.host_os = HostOs::WINDOWS;
    AgentExecutor executor(runner, s);

    auto req = request();
    req.safety_strategy = SafetyStrategy::DROP_SUDO;

    EXPECT_THROW(executor.run(req), ValidationError);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(AgentExecutorTest, AgentFailureCarriesExitCodeAndCleansUp) {
    setenv("FAKE_AGENT_EXIT", "3", 1);
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.output_schema = ContentSource::inlineText("{}");

    try {
        executor.run(req);
        FAIL() << "expected AgentProcessError";
    } catch (const AgentProcessError& e) {
        EXPECT_EQ(e.exitCode(), 3);
    }
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, ConfigHomeAndExistingOriginatorPassedThrough) {
    setenv("CODEX_INTERNAL_ORIGINATOR_OVERRIDE", "outer-tool", 1);
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.config_home = work.file("codex-home");
    executor.run(req);

    EXPECT_EQ(readText(record + ".originator"), "outer-tool");
    EXPECT_EQ(readText(record + ".home"), work.file("codex-home"));
    unsetenv("CODEX_INTERNAL_ORIGINATOR_OVERRIDE");
}

TEST_F(AgentExecutorTest, ImpersonatedRunRoutesEveryOperationThroughTheUser) {
    FakeProcessRunner runner([](const CommandSpec& spec) {
        const std::string& op = spec.argv.size() > 5 ? spec.argv[5] : spec.argv[0];
        if (op == "mktemp") {
            bool schema = spec.argv.back().find("schema") != std::string::npos;
            return exitWith(0, schema ? "/tmp/privgate-schema-S\n" : "/tmp/privgate-exec-O\n");
        }
        if (op == "cat") {
            return exitWith(0, "done");
        }
        return exitWith(0);
    });
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.safety_strategy = SafetyStrategy::UNPRIVILEGED_USER;
    req.run_as_user = "codex";
    req.output_schema = ContentSource::inlineText("{}");

    auto result = executor.run(req);
    EXPECT_EQ(result.final_message, "done");

    const std::string prefix = "sudo -n -u codex -- ";
    for (const auto& command : runner.commands) {
        EXPECT_EQ(command.rfind(prefix, 0), 0u) << command;
    }

    ASSERT_EQ(runner.commands.size(), 8u);
    EXPECT_EQ(runner.commands[0], prefix + "mktemp -d -t privgate-exec-XXXXXX");
    EXPECT_EQ(runner.commands[1], prefix + "mktemp -d -t privgate-schema-XXXXXX");
    EXPECT_EQ(runner.specs[2].argv[5], "tee");
    EXPECT_EQ(runner.specs[3].argv[5], "mv");
    EXPECT_EQ(runner.commands[4],
              prefix + agent + " exec --skip-git-repo-check --cd " + work.path() +
              " --output-last-message /tmp/privgate-exec-O/output.md"
              " --output-schema /tmp/privgate-schema-S/schema.json --sandbox workspace-write");
    EXPECT_EQ(runner.specs[4].input, "Summarize the diff.");
    EXPECT_EQ(runner.commands[5], prefix + "cat /tmp/privgate-exec-O/output.md");
    EXPECT_EQ(runner.commands[6], prefix + "rm -rf /tmp/privgate-schema-S");
    EXPECT_EQ(runner.commands[7], prefix + "rm -rf /tmp/privgate-exec-O");
}

TEST_F(AgentExecutorTest, BuildPlanSetsOriginatorOnlyWhenAbsent) {
    FakeProcessRunner runner;
    AgentExecutor executor(runner, settings());

    auto plan = executor.buildPlan(request(), "codex", "/tmp/out.md", std::nullopt, {{"PATH", "/bin"}});
    EXPECT_EQ(plan.environment.at("CODEX_INTERNAL_ORIGINATOR_OVERRIDE"), "privgate");
    EXPECT_EQ(plan.environment.count("CODEX_HOME"), 0u);

    auto kept = executor.buildPlan(request(), "codex", "/tmp/out.md", std::nullopt,
                                   {{"CODEX_INTERNAL_ORIGINATOR_OVERRIDE", "ci"}});
    EXPECT_EQ(kept.environment.at("CODEX_INTERNAL_ORIGINATOR_OVERRIDE"), "ci");
    EXPECT_EQ(kept.command.front(), "codex");
}

TEST_F(AgentExecutorTest, MissingFinalMessageIsFinalReadErrorAndCleansUp) {
    setenv("FAKE_AGENT_SKIP_OUTPUT", "1", 1);
    CommandRunner runner;
    AgentExecutor executor(runner, settings());

    auto req = request();
    req.output_schema = ContentSource::inlineText("{}");

    try {
        executor.run(req);
        FAIL() << "expected FinalReadError";
    } catch (const FinalReadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FINAL_READ_FAILED);
    }
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, ImpersonatedMissingFinalMessageIsFinalReadErrorAndCleansUp) {
    setenv("FAKE_AGENT_SKIP_OUTPUT", "1", 1);
    CommandRunner runner;
    AgentExecutor executor(runner, impersonatedSettings());

    auto req = impersonatedRequest();
    req.output_schema = ContentSource::inlineText("{}");

    try {
        executor.run(req);
        FAIL() << "expected FinalReadError";
    } catch (const FinalReadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FINAL_READ_FAILED);
    }
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, ImpersonatedRunEndToEnd) {
    CommandRunner runner;
    AgentExecutor executor(runner, impersonatedSettings());

    auto req = impersonatedRequest();
    req.output_schema = ContentSource::inlineText("{\"type\":\"object\"}");

    EXPECT_EQ(executor.run(req).final_message, "Summarize the diff.");
    EXPECT_EQ(readText(record + ".schema"), "{\"type\":\"object\"}");
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}

TEST_F(AgentExecutorTest, CancelledImpersonatedRunStillRemovesTemporaries) {
    setenv("FAKE_AGENT_SLEEP", "30", 1);
    CancellationToken token;
    token.setTimeout(std::chrono::seconds(2));
    CommandRunner runner(RunnerLimits{}, &token);
    AgentExecutor executor(runner, impersonatedSettings());

    auto req = impersonatedRequest();
    req.output_schema = ContentSource::inlineText("{}");

    EXPECT_THROW(executor.run(req), CommandCancelledError);
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(entryCount(scratch.path()), 0u);
}
