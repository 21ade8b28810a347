/**
 * @file test_container_controller.cpp
 * @brief Unit tests for the container lifecycle against a scripted engine.
 */

#include "lifecycle/container_controller.hpp"
#include "support/fake_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>

using namespace codebox;
using namespace codebox::testing;
using namespace std::chrono_literals;

class ContainerControllerTest : public ::testing::Test {
protected:
    FakeEngine engine_;
    std::vector<std::pair<ContainerId, Error>> cleanup_failures_;
    ContainerController controller_{engine_, SandboxConfig{}, nullptr,
        [this](const ContainerId& id, const Error& e) { cleanup_failures_.emplace_back(id, e); }};

    RuntimeDescriptor runtime_;
    Workspace workspace_;
    ResourceProfile profile_;

    void SetUp() override {
        runtime_.language = "python";
        runtime_.version = "3.12.0";
        runtime_.image = "codebox-python-runner";
        runtime_.extension = ".py";
        runtime_.command = {"python3", "{file}", "{args}"};

        workspace_.id = "0123456789abcdef0123456789abcdef";
        workspace_.path = "/tmp/codebox/ws-0123456789abcdef0123456789abcdef";
        workspace_.files = {"main.py"};

        profile_.memory_bytes = 128 * kMiB;
        profile_.run_timeout = 2000ms;
        profile_.compile_timeout = 2000ms;
        profile_.nano_cpus = 500000000;
        profile_.pids_limit = 64;
        profile_.tmpfs_bytes = 64 * kMiB;
        profile_.output_limit = 1024;
    }

    Result<RawOutcome> run(std::string_view stdin_data = {}, std::vector<std::string> args = {}) {
        return controller_.run(runtime_, workspace_, stdin_data, args, profile_);
    }
};

TEST_F(ContainerControllerTest, SpecCarriesSandboxAndLimits) {
    auto spec = controller_.make_spec(runtime_, workspace_, {"x"}, profile_, {}, false);

    EXPECT_EQ(spec.image, "codebox-python-runner");
    EXPECT_EQ(spec.command, (std::vector<std::string>{"python3", "/code/main.py", "x"}));
    EXPECT_EQ(spec.working_dir, "/code");
    EXPECT_EQ(spec.user, "runner");
    EXPECT_EQ(spec.host_path.string(), workspace_.path.string());
    EXPECT_EQ(spec.mount_path, "/code");
    EXPECT_TRUE(spec.mount_read_only);
    EXPECT_EQ(spec.memory_bytes, 128 * kMiB);
    EXPECT_EQ(spec.memory_swap_bytes, spec.memory_bytes);
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.cap_drop, std::vector<std::string>{"ALL"});
    ASSERT_EQ(spec.tmpfs.size(), 2u);
    EXPECT_EQ(spec.tmpfs[0].first, "/tmp");
    EXPECT_NE(spec.tmpfs[0].second.find("size=67108864"), std::string::npos);
    EXPECT_EQ(spec.labels.at("codebox.language"), "python");
    EXPECT_EQ(spec.labels.at("codebox.workspace"), workspace_.id);
    EXPECT_FALSE(spec.open_stdin);
}

TEST_F(ContainerControllerTest, SuccessfulRunCollectsOutputAndRemoves) {
    engine_.set_default_script(Script{.stdout_data = "Hello, World!\n", .stderr_data = "warn\n"});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome->stdout_data, "Hello, World!\n");
    EXPECT_EQ(outcome->stderr_data, "warn\n");
    ASSERT_TRUE(outcome->exit_code.has_value());
    EXPECT_EQ(*outcome->exit_code, 0);
    EXPECT_FALSE(outcome->timed_out);
    EXPECT_FALSE(outcome->oom_killed);
    EXPECT_EQ(engine_.removes(), 1u);
    EXPECT_EQ(engine_.live_containers(), 0u);
    EXPECT_TRUE(cleanup_failures_.empty());
}

TEST_F(ContainerControllerTest, TimeoutKeepsPartialOutput) {
    engine_.set_default_script(Script{.stdout_data = "partial", .run_time = 10s});
    profile_.run_timeout = 50ms;

    const auto started = std::chrono::steady_clock::now();
    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    EXPECT_TRUE(outcome->timed_out);
    EXPECT_FALSE(outcome->exit_code.has_value());
    EXPECT_EQ(outcome->stdout_data, "partial");
    EXPECT_EQ(engine_.live_containers(), 0u);
}

TEST_F(ContainerControllerTest, StalledStdinIsBoundedByRunBudget) {
    engine_.set_default_script(Script{.stdout_data = "partial", .run_time = 10s,
                                      .stdin_stall = 10s});
    profile_.run_timeout = 100ms;

    const auto started = std::chrono::steady_clock::now();
    auto outcome = run("never read\n");
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    EXPECT_TRUE(outcome->timed_out);
    EXPECT_EQ(outcome->stdout_data, "partial");
    EXPECT_TRUE(engine_.stdin_received().empty());
    EXPECT_EQ(engine_.live_containers(), 0u);
}

TEST_F(ContainerControllerTest, CompiledRuntimeWaitsForCompileAndRun) {
    runtime_.compiled = true;
    profile_.run_timeout = 60ms;
    profile_.compile_timeout = 200ms;
    engine_.set_default_script(Script{.stdout_data = "ok", .run_time = 100ms});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->timed_out);
    EXPECT_EQ(outcome->exit_code, 0);
}

TEST_F(ContainerControllerTest, OomAndExitCodeFromInspect) {
    engine_.set_default_script(Script{.exit_code = 137, .oom_killed = true});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->oom_killed);
    EXPECT_EQ(outcome->exit_code, 137);
}

TEST_F(ContainerControllerTest, InspectFailureFallsBackToWaitStatus) {
    engine_.set_default_script(Script{
        .exit_code = 3,
        .inspect_error = Error{ErrorCode::EngineUnavailable, "proxy hiccup"}});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome->exit_code, 3);
    EXPECT_FALSE(outcome->oom_killed);
}

TEST_F(ContainerControllerTest, StdinDeliveredWhenPresent) {
    auto outcome = run("5\n7\n");
    ASSERT_TRUE(outcome.has_value());

    auto received = engine_.stdin_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received.begin()->second, "5\n7\n");
    EXPECT_TRUE(engine_.created_specs().front().open_stdin);
}

TEST_F(ContainerControllerTest, NoStdinNoAttach) {
    auto outcome = run();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(engine_.stdin_received().empty());
    EXPECT_FALSE(engine_.created_specs().front().open_stdin);
}

TEST_F(ContainerControllerTest, CreateFailureMakesNoFurtherCalls) {
    engine_.set_default_script(Script{
        .create_error = Error{ErrorCode::EngineRejected, "No such image"}});

    auto outcome = run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::EngineRejected);
    EXPECT_EQ(engine_.removes(), 0u);
    EXPECT_EQ(engine_.calls(), 1);
}

TEST_F(ContainerControllerTest, StartFailureStillRemoves) {
    engine_.set_default_script(Script{
        .start_error = Error{ErrorCode::EngineRejected, "OCI runtime create failed"}});

    auto outcome = run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::EngineRejected);
    EXPECT_EQ(engine_.removes(), 1u);
    EXPECT_EQ(engine_.live_containers(), 0u);
}

TEST_F(ContainerControllerTest, WaitFailureStillRemoves) {
    engine_.set_default_script(Script{
        .wait_error = Error{ErrorCode::EngineUnavailable, "connection reset"}});

    auto outcome = run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::EngineUnavailable);
    EXPECT_EQ(engine_.live_containers(), 0u);
}

TEST_F(ContainerControllerTest, RemoveFailureIsReportedNotPropagated) {
    engine_.set_default_script(Script{
        .stdout_data = "done",
        .remove_error = Error{ErrorCode::EngineUnavailable, "proxy down"}});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome->stdout_data, "done");

    ASSERT_EQ(cleanup_failures_.size(), 1u);
    EXPECT_EQ(cleanup_failures_.front().first, outcome->container_id);
    EXPECT_EQ(cleanup_failures_.front().second.message, "proxy down");
    EXPECT_EQ(engine_.removes(), 1u);
}

TEST_F(ContainerControllerTest, OutputCutAtCeiling) {
    profile_.output_limit = 4;
    engine_.set_default_script(Script{.stdout_data = "0123456789", .stderr_data = "ab"});

    auto outcome = run();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->stdout_data, "0123");
    EXPECT_TRUE(outcome->stdout_truncated);
    EXPECT_EQ(outcome->stderr_data, "ab");
    EXPECT_FALSE(outcome->stderr_truncated);
}
