#include <gtest/gtest.h>
#include <managers/diagnostic_runner.hpp>
#include "fake_session.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const std::string SCRIPT = "#!/bin/bash\necho \"nbot at $NBOT_DIR\"\n";

class DiagnosticRunnerTest : public ::testing::Test {
protected:
    FakeRemote remote_;
    FakeConnector connector_{remote_};
    fs::path payload_;
    RunOptions options_;

    void SetUp() override {
        payload_ = fs::temp_directory_path() /
                   (std::string("nbotdiag_runner_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".sh");
        std::ofstream(payload_, std::ios::binary) << SCRIPT;

        options_.host = "diag.example.org";
        options_.password = "pw";
    }

    void TearDown() override {
        fs::remove(payload_);
    }

    RunOutcome run(EnvLookup env = nullptr) {
        DiagnosticRunner runner(connector_, std::move(env));
        return runner.run(options_, payload_);
    }
};

TEST_F(DiagnosticRunnerTest, NoCredentialNeverConnects) {
    options_.password.reset();
    auto outcome = run([](const std::string&) { return std::optional<std::string>(); });

    EXPECT_EQ(outcome.error, RunError::Config);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_EQ(remote_.connect_attempts, 0);
}

TEST_F(DiagnosticRunnerTest, MissingPayloadNeverConnects) {
    fs::remove(payload_);
    auto outcome = run();

    EXPECT_EQ(outcome.error, RunError::Payload);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_NE(outcome.message.find(payload_.string()), std::string::npos);
    EXPECT_EQ(remote_.connect_attempts, 0);
}

TEST_F(DiagnosticRunnerTest, ConnectFailureIsExitOne) {
    remote_.connect_error = "TCP connection to diag.example.org:22 failed: timed out after 15s";
    auto outcome = run();

    EXPECT_EQ(outcome.error, RunError::Connect);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(remote_.connect_attempts, 1);
    EXPECT_TRUE(remote_.commands.empty());
}

TEST_F(DiagnosticRunnerTest, PassesResolvedParamsToConnector) {
    options_.port = 2022;
    options_.user = "ops";
    options_.connect_timeout = 9;
    run();

    EXPECT_EQ(remote_.last_params.host, "diag.example.org");
    EXPECT_EQ(remote_.last_params.port, 2022);
    EXPECT_EQ(remote_.last_params.user, "ops");
    EXPECT_EQ(remote_.last_params.credential.password, "pw");
    EXPECT_EQ(remote_.last_params.connect_timeout, 9);
}

TEST_F(DiagnosticRunnerTest, UploadsExactPayloadToRemotePath) {
    options_.remote_path = "/var/tmp/diag.sh";
    auto outcome = run();

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    ASSERT_EQ(remote_.files.size(), 1u);
    EXPECT_EQ(remote_.files.at("/var/tmp/diag.sh"), SCRIPT);
}

TEST_F(DiagnosticRunnerTest, RunsChmodThenScriptWithCommandTimeout) {
    options_.command_timeout = 42;
    run();

    ASSERT_EQ(remote_.commands.size(), 2u);
    EXPECT_EQ(remote_.commands[0], "chmod +x '/tmp/nbot-diagnose.sh'");
    EXPECT_EQ(remote_.commands[1], "NBOT_DIR='/opt/nbot' bash '/tmp/nbot-diagnose.sh'");
    EXPECT_EQ(remote_.command_timeouts, (std::vector<int>{42, 42}));
}

TEST_F(DiagnosticRunnerTest, NbotDirOnlyChangesEnvironmentOverride) {
    run();
    auto baseline_files = remote_.files;
    auto baseline_chmod = remote_.commands.at(0);

    FakeRemote other;
    FakeConnector other_connector(other);
    options_.nbot_dir = "/srv/custom";
    DiagnosticRunner runner(other_connector, nullptr);
    runner.run(options_, payload_);

    EXPECT_EQ(other.files, baseline_files);
    EXPECT_EQ(other.commands.at(0), baseline_chmod);
    EXPECT_EQ(other.commands.at(1), "NBOT_DIR='/srv/custom' bash '/tmp/nbot-diagnose.sh'");
}

TEST_F(DiagnosticRunnerTest, PropagatesRemoteExitStatus) {
    remote_.exec_result = SSHResult{3, "partial\n", "docker: not found\n"};
    auto outcome = run();

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_text, "partial\n");
    EXPECT_EQ(outcome.stderr_text, "docker: not found\n");
}

TEST_F(DiagnosticRunnerTest, InvalidBytesAreReplacedNotFatal) {
    remote_.exec_result = SSHResult{0, "ok \xFF\xFE done\n", "\xC3"};
    auto outcome = run();

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.stdout_text, "ok \xEF\xBF\xBD\xEF\xBF\xBD done\n");
    EXPECT_EQ(outcome.stderr_text, "\xEF\xBF\xBD");
}

TEST_F(DiagnosticRunnerTest, UploadFailureStopsBeforeAnyCommand) {
    remote_.upload_error = "Cannot open /tmp/nbot-diagnose.sh for writing";
    auto outcome = run();

    EXPECT_EQ(outcome.error, RunError::RemoteExec);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_TRUE(remote_.commands.empty());
    EXPECT_EQ(remote_.close_calls, 1);
}

TEST_F(DiagnosticRunnerTest, ChmodFailureStopsBeforeScript) {
    remote_.chmod_status = 1;
    auto outcome = run();

    EXPECT_EQ(outcome.error, RunError::RemoteExec);
    EXPECT_EQ(remote_.commands.size(), 1u);
    EXPECT_NE(outcome.message.find("chmod"), std::string::npos);
}

TEST_F(DiagnosticRunnerTest, ExecTimeoutIsRemoteFailure) {
    remote_.exec_error = "Remote command timed out after 180s";
    auto outcome = run();

    EXPECT_EQ(outcome.error, RunError::RemoteExec);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(outcome.message, "Remote command timed out after 180s");
    EXPECT_EQ(remote_.close_calls, 1);
}

TEST_F(DiagnosticRunnerTest, SessionClosedExactlyOnceOnSuccess) {
    auto outcome = run();
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(remote_.close_calls, 1);
}

TEST(RunErrorCodes, LocalFailuresAreTwoRemoteAreOne) {
    EXPECT_EQ(exit_code_for(RunError::None), 0);
    EXPECT_EQ(exit_code_for(RunError::Usage), 2);
    EXPECT_EQ(exit_code_for(RunError::Config), 2);
    EXPECT_EQ(exit_code_for(RunError::Payload), 2);
    EXPECT_EQ(exit_code_for(RunError::Dependency), 2);
    EXPECT_EQ(exit_code_for(RunError::Connect), 1);
    EXPECT_EQ(exit_code_for(RunError::RemoteExec), 1);
}
