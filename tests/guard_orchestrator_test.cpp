#include "confirmation_signal.hpp"
#include "errors.hpp"
#include "fake_firewall_backend.hpp"
#include "guard_orchestrator.hpp"
#include <chrono>
#include <atomic>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace portguard;
using portguard::testing::FakeFirewallBackend;
using portguard::testing::TempDir;

namespace {

class ThrowingAppendBackend : public FakeFirewallBackend {
public:
    CommandResult appendBlockRule(AddressFamily family, Protocol protocol, uint16_t port) override {
        if (family == AddressFamily::IPv4 && protocol == Protocol::Tcp && port == 912) {
            commands.push_back("append:IPv4:tcp/912");
            throw std::runtime_error("backend connection lost");
        }
        return FakeFirewallBackend::appendBlockRule(family, protocol, port);
    }
};

ChangeItem item(Protocol protocol, uint16_t port, const std::string& description = "") {
    ChangeItem change;
    change.protocol = protocol;
    change.port = port;
    change.description = description;
    return change;
}

class GuardOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.guard.backup_directory = temp.path() / "iptables-backups";
        config.guard.confirm_timeout = std::chrono::seconds(1);
        config.guard.poll_interval = std::chrono::milliseconds(10);
        config.guard.retry.backoff = std::chrono::milliseconds(0);
        config.block = {item(Protocol::Tcp, 902, "VMware Authentication Daemon")};
    }

    bool snapshotPresent() const {
        return std::filesystem::exists(config.guard.backupPath(AddressFamily::IPv4)) ||
               std::filesystem::exists(config.guard.backupPath(AddressFamily::IPv6));
    }

    TempDir temp;
    FakeFirewallBackend backend;
    Config config;
};

} // namespace

TEST_F(GuardOrchestratorTest, ConfirmedChangeIsCommitted) {
    config.guard.confirm_timeout = std::chrono::seconds(30);
    GuardOrchestrator orchestrator(backend, config);

    std::thread operator_thread([&orchestrator] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        orchestrator.confirm();
    });
    GuardResult result = orchestrator.run();
    operator_thread.join();

    EXPECT_EQ(result.phase, Phase::Committed);
    EXPECT_EQ(result.exitCode(), 0);
    EXPECT_FALSE(result.rollback.has_value());
    EXPECT_FALSE(snapshotPresent());
    EXPECT_TRUE(backend.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    EXPECT_TRUE(backend.hasBlockRule(AddressFamily::IPv6, Protocol::Tcp, 902));
    EXPECT_EQ(backend.count("persist"), 1);
    EXPECT_EQ(orchestrator.state().changes_applied, 2u);

    // both chains are listed once for the checks and once after the rules go in
    EXPECT_EQ(backend.count("list:"), 4);
    ASSERT_GE(backend.commands.size(), 4u);
    const size_t n = backend.commands.size();
    EXPECT_EQ(backend.commands[n - 4], "append:IPv6:tcp/902");
    EXPECT_EQ(backend.commands[n - 3], "list:IPv4");
    EXPECT_EQ(backend.commands[n - 2], "list:IPv6");
    EXPECT_EQ(backend.commands[n - 1], "persist");
}

TEST_F(GuardOrchestratorTest, PersistFailureStillCommits) {
    backend.failOn("persist");
    GuardOrchestrator orchestrator(backend, config);
    orchestrator.confirm();

    GuardResult result = orchestrator.run();

    EXPECT_EQ(result.phase, Phase::Committed);
    EXPECT_FALSE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, PersistenceCanBeDisabled) {
    config.guard.persist = false;
    GuardOrchestrator orchestrator(backend, config);
    orchestrator.confirm();

    EXPECT_EQ(orchestrator.run().phase, Phase::Committed);
    EXPECT_EQ(backend.count("persist"), 0);
}

TEST_F(GuardOrchestratorTest, UnconfirmedChangeIsRolledBack) {
    GuardOrchestrator orchestrator(backend, config);
    auto start = std::chrono::steady_clock::now();
    GuardResult result = orchestrator.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.phase, Phase::RolledBack);
    EXPECT_EQ(result.exitCode(), 2);
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv6, Protocol::Tcp, 902));
    EXPECT_FALSE(snapshotPresent());
    ASSERT_TRUE(result.rollback.has_value());
    EXPECT_TRUE(result.rollback->residual.empty());
    EXPECT_EQ(backend.count("persist"), 0);
}

TEST_F(GuardOrchestratorTest, ApplyFailureRollsBackWithoutWaiting) {
    config.guard.confirm_timeout = std::chrono::seconds(60);
    config.block = {item(Protocol::Tcp, 902), item(Protocol::Tcp, 912)};
    backend.failOn("append:IPv4:tcp/912");

    GuardOrchestrator orchestrator(backend, config);
    auto start = std::chrono::steady_clock::now();
    GuardResult result = orchestrator.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 10000);
    EXPECT_EQ(result.phase, Phase::RolledBack);
    EXPECT_NE(result.failure.find("tcp/912"), std::string::npos);
    EXPECT_EQ(orchestrator.state().changes_applied, 2u);
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv6, Protocol::Tcp, 902));
    EXPECT_EQ(backend.count("append:IPv6:tcp/912"), 0);
    EXPECT_FALSE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, UnexpectedErrorWhileApplyingRollsBack) {
    config.block = {item(Protocol::Tcp, 902), item(Protocol::Tcp, 912)};
    ThrowingAppendBackend throwing;

    GuardOrchestrator orchestrator(throwing, config);
    GuardResult result;
    ASSERT_NO_THROW(result = orchestrator.run());

    EXPECT_EQ(result.phase, Phase::RolledBack);
    EXPECT_EQ(result.exitCode(), 2);
    EXPECT_NE(result.failure.find("backend connection lost"), std::string::npos);
    EXPECT_FALSE(throwing.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    EXPECT_FALSE(throwing.hasBlockRule(AddressFamily::IPv6, Protocol::Tcp, 902));
    EXPECT_EQ(throwing.count("append:IPv6:tcp/912"), 0);
    EXPECT_EQ(throwing.count("persist"), 0);
    EXPECT_FALSE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, ErrorInsideWaitLoopRollsBackLikeTimeout) {
    config.guard.confirm_timeout = std::chrono::seconds(60);
    std::atomic<bool> elsewhere{false};
    ConfirmationSignal held(elsewhere);

    GuardOrchestrator orchestrator(backend, config);
    auto start = std::chrono::steady_clock::now();
    GuardResult result = orchestrator.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 10000);
    EXPECT_EQ(result.phase, Phase::RolledBack);
    EXPECT_FALSE(result.failure.empty());
    EXPECT_NE(result.failure.find("already installed"), std::string::npos);
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv6, Protocol::Tcp, 902));
    EXPECT_EQ(backend.count("persist"), 0);
    EXPECT_FALSE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, ApplyFailureWithFailingRollbackIsPartial) {
    config.block = {item(Protocol::Tcp, 902), item(Protocol::Tcp, 912)};
    backend.failOn("append:IPv4:tcp/912");
    backend.failOn("restore:IPv4");
    backend.failOn("flush:IPv4");

    GuardOrchestrator orchestrator(backend, config);
    GuardResult result = orchestrator.run();

    // tcp/902 is deleted; deleting the never-applied tcp/912 fails
    EXPECT_EQ(result.phase, Phase::RollbackPartial);
    EXPECT_EQ(result.exitCode(), 3);
    EXPECT_FALSE(backend.hasBlockRule(AddressFamily::IPv4, Protocol::Tcp, 902));
    ASSERT_TRUE(result.rollback.has_value());
    EXPECT_TRUE(result.rollback->residual.empty());
    EXPECT_EQ(result.rollback->retained_snapshots.size(), 2u);
    EXPECT_TRUE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, StaleSnapshotRefusesWithoutCommands) {
    std::filesystem::create_directories(config.guard.backup_directory);
    std::ofstream(config.guard.backupPath(AddressFamily::IPv4)) << "*filter\nCOMMIT\n";

    GuardOrchestrator orchestrator(backend, config);
    EXPECT_THROW(orchestrator.run(), PreconditionFailure);

    EXPECT_TRUE(backend.mutations().empty());
    EXPECT_EQ(backend.count("dump:"), 0);
    EXPECT_FALSE(std::filesystem::exists(config.guard.backupPath(AddressFamily::IPv6)));
    EXPECT_EQ(orchestrator.state().phase, Phase::Init);
}

TEST_F(GuardOrchestratorTest, PreconditionFailureListsEveryProblem) {
    backend.environment_problems = {"This program must be run as root (sudo)"};
    backend.chains[AddressFamily::IPv4].rules.push_back("-i lo -j ACCEPT");
    backend.chains[AddressFamily::IPv6].policy = ChainPolicy::Drop;

    GuardOrchestrator orchestrator(backend, config);
    try {
        orchestrator.run();
        FAIL() << "expected PreconditionFailure";
    } catch (const PreconditionFailure& e) {
        EXPECT_EQ(e.problems().size(), 3u);
    }
    EXPECT_TRUE(backend.mutations().empty());
    EXPECT_FALSE(snapshotPresent());
}

TEST_F(GuardOrchestratorTest, ExpectedDropPolicyIsAccepted) {
    config.guard.expected_policy = ChainPolicy::Drop;
    backend.chains[AddressFamily::IPv4].policy = ChainPolicy::Drop;
    backend.chains[AddressFamily::IPv6].policy = ChainPolicy::Drop;

    GuardOrchestrator orchestrator(backend, config);
    EXPECT_NO_THROW(orchestrator.verifyPreconditions());
}

TEST_F(GuardOrchestratorTest, UnparsableListingRefuses) {
    backend.overrideListing(AddressFamily::IPv6, "-P INPUT ACCEPT\n-A INPUT -p tcp --dport 22\n");

    GuardOrchestrator orchestrator(backend, config);
    EXPECT_THROW(orchestrator.verifyPreconditions(), PreconditionFailure);
}

TEST_F(GuardOrchestratorTest, BackupFailurePropagatesBeforeMutation) {
    backend.failOn("dump:IPv6");

    GuardOrchestrator orchestrator(backend, config);
    EXPECT_THROW(orchestrator.run(), BackupError);
    EXPECT_TRUE(backend.mutations().empty());
    EXPECT_EQ(orchestrator.state().phase, Phase::Verified);
}

TEST(GuardResultTest, ExitCodes) {
    GuardResult result;
    result.phase = Phase::Committed;
    EXPECT_EQ(result.exitCode(), 0);
    result.phase = Phase::RolledBack;
    EXPECT_EQ(result.exitCode(), 2);
    result.phase = Phase::RollbackPartial;
    EXPECT_EQ(result.exitCode(), 3);
    result.phase = Phase::Applied;
    EXPECT_EQ(result.exitCode(), 1);
    EXPECT_EQ(phaseToString(Phase::AwaitingConfirmation), "AWAITING_CONFIRMATION");
}

TEST(ConfirmationSignalTest, SignalsSetFlagAndHandlersAreRestored) {
    struct sigaction before {};
    ASSERT_EQ(sigaction(SIGINT, nullptr, &before), 0);

    std::atomic<bool> confirmed{false};
    {
        ConfirmationSignal guard(confirmed);
        ASSERT_EQ(raise(SIGINT), 0);
        EXPECT_TRUE(confirmed.load());

        confirmed.store(false);
        ASSERT_EQ(raise(SIGTERM), 0);
        EXPECT_TRUE(confirmed.load());
    }

    struct sigaction after {};
    ASSERT_EQ(sigaction(SIGINT, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(ConfirmationSignalTest, OnlyOneActiveInstance) {
    std::atomic<bool> first{false};
    std::atomic<bool> second{false};
    ConfirmationSignal guard(first);
    EXPECT_THROW(ConfirmationSignal other(second), std::runtime_error);
}
