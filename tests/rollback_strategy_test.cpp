#include "errors.hpp"
#include "fake_firewall_backend.hpp"
#include "rollback_strategy.hpp"
#include <gtest/gtest.h>

using namespace portguard;
using portguard::testing::FakeFirewallBackend;
using portguard::testing::TempDir;

namespace {

ChangeItem item(Protocol protocol, uint16_t port) {
    ChangeItem change;
    change.protocol = protocol;
    change.port = port;
    return change;
}

// Strategy with a scripted outcome per family
class ScriptedStrategy : public RecoveryStrategy {
public:
    ScriptedStrategy(std::string name, std::vector<std::string>& log, bool succeed_v4, bool succeed_v6)
        : name_(std::move(name)), log_(log), succeed_v4_(succeed_v4), succeed_v6_(succeed_v6) {}

    std::string name() const override { return name_; }

    std::string attempt(AddressFamily family) override {
        log_.push_back(name_ + ":" + familyToString(family));
        bool succeed = family == AddressFamily::IPv4 ? succeed_v4_ : succeed_v6_;
        if (!succeed) {
            throw RollbackFailure(name_ + " refused");
        }
        return name_ + " done";
    }

private:
    std::string name_;
    std::vector<std::string>& log_;
    bool succeed_v4_;
    bool succeed_v6_;
};

class RollbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.backup_directory = temp.path();
        settings.retry.backoff = std::chrono::milliseconds(0);
        items = {item(Protocol::Tcp, 902), item(Protocol::Udp, 902)};
    }

    void applyAll() {
        for (const auto& change : items) {
            for (AddressFamily family : kAllFamilies) {
                ASSERT_TRUE(backend.appendBlockRule(family, change.protocol, change.port).isSuccess());
                applied[family].push_back(change);
            }
        }
    }

    TempDir temp;
    FakeFirewallBackend backend;
    GuardSettings settings;
    std::vector<ChangeItem> items;
    std::map<AddressFamily, std::vector<ChangeItem>> applied;
};

} // namespace

TEST_F(RollbackTest, FlushChainRetriesThenSucceeds) {
    applyAll();
    backend.failOn("flush:IPv4", 2);
    FlushChain flush(backend, settings.retry);

    EXPECT_NO_THROW(flush.attempt(AddressFamily::IPv4));
    EXPECT_EQ(backend.count("flush:IPv4"), 3);
    EXPECT_TRUE(backend.chains[AddressFamily::IPv4].rules.empty());
}

TEST_F(RollbackTest, FlushChainThrowsWhenExhausted) {
    backend.failOn("flush:IPv6");
    FlushChain flush(backend, settings.retry);

    EXPECT_THROW(flush.attempt(AddressFamily::IPv6), RollbackFailure);
    EXPECT_EQ(backend.count("flush:IPv6"), settings.retry.attempts);
}

TEST_F(RollbackTest, DeleteRulesIndividuallyWorksInReverseOrder) {
    applyAll();
    DeleteRulesIndividually deleter(backend, applied);

    EXPECT_NO_THROW(deleter.attempt(AddressFamily::IPv4));
    std::vector<std::string> deletes;
    for (const auto& command : backend.commands) {
        if (command.rfind("delete:", 0) == 0) {
            deletes.push_back(command);
        }
    }
    ASSERT_EQ(deletes.size(), 2u);
    EXPECT_EQ(deletes[0], "delete:IPv4:udp/902");
    EXPECT_EQ(deletes[1], "delete:IPv4:tcp/902");
    EXPECT_TRUE(backend.chains[AddressFamily::IPv4].rules.empty());
}

TEST_F(RollbackTest, DeleteRulesIndividuallyFailsIfAnyDeleteFails) {
    applyAll();
    backend.failOn("delete:IPv6:udp/902");
    DeleteRulesIndividually deleter(backend, applied);

    EXPECT_THROW(deleter.attempt(AddressFamily::IPv6), RollbackFailure);
    // The remaining rule was still attempted, once
    EXPECT_EQ(backend.count("delete:IPv6:tcp/902"), 1);
    EXPECT_EQ(backend.count("delete:IPv6:udp/902"), 1);
}

TEST_F(RollbackTest, ExecutorEscalatesPerFamilyIndependently) {
    std::vector<std::string> log;
    std::vector<std::unique_ptr<RecoveryStrategy>> strategies;
    strategies.push_back(std::make_unique<ScriptedStrategy>("first", log, true, false));
    strategies.push_back(std::make_unique<ScriptedStrategy>("second", log, true, false));
    strategies.push_back(std::make_unique<ScriptedStrategy>("third", log, true, true));

    BackupManager backups(backend, settings);
    RollbackExecutor executor(backend, backups, items, std::move(strategies));
    RollbackReport report = executor.run();

    std::vector<std::string> expected = {"first:IPv4", "first:IPv6", "second:IPv6", "third:IPv6"};
    EXPECT_EQ(log, expected);
    ASSERT_EQ(report.families.size(), 2u);
    EXPECT_EQ(report.families[0].strategy, "first");
    EXPECT_EQ(report.families[1].strategy, "third");
    EXPECT_EQ(report.families[1].failures.size(), 2u);
    EXPECT_TRUE(report.rolledBack());
}

TEST_F(RollbackTest, VerificationOverridesStrategySuccess) {
    applyAll();
    std::vector<std::string> log;
    std::vector<std::unique_ptr<RecoveryStrategy>> strategies;
    strategies.push_back(std::make_unique<ScriptedStrategy>("liar", log, true, true));

    BackupManager backups(backend, settings);
    backups.createSnapshot();
    RollbackExecutor executor(backend, backups, items, std::move(strategies));
    RollbackReport report = executor.run();

    EXPECT_FALSE(report.rolledBack());
    EXPECT_EQ(report.residual.size(), 4u);
    EXPECT_EQ(report.retained_snapshots.size(), 2u);
    EXPECT_TRUE(backups.snapshotExists());
}

TEST_F(RollbackTest, UnparsableListingCountsAsResidual) {
    std::vector<std::string> log;
    std::vector<std::unique_ptr<RecoveryStrategy>> strategies;
    strategies.push_back(std::make_unique<ScriptedStrategy>("ok", log, true, true));
    backend.overrideListing(AddressFamily::IPv6, "Chain INPUT (policy ACCEPT)\n");

    BackupManager backups(backend, settings);
    RollbackExecutor executor(backend, backups, items, std::move(strategies));
    RollbackReport report = executor.run();

    EXPECT_FALSE(report.rolledBack());
    ASSERT_EQ(report.residual.size(), 1u);
    EXPECT_NE(report.residual[0].find("IPv6"), std::string::npos);
}

TEST_F(RollbackTest, StandardStrategiesFallBackToFlush) {
    BackupManager backups(backend, settings);
    backups.createSnapshot();
    applyAll();
    backend.failOn("restore:IPv4");

    RollbackExecutor executor(backend, backups, items, applied, settings);
    RollbackReport report = executor.run();

    EXPECT_TRUE(report.rolledBack());
    EXPECT_EQ(report.families[0].strategy, "Flush INPUT chain");
    EXPECT_EQ(report.families[1].strategy, "Restore from backup files");
    EXPECT_EQ(backend.count("restore:IPv4"), settings.retry.attempts);
    EXPECT_FALSE(backups.snapshotExists());
}

TEST_F(RollbackTest, StandardStrategiesReachPerRuleDelete) {
    BackupManager backups(backend, settings);
    backups.createSnapshot();
    applyAll();
    backend.failOn("restore:IPv6");
    backend.failOn("flush:IPv6");

    RollbackExecutor executor(backend, backups, items, applied, settings);
    RollbackReport report = executor.run();

    EXPECT_TRUE(report.rolledBack());
    EXPECT_EQ(report.families[1].strategy, "Delete rules individually");
    EXPECT_TRUE(backend.chains[AddressFamily::IPv6].rules.empty());
}

TEST_F(RollbackTest, EveryStrategyFailingIsPartial) {
    BackupManager backups(backend, settings);
    backups.createSnapshot();
    applyAll();
    backend.failOn("restore:IPv4");
    backend.failOn("flush:IPv4");
    backend.failOn("delete:IPv4:tcp/902");

    RollbackExecutor executor(backend, backups, items, applied, settings);
    RollbackReport report = executor.run();

    EXPECT_EQ(report.outcome, RollbackOutcome::Partial);
    EXPECT_FALSE(report.families[0].succeeded);
    EXPECT_EQ(report.families[0].failures.size(), 3u);
    EXPECT_TRUE(report.families[1].succeeded);
    ASSERT_EQ(report.residual.size(), 1u);
    EXPECT_NE(report.residual[0].find("--dport 902"), std::string::npos);
    EXPECT_TRUE(backups.snapshotExists());
}
