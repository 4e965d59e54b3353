// AGORA - Proposal Action Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/governance/dispatcher.h>
#include <agora/governance/factory.h>
#include <agora/governance/governance.h>
#include <agora/governance/quorum.h>
#include <agora/governance/treasury.h>
#include <agora/crypto/sha256.h>

#include <array>
#include <memory>

using namespace agora;
using namespace agora::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class ActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<util::MockClock>(0);
        ledger_ = std::make_shared<TokenLedger>();
        sink_ = std::make_shared<RecordingEventSink>();

        config_.votingDelay = 1000;
        config_.votingPeriod = 5000;
        config_.quorumRate = QUORUM_RATE_SCALE / 2;
        config_.minActionDelay = 2000;
        config_.minQuorumVotes = 100;

        daoId_ = DaoFactory::DeriveDaoId("TREASURY_TOKEN");
        auto created = Governance::Create(daoId_, config_, clock_, ledger_, sink_);
        ASSERT_TRUE(created.IsValid());
        gov_ = created.Take();
        treasury_ = std::make_unique<Treasury>(daoId_, ledger_, sink_);

        alice_ = CreateTestAddress(1);
        bob_ = CreateTestAddress(2);
        ASSERT_EQ(ledger_->Credit(alice_, 1000), GovernanceError::None);
    }

    Address CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Address(data);
    }

    /// Propose, pass, queue and execute a payload, returning its action.
    /// Each call starts at the current clock and leaves it after execution.
    ProposalAction PassAndExecute(ActionPayload payload) {
        Timestamp now = clock_->Now();
        auto id = gov_->Propose(alice_, std::move(payload), 2000, 100);
        EXPECT_TRUE(id.IsValid());

        EXPECT_TRUE(clock_->Set(now + 1500));
        auto receipt = gov_->CastVote(alice_, *id, 100, VoteSide::For);
        EXPECT_TRUE(receipt.IsValid());

        EXPECT_TRUE(clock_->Set(now + 7000));
        EXPECT_EQ(gov_->Queue(*id), GovernanceError::None);
        EXPECT_EQ(gov_->UnstakeVote(*id, receipt.Take()).error, GovernanceError::None);

        EXPECT_TRUE(clock_->Set(now + 9000));
        auto action = gov_->Execute(*id);
        EXPECT_TRUE(action.IsValid()) << GovernanceErrorToString(action.error);
        return action.Take();
    }

    ActionPayload Transfer(const Address& to, Amount amount) {
        TreasuryTransfer transfer;
        transfer.recipient = to;
        transfer.amount = amount;
        transfer.memo = "grant";
        return ActionPayload(transfer);
    }

    std::shared_ptr<util::MockClock> clock_;
    std::shared_ptr<TokenLedger> ledger_;
    std::shared_ptr<RecordingEventSink> sink_;
    DaoConfig config_;
    DaoId daoId_;
    std::unique_ptr<Governance> gov_;
    std::unique_ptr<Treasury> treasury_;
    Address alice_;
    Address bob_;
};

// ============================================================================
// ProposalAction
// ============================================================================

TEST_F(ActionTest, ActionKindToString) {
    EXPECT_STREQ(ActionKindToString(ActionKind::ConfigUpdate), "ConfigUpdate");
    EXPECT_STREQ(ActionKindToString(ActionKind::TreasuryTransfer), "TreasuryTransfer");
}

TEST_F(ActionTest, ConsumeExactlyOnce) {
    ProposalAction action = PassAndExecute(Transfer(bob_, 10));
    EXPECT_EQ(action.GetKind(), ActionKind::TreasuryTransfer);
    EXPECT_FALSE(action.IsConsumed());

    const TreasuryTransfer* peeked = action.Peek<TreasuryTransfer>();
    ASSERT_NE(peeked, nullptr);
    EXPECT_EQ(peeked->amount, 10u);
    EXPECT_EQ(action.Peek<ConfigUpdate>(), nullptr);

    auto wrongKind = action.Consume<ConfigUpdate>(daoId_);
    EXPECT_EQ(wrongKind.error, GovernanceError::ActionKindMismatch);
    auto wrongDao = action.Consume<TreasuryTransfer>(DaoFactory::DeriveDaoId("OTHER"));
    EXPECT_EQ(wrongDao.error, GovernanceError::DaoMismatch);
    EXPECT_FALSE(action.IsConsumed());

    auto taken = action.Consume<TreasuryTransfer>(daoId_);
    ASSERT_TRUE(taken.IsValid());
    EXPECT_EQ(taken->recipient, bob_);
    EXPECT_EQ(taken->memo, "grant");
    EXPECT_TRUE(action.IsConsumed());

    auto again = action.Consume<TreasuryTransfer>(daoId_);
    EXPECT_EQ(again.error, GovernanceError::ActionAlreadyConsumed);
}

TEST_F(ActionTest, MovedActionIsConsumed) {
    ProposalAction action = PassAndExecute(Transfer(bob_, 10));
    ProposalAction moved = std::move(action);
    EXPECT_TRUE(action.IsConsumed());
    EXPECT_FALSE(moved.IsConsumed());
    EXPECT_EQ(moved.GetDaoId(), daoId_);
    EXPECT_TRUE(moved.Consume<TreasuryTransfer>(daoId_).IsValid());
}

TEST_F(ActionTest, PayloadToString) {
    EXPECT_EQ(ActionPayloadToString(Transfer(bob_, 25)).find("TreasuryTransfer(25 to "), 0u);
}

// ============================================================================
// Treasury
// ============================================================================

TEST_F(ActionTest, TreasuryRequiresCustody) {
    EXPECT_THROW(Treasury(daoId_, nullptr, sink_), std::invalid_argument);
}

TEST_F(ActionTest, Deposit) {
    ASSERT_EQ(treasury_->Deposit(alice_, 500), GovernanceError::None);
    EXPECT_EQ(treasury_->GetBalance(), 500u);
    EXPECT_EQ(ledger_->BalanceOf(alice_), 500u);
    EXPECT_EQ(ledger_->TotalLocked(), 500u);

    auto event = sink_->Last<TreasuryDeposited>();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->from, alice_);
    EXPECT_EQ(event->balance, 500u);
}

TEST_F(ActionTest, DepositZeroIsNoop) {
    EXPECT_EQ(treasury_->Deposit(alice_, 0), GovernanceError::None);
    EXPECT_EQ(treasury_->GetBalance(), 0u);
    EXPECT_EQ(sink_->CountOf<TreasuryDeposited>(), 0u);
}

TEST_F(ActionTest, DepositInsufficientBalance) {
    EXPECT_EQ(treasury_->Deposit(bob_, 1), GovernanceError::InsufficientBalance);
    EXPECT_EQ(treasury_->Deposit(alice_, 1001), GovernanceError::InsufficientBalance);
    EXPECT_EQ(treasury_->GetBalance(), 0u);
    EXPECT_EQ(ledger_->BalanceOf(alice_), 1000u);
}

TEST_F(ActionTest, TransferPaysRecipient) {
    ASSERT_EQ(treasury_->Deposit(alice_, 500), GovernanceError::None);
    ProposalAction action = PassAndExecute(Transfer(bob_, 200));

    ASSERT_EQ(treasury_->ApplyTransfer(std::move(action)), GovernanceError::None);
    EXPECT_TRUE(action.IsConsumed());
    EXPECT_EQ(treasury_->GetBalance(), 300u);
    EXPECT_EQ(ledger_->BalanceOf(bob_), 200u);

    auto event = sink_->Last<TreasuryTransferred>();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->recipient, bob_);
    EXPECT_EQ(event->amount, 200u);
    EXPECT_EQ(event->balance, 300u);
}

TEST_F(ActionTest, TransferInsufficientFundsCanBeRetried) {
    ASSERT_EQ(treasury_->Deposit(alice_, 100), GovernanceError::None);
    ProposalAction action = PassAndExecute(Transfer(bob_, 300));

    EXPECT_EQ(treasury_->ApplyTransfer(std::move(action)),
              GovernanceError::InsufficientTreasuryFunds);
    EXPECT_FALSE(action.IsConsumed());
    EXPECT_EQ(treasury_->GetBalance(), 100u);

    ASSERT_EQ(treasury_->Deposit(alice_, 200), GovernanceError::None);
    EXPECT_EQ(treasury_->ApplyTransfer(std::move(action)), GovernanceError::None);
    EXPECT_EQ(treasury_->GetBalance(), 0u);
    EXPECT_EQ(ledger_->BalanceOf(bob_), 300u);
}

TEST_F(ActionTest, TransferFromAnotherDaoIsRejected) {
    Treasury other(DaoFactory::DeriveDaoId("OTHER"), ledger_, nullptr);
    ASSERT_EQ(other.Deposit(alice_, 500), GovernanceError::None);

    ProposalAction action = PassAndExecute(Transfer(bob_, 200));
    EXPECT_EQ(other.ApplyTransfer(std::move(action)), GovernanceError::DaoMismatch);
    EXPECT_EQ(other.GetBalance(), 500u);

    ASSERT_EQ(treasury_->Deposit(alice_, 200), GovernanceError::None);
    EXPECT_EQ(treasury_->ApplyTransfer(std::move(action)), GovernanceError::None);
}

TEST_F(ActionTest, TreasuryRejectsConfigUpdate) {
    ConfigUpdate update;
    update.votingDelay = 5;
    ProposalAction action = PassAndExecute(ActionPayload(update));

    EXPECT_EQ(treasury_->ApplyTransfer(std::move(action)), GovernanceError::ActionKindMismatch);
    EXPECT_EQ(gov_->ApplyConfigUpdate(std::move(action)), GovernanceError::None);
    EXPECT_EQ(gov_->ApplyConfigUpdate(std::move(action)), GovernanceError::ActionAlreadyConsumed);
}

TEST_F(ActionTest, AppliedConfigUpdateIsConsumed) {
    ConfigUpdate update;
    update.votingDelay = 5;
    ProposalAction action = PassAndExecute(ActionPayload(update));
    ASSERT_FALSE(action.IsConsumed());

    EXPECT_EQ(gov_->ApplyConfigUpdate(std::move(action)), GovernanceError::None);
    EXPECT_TRUE(action.IsConsumed());
    EXPECT_EQ(gov_->GetConfig().votingDelay, 5u);
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST_F(ActionTest, DispatchRoutesByKind) {
    ActionDispatcher dispatcher(*gov_, *treasury_);
    ASSERT_EQ(treasury_->Deposit(alice_, 400), GovernanceError::None);

    ProposalAction transfer = PassAndExecute(Transfer(bob_, 150));
    ASSERT_EQ(dispatcher.Dispatch(std::move(transfer)), GovernanceError::None);
    EXPECT_EQ(ledger_->BalanceOf(bob_), 150u);

    ConfigUpdate update;
    update.minQuorumVotes = 500;
    ProposalAction configAction = PassAndExecute(ActionPayload(update));
    ASSERT_EQ(dispatcher.Dispatch(std::move(configAction)), GovernanceError::None);
    EXPECT_EQ(gov_->GetConfig().minQuorumVotes, 500u);
    EXPECT_EQ(gov_->GetConfig().version, 1u);

    EXPECT_EQ(dispatcher.Dispatch(std::move(configAction)),
              GovernanceError::ActionAlreadyConsumed);
}

// ============================================================================
// DAO Factory
// ============================================================================

TEST_F(ActionTest, FactoryCreatesOneDaoPerTokenType) {
    DaoFactory factory(clock_, ledger_, sink_);
    DaoWitness witness("GOV_TOKEN");

    auto created = factory.CreateDao(std::move(witness), config_);
    ASSERT_TRUE(created.IsValid());
    EXPECT_TRUE(witness.IsConsumed());
    EXPECT_EQ((*created)->GetDaoId(), DaoFactory::DeriveDaoId("GOV_TOKEN"));
    EXPECT_EQ((*created)->GetConfig(), config_);
    EXPECT_TRUE(factory.IsRegistered("GOV_TOKEN"));
    EXPECT_EQ(factory.GetDaoCount(), 1u);

    auto event = sink_->Last<DaoCreated>();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->tokenType, "GOV_TOKEN");

    DaoWitness second("GOV_TOKEN");
    auto duplicate = factory.CreateDao(std::move(second), config_);
    EXPECT_EQ(duplicate.error, GovernanceError::DuplicateWitness);
    EXPECT_FALSE(second.IsConsumed());
    EXPECT_EQ(factory.GetDaoCount(), 1u);
}

TEST_F(ActionTest, FactoryRejectsUsedWitness) {
    DaoFactory factory(clock_, ledger_, nullptr);
    DaoWitness original("A_TOKEN");
    DaoWitness holder = std::move(original);
    EXPECT_TRUE(original.IsConsumed());

    EXPECT_EQ(factory.CreateDao(std::move(original), config_).error,
              GovernanceError::DuplicateWitness);
    EXPECT_TRUE(factory.CreateDao(std::move(holder), config_).IsValid());
    EXPECT_EQ(factory.CreateDao(std::move(holder), config_).error,
              GovernanceError::DuplicateWitness);
}

TEST_F(ActionTest, FactoryValidatesConfigFirst) {
    DaoFactory factory(clock_, ledger_, sink_);
    DaoConfig bad = config_;
    bad.minActionDelay = 0;

    DaoWitness witness("B_TOKEN");
    auto result = factory.CreateDao(std::move(witness), bad);
    EXPECT_EQ(result.error, GovernanceError::ZeroMinActionDelay);
    EXPECT_FALSE(witness.IsConsumed());
    EXPECT_FALSE(factory.IsRegistered("B_TOKEN"));
    EXPECT_EQ(sink_->CountOf<DaoCreated>(), 0u);
}

TEST_F(ActionTest, FactoryRequiresClockAndCustody) {
    EXPECT_THROW(DaoFactory(nullptr, ledger_, sink_), std::invalid_argument);
    EXPECT_THROW(DaoFactory(clock_, nullptr, sink_), std::invalid_argument);
}

TEST_F(ActionTest, DeriveDaoId) {
    EXPECT_EQ(DaoFactory::DeriveDaoId("X"), DaoFactory::DeriveDaoId("X"));
    EXPECT_NE(DaoFactory::DeriveDaoId("X"), DaoFactory::DeriveDaoId("Y"));
    EXPECT_EQ(static_cast<const Hash256&>(DaoFactory::DeriveDaoId("X")), SHA256Hash("X"));
}
