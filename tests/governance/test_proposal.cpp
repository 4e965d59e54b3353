// AGORA - Proposal State Machine Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/governance/proposal.h>
#include <agora/governance/quorum.h>
#include <agora/db/database.h>

using namespace agora;
using namespace agora::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class ProposalTest : public ::testing::Test {
protected:
    void SetUp() override {
        proposal_.startTime = 1000;
        proposal_.endTime = 6000;
        proposal_.actionDelay = 2000;
        proposal_.quorumVotes = 100;
        proposal_.quorumRate = QUORUM_RATE_SCALE / 2;

        ConfigUpdate update;
        update.votingPeriod = 9000;
        proposal_.payload = ActionPayload(update);
    }

    /// Vote 150 for during the window and queue at 7000 (eta 9000)
    void PassAndQueue() {
        ASSERT_EQ(proposal_.AddVote(VoteSide::For, 150, 1500), GovernanceError::None);
        ASSERT_EQ(proposal_.Queue(7000), GovernanceError::None);
    }

    Proposal proposal_;
};

// ============================================================================
// State Derivation
// ============================================================================

TEST_F(ProposalTest, StateToString) {
    EXPECT_STREQ(ProposalStateToString(ProposalState::Pending), "Pending");
    EXPECT_STREQ(ProposalStateToString(ProposalState::Executable), "Executable");
    EXPECT_STREQ(ProposalStateToString(ProposalState::Extracted), "Extracted");
}

TEST_F(ProposalTest, VotingWindowIsInclusive) {
    EXPECT_EQ(proposal_.GetState(0), ProposalState::Pending);
    EXPECT_EQ(proposal_.GetState(999), ProposalState::Pending);
    EXPECT_EQ(proposal_.GetState(1000), ProposalState::Active);
    EXPECT_EQ(proposal_.GetState(6000), ProposalState::Active);
    EXPECT_EQ(proposal_.GetState(6001), ProposalState::Defeated);
}

TEST_F(ProposalTest, DefeatedWithoutQuorum) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 60, 2000), GovernanceError::None);
    ASSERT_EQ(proposal_.AddVote(VoteSide::Against, 40, 2000), GovernanceError::None);
    // 60 for is below the 100 absolute quorum
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Defeated);
}

TEST_F(ProposalTest, DefeatedBelowRate) {
    proposal_.quorumVotes = 1;
    proposal_.quorumRate = QUORUM_RATE_SCALE / 10 * 6;
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 51, 2000), GovernanceError::None);
    ASSERT_EQ(proposal_.AddVote(VoteSide::Against, 49, 2000), GovernanceError::None);
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Defeated);

    proposal_.quorumRate = QUORUM_RATE_SCALE / 2;
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Agreed);
}

TEST_F(ProposalTest, DefeatedOnTie) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 200, 2000), GovernanceError::None);
    ASSERT_EQ(proposal_.AddVote(VoteSide::Against, 200, 2000), GovernanceError::None);
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Defeated);
}

TEST_F(ProposalTest, AgreedQueuedExecutableExtracted) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 150, 1500), GovernanceError::None);
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Agreed);

    ASSERT_EQ(proposal_.Queue(7000), GovernanceError::None);
    EXPECT_EQ(proposal_.eta, 9000u);
    EXPECT_EQ(proposal_.GetState(8999), ProposalState::Queued);
    EXPECT_EQ(proposal_.GetState(9000), ProposalState::Executable);

    auto payload = proposal_.Extract(9000);
    ASSERT_TRUE(payload.IsValid());
    EXPECT_EQ(GetActionKind(*payload), ActionKind::ConfigUpdate);
    EXPECT_FALSE(proposal_.payload.has_value());
    EXPECT_EQ(proposal_.GetState(9000), ProposalState::Extracted);
}

TEST_F(ProposalTest, StateNeverRegresses) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 150, 1500), GovernanceError::None);

    ProposalState last = ProposalState::Pending;
    for (Timestamp t = 0; t <= 12000; t += 250) {
        if (t == 7000) {
            ASSERT_EQ(proposal_.Queue(t), GovernanceError::None);
        }
        if (t == 10000) {
            ASSERT_TRUE(proposal_.Extract(t).IsValid());
        }
        ProposalState state = proposal_.GetState(t);
        EXPECT_GE(static_cast<int>(state), static_cast<int>(last)) << "at " << t;
        last = state;
    }
    EXPECT_EQ(last, ProposalState::Extracted);
}

TEST_F(ProposalTest, SignalOnlyProposalSkipsExecutable) {
    proposal_.payload.reset();
    PassAndQueue();
    EXPECT_EQ(proposal_.GetState(8999), ProposalState::Queued);
    EXPECT_EQ(proposal_.GetState(9000), ProposalState::Extracted);
    EXPECT_FALSE(proposal_.GetActionKind().has_value());

    auto result = proposal_.Extract(9000);
    EXPECT_EQ(result.error, GovernanceError::CannotExecuteProposal);
}

TEST_F(ProposalTest, ExecutableAfterSaturates) {
    EXPECT_EQ(proposal_.GetExecutableAfter(), 8000u);

    proposal_.endTime = MAX_AMOUNT - 1;
    EXPECT_EQ(proposal_.GetExecutableAfter(), MAX_AMOUNT);
}

// ============================================================================
// Voting
// ============================================================================

TEST_F(ProposalTest, AddVoteOutsideWindow) {
    EXPECT_EQ(proposal_.AddVote(VoteSide::For, 10, 999), GovernanceError::ProposalNotActive);
    EXPECT_EQ(proposal_.AddVote(VoteSide::For, 10, 6001), GovernanceError::ProposalNotActive);
    EXPECT_EQ(proposal_.forVotes, 0u);
}

TEST_F(ProposalTest, AddZeroVote) {
    EXPECT_EQ(proposal_.AddVote(VoteSide::For, 0, 2000), GovernanceError::ZeroStakeRejected);
}

TEST_F(ProposalTest, AddVoteOverflow) {
    proposal_.forVotes = MAX_AMOUNT - 10;
    proposal_.againstVotes = 5;
    EXPECT_EQ(proposal_.AddVote(VoteSide::Against, 6, 2000), GovernanceError::VoteOverflow);
    EXPECT_EQ(proposal_.againstVotes, 5u);
    EXPECT_EQ(proposal_.AddVote(VoteSide::Against, 5, 2000), GovernanceError::None);
}

TEST_F(ProposalTest, MoveVote) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 100, 2000), GovernanceError::None);
    ASSERT_EQ(proposal_.MoveVote(VoteSide::For, 30, 2000), GovernanceError::None);
    EXPECT_EQ(proposal_.GetVotes(VoteSide::For), 70u);
    EXPECT_EQ(proposal_.GetVotes(VoteSide::Against), 30u);

    EXPECT_EQ(proposal_.MoveVote(VoteSide::Against, 31, 2000), GovernanceError::VoteOverflow);
    EXPECT_EQ(proposal_.MoveVote(VoteSide::For, 10, 6001), GovernanceError::ProposalNotActive);
    EXPECT_EQ(proposal_.forVotes + proposal_.againstVotes, 100u);
}

TEST_F(ProposalTest, RemoveVote) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::Against, 40, 2000), GovernanceError::None);
    EXPECT_EQ(proposal_.RemoveVote(VoteSide::Against, 41, 2000), GovernanceError::VoteOverflow);
    EXPECT_EQ(proposal_.RemoveVote(VoteSide::Against, 40, 2000), GovernanceError::None);
    EXPECT_EQ(proposal_.againstVotes, 0u);
}

// ============================================================================
// Execution Pipeline
// ============================================================================

TEST_F(ProposalTest, QueueRequiresAgreed) {
    EXPECT_EQ(proposal_.Queue(3000), GovernanceError::ProposalNotPassed);
    EXPECT_EQ(proposal_.Queue(7000), GovernanceError::ProposalNotPassed);
    EXPECT_EQ(proposal_.eta, 0u);
}

TEST_F(ProposalTest, QueueTwiceFails) {
    PassAndQueue();
    EXPECT_EQ(proposal_.Queue(7500), GovernanceError::ProposalNotPassed);
    EXPECT_EQ(proposal_.eta, 9000u);
}

TEST_F(ProposalTest, QueueOverflow) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 150, 1500), GovernanceError::None);
    proposal_.actionDelay = MAX_AMOUNT;
    EXPECT_EQ(proposal_.Queue(7000), GovernanceError::ArithmeticOverflow);
    EXPECT_EQ(proposal_.GetState(7000), ProposalState::Agreed);
}

TEST_F(ProposalTest, ExtractBeforeEta) {
    PassAndQueue();
    auto result = proposal_.Extract(8999);
    EXPECT_EQ(result.error, GovernanceError::CannotExecuteProposal);
    EXPECT_TRUE(proposal_.payload.has_value());
}

TEST_F(ProposalTest, ExtractTooEarly) {
    ASSERT_EQ(proposal_.AddVote(VoteSide::For, 150, 1500), GovernanceError::None);
    // eta set below endTime + actionDelay, as a restored record could be
    proposal_.eta = 6500;
    ASSERT_EQ(proposal_.GetState(7000), ProposalState::Executable);

    auto result = proposal_.Extract(7000);
    EXPECT_EQ(result.error, GovernanceError::TooEarlyToExecute);
    EXPECT_TRUE(proposal_.payload.has_value());
    EXPECT_TRUE(proposal_.Extract(8000).IsValid());
}

TEST_F(ProposalTest, ExtractOnlyOnce) {
    PassAndQueue();
    ASSERT_TRUE(proposal_.Extract(9000).IsValid());
    EXPECT_EQ(proposal_.Extract(9001).error, GovernanceError::CannotExecuteProposal);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(ProposalTest, SerializationKeepsPayload) {
    proposal_.forVotes = 150;
    proposal_.eta = 9000;

    Proposal restored;
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(proposal_), restored));
    EXPECT_EQ(restored.endTime, 6000u);
    EXPECT_EQ(restored.forVotes, 150u);
    EXPECT_EQ(restored.eta, 9000u);
    EXPECT_EQ(restored.quorumRate, proposal_.quorumRate);
    ASSERT_TRUE(restored.payload.has_value());
    EXPECT_EQ(std::get<ConfigUpdate>(*restored.payload).votingPeriod,
              std::optional<Duration>(9000));
}

TEST_F(ProposalTest, UnknownActionKindIsRejected) {
    proposal_.payload.reset();
    std::string data = db::SerializeToString(proposal_);
    // Presence byte set, then a kind byte that names no action
    data.back() = '\x01';
    data.push_back('\x07');

    Proposal restored;
    EXPECT_FALSE(db::DeserializeFromString(data, restored));
}
