// AGORA - Vote Receipt
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// A staker's position on one proposal. The receipt exclusively owns the
// locked stake: it cannot be copied, only moved, and only the governance
// facade (or the database restoring a stashed receipt) can create one.

#ifndef AGORA_GOVERNANCE_VOTE_RECEIPT_H
#define AGORA_GOVERNANCE_VOTE_RECEIPT_H

#include <agora/core/serialize.h>
#include <agora/core/types.h>

#include <string>

namespace agora {

namespace db {
class GovernanceDB;
}

namespace governance {

class Governance;

/// Side of a vote
enum class VoteSide : uint8_t {
    For = 0,
    Against = 1
};

/// Convert vote side to string
const char* VoteSideToString(VoteSide side);

/// The other side
inline VoteSide Opposite(VoteSide side) {
    return side == VoteSide::For ? VoteSide::Against : VoteSide::For;
}

class VoteReceipt {
public:
    VoteReceipt(const VoteReceipt&) = delete;
    VoteReceipt& operator=(const VoteReceipt&) = delete;

    /// Moving transfers the stake; the source is left empty
    VoteReceipt(VoteReceipt&& other) noexcept;
    VoteReceipt& operator=(VoteReceipt&& other) noexcept;

    ~VoteReceipt() = default;

    const ReceiptId& GetId() const { return id_; }
    const DaoId& GetDaoId() const { return daoId_; }
    const ProposalId& GetProposalId() const { return proposalId_; }
    const Address& GetVoter() const { return voter_; }
    Amount GetStakedAmount() const { return stakedAmount_; }
    VoteSide GetSide() const { return side_; }

    /// End of the proposal's voting window, copied at cast time
    Timestamp GetEndTime() const { return endTime_; }

    /// True once moved from or consumed
    bool IsEmpty() const { return stakedAmount_ == 0; }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, id_);
        Serialize(s, daoId_);
        Serialize(s, proposalId_);
        Serialize(s, voter_);
        ser_writedata64(s, stakedAmount_);
        ser_writedata8(s, static_cast<uint8_t>(side_));
        ser_writedata64(s, endTime_);
    }

private:
    friend class Governance;
    friend class db::GovernanceDB;

    VoteReceipt() = default;

    VoteReceipt(const ReceiptId& id, const DaoId& daoId, const ProposalId& proposalId,
                const Address& voter, Amount stake, VoteSide side, Timestamp endTime)
        : id_(id), daoId_(daoId), proposalId_(proposalId), voter_(voter),
          stakedAmount_(stake), side_(side), endTime_(endTime) {}

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, id_);
        Unserialize(s, daoId_);
        Unserialize(s, proposalId_);
        Unserialize(s, voter_);
        stakedAmount_ = ser_readdata64(s);
        uint8_t side = ser_readdata8(s);
        if (side > static_cast<uint8_t>(VoteSide::Against)) {
            throw std::ios_base::failure("invalid vote side");
        }
        side_ = static_cast<VoteSide>(side);
        endTime_ = ser_readdata64(s);
    }

    /// Flip the side in place
    void SetSide(VoteSide side) { side_ = side; }

    /// Clear the receipt once its stake has been released
    void Clear();

    ReceiptId id_;
    DaoId daoId_;
    ProposalId proposalId_;
    Address voter_;
    Amount stakedAmount_{0};
    VoteSide side_{VoteSide::For};
    Timestamp endTime_{0};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_VOTE_RECEIPT_H
