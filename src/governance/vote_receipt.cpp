// AGORA - Vote Receipt Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/vote_receipt.h>

#include <sstream>

namespace agora {
namespace governance {

const char* VoteSideToString(VoteSide side) {
    switch (side) {
        case VoteSide::For: return "For";
        case VoteSide::Against: return "Against";
        default: return "Unknown";
    }
}

VoteReceipt::VoteReceipt(VoteReceipt&& other) noexcept
    : id_(other.id_), daoId_(other.daoId_), proposalId_(other.proposalId_),
      voter_(other.voter_), stakedAmount_(other.stakedAmount_),
      side_(other.side_), endTime_(other.endTime_) {
    other.Clear();
}

VoteReceipt& VoteReceipt::operator=(VoteReceipt&& other) noexcept {
    if (this != &other) {
        id_ = other.id_;
        daoId_ = other.daoId_;
        proposalId_ = other.proposalId_;
        voter_ = other.voter_;
        stakedAmount_ = other.stakedAmount_;
        side_ = other.side_;
        endTime_ = other.endTime_;
        other.Clear();
    }
    return *this;
}

void VoteReceipt::Clear() {
    id_.SetNull();
    daoId_.SetNull();
    proposalId_.SetNull();
    voter_.SetNull();
    stakedAmount_ = 0;
    side_ = VoteSide::For;
    endTime_ = 0;
}

std::string VoteReceipt::ToString() const {
    std::ostringstream oss;
    oss << "VoteReceipt(" << id_.ToHex().substr(0, 16)
        << " proposal=" << proposalId_.ToHex().substr(0, 16)
        << " " << VoteSideToString(side_)
        << " stake=" << stakedAmount_ << ")";
    return oss.str();
}

} // namespace governance
} // namespace agora
