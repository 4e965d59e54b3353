// AGORA - Quorum Math Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/quorum.h>

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace agora {
namespace governance {

namespace {

using uint128 = unsigned __int128;

FixedPoint DivDownWide(uint128 numerator, uint128 denominator) {
    uint128 result = numerator * QUORUM_RATE_SCALE / denominator;
    if (result > std::numeric_limits<FixedPoint>::max()) {
        return std::numeric_limits<FixedPoint>::max();
    }
    return static_cast<FixedPoint>(result);
}

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

FixedPoint DivDown(uint64_t numerator, uint64_t denominator) {
    if (denominator == 0) {
        throw std::domain_error("DivDown: zero denominator");
    }
    return DivDownWide(numerator, denominator);
}

bool HasQuorum(Amount forVotes, Amount againstVotes,
               Amount quorumVotes, FixedPoint quorumRate) {
    if (forVotes <= againstVotes) {
        return false;
    }
    if (forVotes < quorumVotes) {
        return false;
    }

    // The sum of two amounts may exceed 64 bits
    uint128 total = static_cast<uint128>(forVotes) + againstVotes;
    if (total == 0) {
        return false;
    }
    return quorumRate <= DivDownWide(forVotes, total);
}

std::string FormatQuorumRate(FixedPoint rate) {
    // Hundredths of a percent, truncated
    uint64_t hundredths = rate / (QUORUM_RATE_PERCENT / 100);
    std::ostringstream oss;
    oss << hundredths / 100 << '.' << std::setfill('0') << std::setw(2)
        << hundredths % 100 << '%';
    return oss.str();
}

std::optional<FixedPoint> ParseQuorumRate(const std::string& str) {
    std::string s = Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }

    if (s.back() != '%') {
        if (!AllDigits(s) || s.size() > 19) {
            return std::nullopt;
        }
        return static_cast<FixedPoint>(std::stoull(s));
    }

    s = Trim(s.substr(0, s.size() - 1));
    std::string whole = s;
    std::string fraction;
    size_t dot = s.find('.');
    if (dot != std::string::npos) {
        whole = s.substr(0, dot);
        fraction = s.substr(dot + 1);
        if (!AllDigits(fraction)) {
            return std::nullopt;
        }
    }
    // 1% is 1e7 on the quorum scale, so at most seven fractional digits
    if (!AllDigits(whole) || whole.size() > 6 || fraction.size() > 7) {
        return std::nullopt;
    }

    FixedPoint result = std::stoull(whole) * QUORUM_RATE_PERCENT;
    FixedPoint unit = QUORUM_RATE_PERCENT;
    for (char c : fraction) {
        unit /= 10;
        result += static_cast<FixedPoint>(c - '0') * unit;
    }
    return result;
}

} // namespace governance
} // namespace agora
