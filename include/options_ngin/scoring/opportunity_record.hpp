// include/options_ngin/scoring/opportunity_record.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "options_ngin/core/types.hpp"

namespace options_ngin {
namespace scoring {

/**
 * @brief Recommendation bucket of a scored contract
 */
enum class Recommendation { FAVOR, NEUTRAL, AVOID };

inline std::string recommendation_to_string(Recommendation rec) {
    switch (rec) {
        case Recommendation::FAVOR:
            return "favor";
        case Recommendation::AVOID:
            return "avoid";
        default:
            return "neutral";
    }
}

/**
 * @brief Reasons attached to a scored contract, as a bitmask
 *
 * The first three set the risk flag; the others are informational.
 */
enum class RiskReason : uint32_t {
    NONE = 0,
    LOW_LIQUIDITY = 1 << 0,
    WIDE_SPREAD = 1 << 1,  // also set when bid/ask is missing
    NEAR_EXPIRY = 1 << 2,
    NO_MARKET_PRICE = 1 << 3,
    MISSING_VOLATILITY = 1 << 4,
};

inline RiskReason operator|(RiskReason a, RiskReason b) {
    return static_cast<RiskReason>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline RiskReason& operator|=(RiskReason& a, RiskReason b) {
    a = a | b;
    return a;
}

inline bool has_reason(RiskReason mask, RiskReason reason) {
    return (static_cast<uint32_t>(mask) & static_cast<uint32_t>(reason)) != 0;
}

constexpr RiskReason FLAGGING_REASONS = static_cast<RiskReason>(
    static_cast<uint32_t>(RiskReason::LOW_LIQUIDITY) |
    static_cast<uint32_t>(RiskReason::WIDE_SPREAD) |
    static_cast<uint32_t>(RiskReason::NEAR_EXPIRY));

/**
 * @brief Reason names in bit order, e.g. {"low_liquidity", "wide_spread"}
 */
std::vector<std::string> risk_reasons_to_strings(RiskReason mask);

/**
 * @brief Semicolon-joined reason names, empty when none
 */
std::string risk_reasons_to_string(RiskReason mask);

/**
 * @brief Scored contract
 */
struct OpportunityRecord {
    ContractId id;
    std::string contract_symbol;

    // Inputs
    double market_price{0.0};
    double theoretical_value{0.0};
    double delta{0.0};
    double vega{0.0};
    double time_to_expiry_years{0.0};
    double implied_volatility{0.0};  // volatility used for pricing, 0 if unusable

    // Factors
    double pricing_gap{0.0};
    double gap_term{0.0};
    double raw_liquidity{0.0};  // log1p(volume + open_interest)
    double liquidity_term{0.0};
    double spread_penalty{1.0};
    double sentiment_mean{0.0};
    double sentiment_alignment{0.5};

    // Outputs
    double composite_score{0.0};
    int confidence{50};
    bool risk_flag{false};
    RiskReason risk_reasons{RiskReason::NONE};
    Recommendation recommendation{Recommendation::NEUTRAL};
    Side side{Side::NONE};
};

}  // namespace scoring
}  // namespace options_ngin
