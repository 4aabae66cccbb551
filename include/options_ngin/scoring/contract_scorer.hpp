// include/options_ngin/scoring/contract_scorer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/error.hpp"
#include "options_ngin/pricing/black_scholes.hpp"
#include "options_ngin/scoring/opportunity_record.hpp"
#include "options_ngin/sentiment/sentiment_aggregator.hpp"

namespace options_ngin {
namespace scoring {

/**
 * @brief Weights and thresholds of the opportunity score
 *
 * composite = 100 * tanh(gap / gap_scale) *
 *             (gap_weight + liquidity_weight * L + spread_weight * (1 - S)
 *              + sentiment_weight * A)
 *
 * The four weights must sum to 1 so |composite| <= 100.
 */
struct ScoringConfig : public ConfigBase {
    double gap_weight{0.4};
    double liquidity_weight{0.2};
    double spread_weight{0.2};
    double sentiment_weight{0.2};

    double gap_scale{0.5};
    double min_market_price{0.01};  // denominator floor of the pricing gap
    double liquidity_saturation{5000.0};
    double max_spread_ratio{5.0};

    double favor_threshold{25.0};
    double avoid_threshold{25.0};  // applied as composite <= -avoid_threshold

    // Risk flag
    double min_liquidity{10.0};
    double max_spread_ceiling{1.0};
    double min_time_to_expiry_years{1.0 / 365.0};

    std::string version{"1.0.0"};

    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;

    /**
     * @return INVALID_ARGUMENT if weights are negative or do not sum to 1,
     *         or a scale/threshold is not positive
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Fuses mispricing, microstructure and sentiment into an OpportunityRecord
 *
 * Scoring is a pure function of its three inputs and the config. Inputs that
 * do not belong together (a theoretical result for another contract,
 * sentiment for another ticker, a non-finite fair value) are programming
 * errors and throw TradeError with CONTRACT_VIOLATION.
 */
class ContractScorer {
public:
    explicit ContractScorer(ScoringConfig config = ScoringConfig());
    virtual ~ContractScorer() = default;

    virtual OpportunityRecord score(const Contract& contract,
                                    const pricing::TheoreticalResult& theo,
                                    const sentiment::SentimentSummary& sentiment) const;

    const ScoringConfig& config() const {
        return config_;
    }

private:
    ScoringConfig config_;
};

/**
 * @brief Strict weak order used for ranking
 *
 * Larger |composite| first, then larger raw liquidity, then nearer
 * expiration, then (ticker, kind, strike, contract symbol).
 */
bool ranks_before(const OpportunityRecord& a, const OpportunityRecord& b);

/**
 * @brief Sort records into rank order; the result does not depend on input order
 */
void rank_records(std::vector<OpportunityRecord>& records);

}  // namespace scoring
}  // namespace options_ngin
