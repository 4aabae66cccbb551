// src/scoring/contract_scorer.cpp
#include "options_ngin/scoring/contract_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>
#include <utility>

namespace options_ngin {
namespace scoring {

namespace {

double sign(double x) {
    return (x > 0.0) - (x < 0.0);
}

}  // namespace

std::vector<std::string> risk_reasons_to_strings(RiskReason mask) {
    std::vector<std::string> names;
    if (has_reason(mask, RiskReason::LOW_LIQUIDITY))
        names.emplace_back("low_liquidity");
    if (has_reason(mask, RiskReason::WIDE_SPREAD))
        names.emplace_back("wide_spread");
    if (has_reason(mask, RiskReason::NEAR_EXPIRY))
        names.emplace_back("near_expiry");
    if (has_reason(mask, RiskReason::NO_MARKET_PRICE))
        names.emplace_back("no_market_price");
    if (has_reason(mask, RiskReason::MISSING_VOLATILITY))
        names.emplace_back("missing_volatility");
    return names;
}

std::string risk_reasons_to_string(RiskReason mask) {
    std::string joined;
    for (const auto& name : risk_reasons_to_strings(mask)) {
        if (!joined.empty()) {
            joined += ";";
        }
        joined += name;
    }
    return joined;
}

Result<void> ScoringConfig::validate() const {
    const double weights[] = {gap_weight, liquidity_weight, spread_weight, sentiment_weight};
    double total = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Scoring weights must be finite and non-negative",
                                    "ScoringConfig");
        }
        total += w;
    }
    if (std::abs(total - 1.0) > WEIGHT_SUM_TOLERANCE) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Scoring weights must sum to 1, got " + std::to_string(total),
                                "ScoringConfig");
    }

    const std::pair<const char*, double> positives[] = {
        {"gap_scale", gap_scale},
        {"min_market_price", min_market_price},
        {"liquidity_saturation", liquidity_saturation},
        {"max_spread_ratio", max_spread_ratio},
        {"favor_threshold", favor_threshold},
        {"avoid_threshold", avoid_threshold},
        {"max_spread_ceiling", max_spread_ceiling},
    };
    for (const auto& entry : positives) {
        if (!std::isfinite(entry.second) || entry.second <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    std::string(entry.first) + " must be positive",
                                    "ScoringConfig");
        }
    }

    if (!std::isfinite(min_liquidity) || min_liquidity < 0.0 ||
        !std::isfinite(min_time_to_expiry_years) || min_time_to_expiry_years < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk flag thresholds must be finite and non-negative",
                                "ScoringConfig");
    }
    return Result<void>();
}

nlohmann::json ScoringConfig::to_json() const {
    nlohmann::json j;
    j["weights"] = {{"gap", gap_weight},
                    {"liquidity", liquidity_weight},
                    {"spread", spread_weight},
                    {"sentiment", sentiment_weight}};
    j["gap_scale"] = gap_scale;
    j["min_market_price"] = min_market_price;
    j["liquidity_saturation"] = liquidity_saturation;
    j["max_spread_ratio"] = max_spread_ratio;
    j["favor_threshold"] = favor_threshold;
    j["avoid_threshold"] = avoid_threshold;
    j["min_liquidity"] = min_liquidity;
    j["max_spread_ceiling"] = max_spread_ceiling;
    j["min_time_to_expiry_years"] = min_time_to_expiry_years;
    j["version"] = version;
    return j;
}

void ScoringConfig::from_json(const nlohmann::json& j) {
    if (j.contains("weights")) {
        const auto& w = j.at("weights");
        if (w.contains("gap"))
            gap_weight = w.at("gap").get<double>();
        if (w.contains("liquidity"))
            liquidity_weight = w.at("liquidity").get<double>();
        if (w.contains("spread"))
            spread_weight = w.at("spread").get<double>();
        if (w.contains("sentiment"))
            sentiment_weight = w.at("sentiment").get<double>();
    }
    if (j.contains("gap_scale"))
        gap_scale = j.at("gap_scale").get<double>();
    if (j.contains("min_market_price"))
        min_market_price = j.at("min_market_price").get<double>();
    if (j.contains("liquidity_saturation"))
        liquidity_saturation = j.at("liquidity_saturation").get<double>();
    if (j.contains("max_spread_ratio"))
        max_spread_ratio = j.at("max_spread_ratio").get<double>();
    if (j.contains("favor_threshold"))
        favor_threshold = j.at("favor_threshold").get<double>();
    if (j.contains("avoid_threshold"))
        avoid_threshold = j.at("avoid_threshold").get<double>();
    if (j.contains("min_liquidity"))
        min_liquidity = j.at("min_liquidity").get<double>();
    if (j.contains("max_spread_ceiling"))
        max_spread_ceiling = j.at("max_spread_ceiling").get<double>();
    if (j.contains("min_time_to_expiry_years"))
        min_time_to_expiry_years = j.at("min_time_to_expiry_years").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

ContractScorer::ContractScorer(ScoringConfig config) : config_(std::move(config)) {}

OpportunityRecord ContractScorer::score(const Contract& contract,
                                        const pricing::TheoreticalResult& theo,
                                        const sentiment::SentimentSummary& sentiment) const {
    if (theo.id != contract.id) {
        throw TradeError(ErrorCode::CONTRACT_VIOLATION,
                         "Theoretical result does not belong to contract " +
                             contract.contract_symbol,
                         "ContractScorer");
    }
    if (sentiment.ticker != contract.id.ticker) {
        throw TradeError(ErrorCode::CONTRACT_VIOLATION,
                         "Sentiment for " + sentiment.ticker + " applied to a " +
                             contract.id.ticker + " contract",
                         "ContractScorer");
    }
    if (!std::isfinite(theo.fair_value) || !std::isfinite(theo.time_to_expiry_years) ||
        !std::isfinite(sentiment.mean)) {
        throw TradeError(ErrorCode::CONTRACT_VIOLATION,
                         "Non-finite scoring input for " + contract.contract_symbol,
                         "ContractScorer");
    }

    OpportunityRecord rec;
    rec.id = contract.id;
    rec.contract_symbol = contract.contract_symbol;
    rec.market_price = contract.market_price();
    rec.theoretical_value = theo.fair_value;
    rec.delta = theo.greeks.delta;
    rec.vega = theo.greeks.vega;
    rec.time_to_expiry_years = theo.time_to_expiry_years;
    rec.implied_volatility = theo.volatility;
    rec.sentiment_mean = sentiment.mean;

    RiskReason reasons = RiskReason::NONE;
    if (rec.market_price <= 0.0) {
        reasons |= RiskReason::NO_MARKET_PRICE;
    }
    if (!contract.usable_volatility()) {
        reasons |= RiskReason::MISSING_VOLATILITY;
    }

    // 1. Pricing gap
    rec.pricing_gap = (rec.theoretical_value - rec.market_price) /
                      std::max(rec.market_price, config_.min_market_price);
    rec.gap_term = std::tanh(rec.pricing_gap / config_.gap_scale);

    // 2. Liquidity
    const double activity = std::max(0.0, contract.activity());
    rec.raw_liquidity = std::log1p(activity);
    rec.liquidity_term =
        std::min(rec.raw_liquidity / std::log1p(config_.liquidity_saturation), 1.0);
    if (activity < config_.min_liquidity) {
        reasons |= RiskReason::LOW_LIQUIDITY;
    }

    // 3. Spread, a missing quote side counts as the widest spread
    if (contract.has_two_sided_market()) {
        const double mid = (*contract.bid + *contract.ask) / 2.0;
        const double ratio = (*contract.ask - *contract.bid) / mid;
        rec.spread_penalty =
            std::min(std::max(ratio, 0.0), config_.max_spread_ratio) / config_.max_spread_ratio;
        if (ratio > config_.max_spread_ceiling) {
            reasons |= RiskReason::WIDE_SPREAD;
        }
    } else {
        rec.spread_penalty = 1.0;
        reasons |= RiskReason::WIDE_SPREAD;
    }

    // 4. Underpriced calls and overpriced puts are bullish bets
    const double direction =
        contract.id.type == OptionType::CALL ? sign(rec.pricing_gap) : -sign(rec.pricing_gap);
    rec.sentiment_alignment = (1.0 + sentiment.mean * direction) / 2.0;

    // 5. Composite
    const double quality = config_.gap_weight +
                           config_.liquidity_weight * rec.liquidity_term +
                           config_.spread_weight * (1.0 - rec.spread_penalty) +
                           config_.sentiment_weight * rec.sentiment_alignment;
    rec.composite_score = 100.0 * rec.gap_term * quality;

    // 6. Risk flag
    if (rec.time_to_expiry_years < config_.min_time_to_expiry_years) {
        reasons |= RiskReason::NEAR_EXPIRY;
    }
    rec.risk_reasons = reasons;
    rec.risk_flag = has_reason(reasons, FLAGGING_REASONS);

    // 7. Bucket
    if (rec.composite_score >= config_.favor_threshold) {
        rec.recommendation = rec.risk_flag ? Recommendation::NEUTRAL : Recommendation::FAVOR;
    } else if (rec.composite_score <= -config_.avoid_threshold) {
        rec.recommendation = Recommendation::AVOID;
    } else {
        rec.recommendation = Recommendation::NEUTRAL;
    }

    // 8. Side
    if (rec.pricing_gap > 0.0) {
        rec.side = Side::BUY;
    } else if (rec.pricing_gap < 0.0) {
        rec.side = Side::SELL;
    } else {
        rec.side = Side::NONE;
    }

    // 9. Confidence
    rec.confidence = static_cast<int>(
        std::min(100L, std::max(0L, std::lround(50.0 + rec.composite_score / 2.0))));

    return rec;
}

bool ranks_before(const OpportunityRecord& a, const OpportunityRecord& b) {
    const double abs_a = std::abs(a.composite_score);
    const double abs_b = std::abs(b.composite_score);
    if (abs_a != abs_b) {
        return abs_a > abs_b;
    }
    if (a.raw_liquidity != b.raw_liquidity) {
        return a.raw_liquidity > b.raw_liquidity;
    }
    if (a.id.expiration != b.id.expiration) {
        return a.id.expiration < b.id.expiration;
    }
    return std::tie(a.id.ticker, a.id.type, a.id.strike, a.contract_symbol) <
           std::tie(b.id.ticker, b.id.type, b.id.strike, b.contract_symbol);
}

void rank_records(std::vector<OpportunityRecord>& records) {
    std::stable_sort(records.begin(), records.end(), ranks_before);
}

}  // namespace scoring
}  // namespace options_ngin
