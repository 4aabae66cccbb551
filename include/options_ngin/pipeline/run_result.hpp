// include/options_ngin/pipeline/run_result.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/types.hpp"
#include "options_ngin/scoring/opportunity_record.hpp"
#include "options_ngin/sentiment/sentiment_aggregator.hpp"

namespace options_ngin {

enum class TickerStatus {
    OK,
    SKIPPED,             // invalid ticker, or quote/chain unavailable
    DEGRADED_SENTIMENT,  // scored, but headlines failed or the classifier fell back
    CANCELLED            // never started
};

inline std::string ticker_status_to_string(TickerStatus status) {
    switch (status) {
        case TickerStatus::OK:
            return "ok";
        case TickerStatus::SKIPPED:
            return "skipped";
        case TickerStatus::DEGRADED_SENTIMENT:
            return "degraded_sentiment";
        case TickerStatus::CANCELLED:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of one ticker
 */
struct TickerReport {
    std::string ticker;
    TickerStatus status{TickerStatus::OK};
    std::vector<std::string> reasons;   // why the ticker was skipped or cancelled
    std::vector<std::string> warnings;  // recovered problems
    std::optional<Quote> quote;
    sentiment::SentimentSummary sentiment;
    size_t contracts_received{0};
    size_t contracts_rejected{0};
    std::vector<scoring::OpportunityRecord> records;  // ranked

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a run
 */
struct RunResult {
    std::vector<scoring::OpportunityRecord> records;  // globally ranked
    std::map<std::string, TickerReport> reports;
    Timestamp started_at;
    Timestamp finished_at;
    bool cancelled{false};

    size_t count_with_status(TickerStatus status) const;

    nlohmann::json to_json() const;
};

}  // namespace options_ngin
