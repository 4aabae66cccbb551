// include/options_ngin/pipeline/pipeline_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/data/news_provider.hpp"
#include "options_ngin/scoring/contract_scorer.hpp"
#include "options_ngin/sentiment/sentiment_aggregator.hpp"

namespace options_ngin {

/**
 * @brief Configuration of a scan run
 */
struct PipelineConfig : public ConfigBase {
    std::vector<std::string> tickers;
    size_t max_expirations{6};
    double risk_free_rate{0.045};
    size_t headline_count{100};
    NewsSource news_source{NewsSource::TICKER};
    std::string news_query{"SPY OR S&P 500"};
    size_t top_per_ticker{0};  // 0 keeps every record
    size_t max_workers{3};
    int fetch_timeout_ms{30000};
    int run_timeout_ms{0};  // 0 disables the run deadline

    scoring::ScoringConfig scoring;
    sentiment::SentimentConfig sentiment;

    std::string version{"1.0.0"};

    /**
     * @brief Check ranges and the nested configs
     * @return INVALID_ARGUMENT describing the first problem found
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace options_ngin
