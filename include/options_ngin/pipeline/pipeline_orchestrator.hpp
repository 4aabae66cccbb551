// include/options_ngin/pipeline/pipeline_orchestrator.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/data/market_data_provider.hpp"
#include "options_ngin/data/news_provider.hpp"
#include "options_ngin/pipeline/pipeline_config.hpp"
#include "options_ngin/pipeline/run_result.hpp"
#include "options_ngin/scoring/contract_scorer.hpp"
#include "options_ngin/sentiment/sentiment_aggregator.hpp"
#include "options_ngin/sentiment/sentiment_model.hpp"

namespace options_ngin {

/**
 * @brief Runs the scan: fetch, summarize sentiment, price, score, rank
 *
 * Tickers are processed by up to max_workers threads. Each ticker is
 * independent: any upstream failure is recorded in its TickerReport and
 * the run completes. A scorer CONTRACT_VIOLATION is a bug, not an upstream
 * failure: it stops the remaining tickers and fails the whole run.
 */
class PipelineOrchestrator {
public:
    /**
     * @param model Classifier handed to the sentiment aggregator of each run,
     *              may be null (lexicon only)
     * @param scorer Contract scorer, null builds one from config.scoring
     */
    PipelineOrchestrator(PipelineConfig config, std::shared_ptr<MarketDataProvider> market_data,
                         std::shared_ptr<NewsProvider> news,
                         std::shared_ptr<sentiment::SentimentModel> model,
                         std::shared_ptr<const scoring::ContractScorer> scorer = nullptr);

    /**
     * @brief Validate the configuration and run the pricing self-test
     * @return INVALID_ARGUMENT for a bad config or missing provider,
     *         SELF_TEST_FAILED if the pricing engine is off
     */
    Result<void> initialize();

    /**
     * @brief Scan the configured tickers
     */
    Result<RunResult> run();

    /**
     * @brief Scan the given tickers
     * @return NOT_INITIALIZED before initialize(), the sentiment setup error,
     *         or CONTRACT_VIOLATION if the scorer rejected its inputs
     */
    Result<RunResult> run(const std::vector<std::string>& tickers);

    /**
     * @brief Stop starting new tickers; in-flight tickers finish normally
     *
     * Safe to call from any thread. The request is cleared when the run ends.
     */
    void cancel();

    bool is_cancel_requested() const {
        return cancel_requested_.load(std::memory_order_acquire);
    }

    const PipelineConfig& config() const {
        return config_;
    }

    /**
     * @brief Trim and upper-case a ticker; nullopt if it is not a plausible symbol
     */
    static std::optional<std::string> normalize_ticker(const std::string& raw);

    /**
     * @brief Empty string if the contract can be priced, otherwise the rejection reason
     */
    static std::string validate_contract(const Contract& contract, const std::string& ticker);

private:
    TickerReport process_ticker(const std::string& ticker,
                                sentiment::SentimentAggregator& aggregator) const;
    void score_chain(const Quote& quote, const std::vector<Contract>& chain,
                     const sentiment::SentimentSummary& summary, TickerReport& report) const;
    bool should_stop(std::chrono::steady_clock::time_point deadline) const;
    static TickerReport failed_ticker_report(const std::string& ticker, const std::string& what);

    PipelineConfig config_;
    std::shared_ptr<MarketDataProvider> market_data_;
    std::shared_ptr<NewsProvider> news_;
    std::shared_ptr<sentiment::SentimentModel> model_;
    std::shared_ptr<const scoring::ContractScorer> scorer_;

    std::atomic<bool> cancel_requested_{false};
    bool initialized_{false};
};

}  // namespace options_ngin
