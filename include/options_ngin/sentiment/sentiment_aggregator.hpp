// include/options_ngin/sentiment/sentiment_aggregator.hpp
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/sentiment/classifier_scorer.hpp"
#include "options_ngin/sentiment/lexicon_scorer.hpp"
#include "options_ngin/sentiment/sentiment_model.hpp"
#include "options_ngin/sentiment/text_utils.hpp"

namespace options_ngin {
namespace sentiment {

/**
 * @brief Scorer selection requested by the caller
 */
enum class SentimentMode {
    AUTO,          // Classifier first, lexicon on failure
    FALLBACK_ONLY  // Lexicon only, the model is never touched
};

inline std::string sentiment_mode_to_string(SentimentMode mode) {
    return mode == SentimentMode::AUTO ? "auto" : "fallback_only";
}

inline std::optional<SentimentMode> sentiment_mode_from_string(const std::string& text) {
    if (text == "auto")
        return SentimentMode::AUTO;
    if (text == "fallback_only" || text == "fallback-only" || text == "lexicon")
        return SentimentMode::FALLBACK_ONLY;
    return std::nullopt;
}

/**
 * @brief Which scorer the aggregator will use next
 */
enum class ScorerState {
    CLASSIFIER_PENDING,  // Model not yet loaded
    CLASSIFIER_ACTIVE,   // Model loaded and healthy
    LEXICON_ONLY         // Switched after a failure, for the rest of the run
};

struct SentimentConfig : public ConfigBase {
    SentimentMode mode{SentimentMode::AUTO};
    size_t top_k{3};
    int classifier_timeout_ms{5000};
    size_t max_text_length{DEFAULT_MAX_TEXT_LENGTH};
    std::string model_path{"config/models/headline_sentiment.json"};
    std::string lexicon_path;  // optional extra lexicon entries

    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief A headline with its score and fetch position
 */
struct ScoredHeadline {
    Headline headline;
    double score{0.0};
    size_t index{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Per-ticker sentiment statistics
 */
struct SentimentSummary {
    std::string ticker;
    double mean{0.0};
    double std_dev{0.0};  // population
    size_t count{0};
    std::vector<ScoredHeadline> headline_scores;  // fetch order
    std::vector<ScoredHeadline> top_positive;
    std::vector<ScoredHeadline> top_negative;
    std::string method_used;
    std::optional<std::string> warning;

    // True when auto mode was requested but the lexicon produced the scores
    bool degraded{false};

    nlohmann::json to_json() const;
};

/**
 * @brief Turns a HeadlineSet into a SentimentSummary
 *
 * Owns the classifier for the duration of a run: the model passed in is
 * loaded at most once (on initialize() or the first auto-mode batch) and
 * unloaded when the aggregator is destroyed. The first classifier failure
 * moves the aggregator to LEXICON_ONLY permanently; that batch is then
 * rescored with the lexicon and later batches go straight to it.
 *
 * summarize() may be called concurrently from several threads.
 */
class SentimentAggregator {
public:
    SentimentAggregator(SentimentConfig config, std::shared_ptr<SentimentModel> model);
    ~SentimentAggregator();

    SentimentAggregator(const SentimentAggregator&) = delete;
    SentimentAggregator& operator=(const SentimentAggregator&) = delete;

    /**
     * @brief Validate the config, load lexicon extensions and the model
     *
     * A model that fails to load is not an error: the aggregator moves to
     * LEXICON_ONLY and records the reason.
     *
     * @return INVALID_ARGUMENT on invalid config, or the lexicon extension
     *         load error
     */
    Result<void> initialize();

    /**
     * @brief Summarize using the configured mode
     */
    SentimentSummary summarize(const HeadlineSet& headlines);

    SentimentSummary summarize(const HeadlineSet& headlines, SentimentMode mode);

    ScorerState state() const {
        return state_.load(std::memory_order_acquire);
    }

    /**
     * @brief Reason for the switch to LEXICON_ONLY, empty while the classifier is healthy
     */
    std::string fallback_reason() const;

    const SentimentConfig& config() const {
        return config_;
    }

private:
    void ensure_model_loaded();
    void switch_to_lexicon(const std::string& reason);
    Result<std::vector<double>> score_with_classifier(const std::vector<std::string>& texts);

    SentimentConfig config_;
    std::shared_ptr<SentimentModel> model_;
    std::unique_ptr<ClassifierScorer> classifier_;
    LexiconScorer lexicon_;

    std::atomic<ScorerState> state_{ScorerState::CLASSIFIER_PENDING};
    std::once_flag load_once_;
    mutable std::mutex reason_mutex_;
    std::string fallback_reason_;
};

}  // namespace sentiment
}  // namespace options_ngin
