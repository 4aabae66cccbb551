// include/options_ngin/sentiment/lexicon_scorer.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "options_ngin/sentiment/sentiment_scorer.hpp"

namespace options_ngin {
namespace sentiment {

/**
 * @brief Deterministic rule-based scorer
 *
 * Each lexicon token contributes its valence. A booster directly before the
 * token adds BOOSTER_INCREMENT in the valence's direction, and a negation in
 * the NEGATION_WINDOW preceding tokens multiplies it by NEGATION_SCALAR. The
 * summed valence s is mapped to s / sqrt(s^2 + NORMALIZATION_ALPHA).
 * Never fails and has no external dependencies.
 */
class LexiconScorer : public SentimentScorer {
public:
    static constexpr double NEGATION_SCALAR = -0.74;
    static constexpr double BOOSTER_INCREMENT = 0.293;
    static constexpr double NORMALIZATION_ALPHA = 15.0;
    static constexpr size_t NEGATION_WINDOW = 3;

    LexiconScorer();

    /**
     * @brief Merge extra entries from a JSON file
     *
     * Format: {"words": {"token": valence, ...}, "boosters": ["token", ...]}.
     * Entries override the built-in valence of the same token.
     */
    Result<void> load_extensions(const std::string& filepath);

    Result<std::vector<double>> score(const std::vector<std::string>& texts) override;

    std::string name() const override {
        return LEXICON_METHOD;
    }

    /**
     * @brief Score a single text
     */
    double score_text(const std::string& text) const;

    size_t lexicon_size() const {
        return valences_.size();
    }

private:
    std::unordered_map<std::string, double> valences_;
    std::unordered_set<std::string> boosters_;
    std::unordered_set<std::string> negations_;
};

}  // namespace sentiment
}  // namespace options_ngin
