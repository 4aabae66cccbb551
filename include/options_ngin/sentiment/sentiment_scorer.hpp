// include/options_ngin/sentiment/sentiment_scorer.hpp
#pragma once

#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"

namespace options_ngin {
namespace sentiment {

/**
 * @brief Name reported in method_used when the lexicon scorer produced the scores
 */
inline const std::string LEXICON_METHOD = "lexicon";

/**
 * @brief Scores a batch of normalized headline texts on [-1, 1]
 *
 * Implementations return exactly one score per text, in input order, or an
 * error for the whole batch. Empty texts score 0.
 */
class SentimentScorer {
public:
    virtual ~SentimentScorer() = default;

    virtual Result<std::vector<double>> score(const std::vector<std::string>& texts) = 0;

    /**
     * @brief Method name recorded in the summary
     */
    virtual std::string name() const = 0;
};

}  // namespace sentiment
}  // namespace options_ngin
