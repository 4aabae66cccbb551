// include/options_ngin/sentiment/linear_sentiment_model.hpp
#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include "options_ngin/sentiment/sentiment_model.hpp"

namespace options_ngin {
namespace sentiment {

/**
 * @brief Three-class linear headline classifier
 *
 * Features are lower-cased unigrams and adjacent-token bigrams ("price
 * target"). Class logits are bias + the sum of matched feature weights,
 * turned into probabilities with a softmax. Weights are read from a JSON
 * file:
 *
 *   {
 *     "name": "headline-linear-v1",
 *     "labels": ["negative", "neutral", "positive"],
 *     "bias": [b0, b1, b2],
 *     "unigrams": {"beat": [w0, w1, w2], ...},
 *     "bigrams": {"price target": [w0, w1, w2], ...}
 *   }
 *
 * Labels may come in any order but must be exactly the three classes.
 */
class LinearSentimentModel : public SentimentModel {
public:
    static constexpr size_t NUM_CLASSES = 3;
    using Weights = std::array<double, NUM_CLASSES>;

    explicit LinearSentimentModel(std::string weights_path);
    ~LinearSentimentModel() override = default;

    /**
     * @return MODEL_UNAVAILABLE if the file is missing, unreadable or malformed
     */
    Result<void> load() override;
    void unload() override;
    bool is_loaded() const override;

    /**
     * @return MODEL_UNAVAILABLE if called before load()
     */
    Result<SentimentPrediction> predict(const std::string& text) const override;

    std::string name() const override;

    const std::string& weights_path() const {
        return weights_path_;
    }

private:
    std::string weights_path_;
    std::string model_name_;

    // Indexed by SentimentLabel
    Weights bias_{};
    std::unordered_map<std::string, Weights> unigrams_;
    std::unordered_map<std::string, Weights> bigrams_;

    std::atomic<bool> loaded_{false};
    // Guards the weights; predict() holds it so unload() cannot clear them mid-prediction
    mutable std::mutex load_mutex_;
};

}  // namespace sentiment
}  // namespace options_ngin
