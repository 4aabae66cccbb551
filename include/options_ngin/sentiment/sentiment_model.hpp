// include/options_ngin/sentiment/sentiment_model.hpp
#pragma once

#include <string>
#include "options_ngin/core/error.hpp"

namespace options_ngin {
namespace sentiment {

enum class SentimentLabel { NEGATIVE, NEUTRAL, POSITIVE };

inline std::string sentiment_label_to_string(SentimentLabel label) {
    switch (label) {
        case SentimentLabel::NEGATIVE:
            return "negative";
        case SentimentLabel::POSITIVE:
            return "positive";
        default:
            return "neutral";
    }
}

/**
 * @brief Class prediction for a single text
 */
struct SentimentPrediction {
    SentimentLabel label{SentimentLabel::NEUTRAL};
    double confidence{0.0};  // probability of the predicted class

    /**
     * @brief Signed score: +confidence, -confidence or 0 for neutral
     */
    double signed_score() const {
        switch (label) {
            case SentimentLabel::POSITIVE:
                return confidence;
            case SentimentLabel::NEGATIVE:
                return -confidence;
            default:
                return 0.0;
        }
    }
};

/**
 * @brief Text classification model resource
 *
 * A model is constructed unloaded; load() acquires its weights and unload()
 * releases them. predict() is only valid between the two and must be safe to
 * call concurrently once loaded.
 */
class SentimentModel {
public:
    virtual ~SentimentModel() = default;

    virtual Result<void> load() = 0;
    virtual void unload() = 0;
    virtual bool is_loaded() const = 0;

    virtual Result<SentimentPrediction> predict(const std::string& text) const = 0;

    virtual std::string name() const = 0;
};

}  // namespace sentiment
}  // namespace options_ngin
