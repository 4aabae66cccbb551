// include/options_ngin/sentiment/classifier_scorer.hpp
#pragma once

#include <chrono>
#include <memory>
#include "options_ngin/sentiment/sentiment_model.hpp"
#include "options_ngin/sentiment/sentiment_scorer.hpp"

namespace options_ngin {
namespace sentiment {

/**
 * @brief Scores headlines with a loaded SentimentModel
 *
 * A batch runs on its own thread under a deadline. A batch that runs past it
 * fails as a whole with TIMEOUT_ERROR and is abandoned, still holding a
 * reference to the model. Every prediction must carry a finite confidence in
 * [0, 1], so every score lies in [-1, 1]. The scorer does not own the model
 * lifecycle, it only borrows a loaded one.
 */
class ClassifierScorer : public SentimentScorer {
public:
    ClassifierScorer(std::shared_ptr<SentimentModel> model, std::chrono::milliseconds timeout);

    /**
     * @return MODEL_UNAVAILABLE if the model is missing or not loaded,
     *         MODEL_INFERENCE_ERROR if any prediction fails, throws or has an
     *         out-of-range confidence,
     *         TIMEOUT_ERROR if the batch deadline passes
     */
    Result<std::vector<double>> score(const std::vector<std::string>& texts) override;

    std::string name() const override;

private:
    std::shared_ptr<SentimentModel> model_;
    std::chrono::milliseconds timeout_;
};

}  // namespace sentiment
}  // namespace options_ngin
