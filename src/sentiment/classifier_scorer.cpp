// src/sentiment/classifier_scorer.cpp
#include "options_ngin/sentiment/classifier_scorer.hpp"
#include <cmath>
#include "options_ngin/core/call_with_timeout.hpp"

namespace options_ngin {
namespace sentiment {

namespace {

Result<std::vector<double>> score_batch(const SentimentModel& model,
                                        const std::vector<std::string>& texts) {
    std::vector<double> scores;
    scores.reserve(texts.size());

    for (size_t i = 0; i < texts.size(); ++i) {
        if (texts[i].empty()) {
            scores.push_back(0.0);
            continue;
        }

        auto prediction = model.predict(texts[i]);
        if (prediction.is_error()) {
            return make_error<std::vector<double>>(
                ErrorCode::MODEL_INFERENCE_ERROR,
                "Inference failed on headline " + std::to_string(i) + ": " +
                    prediction.error()->what(),
                "ClassifierScorer");
        }
        const double confidence = prediction.value().confidence;
        if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
            return make_error<std::vector<double>>(
                ErrorCode::MODEL_INFERENCE_ERROR,
                "Headline " + std::to_string(i) + ": confidence " + std::to_string(confidence) +
                    " is outside [0, 1]",
                "ClassifierScorer");
        }
        scores.push_back(prediction.value().signed_score());
    }
    return scores;
}

}  // namespace

ClassifierScorer::ClassifierScorer(std::shared_ptr<SentimentModel> model,
                                   std::chrono::milliseconds timeout)
    : model_(std::move(model)), timeout_(timeout) {}

std::string ClassifierScorer::name() const {
    return model_ ? model_->name() : std::string("classifier");
}

Result<std::vector<double>> ClassifierScorer::score(const std::vector<std::string>& texts) {
    if (!model_ || !model_->is_loaded()) {
        return make_error<std::vector<double>>(ErrorCode::MODEL_UNAVAILABLE,
                                               "Sentiment model is not loaded",
                                               "ClassifierScorer");
    }
    if (texts.empty()) {
        return std::vector<double>();
    }

    // An abandoned batch keeps running, so it holds its own model and text copies
    std::shared_ptr<SentimentModel> model = model_;
    auto scored = call_with_timeout<std::vector<double>>(
        [model, texts]() { return score_batch(*model, texts); }, timeout_,
        "Sentiment inference on " + std::to_string(texts.size()) + " headlines");
    if (scored.is_error() && scored.error()->code() == ErrorCode::UNKNOWN_ERROR) {
        // The model threw
        return make_error<std::vector<double>>(ErrorCode::MODEL_INFERENCE_ERROR,
                                               scored.error()->what(), "ClassifierScorer");
    }
    return std::move(scored);
}

}  // namespace sentiment
}  // namespace options_ngin
