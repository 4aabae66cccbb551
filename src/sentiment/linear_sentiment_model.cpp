// src/sentiment/linear_sentiment_model.cpp
#include "options_ngin/sentiment/linear_sentiment_model.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <vector>
#include "options_ngin/sentiment/text_utils.hpp"

namespace options_ngin {
namespace sentiment {

namespace {

std::optional<size_t> label_index(const std::string& label) {
    if (label == "negative")
        return static_cast<size_t>(SentimentLabel::NEGATIVE);
    if (label == "neutral")
        return static_cast<size_t>(SentimentLabel::NEUTRAL);
    if (label == "positive")
        return static_cast<size_t>(SentimentLabel::POSITIVE);
    return std::nullopt;
}

// Reorders a file-ordered weight row into SentimentLabel order
LinearSentimentModel::Weights read_row(const nlohmann::json& row,
                                       const std::array<size_t, 3>& column_to_label,
                                       const std::string& what) {
    if (!row.is_array() || row.size() != LinearSentimentModel::NUM_CLASSES) {
        throw std::invalid_argument("'" + what + "' must be an array of " +
                                    std::to_string(LinearSentimentModel::NUM_CLASSES) +
                                    " weights");
    }
    LinearSentimentModel::Weights weights{};
    for (size_t col = 0; col < LinearSentimentModel::NUM_CLASSES; ++col) {
        double w = row.at(col).get<double>();
        if (!std::isfinite(w)) {
            throw std::invalid_argument("'" + what + "' contains a non-finite weight");
        }
        weights[column_to_label[col]] = w;
    }
    return weights;
}

}  // namespace

LinearSentimentModel::LinearSentimentModel(std::string weights_path)
    : weights_path_(std::move(weights_path)) {}

Result<void> LinearSentimentModel::load() {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (loaded_.load(std::memory_order_acquire)) {
        return Result<void>();
    }

    if (weights_path_.empty() || !std::filesystem::exists(weights_path_)) {
        return make_error<void>(ErrorCode::MODEL_UNAVAILABLE,
                                "Model weights not found: " + weights_path_,
                                "LinearSentimentModel");
    }

    std::ifstream file(weights_path_);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::MODEL_UNAVAILABLE,
                                "Failed to open model weights: " + weights_path_,
                                "LinearSentimentModel");
    }

    try {
        nlohmann::json j;
        file >> j;

        const auto& labels = j.at("labels");
        if (!labels.is_array() || labels.size() != NUM_CLASSES) {
            throw std::invalid_argument("'labels' must list negative, neutral and positive");
        }
        std::array<size_t, 3> column_to_label{};
        std::array<bool, 3> seen{};
        for (size_t col = 0; col < NUM_CLASSES; ++col) {
            auto idx = label_index(labels.at(col).get<std::string>());
            if (!idx || seen[*idx]) {
                throw std::invalid_argument("'labels' must list negative, neutral and positive");
            }
            seen[*idx] = true;
            column_to_label[col] = *idx;
        }

        Weights bias = read_row(j.at("bias"), column_to_label, "bias");

        std::unordered_map<std::string, Weights> unigrams;
        if (j.contains("unigrams")) {
            for (const auto& item : j.at("unigrams").items()) {
                unigrams[item.key()] = read_row(item.value(), column_to_label, item.key());
            }
        }
        std::unordered_map<std::string, Weights> bigrams;
        if (j.contains("bigrams")) {
            for (const auto& item : j.at("bigrams").items()) {
                bigrams[item.key()] = read_row(item.value(), column_to_label, item.key());
            }
        }

        model_name_ = j.value("name", std::string("linear"));
        bias_ = bias;
        unigrams_ = std::move(unigrams);
        bigrams_ = std::move(bigrams);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::MODEL_UNAVAILABLE,
                                "Malformed model weights " + weights_path_ + ": " + e.what(),
                                "LinearSentimentModel");
    } catch (const std::invalid_argument& e) {
        return make_error<void>(ErrorCode::MODEL_UNAVAILABLE,
                                "Malformed model weights " + weights_path_ + ": " + e.what(),
                                "LinearSentimentModel");
    }

    loaded_.store(true, std::memory_order_release);
    return Result<void>();
}

void LinearSentimentModel::unload() {
    std::lock_guard<std::mutex> lock(load_mutex_);
    loaded_.store(false, std::memory_order_release);
    unigrams_.clear();
    bigrams_.clear();
    bias_ = Weights{};
}

bool LinearSentimentModel::is_loaded() const {
    return loaded_.load(std::memory_order_acquire);
}

std::string LinearSentimentModel::name() const {
    std::lock_guard<std::mutex> lock(load_mutex_);
    return model_name_.empty() ? std::string("linear") : model_name_;
}

Result<SentimentPrediction> LinearSentimentModel::predict(const std::string& text) const {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (!is_loaded()) {
        return make_error<SentimentPrediction>(ErrorCode::MODEL_UNAVAILABLE,
                                               "Model not loaded", "LinearSentimentModel");
    }

    std::vector<std::string> tokens = tokenize(text);
    if (tokens.empty()) {
        return SentimentPrediction{SentimentLabel::NEUTRAL, 0.0};
    }

    Weights logits = bias_;
    auto accumulate = [&logits](const Weights& w) {
        for (size_t k = 0; k < NUM_CLASSES; ++k) {
            logits[k] += w[k];
        }
    };
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto uni = unigrams_.find(tokens[i]);
        if (uni != unigrams_.end()) {
            accumulate(uni->second);
        }
        if (i + 1 < tokens.size()) {
            auto bi = bigrams_.find(tokens[i] + " " + tokens[i + 1]);
            if (bi != bigrams_.end()) {
                accumulate(bi->second);
            }
        }
    }

    double max_logit = *std::max_element(logits.begin(), logits.end());
    Weights probs{};
    double total = 0.0;
    for (size_t k = 0; k < NUM_CLASSES; ++k) {
        probs[k] = std::exp(logits[k] - max_logit);
        total += probs[k];
    }
    if (!std::isfinite(total) || total <= 0.0) {
        return make_error<SentimentPrediction>(ErrorCode::MODEL_INFERENCE_ERROR,
                                               "Softmax produced no finite probabilities",
                                               "LinearSentimentModel");
    }

    // First maximum wins, so ties resolve in NEGATIVE, NEUTRAL, POSITIVE order
    size_t best = 0;
    for (size_t k = 1; k < NUM_CLASSES; ++k) {
        if (probs[k] > probs[best]) {
            best = k;
        }
    }

    SentimentPrediction prediction;
    prediction.label = static_cast<SentimentLabel>(best);
    prediction.confidence = probs[best] / total;
    return prediction;
}

}  // namespace sentiment
}  // namespace options_ngin
