// src/sentiment/sentiment_aggregator.cpp
#include "options_ngin/sentiment/sentiment_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace sentiment {

Result<void> SentimentConfig::validate() const {
    if (top_k == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "top_k must be at least 1",
                                "SentimentConfig");
    }
    if (classifier_timeout_ms <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "classifier_timeout_ms must be positive", "SentimentConfig");
    }
    if (max_text_length == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_text_length must be positive", "SentimentConfig");
    }
    return Result<void>();
}

nlohmann::json SentimentConfig::to_json() const {
    nlohmann::json j;
    j["mode"] = sentiment_mode_to_string(mode);
    j["top_k"] = top_k;
    j["classifier_timeout_ms"] = classifier_timeout_ms;
    j["max_text_length"] = max_text_length;
    j["model_path"] = model_path;
    j["lexicon_path"] = lexicon_path;
    return j;
}

void SentimentConfig::from_json(const nlohmann::json& j) {
    if (j.contains("mode")) {
        auto parsed = sentiment_mode_from_string(j.at("mode").get<std::string>());
        if (parsed) {
            mode = *parsed;
        }
    }
    if (j.contains("top_k"))
        top_k = j.at("top_k").get<size_t>();
    if (j.contains("classifier_timeout_ms"))
        classifier_timeout_ms = j.at("classifier_timeout_ms").get<int>();
    if (j.contains("max_text_length"))
        max_text_length = j.at("max_text_length").get<size_t>();
    if (j.contains("model_path"))
        model_path = j.at("model_path").get<std::string>();
    if (j.contains("lexicon_path"))
        lexicon_path = j.at("lexicon_path").get<std::string>();
}

nlohmann::json ScoredHeadline::to_json() const {
    nlohmann::json j;
    j["title"] = headline.text;
    j["score"] = score;
    j["source"] = headline.source;
    j["published_at"] = core::format_iso8601(headline.published_at);
    j["url"] = headline.url;
    j["index"] = index;
    return j;
}

nlohmann::json SentimentSummary::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    j["mean"] = mean;
    j["std"] = std_dev;
    j["count"] = count;
    j["method_used"] = method_used;
    j["degraded"] = degraded;
    j["warning"] = warning ? nlohmann::json(*warning) : nlohmann::json(nullptr);

    auto to_array = [](const std::vector<ScoredHeadline>& items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items) {
            arr.push_back(item.to_json());
        }
        return arr;
    };
    j["headline_scores"] = to_array(headline_scores);
    j["top_positive"] = to_array(top_positive);
    j["top_negative"] = to_array(top_negative);
    return j;
}

SentimentAggregator::SentimentAggregator(SentimentConfig config,
                                         std::shared_ptr<SentimentModel> model)
    : config_(std::move(config)), model_(std::move(model)) {
    if (model_) {
        classifier_ = std::make_unique<ClassifierScorer>(
            model_, std::chrono::milliseconds(config_.classifier_timeout_ms));
    }
}

SentimentAggregator::~SentimentAggregator() {
    if (model_ && model_->is_loaded()) {
        model_->unload();
    }
}

Result<void> SentimentAggregator::initialize() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }

    if (!config_.lexicon_path.empty()) {
        auto loaded = lexicon_.load_extensions(config_.lexicon_path);
        if (loaded.is_error()) {
            return loaded;
        }
        INFO("Loaded lexicon extensions from " + config_.lexicon_path + " (" +
             std::to_string(lexicon_.lexicon_size()) + " entries)");
    }

    if (config_.mode == SentimentMode::AUTO) {
        ensure_model_loaded();
    }
    return Result<void>();
}

void SentimentAggregator::ensure_model_loaded() {
    std::call_once(load_once_, [this]() {
        if (!model_) {
            switch_to_lexicon("no sentiment model configured");
            return;
        }
        auto loaded = model_->load();
        if (loaded.is_error()) {
            switch_to_lexicon(std::string("model load failed: ") + loaded.error()->what());
            return;
        }
        ScorerState expected = ScorerState::CLASSIFIER_PENDING;
        state_.compare_exchange_strong(expected, ScorerState::CLASSIFIER_ACTIVE,
                                       std::memory_order_acq_rel);
        INFO("Sentiment model '" + model_->name() + "' loaded");
    });
}

void SentimentAggregator::switch_to_lexicon(const std::string& reason) {
    ScorerState previous = state_.exchange(ScorerState::LEXICON_ONLY, std::memory_order_acq_rel);
    if (previous == ScorerState::LEXICON_ONLY) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        fallback_reason_ = reason;
    }
    WARN("Sentiment classifier disabled for the rest of the run, using lexicon: " + reason);
}

std::string SentimentAggregator::fallback_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return fallback_reason_;
}

Result<std::vector<double>> SentimentAggregator::score_with_classifier(
    const std::vector<std::string>& texts) {
    try {
        return classifier_->score(texts);
    } catch (const std::exception& e) {
        return make_error<std::vector<double>>(ErrorCode::MODEL_INFERENCE_ERROR, e.what(),
                                               "SentimentAggregator");
    }
}

SentimentSummary SentimentAggregator::summarize(const HeadlineSet& headlines) {
    return summarize(headlines, config_.mode);
}

SentimentSummary SentimentAggregator::summarize(const HeadlineSet& headlines,
                                                SentimentMode mode) {
    SentimentSummary summary;
    summary.ticker = headlines.ticker;

    std::vector<std::string> texts;
    texts.reserve(headlines.size());
    for (const auto& headline : headlines.headlines) {
        texts.push_back(normalize_headline(headline.text, config_.max_text_length));
    }

    std::vector<double> scores;
    bool use_lexicon = true;
    if (mode == SentimentMode::AUTO) {
        ensure_model_loaded();
        if (state() == ScorerState::CLASSIFIER_ACTIVE) {
            use_lexicon = false;
            if (!texts.empty()) {
                auto classified = score_with_classifier(texts);
                if (classified.is_ok()) {
                    scores = classified.take();
                } else {
                    switch_to_lexicon(classified.error()->to_string());
                    summary.warning = std::string("Classifier failed, scored with lexicon: ") +
                                      classified.error()->what();
                    use_lexicon = true;
                }
            }
        }
        if (use_lexicon) {
            summary.degraded = true;
            if (!summary.warning) {
                summary.warning = "Classifier unavailable, scored with lexicon: " +
                                  fallback_reason();
            }
        }
    }

    if (use_lexicon) {
        // The lexicon scorer never fails
        scores = lexicon_.score(texts).value();
        summary.method_used = lexicon_.name();
    } else {
        summary.method_used = classifier_->name();
    }

    summary.count = scores.size();
    if (summary.count == 0) {
        if (!summary.warning) {
            summary.warning = "No headlines provided";
        }
        return summary;
    }

    double sum = 0.0;
    for (double s : scores) {
        sum += s;
    }
    summary.mean = sum / static_cast<double>(summary.count);

    double sq = 0.0;
    for (double s : scores) {
        sq += (s - summary.mean) * (s - summary.mean);
    }
    summary.std_dev = std::sqrt(sq / static_cast<double>(summary.count));

    summary.headline_scores.reserve(summary.count);
    for (size_t i = 0; i < summary.count; ++i) {
        summary.headline_scores.push_back({headlines.headlines[i], scores[i], i});
    }

    const size_t k = std::min(config_.top_k, summary.count);
    std::vector<ScoredHeadline> ordered = summary.headline_scores;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ScoredHeadline& a, const ScoredHeadline& b) {
                         return a.score > b.score;
                     });
    summary.top_positive.assign(ordered.begin(), ordered.begin() + k);

    ordered = summary.headline_scores;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ScoredHeadline& a, const ScoredHeadline& b) {
                         return a.score < b.score;
                     });
    summary.top_negative.assign(ordered.begin(), ordered.begin() + k);

    DEBUG(headlines.ticker + " sentiment: mean=" + std::to_string(summary.mean) +
          " count=" + std::to_string(summary.count) + " method=" + summary.method_used);
    return summary;
}

}  // namespace sentiment
}  // namespace options_ngin
