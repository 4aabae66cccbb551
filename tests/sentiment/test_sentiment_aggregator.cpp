#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <thread>
#include <vector>
#include "core/test_base.hpp"
#include "options_ngin/sentiment/classifier_scorer.hpp"
#include "options_ngin/sentiment/sentiment_aggregator.hpp"
#include "sentiment/mock_sentiment_model.hpp"

using namespace options_ngin;
using namespace options_ngin::sentiment;
using options_ngin::testing::MockSentimentModel;

class SentimentAggregatorTest : public options_ngin::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        model = std::make_shared<MockSentimentModel>();
    }

    HeadlineSet make_set(const std::string& ticker, const std::vector<std::string>& texts) {
        HeadlineSet set;
        set.ticker = ticker;
        Timestamp ts = std::chrono::system_clock::now();
        for (const auto& text : texts) {
            set.headlines.emplace_back(text, "test-wire", ts);
        }
        return set;
    }

    SentimentConfig config_with(SentimentMode mode) {
        SentimentConfig config;
        config.mode = mode;
        config.top_k = 3;
        return config;
    }

    std::shared_ptr<MockSentimentModel> model;
};

TEST_F(SentimentAggregatorTest, EmptySetReturnsZeroWithWarning) {
    SentimentAggregator aggregator(config_with(SentimentMode::FALLBACK_ONLY), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {}));
    EXPECT_EQ(summary.ticker, "SPY");
    EXPECT_EQ(summary.count, 0u);
    EXPECT_DOUBLE_EQ(summary.mean, 0.0);
    EXPECT_DOUBLE_EQ(summary.std_dev, 0.0);
    EXPECT_TRUE(summary.top_positive.empty());
    EXPECT_TRUE(summary.top_negative.empty());
    ASSERT_TRUE(summary.warning.has_value());
    EXPECT_EQ(*summary.warning, "No headlines provided");
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_FALSE(summary.degraded);
}

TEST_F(SentimentAggregatorTest, ClassifierScoresWhenHealthy) {
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());
    EXPECT_EQ(aggregator.state(), ScorerState::CLASSIFIER_ACTIVE);
    EXPECT_EQ(model->load_calls.load(), 1);

    auto summary =
        aggregator.summarize(make_set("AAPL", {"Apple shares up", "Apple shares down", "flat"}));
    EXPECT_EQ(summary.method_used, "mock-classifier");
    EXPECT_FALSE(summary.degraded);
    EXPECT_FALSE(summary.warning.has_value());
    ASSERT_EQ(summary.count, 3u);
    EXPECT_NEAR(summary.headline_scores[0].score, 0.9, 1e-12);
    EXPECT_NEAR(summary.headline_scores[1].score, -0.9, 1e-12);
    EXPECT_DOUBLE_EQ(summary.headline_scores[2].score, 0.0);
    EXPECT_NEAR(summary.mean, 0.0, 1e-12);
    EXPECT_NEAR(summary.std_dev, std::sqrt(1.62 / 3.0), 1e-12);
    EXPECT_TRUE(aggregator.fallback_reason().empty());
}

TEST_F(SentimentAggregatorTest, InferenceFailureSwitchesPermanently) {
    model->fail_predict_from = 1;
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto first = aggregator.summarize(make_set("SPY", {"Stocks rally up", "Stocks crash down"}));
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);
    EXPECT_EQ(first.method_used, LEXICON_METHOD);
    EXPECT_TRUE(first.degraded);
    ASSERT_TRUE(first.warning.has_value());
    ASSERT_EQ(first.count, 2u);
    // The whole batch is rescored by the lexicon, not mixed
    EXPECT_GT(first.headline_scores[0].score, 0.0);
    EXPECT_LT(first.headline_scores[1].score, 0.0);
    EXPECT_FALSE(aggregator.fallback_reason().empty());

    const int calls_after_failure = model->predict_calls.load();
    auto second = aggregator.summarize(make_set("QQQ", {"Tech rally up"}));
    EXPECT_EQ(model->predict_calls.load(), calls_after_failure);
    EXPECT_EQ(second.method_used, LEXICON_METHOD);
    EXPECT_TRUE(second.degraded);
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);
}

TEST_F(SentimentAggregatorTest, ThrowingModelFallsBack) {
    model->throw_on_predict = true;
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally"}));
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_TRUE(summary.degraded);
    EXPECT_NEAR(summary.mean, 0.44043357076016854, 1e-12);
}

TEST_F(SentimentAggregatorTest, LoadFailureUsesLexicon) {
    model->fail_load = true;
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);
    EXPECT_NE(aggregator.fallback_reason().find("model load failed"), std::string::npos);

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally"}));
    EXPECT_TRUE(summary.degraded);
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    ASSERT_TRUE(summary.warning.has_value());
    EXPECT_EQ(model->predict_calls.load(), 0);

    // Never retried within the same aggregator
    aggregator.summarize(make_set("AAPL", {"Apple rally"}));
    EXPECT_EQ(model->load_calls.load(), 1);
}

TEST_F(SentimentAggregatorTest, MissingModelUsesLexicon) {
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), nullptr);
    ASSERT_TRUE(aggregator.initialize().is_ok());
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally"}));
    EXPECT_TRUE(summary.degraded);
}

TEST_F(SentimentAggregatorTest, FallbackOnlyNeverTouchesModel) {
    {
        SentimentAggregator aggregator(config_with(SentimentMode::FALLBACK_ONLY), model);
        ASSERT_TRUE(aggregator.initialize().is_ok());
        auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally up"}));
        EXPECT_EQ(summary.method_used, LEXICON_METHOD);
        EXPECT_FALSE(summary.degraded);
        EXPECT_FALSE(summary.warning.has_value());
    }
    EXPECT_EQ(model->load_calls.load(), 0);
    EXPECT_EQ(model->predict_calls.load(), 0);
}

TEST_F(SentimentAggregatorTest, PerCallModeOverride) {
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary =
        aggregator.summarize(make_set("SPY", {"Stocks rally up"}), SentimentMode::FALLBACK_ONLY);
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_EQ(model->predict_calls.load(), 0);
    EXPECT_EQ(aggregator.state(), ScorerState::CLASSIFIER_ACTIVE);
}

TEST_F(SentimentAggregatorTest, ModelLoadedOnceUnderConcurrency) {
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&aggregator, this, i]() {
            auto summary =
                aggregator.summarize(make_set("T" + std::to_string(i), {"shares up"}));
            EXPECT_EQ(summary.count, 1u);
            EXPECT_FALSE(summary.degraded);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(model->load_calls.load(), 1);
    EXPECT_EQ(model->predict_calls.load(), 8);
}

TEST_F(SentimentAggregatorTest, DestructorUnloadsModel) {
    {
        SentimentAggregator aggregator(config_with(SentimentMode::AUTO), model);
        ASSERT_TRUE(aggregator.initialize().is_ok());
        EXPECT_TRUE(model->is_loaded());
    }
    EXPECT_FALSE(model->is_loaded());
    EXPECT_EQ(model->unload_calls.load(), 1);
}

TEST_F(SentimentAggregatorTest, ClassifierTimeoutFallsBack) {
    auto config = config_with(SentimentMode::AUTO);
    config.classifier_timeout_ms = 1;
    model->predict_delay = std::chrono::milliseconds(20);
    SentimentAggregator aggregator(config, model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"up", "up", "up"}));
    EXPECT_TRUE(summary.degraded);
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);
    EXPECT_NE(aggregator.fallback_reason().find("TIMEOUT_ERROR"), std::string::npos);
}

TEST_F(SentimentAggregatorTest, SlowSingleHeadlineIsCutOffAtDeadline) {
    auto config = config_with(SentimentMode::AUTO);
    config.classifier_timeout_ms = 50;
    model->predict_delay = std::chrono::milliseconds(400);
    SentimentAggregator aggregator(config, model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto start = std::chrono::steady_clock::now();
    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally up"}));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(300));
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_TRUE(summary.degraded);
    EXPECT_EQ(aggregator.state(), ScorerState::LEXICON_ONLY);
    EXPECT_NE(aggregator.fallback_reason().find("TIMEOUT_ERROR"), std::string::npos);
}

TEST_F(SentimentAggregatorTest, NonFiniteConfidenceFallsBack) {
    auto nan_model =
        std::make_shared<MockSentimentModel>(std::numeric_limits<double>::quiet_NaN());
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), nan_model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally up"}));
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_TRUE(summary.degraded);
    EXPECT_TRUE(std::isfinite(summary.mean));
    EXPECT_NE(aggregator.fallback_reason().find("MODEL_INFERENCE_ERROR"), std::string::npos);
}

TEST_F(SentimentAggregatorTest, ConfidenceAboveOneFallsBack) {
    auto loud_model = std::make_shared<MockSentimentModel>(7.5);
    SentimentAggregator aggregator(config_with(SentimentMode::AUTO), loud_model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally up", "Futures down"}));
    EXPECT_EQ(summary.method_used, LEXICON_METHOD);
    EXPECT_GE(summary.mean, -1.0);
    EXPECT_LE(summary.mean, 1.0);
    for (const auto& scored : summary.headline_scores) {
        EXPECT_LE(std::abs(scored.score), 1.0);
    }
}

TEST_F(SentimentAggregatorTest, ClassifierScorerRejectsOutOfRangeConfidence) {
    auto negative = std::make_shared<MockSentimentModel>(-0.2);
    ASSERT_TRUE(negative->load().is_ok());
    ClassifierScorer scorer(negative, std::chrono::milliseconds(1000));

    auto result = scorer.score({"Futures down"});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MODEL_INFERENCE_ERROR);
    EXPECT_EQ(result.error()->component(), "ClassifierScorer");

    auto healthy = std::make_shared<MockSentimentModel>(1.0);
    ASSERT_TRUE(healthy->load().is_ok());
    ClassifierScorer bounded(healthy, std::chrono::milliseconds(1000));
    auto scores = bounded.score({"Futures down", "", "Shares up"});
    ASSERT_TRUE(scores.is_ok());
    EXPECT_EQ(scores.value(), (std::vector<double>{-1.0, 0.0, 1.0}));
}

TEST_F(SentimentAggregatorTest, ClassifierScorerTimeoutReturnsPromptly) {
    model->predict_delay = std::chrono::milliseconds(1000);
    ASSERT_TRUE(model->load().is_ok());
    ClassifierScorer scorer(model, std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    auto result = scorer.score({"one headline"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
}

TEST_F(SentimentAggregatorTest, TopKOrderingIsStable) {
    auto config = config_with(SentimentMode::FALLBACK_ONLY);
    config.top_k = 2;
    SentimentAggregator aggregator(config, model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set(
        "SPY", {"Stocks rally", "Company meeting", "not bullish", "Stocks rally", "Market crash"}));
    ASSERT_EQ(summary.count, 5u);

    ASSERT_EQ(summary.top_positive.size(), 2u);
    EXPECT_EQ(summary.top_positive[0].index, 0u);
    EXPECT_EQ(summary.top_positive[1].index, 3u);

    ASSERT_EQ(summary.top_negative.size(), 2u);
    EXPECT_EQ(summary.top_negative[0].index, 4u);
    EXPECT_EQ(summary.top_negative[1].index, 2u);

    // headline_scores keeps fetch order
    for (size_t i = 0; i < summary.headline_scores.size(); ++i) {
        EXPECT_EQ(summary.headline_scores[i].index, i);
    }
}

TEST_F(SentimentAggregatorTest, TopKClampedToCount) {
    auto config = config_with(SentimentMode::FALLBACK_ONLY);
    config.top_k = 10;
    SentimentAggregator aggregator(config, model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"Stocks rally", "Market crash"}));
    EXPECT_EQ(summary.top_positive.size(), 2u);
    EXPECT_EQ(summary.top_negative.size(), 2u);
    EXPECT_EQ(summary.top_negative[0].index, 1u);
}

TEST_F(SentimentAggregatorTest, HeadlinesNormalizedBeforeScoring) {
    SentimentAggregator aggregator(config_with(SentimentMode::FALLBACK_ONLY), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto summary = aggregator.summarize(make_set("SPY", {"<b>Stocks</b>&nbsp;rally"}));
    ASSERT_EQ(summary.count, 1u);
    EXPECT_NEAR(summary.mean, 0.44043357076016854, 1e-12);
    EXPECT_EQ(summary.headline_scores[0].headline.text, "<b>Stocks</b>&nbsp;rally");
}

TEST_F(SentimentAggregatorTest, InvalidConfigRejected) {
    auto config = config_with(SentimentMode::AUTO);
    config.top_k = 0;
    SentimentAggregator aggregator(config, model);
    auto result = aggregator.initialize();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    config.top_k = 3;
    config.lexicon_path = "/nonexistent/lexicon.json";
    SentimentAggregator with_bad_lexicon(config, model);
    EXPECT_TRUE(with_bad_lexicon.initialize().is_error());
}

TEST_F(SentimentAggregatorTest, ConfigJsonRoundTrip) {
    SentimentConfig config;
    config.mode = SentimentMode::FALLBACK_ONLY;
    config.top_k = 5;
    config.classifier_timeout_ms = 250;

    SentimentConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.mode, SentimentMode::FALLBACK_ONLY);
    EXPECT_EQ(loaded.top_k, 5u);
    EXPECT_EQ(loaded.classifier_timeout_ms, 250);

    EXPECT_TRUE(sentiment_mode_from_string("fallback-only") == SentimentMode::FALLBACK_ONLY);
    EXPECT_FALSE(sentiment_mode_from_string("classifier").has_value());
}

TEST_F(SentimentAggregatorTest, SummaryToJson) {
    SentimentAggregator aggregator(config_with(SentimentMode::FALLBACK_ONLY), model);
    ASSERT_TRUE(aggregator.initialize().is_ok());

    auto json = aggregator.summarize(make_set("SPY", {"Stocks rally"})).to_json();
    EXPECT_EQ(json["ticker"], "SPY");
    EXPECT_EQ(json["count"], 1);
    EXPECT_EQ(json["method_used"], "lexicon");
    EXPECT_TRUE(json["warning"].is_null());
    ASSERT_EQ(json["top_positive"].size(), 1u);
    EXPECT_EQ(json["top_positive"][0]["title"], "Stocks rally");
}
