// src/pipeline/pipeline_config.cpp
#include "options_ngin/pipeline/pipeline_config.hpp"
#include <cmath>

namespace options_ngin {

Result<void> PipelineConfig::validate() const {
    if (max_expirations == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_expirations must be at least 1",
                                "PipelineConfig");
    }
    if (max_workers == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_workers must be at least 1",
                                "PipelineConfig");
    }
    if (!std::isfinite(risk_free_rate)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "risk_free_rate must be finite",
                                "PipelineConfig");
    }
    if (fetch_timeout_ms <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "fetch_timeout_ms must be positive",
                                "PipelineConfig");
    }
    if (run_timeout_ms < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "run_timeout_ms must be zero (no deadline) or positive",
                                "PipelineConfig");
    }
    if (news_source == NewsSource::QUERY && news_query.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "news_query is required when news_source is 'query'",
                                "PipelineConfig");
    }

    auto scoring_valid = scoring.validate();
    if (scoring_valid.is_error()) {
        return scoring_valid;
    }
    return sentiment.validate();
}

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["tickers"] = tickers;
    j["max_expirations"] = max_expirations;
    j["risk_free_rate"] = risk_free_rate;
    j["headline_count"] = headline_count;
    j["news_source"] = news_source_to_string(news_source);
    j["news_query"] = news_query;
    j["top_per_ticker"] = top_per_ticker;
    j["max_workers"] = max_workers;
    j["fetch_timeout_ms"] = fetch_timeout_ms;
    j["run_timeout_ms"] = run_timeout_ms;
    j["scoring"] = scoring.to_json();
    j["sentiment"] = sentiment.to_json();
    j["version"] = version;
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("tickers"))
        tickers = j.at("tickers").get<std::vector<std::string>>();
    if (j.contains("max_expirations"))
        max_expirations = j.at("max_expirations").get<size_t>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("headline_count"))
        headline_count = j.at("headline_count").get<size_t>();
    if (j.contains("news_source")) {
        auto parsed = news_source_from_string(j.at("news_source").get<std::string>());
        if (parsed) {
            news_source = *parsed;
        }
    }
    if (j.contains("news_query"))
        news_query = j.at("news_query").get<std::string>();
    if (j.contains("top_per_ticker"))
        top_per_ticker = j.at("top_per_ticker").get<size_t>();
    if (j.contains("max_workers"))
        max_workers = j.at("max_workers").get<size_t>();
    if (j.contains("fetch_timeout_ms"))
        fetch_timeout_ms = j.at("fetch_timeout_ms").get<int>();
    if (j.contains("run_timeout_ms"))
        run_timeout_ms = j.at("run_timeout_ms").get<int>();
    if (j.contains("scoring"))
        scoring.from_json(j.at("scoring"));
    if (j.contains("sentiment"))
        sentiment.from_json(j.at("sentiment"));
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace options_ngin
