// src/pipeline/pipeline_orchestrator.cpp
#include "options_ngin/pipeline/pipeline_orchestrator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>
#include <thread>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/call_with_timeout.hpp"
#include "options_ngin/pricing/black_scholes.hpp"

namespace options_ngin {

namespace {

constexpr size_t MAX_TICKER_LENGTH = 12;

bool valid_optional_field(const std::optional<double>& value) {
    return !value || (std::isfinite(*value) && *value >= 0.0);
}

}  // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineConfig config,
                                           std::shared_ptr<MarketDataProvider> market_data,
                                           std::shared_ptr<NewsProvider> news,
                                           std::shared_ptr<sentiment::SentimentModel> model,
                                           std::shared_ptr<const scoring::ContractScorer> scorer)
    : config_(std::move(config)),
      market_data_(std::move(market_data)),
      news_(std::move(news)),
      model_(std::move(model)),
      scorer_(std::move(scorer)) {
    if (!scorer_) {
        scorer_ = std::make_shared<scoring::ContractScorer>(config_.scoring);
    }
}

Result<void> PipelineOrchestrator::initialize() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }
    if (!market_data_ || !news_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Market data and news providers are required",
                                "PipelineOrchestrator");
    }

    auto self_test = pricing::run_self_test();
    if (self_test.is_error()) {
        ERROR("Pricing self-test failed: " + self_test.error()->to_string());
        return self_test;
    }

    initialized_ = true;
    INFO("Pipeline initialized: " + std::to_string(config_.max_workers) + " workers, " +
         std::to_string(config_.max_expirations) + " expirations, sentiment mode " +
         sentiment::sentiment_mode_to_string(config_.sentiment.mode));
    return Result<void>();
}

void PipelineOrchestrator::cancel() {
    cancel_requested_.store(true, std::memory_order_release);
    INFO("Cancellation requested, no new tickers will be started");
}

std::optional<std::string> PipelineOrchestrator::normalize_ticker(const std::string& raw) {
    std::string ticker;
    for (char c : raw) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            continue;
        }
        if (!std::isalnum(uc) && c != '.' && c != '-' && c != '^' && c != '=') {
            return std::nullopt;
        }
        ticker.push_back(static_cast<char>(std::toupper(uc)));
    }
    if (ticker.empty() || ticker.size() > MAX_TICKER_LENGTH) {
        return std::nullopt;
    }
    return ticker;
}

std::string PipelineOrchestrator::validate_contract(const Contract& contract,
                                                    const std::string& ticker) {
    if (contract.id.ticker != ticker) {
        return "contract belongs to " + contract.id.ticker;
    }
    if (!std::isfinite(contract.id.strike) || contract.id.strike <= 0.0) {
        return "strike must be positive";
    }
    if (!std::isfinite(contract.last_price) || contract.last_price < 0.0) {
        return "last price must be finite and non-negative";
    }
    if (!valid_optional_field(contract.bid) || !valid_optional_field(contract.ask)) {
        return "bid/ask must be finite and non-negative";
    }
    if (!valid_optional_field(contract.volume) || !valid_optional_field(contract.open_interest)) {
        return "volume/open interest must be finite and non-negative";
    }
    if (contract.implied_volatility && !std::isfinite(*contract.implied_volatility)) {
        return "implied volatility must be finite";
    }
    return "";
}

bool PipelineOrchestrator::should_stop(std::chrono::steady_clock::time_point deadline) const {
    if (is_cancel_requested()) {
        return true;
    }
    return config_.run_timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline;
}

Result<RunResult> PipelineOrchestrator::run() {
    return run(config_.tickers);
}

Result<RunResult> PipelineOrchestrator::run(const std::vector<std::string>& tickers) {
    if (!initialized_) {
        return make_error<RunResult>(ErrorCode::NOT_INITIALIZED,
                                     "Pipeline orchestrator not initialized",
                                     "PipelineOrchestrator");
    }

    RunResult result;
    result.started_at = std::chrono::system_clock::now();
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.run_timeout_ms);

    // One aggregator per run: the model is loaded once here and unloaded when it goes out of scope
    sentiment::SentimentAggregator aggregator(config_.sentiment, model_);
    auto sentiment_ready = aggregator.initialize();
    if (sentiment_ready.is_error()) {
        return forward_error<RunResult>(*sentiment_ready.error(), "PipelineOrchestrator");
    }

    // Normalize and de-duplicate, keeping first occurrence order
    std::vector<std::string> work;
    for (const auto& raw : tickers) {
        auto normalized = normalize_ticker(raw);
        if (!normalized) {
            WARN("Skipping invalid ticker '" + raw + "'");
            TickerReport report;
            report.ticker = raw;
            report.status = TickerStatus::SKIPPED;
            report.reasons.push_back("invalid ticker symbol");
            report.sentiment.ticker = raw;
            result.reports[raw] = std::move(report);
            continue;
        }
        if (std::find(work.begin(), work.end(), *normalized) == work.end()) {
            work.push_back(*normalized);
        }
    }

    std::vector<std::optional<TickerReport>> slots(work.size());
    std::atomic<size_t> next_index{0};

    // First scorer contract violation; once set no further tickers start
    std::atomic<bool> violated{false};
    std::mutex violation_mutex;
    std::optional<std::string> violation;

    auto worker = [&]() {
        Logger::register_component("PipelineWorker");
        while (!violated.load(std::memory_order_acquire) && !should_stop(deadline)) {
            size_t index = next_index.fetch_add(1);
            if (index >= work.size()) {
                break;
            }
            try {
                slots[index] = process_ticker(work[index], aggregator);
            } catch (const TradeError& e) {
                if (e.code() != ErrorCode::CONTRACT_VIOLATION) {
                    slots[index] = failed_ticker_report(work[index], e.to_string());
                    continue;
                }
                FATAL("Contract violation while scoring " + work[index] + ": " + e.to_string());
                std::lock_guard<std::mutex> lock(violation_mutex);
                if (!violation) {
                    violation = work[index] + ": " + e.what();
                }
                violated.store(true, std::memory_order_release);
            } catch (const std::exception& e) {
                slots[index] = failed_ticker_report(work[index], e.what());
            }
        }
    };

    const size_t worker_count = std::min(config_.max_workers, std::max<size_t>(work.size(), 1));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (violation) {
        cancel_requested_.store(false, std::memory_order_release);
        return make_error<RunResult>(ErrorCode::CONTRACT_VIOLATION,
                                     "Scoring aborted, contract violated for " + *violation,
                                     "PipelineOrchestrator");
    }

    for (size_t i = 0; i < work.size(); ++i) {
        if (!slots[i]) {
            TickerReport report;
            report.ticker = work[i];
            report.status = TickerStatus::CANCELLED;
            report.reasons.push_back(is_cancel_requested() ? "run cancelled"
                                                           : "run deadline exceeded");
            report.sentiment.ticker = work[i];
            slots[i] = std::move(report);
            result.cancelled = true;
        }
        TickerReport& report = *slots[i];
        result.records.insert(result.records.end(), report.records.begin(),
                              report.records.end());
        result.reports[report.ticker] = std::move(report);
    }

    scoring::rank_records(result.records);
    result.finished_at = std::chrono::system_clock::now();
    cancel_requested_.store(false, std::memory_order_release);

    INFO("Run complete: " + std::to_string(result.records.size()) + " records, " +
         std::to_string(result.count_with_status(TickerStatus::OK)) + " ok, " +
         std::to_string(result.count_with_status(TickerStatus::DEGRADED_SENTIMENT)) +
         " degraded, " + std::to_string(result.count_with_status(TickerStatus::SKIPPED)) +
         " skipped, " + std::to_string(result.count_with_status(TickerStatus::CANCELLED)) +
         " cancelled");
    return result;
}

TickerReport PipelineOrchestrator::failed_ticker_report(const std::string& ticker,
                                                    const std::string& what) {
    ERROR("Unexpected failure processing " + ticker + ": " + what);
    TickerReport report;
    report.ticker = ticker;
    report.status = TickerStatus::SKIPPED;
    report.reasons.push_back("internal error: " + what);
    report.sentiment.ticker = ticker;
    return report;
}

TickerReport PipelineOrchestrator::process_ticker(
    const std::string& ticker, sentiment::SentimentAggregator& aggregator) const {
    TickerReport report;
    report.ticker = ticker;
    const auto timeout = std::chrono::milliseconds(config_.fetch_timeout_ms);

    // Market data
    std::optional<std::string> skip_reason;
    std::vector<Contract> chain;
    auto market_data = market_data_;
    auto quote = call_with_timeout<Quote>(
        [market_data, ticker]() { return market_data->get_quote(ticker); }, timeout,
        "Quote fetch for " + ticker);
    if (quote.is_error()) {
        skip_reason = std::string("quote unavailable: ") + quote.error()->what();
    } else if (!std::isfinite(quote.value().spot) || quote.value().spot <= 0.0) {
        skip_reason = "quote has non-positive spot " + std::to_string(quote.value().spot);
    } else if (quote.value().ticker != ticker) {
        skip_reason = "quote returned for " + quote.value().ticker;
    } else {
        report.quote = quote.value();
        const size_t max_expirations = config_.max_expirations;
        auto fetched = call_with_timeout<std::vector<Contract>>(
            [market_data, ticker, max_expirations]() {
                return market_data->get_option_chain(ticker, max_expirations);
            },
            timeout, "Option chain fetch for " + ticker);
        if (fetched.is_error()) {
            skip_reason = std::string("option chain unavailable: ") + fetched.error()->what();
        } else if (fetched.value().empty()) {
            skip_reason = "option chain is empty";
        } else {
            chain = fetched.take();
        }
    }

    // Headlines are fetched even for skipped tickers so the report carries sentiment
    HeadlineSet headline_set;
    headline_set.ticker = ticker;
    auto news = news_;
    const std::string news_key =
        config_.news_source == NewsSource::TICKER ? ticker : config_.news_query;
    const size_t headline_count = config_.headline_count;
    auto headlines = call_with_timeout<std::vector<Headline>>(
        [news, news_key, headline_count]() {
            return news->get_headlines(news_key, headline_count);
        },
        timeout, "Headline fetch for " + ticker);
    bool degraded = false;
    if (headlines.is_error()) {
        std::string warning = std::string("headlines unavailable: ") + headlines.error()->what();
        WARN(ticker + ": " + warning);
        report.warnings.push_back(warning);
        degraded = true;
    } else {
        headline_set.headlines = headlines.take();
    }

    report.sentiment = aggregator.summarize(headline_set);
    if (report.sentiment.degraded) {
        degraded = true;
        if (report.sentiment.warning) {
            report.warnings.push_back(*report.sentiment.warning);
        }
    }

    if (skip_reason) {
        WARN("Skipping " + ticker + ": " + *skip_reason);
        report.status = TickerStatus::SKIPPED;
        report.reasons.push_back(*skip_reason);
        return report;
    }

    score_chain(*report.quote, chain, report.sentiment, report);
    report.status = degraded ? TickerStatus::DEGRADED_SENTIMENT : TickerStatus::OK;
    INFO(ticker + ": scored " + std::to_string(report.records.size()) + " of " +
         std::to_string(report.contracts_received) + " contracts (" +
         std::to_string(report.contracts_rejected) + " rejected), sentiment " +
         std::to_string(report.sentiment.mean) + " via " + report.sentiment.method_used);
    return report;
}

void PipelineOrchestrator::score_chain(const Quote& quote, const std::vector<Contract>& chain,
                                       const sentiment::SentimentSummary& summary,
                                       TickerReport& report) const {
    report.contracts_received = chain.size();
    for (const auto& contract : chain) {
        std::string invalid = validate_contract(contract, quote.ticker);
        if (!invalid.empty()) {
            WARN("Rejected " + quote.ticker + " contract '" + contract.contract_symbol +
                 "': " + invalid);
            ++report.contracts_rejected;
            continue;
        }

        auto theo = pricing::price_contract(contract, quote, config_.risk_free_rate);
        if (theo.is_error()) {
            WARN("Rejected " + quote.ticker + " contract '" + contract.contract_symbol +
                 "': " + theo.error()->what());
            ++report.contracts_rejected;
            continue;
        }

        scoring::OpportunityRecord record = scorer_->score(contract, theo.value(), summary);
        DEBUG(contract.contract_symbol + " fair=" + std::to_string(record.theoretical_value) +
              " market=" + std::to_string(record.market_price) +
              " score=" + std::to_string(record.composite_score));
        report.records.push_back(std::move(record));
    }

    scoring::rank_records(report.records);
    if (config_.top_per_ticker > 0 && report.records.size() > config_.top_per_ticker) {
        report.records.resize(config_.top_per_ticker);
    }
    if (report.records.empty()) {
        report.warnings.push_back("no contract could be scored");
    }
}

}  // namespace options_ngin
