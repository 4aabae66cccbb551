#include <iomanip>
#include <iostream>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/data/csv_market_data_provider.hpp"
#include "options_ngin/data/csv_news_provider.hpp"
#include "options_ngin/pipeline/pipeline_orchestrator.hpp"
#include "options_ngin/pipeline/scan_config.hpp"
#include "options_ngin/pricing/black_scholes.hpp"
#include "options_ngin/sentiment/linear_sentiment_model.hpp"
#include "options_ngin/storage/results_exporter.hpp"

using namespace options_ngin;

namespace {

void print_top_records(const RunResult& run, size_t limit) {
    std::cout << "\n=== Top Opportunities ===" << std::endl;
    std::cout << std::left << std::setw(8) << "Ticker" << std::setw(6) << "Kind"
              << std::setw(10) << "Strike" << std::setw(12) << "Expiry" << std::setw(10)
              << "Market" << std::setw(10) << "Fair" << std::setw(9) << "Score"
              << std::setw(9) << "Bucket" << std::setw(6) << "Side" << "Risk" << std::endl;

    size_t shown = 0;
    for (const auto& r : run.records) {
        if (shown++ >= limit) {
            break;
        }
        std::cout << std::left << std::setw(8) << r.id.ticker << std::setw(6)
                  << option_type_to_string(r.id.type) << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.id.strike << std::setw(12)
                  << core::format_date(r.id.expiration) << std::setw(10) << r.market_price
                  << std::setw(10) << r.theoretical_value << std::setw(9) << r.composite_score
                  << std::setw(9) << scoring::recommendation_to_string(r.recommendation)
                  << std::setw(6) << side_to_string(r.side)
                  << scoring::risk_reasons_to_string(r.risk_reasons) << std::endl;
    }
}

void print_ticker_reports(const RunResult& run) {
    std::cout << "\n=== Tickers ===" << std::endl;
    for (const auto& [ticker, report] : run.reports) {
        std::cout << std::left << std::setw(8) << ticker << std::setw(20)
                  << ticker_status_to_string(report.status) << "records=" << report.records.size()
                  << " rejected=" << report.contracts_rejected << " sentiment="
                  << std::fixed << std::setprecision(3) << report.sentiment.mean << " ("
                  << report.sentiment.count << " via " << report.sentiment.method_used << ")";
        for (const auto& reason : report.reasons) {
            std::cout << " [" << reason << "]";
        }
        std::cout << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "./config.json";

        ScanConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load configuration " << config_path << ": "
                      << load_result.error()->to_string() << std::endl;
            return 1;
        }

        auto logger_init = Logger::instance().initialize(config.logger);
        if (logger_init.is_error()) {
            std::cerr << "Logger initialization failed: " << logger_init.error()->to_string()
                      << std::endl;
            return 1;
        }
        Logger::register_component("OptionsScan");
        INFO("Loaded configuration from " + config_path);

        auto valid = config.validate();
        if (valid.is_error()) {
            ERROR("Invalid configuration: " + valid.error()->to_string());
            return 1;
        }

        auto self_test = pricing::run_self_test();
        if (self_test.is_error()) {
            FATAL("Pricing engine self-test failed: " + self_test.error()->to_string());
            return 1;
        }
        INFO("Pricing engine self-test passed");

        auto market_data = std::make_shared<CsvMarketDataProvider>(config.data);
        auto market_init = market_data->initialize();
        if (market_init.is_error()) {
            ERROR("Failed to initialize market data: " + market_init.error()->to_string());
            return 1;
        }

        auto news = std::make_shared<CsvNewsProvider>(config.data, config.pipeline.news_source);
        auto news_init = news->initialize();
        if (news_init.is_error()) {
            // Missing news only degrades sentiment; every fetch will report the failure
            WARN("Headlines unavailable: " + news_init.error()->to_string());
        }

        std::shared_ptr<sentiment::SentimentModel> model;
        if (config.pipeline.sentiment.mode == sentiment::SentimentMode::AUTO) {
            model = std::make_shared<sentiment::LinearSentimentModel>(
                config.pipeline.sentiment.model_path);
        }

        PipelineOrchestrator orchestrator(config.pipeline, market_data, news, model);
        auto init_result = orchestrator.initialize();
        if (init_result.is_error()) {
            ERROR("Failed to initialize pipeline: " + init_result.error()->to_string());
            return 1;
        }

        auto run_result = orchestrator.run();
        if (run_result.is_error()) {
            ERROR("Run failed: " + run_result.error()->to_string());
            return 1;
        }
        const RunResult& run = run_result.value();

        print_ticker_reports(run);
        print_top_records(run, 20);

        ResultsExporter exporter(config.output);
        auto export_result = exporter.export_run(run);
        if (export_result.is_error()) {
            ERROR("Failed to export results: " + export_result.error()->to_string());
            return 1;
        }

        INFO("Scan finished with "
             << Logger::instance().message_count(LogLevel::WARNING) << " warning(s)");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
