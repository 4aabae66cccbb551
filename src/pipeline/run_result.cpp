// src/pipeline/run_result.cpp
#include "options_ngin/pipeline/run_result.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {

nlohmann::json TickerReport::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    j["status"] = ticker_status_to_string(status);
    j["reasons"] = reasons;
    j["warnings"] = warnings;
    if (quote) {
        j["quote"] = {{"spot", quote->spot},
                      {"timestamp", core::format_iso8601(quote->timestamp)}};
    } else {
        j["quote"] = nullptr;
    }
    j["sentiment"] = sentiment.to_json();
    j["contracts_received"] = contracts_received;
    j["contracts_rejected"] = contracts_rejected;
    j["record_count"] = records.size();
    return j;
}

size_t RunResult::count_with_status(TickerStatus status) const {
    size_t count = 0;
    for (const auto& [ticker, report] : reports) {
        if (report.status == status) {
            ++count;
        }
    }
    return count;
}

nlohmann::json RunResult::to_json() const {
    nlohmann::json j;
    j["started_at"] = core::format_iso8601(started_at);
    j["finished_at"] = core::format_iso8601(finished_at);
    j["cancelled"] = cancelled;
    j["record_count"] = records.size();

    nlohmann::json tickers = nlohmann::json::object();
    for (const auto& [ticker, report] : reports) {
        tickers[ticker] = report.to_json();
    }
    j["tickers"] = tickers;
    return j;
}

}  // namespace options_ngin
