// src/data/csv_market_data_provider.cpp
#include "options_ngin/data/csv_market_data_provider.hpp"
#include <algorithm>
#include <set>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/data/conversion_utils.hpp"

namespace options_ngin {

CsvMarketDataProvider::CsvMarketDataProvider(CsvSnapshotConfig config)
    : config_(std::move(config)) {}

Result<void> CsvMarketDataProvider::initialize() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }

    auto table = DataConversionUtils::read_csv(config_.quotes_path(),
                                               DataConversionUtils::quote_column_types());
    if (table.is_error()) {
        return forward_error<void>(*table.error(), "CsvMarketDataProvider",
                                   "Failed to load quotes");
    }

    auto quotes = DataConversionUtils::arrow_table_to_quotes(table.value());
    if (quotes.is_error()) {
        return forward_error<void>(*quotes.error(), "CsvMarketDataProvider",
                                   "Invalid quotes file " + config_.quotes_path());
    }

    quotes_.clear();
    for (const auto& quote : quotes.value()) {
        // A later row for the same ticker is a newer snapshot
        quotes_[quote.ticker] = quote;
    }
    initialized_.store(true, std::memory_order_release);
    INFO("Loaded " + std::to_string(quotes_.size()) + " quotes from " + config_.quotes_path());
    return Result<void>();
}

Result<Quote> CsvMarketDataProvider::get_quote(const std::string& ticker) {
    if (!initialized_.load(std::memory_order_acquire)) {
        return make_error<Quote>(ErrorCode::NOT_INITIALIZED, "Provider not initialized",
                                 "CsvMarketDataProvider");
    }

    auto it = quotes_.find(ticker);
    if (it == quotes_.end()) {
        return make_error<Quote>(ErrorCode::DATA_NOT_FOUND, "No quote for " + ticker,
                                 "CsvMarketDataProvider");
    }
    return it->second;
}

Result<std::vector<Contract>> CsvMarketDataProvider::get_option_chain(const std::string& ticker,
                                                                      size_t max_expirations) {
    const std::string path = config_.chain_path(ticker);
    auto table = DataConversionUtils::read_csv(path, DataConversionUtils::chain_column_types());
    if (table.is_error()) {
        return make_error<std::vector<Contract>>(
            ErrorCode::MARKET_DATA_ERROR,
            "Option chain unavailable for " + ticker + ": " + table.error()->what(),
            "CsvMarketDataProvider");
    }

    auto contracts = DataConversionUtils::arrow_table_to_contracts(table.value(), ticker);
    if (contracts.is_error()) {
        return make_error<std::vector<Contract>>(
            ErrorCode::MARKET_DATA_ERROR,
            "Invalid option chain " + path + ": " + contracts.error()->what(),
            "CsvMarketDataProvider");
    }

    std::set<Timestamp> expirations;
    for (const auto& contract : contracts.value()) {
        expirations.insert(contract.id.expiration);
    }
    if (expirations.size() <= max_expirations) {
        return contracts.value();
    }

    auto cutoff = std::next(expirations.begin(), static_cast<std::ptrdiff_t>(max_expirations));
    std::set<Timestamp> kept(expirations.begin(), cutoff);
    std::vector<Contract> selected;
    for (const auto& contract : contracts.value()) {
        if (kept.count(contract.id.expiration) > 0) {
            selected.push_back(contract);
        }
    }
    DEBUG(ticker + ": kept " + std::to_string(selected.size()) + " of " +
          std::to_string(contracts.value().size()) + " contracts in the first " +
          std::to_string(max_expirations) + " expirations");
    return selected;
}

}  // namespace options_ngin
