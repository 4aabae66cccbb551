// include/options_ngin/data/csv_market_data_provider.hpp
#pragma once

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>
#include "options_ngin/data/csv_snapshot_config.hpp"
#include "options_ngin/data/market_data_provider.hpp"

namespace options_ngin {

/**
 * @brief Market data served from a CSV snapshot directory
 *
 * Quotes are loaded once by initialize(); chains are read from disk on each
 * request so a snapshot can be refreshed between runs.
 */
class CsvMarketDataProvider : public MarketDataProvider {
public:
    explicit CsvMarketDataProvider(CsvSnapshotConfig config);

    /**
     * @brief Load the quotes file
     * @return Error if the quotes file is missing or malformed
     */
    Result<void> initialize();

    Result<Quote> get_quote(const std::string& ticker) override;

    /**
     * @brief Contracts of the nearest max_expirations expiration dates, in file order
     */
    Result<std::vector<Contract>> get_option_chain(const std::string& ticker,
                                                   size_t max_expirations) override;

    size_t quote_count() const {
        return quotes_.size();
    }

private:
    CsvSnapshotConfig config_;
    std::unordered_map<std::string, Quote> quotes_;
    std::atomic<bool> initialized_{false};
};

}  // namespace options_ngin
