// include/options_ngin/data/market_data_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"

namespace options_ngin {

/**
 * @brief Source of underlying quotes and option chains
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /**
     * @brief Latest spot price of the underlying
     * @return MARKET_DATA_ERROR (or DATA_NOT_FOUND) on failure
     */
    virtual Result<Quote> get_quote(const std::string& ticker) = 0;

    /**
     * @brief Contracts of the nearest max_expirations expirations
     *
     * Expirations are normalized to the 16:00 US/Eastern cutoff.
     */
    virtual Result<std::vector<Contract>> get_option_chain(const std::string& ticker,
                                                           size_t max_expirations) = 0;
};

}  // namespace options_ngin
