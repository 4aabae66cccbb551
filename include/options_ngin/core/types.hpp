// include/options_ngin/core/types.hpp

#pragma once

#include <cctype>
#include <chrono>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace options_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // No directional view
};

/**
 * @brief Option kind
 */
enum class OptionType { CALL, PUT };

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "buy";
        case Side::SELL:
            return "sell";
        default:
            return "none";
    }
}

inline std::string option_type_to_string(OptionType type) {
    return type == OptionType::CALL ? "call" : "put";
}

/**
 * @brief Parse "call"/"put" (any case, "C"/"P" accepted)
 */
inline std::optional<OptionType> option_type_from_string(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "call" || lower == "c")
        return OptionType::CALL;
    if (lower == "put" || lower == "p")
        return OptionType::PUT;
    return std::nullopt;
}

/**
 * @brief Underlying quote snapshot, one per ticker per run
 */
struct Quote {
    std::string ticker;
    Price spot{0.0};
    Timestamp timestamp;

    Quote() = default;
    Quote(std::string t, Price s, Timestamp ts) : ticker(std::move(t)), spot(s), timestamp(ts) {}
};

/**
 * @brief Contract identity: (ticker, kind, strike, expiration)
 */
struct ContractId {
    std::string ticker;
    OptionType type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;

    bool operator==(const ContractId& other) const {
        return ticker == other.ticker && type == other.type && strike == other.strike &&
               expiration == other.expiration;
    }
    bool operator!=(const ContractId& other) const {
        return !(*this == other);
    }
    bool operator<(const ContractId& other) const {
        return std::tie(ticker, type, strike, expiration) <
               std::tie(other.ticker, other.type, other.strike, other.expiration);
    }
};

/**
 * @brief One option contract from a chain snapshot
 *
 * Quote fields that a provider may not supply are optional. Derived
 * fields (mid, spread, usable volatility) are computed on demand.
 */
struct Contract {
    ContractId id;
    std::string contract_symbol;
    Price last_price{0.0};
    std::optional<Price> bid;
    std::optional<Price> ask;
    std::optional<double> implied_volatility;
    std::optional<double> open_interest;
    std::optional<double> volume;

    // Volatility above this is treated as a bad print
    static constexpr double MAX_USABLE_VOLATILITY = 5.0;

    bool has_two_sided_market() const {
        return bid.has_value() && ask.has_value() && *bid > 0.0 && *ask > 0.0;
    }

    /**
     * @brief Mid of bid/ask when both are positive, otherwise last price
     */
    Price market_price() const {
        if (has_two_sided_market()) {
            return (*bid + *ask) / 2.0;
        }
        return last_price > 0.0 ? last_price : 0.0;
    }

    std::optional<Price> spread() const {
        if (!has_two_sided_market()) {
            return std::nullopt;
        }
        return *ask - *bid;
    }

    /**
     * @brief Implied volatility if present and within (0, MAX_USABLE_VOLATILITY)
     */
    std::optional<double> usable_volatility() const {
        if (implied_volatility && *implied_volatility > 0.0 &&
            *implied_volatility < MAX_USABLE_VOLATILITY) {
            return implied_volatility;
        }
        return std::nullopt;
    }

    double activity() const {
        return volume.value_or(0.0) + open_interest.value_or(0.0);
    }
};

/**
 * @brief A single fetched headline
 */
struct Headline {
    std::string text;
    std::string source;
    Timestamp published_at;
    std::string url;

    Headline() = default;
    Headline(std::string t, std::string s, Timestamp ts, std::string u = "")
        : text(std::move(t)), source(std::move(s)), published_at(ts), url(std::move(u)) {}
};

/**
 * @brief Headlines for one ticker in fetch order
 */
struct HeadlineSet {
    std::string ticker;
    std::vector<Headline> headlines;

    bool empty() const {
        return headlines.empty();
    }
    size_t size() const {
        return headlines.size();
    }
};

}  // namespace options_ngin
