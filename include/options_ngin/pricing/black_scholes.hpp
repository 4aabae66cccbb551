// include/options_ngin/pricing/black_scholes.hpp
#pragma once

#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"

namespace options_ngin {
namespace pricing {

/**
 * @brief First-order (and gamma) sensitivities
 *
 * vega is per one volatility point (0.01), rho per one rate point (0.01),
 * theta per calendar year.
 */
struct Greeks {
    double delta{0.0};
    double gamma{0.0};
    double theta{0.0};
    double vega{0.0};
    double rho{0.0};
};

/**
 * @brief Inputs of a single valuation
 */
struct PricingInputs {
    double spot{0.0};
    double strike{0.0};
    double time_to_expiry_years{0.0};
    double volatility{0.0};
    double risk_free_rate{0.0};
    OptionType type{OptionType::CALL};
};

struct PricingResult {
    double fair_value{0.0};
    Greeks greeks;
    bool degenerate{false};  // priced at intrinsic (no time value)
};

/**
 * @brief Theoretical valuation of one contract, tied to its identity
 */
struct TheoreticalResult {
    ContractId id;
    double fair_value{0.0};
    Greeks greeks;
    bool degenerate{false};

    // Inputs actually used
    double spot{0.0};
    double volatility{0.0};
    double time_to_expiry_years{0.0};
    double risk_free_rate{0.0};
};

/**
 * @brief Intrinsic value: max(S-K,0) for calls, max(K-S,0) for puts
 */
double intrinsic_value(double spot, double strike, OptionType type);

/**
 * @brief Check spot > 0, strike > 0 and that every input is finite
 */
Result<void> validate_inputs(const PricingInputs& inputs);

/**
 * @brief Closed-form Black-Scholes price and Greeks
 *
 * Expired contracts (time <= 0) and zero/negative volatility are priced at
 * intrinsic value with delta 1{S>K} (call) or -1{S<K} (put) and all other
 * Greeks zero. fair_value is always finite and non-negative for valid
 * inputs. Pure function.
 *
 * @return INVALID_ARGUMENT if validate_inputs fails
 */
Result<PricingResult> price(const PricingInputs& inputs);

Result<PricingResult> price(double spot, double strike, double time_to_expiry_years,
                            double volatility, double risk_free_rate, OptionType type);

/**
 * @brief Value a chain contract against its underlying quote
 *
 * Time to expiry is measured from the quote timestamp to the contract's
 * normalized expiration. Contracts without usable implied volatility are
 * priced with zero volatility (intrinsic).
 */
Result<TheoreticalResult> price_contract(const Contract& contract, const Quote& quote,
                                         double risk_free_rate);

/**
 * @brief Fixed-input regression check of the engine
 *
 * S=100, K=100, T=0.5, vol=0.2, r=0.05 must give call 6.8887 and put 4.4197
 * within SELF_TEST_TOLERANCE, satisfy put-call parity, and price T=0 at
 * intrinsic. Run at startup before any scoring.
 */
Result<void> run_self_test();

constexpr double SELF_TEST_TOLERANCE = 1e-2;
constexpr double SELF_TEST_CALL_REFERENCE = 6.8887;
constexpr double SELF_TEST_PUT_REFERENCE = 4.4197;

}  // namespace pricing
}  // namespace options_ngin
