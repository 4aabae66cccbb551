// src/pricing/black_scholes.cpp
#include "options_ngin/pricing/black_scholes.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace pricing {

namespace {
constexpr double SQRT_2PI = 2.506628274631000502415765284811045253006;
constexpr double SQRT_2 = 1.414213562373095048801688724209698078570;

// erfc keeps precision in the far tails where 1 + erf(x) cancels
double norm_cdf(double x) {
    return 0.5 * std::erfc(-x / SQRT_2);
}

double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

PricingResult degenerate_result(const PricingInputs& in) {
    PricingResult result;
    result.degenerate = true;
    result.fair_value = intrinsic_value(in.spot, in.strike, in.type);
    if (in.type == OptionType::CALL) {
        result.greeks.delta = in.spot > in.strike ? 1.0 : 0.0;
    } else {
        result.greeks.delta = in.spot < in.strike ? -1.0 : 0.0;
    }
    return result;
}

}  // namespace

double intrinsic_value(double spot, double strike, OptionType type) {
    if (type == OptionType::CALL) {
        return std::max(0.0, spot - strike);
    }
    return std::max(0.0, strike - spot);
}

Result<void> validate_inputs(const PricingInputs& in) {
    if (!std::isfinite(in.spot) || !std::isfinite(in.strike) ||
        !std::isfinite(in.time_to_expiry_years) || !std::isfinite(in.volatility) ||
        !std::isfinite(in.risk_free_rate)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Pricing inputs must be finite",
                                "BlackScholes");
    }
    if (in.spot <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Spot must be positive, got " + std::to_string(in.spot),
                                "BlackScholes");
    }
    if (in.strike <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Strike must be positive, got " + std::to_string(in.strike),
                                "BlackScholes");
    }
    return Result<void>();
}

Result<PricingResult> price(const PricingInputs& in) {
    auto valid = validate_inputs(in);
    if (valid.is_error()) {
        return forward_error<PricingResult>(*valid.error(), "BlackScholes");
    }

    if (in.time_to_expiry_years <= 0.0 || in.volatility <= 0.0) {
        return degenerate_result(in);
    }

    const double S = in.spot;
    const double K = in.strike;
    const double t = in.time_to_expiry_years;
    const double r = in.risk_free_rate;
    const double vol = in.volatility;

    const double sqrt_t = std::sqrt(t);
    const double vol_sqrt_t = vol * sqrt_t;
    const double d1 = (std::log(S / K) + (r + 0.5 * vol * vol) * t) / vol_sqrt_t;
    const double d2 = d1 - vol_sqrt_t;
    const double discount = std::exp(-r * t);
    const double pdf_d1 = norm_pdf(d1);

    PricingResult result;
    if (in.type == OptionType::CALL) {
        result.fair_value = S * norm_cdf(d1) - K * discount * norm_cdf(d2);
        result.greeks.delta = norm_cdf(d1);
        result.greeks.theta = -S * vol * pdf_d1 / (2.0 * sqrt_t) - r * K * discount * norm_cdf(d2);
        result.greeks.rho = K * t * discount * norm_cdf(d2) / 100.0;
    } else {
        result.fair_value = K * discount * norm_cdf(-d2) - S * norm_cdf(-d1);
        result.greeks.delta = norm_cdf(d1) - 1.0;
        result.greeks.theta = -S * vol * pdf_d1 / (2.0 * sqrt_t) + r * K * discount * norm_cdf(-d2);
        result.greeks.rho = -K * t * discount * norm_cdf(-d2) / 100.0;
    }
    result.greeks.gamma = pdf_d1 / (S * vol_sqrt_t);
    result.greeks.vega = S * sqrt_t * pdf_d1 / 100.0;

    if (!std::isfinite(result.fair_value)) {
        // d1/d2 overflow only for extreme ratios; the limit is intrinsic
        return degenerate_result(in);
    }
    // Deep out-of-the-money values can round a hair below zero
    result.fair_value = std::max(0.0, result.fair_value);
    return result;
}

Result<PricingResult> price(double spot, double strike, double time_to_expiry_years,
                            double volatility, double risk_free_rate, OptionType type) {
    PricingInputs inputs;
    inputs.spot = spot;
    inputs.strike = strike;
    inputs.time_to_expiry_years = time_to_expiry_years;
    inputs.volatility = volatility;
    inputs.risk_free_rate = risk_free_rate;
    inputs.type = type;
    return price(inputs);
}

Result<TheoreticalResult> price_contract(const Contract& contract, const Quote& quote,
                                         double risk_free_rate) {
    if (contract.id.ticker != quote.ticker) {
        return make_error<TheoreticalResult>(
            ErrorCode::CONTRACT_VIOLATION,
            "Quote for " + quote.ticker + " used to price a " + contract.id.ticker + " contract",
            "BlackScholes");
    }

    PricingInputs inputs;
    inputs.spot = quote.spot;
    inputs.strike = contract.id.strike;
    inputs.time_to_expiry_years = core::year_fraction(quote.timestamp, contract.id.expiration);
    inputs.volatility = contract.usable_volatility().value_or(0.0);
    inputs.risk_free_rate = risk_free_rate;
    inputs.type = contract.id.type;

    auto priced = price(inputs);
    if (priced.is_error()) {
        return forward_error<TheoreticalResult>(*priced.error(), "BlackScholes");
    }

    TheoreticalResult theo;
    theo.id = contract.id;
    theo.fair_value = priced.value().fair_value;
    theo.greeks = priced.value().greeks;
    theo.degenerate = priced.value().degenerate;
    theo.spot = inputs.spot;
    theo.volatility = inputs.volatility;
    theo.time_to_expiry_years = inputs.time_to_expiry_years;
    theo.risk_free_rate = inputs.risk_free_rate;
    return theo;
}

Result<void> run_self_test() {
    auto call = price(100.0, 100.0, 0.5, 0.2, 0.05, OptionType::CALL);
    auto put = price(100.0, 100.0, 0.5, 0.2, 0.05, OptionType::PUT);
    if (call.is_error() || put.is_error()) {
        return make_error<void>(ErrorCode::SELF_TEST_FAILED,
                                "Reference inputs rejected by the pricing engine",
                                "BlackScholes");
    }

    const double c = call.value().fair_value;
    const double p = put.value().fair_value;
    if (std::abs(c - SELF_TEST_CALL_REFERENCE) > SELF_TEST_TOLERANCE ||
        std::abs(p - SELF_TEST_PUT_REFERENCE) > SELF_TEST_TOLERANCE) {
        std::ostringstream ss;
        ss << "Reference valuation drifted: call=" << c << " (expected "
           << SELF_TEST_CALL_REFERENCE << "), put=" << p << " (expected "
           << SELF_TEST_PUT_REFERENCE << ")";
        return make_error<void>(ErrorCode::SELF_TEST_FAILED, ss.str(), "BlackScholes");
    }

    // C - P = S - K e^{-rT}
    const double parity = 100.0 - 100.0 * std::exp(-0.05 * 0.5);
    if (std::abs((c - p) - parity) > 1e-9) {
        return make_error<void>(ErrorCode::SELF_TEST_FAILED, "Put-call parity violated",
                                "BlackScholes");
    }

    auto expired = price(110.0, 100.0, 0.0, 0.2, 0.05, OptionType::CALL);
    if (expired.is_error() || expired.value().fair_value != 10.0) {
        return make_error<void>(ErrorCode::SELF_TEST_FAILED,
                                "Expired contract not priced at intrinsic value",
                                "BlackScholes");
    }

    return Result<void>();
}

}  // namespace pricing
}  // namespace options_ngin
