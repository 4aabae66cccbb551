// src/data/conversion_utils.cpp
#include "options_ngin/data/conversion_utils.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <cmath>
#include <filesystem>
#include <limits>
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {

namespace {

using ColumnTypes = std::map<std::string, std::shared_ptr<arrow::DataType>>;

}  // namespace

const ColumnTypes& DataConversionUtils::quote_column_types() {
    static const ColumnTypes types = {
        {"ticker", arrow::utf8()},
        {"spot", arrow::float64()},
        {"timestamp", arrow::utf8()},
    };
    return types;
}

const ColumnTypes& DataConversionUtils::chain_column_types() {
    static const ColumnTypes types = {
        {"ticker", arrow::utf8()},         {"expiration", arrow::utf8()},
        {"option_type", arrow::utf8()},    {"contractSymbol", arrow::utf8()},
        {"strike", arrow::float64()},      {"lastPrice", arrow::float64()},
        {"bid", arrow::float64()},         {"ask", arrow::float64()},
        {"volume", arrow::float64()},      {"openInterest", arrow::float64()},
        {"impliedVolatility", arrow::float64()},
    };
    return types;
}

const ColumnTypes& DataConversionUtils::news_column_types() {
    static const ColumnTypes types = {
        {"title", arrow::utf8()}, {"source", arrow::utf8()}, {"publishedAt", arrow::utf8()},
        {"url", arrow::utf8()},   {"query", arrow::utf8()},  {"ticker", arrow::utf8()},
    };
    return types;
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::read_csv(
    const std::string& filepath, const ColumnTypes& column_types) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_NOT_FOUND, "File not found: " + filepath, "DataConversionUtils");
    }

    auto input = arrow::io::ReadableFile::Open(filepath);
    if (!input.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + filepath + ": " + input.status().ToString(),
            "DataConversionUtils");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const auto& entry : column_types) {
        convert_options.column_types[entry.first] = entry.second;
    }
    convert_options.strings_can_be_null = true;

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_DATA,
            "Failed to create CSV reader for " + filepath + ": " + reader.status().ToString(),
            "DataConversionUtils");
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_DATA,
            "Failed to parse " + filepath + ": " + table.status().ToString(),
            "DataConversionUtils");
    }

    auto combined = (*table)->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks of " + filepath + ": " + combined.status().ToString(),
            "DataConversionUtils");
    }
    return *combined;
}

Result<std::vector<Quote>> DataConversionUtils::arrow_table_to_quotes(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Quote>>(ErrorCode::INVALID_ARGUMENT,
                                              "Table pointer is null", "DataConversionUtils");
    }

    auto ticker_col = get_column(table, "ticker", true);
    auto spot_col = get_column(table, "spot", true);
    auto ts_col = get_column(table, "timestamp", true);
    for (const auto* col : {&ticker_col, &spot_col, &ts_col}) {
        if (col->is_error()) {
            return forward_error<std::vector<Quote>>(*col->error(), "DataConversionUtils");
        }
    }

    std::vector<Quote> quotes;
    quotes.reserve(table->num_rows());
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        Quote quote;
        quote.ticker = extract_string(ticker_col.value(), i);

        auto spot = extract_double(spot_col.value(), i);
        if (spot.is_error()) {
            return forward_error<std::vector<Quote>>(
                *spot.error(), "DataConversionUtils",
                "Row " + std::to_string(i) + " (" + quote.ticker + ")");
        }
        quote.spot = spot.value();

        std::string ts_text = extract_string(ts_col.value(), i);
        auto ts = core::parse_iso8601(ts_text);
        if (!ts) {
            return make_error<std::vector<Quote>>(
                ErrorCode::CONVERSION_ERROR,
                "Row " + std::to_string(i) + ": invalid timestamp '" + ts_text + "'",
                "DataConversionUtils");
        }
        quote.timestamp = *ts;
        quotes.push_back(std::move(quote));
    }
    return quotes;
}

Result<std::vector<Contract>> DataConversionUtils::arrow_table_to_contracts(
    const std::shared_ptr<arrow::Table>& table, const std::string& ticker) {
    if (!table) {
        return make_error<std::vector<Contract>>(ErrorCode::INVALID_ARGUMENT,
                                                 "Table pointer is null", "DataConversionUtils");
    }

    auto expiration_col = get_column(table, "expiration", true);
    auto type_col = get_column(table, "option_type", true);
    auto strike_col = get_column(table, "strike", true);
    for (const auto* col : {&expiration_col, &type_col, &strike_col}) {
        if (col->is_error()) {
            return forward_error<std::vector<Contract>>(*col->error(), "DataConversionUtils");
        }
    }
    // Optional columns come back as nullptr when absent
    auto ticker_col = get_column(table, "ticker", false);
    auto symbol_col = get_column(table, "contractSymbol", false);
    auto last_col = get_column(table, "lastPrice", false);
    auto bid_col = get_column(table, "bid", false);
    auto ask_col = get_column(table, "ask", false);
    auto volume_col = get_column(table, "volume", false);
    auto oi_col = get_column(table, "openInterest", false);
    auto iv_col = get_column(table, "impliedVolatility", false);
    for (const auto* col :
         {&ticker_col, &symbol_col, &last_col, &bid_col, &ask_col, &volume_col, &oi_col, &iv_col}) {
        if (col->is_error()) {
            return forward_error<std::vector<Contract>>(*col->error(), "DataConversionUtils");
        }
    }

    std::vector<Contract> contracts;
    contracts.reserve(table->num_rows());
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        std::string row_ticker = extract_string(ticker_col.value(), i);
        if (!row_ticker.empty() && row_ticker != ticker) {
            return make_error<std::vector<Contract>>(
                ErrorCode::INVALID_DATA,
                "Row " + std::to_string(i) + " belongs to " + row_ticker + ", expected " + ticker,
                "DataConversionUtils");
        }

        std::string type_text = extract_string(type_col.value(), i);
        auto type = option_type_from_string(type_text);
        if (!type) {
            return make_error<std::vector<Contract>>(
                ErrorCode::CONVERSION_ERROR,
                "Row " + std::to_string(i) + ": invalid option type '" + type_text + "'",
                "DataConversionUtils");
        }

        std::string expiration_text = extract_string(expiration_col.value(), i);
        auto expiration = core::parse_expiration_date(expiration_text);
        if (!expiration) {
            return make_error<std::vector<Contract>>(
                ErrorCode::CONVERSION_ERROR,
                "Row " + std::to_string(i) + ": invalid expiration '" + expiration_text + "'",
                "DataConversionUtils");
        }

        Contract contract;
        contract.id.ticker = ticker;
        contract.id.type = *type;
        contract.id.expiration = *expiration;
        contract.id.strike = extract_optional_double(strike_col.value(), i)
                                 .value_or(std::numeric_limits<double>::quiet_NaN());
        contract.contract_symbol = extract_string(symbol_col.value(), i);
        contract.last_price = extract_optional_double(last_col.value(), i).value_or(0.0);
        contract.bid = extract_optional_double(bid_col.value(), i);
        contract.ask = extract_optional_double(ask_col.value(), i);
        contract.volume = extract_optional_double(volume_col.value(), i);
        contract.open_interest = extract_optional_double(oi_col.value(), i);
        contract.implied_volatility = extract_optional_double(iv_col.value(), i);
        contracts.push_back(std::move(contract));
    }
    return contracts;
}

Result<std::vector<NewsRow>> DataConversionUtils::arrow_table_to_news(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<NewsRow>>(ErrorCode::INVALID_ARGUMENT,
                                                "Table pointer is null", "DataConversionUtils");
    }

    auto title_col = get_column(table, "title", true);
    if (title_col.is_error()) {
        return forward_error<std::vector<NewsRow>>(*title_col.error(), "DataConversionUtils");
    }
    auto source_col = get_column(table, "source", false);
    auto published_col = get_column(table, "publishedAt", false);
    auto url_col = get_column(table, "url", false);
    auto query_col = get_column(table, "query", false);
    auto ticker_col = get_column(table, "ticker", false);
    for (const auto* col : {&source_col, &published_col, &url_col, &query_col, &ticker_col}) {
        if (col->is_error()) {
            return forward_error<std::vector<NewsRow>>(*col->error(), "DataConversionUtils");
        }
    }

    std::vector<NewsRow> rows;
    rows.reserve(table->num_rows());
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        NewsRow row;
        row.headline.text = extract_string(title_col.value(), i);
        row.headline.source = extract_string(source_col.value(), i);
        row.headline.url = extract_string(url_col.value(), i);
        // Unparseable publication times are kept at the epoch; they do not affect scoring
        auto published = core::parse_iso8601(extract_string(published_col.value(), i));
        if (published) {
            row.headline.published_at = *published;
        }
        row.query = extract_string(query_col.value(), i);
        row.ticker = extract_string(ticker_col.value(), i);
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::shared_ptr<arrow::Array>> DataConversionUtils::get_column(
    const std::shared_ptr<arrow::Table>& table, const std::string& name, bool required) {
    auto column = table->GetColumnByName(name);
    if (column == nullptr) {
        if (required) {
            return make_error<std::shared_ptr<arrow::Array>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + name,
                "DataConversionUtils");
        }
        return std::shared_ptr<arrow::Array>();
    }
    if (column->num_chunks() == 0) {
        return std::shared_ptr<arrow::Array>();
    }
    if (column->num_chunks() > 1) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR, "Column " + name + " was not combined into one chunk",
            "DataConversionUtils");
    }
    return column->chunk(0);
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    auto value = extract_optional_double(array, index);
    if (!value) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }
    return *value;
}

std::optional<double> DataConversionUtils::extract_optional_double(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index)) {
        return std::nullopt;
    }

    double value = std::numeric_limits<double>::quiet_NaN();
    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            value = std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
            break;
        case arrow::Type::INT64:
            value = static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
            break;
        default:
            return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                int64_t index) {
    if (!array || index < 0 || index >= array->length() || array->IsNull(index)) {
        return "";
    }
    if (array->type_id() != arrow::Type::STRING) {
        auto scalar = array->GetScalar(index);
        if (!scalar.ok()) {
            return "";
        }
        return (*scalar)->ToString();
    }
    return std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
}

}  // namespace options_ngin
