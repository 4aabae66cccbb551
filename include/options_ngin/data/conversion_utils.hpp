// include/options_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"

namespace options_ngin {

/**
 * @brief One row of a headlines snapshot
 */
struct NewsRow {
    Headline headline;
    std::string query;
    std::string ticker;  // empty when the snapshot has no ticker column
};

class DataConversionUtils {
public:
    /**
     * @brief Read a CSV file into an Arrow table
     * @param filepath CSV file with a header row
     * @param column_types Forced column types; other columns are inferred
     * @return FILE_NOT_FOUND, or INVALID_DATA if Arrow cannot parse the file
     */
    static Result<std::shared_ptr<arrow::Table>> read_csv(
        const std::string& filepath,
        const std::map<std::string, std::shared_ptr<arrow::DataType>>& column_types);

    /**
     * @brief Convert an Arrow table (ticker, spot, timestamp) to quotes
     */
    static Result<std::vector<Quote>> arrow_table_to_quotes(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert a chain snapshot table to contracts of one underlying
     *
     * Required columns: expiration, option_type, strike. Optional: ticker,
     * contractSymbol, lastPrice, bid, ask, volume, openInterest,
     * impliedVolatility. Null strikes are kept as NaN so the caller can
     * reject and count them; an unparseable kind or expiration fails the
     * whole table.
     */
    static Result<std::vector<Contract>> arrow_table_to_contracts(
        const std::shared_ptr<arrow::Table>& table, const std::string& ticker);

    /**
     * @brief Convert a headlines table (title, source, publishedAt, url, query[, ticker])
     */
    static Result<std::vector<NewsRow>> arrow_table_to_news(
        const std::shared_ptr<arrow::Table>& table);

    static const std::map<std::string, std::shared_ptr<arrow::DataType>>& quote_column_types();
    static const std::map<std::string, std::shared_ptr<arrow::DataType>>& chain_column_types();
    static const std::map<std::string, std::shared_ptr<arrow::DataType>>& news_column_types();

private:
    /**
     * @brief Column as a single array, nullptr if absent
     */
    static Result<std::shared_ptr<arrow::Array>> get_column(
        const std::shared_ptr<arrow::Table>& table, const std::string& name, bool required);

    /**
     * @brief Extract double value from Arrow array
     * @return INVALID_DATA on null
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    /**
     * @brief Extract a nullable double; null, NaN or a missing column give nullopt
     */
    static std::optional<double> extract_optional_double(
        const std::shared_ptr<arrow::Array>& array, int64_t index);

    /**
     * @brief Extract string value from Arrow array; null or a missing column give ""
     */
    static std::string extract_string(const std::shared_ptr<arrow::Array>& array,
                                      int64_t index);
};

}  // namespace options_ngin
