// include/options_ngin/data/csv_snapshot_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "options_ngin/core/config_base.hpp"

namespace options_ngin {

/**
 * @brief Layout of a CSV market/news snapshot directory
 *
 *   <data_directory>/<quotes_file>                 ticker,spot,timestamp
 *   <data_directory>/<chains_directory>/<T>.csv    one option chain per ticker
 *   <data_directory>/<headlines_file>              title,source,publishedAt,url,query[,ticker]
 */
struct CsvSnapshotConfig : public ConfigBase {
    std::string data_directory{"data/sample"};
    std::string quotes_file{"quotes.csv"};
    std::string chains_directory{"chains"};
    std::string headlines_file{"headlines.csv"};

    std::string quotes_path() const;
    std::string chain_path(const std::string& ticker) const;
    std::string headlines_path() const;

    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace options_ngin
