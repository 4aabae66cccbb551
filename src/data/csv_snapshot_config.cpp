// src/data/csv_snapshot_config.cpp
#include "options_ngin/data/csv_snapshot_config.hpp"
#include <filesystem>

namespace options_ngin {

std::string CsvSnapshotConfig::quotes_path() const {
    return (std::filesystem::path(data_directory) / quotes_file).string();
}

std::string CsvSnapshotConfig::chain_path(const std::string& ticker) const {
    return (std::filesystem::path(data_directory) / chains_directory / (ticker + ".csv")).string();
}

std::string CsvSnapshotConfig::headlines_path() const {
    return (std::filesystem::path(data_directory) / headlines_file).string();
}

Result<void> CsvSnapshotConfig::validate() const {
    if (data_directory.empty() || quotes_file.empty() || headlines_file.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Snapshot directory and file names must not be empty",
                                "CsvSnapshotConfig");
    }
    return Result<void>();
}

nlohmann::json CsvSnapshotConfig::to_json() const {
    nlohmann::json j;
    j["data_directory"] = data_directory;
    j["quotes_file"] = quotes_file;
    j["chains_directory"] = chains_directory;
    j["headlines_file"] = headlines_file;
    return j;
}

void CsvSnapshotConfig::from_json(const nlohmann::json& j) {
    if (j.contains("data_directory"))
        data_directory = j.at("data_directory").get<std::string>();
    if (j.contains("quotes_file"))
        quotes_file = j.at("quotes_file").get<std::string>();
    if (j.contains("chains_directory"))
        chains_directory = j.at("chains_directory").get<std::string>();
    if (j.contains("headlines_file"))
        headlines_file = j.at("headlines_file").get<std::string>();
}

}  // namespace options_ngin
