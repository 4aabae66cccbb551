// src/storage/results_exporter.cpp
#include "options_ngin/storage/results_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {

namespace {

const char* const kColumns[] = {
    "ticker",          "option_type",       "strike",         "expiration",
    "contract_symbol", "market_price",      "theoretical_value", "delta",
    "vega",            "time_to_expiry_years", "implied_volatility", "pricing_gap",
    "gap_term",        "raw_liquidity",     "liquidity_term", "spread_penalty",
    "sentiment_mean",  "sentiment_alignment", "composite_score", "confidence",
    "risk_flag",       "risk_reasons",      "recommendation", "side",
};

std::string escape_csv(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "\"";
    return quoted;
}

}  // namespace

Result<void> OutputConfig::validate() const {
    if (records_file.empty() || summary_file.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Output file names must not be empty",
                                "OutputConfig");
    }
    return Result<void>();
}

nlohmann::json OutputConfig::to_json() const {
    nlohmann::json j;
    j["output_directory"] = output_directory;
    j["records_file"] = records_file;
    j["summary_file"] = summary_file;
    j["timestamped_files"] = timestamped_files;
    return j;
}

void OutputConfig::from_json(const nlohmann::json& j) {
    if (j.contains("output_directory"))
        output_directory = j.at("output_directory").get<std::string>();
    if (j.contains("records_file"))
        records_file = j.at("records_file").get<std::string>();
    if (j.contains("summary_file"))
        summary_file = j.at("summary_file").get<std::string>();
    if (j.contains("timestamped_files"))
        timestamped_files = j.at("timestamped_files").get<bool>();
}

ResultsExporter::ResultsExporter(OutputConfig config) : config_(std::move(config)) {}

std::string ResultsExporter::csv_header() {
    std::string header;
    for (const char* column : kColumns) {
        if (!header.empty()) {
            header += ",";
        }
        header += column;
    }
    return header;
}

std::string ResultsExporter::to_csv_row(const scoring::OpportunityRecord& r) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);
    ss << escape_csv(r.id.ticker) << "," << option_type_to_string(r.id.type) << ","
       << r.id.strike << "," << core::format_date(r.id.expiration) << ","
       << escape_csv(r.contract_symbol) << "," << r.market_price << ","
       << r.theoretical_value << "," << r.delta << "," << r.vega << ","
       << r.time_to_expiry_years << "," << r.implied_volatility << "," << r.pricing_gap << ","
       << r.gap_term << "," << r.raw_liquidity << "," << r.liquidity_term << ","
       << r.spread_penalty << "," << r.sentiment_mean << "," << r.sentiment_alignment << ","
       << r.composite_score << "," << r.confidence << "," << (r.risk_flag ? "true" : "false")
       << "," << scoring::risk_reasons_to_string(r.risk_reasons) << ","
       << scoring::recommendation_to_string(r.recommendation) << ","
       << side_to_string(r.side);
    return ss.str();
}

Result<std::string> ResultsExporter::prepare_path(const std::string& filename,
                                                  const std::string& file_tag) const {
    std::filesystem::path dir(config_.output_directory.empty() ? "." : config_.output_directory);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to create output directory " + dir.string() +
                                           ": " + ec.message(),
                                       "ResultsExporter");
    }
    std::string name = file_tag.empty() ? filename : file_tag + "_" + filename;
    return (dir / name).string();
}

Result<std::string> ResultsExporter::export_records(
    const std::vector<scoring::OpportunityRecord>& records, const std::string& file_tag) const {
    auto path = prepare_path(config_.records_file, file_tag);
    if (path.is_error()) {
        return forward_error<std::string>(*path.error(), "ResultsExporter");
    }

    std::ofstream file(path.value());
    if (!file.is_open()) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to open file for writing: " + path.value(),
                                       "ResultsExporter");
    }

    file << csv_header() << "\n";
    for (const auto& record : records) {
        file << to_csv_row(record) << "\n";
    }
    file.close();
    if (file.fail()) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to write " + path.value(), "ResultsExporter");
    }

    INFO("Exported " + std::to_string(records.size()) + " records to " + path.value());
    return path.value();
}

Result<std::string> ResultsExporter::export_summary(const RunResult& run,
                                                    const std::string& file_tag) const {
    auto path = prepare_path(config_.summary_file, file_tag);
    if (path.is_error()) {
        return forward_error<std::string>(*path.error(), "ResultsExporter");
    }

    std::ofstream file(path.value());
    if (!file.is_open()) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to open file for writing: " + path.value(),
                                       "ResultsExporter");
    }

    file << run.to_json().dump(4) << "\n";
    file.close();
    if (file.fail()) {
        return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to write " + path.value(), "ResultsExporter");
    }

    INFO("Exported run summary for " + std::to_string(run.reports.size()) + " tickers to " +
         path.value());
    return path.value();
}

Result<void> ResultsExporter::export_run(const RunResult& run) const {
    std::string tag;
    if (config_.timestamped_files) {
        std::time_t started = std::chrono::system_clock::to_time_t(run.started_at);
        std::tm tm_utc;
        if (core::safe_gmtime(&started, &tm_utc)) {
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm_utc);
            tag = buffer;
        }
    }

    auto records = export_records(run.records, tag);
    if (records.is_error()) {
        return forward_error<void>(*records.error(), "ResultsExporter");
    }
    auto summary = export_summary(run, tag);
    if (summary.is_error()) {
        return forward_error<void>(*summary.error(), "ResultsExporter");
    }
    return Result<void>();
}

}  // namespace options_ngin
