// include/options_ngin/storage/results_exporter.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/error.hpp"
#include "options_ngin/pipeline/run_result.hpp"
#include "options_ngin/scoring/opportunity_record.hpp"

namespace options_ngin {

struct OutputConfig : public ConfigBase {
    std::string output_directory{"results"};
    std::string records_file{"opportunities.csv"};
    std::string summary_file{"summary.json"};
    bool timestamped_files{false};  // prefix files with YYYYMMDD_HHMMSS_

    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Writes run artifacts: a CSV of every record and a JSON summary
 *
 * Doubles are written with max_digits10 precision so reading the CSV back
 * reproduces the exact values.
 */
class ResultsExporter {
public:
    explicit ResultsExporter(OutputConfig config = OutputConfig());

    /**
     * @brief Write records in the given order
     * @return Path of the written file, or FILE_IO_ERROR
     */
    Result<std::string> export_records(const std::vector<scoring::OpportunityRecord>& records,
                                       const std::string& file_tag = "") const;

    /**
     * @brief Write the per-ticker JSON summary of a run
     * @return Path of the written file, or FILE_IO_ERROR
     */
    Result<std::string> export_summary(const RunResult& run,
                                       const std::string& file_tag = "") const;

    /**
     * @brief Write both artifacts for a run
     */
    Result<void> export_run(const RunResult& run) const;

    static std::string csv_header();
    static std::string to_csv_row(const scoring::OpportunityRecord& record);

private:
    Result<std::string> prepare_path(const std::string& filename,
                                     const std::string& file_tag) const;

    OutputConfig config_;
};

}  // namespace options_ngin
