// include/options_ngin/pipeline/scan_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/logger.hpp"
#include "options_ngin/data/csv_snapshot_config.hpp"
#include "options_ngin/pipeline/pipeline_config.hpp"
#include "options_ngin/storage/results_exporter.hpp"

namespace options_ngin {

/**
 * @brief Top-level document read by the scan application
 *
 *   {"logger": {...}, "pipeline": {...}, "data": {...}, "output": {...}}
 */
struct ScanConfig : public ConfigBase {
    LoggerConfig logger;
    PipelineConfig pipeline;
    CsvSnapshotConfig data;
    OutputConfig output;

    Result<void> validate() const {
        auto logger_valid = logger.validate();
        if (logger_valid.is_error()) {
            return logger_valid;
        }
        auto pipeline_valid = pipeline.validate();
        if (pipeline_valid.is_error()) {
            return pipeline_valid;
        }
        auto data_valid = data.validate();
        if (data_valid.is_error()) {
            return data_valid;
        }
        return output.validate();
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logger"] = logger.to_json();
        j["pipeline"] = pipeline.to_json();
        j["data"] = data.to_json();
        j["output"] = output.to_json();
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("logger"))
            logger.from_json(j.at("logger"));
        if (j.contains("pipeline"))
            pipeline.from_json(j.at("pipeline"));
        if (j.contains("data"))
            data.from_json(j.at("data"));
        if (j.contains("output"))
            output.from_json(j.at("output"));
    }
};

}  // namespace options_ngin
