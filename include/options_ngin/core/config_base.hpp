// include/options_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "options_ngin/core/error.hpp"

namespace options_ngin {

/**
 * @brief JSON persistence shared by every configuration section
 *
 * Derived types supply to_json/from_json. Loading is a merge: keys absent from
 * the document keep their current value, so defaults survive partial files.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON
     * @return FILE_IO_ERROR if the file cannot be written
     */
    Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @return FILE_NOT_FOUND if the file cannot be opened, otherwise as load_from_string
     */
    Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Merge a JSON document into this configuration
     * @param source Names the document in error messages
     * @return JSON_PARSE_ERROR for malformed JSON, a non-object document or a
     *         value of the wrong type
     */
    Result<void> load_from_string(const std::string& text,
                                  const std::string& source = "<inline>");

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace options_ngin
