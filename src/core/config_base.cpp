// src/core/config_base.cpp

#include "options_ngin/core/config_base.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace options_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write config " + filepath,
                                "ConfigBase");
    }
    out << std::setw(4) << to_json() << '\n';
    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write failed for config " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Cannot open config " + filepath,
                                "ConfigBase");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_string(buffer.str(), filepath);
}

Result<void> ConfigBase::load_from_string(const std::string& text, const std::string& source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR, source + ": " + e.what(),
                                "ConfigBase");
    }
    if (!document.is_object()) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                source + ": expected a JSON object at the top level",
                                "ConfigBase");
    }

    // from_json reads with get<T>(), which throws on a mistyped value
    try {
        from_json(document);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR, source + ": " + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

}  // namespace options_ngin
