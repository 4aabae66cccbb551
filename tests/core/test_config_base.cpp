#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/scoring/contract_scorer.hpp"

using namespace options_ngin;

namespace {

struct FetchLimits : public ConfigBase {
    std::string source = "csv";
    int max_expirations = 4;
    double timeout_seconds = 2.5;

    nlohmann::json to_json() const override {
        return {{"source", source},
                {"max_expirations", max_expirations},
                {"timeout_seconds", timeout_seconds}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("source"))
            source = j.at("source").get<std::string>();
        if (j.contains("max_expirations"))
            max_expirations = j.at("max_expirations").get<int>();
        if (j.contains("timeout_seconds"))
            timeout_seconds = j.at("timeout_seconds").get<double>();
    }
};

}  // namespace

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "options_ngin_config_base_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
};

TEST_F(ConfigBaseTest, FileRoundTrip) {
    FetchLimits limits;
    limits.source = "vendor";
    limits.max_expirations = 8;
    limits.timeout_seconds = 0.75;

    const std::string path = (dir / "limits.json").string();
    auto saved = limits.save_to_file(path);
    ASSERT_TRUE(saved.is_ok()) << saved.error()->to_string();

    FetchLimits loaded;
    auto result = loaded.load_from_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_EQ(loaded.source, "vendor");
    EXPECT_EQ(loaded.max_expirations, 8);
    EXPECT_DOUBLE_EQ(loaded.timeout_seconds, 0.75);
}

TEST_F(ConfigBaseTest, PartialDocumentKeepsDefaults) {
    FetchLimits limits;
    ASSERT_TRUE(limits.load_from_string(R"({"max_expirations": 1})").is_ok());
    EXPECT_EQ(limits.source, "csv");
    EXPECT_EQ(limits.max_expirations, 1);
    EXPECT_DOUBLE_EQ(limits.timeout_seconds, 2.5);
}

TEST_F(ConfigBaseTest, MalformedJsonNamesSource) {
    FetchLimits limits;
    auto result = limits.load_from_string("{ max_expirations: 3 }", "scan.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(std::string(result.error()->what()).rfind("scan.json: ", 0), 0u);
}

TEST_F(ConfigBaseTest, TopLevelMustBeObject) {
    FetchLimits limits;
    auto result = limits.load_from_string("[1, 2, 3]");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(limits.max_expirations, 4);
}

TEST_F(ConfigBaseTest, MistypedValueIsParseError) {
    const std::string path = (dir / "mistyped.json").string();
    std::ofstream(path) << R"({"timeout_seconds": "soon"})";

    FetchLimits limits;
    auto result = limits.load_from_file(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find(path), std::string::npos);
}

TEST_F(ConfigBaseTest, MissingFile) {
    FetchLimits limits;
    auto result = limits.load_from_file((dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(result.error()->component(), "ConfigBase");
}

TEST_F(ConfigBaseTest, SaveIntoMissingDirectoryFails) {
    FetchLimits limits;
    auto result = limits.save_to_file((dir / "absent" / "limits.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ConfigBaseTest, ScoringConfigThroughFile) {
    scoring::ScoringConfig config;
    config.gap_weight = 0.5;
    config.liquidity_weight = 0.1;
    config.favor_threshold = 30.0;

    const std::string path = (dir / "scoring.json").string();
    ASSERT_TRUE(config.save_to_file(path).is_ok());

    scoring::ScoringConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path).is_ok());
    EXPECT_DOUBLE_EQ(loaded.gap_weight, 0.5);
    EXPECT_DOUBLE_EQ(loaded.liquidity_weight, 0.1);
    EXPECT_DOUBLE_EQ(loaded.spread_weight, 0.2);
    EXPECT_DOUBLE_EQ(loaded.favor_threshold, 30.0);
}
